#include <gtest/gtest.h>

#include <QDir>
#include <QFileInfo>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "Clipboard.h"
#include "Config.h"
#include "FileManagerCore.h"
#include "testutils.h"

namespace {

class FileManagerCoreTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tmp.isValid());
        Config::instance().load(tmp.filePath("config.toml"));
        src = tmp.filePath("src");
        dst = tmp.filePath("dst");
        ASSERT_TRUE(QDir().mkpath(src));
        ASSERT_TRUE(QDir().mkpath(dst));
    }

    void TearDown() override
    {
        Config::instance().load(tmp.filePath("config.toml"));
    }

    static OperationResult waitForResult(OperationHandle* handle)
    {
        QSignalSpy spy(handle, &OperationHandle::completed);
        EXPECT_TRUE(spy.wait(10000));
        if (spy.isEmpty())
            return OperationResult();
        return spy.takeFirst().at(0).value<OperationResult>();
    }

    QTemporaryDir tmp;
    QString src;
    QString dst;
    FileManagerCore core;
};

} // namespace

TEST(ClipboardTest, CutAndCopyProduceMatchingRequests)
{
    Clipboard clipboard;
    EXPECT_TRUE(clipboard.isEmpty());

    clipboard.copy({"/a", "/b"});
    OperationRequest copy = clipboard.toRequest("/dest");
    EXPECT_EQ(copy.kind, OperationKind::Copy);
    EXPECT_EQ(copy.sourcePaths, QStringList({"/a", "/b"}));
    EXPECT_EQ(copy.destinationDir, QString("/dest"));

    clipboard.cut({"/c"});
    EXPECT_TRUE(clipboard.isCutMode());
    EXPECT_EQ(clipboard.toRequest("/dest").kind, OperationKind::Move);
    EXPECT_EQ(clipboard.paths(), QStringList({"/c"}));

    clipboard.clear();
    EXPECT_TRUE(clipboard.isEmpty());
    EXPECT_FALSE(clipboard.isCutMode());
}

TEST_F(FileManagerCoreTest, SubmitOperationByKind)
{
    writeFile(src + "/a.txt", "a");

    QString error;
    OperationHandle* handle = core.submitOperation(OperationKind::Copy, {src + "/a.txt"}, dst, &error);
    ASSERT_NE(handle, nullptr) << error.toStdString();
    EXPECT_EQ(handle->parent(), &core);

    EXPECT_TRUE(waitForResult(handle).succeeded());
    EXPECT_EQ(readFile(dst + "/a.txt"), QByteArray("a"));
    delete handle;
}

TEST_F(FileManagerCoreTest, ConfigSettingsAreAppliedToRequests)
{
    writeFile(src + "/v.txt", "verify me");
    Config::instance().setVerifyCopies(true);
    Config::instance().setVerifyAlgorithm("SHA-512");

    OperationHandle* handle = core.submitOperation(OperationKind::Copy, {src + "/v.txt"}, dst);
    ASSERT_NE(handle, nullptr);
    EXPECT_TRUE(handle->request().verifyCopies);
    EXPECT_EQ(handle->request().verifyAlgorithm, QString("SHA-512"));
    EXPECT_TRUE(waitForResult(handle).succeeded());
    delete handle;

    Config::instance().setDebounceMs(42);
    WatchSubscription* watch = core.watchDirectory(dst);
    ASSERT_NE(watch, nullptr);
    EXPECT_EQ(watch->debounceMs(), 42);
    delete watch;
}

TEST_F(FileManagerCoreTest, InvalidRequestsReturnNoHandle)
{
    QString error;
    EXPECT_EQ(core.submitOperation(OperationKind::Copy, {}, dst, &error), nullptr);
    EXPECT_FALSE(error.isEmpty());

    error.clear();
    EXPECT_EQ(core.submitSearch(tmp.filePath("missing"), "*", &error), nullptr);
    EXPECT_FALSE(error.isEmpty());

    writeFile(src + "/file.txt", "f");
    error.clear();
    EXPECT_EQ(core.watchDirectory(src + "/file.txt", &error), nullptr);
    EXPECT_FALSE(error.isEmpty());

    Clipboard empty;
    error.clear();
    EXPECT_EQ(core.paste(empty, dst, &error), nullptr);
    EXPECT_FALSE(error.isEmpty());
}

TEST_F(FileManagerCoreTest, PasteCutMovesAndClearsClipboard)
{
    writeFile(src + "/moving.txt", "m");

    Clipboard clipboard;
    clipboard.cut({src + "/moving.txt"});

    OperationHandle* handle = core.paste(clipboard, dst);
    ASSERT_NE(handle, nullptr);
    EXPECT_TRUE(clipboard.isEmpty());
    EXPECT_EQ(handle->request().kind, OperationKind::Move);

    EXPECT_TRUE(waitForResult(handle).succeeded());
    EXPECT_FALSE(QFileInfo::exists(src + "/moving.txt"));
    EXPECT_EQ(readFile(dst + "/moving.txt"), QByteArray("m"));
    delete handle;
}

TEST_F(FileManagerCoreTest, PasteCopyKeepsClipboard)
{
    writeFile(src + "/kept.txt", "k");

    Clipboard clipboard;
    clipboard.copy({src + "/kept.txt"});

    OperationHandle* handle = core.paste(clipboard, dst);
    ASSERT_NE(handle, nullptr);
    EXPECT_FALSE(clipboard.isEmpty());
    EXPECT_TRUE(waitForResult(handle).succeeded());
    EXPECT_TRUE(QFileInfo::exists(src + "/kept.txt"));
    delete handle;
}

TEST_F(FileManagerCoreTest, SubmitSearchUsesConfiguredCaseSensitivity)
{
    writeFile(src + "/A.LOG", "");
    Config::instance().setSearchCaseSensitive(false);

    SearchHandle* handle = core.submitSearch(src, "*.log");
    ASSERT_NE(handle, nullptr);
    EXPECT_FALSE(handle->request().fileNameCaseSensitive);

    QSignalSpy spy(handle, &SearchHandle::searchCompleted);
    ASSERT_TRUE(spy.wait(10000));
    EXPECT_EQ(spy.takeFirst().at(0).value<SearchSummary>().matchCount, 1);
    delete handle;
}

TEST_F(FileManagerCoreTest, ExplicitVerificationSettingsAreKept)
{
    writeFile(src + "/k.txt", "keep my settings");
    Config::instance().setVerifyAlgorithm("SHA-512");
    Config::instance().setHashBufferSize(8192);

    OperationRequest request;
    request.kind = OperationKind::Copy;
    request.sourcePaths = QStringList{src + "/k.txt"};
    request.destinationDir = dst;
    request.verifyCopies = true;
    request.verifyAlgorithm = "SHA-1";
    request.hashBufferSize = 512;

    OperationHandle* handle = core.submitOperation(request);
    ASSERT_NE(handle, nullptr);
    EXPECT_EQ(handle->request().verifyAlgorithm, QString("SHA-1"));
    EXPECT_EQ(handle->request().hashBufferSize, 512);
    EXPECT_TRUE(waitForResult(handle).succeeded());
    delete handle;

    // Untouched fields still take the configured values
    OperationRequest plain;
    plain.kind = OperationKind::Copy;
    plain.sourcePaths = QStringList{src + "/k.txt"};
    plain.destinationDir = dst;
    plain.overwriteExisting = true;
    handle = core.submitOperation(plain);
    ASSERT_NE(handle, nullptr);
    EXPECT_EQ(handle->request().verifyAlgorithm, QString("SHA-512"));
    EXPECT_EQ(handle->request().hashBufferSize, 8192);
    EXPECT_TRUE(waitForResult(handle).succeeded());
    delete handle;
}

TEST_F(FileManagerCoreTest, RenameAndCreateDirectory)
{
    writeFile(src + "/old.txt", "content");

    QString error;
    OperationHandle* handle = core.submitRename(src + "/old.txt", "new.txt", &error);
    ASSERT_NE(handle, nullptr) << error.toStdString();
    EXPECT_TRUE(waitForResult(handle).succeeded());
    EXPECT_FALSE(QFileInfo::exists(src + "/old.txt"));
    EXPECT_EQ(readFile(src + "/new.txt"), QByteArray("content"));
    delete handle;

    EXPECT_EQ(core.submitRename(src + "/new.txt", "../escape.txt", &error), nullptr);
    EXPECT_FALSE(error.isEmpty());

    handle = core.submitCreateDirectory(dst, "made/inside", &error);
    ASSERT_NE(handle, nullptr) << error.toStdString();
    EXPECT_TRUE(waitForResult(handle).succeeded());
    EXPECT_TRUE(QFileInfo(dst + "/made/inside").isDir());
    delete handle;

    error.clear();
    EXPECT_EQ(core.submitCreateDirectory(dst, "made/inside", &error), nullptr) << "already exists";
    EXPECT_FALSE(error.isEmpty());
    error.clear();
    EXPECT_EQ(core.submitCreateDirectory(dst, "../outside", &error), nullptr);
    EXPECT_FALSE(error.isEmpty());
    error.clear();
    EXPECT_EQ(core.submitCreateDirectory(dst, "", &error), nullptr);
    EXPECT_FALSE(error.isEmpty());
}

TEST_F(FileManagerCoreTest, WatchDirectoryReturnsBeforeSubtreeIsRegistered)
{
    for (int i = 0; i < 50; ++i)
        ASSERT_TRUE(QDir().mkpath(QString("%1/tree/d%2/e").arg(dst).arg(i)));

    WatchSubscription* watch = core.watchDirectory(dst);
    ASSERT_NE(watch, nullptr);
    EXPECT_EQ(watch->watchedDirectoryCount(), 1);
    EXPECT_TRUE(watch->isRegistering());

    QSignalSpy registered(watch, &WatchSubscription::registrationFinished);
    ASSERT_TRUE(registered.wait(10000));
    EXPECT_EQ(watch->watchedDirectoryCount(), 1 + 1 + 50 * 2);
    delete watch;
}
