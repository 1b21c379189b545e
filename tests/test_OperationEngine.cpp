#include <gtest/gtest.h>

#include <QCoreApplication>
#include <QFileInfo>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

#include <atomic>
#include <memory>

#include "OperationEngine.h"
#include "SearchEngine.h"
#include "testutils.h"

namespace {

class OperationEngineTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tmp.isValid());
        src = tmp.filePath("src");
        dst = tmp.filePath("dst");
        ASSERT_TRUE(QDir().mkpath(src));
        ASSERT_TRUE(QDir().mkpath(dst));
    }

    OperationResult waitForResult(OperationHandle* handle)
    {
        QSignalSpy spy(handle, &OperationHandle::completed);
        if (!handle->isFinished())
            EXPECT_TRUE(spy.wait(10000));
        EXPECT_EQ(spy.count(), 1);
        if (spy.isEmpty())
            return OperationResult();
        return spy.takeFirst().at(0).value<OperationResult>();
    }

    QTemporaryDir tmp;
    QString src;
    QString dst;
    OperationEngine engine;
    QObject context;
};

} // namespace

TEST_F(OperationEngineTest, CopyBatchReportsProgressPerItem)
{
    writeFile(src + "/fileA.txt", "A");
    writeFile(src + "/dirB/inner.txt", "B");

    OperationRequest request;
    request.kind = OperationKind::Copy;
    request.sourcePaths = {src + "/fileA.txt", src + "/dirB/"};
    request.destinationDir = dst;

    QString error;
    std::unique_ptr<OperationHandle> handle(engine.submit(request, &error));
    ASSERT_NE(handle, nullptr) << error.toStdString();

    QVector<OperationProgress> events;
    handle->onProgress(&context, [&](const OperationProgress& p) { events.append(p); });

    const OperationResult result = waitForResult(handle.get());

    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0].completedCount, 1);
    EXPECT_EQ(events[0].totalCount, 2);
    EXPECT_EQ(events[0].currentPath, src + "/fileA.txt");
    EXPECT_EQ(events[1].completedCount, 2);
    EXPECT_EQ(events[1].totalCount, 2);

    EXPECT_TRUE(result.errors.isEmpty());
    EXPECT_FALSE(result.cancelled);
    EXPECT_TRUE(result.succeeded());
    EXPECT_TRUE(QFileInfo(dst + "/fileA.txt").isFile());
    EXPECT_EQ(readFile(dst + "/dirB/inner.txt"), QByteArray("B"));
}

TEST_F(OperationEngineTest, FailedItemsAreCollectedAndProcessingContinues)
{
    writeFile(src + "/ok1.txt", "1");
    writeFile(src + "/clash.txt", "new");
    writeFile(src + "/ok2.txt", "2");
    writeFile(dst + "/clash.txt", "old");

    OperationRequest request;
    request.kind = OperationKind::Copy;
    request.sourcePaths = {src + "/ok1.txt", src + "/clash.txt", src + "/ok2.txt"};
    request.destinationDir = dst;

    std::unique_ptr<OperationHandle> handle(engine.submit(request));
    ASSERT_NE(handle, nullptr);

    int lastCount = 0;
    bool increasing = true;
    handle->onProgress(&context, [&](const OperationProgress& p) {
        increasing = increasing && p.completedCount == lastCount + 1 && p.completedCount <= p.totalCount;
        lastCount = p.completedCount;
    });

    const OperationResult result = waitForResult(handle.get());

    EXPECT_TRUE(increasing);
    EXPECT_EQ(lastCount, 3);
    ASSERT_EQ(result.errors.size(), 1);
    EXPECT_EQ(result.errors[0].path, src + "/clash.txt");
    EXPECT_FALSE(result.errors[0].message.isEmpty());
    EXPECT_EQ(readFile(dst + "/clash.txt"), QByteArray("old"));
    EXPECT_TRUE(QFileInfo::exists(dst + "/ok2.txt"));
}

TEST_F(OperationEngineTest, InvalidRequestsAreRejected)
{
    writeFile(src + "/f.txt", "f");

    OperationRequest empty;
    empty.kind = OperationKind::Delete;
    QString error;
    EXPECT_EQ(engine.submit(empty, &error), nullptr);
    EXPECT_FALSE(error.isEmpty());

    OperationRequest noDest;
    noDest.kind = OperationKind::Move;
    noDest.sourcePaths = {src + "/f.txt"};
    error.clear();
    EXPECT_EQ(engine.submit(noDest, &error), nullptr);
    EXPECT_FALSE(error.isEmpty());

    OperationRequest fileDest = noDest;
    fileDest.destinationDir = src + "/f.txt";
    error.clear();
    EXPECT_EQ(engine.submit(fileDest, &error), nullptr);
    EXPECT_FALSE(error.isEmpty());

    OperationRequest missing;
    missing.kind = OperationKind::Delete;
    missing.sourcePaths = {src + "/nope"};
    EXPECT_EQ(engine.submit(missing), nullptr);
}

TEST_F(OperationEngineTest, CancelBeforeStartProcessesNothing)
{
    writeFile(src + "/a.txt", "a");
    writeFile(src + "/b.txt", "b");

    OperationRequest request;
    request.kind = OperationKind::Copy;
    request.sourcePaths = {src + "/a.txt", src + "/b.txt"};
    request.destinationDir = dst;

    std::unique_ptr<OperationHandle> handle(engine.submit(request));
    ASSERT_NE(handle, nullptr);

    int progressEvents = 0;
    handle->onProgress(&context, [&](const OperationProgress&) { ++progressEvents; });
    handle->cancel();
    EXPECT_TRUE(handle->isCancelRequested());

    const OperationResult result = waitForResult(handle.get());

    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.errors.isEmpty());
    EXPECT_EQ(progressEvents, 0);
    EXPECT_FALSE(QFileInfo::exists(dst + "/a.txt"));
    EXPECT_TRUE(handle->isFinished());
}

TEST_F(OperationEngineTest, CancelAfterItemKStopsBeforeNextItem)
{
    const int n = 5;
    const int k = 2;

    OperationRequest request;
    request.kind = OperationKind::Copy;
    request.destinationDir = dst;
    for (int i = 0; i < n; ++i) {
        writeFile(QString("%1/item%2.txt").arg(src).arg(i), "x");
        request.sourcePaths << QString("%1/item%2.txt").arg(src).arg(i);
    }

    // Run the worker on this thread so the cancel lands exactly after item k
    auto cancelFlag = std::make_shared<std::atomic_bool>(false);
    OperationWorker worker(request, cancelFlag);

    int progressEvents = 0;
    QObject::connect(&worker, &OperationWorker::progress, [&](const OperationProgress& p) {
        ++progressEvents;
        if (p.completedCount == k)
            cancelFlag->store(true);
    });
    OperationResult result;
    int completedEvents = 0;
    QObject::connect(&worker, &OperationWorker::completed, [&](const OperationResult& r) {
        result = r;
        ++completedEvents;
    });

    worker.run();

    EXPECT_EQ(completedEvents, 1);
    EXPECT_EQ(progressEvents, k);
    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.errors.isEmpty());
    for (int i = 0; i < n; ++i)
        EXPECT_EQ(QFileInfo::exists(QString("%1/item%2.txt").arg(dst).arg(i)), i < k) << i;
}

TEST_F(OperationEngineTest, CancelledBatchReportsAtMostKErrors)
{
    const int k = 2;

    OperationRequest request;
    request.kind = OperationKind::Delete;
    request.sourcePaths = {src + "/gone1", src + "/gone2", src + "/gone3", src + "/gone4"};

    auto cancelFlag = std::make_shared<std::atomic_bool>(false);
    OperationWorker worker(request, cancelFlag);
    QObject::connect(&worker, &OperationWorker::progress, [&](const OperationProgress& p) {
        if (p.completedCount == k)
            cancelFlag->store(true);
    });
    OperationResult result;
    QObject::connect(&worker, &OperationWorker::completed, [&](const OperationResult& r) { result = r; });

    worker.run();

    EXPECT_TRUE(result.cancelled);
    ASSERT_EQ(result.errors.size(), k);
    EXPECT_EQ(result.errors[0].path, src + "/gone1");
    EXPECT_EQ(result.errors[1].path, src + "/gone2");
}

TEST_F(OperationEngineTest, DeleteAndExtractRunThroughEngine)
{
    writeFile(src + "/doomed.txt", "bye");

    OperationRequest request;
    request.kind = OperationKind::Delete;
    request.sourcePaths = {src + "/doomed.txt"};

    std::unique_ptr<OperationHandle> handle(engine.submit(request));
    ASSERT_NE(handle, nullptr);
    const OperationResult result = waitForResult(handle.get());
    EXPECT_TRUE(result.succeeded());
    EXPECT_FALSE(QFileInfo::exists(src + "/doomed.txt"));

    // Not a zip: one error for that item
    writeFile(src + "/fake.zip", "definitely not a zip archive");
    OperationRequest extract;
    extract.kind = OperationKind::Extract;
    extract.sourcePaths = {src + "/fake.zip"};
    std::unique_ptr<OperationHandle> extractHandle(engine.submit(extract));
    ASSERT_NE(extractHandle, nullptr);
    const OperationResult extractResult = waitForResult(extractHandle.get());
    ASSERT_EQ(extractResult.errors.size(), 1);
    EXPECT_EQ(extractResult.errors[0].path, src + "/fake.zip");
}

TEST_F(OperationEngineTest, DestroyingHandleCancelsAndWaits)
{
    OperationRequest request;
    request.kind = OperationKind::Copy;
    request.destinationDir = dst;
    for (int i = 0; i < 20; ++i) {
        writeFile(QString("%1/f%2.txt").arg(src).arg(i), QByteArray(1024, 'z'));
        request.sourcePaths << QString("%1/f%2.txt").arg(src).arg(i);
    }

    OperationHandle* handle = engine.submit(request);
    ASSERT_NE(handle, nullptr);
    QCoreApplication::processEvents();
    delete handle;

    // Whatever got copied is complete; nothing is half written
    const QStringList copied = QDir(dst).entryList(QDir::Files | QDir::Hidden);
    for (const QString& name : copied) {
        EXPECT_FALSE(name.endsWith(".part")) << name.toStdString();
        EXPECT_EQ(QFileInfo(dst + "/" + name).size(), 1024);
    }
}

TEST_F(OperationEngineTest, ConcurrentBatchesAndSearchStayIndependent)
{
    const QString dstA = tmp.filePath("dstA");
    const QString dstB = tmp.filePath("dstB");
    const QString searchRoot = tmp.filePath("searched");
    ASSERT_TRUE(QDir().mkpath(dstA));
    ASSERT_TRUE(QDir().mkpath(dstB));

    OperationRequest requestA;
    requestA.kind = OperationKind::Copy;
    requestA.destinationDir = dstA;
    OperationRequest requestB = requestA;
    requestB.destinationDir = dstB;
    for (int i = 0; i < 8; ++i) {
        const QString path = QString("%1/item%2.bin").arg(src).arg(i);
        writeFile(path, QByteArray(4096, char('a' + i)));
        requestA.sourcePaths << path;
        requestB.sourcePaths << path;
    }
    for (int i = 0; i < 30; ++i)
        writeFile(QString("%1/d%2/hit%2.log").arg(searchRoot).arg(i), "");

    SearchEngine searchEngine;
    SearchRequest searchRequest;
    searchRequest.rootPath = searchRoot;
    searchRequest.fileNamePattern = "*.log";

    std::unique_ptr<OperationHandle> handleA(engine.submit(requestA));
    std::unique_ptr<OperationHandle> handleB(engine.submit(requestB));
    std::unique_ptr<SearchHandle> search(searchEngine.search(searchRequest));
    ASSERT_NE(handleA, nullptr);
    ASSERT_NE(handleB, nullptr);
    ASSERT_NE(search, nullptr);

    QVector<OperationProgress> progressA;
    QVector<OperationProgress> progressB;
    std::unique_ptr<OperationResult> resultA;
    std::unique_ptr<OperationResult> resultB;
    QStringList matches;
    std::unique_ptr<SearchSummary> summary;
    handleA->onProgress(&context, [&](const OperationProgress& p) { progressA.append(p); });
    handleB->onProgress(&context, [&](const OperationProgress& p) { progressB.append(p); });
    handleA->onCompleted(&context, [&](const OperationResult& r) { resultA.reset(new OperationResult(r)); });
    handleB->onCompleted(&context, [&](const OperationResult& r) { resultB.reset(new OperationResult(r)); });
    search->onMatch(&context, [&](const QString& path) { matches << path; });
    search->onCompleted(&context, [&](const SearchSummary& s) { summary.reset(new SearchSummary(s)); });

    handleA->cancel();

    ASSERT_TRUE(QTest::qWaitFor([&]() { return resultA && resultB && summary; }, 20000));

    EXPECT_TRUE(resultA->cancelled);
    EXPECT_TRUE(resultA->errors.isEmpty());
    EXPECT_TRUE(progressA.isEmpty());
    EXPECT_TRUE(QDir(dstA).entryList(QDir::NoDotAndDotDot | QDir::AllEntries | QDir::Hidden).isEmpty());

    EXPECT_TRUE(resultB->succeeded());
    ASSERT_EQ(progressB.size(), 8);
    for (int i = 0; i < progressB.size(); ++i) {
        EXPECT_EQ(progressB[i].completedCount, i + 1);
        EXPECT_EQ(progressB[i].totalCount, 8);
        EXPECT_EQ(progressB[i].currentPath, requestB.sourcePaths.at(i));
    }
    EXPECT_EQ(readFile(dstB + "/item7.bin"), QByteArray(4096, 'h'));

    EXPECT_FALSE(summary->stopped);
    EXPECT_EQ(summary->matchCount, 30);
    EXPECT_EQ(matches.size(), 30);
    for (const QString& match : matches)
        EXPECT_TRUE(match.startsWith(searchRoot + "/")) << match.toStdString();
}
