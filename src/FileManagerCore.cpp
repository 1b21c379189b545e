#include "FileManagerCore.h"
#include "Clipboard.h"
#include "Config.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>

FileManagerCore::FileManagerCore(QObject* parent)
    : QObject(parent)
    , m_operationEngine(new OperationEngine(this))
    , m_searchEngine(new SearchEngine(this))
{
}

OperationHandle* FileManagerCore::submitOperation(OperationKind kind, const QStringList& paths,
                                                  const QString& destination, QString* errorMessage)
{
    OperationRequest request;
    request.kind = kind;
    request.sourcePaths = paths;
    request.destinationDir = destination;
    return submitOperation(request, errorMessage);
}

OperationHandle* FileManagerCore::submitOperation(OperationRequest request, QString* errorMessage)
{
    const Config& config = Config::instance();
    const OperationRequest defaults;
    request.verifyCopies = request.verifyCopies || config.verifyCopies();
    if (request.verifyAlgorithm == defaults.verifyAlgorithm)
        request.verifyAlgorithm = config.verifyAlgorithm();
    if (request.hashBufferSize == defaults.hashBufferSize)
        request.hashBufferSize = config.hashBufferSize();
    return m_operationEngine->submit(request, errorMessage, this);
}

OperationHandle* FileManagerCore::submitRename(const QString& path, const QString& newName,
                                               QString* errorMessage)
{
    OperationRequest request;
    request.kind = OperationKind::Rename;
    request.sourcePaths = QStringList{path};
    request.newName = newName;
    return submitOperation(request, errorMessage);
}

OperationHandle* FileManagerCore::submitCreateDirectory(const QString& parentDir, const QString& name,
                                                        QString* errorMessage)
{
    // name may hold several components ("a/b"), but never climb out of parentDir
    const QString cleanName = QDir::cleanPath(name);
    if (parentDir.isEmpty() || !QDir::isAbsolutePath(parentDir) || cleanName.isEmpty()
        || cleanName == "." || QDir::isAbsolutePath(cleanName)
        || cleanName == ".." || cleanName.startsWith("../")) {
        const QString error = tr("Cannot create '%1' in '%2'").arg(name, parentDir);
        qWarning() << "Rejected operation:" << error;
        if (errorMessage)
            *errorMessage = error;
        return nullptr;
    }

    OperationRequest request;
    request.kind = OperationKind::CreateDirectory;
    request.sourcePaths = QStringList{QDir(parentDir).filePath(cleanName)};
    return submitOperation(request, errorMessage);
}

SearchHandle* FileManagerCore::submitSearch(const QString& root, const QString& pattern,
                                            QString* errorMessage)
{
    const Config& config = Config::instance();

    SearchRequest request;
    request.rootPath = root;
    request.fileNamePattern = pattern;
    request.fileNameCaseSensitive = config.searchCaseSensitive();
    request.progressInterval = config.searchProgressInterval();
    return m_searchEngine->search(request, errorMessage, this);
}

WatchSubscription* FileManagerCore::watchDirectory(const QString& path, QString* errorMessage)
{
    QFileInfo info(path);
    if (path.isEmpty() || !QDir::isAbsolutePath(path) || !info.isDir()) {
        const QString error = tr("Cannot watch '%1': not a directory").arg(path);
        qWarning() << "Rejected watch:" << error;
        if (errorMessage)
            *errorMessage = error;
        return nullptr;
    }

    auto* subscription = new WatchSubscription(path, Config::instance().debounceMs(), this);
    // A failure here is reported through failed(), queued for the caller.
    subscription->start();
    return subscription;
}

OperationHandle* FileManagerCore::paste(Clipboard& clipboard, const QString& destination,
                                        QString* errorMessage)
{
    if (clipboard.isEmpty()) {
        if (errorMessage)
            *errorMessage = tr("Clipboard is empty");
        return nullptr;
    }

    OperationHandle* handle = submitOperation(clipboard.toRequest(destination), errorMessage);
    // Cut paths no longer exist at their old place once moved
    if (handle && clipboard.isCutMode())
        clipboard.clear();
    return handle;
}
