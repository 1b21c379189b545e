#include "SearchEngine.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QThread>
#include <QTimer>

SearchHandle::SearchHandle(const SearchRequest& request, QObject* parent)
    : QObject(parent)
    , m_request(request)
    , m_stopFlag(std::make_shared<std::atomic_bool>(false))
{
}

SearchHandle::~SearchHandle()
{
    stop();
    if (m_thread && m_thread->isRunning())
        m_thread->wait();
}

void SearchHandle::start()
{
    // ─────────────────────────────────────────────────────────
    // Create worker and thread
    // ─────────────────────────────────────────────────────────
    auto* thread = new QThread;
    auto* worker = new SearchWorker(m_request, m_stopFlag);
    worker->moveToThread(thread);

    // Connect signals
    connect(thread, &QThread::started, worker, &SearchWorker::startSearch);
    connect(worker, &SearchWorker::resultFound, this, &SearchHandle::matchFound);
    connect(worker, &SearchWorker::progressUpdate, this, &SearchHandle::progressUpdate);
    connect(worker, &SearchWorker::searchFinished, this, [this](const SearchSummary& summary) {
        m_finished = true;
        emit searchCompleted(summary);
    });

    // Cleanup on finish
    connect(worker, &SearchWorker::searchFinished, thread, &QThread::quit, Qt::DirectConnection);
    connect(thread, &QThread::finished, worker, &QObject::deleteLater);
    connect(thread, &QThread::finished, thread, &QObject::deleteLater);

    m_thread = thread;
    QTimer::singleShot(0, thread, [thread]() { thread->start(); });
}

void SearchHandle::stop()
{
    m_stopFlag->store(true);
}

QMetaObject::Connection SearchHandle::onMatch(QObject* context, MatchCallback callback)
{
    return connect(this, &SearchHandle::matchFound, context, std::move(callback));
}

QMetaObject::Connection SearchHandle::onCompleted(QObject* context, CompletedCallback callback)
{
    return connect(this, &SearchHandle::searchCompleted, context, std::move(callback));
}

SearchEngine::SearchEngine(QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<SearchSummary>();
}

SearchHandle* SearchEngine::search(const SearchRequest& request, QString* errorMessage, QObject* parent)
{
    QString error;
    QFileInfo rootInfo(request.rootPath);
    if (request.rootPath.isEmpty() || !QDir::isAbsolutePath(request.rootPath))
        error = tr("Search root '%1' is not an absolute path").arg(request.rootPath);
    else if (!rootInfo.isDir())
        error = tr("Search root '%1' is not a directory").arg(request.rootPath);

    if (!error.isEmpty()) {
        qWarning() << "Rejected search:" << error;
        if (errorMessage)
            *errorMessage = error;
        return nullptr;
    }

    auto* handle = new SearchHandle(request, parent);
    handle->start();
    qDebug() << "Searching" << request.rootPath << "for" << request.fileNamePattern;
    return handle;
}
