#include "OperationEngine.h"
#include "FileOperations.h"

#include <QDebug>
#include <QThread>
#include <QTimer>

#include <exception>

OperationWorker::OperationWorker(const OperationRequest& request, CancelFlag cancelFlag, QObject* parent)
    : QObject(parent)
    , m_request(request)
    , m_cancelFlag(std::move(cancelFlag))
{
}

void OperationWorker::run()
{
    OperationResult result;
    const int total = m_request.sourcePaths.size();
    int done = 0;

    for (const QString& path : m_request.sourcePaths) {
        if (m_cancelFlag->load()) {
            result.cancelled = true;
            qDebug() << operationKindName(m_request.kind) << "cancelled after" << done << "of" << total << "items";
            break;
        }

        try {
            FileOperations::executeItem(m_request, path);
        } catch (const std::exception& e) {
            const QString message = QString::fromStdString(e.what());
            qWarning() << operationKindName(m_request.kind) << "failed for" << path << ":" << message;
            result.errors.append({path, message});
        }

        ++done;
        emit progress(OperationProgress{done, total, path});
    }

    emit completed(result);
    emit finished();
}

OperationHandle::OperationHandle(const OperationRequest& request, QObject* parent)
    : QObject(parent)
    , m_request(request)
    , m_cancelFlag(std::make_shared<std::atomic_bool>(false))
{
}

OperationHandle::~OperationHandle()
{
    cancel();
    if (m_thread && m_thread->isRunning())
        m_thread->wait();
}

void OperationHandle::start()
{
    auto* thread = new QThread;
    auto* worker = new OperationWorker(m_request, m_cancelFlag);
    worker->moveToThread(thread);

    connect(thread, &QThread::started, worker, &OperationWorker::run);
    connect(worker, &OperationWorker::progress, this, &OperationHandle::progress);
    connect(worker, &OperationWorker::completed, this, [this](const OperationResult& result) {
        m_finished = true;
        emit completed(result);
    });

    // Cleanup on finish. quit() must not wait for the caller's event loop,
    // the destructor may be blocked in wait() on it.
    connect(worker, &OperationWorker::finished, thread, &QThread::quit, Qt::DirectConnection);
    connect(thread, &QThread::finished, worker, &QObject::deleteLater);
    connect(thread, &QThread::finished, thread, &QObject::deleteLater);

    m_thread = thread;

    // Start from the caller's event loop so callbacks registered after
    // submit() returns are connected before the first event.
    QTimer::singleShot(0, thread, [thread]() { thread->start(); });
}

void OperationHandle::cancel()
{
    m_cancelFlag->store(true);
}

QMetaObject::Connection OperationHandle::onProgress(QObject* context, ProgressCallback callback)
{
    return connect(this, &OperationHandle::progress, context, std::move(callback));
}

QMetaObject::Connection OperationHandle::onCompleted(QObject* context, CompletedCallback callback)
{
    return connect(this, &OperationHandle::completed, context, std::move(callback));
}

OperationEngine::OperationEngine(QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<OperationProgress>();
    qRegisterMetaType<OperationResult>();
}

OperationHandle* OperationEngine::submit(const OperationRequest& request, QString* errorMessage, QObject* parent)
{
    const QString error = FileOperations::validateRequest(request);
    if (!error.isEmpty()) {
        qWarning() << "Rejected" << operationKindName(request.kind) << "request:" << error;
        if (errorMessage)
            *errorMessage = error;
        return nullptr;
    }

    auto* handle = new OperationHandle(request, parent);
    handle->start();
    qDebug() << "Submitted" << operationKindName(request.kind) << "of" << request.sourcePaths.size() << "items";
    return handle;
}
