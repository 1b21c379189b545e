#pragma once

#include "OperationTypes.h"

#include <QObject>
#include <QPointer>

#include <atomic>
#include <functional>
#include <memory>

class QThread;

using CancelFlag = std::shared_ptr<std::atomic_bool>;

// Runs one batch on its own thread. Items are processed strictly in order,
// one at a time; the cancel flag is checked before every item.
class OperationWorker : public QObject {
    Q_OBJECT

public:
    OperationWorker(const OperationRequest& request, CancelFlag cancelFlag, QObject* parent = nullptr);

public slots:
    void run();

signals:
    void progress(const OperationProgress& progress);
    void completed(const OperationResult& result);
    void finished();

private:
    OperationRequest m_request;
    CancelFlag m_cancelFlag;
};

// One in-flight batch as seen by the caller. Lives on the caller's thread;
// signals arrive there through queued connections from the worker.
//
// Callbacks registered with onProgress/onCompleted run on the thread of the
// given context object. The worker starts from the caller's event loop, so
// callbacks registered right after submission see every event.
//
// Destroying the handle cancels the batch and waits for the current item.
class OperationHandle : public QObject {
    Q_OBJECT

public:
    using ProgressCallback = std::function<void(const OperationProgress&)>;
    using CompletedCallback = std::function<void(const OperationResult&)>;

    ~OperationHandle() override;

    QMetaObject::Connection onProgress(QObject* context, ProgressCallback callback);
    QMetaObject::Connection onCompleted(QObject* context, CompletedCallback callback);

    const OperationRequest& request() const { return m_request; }
    bool isFinished() const { return m_finished; }
    bool isCancelRequested() const { return m_cancelFlag->load(); }

public slots:
    // Stop before the next item; items already done are kept.
    void cancel();

signals:
    void progress(const OperationProgress& progress);
    void completed(const OperationResult& result);

private:
    friend class OperationEngine;
    OperationHandle(const OperationRequest& request, QObject* parent);

    void start();

    OperationRequest m_request;
    CancelFlag m_cancelFlag;
    QPointer<QThread> m_thread;
    bool m_finished = false;
};

class OperationEngine : public QObject {
    Q_OBJECT

public:
    explicit OperationEngine(QObject* parent = nullptr);

    // Validates and starts request. Invalid requests are rejected right away:
    // nullptr is returned and errorMessage (if given) says why.
    // The returned handle is owned by parent (or the caller if parent is null).
    OperationHandle* submit(const OperationRequest& request, QString* errorMessage = nullptr,
                            QObject* parent = nullptr);
};
