#pragma once

#include "SearchWorker.h"

#include <QObject>
#include <QPointer>

#include <functional>

class QThread;

// A running search as seen by the caller. Matches stream in through
// matchFound; searchCompleted is emitted exactly once, also after stop().
// Destroying the handle stops the scan and waits for the current directory.
class SearchHandle : public QObject {
    Q_OBJECT

public:
    using MatchCallback = std::function<void(const QString&)>;
    using CompletedCallback = std::function<void(const SearchSummary&)>;

    ~SearchHandle() override;

    QMetaObject::Connection onMatch(QObject* context, MatchCallback callback);
    QMetaObject::Connection onCompleted(QObject* context, CompletedCallback callback);

    const SearchRequest& request() const { return m_request; }
    bool isFinished() const { return m_finished; }

public slots:
    void stop();

signals:
    void matchFound(const QString& path);
    void progressUpdate(int searchedEntries, int foundEntries);
    void searchCompleted(const SearchSummary& summary);

private:
    friend class SearchEngine;
    SearchHandle(const SearchRequest& request, QObject* parent);

    void start();

    SearchRequest m_request;
    SearchWorker::StopFlag m_stopFlag;
    QPointer<QThread> m_thread;
    bool m_finished = false;
};

class SearchEngine : public QObject {
    Q_OBJECT

public:
    explicit SearchEngine(QObject* parent = nullptr);

    // Starts a search on its own thread. Returns nullptr and fills
    // errorMessage if rootPath is not an existing directory.
    SearchHandle* search(const SearchRequest& request, QString* errorMessage = nullptr,
                         QObject* parent = nullptr);
};
