#ifndef WATCHSUBSCRIPTION_H
#define WATCHSUBSCRIPTION_H

#include <QHash>
#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>

class QSocketNotifier;
class QTimer;

// Recursive watch of one directory tree with a debounced "changed" signal.
//
// Every inotify event under the root restarts a single-shot timer, so a
// burst of events produces one changed() emitted debounceMs after the last
// event. Directories created later are added to the watch.
//
// Only the root is watched when start() returns. Subdirectories are
// registered from the event loop in small batches, so watching a large tree
// never blocks the caller; registrationFinished() is emitted once the queue
// of directories to register runs empty.
//
// The inotify descriptor and the timer are both serviced by the event loop
// of the thread this object lives in; a changed() therefore always reflects
// every event read before it.
class WatchSubscription : public QObject
{
    Q_OBJECT
public:
    enum class State {
        Idle,             // watching, nothing pending
        PendingRefresh,   // timer armed
        Inert             // stopped or failed; never fires again
    };

    explicit WatchSubscription(const QString& rootPath, int debounceMs = 300, QObject *parent = nullptr);
    ~WatchSubscription() override;

    // Establish the watch. On failure failed() is emitted (queued) and the
    // subscription becomes inert; the return value says the same.
    bool start();
    void stop();

    QMetaObject::Connection onChanged(QObject* context, std::function<void()> callback);
    QMetaObject::Connection onFailed(QObject* context, std::function<void(const QString&)> callback);

    QString rootPath() const { return m_rootPath; }
    int debounceMs() const { return m_debounceMs; }
    State state() const { return m_state; }
    int watchedDirectoryCount() const { return m_watches.size(); }
    bool isRegistering() const { return !m_pendingDirectories.isEmpty(); }

signals:
    void changed();
    void failed(const QString& message);
    void registrationFinished();

private slots:
    void onInotifyEvent();
    void onDebounceTimeout();
    void registerPendingDirectories();

private:
    bool addWatch(const QString& dirPath, bool isRoot);
    void queueDirectory(const QString& dirPath);
    void registerEvent();
    void fail(const QString& message);
    void teardown();

    QString m_rootPath;
    int m_debounceMs;
    int m_inotifyFd = -1;
    int m_rootWd = -1;
    QSocketNotifier* m_inotifyNotifier = nullptr;
    QTimer* m_debounceTimer = nullptr;
    QHash<int, QString> m_watches;   // watch descriptor -> directory
    QStringList m_pendingDirectories;   // watched, children not yet listed
    bool m_registrationScheduled = false;
    State m_state = State::Idle;
    bool m_failureReported = false;
};

#endif // WATCHSUBSCRIPTION_H
