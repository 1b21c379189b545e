#include "WatchSubscription.h"
#include "SearchWorker.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSocketNotifier>
#include <QTimer>

#include <cerrno>
#include <cstring>
#include <sys/inotify.h>
#include <unistd.h>

namespace {
    // Directories listed per event-loop iteration while registering a tree
    constexpr int RegistrationBatchSize = 32;

    constexpr uint32_t WatchMask = IN_CREATE | IN_DELETE | IN_MODIFY | IN_ATTRIB
                                 | IN_MOVED_FROM | IN_MOVED_TO
                                 | IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR;
}

WatchSubscription::WatchSubscription(const QString& rootPath, int debounceMs, QObject *parent)
    : QObject(parent)
    , m_rootPath(QDir::cleanPath(rootPath))
    , m_debounceMs(debounceMs)
{
    m_debounceTimer = new QTimer(this);
    m_debounceTimer->setSingleShot(true);
    m_debounceTimer->setInterval(m_debounceMs);
    connect(m_debounceTimer, &QTimer::timeout, this, &WatchSubscription::onDebounceTimeout);
}

WatchSubscription::~WatchSubscription()
{
    stop();
}

bool WatchSubscription::start()
{
    if (m_state == State::Inert)
        return false;
    if (m_inotifyFd >= 0)
        return true;

    m_inotifyFd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (m_inotifyFd < 0) {
        fail(tr("Cannot create inotify instance: %1").arg(QString::fromLocal8Bit(strerror(errno))));
        return false;
    }

    // Create QSocketNotifier to integrate with Qt event loop
    m_inotifyNotifier = new QSocketNotifier(m_inotifyFd, QSocketNotifier::Read, this);
    connect(m_inotifyNotifier, &QSocketNotifier::activated,
            this, &WatchSubscription::onInotifyEvent);

    if (!addWatch(m_rootPath, true))
        return false;
    queueDirectory(m_rootPath);

    qDebug() << "Watching" << m_rootPath;
    return true;
}

void WatchSubscription::stop()
{
    if (m_state == State::Inert && m_inotifyFd < 0)
        return;

    teardown();
    m_state = State::Inert;
}

void WatchSubscription::teardown()
{
    m_debounceTimer->stop();

    if (m_inotifyNotifier) {
        delete m_inotifyNotifier;
        m_inotifyNotifier = nullptr;
    }

    if (m_inotifyFd >= 0) {
        close(m_inotifyFd);
        m_inotifyFd = -1;
    }

    m_watches.clear();
    m_pendingDirectories.clear();
    m_rootWd = -1;
}

QMetaObject::Connection WatchSubscription::onChanged(QObject* context, std::function<void()> callback)
{
    return connect(this, &WatchSubscription::changed, context, std::move(callback));
}

QMetaObject::Connection WatchSubscription::onFailed(QObject* context, std::function<void(const QString&)> callback)
{
    return connect(this, &WatchSubscription::failed, context, std::move(callback));
}

bool WatchSubscription::addWatch(const QString& dirPath, bool isRoot)
{
    // Subdirectories are reached by listing, never through a symlink
    const uint32_t mask = isRoot ? WatchMask : (WatchMask | IN_DONT_FOLLOW);
    const QByteArray nativePath = QFile::encodeName(dirPath);
    const int wd = inotify_add_watch(m_inotifyFd, nativePath.constData(), mask);
    if (wd < 0) {
        const int err = errno;
        // A subdirectory that vanished or is unreadable is simply not watched
        if (!isRoot && (err == ENOENT || err == EACCES || err == ENOTDIR)) {
            qDebug() << "Not watching" << dirPath << ":" << strerror(err);
            return true;
        }
        fail(tr("Cannot watch '%1': %2").arg(dirPath, QString::fromLocal8Bit(strerror(err))));
        return false;
    }

    m_watches.insert(wd, dirPath);
    if (isRoot)
        m_rootWd = wd;
    return true;
}

void WatchSubscription::queueDirectory(const QString& dirPath)
{
    m_pendingDirectories.append(dirPath);
    if (m_registrationScheduled)
        return;

    m_registrationScheduled = true;
    QTimer::singleShot(0, this, &WatchSubscription::registerPendingDirectories);
}

void WatchSubscription::registerPendingDirectories()
{
    m_registrationScheduled = false;
    if (m_state == State::Inert)
        return;

    for (int i = 0; i < RegistrationBatchSize && !m_pendingDirectories.isEmpty(); ++i) {
        const QString dirPath = m_pendingDirectories.takeLast();
        const DirectoryListing listing = listDirectory(dirPath);
        if (const auto* error = std::get_if<DirectoryAccessError>(&listing)) {
            qDebug() << "Not descending into" << error->path << ":" << error->message;
            continue;
        }

        for (const QFileInfo& info : std::get<QFileInfoList>(listing)) {
            if (!info.isDir() || info.isSymLink())
                continue;
            const QString child = info.absoluteFilePath();
            if (!addWatch(child, false))
                return;
            m_pendingDirectories.append(child);
        }
    }

    if (m_pendingDirectories.isEmpty()) {
        qDebug() << "Watching" << m_watches.size() << "directories under" << m_rootPath;
        emit registrationFinished();
        return;
    }

    m_registrationScheduled = true;
    QTimer::singleShot(0, this, &WatchSubscription::registerPendingDirectories);
}

void WatchSubscription::onInotifyEvent()
{
    if (m_inotifyFd < 0)
        return;

    alignas(struct inotify_event) char buffer[4096];
    bool mutated = false;

    for (;;) {
        const ssize_t len = read(m_inotifyFd, buffer, sizeof(buffer));
        if (len < 0) {
            if (errno == EINTR)
                continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK)
                qWarning() << "Failed to read inotify events:" << strerror(errno);
            break;
        }
        if (len == 0)
            break;

        for (const char* ptr = buffer; ptr < buffer + len; ) {
            const auto* event = reinterpret_cast<const struct inotify_event*>(ptr);
            ptr += sizeof(struct inotify_event) + event->len;

            if (event->mask & IN_Q_OVERFLOW) {
                qWarning() << "inotify queue overflow while watching" << m_rootPath;
                mutated = true;
                continue;
            }

            if (event->wd == m_rootWd
                && (event->mask & (IN_DELETE_SELF | IN_MOVE_SELF | IN_IGNORED | IN_UNMOUNT))) {
                fail(tr("Watched directory '%1' was removed or moved").arg(m_rootPath));
                return;
            }

            if (event->mask & IN_IGNORED) {
                m_watches.remove(event->wd);
                continue;
            }

            mutated = true;

            // New subtree: start watching it and everything already inside
            if ((event->mask & IN_ISDIR) && (event->mask & (IN_CREATE | IN_MOVED_TO)) && event->len > 0) {
                const QString parent = m_watches.value(event->wd);
                if (!parent.isEmpty()) {
                    const QString newDir = QDir(parent).filePath(QFile::decodeName(event->name));
                    if (!addWatch(newDir, false))
                        return;
                    queueDirectory(newDir);
                }
            }
        }
    }

    if (mutated)
        registerEvent();
}

void WatchSubscription::registerEvent()
{
    if (m_state == State::Inert)
        return;

    // (Re)start: a running timer is restarted, so it fires after the last event
    m_debounceTimer->start();
    m_state = State::PendingRefresh;
}

void WatchSubscription::onDebounceTimeout()
{
    if (m_state != State::PendingRefresh)
        return;

    m_state = State::Idle;
    emit changed();
}

void WatchSubscription::fail(const QString& message)
{
    qWarning() << "Directory watch failed:" << message;
    teardown();
    m_state = State::Inert;

    if (m_failureReported)
        return;
    m_failureReported = true;

    // Queued so a failure inside start() still reaches callbacks that are
    // registered right after watchDirectory() returns.
    QMetaObject::invokeMethod(this, [this, message]() {
        emit failed(message);
    }, Qt::QueuedConnection);
}
