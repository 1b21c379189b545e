#include "SearchWorker.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QObject>
#include <QVector>

DirectoryListing listDirectory(const QString& dirPath)
{
    QFileInfo dirInfo(dirPath);
    if (!dirInfo.exists())
        return DirectoryAccessError{dirPath, QObject::tr("No such directory")};
    if (!dirInfo.isDir())
        return DirectoryAccessError{dirPath, QObject::tr("Not a directory")};
    if (!dirInfo.isReadable() || !dirInfo.isExecutable())
        return DirectoryAccessError{dirPath, QObject::tr("Permission denied")};

    QDir dir(dirPath);
    // System keeps dangling symlinks, sockets and fifos in the listing
    return dir.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
                             QDir::NoSort);
}

QRegularExpression globToRegularExpression(const QString& pattern, bool caseSensitive)
{
    QString effective = pattern.isEmpty() ? QStringLiteral("*") : pattern;

    QString regex;
    regex.reserve(effective.size() * 2);
    for (const QChar ch : effective) {
        if (ch == '*')
            regex += QStringLiteral(".*");
        else if (ch == '?')
            regex += '.';
        else
            regex += QRegularExpression::escape(QString(ch));
    }

    QRegularExpression::PatternOptions options = QRegularExpression::DotMatchesEverythingOption;
    if (!caseSensitive)
        options |= QRegularExpression::CaseInsensitiveOption;

    return QRegularExpression(QRegularExpression::anchoredPattern(regex), options);
}

SearchWorker::SearchWorker(const SearchRequest& request, StopFlag stopFlag, QObject* parent)
    : QObject(parent)
    , m_request(request)
    , m_fileNameRegex(globToRegularExpression(request.fileNamePattern, request.fileNameCaseSensitive))
    , m_shouldStop(std::move(stopFlag))
{
}

bool SearchWorker::matchesFileName(const QString& fileName) const
{
    return m_fileNameRegex.match(fileName).hasMatch();
}

void SearchWorker::startSearch()
{
    SearchSummary summary;
    int searchedEntries = 0;
    const int interval = m_request.progressInterval > 0 ? m_request.progressInterval : 1000;

    // Depth-first with an explicit stack; children are pushed in reverse so
    // they are visited in enumeration order.
    QVector<QString> pending;
    pending.push_back(m_request.rootPath);

    while (!pending.isEmpty()) {
        // Checkpoint: a stop request abandons every unvisited directory
        if (m_shouldStop->load()) {
            summary.stopped = true;
            break;
        }

        const QString dirPath = pending.takeLast();
        const DirectoryListing listing = listDirectory(dirPath);

        if (const auto* error = std::get_if<DirectoryAccessError>(&listing)) {
            ++summary.skippedDirectories;
            qDebug() << "Skipping" << error->path << ":" << error->message;
            continue;
        }
        ++summary.visitedDirectories;

        QVector<QString> subdirs;
        for (const QFileInfo& info : std::get<QFileInfoList>(listing)) {
            if (++searchedEntries % interval == 0)
                emit progressUpdate(searchedEntries, summary.matchCount);

            if (matchesFileName(info.fileName())) {
                ++summary.matchCount;
                emit resultFound(info.absoluteFilePath());
            }

            // Never descend through a symlink; cyclic links would loop forever
            if (info.isDir() && !info.isSymLink())
                subdirs.push_back(info.absoluteFilePath());
        }

        for (auto it = subdirs.crbegin(); it != subdirs.crend(); ++it)
            pending.push_back(*it);
    }

    emit progressUpdate(searchedEntries, summary.matchCount);
    emit searchFinished(summary);
}
