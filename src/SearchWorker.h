#pragma once

#include <QFileInfoList>
#include <QMetaType>
#include <QObject>
#include <QString>
#include <QRegularExpression>

#include <atomic>
#include <memory>
#include <variant>

struct SearchRequest {
    QString rootPath;
    QString fileNamePattern;            // wildcard pattern (e.g., "*.txt"); empty means "*"
    bool fileNameCaseSensitive = true;
    int progressInterval = 1000;        // entries between progressUpdate signals
};

struct SearchSummary {
    int matchCount = 0;
    int visitedDirectories = 0;
    int skippedDirectories = 0;         // could not be listed
    bool stopped = false;
};

Q_DECLARE_METATYPE(SearchSummary)

struct DirectoryAccessError {
    QString path;
    QString message;
};

// Outcome of listing one directory during the walk.
using DirectoryListing = std::variant<QFileInfoList, DirectoryAccessError>;

// All entries of dirPath (hidden ones included) in enumeration order,
// or the reason the directory cannot be read.
DirectoryListing listDirectory(const QString& dirPath);

// Anchored regular expression for a glob over a single name.
// '*' matches any run of characters, '?' exactly one; everything else is literal.
QRegularExpression globToRegularExpression(const QString& pattern, bool caseSensitive);

class SearchWorker : public QObject {
    Q_OBJECT

public:
    using StopFlag = std::shared_ptr<std::atomic_bool>;

    SearchWorker(const SearchRequest& request, StopFlag stopFlag, QObject* parent = nullptr);

    bool matchesFileName(const QString& fileName) const;

public slots:
    void startSearch();

signals:
    void resultFound(const QString& path);
    void progressUpdate(int searchedEntries, int foundEntries);
    void searchFinished(const SearchSummary& summary);

private:
    SearchRequest m_request;
    QRegularExpression m_fileNameRegex;
    StopFlag m_shouldStop;
};
