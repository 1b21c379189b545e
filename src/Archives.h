#ifndef ARCHIVES_H
#define ARCHIVES_H

#include <QString>
#include <QList>

// Entry in an archive (file or directory)
struct ArchiveEntry {
    QString path;           // Full path inside archive (e.g., "dir1/dir2/file.txt")
    QString name;           // Just the filename
    bool isDirectory = false;
    bool isSymlink = false;
    qint64 size = 0;
};

// Contents of an archive
struct ArchiveContents {
    QString archivePath;                    // Path to archive file
    QList<ArchiveEntry> allEntries;         // Flat list of all entries
    QString error;                          // Non-empty if the archive could not be read

    bool isValid() const { return error.isEmpty(); }
};

// Read zip archive contents using libarchive (headers only, no data)
ArchiveContents readArchive(const QString& archivePath);

// True if an entry name stays inside the extraction directory:
// relative, no ".." component, not empty.
bool isSafeEntryPath(const QString& entryPath);

// Extract zip archive into destDir.
// Every entry name is checked before anything is written; an archive with
// an absolute path, a ".." component or a symlink entry is rejected whole.
// Returns empty string on success, error message on failure
QString extractZip(const QString& archivePath, const QString& destDir);

#endif // ARCHIVES_H
