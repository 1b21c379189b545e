#include "Archives.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QObject>

#include <archive.h>
#include <archive_entry.h>

#include <memory>

namespace {

using ArchiveReader = std::unique_ptr<archive, decltype(&archive_read_free)>;
using ArchiveWriter = std::unique_ptr<archive, decltype(&archive_write_free)>;

constexpr size_t BlockSize = 10240;

QString entryPathName(archive_entry* entry)
{
    const char* utf8 = archive_entry_pathname_utf8(entry);
    if (utf8)
        return QString::fromUtf8(utf8);
    const char* raw = archive_entry_pathname(entry);
    return raw ? QFile::decodeName(raw) : QString();
}

QString archiveError(archive* a)
{
    const char* msg = archive_error_string(a);
    return msg ? QString::fromUtf8(msg) : QObject::tr("unknown libarchive error");
}

ArchiveReader openZip(const QString& archivePath, QString& error)
{
    ArchiveReader reader(archive_read_new(), &archive_read_free);
    archive_read_support_format_zip(reader.get());

    const QByteArray nativePath = QFile::encodeName(archivePath);
    if (archive_read_open_filename(reader.get(), nativePath.constData(), BlockSize) != ARCHIVE_OK) {
        error = QObject::tr("Cannot open archive '%1': %2").arg(archivePath, archiveError(reader.get()));
        return ArchiveReader(nullptr, &archive_read_free);
    }
    return reader;
}

// Copy the data of the current entry from reader to writer.
// On failure failed points at the side that reported the error.
int copyData(archive* reader, archive* writer, archive*& failed)
{
    const void* buff;
    size_t size;
    la_int64_t offset;

    for (;;) {
        int r = archive_read_data_block(reader, &buff, &size, &offset);
        if (r == ARCHIVE_EOF)
            return ARCHIVE_OK;
        if (r < ARCHIVE_OK) {
            failed = reader;
            return r;
        }
        r = static_cast<int>(archive_write_data_block(writer, buff, size, offset));
        if (r < ARCHIVE_OK) {
            failed = writer;
            return r;
        }
    }
}

} // anonymous namespace

bool isSafeEntryPath(const QString& entryPath)
{
    if (entryPath.isEmpty())
        return false;
    if (entryPath.startsWith('/') || entryPath.startsWith('\\'))
        return false;
    // "C:foo" style names from Windows-made archives
    if (entryPath.size() >= 2 && entryPath.at(1) == ':')
        return false;

    const QStringList parts = QString(entryPath).replace('\\', '/').split('/', Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        if (part == "..")
            return false;
    }
    return true;
}

ArchiveContents readArchive(const QString& archivePath)
{
    ArchiveContents contents;
    contents.archivePath = archivePath;

    ArchiveReader reader = openZip(archivePath, contents.error);
    if (!reader)
        return contents;

    archive_entry* entry = nullptr;
    int r;
    while ((r = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK) {
        ArchiveEntry e;
        e.path = entryPathName(entry);
        e.isDirectory = archive_entry_filetype(entry) == AE_IFDIR || e.path.endsWith('/');
        e.isSymlink = archive_entry_filetype(entry) == AE_IFLNK;
        e.size = archive_entry_size_is_set(entry) ? archive_entry_size(entry) : 0;

        QString trimmed = e.path;
        while (trimmed.endsWith('/'))
            trimmed.chop(1);
        e.name = trimmed.mid(trimmed.lastIndexOf('/') + 1);

        contents.allEntries.append(e);
        archive_read_data_skip(reader.get());
    }

    if (r != ARCHIVE_EOF) {
        contents.error = QObject::tr("Malformed archive '%1': %2").arg(archivePath, archiveError(reader.get()));
    }
    return contents;
}

QString extractZip(const QString& archivePath, const QString& destDir)
{
    // Pass 1: validate every entry name before writing anything.
    const ArchiveContents contents = readArchive(archivePath);
    if (!contents.isValid())
        return contents.error;

    for (const ArchiveEntry& e : contents.allEntries) {
        if (!isSafeEntryPath(e.path))
            return QObject::tr("Malformed archive '%1': entry '%2' points outside the destination directory")
                .arg(archivePath, e.path);
        if (e.isSymlink)
            return QObject::tr("Malformed archive '%1': symbolic link entry '%2' is not supported")
                .arg(archivePath, e.path);
    }

    // Pass 2: extract.
    QString error;
    ArchiveReader reader = openZip(archivePath, error);
    if (!reader)
        return error;

    ArchiveWriter writer(archive_write_disk_new(), &archive_write_free);
    archive_write_disk_set_options(writer.get(),
                                   ARCHIVE_EXTRACT_TIME
                                   | ARCHIVE_EXTRACT_PERM
                                   | ARCHIVE_EXTRACT_SECURE_NODOTDOT
                                   | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(writer.get());

    // Entry names are rewritten to absolute paths below, so the destination
    // itself must not contain symlinks for ARCHIVE_EXTRACT_SECURE_SYMLINKS.
    const QString canonicalDest = QFileInfo(destDir).canonicalFilePath();
    if (canonicalDest.isEmpty())
        return QObject::tr("Destination directory '%1' does not exist").arg(destDir);
    const QDir dest(canonicalDest);
    archive_entry* entry = nullptr;
    int extracted = 0;
    for (;;) {
        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF)
            break;
        if (r < ARCHIVE_WARN)
            return QObject::tr("Malformed archive '%1': %2").arg(archivePath, archiveError(reader.get()));

        const QString entryPath = entryPathName(entry);
        if (!isSafeEntryPath(entryPath))
            return QObject::tr("Malformed archive '%1': entry '%2' points outside the destination directory")
                .arg(archivePath, entryPath);

        const QByteArray fullPath = QFile::encodeName(QDir::cleanPath(dest.filePath(entryPath)));
        archive_entry_set_pathname(entry, fullPath.constData());

        r = archive_write_header(writer.get(), entry);
        if (r < ARCHIVE_WARN)
            return QObject::tr("Cannot extract '%1': %2").arg(entryPath, archiveError(writer.get()));

        // Always drain the data: a zip may not record the size in the local header
        archive* failed = nullptr;
        r = copyData(reader.get(), writer.get(), failed);
        if (r < ARCHIVE_WARN) {
            if (failed == writer.get())
                return QObject::tr("Cannot extract '%1': %2").arg(entryPath, archiveError(writer.get()));
            return QObject::tr("Malformed archive '%1' at '%2': %3")
                .arg(archivePath, entryPath, archiveError(reader.get()));
        }

        r = archive_write_finish_entry(writer.get());
        if (r < ARCHIVE_WARN)
            return QObject::tr("Cannot extract '%1': %2").arg(entryPath, archiveError(writer.get()));
        ++extracted;
    }

    if (archive_write_close(writer.get()) != ARCHIVE_OK)
        return QObject::tr("Cannot finish extraction of '%1': %2").arg(archivePath, archiveError(writer.get()));

    qDebug() << "Extracted" << extracted << "entries from" << archivePath << "to" << destDir;
    return QString();
}
