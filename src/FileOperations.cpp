#include "FileOperations.h"
#include "Archives.h"
#include "fileutils.h"
#include "quitls.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QObject>

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

QString operationKindName(OperationKind kind)
{
    switch (kind) {
        case OperationKind::Copy:
            return "Copy";
        case OperationKind::Move:
            return "Move";
        case OperationKind::Delete:
            return "Delete";
        case OperationKind::Extract:
            return "Extract";
        case OperationKind::Rename:
            return "Rename";
        case OperationKind::CreateDirectory:
            return "Create directory";
    }
    return "Unknown";
}

namespace FileOperations {

namespace {

[[noreturn]] void fail(const QString& message)
{
    throw std::runtime_error(message.toStdString());
}

void ensureSourceExists(const QString& srcPath)
{
    if (!fileutils::entryExists(toFsPath(srcPath)))
        fail(QObject::tr("'%1' does not exist").arg(srcPath));
}

// State may have changed since submission; re-check before touching anything.
void ensureDestinationDir(const QString& destDir)
{
    QFileInfo dstInfo(destDir);
    if (!dstInfo.exists())
        fail(QObject::tr("Destination directory '%1' does not exist").arg(destDir));
    if (!dstInfo.isDir())
        fail(QObject::tr("'%1' exists but is not a directory").arg(destDir));
}

// Guards shared by copy and move. Returns the final target path.
QString prepareTarget(const QString& srcPath, const QString& destDir, const OperationRequest& options)
{
    ensureSourceExists(srcPath);
    ensureDestinationDir(destDir);

    const QString target = targetPathFor(srcPath, destDir);
    if (isInvalidCopyMoveTarget(srcPath, target))
        fail(QObject::tr("Cannot %1 '%2' onto itself or into its own subdirectory")
                 .arg(operationKindName(options.kind).toLower(), srcPath));

    const fs::path fsTarget = toFsPath(target);
    if (fileutils::entryExists(fsTarget)) {
        if (!options.overwriteExisting)
            fail(QObject::tr("'%1' already exists").arg(target));
        // Replacing a directory that contains the source would destroy it.
        const QString srcCanonical = QFileInfo(srcPath).canonicalFilePath();
        const QString dstCanonical = QFileInfo(target).canonicalFilePath();
        if (!fileutils::isSymlink(fsTarget) && !dstCanonical.isEmpty()
            && srcCanonical.startsWith(dstCanonical + '/'))
            fail(QObject::tr("Cannot replace '%1' because it contains '%2'").arg(target, srcPath));
        qDebug() << "Replacing existing" << target;
        fileutils::removePath(fsTarget);
    }
    return target;
}

void verifyFileCopy(const fs::path& src, const fs::path& dst, const OperationRequest& options)
{
    const std::string algorithm = options.verifyAlgorithm.toStdString();
    const std::size_t bufSize = options.hashBufferSize > 0
        ? static_cast<std::size_t>(options.hashBufferSize)
        : static_cast<std::size_t>(64 * 1024);

    std::string srcHash;
    std::string dstHash;
    try {
        srcHash = fileutils::compute_file_hash(src, bufSize, algorithm);
        dstHash = fileutils::compute_file_hash(dst, bufSize, algorithm);
    } catch (const std::exception& e) {
        std::error_code ignored;
        fs::remove(dst, ignored);
        fail(QObject::tr("Cannot verify '%1': %2").arg(fromFsPath(src), QString::fromLocal8Bit(e.what())));
    }

    if (srcHash != dstHash) {
        std::error_code ignored;
        fs::remove(dst, ignored);
        fail(QObject::tr("Verification failed for '%1' (%2 mismatch)")
                 .arg(fromFsPath(src), options.verifyAlgorithm));
    }
}

// Copy src onto target (which does not exist). Shared by copy and the
// cross-volume branch of move.
void copyEntry(const fs::path& src, const fs::path& target, const OperationRequest& options)
{
    std::error_code ec;
    const fs::file_status st = fs::symlink_status(src, ec);
    if (ec)
        fail(QObject::tr("Cannot stat '%1': %2").arg(fromFsPath(src), QString::fromStdString(ec.message())));

    if (fs::is_symlink(st)) {
        fileutils::copySymlink(src, target);
    } else if (fs::is_directory(st)) {
        fileutils::CopiedFileCallback verify;
        if (options.verifyCopies) {
            verify = [&options](const fs::path& from, const fs::path& to) {
                verifyFileCopy(from, to, options);
            };
        }
        fileutils::copyTree(src, target, verify);
    } else if (fs::is_regular_file(st)) {
        fileutils::copyRegularFile(src, target);
        if (options.verifyCopies)
            verifyFileCopy(src, target, options);
    } else {
        fail(QObject::tr("'%1' is not a regular file, directory or symbolic link").arg(fromFsPath(src)));
    }
}

} // anonymous namespace

QString validateRequest(const OperationRequest& request)
{
    if (request.sourcePaths.isEmpty())
        return QObject::tr("No source paths given");

    for (const QString& path : request.sourcePaths) {
        if (path.isEmpty() || !QDir::isAbsolutePath(path))
            return QObject::tr("Source path '%1' is not absolute").arg(path);
        const bool exists = fileutils::entryExists(toFsPath(path));
        if (request.kind == OperationKind::CreateDirectory) {
            if (exists)
                return QObject::tr("'%1' already exists").arg(path);
        } else if (!exists) {
            return QObject::tr("'%1' does not exist").arg(path);
        }
    }

    switch (request.kind) {
        case OperationKind::Copy:
        case OperationKind::Move: {
            if (request.destinationDir.isEmpty())
                return QObject::tr("%1 requires a destination directory").arg(operationKindName(request.kind));
            if (!QDir::isAbsolutePath(request.destinationDir))
                return QObject::tr("Destination '%1' is not absolute").arg(request.destinationDir);
            QFileInfo dstInfo(request.destinationDir);
            if (!dstInfo.exists())
                return QObject::tr("Destination directory '%1' does not exist").arg(request.destinationDir);
            if (!dstInfo.isDir())
                return QObject::tr("'%1' exists but is not a directory").arg(request.destinationDir);
            break;
        }
        case OperationKind::Delete:
            if (!request.destinationDir.isEmpty())
                return QObject::tr("Delete does not take a destination directory");
            break;
        case OperationKind::Extract:
            if (!request.destinationDir.isEmpty()) {
                QFileInfo dstInfo(request.destinationDir);
                if (!QDir::isAbsolutePath(request.destinationDir) || !dstInfo.isDir())
                    return QObject::tr("'%1' is not a directory").arg(request.destinationDir);
            }
            break;
        case OperationKind::Rename:
            if (request.sourcePaths.size() != 1)
                return QObject::tr("Rename takes exactly one path");
            if (!isValidEntryName(request.newName))
                return QObject::tr("'%1' is not a valid name").arg(request.newName);
            if (!request.destinationDir.isEmpty())
                return QObject::tr("Rename does not take a destination directory");
            break;
        case OperationKind::CreateDirectory:
            if (!request.destinationDir.isEmpty())
                return QObject::tr("Create directory does not take a destination directory");
            break;
    }

    return QString();
}

bool isInvalidCopyMoveTarget(const QString& srcPath, const QString& dstPath)
{
    // A symlink is copied as a link; only the exact same path is a problem.
    if (fileutils::isSymlink(toFsPath(srcPath)))
        return QDir::cleanPath(srcPath) == QDir::cleanPath(dstPath);

    QFileInfo srcInfo(srcPath);
    QFileInfo dstInfo(dstPath);

    QString srcCanonical = srcInfo.canonicalFilePath();
    // For destination that may not exist yet, get canonical path of existing parent
    QString dstCanonical;
    if (dstInfo.exists()) {
        dstCanonical = dstInfo.canonicalFilePath();
    } else {
        const QString parentCanonical = QFileInfo(dstInfo.absolutePath()).canonicalFilePath();
        if (!parentCanonical.isEmpty())
            dstCanonical = QDir(parentCanonical).filePath(dstInfo.fileName());
    }

    if (srcCanonical.isEmpty() || dstCanonical.isEmpty())
        return false;

    // Same path
    if (srcCanonical == dstCanonical)
        return true;

    // Destination is subdirectory of source (only when source is directory)
    if (srcInfo.isDir()) {
        QString srcWithSlash = srcCanonical;
        if (!srcWithSlash.endsWith('/'))
            srcWithSlash += '/';
        if (dstCanonical.startsWith(srcWithSlash))
            return true;
    }

    return false;
}

bool isValidEntryName(const QString& name)
{
    return !name.isEmpty() && name != "." && name != ".."
        && !name.contains('/') && !name.contains(QChar('\0'));
}

QString targetPathFor(const QString& srcPath, const QString& destDir)
{
    return QDir(destDir).filePath(baseName(srcPath));
}

void copyItem(const QString& srcPath, const QString& destDir, const OperationRequest& options)
{
    const QString target = prepareTarget(srcPath, destDir, options);
    copyEntry(toFsPath(srcPath), toFsPath(target), options);
}

void moveItem(const QString& srcPath, const QString& destDir, const OperationRequest& options)
{
    const QString target = prepareTarget(srcPath, destDir, options);
    const fs::path src = toFsPath(srcPath);
    const fs::path dst = toFsPath(target);

    // Check if same filesystem (true move) or different (copy+delete)
    if (fileutils::sameVolume(src, toFsPath(destDir))) {
        if (fileutils::renamePath(src, dst) == fileutils::RenameResult::Renamed)
            return;
        qDebug() << "Rename of" << srcPath << "crossed a device boundary, copying instead";
    }

    try {
        copyEntry(src, dst, options);
    } catch (const std::exception&) {
        // Keep the source; drop whatever part of the copy was written.
        if (fileutils::entryExists(dst)) {
            try {
                fileutils::removePath(dst);
            } catch (const std::exception& cleanup) {
                qWarning() << "Failed to remove partial copy:" << cleanup.what();
            }
        }
        throw;
    }
    fileutils::removePath(src);
}

void deleteItem(const QString& path)
{
    ensureSourceExists(path);
    fileutils::removePath(toFsPath(path));
}

void renameItem(const QString& path, const QString& newName)
{
    ensureSourceExists(path);
    if (!isValidEntryName(newName))
        fail(QObject::tr("'%1' is not a valid name").arg(newName));

    const QString target = QDir(QFileInfo(path).absolutePath()).filePath(newName);
    if (fileutils::entryExists(toFsPath(target)))
        fail(QObject::tr("'%1' already exists").arg(target));

    if (fileutils::renamePath(toFsPath(path), toFsPath(target)) == fileutils::RenameResult::CrossDevice)
        fail(QObject::tr("Cannot rename '%1': crosses a device boundary").arg(path));
}

void createDirectoryItem(const QString& path)
{
    const fs::path dir = toFsPath(path);
    if (fileutils::entryExists(dir))
        fail(QObject::tr("'%1' already exists").arg(path));

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        fail(QObject::tr("Cannot create directory '%1': %2").arg(path, QString::fromStdString(ec.message())));
}

void verifyCopy(const QString& srcPath, const QString& dstPath, const OperationRequest& options)
{
    verifyFileCopy(toFsPath(srcPath), toFsPath(dstPath), options);
}

void extractItem(const QString& archivePath, const QString& destDir)
{
    QFileInfo archiveInfo(archivePath);
    if (!archiveInfo.exists())
        fail(QObject::tr("'%1' does not exist").arg(archivePath));
    if (!archiveInfo.isFile())
        fail(QObject::tr("'%1' is not an archive file").arg(archivePath));

    const QString target = destDir.isEmpty() ? archiveInfo.absolutePath() : destDir;
    ensureDestinationDir(target);

    const QString error = extractZip(archivePath, target);
    if (!error.isEmpty())
        fail(error);
}

void executeItem(const OperationRequest& request, const QString& srcPath)
{
    // "link/" would resolve through the link; work on the entry itself
    const QString path = QDir::cleanPath(srcPath);

    switch (request.kind) {
        case OperationKind::Copy:
            copyItem(path, request.destinationDir, request);
            break;
        case OperationKind::Move:
            moveItem(path, request.destinationDir, request);
            break;
        case OperationKind::Delete:
            deleteItem(path);
            break;
        case OperationKind::Extract:
            extractItem(path, request.destinationDir);
            break;
        case OperationKind::Rename:
            renameItem(path, request.newName);
            break;
        case OperationKind::CreateDirectory:
            createDirectoryItem(path);
            break;
    }
}

} // namespace FileOperations
