#ifndef FILEOPERATIONS_H
#define FILEOPERATIONS_H

#include "OperationTypes.h"

#include <QString>

// Per-item work of a batch. Everything here runs on the worker thread and
// reports failures by throwing std::runtime_error; the engine turns each
// exception into one OperationError and moves on to the next item.
namespace FileOperations {

// Returns empty string when the request may be submitted, otherwise the
// reason it is rejected.
QString validateRequest(const OperationRequest& request);

// Check if target is invalid (same path or subdirectory of source)
bool isInvalidCopyMoveTarget(const QString& srcPath, const QString& dstPath);

// destDir/<base name of srcPath>
QString targetPathFor(const QString& srcPath, const QString& destDir);

// Copy srcPath into destDir. Symlinks are recreated, directories are copied
// recursively (keeping inner symlinks), files keep mode and mtime.
void copyItem(const QString& srcPath, const QString& destDir, const OperationRequest& options);

// Move srcPath into destDir: rename on the same volume, copy + delete otherwise.
void moveItem(const QString& srcPath, const QString& destDir, const OperationRequest& options);

// Remove path; never follows a symlink to a directory.
void deleteItem(const QString& path);

// Rename path to newName inside the same directory. Fails if an entry with
// that name already exists.
void renameItem(const QString& path, const QString& newName);

// Create path and any missing parents. Fails if path already exists.
void createDirectoryItem(const QString& path);

// Hash src and dst with the request's algorithm. On mismatch dst is removed
// and the call throws.
void verifyCopy(const QString& srcPath, const QString& dstPath, const OperationRequest& options);

// True if name can be used as a single directory entry name.
bool isValidEntryName(const QString& name);

// Extract zip archive into destDir, or next to the archive if destDir is empty.
void extractItem(const QString& archivePath, const QString& destDir);

// Dispatch one source path of request to the matching operation above.
void executeItem(const OperationRequest& request, const QString& srcPath);

} // namespace FileOperations

#endif // FILEOPERATIONS_H
