#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

// Low level filesystem primitives used by the operation engine.
// Everything here is Qt-free and reports failures by throwing
// std::runtime_error whose message names the path and the OS reason.
namespace fileutils {

// Unique "<crc><pid><time><seq>.part" name next to path (or inside it when
// pathIsDir). Used as the temporary target of a file copy.
std::string makeTempPartPath(const std::string& path, bool pathIsDir);

// Generic file hash using Botan-2.
//
// Parameters:
//   file_path   - path to the file to hash
//   buffer_size - temporary read buffer size; if 0, std::logic_error is thrown
//   algorithm   - hash algorithm name understood by Botan (e.g. "SHA-256",
//                 "SHA-512", "SHA-1", "BLAKE2b", ...)
//
// Throws:
//   std::logic_error   - if buffer_size == 0 (programming error)
//   std::runtime_error - if file operations fail or algorithm is unsupported
//
// Returns:
//   Lower-case hexadecimal string with the digest.
//
std::string compute_file_hash(const std::filesystem::path& file_path,
                              std::size_t buffer_size,
                              std::string_view algorithm);

// True if path itself is a symbolic link (never follows it).
bool isSymlink(const std::filesystem::path& path);

// True if path exists in any form, including a dangling symlink.
bool entryExists(const std::filesystem::path& path);

// True if the entry at path (not followed) and the directory dir live on
// the same device. Throws if either cannot be stat'ed.
bool sameVolume(const std::filesystem::path& path, const std::filesystem::path& dir);

// Copy atime/mtime of src onto dst and flush dst to disk.
void preserveFileTimes(const std::filesystem::path& src, const std::filesystem::path& dst);

// Copy a regular file with its permission bits and timestamps.
// Data goes to a temporary .part file in the destination directory first,
// which is then renamed onto dst. An existing dst is replaced.
void copyRegularFile(const std::filesystem::path& src, const std::filesystem::path& dst);

// Create dst as a symlink with exactly the same target string as src.
void copySymlink(const std::filesystem::path& src, const std::filesystem::path& dst);

using CopiedFileCallback = std::function<void(const std::filesystem::path& src,
                                              const std::filesystem::path& dst)>;

// Recursively copy directory src to dst (which must not exist).
// Symlinks inside the tree are recreated, not followed. Entries that fail
// are skipped and the copy continues; afterwards a single error listing the
// number of failures and the first reason is thrown.
//
// onFileCopied, if set, runs after each regular file is copied. An exception
// from it counts as a failure of that entry.
void copyTree(const std::filesystem::path& src, const std::filesystem::path& dst,
              const CopiedFileCallback& onFileCopied = {});

// Remove path. Real directories are removed recursively, symlinks and
// everything else are unlinked without following.
void removePath(const std::filesystem::path& path);

enum class RenameResult { Renamed, CrossDevice };

// rename(2). Returns CrossDevice instead of throwing when the kernel refuses
// with EXDEV so the caller can fall back to copy + delete.
RenameResult renamePath(const std::filesystem::path& src, const std::filesystem::path& dst);

std::string trim(const std::string& str);
}
