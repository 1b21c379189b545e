#include "fileutils.h"

#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <atomic>
#include <fstream>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <botan/hash.h>
#include <botan/hex.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fileutils {

namespace fs = std::filesystem;

namespace {

[[noreturn]] void throwFsError(const std::string& what, const fs::path& path, const std::error_code& ec)
{
    throw std::runtime_error(what + " '" + path.string() + "': " + ec.message());
}

[[noreturn]] void throwErrno(const std::string& what, const fs::path& path)
{
    throwFsError(what, path, std::error_code(errno, std::generic_category()));
}

struct stat lstatOrThrow(const fs::path& path)
{
    struct stat st;
    if (::lstat(path.c_str(), &st) != 0)
        throwErrno("Cannot stat", path);
    return st;
}

// Copies permission bits and timestamps of a directory after its content
// has been written (writing children bumps the mtime).
void copyDirectoryAttributes(const fs::path& src, const fs::path& dst)
{
    std::error_code ec;
    fs::permissions(dst, fs::status(src).permissions(), fs::perm_options::replace, ec);
    if (ec)
        throwFsError("Cannot set permissions on", dst, ec);

    struct stat st;
    if (::stat(src.c_str(), &st) == 0) {
        struct timespec times[2];
        times[0] = st.st_atim;
        times[1] = st.st_mtim;
        ::utimensat(AT_FDCWD, dst.c_str(), times, 0);
    }
}

} // anonymous namespace

std::string makeTempPartPath(const std::string& path, bool pathIsDir)
{
    static std::atomic<uint32_t> g_seq{0};

    fs::path abs = fs::absolute(path);
    fs::path dir = pathIsDir ? abs : abs.parent_path();
    fs::path hashedPath = abs;

    std::string utf8 = hashedPath.u8string();
    auto crc = Botan::HashFunction::create("CRC32");
    crc->update(reinterpret_cast<const uint8_t*>(utf8.data()), utf8.size());
    auto digest = crc->final();

    std::string crcHex = Botan::hex_encode(digest);
    if (crcHex.size() > 8)
        crcHex = crcHex.substr(0, 8);

    int pid = ::getpid();

    using namespace std::chrono;

    auto now  = system_clock::now();
    auto tt   = system_clock::to_time_t(now);
    auto us   = duration_cast<microseconds>(now.time_since_epoch()) % 1000000; // 0–999999
    auto ms   = duration_cast<milliseconds>(us) % 1000;                        // mmm
    auto microsOnly = us - duration_cast<microseconds>(ms);                    // uuu

    std::tm tm{};
    localtime_r(&tt, &tm);

    std::ostringstream tbuf;
    tbuf << std::setw(2) << std::setfill('0') << tm.tm_min
         << std::setw(2) << tm.tm_sec
         << std::setw(3) << std::setfill('0') << ms.count()
         << std::setw(3) << std::setfill('0') << microsOnly.count();

    std::string timeStr = tbuf.str();

    constexpr uint32_t SEQ_MOD = 10'000;
    uint32_t seq = g_seq.fetch_add(1, std::memory_order_relaxed) % SEQ_MOD;

    std::ostringstream name;
    name << '.' << crcHex << pid << timeStr << seq << ".part";

    return (dir / name.str()).string();
}


std::string compute_file_hash(const fs::path& file_path,
                              std::size_t buffer_size,
                              std::string_view algorithm)
{
    if (buffer_size == 0) {
        // Zero buffer size is a logic error in the caller.
        throw std::logic_error("compute_file_hash: buffer_size must be > 0");
    }

    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec)) {
        throw std::runtime_error("compute_file_hash: not a regular file: " + file_path.string());
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("compute_file_hash: unable to open file for reading");
    }

    auto hash = Botan::HashFunction::create(std::string(algorithm));
    if (!hash) {
        throw std::runtime_error(
            std::string("compute_file_hash: unsupported algorithm: ") +
            std::string(algorithm));
    }

    std::vector<std::uint8_t> buffer(buffer_size);

    while (in) {
        in.read(reinterpret_cast<char*>(buffer.data()),
                static_cast<std::streamsize>(buffer.size()));
        const std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }

        hash->update(buffer.data(), static_cast<std::size_t>(got));
    }
    if (in.bad()) {
        throw std::runtime_error("compute_file_hash: read error on " + file_path.string());
    }

    const auto digest = hash->final();
    return Botan::hex_encode(digest, false /*lowercase*/);
}

bool isSymlink(const fs::path& path)
{
    std::error_code ec;
    return fs::is_symlink(fs::symlink_status(path, ec));
}

bool entryExists(const fs::path& path)
{
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

bool sameVolume(const fs::path& path, const fs::path& dir)
{
    const struct stat srcStat = lstatOrThrow(path);
    struct stat dirStat;
    if (::stat(dir.c_str(), &dirStat) != 0)
        throwErrno("Cannot stat", dir);
    return srcStat.st_dev == dirStat.st_dev;
}

void preserveFileTimes(const fs::path& src, const fs::path& dst)
{
    struct stat srcStat;
    if (::stat(src.c_str(), &srcStat) != 0)
        throwErrno("Cannot stat", src);

    struct timespec times[2];
    times[0] = srcStat.st_atim;  // access time
    times[1] = srcStat.st_mtim;  // modification time
    if (::utimensat(AT_FDCWD, dst.c_str(), times, 0) != 0)
        throwErrno("Cannot set timestamps on", dst);

    // Sync file to disk (important for USB drives to prevent data loss)
    int fd = ::open(dst.c_str(), O_RDONLY);
    if (fd >= 0) {
        ::fsync(fd);
        ::close(fd);
    }
}

void copyRegularFile(const fs::path& src, const fs::path& dst)
{
    const fs::path tmp = makeTempPartPath(dst.parent_path().string(), true);

    std::error_code ec;
    fs::copy_file(src, tmp, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throwFsError("Cannot copy", src, ec);
    }

    try {
        fs::permissions(tmp, fs::status(src).permissions(), fs::perm_options::replace);
        preserveFileTimes(src, tmp);
    } catch (const std::exception& e) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw std::runtime_error(std::string("Cannot copy metadata of '") + src.string() + "': " + e.what());
    }

    if (::rename(tmp.c_str(), dst.c_str()) != 0) {
        const int err = errno;
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throwFsError("Cannot create", dst, std::error_code(err, std::generic_category()));
    }
}

void copySymlink(const fs::path& src, const fs::path& dst)
{
    std::error_code ec;
    const fs::path target = fs::read_symlink(src, ec);
    if (ec)
        throwFsError("Cannot read link", src, ec);

    fs::create_symlink(target, dst, ec);
    if (ec)
        throwFsError("Cannot create link", dst, ec);
}

void copyTree(const fs::path& src, const fs::path& dst, const CopiedFileCallback& onFileCopied)
{
    std::error_code ec;
    if (!fs::create_directory(dst, ec)) {
        if (!ec)
            ec = std::make_error_code(std::errc::file_exists);
        throwFsError("Cannot create directory", dst, ec);
    }

    std::size_t failures = 0;
    std::string firstError;
    auto recordFailure = [&](const std::string& message) {
        if (failures++ == 0)
            firstError = message;
    };

    fs::directory_iterator it(src, ec);
    if (ec)
        throwFsError("Cannot list directory", src, ec);

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            recordFailure("Cannot list directory '" + src.string() + "': " + ec.message());
            break;
        }

        const fs::path from = it->path();
        const fs::path to = dst / from.filename();
        try {
            const fs::file_status st = it->symlink_status();
            if (fs::is_symlink(st)) {
                copySymlink(from, to);
            } else if (fs::is_directory(st)) {
                copyTree(from, to, onFileCopied);
            } else if (fs::is_regular_file(st)) {
                copyRegularFile(from, to);
                if (onFileCopied)
                    onFileCopied(from, to);
            } else {
                recordFailure("Cannot copy special file '" + from.string() + "'");
            }
        } catch (const std::exception& e) {
            recordFailure(e.what());
        }
    }

    copyDirectoryAttributes(src, dst);

    if (failures > 0) {
        throw std::runtime_error(std::to_string(failures) + " entr" + (failures == 1 ? "y" : "ies")
                                 + " of '" + src.string() + "' not copied: " + firstError);
    }
}

void removePath(const fs::path& path)
{
    std::error_code ec;
    const fs::file_status st = fs::symlink_status(path, ec);
    if (ec || !fs::exists(st)) {
        throwFsError("Cannot remove", path,
                     ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory));
    }

    if (fs::is_directory(st)) {
        fs::remove_all(path, ec);
    } else {
        fs::remove(path, ec);
    }
    if (ec)
        throwFsError("Cannot remove", path, ec);
}

RenameResult renamePath(const fs::path& src, const fs::path& dst)
{
    if (::rename(src.c_str(), dst.c_str()) == 0)
        return RenameResult::Renamed;
    if (errno == EXDEV)
        return RenameResult::CrossDevice;
    throwErrno("Cannot move", src);
}

namespace {
std::string trimLeft(const std::string &str) {
    const auto strBegin = str.find_first_not_of(" \t");
    if (strBegin == std::string::npos)
        return std::string();
    return str.substr(strBegin, str.length() - strBegin);
}


std::string trimRight(const std::string &str) {
    const auto strEnd = str.find_last_not_of(" \t\r");
    return str.substr(0, strEnd + 1);
}

} // anonymous namespace

std::string trim(const std::string &str) {
    return trimLeft(trimRight(str));
}

}
