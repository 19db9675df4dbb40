#include "ModKey.h"
#include <cerrno>
#include <chrono>
#include <filesystem>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/stat.h>  // stat()
#endif

namespace Strata::Core::IO {

ModKeyResult computeModKey(const std::string& path) {
    ModKeyResult result;

#if defined(__unix__) || defined(__APPLE__)
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        // ENOTDIR from stat() only ever means an ancestor is not a directory
        result.error = makeErrorInfo(normalizeOpenErrno(errno), "Cannot stat file", path);
        return result;
    }

#if defined(__APPLE__)
    const auto& mtime = st.st_mtimespec;
#else
    const auto& mtime = st.st_mtim;
#endif

    // A zeroed modification time means the file system does not track it
    if (mtime.tv_sec == 0 && mtime.tv_nsec == 0) {
        result.error = makeErrorInfo(FileError::Other, "Modification time unavailable", path);
        return result;
    }

    result.key.device = static_cast<uint64_t>(st.st_dev);
    result.key.inode = static_cast<uint64_t>(st.st_ino);
    result.key.size = static_cast<uint64_t>(st.st_size);
    result.key.mtimeSeconds = static_cast<int64_t>(mtime.tv_sec);
    result.key.mtimeNanoseconds = static_cast<int64_t>(mtime.tv_nsec);
    result.key.mode = static_cast<uint32_t>(st.st_mode);
    result.key.uid = static_cast<uint32_t>(st.st_uid);
#else
    // No inode or owner through std::filesystem; size, time and permissions still change
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        if (!ec) ec = std::make_error_code(std::errc::no_such_file_or_directory);
        result.error = makeErrorInfo(ec, "Cannot stat file", path);
        return result;
    }
    auto lwt = std::filesystem::last_write_time(path, ec);
    if (ec) {
        result.error = makeErrorInfo(ec, "Cannot read modification time", path);
        return result;
    }
    const auto ticks = std::chrono::duration_cast<std::chrono::nanoseconds>(lwt.time_since_epoch()).count();
    if (ticks == 0) {
        result.error = makeErrorInfo(FileError::Other, "Modification time unavailable", path);
        return result;
    }
    if (std::filesystem::is_regular_file(status)) {
        result.key.size = static_cast<uint64_t>(std::filesystem::file_size(path, ec));
        if (ec) result.key.size = 0;
    }
    result.key.mtimeSeconds = static_cast<int64_t>(ticks / 1000000000);
    result.key.mtimeNanoseconds = static_cast<int64_t>(ticks % 1000000000);
    result.key.mode = static_cast<uint32_t>(status.permissions()) |
                      (std::filesystem::is_directory(status) ? 0x10000u : 0u);
#endif

    return result;
}

} // namespace Strata::Core::IO
