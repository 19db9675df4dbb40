#include "RealFileSystem.h"
#include "PathUtils.h"
#include "../Logging/Logger.h"
#include "../CoreCommon.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#if defined(__unix__) || defined(__APPLE__)
#include <dirent.h>    // fdopendir(), readdir()
#include <fcntl.h>     // open()
#include <unistd.h>    // read(), close()
#include <sys/stat.h>  // fstat()
#endif

namespace Strata::Core::IO {

namespace {
    constexpr const char* LogCategory = "FileSystem";

#if defined(__unix__) || defined(__APPLE__)
    // Closes a descriptor on scope exit unless ownership was handed off
    struct PosixFd {
        int fd = -1;
        ~PosixFd() {
            if (fd >= 0) {
                ::close(fd);
            }
        }
        int release() noexcept {
            int out = fd;
            fd = -1;
            return out;
        }
    };

    struct PosixDir {
        DIR* dir = nullptr;
        ~PosixDir() {
            if (dir) {
                ::closedir(dir);
            }
        }
    };
#endif

    // Reads directory names; returns 0 or an errno value. ENOTDIR from open() is
    // normalized, ENOTDIR from enumerating an opened non-directory is kept.
    int readDirectoryNames(const std::string& path, std::vector<std::string>& names) {
#if defined(__unix__) || defined(__APPLE__)
        PosixFd file;
        file.fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK);
        if (file.fd < 0) {
            return normalizeOpenErrno(errno);
        }

        PosixDir dir;
        dir.dir = ::fdopendir(file.fd);
        if (!dir.dir) {
            return errno;
        }
        file.release();  // owned by dir now

        for (;;) {
            errno = 0;
            const dirent* ent = ::readdir(dir.dir);
            if (!ent) {
                return errno;
            }
            const char* name = ent->d_name;
            if ((name[0] == '.' && name[1] == '\0') || (name[0] == '.' && name[1] == '.' && name[2] == '\0')) {
                continue;
            }
            names.emplace_back(name);
        }
#else
        std::error_code ec;
        std::filesystem::directory_iterator it(path, ec);
        if (ec) {
            std::error_code stEc;
            auto status = std::filesystem::status(path, stEc);
            if (!stEc && std::filesystem::exists(status) && !std::filesystem::is_directory(status)) {
                return ENOTDIR;
            }
            // Windows reports a missing path as "not a directory" in several cases
            if (ec == std::errc::not_a_directory || ec == std::errc::no_such_file_or_directory) {
                return ENOENT;
            }
            if (ec == std::errc::permission_denied) {
                return EACCES;
            }
            return EIO;
        }
        for (const auto& entry : it) {
            names.push_back(entry.path().filename().string());
        }
        return 0;
#endif
    }

    bool parseBoolFlag(const std::string& value, bool fallback) {
        std::string lowered(value);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered == "0" || lowered == "false" || lowered == "off" || lowered == "no") return false;
        if (lowered == "1" || lowered == "true" || lowered == "on" || lowered == "yes") return true;
        return fallback;
    }
}

RealFileSystem::Config RealFileSystem::Config::fromEnvironment() {
    Config cfg;

    if (auto maxOpen = safeGetEnv("STRATA_FS_MAX_OPEN_FILES")) {
        try {
            size_t consumed = 0;
            const unsigned long long value = std::stoull(*maxOpen, &consumed);
            if (consumed != maxOpen->size()) {
                throw std::invalid_argument("trailing characters");
            }
            cfg.maxOpenFiles = static_cast<size_t>(value);
        } catch (const std::exception& e) {
            STRATA_LOG_WARNING_CAT(LogCategory, "Ignoring STRATA_FS_MAX_OPEN_FILES='" + *maxOpen + "': " + e.what());
        }
    }

    if (auto resolve = safeGetEnv("STRATA_FS_RESOLVE_CWD")) {
        cfg.resolveCwdSymlinks = parseBoolFlag(*resolve, cfg.resolveCwdSymlinks);
    }

    return cfg;
}

RealFileSystem::RealFileSystem(Config cfg)
    : _cfg(std::move(cfg)) {
    _limiter = _cfg.limiter ? _cfg.limiter : makeFileOpenLimiter(_cfg.maxOpenFiles);
    _cwd = captureWorkingDirectory(_cfg.resolveCwdSymlinks);

    STRATA_LOG_DEBUG_CAT(LogCategory, "RealFileSystem created (cwd='" + _cwd + "', maxOpenFiles=" +
                         (_cfg.limiter ? std::string("custom") : std::to_string(_cfg.maxOpenFiles)) + ")");
}

std::string RealFileSystem::captureWorkingDirectory(bool resolveSymlinks) {
    std::error_code ec;
    auto current = std::filesystem::current_path(ec);
    if (ec) {
        STRATA_LOG_DEBUG_CAT(LogCategory, "Working directory unavailable: " + ec.message());
        return {};
    }

    std::string cwd = current.string();
    if (!resolveSymlinks) {
        return cwd;
    }

    // Best effort: a symlink loop or a vanished component keeps the unresolved path.
    // Anything that really depends on the canonical path fails later, where it matters.
    auto canonical = std::filesystem::canonical(current, ec);
    if (ec) {
        STRATA_LOG_DEBUG_CAT(LogCategory, "Keeping unresolved working directory '" + cwd + "': " + ec.message());
        return cwd;
    }
    return canonical.string();
}

DirectoryListing RealFileSystem::readDirectory(const std::string& path) {
    std::shared_ptr<ListingSlot> slot;
    {
        std::shared_lock<std::shared_mutex> rlock(_cacheMutex);
        auto it = _listings.find(path);
        if (it != _listings.end()) {
            slot = it->second;
        }
    }
    if (!slot) {
        std::unique_lock<std::shared_mutex> wlock(_cacheMutex);
        auto& stored = _listings[path];
        if (!stored) {
            stored = std::make_shared<ListingSlot>();
        }
        slot = stored;
    }

    // Exactly one listing per path; concurrent first callers wait for it
    std::call_once(slot->once, [this, &slot, &path] {
        slot->listing = listDirectory(path);
    });
    return slot->listing;
}

DirectoryListing RealFileSystem::listDirectory(const std::string& path) {
    STRATA_LOG_TRACE_CAT(LogCategory, "Listing directory (cache miss): " + path);

    std::vector<std::string> names;
    int err;
    {
        ScopedFileOpen guard(*_limiter);
        err = readDirectoryNames(path, names);
    }

    DirectoryListing listing;
    if (err != 0) {
        // Cached permanently: an inaccessible directory stays inaccessible for this instance
        listing.entries = std::make_shared<EntryMap>();
        listing.error = makeErrorInfo(err, "Cannot read directory", path);
        STRATA_LOG_DEBUG_CAT(LogCategory, "Directory listing failed for '" + path + "': " +
                             std::string(toString(listing.error.code)));
        return listing;
    }

    auto entries = std::make_shared<EntryMap>();
    entries->reserve(names.size());
    for (auto& name : names) {
        // Kind is resolved lazily; no stat here
        auto entry = std::make_unique<Entry>(path, name, _limiter);
        entries->emplace(std::move(name), std::move(entry));
    }
    listing.entries = std::move(entries);
    return listing;
}

FileContents RealFileSystem::readFile(const std::string& path) {
    FileContents result;
    ScopedFileOpen guard(*_limiter);

#if defined(__unix__) || defined(__APPLE__)
    PosixFd file;
    file.fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (file.fd < 0) {
        result.error = makeErrorInfo(normalizeOpenErrno(errno), "Cannot open file for reading", path);
        return result;
    }

    struct stat st;
    if (::fstat(file.fd, &st) == 0 && S_ISREG(st.st_mode) && st.st_size > 0) {
        result.contents.reserve(static_cast<size_t>(st.st_size));
    }

    char buffer[64 * 1024];
    for (;;) {
        const ssize_t n = ::read(file.fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int saved_errno = errno;
            result.contents.clear();
            result.error = makeErrorInfo(saved_errno, "Cannot read file", path);
            return result;
        }
        if (n == 0) {
            break;
        }
        result.contents.append(buffer, static_cast<size_t>(n));
    }
#else
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        // Missing files and non-directory ancestors both surface as NotFound
        result.error = makeErrorInfo(ENOENT, "Cannot open file for reading", path);
        return result;
    }
    if (std::filesystem::is_directory(status)) {
        result.error = makeErrorInfo(EISDIR, "Cannot read a directory as a file", path);
        return result;
    }
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        result.error = makeErrorInfo(EACCES, "Cannot open file for reading", path);
        return result;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        result.error = makeErrorInfo(EIO, "Cannot read file", path);
        return result;
    }
    result.contents = ss.str();
#endif

    return result;
}

ModKeyResult RealFileSystem::modKey(const std::string& path) {
    ScopedFileOpen guard(*_limiter);
    return computeModKey(path);
}

bool RealFileSystem::isAbs(std::string_view path) const {
    return PathUtils::isAbs(path);
}

std::optional<std::string> RealFileSystem::abs(std::string_view path) const {
    return PathUtils::abs(path);
}

std::string RealFileSystem::dir(std::string_view path) const {
    return PathUtils::dir(path);
}

std::string RealFileSystem::base(std::string_view path) const {
    return PathUtils::base(path);
}

std::string RealFileSystem::ext(std::string_view path) const {
    return PathUtils::ext(path);
}

std::string RealFileSystem::join(std::initializer_list<std::string_view> parts) const {
    return PathUtils::join(parts);
}

std::optional<std::string> RealFileSystem::rel(std::string_view basePath, std::string_view targetPath) const {
    return PathUtils::rel(basePath, targetPath);
}

size_t RealFileSystem::cachedDirectoryCount() const {
    std::shared_lock<std::shared_mutex> rlock(_cacheMutex);
    return _listings.size();
}

} // namespace Strata::Core::IO
