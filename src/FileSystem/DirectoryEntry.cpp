#include "DirectoryEntry.h"
#include "FileOpenLimiter.h"
#include "PathUtils.h"
#include <cerrno>
#include <filesystem>
#include <utility>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/stat.h>  // stat()
#endif

namespace Strata::Core::IO {

std::string_view toString(EntryKind kind) noexcept {
    switch (kind) {
        case EntryKind::Unresolved: return "Unresolved";
        case EntryKind::File: return "File";
        case EntryKind::Directory: return "Directory";
        case EntryKind::Other: return "Other";
    }
    return "Unknown";
}

Entry::Entry(std::string dir, std::string base, std::shared_ptr<IFileOpenLimiter> limiter)
    : _dir(std::move(dir))
    , _base(std::move(base))
    , _limiter(std::move(limiter)) {
}

std::string Entry::path() const {
    return PathUtils::join({_dir, _base});
}

EntryKindResult Entry::kind() const {
    // Fast path - already resolved
    EntryKind cached = _kind.load(std::memory_order_acquire);
    if (cached != EntryKind::Unresolved) {
        return EntryKindResult{cached, {}};
    }

    // Slow path - one prober at a time, re-check after acquiring
    std::lock_guard<std::mutex> lock(_probeMutex);
    cached = _kind.load(std::memory_order_acquire);
    if (cached != EntryKind::Unresolved) {
        return EntryKindResult{cached, {}};
    }

    EntryKindResult result = probe();
    if (result.ok()) {
        _kind.store(result.kind, std::memory_order_release);
    }
    return result;
}

EntryKindResult Entry::probe() const {
    const std::string p = path();
    EntryKindResult result;

#if defined(__unix__) || defined(__APPLE__)
    struct stat st;
    int rc;
    int savedErrno = 0;
    {
        ScopedFileOpen guard(*_limiter);
        rc = ::stat(p.c_str(), &st);  // follows symlinks
        if (rc != 0) savedErrno = normalizeOpenErrno(errno);
    }
    if (rc != 0) {
        result.error = makeErrorInfo(savedErrno, "Cannot stat directory entry", p);
        return result;
    }
    if (S_ISDIR(st.st_mode)) {
        result.kind = EntryKind::Directory;
    } else if (S_ISREG(st.st_mode)) {
        result.kind = EntryKind::File;
    } else {
        result.kind = EntryKind::Other;
    }
#else
    std::error_code ec;
    std::filesystem::file_status status;
    {
        ScopedFileOpen guard(*_limiter);
        status = std::filesystem::status(p, ec);
    }
    if (ec || !std::filesystem::exists(status)) {
        if (!ec) ec = std::make_error_code(std::errc::no_such_file_or_directory);
        result.error = makeErrorInfo(ec, "Cannot stat directory entry", p);
        return result;
    }
    if (std::filesystem::is_directory(status)) {
        result.kind = EntryKind::Directory;
    } else if (std::filesystem::is_regular_file(status)) {
        result.kind = EntryKind::File;
    } else {
        result.kind = EntryKind::Other;
    }
#endif

    return result;
}

} // namespace Strata::Core::IO
