/**
 * @file FileSystemError.h
 * @brief Error vocabulary shared by every file system operation
 *
 * Platform error codes are folded into four canonical kinds so callers can
 * write a single portable check (most importantly, a single not-found check).
 * The raw system error is preserved in FileErrorInfo::systemError for
 * diagnostics.
 */
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace Strata::Core::IO {

/**
 * Public error taxonomy surfaced by file system operations.
 * Mapping guidelines:
 * - NotFound: path (or one of its ancestors) does not exist. Also used for
 *   "not a directory" failures raised while opening a path, see normalizeOpenErrno()
 * - NotADirectory: an opened path was enumerated as a directory but is not one
 * - PermissionDenied: EACCES/EPERM or equivalent
 * - Other: every other failure (EISDIR, ELOOP, EIO, ...)
 */
enum class FileError {
    None = 0,
    NotFound,
    NotADirectory,
    PermissionDenied,
    Other
};

struct FileErrorInfo {
    FileError code = FileError::None;
    std::string message;
    std::optional<std::error_code> systemError;
    std::string path;

    bool failed() const noexcept { return code != FileError::None; }
    explicit operator bool() const noexcept { return failed(); }

    friend bool operator==(const FileErrorInfo& a, const FileErrorInfo& b) noexcept {
        return a.code == b.code && a.systemError == b.systemError && a.path == b.path;
    }
    friend bool operator!=(const FileErrorInfo& a, const FileErrorInfo& b) noexcept {
        return !(a == b);
    }
};

std::string_view toString(FileError error) noexcept;

// Maps an errno value to the canonical taxonomy (no normalization applied)
FileError mapErrnoToFileError(int err) noexcept;
FileError mapErrorCode(const std::error_code& ec) noexcept;

/**
 * @brief Rewrites "not a directory" to "not found" for failures raised while opening or stat-ing a path
 *
 * Opening "a/b/c" where "a/b" is a regular file fails with ENOTDIR on POSIX, and Windows
 * reports a plain missing path the same way. Either way the path does not exist, so
 * callers only ever see ENOENT for it.
 */
int normalizeOpenErrno(int err) noexcept;

/**
 * @brief Builds a populated FileErrorInfo from an errno value
 * @param err errno value (already normalized if applicable)
 * @param message Human-readable context ("Cannot open file", ...)
 * @param path Path the operation targeted
 */
FileErrorInfo makeErrorInfo(int err, std::string message, std::string path);

// Builds a FileErrorInfo from a std::error_code of any category (std::filesystem results)
FileErrorInfo makeErrorInfo(const std::error_code& ec, std::string message, std::string path);

FileErrorInfo makeErrorInfo(FileError code, std::string message, std::string path,
                            std::optional<std::error_code> ec = std::nullopt);

} // namespace Strata::Core::IO
