#include "FileSystemError.h"
#include <cerrno>
#include <utility>

namespace Strata::Core::IO {

std::string_view toString(FileError error) noexcept {
    switch (error) {
        case FileError::None: return "None";
        case FileError::NotFound: return "NotFound";
        case FileError::NotADirectory: return "NotADirectory";
        case FileError::PermissionDenied: return "PermissionDenied";
        case FileError::Other: return "Other";
    }
    return "Unknown";
}

FileError mapErrnoToFileError(int err) noexcept {
    switch (err) {
        case 0:
            return FileError::None;
        case ENOENT:
            return FileError::NotFound;
        case ENOTDIR:
            return FileError::NotADirectory;
        case EACCES:
        case EPERM:
            return FileError::PermissionDenied;
        default:
            return FileError::Other;
    }
}

FileError mapErrorCode(const std::error_code& ec) noexcept {
    if (!ec) {
        return FileError::None;
    }
    const auto condition = ec.default_error_condition();
    if (condition == std::errc::no_such_file_or_directory) {
        return FileError::NotFound;
    }
    if (condition == std::errc::not_a_directory) {
        return FileError::NotADirectory;
    }
    if (condition == std::errc::permission_denied || condition == std::errc::operation_not_permitted) {
        return FileError::PermissionDenied;
    }
    return FileError::Other;
}

int normalizeOpenErrno(int err) noexcept {
    return err == ENOTDIR ? ENOENT : err;
}

FileErrorInfo makeErrorInfo(int err, std::string message, std::string path) {
    FileErrorInfo info;
    info.code = mapErrnoToFileError(err);
    info.message = std::move(message);
    info.path = std::move(path);
    info.systemError = std::error_code(err, std::generic_category());
    return info;
}

FileErrorInfo makeErrorInfo(const std::error_code& ec, std::string message, std::string path) {
    FileErrorInfo info;
    info.code = mapErrorCode(ec);
    info.message = std::move(message);
    info.path = std::move(path);
    info.systemError = ec;
    return info;
}

FileErrorInfo makeErrorInfo(FileError code, std::string message, std::string path,
                            std::optional<std::error_code> ec) {
    FileErrorInfo info;
    info.code = code;
    info.message = std::move(message);
    info.path = std::move(path);
    info.systemError = ec;
    return info;
}

} // namespace Strata::Core::IO
