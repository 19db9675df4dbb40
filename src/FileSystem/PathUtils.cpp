#include "PathUtils.h"
#include <filesystem>
#include <system_error>

namespace Strata::Core::IO::PathUtils {

namespace {
    namespace fs = std::filesystem;

    fs::path stripTrailingSeparators(fs::path p) {
        while (!p.has_filename() && p.has_relative_path()) {
            p = p.parent_path();
        }
        return p;
    }

    template <typename Range>
    std::string joinRange(const Range& parts) {
        std::string joined;
        for (const auto& part : parts) {
            if (part.empty()) {
                continue;
            }
            if (!joined.empty()) {
                joined += static_cast<char>(fs::path::preferred_separator);
            }
            joined.append(part.data(), part.size());
        }
        return clean(joined);
    }
}

std::string clean(std::string_view path) {
    if (path.empty()) {
        return ".";
    }
    fs::path normal = stripTrailingSeparators(fs::path(path).lexically_normal());
    if (normal.empty()) {
        return ".";
    }
    return normal.string();
}

bool isAbs(std::string_view path) {
    return fs::path(path).is_absolute();
}

std::optional<std::string> abs(std::string_view path) {
    std::error_code ec;
    auto absolute = fs::absolute(path.empty() ? fs::path(".") : fs::path(path), ec);
    if (ec) {
        return std::nullopt;
    }
    return clean(absolute.string());
}

std::string dir(std::string_view path) {
    return clean(fs::path(path).parent_path().string());
}

std::string base(std::string_view path) {
    if (path.empty()) {
        return ".";
    }
    fs::path p = stripTrailingSeparators(fs::path(path));
    if (!p.has_relative_path()) {
        // Only a root remains ("/" or "C:\")
        return p.has_root_directory() ? p.root_directory().string() : p.string();
    }
    return p.filename().string();
}

std::string ext(std::string_view path) {
    // A dot-file is all extension: ".env" -> ".env"
    for (size_t i = path.size(); i > 0; --i) {
        const char c = path[i - 1];
        if (c == '.') {
            return std::string(path.substr(i - 1));
        }
        if (c == '/' || c == static_cast<char>(fs::path::preferred_separator)) {
            break;
        }
    }
    return {};
}

std::string join(std::initializer_list<std::string_view> parts) {
    return joinRange(parts);
}

std::string join(const std::vector<std::string>& parts) {
    return joinRange(parts);
}

std::optional<std::string> rel(std::string_view basePath, std::string_view targetPath) {
    fs::path from(clean(basePath));
    fs::path to(clean(targetPath));
    if (from.is_absolute() != to.is_absolute()) {
        return std::nullopt;
    }
    auto relative = to.lexically_relative(from);
    if (relative.empty()) {
        return std::nullopt;
    }
    return relative.string();
}

} // namespace Strata::Core::IO::PathUtils
