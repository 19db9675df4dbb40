/**
 * @file PathUtils.h
 * @brief Stateless path helpers with platform path semantics
 *
 * All helpers delegate to std::filesystem so separator conventions, root
 * handling and case rules are the platform's own. The only added policy is
 * clean(): lexical normalization, no trailing separator, and "." for an empty
 * result, which is what every returned path in this layer looks like.
 */
#pragma once
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Strata::Core::IO::PathUtils {

/**
 * @brief Lexically normalizes a path
 *
 * Collapses "." and "name/.." segments and duplicate separators, strips a
 * trailing separator (except for a bare root) and returns "." for an empty path.
 * @code
 * clean("a/b/../c/") == "a/c"
 * clean("") == "."
 * @endcode
 */
std::string clean(std::string_view path);

bool isAbs(std::string_view path);

/**
 * @brief Converts a path to a cleaned absolute path
 *
 * An empty path resolves to the working directory.
 * @return std::nullopt if the working directory cannot be determined
 */
std::optional<std::string> abs(std::string_view path);

// Everything but the last element, cleaned ("." if there is no parent)
std::string dir(std::string_view path);

// Last element with trailing separators removed ("." for an empty path)
std::string base(std::string_view path);

/**
 * @brief Suffix of the last element starting at its final dot, or empty
 * @code
 * ext("lib/index.test.js") == ".js"
 * ext(".env") == ".env"
 * ext("pkg.d/README") == ""
 * @endcode
 */
std::string ext(std::string_view path);

/**
 * @brief Joins the non-empty parts with the platform separator and cleans the result
 * @code
 * join({"a", "b", "../c"}) == "a/c"
 * @endcode
 */
std::string join(std::initializer_list<std::string_view> parts);
std::string join(const std::vector<std::string>& parts);

/**
 * @brief Relative path from base to target
 * @return std::nullopt if no relative path exists (one absolute and one relative,
 *         different roots, or base climbs above a relative root)
 */
std::optional<std::string> rel(std::string_view basePath, std::string_view targetPath);

} // namespace Strata::Core::IO::PathUtils
