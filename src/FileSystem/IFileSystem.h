/**
 * @file IFileSystem.h
 * @brief Capability surface consumed by resolvers and bundlers
 *
 * Consumers depend on IFileSystem rather than a concrete implementation.
 * RealFileSystem is the disk-backed implementation; all operations are
 * synchronous and report failures as values (FileErrorInfo), never by throwing.
 *
 * Caching contract:
 * - readDirectory() memoizes per path for the lifetime of the instance,
 *   failures included. There is no invalidation.
 * - readFile() and modKey() never cache; every call hits storage.
 */
#pragma once
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "DirectoryEntry.h"
#include "FileSystemError.h"
#include "ModKey.h"

namespace Strata::Core::IO {

/**
 * @brief Cached outcome of listing one directory
 *
 * entries is never null. On failure it points at an empty map and error is set.
 * The map is immutable once published; Entry objects inside it only mutate their
 * own cached kind.
 */
struct DirectoryListing {
    std::shared_ptr<const EntryMap> entries;
    FileErrorInfo error;

    bool ok() const noexcept { return !error.failed(); }

    // Convenience lookup; nullptr if name is not in the listing
    const Entry* find(const std::string& name) const {
        if (!entries) return nullptr;
        auto it = entries->find(name);
        return it == entries->end() ? nullptr : it->second.get();
    }
};

struct FileContents {
    std::string contents;
    FileErrorInfo error;

    bool ok() const noexcept { return !error.failed(); }
};

class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    /**
     * @brief Lists a directory, consulting the per-instance cache first
     * @param path Directory path; used verbatim as the cache key
     * @return Mapping of base name to lazily-typed Entry, or an empty mapping and error.
     *         A missing directory always reports FileError::NotFound.
     */
    virtual DirectoryListing readDirectory(const std::string& path) = 0;

    /**
     * @brief Reads the whole file
     *
     * A path with a non-directory ancestor reports FileError::NotFound.
     */
    virtual FileContents readFile(const std::string& path) = 0;

    // Identity/metadata fingerprint of path; recomputed on every call
    virtual ModKeyResult modKey(const std::string& path) = 0;

    // Path utilities
    virtual bool isAbs(std::string_view path) const = 0;
    virtual std::optional<std::string> abs(std::string_view path) const = 0;
    virtual std::string dir(std::string_view path) const = 0;
    virtual std::string base(std::string_view path) const = 0;
    virtual std::string ext(std::string_view path) const = 0;
    virtual std::string join(std::initializer_list<std::string_view> parts) const = 0;
    virtual std::optional<std::string> rel(std::string_view basePath, std::string_view targetPath) const = 0;

    // Symlink-resolved working directory captured at construction
    virtual const std::string& cwd() const noexcept = 0;
};

} // namespace Strata::Core::IO
