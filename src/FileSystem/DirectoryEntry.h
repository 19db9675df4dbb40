/**
 * @file DirectoryEntry.h
 * @brief Lazily-typed handle for one name inside one directory
 *
 * Listing a directory only yields names. Whether a name is a file or a
 * subdirectory costs a stat per name, and directories with tens of thousands
 * of entries are common in dependency trees, so Entry defers that stat until
 * kind() is first asked for and then remembers the answer.
 */
#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "FileSystemError.h"

namespace Strata::Core::IO {

class IFileOpenLimiter; // fwd

/**
 * Classification of a directory entry. Symlinks are classified by their target.
 * Unresolved means the entry has not been probed yet (or the probe failed).
 */
enum class EntryKind {
    Unresolved = 0,
    File,
    Directory,
    Other
};

struct EntryKindResult {
    EntryKind kind = EntryKind::Unresolved;
    FileErrorInfo error;

    bool ok() const noexcept { return !error.failed(); }
};

/**
 * @brief One member of a listed directory
 *
 * Entries are created by the file system's directory cache and owned by it;
 * callers only ever see const pointers or references that stay valid for the
 * lifetime of the file system that produced them.
 *
 * kind() probes at most once successfully, even under concurrent first calls.
 * A failed probe (for example the entry was deleted after listing) is reported
 * to the caller and leaves the entry unresolved, so a later call probes again.
 *
 * @code
 * auto listing = fs.readDirectory("/project/node_modules");
 * for (const auto& [name, entry] : *listing.entries) {
 *     auto k = entry->kind();
 *     if (k.ok() && k.kind == EntryKind::Directory) { ... }
 * }
 * @endcode
 */
class Entry {
public:
    /**
     * @param dir Directory the entry was listed from
     * @param base Name of the entry within dir
     * @param limiter Limiter bracketing the metadata probe; shared so the entry stays usable
     *                after the file system that listed it is gone
     */
    Entry(std::string dir, std::string base, std::shared_ptr<IFileOpenLimiter> limiter);

    Entry(const Entry&) = delete;
    Entry& operator=(const Entry&) = delete;

    EntryKindResult kind() const;

    bool isResolved() const noexcept {
        return _kind.load(std::memory_order_acquire) != EntryKind::Unresolved;
    }

    const std::string& dir() const noexcept { return _dir; }
    const std::string& base() const noexcept { return _base; }

    // dir() joined with base()
    std::string path() const;

private:
    EntryKindResult probe() const;

    std::string _dir;
    std::string _base;
    std::shared_ptr<IFileOpenLimiter> _limiter;

    mutable std::atomic<EntryKind> _kind{EntryKind::Unresolved};
    mutable std::mutex _probeMutex;
};

using EntryMap = std::unordered_map<std::string, std::unique_ptr<Entry>>;

std::string_view toString(EntryKind kind) noexcept;

} // namespace Strata::Core::IO
