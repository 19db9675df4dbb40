/**
 * @file ModKey.h
 * @brief Cheap change-detection fingerprint for a file
 *
 * A ModKey is built from file identity and metadata only (device, inode, size,
 * modification time, mode bits, owner). It lets incremental consumers decide
 * whether a file needs re-reading without hashing its content. It is not an
 * integrity check: a writer that restores every one of these fields can fool it.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "FileSystemError.h"

namespace Strata::Core::IO {

struct ModKey {
    uint64_t device = 0;
    uint64_t inode = 0;
    uint64_t size = 0;
    int64_t mtimeSeconds = 0;
    int64_t mtimeNanoseconds = 0;
    uint32_t mode = 0;
    uint32_t uid = 0;

    friend bool operator==(const ModKey& a, const ModKey& b) noexcept {
        return a.device == b.device && a.inode == b.inode && a.size == b.size &&
               a.mtimeSeconds == b.mtimeSeconds && a.mtimeNanoseconds == b.mtimeNanoseconds &&
               a.mode == b.mode && a.uid == b.uid;
    }
    friend bool operator!=(const ModKey& a, const ModKey& b) noexcept {
        return !(a == b);
    }
};

struct ModKeyResult {
    ModKey key;
    FileErrorInfo error;

    bool ok() const noexcept { return !error.failed(); }
};

/**
 * @brief Probes path (following symlinks) and builds its ModKey
 *
 * Performs exactly one metadata probe and never caches. Callers that need
 * back-pressure wrap the call in a ScopedFileOpen; IFileSystem::modKey() does.
 * @return The key, or the mapped probe error. A file whose modification time
 *         reads as zero cannot be change-tracked and fails with FileError::Other.
 */
ModKeyResult computeModKey(const std::string& path);

} // namespace Strata::Core::IO

namespace std {
template <>
struct hash<Strata::Core::IO::ModKey> {
    size_t operator()(const Strata::Core::IO::ModKey& k) const noexcept {
        size_t h = hash<uint64_t>()(k.inode);
        auto mix = [&h](uint64_t v) {
            h ^= hash<uint64_t>()(v) + static_cast<size_t>(0x9e3779b97f4a7c15ULL) + (h << 6) + (h >> 2);
        };
        mix(k.device);
        mix(k.size);
        mix(static_cast<uint64_t>(k.mtimeSeconds));
        mix(static_cast<uint64_t>(k.mtimeNanoseconds));
        mix((static_cast<uint64_t>(k.mode) << 32) | k.uid);
        return h;
    }
};
} // namespace std
