/**
 * @file RealFileSystem.h
 * @brief Disk-backed IFileSystem with a per-instance directory listing cache
 *
 * RealFileSystem is the facade the rest of the pipeline talks to. It lists
 * directories at most once per path (failures included), hands out lazily-typed
 * Entry objects, reads files and computes modification keys without caching,
 * and brackets every underlying open or stat with the configured
 * IFileOpenLimiter. It is safe to share one instance between threads.
 */
#pragma once
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "FileOpenLimiter.h"
#include "IFileSystem.h"

namespace Strata::Core::IO {

class RealFileSystem : public IFileSystem {
public:
    struct Config {
        bool resolveCwdSymlinks;                    // Canonicalize the captured cwd (best effort)
        size_t maxOpenFiles;                        // Bound for the default limiter; 0 = unlimited
        std::shared_ptr<IFileOpenLimiter> limiter;  // Overrides maxOpenFiles when set

        Config()
            : resolveCwdSymlinks(true)
            , maxOpenFiles(BoundedFileOpenLimiter::DefaultCapacity)
            , limiter(nullptr) {}

        /**
         * @brief Defaults overridden by the environment
         *
         * STRATA_FS_MAX_OPEN_FILES: unsigned integer, 0 disables the bound
         * STRATA_FS_RESOLVE_CWD: "0"/"false"/"off" disables cwd canonicalization
         * Malformed values are logged and ignored.
         */
        static Config fromEnvironment();
    };

    explicit RealFileSystem(Config cfg = {});
    ~RealFileSystem() override = default;

    RealFileSystem(const RealFileSystem&) = delete;
    RealFileSystem& operator=(const RealFileSystem&) = delete;

    DirectoryListing readDirectory(const std::string& path) override;
    FileContents readFile(const std::string& path) override;
    ModKeyResult modKey(const std::string& path) override;

    bool isAbs(std::string_view path) const override;
    std::optional<std::string> abs(std::string_view path) const override;
    std::string dir(std::string_view path) const override;
    std::string base(std::string_view path) const override;
    std::string ext(std::string_view path) const override;
    std::string join(std::initializer_list<std::string_view> parts) const override;
    std::optional<std::string> rel(std::string_view basePath, std::string_view targetPath) const override;

    const std::string& cwd() const noexcept override { return _cwd; }

    // Number of directory paths with a cached listing (successful or failed)
    size_t cachedDirectoryCount() const;

    const std::shared_ptr<IFileOpenLimiter>& limiter() const noexcept { return _limiter; }

private:
    struct ListingSlot {
        std::once_flag once;
        DirectoryListing listing;
    };

    // Performs the single underlying listing for a cache miss
    DirectoryListing listDirectory(const std::string& path);

    static std::string captureWorkingDirectory(bool resolveSymlinks);

    Config _cfg;
    std::shared_ptr<IFileOpenLimiter> _limiter;
    std::string _cwd;

    mutable std::shared_mutex _cacheMutex;
    std::unordered_map<std::string, std::shared_ptr<ListingSlot>> _listings;
};

} // namespace Strata::Core::IO
