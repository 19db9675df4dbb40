#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <random>
#include <sstream>
#include <string>

#include "StrataCore.h"

namespace strata::test_helpers
{

// RAII temporary directory that gets cleaned up on destruction
class ScopedTempDir
{
public:
    ScopedTempDir() {
        namespace fs = std::filesystem;
        auto base = fs::temp_directory_path();
        auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        std::random_device rd;
        std::mt19937_64 gen(rd());
        auto rnd = gen();
        std::ostringstream oss;
        oss << "StrataFS_Test_" << std::hex << now << "_" << rnd;
        _path = base / oss.str();
        std::error_code ec;
        fs::create_directories(_path, ec);
    }

    ~ScopedTempDir() {
        namespace fs = std::filesystem;
        std::error_code ec;
        // Restore permissions a test may have removed so remove_all can descend
        for (auto it = fs::recursive_directory_iterator(_path, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_directory(ec)) {
                fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
            }
        }
        ec.clear();
        fs::remove_all(_path, ec);  // best-effort cleanup
    }

    const std::filesystem::path& path() const noexcept {
        return _path;
    }
    std::filesystem::path join(const std::string& name) const {
        return _path / name;
    }
    std::string str() const {
        return _path.string();
    }

private:
    std::filesystem::path _path;
};

// Limiter that never blocks and counts every bracketed open/stat
class CountingFileOpenLimiter : public Strata::Core::IO::IFileOpenLimiter
{
public:
    void acquire() override {
        _acquires.fetch_add(1, std::memory_order_relaxed);
        auto now = _inFlight.fetch_add(1, std::memory_order_acq_rel) + 1;
        auto peak = _peak.load(std::memory_order_relaxed);
        while (now > peak && !_peak.compare_exchange_weak(peak, now, std::memory_order_relaxed)) {
        }
    }

    void release() override {
        _releases.fetch_add(1, std::memory_order_relaxed);
        _inFlight.fetch_sub(1, std::memory_order_acq_rel);
    }

    size_t acquires() const noexcept {
        return _acquires.load(std::memory_order_relaxed);
    }
    size_t releases() const noexcept {
        return _releases.load(std::memory_order_relaxed);
    }
    size_t peakInFlight() const noexcept {
        return _peak.load(std::memory_order_relaxed);
    }

private:
    std::atomic<size_t> _acquires{0};
    std::atomic<size_t> _releases{0};
    std::atomic<size_t> _inFlight{0};
    std::atomic<size_t> _peak{0};
};

// Writes text to p, creating parent directories
void writeText(const std::filesystem::path& p, const std::string& text);

// Reads the whole file at p
std::string readAllBytes(const std::filesystem::path& p);

// RealFileSystem wired to a counting limiter
Strata::Core::IO::RealFileSystem::Config countingConfig(const std::shared_ptr<CountingFileOpenLimiter>& limiter);

// True when the process can bypass permission bits (root), which makes EACCES tests meaningless
bool runningAsRoot();

}  // namespace strata::test_helpers
