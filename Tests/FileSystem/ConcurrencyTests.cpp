#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "FileSystemTestHelpers.h"

using namespace Strata::Core::IO;
using strata::test_helpers::CountingFileOpenLimiter;
using strata::test_helpers::ScopedTempDir;
using strata::test_helpers::countingConfig;
using strata::test_helpers::writeText;

namespace {

// Releases all workers at once so the first calls overlap
class StartGate {
public:
    void wait(int expected) {
        _arrived.fetch_add(1);
        while (_arrived.load() < expected) {
            std::this_thread::yield();
        }
    }

private:
    std::atomic<int> _arrived{0};
};

constexpr int kThreads = 16;

}  // namespace

TEST(FileSystemConcurrency, ConcurrentFirstListingListsOnce) {
    ScopedTempDir tmp;
    for (int i = 0; i < 64; ++i) {
        writeText(tmp.join("m" + std::to_string(i) + ".js"), "x");
    }

    auto limiter = std::make_shared<CountingFileOpenLimiter>();
    RealFileSystem fs(countingConfig(limiter));

    StartGate gate;
    std::vector<const EntryMap*> seen(kThreads, nullptr);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            gate.wait(kThreads);
            auto listing = fs.readDirectory(tmp.str());
            if (listing.ok() && listing.entries->size() == 64) {
                seen[t] = listing.entries.get();
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(limiter->acquires(), 1u);
    for (int t = 0; t < kThreads; ++t) {
        EXPECT_EQ(seen[t], seen[0]) << "thread " << t;
    }
    EXPECT_NE(seen[0], nullptr);
}

TEST(FileSystemConcurrency, ConcurrentFailedListingListsOnce) {
    ScopedTempDir tmp;
    const std::string missing = tmp.join("absent").string();

    auto limiter = std::make_shared<CountingFileOpenLimiter>();
    RealFileSystem fs(countingConfig(limiter));

    StartGate gate;
    std::atomic<int> notFound{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            gate.wait(kThreads);
            if (fs.readDirectory(missing).error.code == FileError::NotFound) {
                notFound.fetch_add(1);
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(notFound.load(), kThreads);
    EXPECT_EQ(limiter->acquires(), 1u);
}

TEST(FileSystemConcurrency, DifferentDirectoriesListIndependently) {
    ScopedTempDir tmp;
    for (int i = 0; i < kThreads; ++i) {
        writeText(tmp.join("d" + std::to_string(i)) / "file.txt", std::to_string(i));
    }

    auto limiter = std::make_shared<CountingFileOpenLimiter>();
    RealFileSystem fs(countingConfig(limiter));

    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int repeat = 0; repeat < 4; ++repeat) {
                auto listing = fs.readDirectory(tmp.join("d" + std::to_string(t)).string());
                if (listing.ok() && listing.find("file.txt")) {
                    ok.fetch_add(1);
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(ok.load(), kThreads * 4);
    EXPECT_EQ(fs.cachedDirectoryCount(), static_cast<size_t>(kThreads));
    EXPECT_EQ(limiter->acquires(), static_cast<size_t>(kThreads));
}

TEST(FileSystemConcurrency, ConcurrentFirstKindQueryProbesOnce) {
    ScopedTempDir tmp;
    std::filesystem::create_directory(tmp.join("shared"));

    auto limiter = std::make_shared<CountingFileOpenLimiter>();
    RealFileSystem fs(countingConfig(limiter));
    auto listing = fs.readDirectory(tmp.str());
    const Entry* entry = listing.find("shared");
    ASSERT_NE(entry, nullptr);
    ASSERT_EQ(limiter->acquires(), 1u);

    StartGate gate;
    std::atomic<int> directories{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            gate.wait(kThreads);
            if (entry->kind().kind == EntryKind::Directory) {
                directories.fetch_add(1);
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(directories.load(), kThreads);
    EXPECT_EQ(limiter->acquires(), 2u);
    EXPECT_EQ(limiter->releases(), 2u);
}
