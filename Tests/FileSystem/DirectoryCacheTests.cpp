#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "FileSystemTestHelpers.h"

using namespace Strata::Core::IO;
using strata::test_helpers::CountingFileOpenLimiter;
using strata::test_helpers::ScopedTempDir;
using strata::test_helpers::countingConfig;
using strata::test_helpers::writeText;

namespace {

std::vector<std::string> sortedNames(const DirectoryListing& listing) {
    std::vector<std::string> names;
    for (const auto& [name, entry] : *listing.entries) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace

TEST(DirectoryCache, ListsNamesWithoutDotEntries) {
    ScopedTempDir tmp;
    writeText(tmp.join("a.txt"), "a");
    writeText(tmp.join("b.js"), "b");
    std::filesystem::create_directory(tmp.join("sub"));

    RealFileSystem fs;
    auto listing = fs.readDirectory(tmp.str());
    ASSERT_TRUE(listing.ok()) << listing.error.message;
    ASSERT_NE(listing.entries, nullptr);

    EXPECT_EQ(sortedNames(listing), (std::vector<std::string>{"a.txt", "b.js", "sub"}));
    EXPECT_EQ(listing.find("."), nullptr);
    EXPECT_EQ(listing.find(".."), nullptr);
}

TEST(DirectoryCache, EmptyDirectoryIsSuccessWithNoEntries) {
    ScopedTempDir tmp;
    RealFileSystem fs;

    auto listing = fs.readDirectory(tmp.str());
    EXPECT_TRUE(listing.ok());
    ASSERT_NE(listing.entries, nullptr);
    EXPECT_TRUE(listing.entries->empty());
}

TEST(DirectoryCache, SecondListingIsServedFromCache) {
    ScopedTempDir tmp;
    writeText(tmp.join("one.txt"), "1");

    auto limiter = std::make_shared<CountingFileOpenLimiter>();
    RealFileSystem fs(countingConfig(limiter));

    auto first = fs.readDirectory(tmp.str());
    auto second = fs.readDirectory(tmp.str());

    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first.entries.get(), second.entries.get());
    EXPECT_EQ(limiter->acquires(), 1u);
    EXPECT_EQ(fs.cachedDirectoryCount(), 1u);
}

TEST(DirectoryCache, ListingIsNotRefreshedAfterChanges) {
    ScopedTempDir tmp;
    writeText(tmp.join("before.txt"), "x");

    RealFileSystem fs;
    auto first = fs.readDirectory(tmp.str());
    ASSERT_TRUE(first.ok());

    writeText(tmp.join("after.txt"), "y");
    auto second = fs.readDirectory(tmp.str());

    EXPECT_EQ(sortedNames(second), (std::vector<std::string>{"before.txt"}));
}

TEST(DirectoryCache, PathIsUsedVerbatimAsKey) {
    ScopedTempDir tmp;
    auto limiter = std::make_shared<CountingFileOpenLimiter>();
    RealFileSystem fs(countingConfig(limiter));

    auto plain = fs.readDirectory(tmp.str());
    auto slashed = fs.readDirectory(tmp.str() + "/");

    EXPECT_TRUE(plain.ok());
    EXPECT_TRUE(slashed.ok());
    EXPECT_EQ(fs.cachedDirectoryCount(), 2u);
    EXPECT_EQ(limiter->acquires(), 2u);
}

TEST(DirectoryCache, MissingDirectoryReportsNotFoundWithEmptyMapping) {
    ScopedTempDir tmp;
    RealFileSystem fs;

    auto listing = fs.readDirectory(tmp.join("nope").string());
    EXPECT_FALSE(listing.ok());
    EXPECT_EQ(listing.error.code, FileError::NotFound);
    ASSERT_NE(listing.entries, nullptr);
    EXPECT_TRUE(listing.entries->empty());
    ASSERT_TRUE(listing.error.systemError.has_value());
    EXPECT_EQ(listing.error.path, tmp.join("nope").string());
}

TEST(DirectoryCache, FailedListingIsCachedWithoutRetry) {
    ScopedTempDir tmp;
    const std::string missing = tmp.join("later").string();

    auto limiter = std::make_shared<CountingFileOpenLimiter>();
    RealFileSystem fs(countingConfig(limiter));

    auto first = fs.readDirectory(missing);
    ASSERT_EQ(first.error.code, FileError::NotFound);

    // Creating the directory afterwards does not change the cached answer
    std::filesystem::create_directory(missing);
    writeText(std::filesystem::path(missing) / "file.txt", "z");

    auto second = fs.readDirectory(missing);
    EXPECT_EQ(second.error, first.error);
    EXPECT_TRUE(second.entries->empty());
    EXPECT_EQ(limiter->acquires(), 1u);
}

TEST(DirectoryCache, SeparateInstancesHaveSeparateCaches) {
    ScopedTempDir tmp;
    const std::string missing = tmp.join("created").string();

    RealFileSystem before;
    EXPECT_EQ(before.readDirectory(missing).error.code, FileError::NotFound);

    std::filesystem::create_directory(missing);

    RealFileSystem after;
    EXPECT_TRUE(after.readDirectory(missing).ok());
    EXPECT_EQ(before.readDirectory(missing).error.code, FileError::NotFound);
}

TEST(DirectoryCache, ListingDoesNotProbeEntries) {
    ScopedTempDir tmp;
    writeText(tmp.join("a.txt"), "a");
    writeText(tmp.join("b.txt"), "b");
    std::filesystem::create_directory(tmp.join("c"));

    auto limiter = std::make_shared<CountingFileOpenLimiter>();
    RealFileSystem fs(countingConfig(limiter));

    auto listing = fs.readDirectory(tmp.str());
    ASSERT_TRUE(listing.ok());
    for (const auto& [name, entry] : *listing.entries) {
        EXPECT_FALSE(entry->isResolved()) << name;
        EXPECT_EQ(entry->dir(), tmp.str());
        EXPECT_EQ(entry->base(), name);
    }
    EXPECT_EQ(limiter->acquires(), 1u);
}
