#include <gtest/gtest.h>

#include <cstring>
#include <string>
#include <vector>

#include "FileSystemTestHelpers.h"
#include "strata/strata_file_system.h"

using strata::test_helpers::ScopedTempDir;
using strata::test_helpers::writeText;

namespace {

class FileSystemCApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        StrataStatus status = STRATA_ERR_UNKNOWN;
        fs = strata_file_system_create(nullptr, &status);
        ASSERT_EQ(status, STRATA_OK);
        ASSERT_NE(fs, nullptr);
    }

    void TearDown() override {
        strata_file_system_destroy(fs);
    }

    strata_FileSystem fs = nullptr;
    ScopedTempDir tmp;
};

}  // namespace

TEST(FileSystemCApi, ConfigInitUsesDefaults) {
    StrataFileSystemConfig cfg;
    std::memset(&cfg, 0xff, sizeof(cfg));
    strata_file_system_config_init(&cfg);
    EXPECT_EQ(cfg.resolve_cwd_symlinks, STRATA_TRUE);
    EXPECT_EQ(cfg.max_open_files, 32u);
}

TEST(FileSystemCApi, CreateRequiresStatus) {
    EXPECT_EQ(strata_file_system_create(nullptr, nullptr), nullptr);
    strata_file_system_destroy(nullptr);
}

TEST(FileSystemCApi, CreateWithExplicitConfig) {
    StrataFileSystemConfig cfg;
    strata_file_system_config_init(&cfg);
    cfg.max_open_files = 0;
    cfg.resolve_cwd_symlinks = STRATA_FALSE;

    StrataStatus status = STRATA_ERR_UNKNOWN;
    strata_FileSystem handle = strata_file_system_create(&cfg, &status);
    ASSERT_EQ(status, STRATA_OK);
    ASSERT_NE(handle, nullptr);

    StrataOwnedString cwd{};
    ASSERT_EQ(strata_file_system_cwd(handle, &cwd), STRATA_OK);
    EXPECT_GT(cwd.len, 0u);
    strata_string_dispose(cwd);
    strata_file_system_destroy(handle);
}

TEST_F(FileSystemCApiTest, ReadFileReturnsOwnedString) {
    writeText(tmp.join("a.txt"), "hello");

    StrataOwnedString out{};
    ASSERT_EQ(strata_file_system_read_file(fs, tmp.join("a.txt").c_str(), &out), STRATA_OK);
    ASSERT_NE(out.ptr, nullptr);
    EXPECT_EQ(out.len, 5u);
    EXPECT_STREQ(out.ptr, "hello");
    strata_string_dispose(out);
}

TEST_F(FileSystemCApiTest, ReadFileMapsErrors) {
    writeText(tmp.join("file"), "x");
    StrataOwnedString out{};

    EXPECT_EQ(strata_file_system_read_file(fs, tmp.join("missing").c_str(), &out), STRATA_ERR_FS_NOT_FOUND);
    EXPECT_EQ(out.ptr, nullptr);

    std::string beneath = tmp.join("file").string() + "/child";
    EXPECT_EQ(strata_file_system_read_file(fs, beneath.c_str(), &out), STRATA_ERR_FS_NOT_FOUND);
    EXPECT_EQ(strata_file_system_read_file(fs, tmp.path().c_str(), &out), STRATA_ERR_FS_OTHER);
    EXPECT_EQ(strata_file_system_read_file(fs, nullptr, &out), STRATA_ERR_INVALID_ARG);
    EXPECT_EQ(strata_file_system_read_file(nullptr, "x", &out), STRATA_ERR_INVALID_ARG);
}

TEST_F(FileSystemCApiTest, ReadDirectoryReturnsSortedNames) {
    writeText(tmp.join("zeta.js"), "z");
    writeText(tmp.join("alpha.js"), "a");
    std::filesystem::create_directory(tmp.join("mid"));

    StrataOwnedStringArray arr{};
    ASSERT_EQ(strata_file_system_read_directory(fs, tmp.path().c_str(), &arr), STRATA_OK);
    ASSERT_EQ(arr.count, 3u);
    std::vector<std::string> names;
    for (uint32_t i = 0; i < arr.count; ++i) {
        names.emplace_back(arr.items[i].ptr, arr.items[i].len);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"alpha.js", "mid", "zeta.js"}));
    strata_string_array_dispose(arr);
}

TEST_F(FileSystemCApiTest, ReadDirectoryOfEmptyDirectory) {
    StrataOwnedStringArray arr{};
    ASSERT_EQ(strata_file_system_read_directory(fs, tmp.path().c_str(), &arr), STRATA_OK);
    EXPECT_EQ(arr.count, 0u);
    EXPECT_EQ(arr.items, nullptr);
    strata_string_array_dispose(arr);
}

TEST_F(FileSystemCApiTest, ReadDirectoryErrorsAreCached) {
    writeText(tmp.join("plain"), "x");
    StrataOwnedStringArray arr{};

    EXPECT_EQ(strata_file_system_read_directory(fs, tmp.join("plain").c_str(), &arr),
              STRATA_ERR_FS_NOT_A_DIRECTORY);

    const auto later = tmp.join("later");
    EXPECT_EQ(strata_file_system_read_directory(fs, later.c_str(), &arr), STRATA_ERR_FS_NOT_FOUND);
    std::filesystem::create_directory(later);
    EXPECT_EQ(strata_file_system_read_directory(fs, later.c_str(), &arr), STRATA_ERR_FS_NOT_FOUND);
}

TEST_F(FileSystemCApiTest, EntryKindResolvesThroughListing) {
    writeText(tmp.join("f.txt"), "x");
    std::filesystem::create_directory(tmp.join("d"));

    StrataEntryKind kind = STRATA_ENTRY_KIND_UNRESOLVED;
    ASSERT_EQ(strata_file_system_entry_kind(fs, tmp.path().c_str(), "f.txt", &kind), STRATA_OK);
    EXPECT_EQ(kind, STRATA_ENTRY_KIND_FILE);
    ASSERT_EQ(strata_file_system_entry_kind(fs, tmp.path().c_str(), "d", &kind), STRATA_OK);
    EXPECT_EQ(kind, STRATA_ENTRY_KIND_DIRECTORY);

    EXPECT_EQ(strata_file_system_entry_kind(fs, tmp.path().c_str(), "nope", &kind), STRATA_ERR_FS_NOT_FOUND);
    EXPECT_EQ(kind, STRATA_ENTRY_KIND_UNRESOLVED);
}

TEST_F(FileSystemCApiTest, ModKeysCompare) {
    const auto path = tmp.join("k.txt");
    writeText(path, "one");

    StrataModKey a{};
    StrataModKey b{};
    ASSERT_EQ(strata_file_system_mod_key(fs, path.c_str(), &a), STRATA_OK);
    ASSERT_EQ(strata_file_system_mod_key(fs, path.c_str(), &b), STRATA_OK);
    EXPECT_EQ(strata_mod_key_equals(&a, &b), STRATA_TRUE);

    writeText(path, "one plus more");
    ASSERT_EQ(strata_file_system_mod_key(fs, path.c_str(), &b), STRATA_OK);
    EXPECT_EQ(strata_mod_key_equals(&a, &b), STRATA_FALSE);
    EXPECT_EQ(strata_mod_key_equals(&a, nullptr), STRATA_FALSE);

    EXPECT_EQ(strata_file_system_mod_key(fs, tmp.join("none").c_str(), &b), STRATA_ERR_FS_NOT_FOUND);
}

TEST_F(FileSystemCApiTest, JoinAndCwd) {
    StrataOwnedString joined{};
    ASSERT_EQ(strata_file_system_join(fs, "a/b", "../c", &joined), STRATA_OK);
    EXPECT_EQ(std::filesystem::path(std::string(joined.ptr, joined.len)), std::filesystem::path("a") / "c");
    strata_string_dispose(joined);

    StrataOwnedString cwd{};
    ASSERT_EQ(strata_file_system_cwd(fs, &cwd), STRATA_OK);
    EXPECT_EQ(std::string(cwd.ptr, cwd.len),
              std::filesystem::canonical(std::filesystem::current_path()).string());
    strata_string_dispose(cwd);
}

TEST(FileSystemCApi, StatusNames) {
    EXPECT_STREQ(strata_status_to_string(STRATA_OK), "STRATA_OK");
    EXPECT_STREQ(strata_status_to_string(STRATA_ERR_FS_NOT_FOUND), "STRATA_ERR_FS_NOT_FOUND");
    EXPECT_STREQ(strata_status_to_string(STRATA_ERR_FS_PERMISSION_DENIED), "STRATA_ERR_FS_PERMISSION_DENIED");

    uint32_t major = 0, minor = 99, patch = 99, abi = 99;
    strata_get_version(&major, &minor, &patch, &abi);
    EXPECT_EQ(major, 1u);
}
