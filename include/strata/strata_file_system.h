#pragma once

/**
 * @file strata_file_system.h
 * @brief C API for the disk-backed file system facade
 *
 * Hourglass wrapper over Strata::Core::IO::RealFileSystem: stable C ABI,
 * opaque handle, C++ implementation. Directory listings are cached per handle
 * for its whole lifetime (failures included); file reads and modification keys
 * always go to disk.
 *
 * File system failures are reported through the STRATA_ERR_FS_* status codes.
 * A missing path is always STRATA_ERR_FS_NOT_FOUND, including paths whose
 * ancestor is a regular file.
 */

#include "Core/strata_c_api.h"

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Types
 * ============================================================================ */

/**
 * @brief Classification of a directory entry (symlinks resolve to their target)
 */
typedef enum StrataEntryKind
{
    STRATA_ENTRY_KIND_UNRESOLVED = 0, /**< Not probed yet */
    STRATA_ENTRY_KIND_FILE = 1,       /**< Regular file */
    STRATA_ENTRY_KIND_DIRECTORY = 2,  /**< Directory */
    STRATA_ENTRY_KIND_OTHER = 3       /**< FIFO, socket, device, ... */
} StrataEntryKind;

/**
 * @brief File system construction options
 */
typedef struct StrataFileSystemConfig
{
    StrataBool resolve_cwd_symlinks; /**< Canonicalize the captured cwd (default true) */
    uint32_t max_open_files;         /**< Concurrent open bound (default 32, 0 = unlimited) */
} StrataFileSystemConfig;

/**
 * @brief Opaque modification key; compare with strata_mod_key_equals()
 */
typedef struct StrataModKey
{
    uint64_t device;
    uint64_t inode;
    uint64_t size;
    int64_t mtime_sec;
    int64_t mtime_nsec;
    uint32_t mode;
    uint32_t uid;
} StrataModKey;

/**
 * @brief Owned array of owned strings. Dispose via strata_string_array_dispose().
 */
typedef struct StrataOwnedStringArray
{
    StrataOwnedString* items;
    uint32_t count;
} StrataOwnedStringArray;

typedef struct strata_FileSystem_t* strata_FileSystem;

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

/**
 * @brief Fill a config with defaults
 * @param config Config to initialize (required)
 */
STRATA_API void strata_file_system_config_init(StrataFileSystemConfig* config);

/**
 * @brief Create a file system facade
 *
 * Captures the working directory once. Never fails because the working directory
 * cannot be canonicalized.
 *
 * @param config Options (NULL for defaults, copied)
 * @param status Error reporting (required)
 * @return Owned handle or NULL on error
 * @ownership Returns owned pointer - must call strata_file_system_destroy()
 */
STRATA_API strata_FileSystem strata_file_system_create(const StrataFileSystemConfig* config, StrataStatus* status);

/**
 * @brief Destroy a file system facade and its directory cache
 * @param fs Handle to destroy (can be NULL)
 */
STRATA_API void strata_file_system_destroy(strata_FileSystem fs);

/* ============================================================================
 * Operations
 * ============================================================================ */

/**
 * @brief Read an entire file
 * @param fs File system (required)
 * @param path File path (required)
 * @param out Receives owned contents on success (required)
 * @return STRATA_OK or STRATA_ERR_FS_* / STRATA_ERR_INVALID_ARG
 *
 * @code
 * StrataOwnedString text;
 * if (strata_file_system_read_file(fs, "package.json", &text) == STRATA_OK) {
 *     fwrite(text.ptr, 1, text.len, stdout);
 *     strata_string_dispose(text);
 * }
 * @endcode
 */
STRATA_API StrataStatus strata_file_system_read_file(strata_FileSystem fs, const char* path, StrataOwnedString* out);

/**
 * @brief List the names in a directory (cached per handle)
 * @param out Receives the names sorted by byte value (required)
 * @return STRATA_OK or STRATA_ERR_FS_*; the same failure is returned on every later call
 */
STRATA_API StrataStatus strata_file_system_read_directory(strata_FileSystem fs, const char* path,
                                                          StrataOwnedStringArray* out);

/**
 * @brief Kind of one entry of a directory, probing it at most once
 * @param dir Directory path, listed through the cache if necessary (required)
 * @param name Entry name within dir (required)
 * @param out Receives the kind (required)
 * @return STRATA_OK, STRATA_ERR_FS_NOT_FOUND if name is not listed, or the probe/listing error
 */
STRATA_API StrataStatus strata_file_system_entry_kind(strata_FileSystem fs, const char* dir, const char* name,
                                                      StrataEntryKind* out);

/**
 * @brief Compute the modification key of a file (never cached)
 */
STRATA_API StrataStatus strata_file_system_mod_key(strata_FileSystem fs, const char* path, StrataModKey* out);

/**
 * @brief Compare two modification keys
 * @return STRATA_TRUE if both keys are non-NULL and equal
 */
STRATA_API StrataBool strata_mod_key_equals(const StrataModKey* a, const StrataModKey* b);

/**
 * @brief Working directory captured when the handle was created
 */
STRATA_API StrataStatus strata_file_system_cwd(strata_FileSystem fs, StrataOwnedString* out);

/**
 * @brief Join two path segments and clean the result
 */
STRATA_API StrataStatus strata_file_system_join(strata_FileSystem fs, const char* a, const char* b,
                                                StrataOwnedString* out);

/**
 * @brief Release an array returned by strata_file_system_read_directory()
 * @param arr Array to dispose (items may be NULL)
 */
STRATA_API void strata_string_array_dispose(StrataOwnedStringArray arr);

#ifdef __cplusplus
}  // extern "C"
#endif
