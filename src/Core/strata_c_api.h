#pragma once

// C ABI for StrataCore
// This header is C-compatible and can be consumed by C, Rust, C#, etc.

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Export macro (works for both static and shared builds)
#if defined(_WIN32)
  #if defined(STRATACORE_SHARED)
    #if defined(STRATACORE_BUILDING)
      #define STRATA_API __declspec(dllexport)
    #else
      #define STRATA_API __declspec(dllimport)
    #endif
  #else
    #define STRATA_API
  #endif
#else
  #if defined(STRATACORE_SHARED)
    #define STRATA_API __attribute__((visibility("default")))
  #else
    #define STRATA_API
  #endif
#endif

// Status codes for C API functions
typedef enum StrataStatus {
    STRATA_OK = 0,
    STRATA_ERR_UNKNOWN = 1,
    STRATA_ERR_INVALID_ARG = 2,
    STRATA_ERR_NOT_FOUND = 3,
    STRATA_ERR_NO_MEMORY = 6,
    STRATA_ERR_UNAVAILABLE = 7,

    // File system failures (see strata/strata_file_system.h)
    STRATA_ERR_FS_NOT_FOUND = 100,
    STRATA_ERR_FS_NOT_A_DIRECTORY = 101,
    STRATA_ERR_FS_PERMISSION_DENIED = 102,
    STRATA_ERR_FS_OTHER = 103
} StrataStatus;

// Booleans (explicit, stable width across languages)
typedef int32_t StrataBool; // 0 = false, non-zero = true
#define STRATA_FALSE 0
#define STRATA_TRUE  1

// Owned string (UTF-8, NUL-terminated). Caller must dispose via strata_string_dispose.
typedef struct StrataOwnedString {
    const char* ptr;
    uint32_t    len;
} StrataOwnedString;

// Library/version/memory -----------------------------------------------------
STRATA_API void strata_get_version(uint32_t* major, uint32_t* minor, uint32_t* patch, uint32_t* abi);

// Convenience/diagnostics ----------------------------------------------------
STRATA_API const char* strata_status_to_string(StrataStatus s); // static string, no free
STRATA_API void        strata_string_dispose(StrataOwnedString s);

#ifdef __cplusplus
} // extern "C"
#endif
