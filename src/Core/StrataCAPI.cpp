/*
 * C API bridge for StrataCore
 */

#include <new>

#include "strata_c_api.h"

extern "C" {

STRATA_API void strata_get_version(uint32_t* major, uint32_t* minor, uint32_t* patch, uint32_t* abi) {
    if (major) *major = 1;
    if (minor) *minor = 0;
    if (patch) *patch = 0;
    if (abi) *abi = 0;
}

STRATA_API const char* strata_status_to_string(StrataStatus s) {
    switch (s) {
        case STRATA_OK:
            return "STRATA_OK";
        case STRATA_ERR_UNKNOWN:
            return "STRATA_ERR_UNKNOWN";
        case STRATA_ERR_INVALID_ARG:
            return "STRATA_ERR_INVALID_ARG";
        case STRATA_ERR_NOT_FOUND:
            return "STRATA_ERR_NOT_FOUND";
        case STRATA_ERR_NO_MEMORY:
            return "STRATA_ERR_NO_MEMORY";
        case STRATA_ERR_UNAVAILABLE:
            return "STRATA_ERR_UNAVAILABLE";
        case STRATA_ERR_FS_NOT_FOUND:
            return "STRATA_ERR_FS_NOT_FOUND";
        case STRATA_ERR_FS_NOT_A_DIRECTORY:
            return "STRATA_ERR_FS_NOT_A_DIRECTORY";
        case STRATA_ERR_FS_PERMISSION_DENIED:
            return "STRATA_ERR_FS_PERMISSION_DENIED";
        case STRATA_ERR_FS_OTHER:
            return "STRATA_ERR_FS_OTHER";
        default:
            return "STRATA_STATUS_UNKNOWN";
    }
}

STRATA_API void strata_string_dispose(StrataOwnedString s) {
    ::operator delete(const_cast<char*>(s.ptr));
}

}  // extern "C"
