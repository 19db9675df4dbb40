/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Strata Authors
 * This file is part of the Strata Core project.
 */

#include <algorithm>
#include <cstring>
#include <exception>
#include <limits>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../include/strata/strata_file_system.h"
#include "../FileSystem/RealFileSystem.h"
#include "../Logging/CLogger.h"

using namespace Strata::Core::IO;

// ============================================================================
// Internal Helpers
// ============================================================================

namespace
{

constexpr const char* LogCategory = "FileSystemCApi";

// Centralized exception translation
StrataStatus translate_exception(const char* function) {
    try {
        throw;  // Re-throw current exception
    } catch (const std::bad_alloc&) {
        STRATA_LOG_ERROR_CAT_F(LogCategory, "%s: out of memory", function);
        return STRATA_ERR_NO_MEMORY;
    } catch (const std::invalid_argument& e) {
        STRATA_LOG_WARNING_CAT_F(LogCategory, "%s: invalid argument: %s", function, e.what());
        return STRATA_ERR_INVALID_ARG;
    } catch (const std::exception& e) {
        STRATA_LOG_ERROR_CAT_F(LogCategory, "%s: %s", function, e.what());
        return STRATA_ERR_UNKNOWN;
    } catch (...) {
        std::terminate();  // Unknown exception = programming bug
    }
}

inline RealFileSystem* to_cpp(strata_FileSystem fs) {
    return reinterpret_cast<RealFileSystem*>(fs);
}

inline strata_FileSystem to_c(RealFileSystem* fs) {
    return reinterpret_cast<strata_FileSystem>(fs);
}

StrataStatus to_c_status(FileError error) {
    switch (error) {
        case FileError::None:
            return STRATA_OK;
        case FileError::NotFound:
            return STRATA_ERR_FS_NOT_FOUND;
        case FileError::NotADirectory:
            return STRATA_ERR_FS_NOT_A_DIRECTORY;
        case FileError::PermissionDenied:
            return STRATA_ERR_FS_PERMISSION_DENIED;
        case FileError::Other:
        default:
            return STRATA_ERR_FS_OTHER;
    }
}

StrataEntryKind to_c_kind(EntryKind kind) {
    switch (kind) {
        case EntryKind::File:
            return STRATA_ENTRY_KIND_FILE;
        case EntryKind::Directory:
            return STRATA_ENTRY_KIND_DIRECTORY;
        case EntryKind::Other:
            return STRATA_ENTRY_KIND_OTHER;
        case EntryKind::Unresolved:
        default:
            return STRATA_ENTRY_KIND_UNRESOLVED;
    }
}

// Copies text into a NUL-terminated buffer released by strata_string_dispose()
StrataStatus make_owned_string(const std::string& text, StrataOwnedString* out) {
    if (text.size() > std::numeric_limits<uint32_t>::max() - 1u) {
        return STRATA_ERR_INVALID_ARG;
    }
    auto* buffer = static_cast<char*>(::operator new(text.size() + 1, std::nothrow));
    if (!buffer) {
        return STRATA_ERR_NO_MEMORY;
    }
    std::memcpy(buffer, text.data(), text.size());
    buffer[text.size()] = '\0';
    out->ptr = buffer;
    out->len = static_cast<uint32_t>(text.size());
    return STRATA_OK;
}

void clear_owned_string(StrataOwnedString* out) {
    out->ptr = nullptr;
    out->len = 0;
}

}  // anonymous namespace

// ============================================================================
// FileSystem C API Implementation
// ============================================================================

extern "C" {

void strata_file_system_config_init(StrataFileSystemConfig* config) {
    if (!config) return;
    config->resolve_cwd_symlinks = STRATA_TRUE;
    config->max_open_files = static_cast<uint32_t>(BoundedFileOpenLimiter::DefaultCapacity);
}

strata_FileSystem strata_file_system_create(const StrataFileSystemConfig* config, StrataStatus* status) {
    if (!status) return nullptr;
    *status = STRATA_OK;

    try {
        RealFileSystem::Config cfg;
        if (config) {
            cfg.resolveCwdSymlinks = config->resolve_cwd_symlinks != STRATA_FALSE;
            cfg.maxOpenFiles = config->max_open_files;
        }
        auto* fs = new (std::nothrow) RealFileSystem(std::move(cfg));
        if (!fs) {
            STRATA_LOG_ERROR_CAT_F(LogCategory, "Failed to allocate file system handle");
            *status = STRATA_ERR_NO_MEMORY;
            return nullptr;
        }
        STRATA_LOG_DEBUG_CAT_F(LogCategory, "Created file system handle %p (cwd='%s')", static_cast<void*>(fs),
                               fs->cwd().c_str());
        return to_c(fs);
    } catch (...) {
        *status = translate_exception(__func__);
        return nullptr;
    }
}

void strata_file_system_destroy(strata_FileSystem fs) {
    if (!fs) return;
    STRATA_LOG_DEBUG_CAT_F(LogCategory, "Destroying file system handle %p", static_cast<void*>(fs));
    delete to_cpp(fs);
}

StrataStatus strata_file_system_read_file(strata_FileSystem fs, const char* path, StrataOwnedString* out) {
    if (!fs || !path || !out) return STRATA_ERR_INVALID_ARG;
    clear_owned_string(out);

    try {
        FileContents result = to_cpp(fs)->readFile(path);
        if (!result.ok()) {
            return to_c_status(result.error.code);
        }
        return make_owned_string(result.contents, out);
    } catch (...) {
        return translate_exception(__func__);
    }
}

StrataStatus strata_file_system_read_directory(strata_FileSystem fs, const char* path,
                                               StrataOwnedStringArray* out) {
    if (!fs || !path || !out) return STRATA_ERR_INVALID_ARG;
    out->items = nullptr;
    out->count = 0;

    try {
        DirectoryListing listing = to_cpp(fs)->readDirectory(path);
        if (!listing.ok()) {
            STRATA_LOG_DEBUG_CAT_F(LogCategory, "read_directory('%s') failed: %s", path,
                                   listing.error.message.c_str());
            return to_c_status(listing.error.code);
        }

        std::vector<std::string> names;
        names.reserve(listing.entries->size());
        for (const auto& [name, entry] : *listing.entries) {
            names.push_back(name);
        }
        std::sort(names.begin(), names.end());

        if (names.empty()) {
            return STRATA_OK;
        }
        if (names.size() > std::numeric_limits<uint32_t>::max()) {
            return STRATA_ERR_INVALID_ARG;
        }

        auto* items = new (std::nothrow) StrataOwnedString[names.size()];
        if (!items) {
            return STRATA_ERR_NO_MEMORY;
        }
        for (size_t i = 0; i < names.size(); ++i) {
            clear_owned_string(&items[i]);
        }
        out->items = items;
        out->count = static_cast<uint32_t>(names.size());

        for (size_t i = 0; i < names.size(); ++i) {
            StrataStatus st = make_owned_string(names[i], &items[i]);
            if (st != STRATA_OK) {
                strata_string_array_dispose(*out);
                out->items = nullptr;
                out->count = 0;
                return st;
            }
        }
        return STRATA_OK;
    } catch (...) {
        return translate_exception(__func__);
    }
}

StrataStatus strata_file_system_entry_kind(strata_FileSystem fs, const char* dir, const char* name,
                                           StrataEntryKind* out) {
    if (!fs || !dir || !name || !out) return STRATA_ERR_INVALID_ARG;
    *out = STRATA_ENTRY_KIND_UNRESOLVED;

    try {
        DirectoryListing listing = to_cpp(fs)->readDirectory(dir);
        if (!listing.ok()) {
            return to_c_status(listing.error.code);
        }
        const Entry* entry = listing.find(name);
        if (!entry) {
            return STRATA_ERR_FS_NOT_FOUND;
        }
        EntryKindResult kind = entry->kind();
        if (!kind.ok()) {
            return to_c_status(kind.error.code);
        }
        *out = to_c_kind(kind.kind);
        return STRATA_OK;
    } catch (...) {
        return translate_exception(__func__);
    }
}

StrataStatus strata_file_system_mod_key(strata_FileSystem fs, const char* path, StrataModKey* out) {
    if (!fs || !path || !out) return STRATA_ERR_INVALID_ARG;
    std::memset(out, 0, sizeof(*out));

    try {
        ModKeyResult result = to_cpp(fs)->modKey(path);
        if (!result.ok()) {
            return to_c_status(result.error.code);
        }
        out->device = result.key.device;
        out->inode = result.key.inode;
        out->size = result.key.size;
        out->mtime_sec = result.key.mtimeSeconds;
        out->mtime_nsec = result.key.mtimeNanoseconds;
        out->mode = result.key.mode;
        out->uid = result.key.uid;
        return STRATA_OK;
    } catch (...) {
        return translate_exception(__func__);
    }
}

StrataBool strata_mod_key_equals(const StrataModKey* a, const StrataModKey* b) {
    if (!a || !b) return STRATA_FALSE;
    bool same = a->device == b->device && a->inode == b->inode && a->size == b->size &&
                a->mtime_sec == b->mtime_sec && a->mtime_nsec == b->mtime_nsec && a->mode == b->mode &&
                a->uid == b->uid;
    return same ? STRATA_TRUE : STRATA_FALSE;
}

StrataStatus strata_file_system_cwd(strata_FileSystem fs, StrataOwnedString* out) {
    if (!fs || !out) return STRATA_ERR_INVALID_ARG;
    clear_owned_string(out);

    try {
        return make_owned_string(to_cpp(fs)->cwd(), out);
    } catch (...) {
        return translate_exception(__func__);
    }
}

StrataStatus strata_file_system_join(strata_FileSystem fs, const char* a, const char* b, StrataOwnedString* out) {
    if (!fs || !a || !b || !out) return STRATA_ERR_INVALID_ARG;
    clear_owned_string(out);

    try {
        return make_owned_string(to_cpp(fs)->join({a, b}), out);
    } catch (...) {
        return translate_exception(__func__);
    }
}

void strata_string_array_dispose(StrataOwnedStringArray arr) {
    if (!arr.items) return;
    for (uint32_t i = 0; i < arr.count; ++i) {
        strata_string_dispose(arr.items[i]);
    }
    delete[] arr.items;
}

}  // extern "C"
