/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Strata Authors
 * This file is part of the Strata Core project.
 */

#pragma once

/**
 * @file CoreCommon.h
 * @brief Core common utilities for StrataCore
 *
 * Environment helpers used by the configuration layer.
 */

#include <cstdlib>
#include <optional>
#include <string>

namespace Strata {
namespace Core {
    // Cross-platform safe environment variable getter that avoids returning raw pointers
    // and copies into std::string. Returns std::nullopt if the variable is not set.
    inline std::optional<std::string> safeGetEnv(const char* name) {
        if (!name) return std::nullopt;
#if defined(_WIN32)
        // Use secure getenv_s to query size first
        size_t required = 0;
        errno_t err = getenv_s(&required, nullptr, 0, name);
        if (err != 0 || required == 0) return std::nullopt;
        // required includes the null terminator
        std::string value;
        value.resize(required);
        size_t read = 0;
        err = getenv_s(&read, value.data(), value.size(), name);
        if (err != 0 || read == 0) return std::nullopt;
        if (!value.empty() && value.back() == '\0') value.pop_back();
        return value;
#else
        const char* v = std::getenv(name);
        if (!v) return std::nullopt;
        return std::string(v);
#endif
    }
} // namespace Core
}
