/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Strata Authors
 * This file is part of the Strata Core project.
 */

/**
 * @file LogLevel.h
 * @brief Severity levels shared by the logger, its sinks and the C shim
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace Strata {
namespace Core {
namespace Logging {

    /**
     * @brief Log severity, ordered from most to least verbose
     *
     * Values are kept in sync with StrataLogLevelC in CLogger.h.
     */
    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        Fatal = 5,
        Off = 6
    };

    constexpr std::string_view logLevelToString(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Trace:   return "TRACE";
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::Fatal:   return "FATAL";
            case LogLevel::Off:     return "OFF";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Parses a case-insensitive level name ("trace", "warn", "warning", ...)
     * @return The level, or std::nullopt if the name is not recognized
     */
    std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace Logging
} // namespace Core
} // namespace Strata
