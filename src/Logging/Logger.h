/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Strata Authors
 * This file is part of the Strata Core project.
 */

/**
 * @file Logger.h
 * @brief Process-wide logger with pluggable sinks
 *
 * Logger fans a record out to every registered ILogSink once it passes the
 * minimum level. The global instance starts with a single ConsoleSink at
 * LogLevel::Info. Use the STRATA_LOG_* macros rather than calling log()
 * directly so the category defaults to the calling function.
 *
 * @code
 * Logger::global().setMinLevel(LogLevel::Debug);
 * STRATA_LOG_INFO("Listing " + path);
 * STRATA_LOG_DEBUG_CAT("FileSystem", "cache miss for " + path);
 * @endcode
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "ILogSink.h"
#include "LogLevel.h"

namespace Strata {
namespace Core {
namespace Logging {

    class Logger {
    public:
        Logger();
        ~Logger() = default;

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        /**
         * @brief The process-wide logger used by the STRATA_LOG_* macros
         */
        static Logger& global();

        void log(LogLevel level, std::string_view category, std::string_view message);

        bool isEnabled(LogLevel level) const noexcept {
            return level >= _minLevel.load(std::memory_order_relaxed);
        }

        void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
        LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }

        void addSink(std::shared_ptr<ILogSink> sink);
        void clearSinks();
        void flush();

        /**
         * @brief Applies STRATA_LOG_LEVEL from the environment if set and valid
         * @return true if the level was changed
         */
        bool configureFromEnvironment();

    private:
        std::atomic<LogLevel> _minLevel{LogLevel::Info};
        mutable std::mutex _sinkMutex;
        std::vector<std::shared_ptr<ILogSink>> _sinks;
    };

} // namespace Logging
} // namespace Core
} // namespace Strata

#define STRATA_LOG_AT(level, category, message)                                              \
    do {                                                                                     \
        auto& strataLogger_ = ::Strata::Core::Logging::Logger::global();                     \
        if (strataLogger_.isEnabled(level)) {                                                \
            strataLogger_.log((level), (category), (message));                               \
        }                                                                                    \
    } while (0)

#define STRATA_LOG_TRACE(message) STRATA_LOG_AT(::Strata::Core::Logging::LogLevel::Trace, __func__, message)
#define STRATA_LOG_DEBUG(message) STRATA_LOG_AT(::Strata::Core::Logging::LogLevel::Debug, __func__, message)
#define STRATA_LOG_INFO(message) STRATA_LOG_AT(::Strata::Core::Logging::LogLevel::Info, __func__, message)
#define STRATA_LOG_WARNING(message) STRATA_LOG_AT(::Strata::Core::Logging::LogLevel::Warning, __func__, message)
#define STRATA_LOG_ERROR(message) STRATA_LOG_AT(::Strata::Core::Logging::LogLevel::Error, __func__, message)
#define STRATA_LOG_FATAL(message) STRATA_LOG_AT(::Strata::Core::Logging::LogLevel::Fatal, __func__, message)

#define STRATA_LOG_TRACE_CAT(cat, message) STRATA_LOG_AT(::Strata::Core::Logging::LogLevel::Trace, cat, message)
#define STRATA_LOG_DEBUG_CAT(cat, message) STRATA_LOG_AT(::Strata::Core::Logging::LogLevel::Debug, cat, message)
#define STRATA_LOG_INFO_CAT(cat, message) STRATA_LOG_AT(::Strata::Core::Logging::LogLevel::Info, cat, message)
#define STRATA_LOG_WARNING_CAT(cat, message) STRATA_LOG_AT(::Strata::Core::Logging::LogLevel::Warning, cat, message)
#define STRATA_LOG_ERROR_CAT(cat, message) STRATA_LOG_AT(::Strata::Core::Logging::LogLevel::Error, cat, message)
#define STRATA_LOG_FATAL_CAT(cat, message) STRATA_LOG_AT(::Strata::Core::Logging::LogLevel::Fatal, cat, message)
