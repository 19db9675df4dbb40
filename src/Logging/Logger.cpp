/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Strata Authors
 * This file is part of the Strata Core project.
 */

#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

#include "../CoreCommon.h"
#include "ConsoleSink.h"

namespace Strata {
namespace Core {
namespace Logging {

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warning;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "fatal") return LogLevel::Fatal;
    if (lowered == "off") return LogLevel::Off;
    return std::nullopt;
}

Logger::Logger() {
    _sinks.push_back(std::make_shared<ConsoleSink>());
}

Logger& Logger::global() {
    static Logger instance;
    return instance;
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message) {
    if (!isEnabled(level) || level == LogLevel::Off) {
        return;
    }

    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.category = std::string(category);
    entry.message = std::string(message);
    entry.threadId = std::this_thread::get_id();

    std::lock_guard<std::mutex> lock(_sinkMutex);
    for (auto& sink : _sinks) {
        sink->write(entry);
    }
}

void Logger::addSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(_sinkMutex);
    _sinks.push_back(std::move(sink));
}

void Logger::clearSinks() {
    std::lock_guard<std::mutex> lock(_sinkMutex);
    _sinks.clear();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(_sinkMutex);
    for (auto& sink : _sinks) {
        sink->flush();
    }
}

bool Logger::configureFromEnvironment() {
    auto value = safeGetEnv("STRATA_LOG_LEVEL");
    if (!value) {
        return false;
    }
    auto level = parseLogLevel(*value);
    if (!level) {
        return false;
    }
    setMinLevel(*level);
    return true;
}

} // namespace Logging
} // namespace Core
} // namespace Strata
