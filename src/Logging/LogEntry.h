/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Strata Authors
 * This file is part of the Strata Core project.
 */

/**
 * @file LogEntry.h
 * @brief A single formatted log record handed to sinks
 */

#pragma once

#include <chrono>
#include <string>
#include <thread>

#include "LogLevel.h"

namespace Strata {
namespace Core {
namespace Logging {

    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level = LogLevel::Info;
        std::string category;
        std::string message;
        std::thread::id threadId;
    };

} // namespace Logging
} // namespace Core
} // namespace Strata
