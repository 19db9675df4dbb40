/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Strata Authors
 * This file is part of the Strata Core project.
 */

/**
 * @file ILogSink.h
 * @brief Destination interface for log records
 */

#pragma once

#include "LogEntry.h"

namespace Strata {
namespace Core {
namespace Logging {

    /**
     * @brief Receives log entries from the Logger
     *
     * write() may be called from any thread; the Logger serializes calls to a
     * given sink, so implementations need no locking of their own.
     */
    class ILogSink {
    public:
        virtual ~ILogSink() = default;

        virtual void write(const LogEntry& entry) = 0;
        virtual void flush() {}
    };

} // namespace Logging
} // namespace Core
} // namespace Strata
