/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Strata Authors
 * This file is part of the Strata Core project.
 */

/**
 * @file ConsoleSink.h
 * @brief Sink that prints log entries to stdout/stderr
 */

#pragma once

#include "ILogSink.h"

namespace Strata {
namespace Core {
namespace Logging {

    /**
     * @brief Writes entries as "[LEVEL] [category] message"
     *
     * Warnings and above go to stderr, everything else to stdout.
     */
    class ConsoleSink : public ILogSink {
    public:
        explicit ConsoleSink(bool showThreadId = false) : _showThreadId(showThreadId) {}

        void write(const LogEntry& entry) override;
        void flush() override;

    private:
        bool _showThreadId;
    };

} // namespace Logging
} // namespace Core
} // namespace Strata
