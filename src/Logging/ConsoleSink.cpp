/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Strata Authors
 * This file is part of the Strata Core project.
 */

#include "ConsoleSink.h"

#include <iostream>

namespace Strata {
namespace Core {
namespace Logging {

void ConsoleSink::write(const LogEntry& entry) {
    std::ostream& out = entry.level >= LogLevel::Warning ? std::cerr : std::cout;
    out << '[' << logLevelToString(entry.level) << "] ";
    if (_showThreadId) {
        out << "[tid " << entry.threadId << "] ";
    }
    if (!entry.category.empty()) {
        out << '[' << entry.category << "] ";
    }
    out << entry.message << '\n';
}

void ConsoleSink::flush() {
    std::cout.flush();
    std::cerr.flush();
}

} // namespace Logging
} // namespace Core
} // namespace Strata
