/* C logger shim forwarding to C++ Logger backend */
#include "Logging/CLogger.h"

#include <cstdarg>
#include <cstdio>
#include <string>

#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

using ::Strata::Core::Logging::Logger;
using ::Strata::Core::Logging::LogLevel;

static LogLevel map_level(StrataLogLevelC lvl) noexcept {
    switch (lvl) {
        case STRATA_LOG_TRACE_C:
            return LogLevel::Trace;
        case STRATA_LOG_DEBUG_C:
            return LogLevel::Debug;
        case STRATA_LOG_INFO_C:
            return LogLevel::Info;
        case STRATA_LOG_WARN_C:
            return LogLevel::Warning;
        case STRATA_LOG_ERROR_C:
            return LogLevel::Error;
        case STRATA_LOG_FATAL_C:
            return LogLevel::Fatal;
        default:
            return LogLevel::Info;
    }
}

static void vwrite_internal(StrataLogLevelC level, const char* category, const char* fmt, va_list args) {
    if (!fmt) return;

    // Skip formatting entirely when the level is filtered out
    const LogLevel mapped = map_level(level);
    if (!Logger::global().isEnabled(mapped)) return;

    va_list args_copy;
    va_copy(args_copy, args);
    int needed = std::vsnprintf(nullptr, 0, fmt, args_copy);
    va_end(args_copy);
    if (needed < 0) return;

    std::string message;
    message.resize(static_cast<size_t>(needed));
    std::vsnprintf(message.data(), message.size() + 1, fmt, args);

    Logger::global().log(mapped, (category && *category) ? category : "C", message);
}

extern "C" {

void strata_log_vwrite(StrataLogLevelC level, const char* fmt, va_list args) {
    vwrite_internal(level, "C", fmt, args);
}

void strata_log_vwrite_cat(StrataLogLevelC level, const char* category, const char* fmt, va_list args) {
    vwrite_internal(level, category, fmt, args);
}

void strata_log_write(StrataLogLevelC level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite_internal(level, "C", fmt, args);
    va_end(args);
}

void strata_log_write_cat(StrataLogLevelC level, const char* category, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite_internal(level, category, fmt, args);
    va_end(args);
}

}  // extern "C"
