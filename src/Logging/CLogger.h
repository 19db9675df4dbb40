#pragma once

// C-compatible logging shim that forwards to StrataCore's C++ logger backend.
// Provides printf-style logging macros that can be used from both C and C++.

#include <stdarg.h>
#ifdef __cplusplus
extern "C" {
#endif

// C-visible log levels (keep values in sync with Logging::LogLevel)
typedef enum StrataLogLevelC
{
    STRATA_LOG_TRACE_C = 0,
    STRATA_LOG_DEBUG_C = 1,
    STRATA_LOG_INFO_C = 2,
    STRATA_LOG_WARN_C = 3,
    STRATA_LOG_ERROR_C = 4,
    STRATA_LOG_FATAL_C = 5
} StrataLogLevelC;

// Core C APIs (printf-style)
void strata_log_write(StrataLogLevelC level, const char* fmt, ...);
void strata_log_write_cat(StrataLogLevelC level, const char* category, const char* fmt, ...);

// va_list variants
void strata_log_vwrite(StrataLogLevelC level, const char* fmt, va_list args);
void strata_log_vwrite_cat(StrataLogLevelC level, const char* category, const char* fmt, va_list args);

#ifdef __cplusplus
}  // extern "C"
#endif

// By default, non-category macros use __func__ as the category.
#ifndef STRATA_LOG_CATEGORY_DEFAULT
#define STRATA_LOG_CATEGORY_DEFAULT __func__
#endif

#define STRATA_LOG_TRACE_F(fmt, ...) \
    strata_log_write_cat(STRATA_LOG_TRACE_C, STRATA_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define STRATA_LOG_DEBUG_F(fmt, ...) \
    strata_log_write_cat(STRATA_LOG_DEBUG_C, STRATA_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define STRATA_LOG_INFO_F(fmt, ...) \
    strata_log_write_cat(STRATA_LOG_INFO_C, STRATA_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define STRATA_LOG_WARNING_F(fmt, ...) \
    strata_log_write_cat(STRATA_LOG_WARN_C, STRATA_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)
#define STRATA_LOG_ERROR_F(fmt, ...) \
    strata_log_write_cat(STRATA_LOG_ERROR_C, STRATA_LOG_CATEGORY_DEFAULT, (fmt), ##__VA_ARGS__)

#define STRATA_LOG_DEBUG_CAT_F(cat, fmt, ...) strata_log_write_cat(STRATA_LOG_DEBUG_C, (cat), (fmt), ##__VA_ARGS__)
#define STRATA_LOG_INFO_CAT_F(cat, fmt, ...) strata_log_write_cat(STRATA_LOG_INFO_C, (cat), (fmt), ##__VA_ARGS__)
#define STRATA_LOG_WARNING_CAT_F(cat, fmt, ...) strata_log_write_cat(STRATA_LOG_WARN_C, (cat), (fmt), ##__VA_ARGS__)
#define STRATA_LOG_ERROR_CAT_F(cat, fmt, ...) strata_log_write_cat(STRATA_LOG_ERROR_C, (cat), (fmt), ##__VA_ARGS__)
