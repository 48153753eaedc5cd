// include/stratlab/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <cstdio>
#include <string>
#include "stratlab/core/types.hpp"

namespace stratlab {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Break a timestamp into UTC calendar fields
 */
inline std::tm to_utc_tm(const Timestamp& ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm result{};
    safe_gmtime(&t, &result);
    return result;
}

/**
 * @brief Format a timestamp's UTC calendar month as "YYYY-MM"
 */
inline std::string month_key(const Timestamp& ts) {
    std::tm tm = to_utc_tm(ts);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d", tm.tm_year + 1900, tm.tm_mon + 1);
    return std::string(buffer);
}

/**
 * @brief Whole UTC days since the epoch
 */
inline long long utc_day_index(const Timestamp& ts) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    long long day = secs / 86400;
    if (secs < 0 && secs % 86400 != 0)
        --day;
    return day;
}

/**
 * @brief Monday-based week index (1970-01-01 was a Thursday)
 */
inline long long utc_week_index(const Timestamp& ts) {
    long long shifted = utc_day_index(ts) + 3;
    long long week = shifted / 7;
    if (shifted < 0 && shifted % 7 != 0)
        --week;
    return week;
}

inline int utc_month_index(const Timestamp& ts) {
    std::tm tm = to_utc_tm(ts);
    return (tm.tm_year + 1900) * 12 + tm.tm_mon;
}

/**
 * @brief Format a timestamp as "YYYY-MM-DD HH:MM:SS" in UTC
 */
inline std::string format_timestamp(const Timestamp& ts) {
    std::tm tm = to_utc_tm(ts);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buffer);
}

/**
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 * @return Formatted time string
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

}  // namespace core
}  // namespace stratlab
