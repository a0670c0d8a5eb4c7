#pragma once

#include <time.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include "finpipe/core/types.hpp"

namespace finpipe {
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
 * @brief Inverse of gmtime: broken-down UTC time to epoch seconds
 */
inline std::time_t safe_timegm(std::tm* time_info) {
#ifdef _WIN32
    return _mkgmtime(time_info);
#else
    return timegm(time_info);
#endif
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

/**
 * @brief Truncate a timestamp to 00:00 UTC of the same day
 */
inline Timestamp floor_to_day(const Timestamp& ts) {
    using namespace std::chrono;
    auto secs = duration_cast<seconds>(ts.time_since_epoch()).count();
    constexpr int64_t kSecondsPerDay = 86400;
    int64_t days = secs / kSecondsPerDay;
    if (secs < 0 && secs % kSecondsPerDay != 0) {
        --days;
    }
    return Timestamp(seconds(days * kSecondsPerDay));
}

/**
 * @brief Timestamp from epoch seconds
 */
inline Timestamp from_unix_seconds(int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

inline int64_t to_unix_seconds(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

/**
 * @brief Parse "YYYY-MM-DD" into the UTC midnight timestamp of that day
 * @return nullopt when the string is not a valid calendar date
 */
inline std::optional<Timestamp> parse_date(const std::string& text) {
    int year = 0, month = 0, day = 0;
    char trailing = 0;
    if (text.size() < 10 ||
        std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &year, &month, &day, &trailing) < 3) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    std::tm time_info = {};
    time_info.tm_year = year - 1900;
    time_info.tm_mon = month - 1;
    time_info.tm_mday = day;
    std::time_t epoch = safe_timegm(&time_info);

    // timegm normalizes 2024-02-31 to March; reject such dates
    std::tm check = {};
    safe_gmtime(&epoch, &check);
    if (check.tm_mday != day || check.tm_mon != month - 1) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(epoch);
}

/**
 * @brief Parse "YYYY-MM-DD HH:MM:SS" (UTC)
 */
inline std::optional<Timestamp> parse_timestamp(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int matched = std::sscanf(text.c_str(), "%4d-%2d-%2d%*[ T]%2d:%2d:%2d", &year, &month, &day,
                              &hour, &minute, &second);
    if (matched < 3) {
        return std::nullopt;
    }
    std::tm time_info = {};
    time_info.tm_year = year - 1900;
    time_info.tm_mon = month - 1;
    time_info.tm_mday = day;
    time_info.tm_hour = hour;
    time_info.tm_min = minute;
    time_info.tm_sec = second;
    return std::chrono::system_clock::from_time_t(safe_timegm(&time_info));
}

/**
 * @brief Format as "YYYY-MM-DD" (UTC)
 */
inline std::string format_date(const Timestamp& ts) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    std::tm time_info;
    safe_gmtime(&time_t, &time_info);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &time_info);
    return std::string(buffer);
}

/**
 * @brief Format as "YYYY-MM-DD HH:MM:SS" (UTC)
 */
inline std::string format_timestamp(const Timestamp& ts) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    std::tm time_info;
    safe_gmtime(&time_t, &time_info);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &time_info);
    return std::string(buffer);
}

}  // namespace core
}  // namespace finpipe
