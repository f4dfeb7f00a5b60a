#pragma once

#include <time.h>
#include <chrono>
#include <cstdio>
#include <string>
#include "fund_ngin/core/error.hpp"
#include "fund_ngin/core/types.hpp"

namespace fund_ngin {
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
 * @brief Inverse of gmtime: interpret a broken-down time as UTC
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

constexpr int SECONDS_PER_DAY = 86400;

/**
 * @brief Build a date (00:00 UTC) from calendar fields
 */
inline Timestamp make_date(int year, int month, int day) {
    std::tm time_info = {};
    time_info.tm_year = year - 1900;
    time_info.tm_mon = month - 1;
    time_info.tm_mday = day;
    return std::chrono::system_clock::from_time_t(safe_timegm(&time_info));
}

/**
 * @brief Truncate a timestamp to its UTC calendar date
 */
inline Timestamp to_date(const Timestamp& ts) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    auto days = secs / SECONDS_PER_DAY;
    if (secs < 0 && secs % SECONDS_PER_DAY != 0) {
        --days;
    }
    return Timestamp(std::chrono::seconds(days * SECONDS_PER_DAY));
}

inline Timestamp today() {
    return to_date(std::chrono::system_clock::now());
}

inline Timestamp add_days(const Timestamp& date, int days) {
    return date + std::chrono::seconds(static_cast<int64_t>(days) * SECONDS_PER_DAY);
}

/**
 * @brief Whole days from start to end (negative if end precedes start)
 */
inline int days_between(const Timestamp& start, const Timestamp& end) {
    auto diff = std::chrono::duration_cast<std::chrono::seconds>(to_date(end) - to_date(start));
    return static_cast<int>(diff.count() / SECONDS_PER_DAY);
}

/**
 * @brief Calendar year and month of a date in UTC
 */
inline std::pair<int, int> year_month(const Timestamp& date) {
    auto time_val = std::chrono::system_clock::to_time_t(date);
    std::tm time_info;
    safe_gmtime(&time_val, &time_info);
    return {time_info.tm_year + 1900, time_info.tm_mon + 1};
}

/**
 * @brief Format a date as YYYY-MM-DD (UTC)
 */
inline std::string format_date(const Timestamp& date) {
    auto time_val = std::chrono::system_clock::to_time_t(date);
    std::tm time_info;
    safe_gmtime(&time_val, &time_info);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &time_info);
    return std::string(buffer);
}

/**
 * @brief Format a timestamp as YYYY-MM-DD HH:MM:SS (UTC)
 */
inline std::string format_timestamp(const Timestamp& ts) {
    auto time_val = std::chrono::system_clock::to_time_t(ts);
    std::tm time_info;
    safe_gmtime(&time_val, &time_info);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &time_info);
    return std::string(buffer);
}

/**
 * @brief Parse a YYYY-MM-DD (optionally followed by a time part) date
 * @param text Date text
 * @return Date at 00:00 UTC, or PARSE_ERROR
 */
inline Result<Timestamp> parse_date(const std::string& text) {
    int year = 0;
    int month = 0;
    int day = 0;
    if (text.size() < 10 || std::sscanf(text.c_str(), "%4d-%2d-%2d", &year, &month, &day) != 3) {
        return make_error<Timestamp>(ErrorCode::PARSE_ERROR, "Invalid date: '" + text + "'",
                                     "TimeUtils");
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || year < 1900) {
        return make_error<Timestamp>(ErrorCode::PARSE_ERROR, "Date out of range: '" + text + "'",
                                     "TimeUtils");
    }
    Timestamp date = make_date(year, month, day);
    // timegm normalizes overflowing days (e.g. 2024-02-31), reject those
    auto ym = year_month(date);
    if (ym.first != year || ym.second != month) {
        return make_error<Timestamp>(ErrorCode::PARSE_ERROR, "Date out of range: '" + text + "'",
                                     "TimeUtils");
    }
    return date;
}

}  // namespace core
}  // namespace fund_ngin
