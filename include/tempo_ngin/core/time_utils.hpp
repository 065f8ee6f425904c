#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <string>
#include "tempo_ngin/core/types.hpp"

namespace tempo_ngin {
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
 * @brief Calendar fields of a timestamp, in UTC
 */
struct CalendarDate {
    int year;
    int month;    // 1-12
    int day;      // 1-31
    int weekday;  // ISO weekday, Monday = 1 ... Sunday = 7
    int iso_year;
    int iso_week;
};

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date
 */
inline long days_from_civil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = static_cast<long>(y - era * 400);
    const long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

/**
 * @brief Build a midnight-UTC timestamp from a calendar date
 */
inline Timestamp make_date(int year, int month, int day) {
    return Timestamp(std::chrono::seconds(days_from_civil(year, month, day) * 86400L));
}

inline CalendarDate to_calendar_date(const Timestamp& ts) {
    std::time_t tt = std::chrono::system_clock::to_time_t(ts);
    std::tm tm_utc;
    safe_gmtime(&tt, &tm_utc);

    CalendarDate date;
    date.year = tm_utc.tm_year + 1900;
    date.month = tm_utc.tm_mon + 1;
    date.day = tm_utc.tm_mday;
    date.weekday = tm_utc.tm_wday == 0 ? 7 : tm_utc.tm_wday;

    // ISO week: the week containing the Thursday of this week
    long days = days_from_civil(date.year, date.month, date.day);
    long thursday = days - date.weekday + 4;
    std::time_t th = static_cast<std::time_t>(thursday * 86400L);
    std::tm tm_th;
    safe_gmtime(&th, &tm_th);
    date.iso_year = tm_th.tm_year + 1900;
    date.iso_week = tm_th.tm_yday / 7 + 1;
    return date;
}

/**
 * @brief Format a timestamp as YYYY-MM-DD (UTC)
 */
inline std::string format_date(const Timestamp& ts) {
    std::time_t tt = std::chrono::system_clock::to_time_t(ts);
    std::tm tm_utc;
    safe_gmtime(&tt, &tm_utc);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm_utc);
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
}  // namespace tempo_ngin
