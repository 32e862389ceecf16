/**
 * @file time.hpp
 * @brief Cross-platform time helpers and local calendar-day arithmetic
 *
 * POSIX uses localtime_r(time_t*, tm*) while Windows uses
 * localtime_s(tm*, time_t*). The calendar helpers below are built on top
 * of the thread-safe variants and are used wherever "today" means the
 * learner's local day (daily limit, today panel, forecast, history).
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace recall::compat {

/**
 * @brief Cross-platform thread-safe local time conversion
 * @return Pointer to the tm structure (result) on success, nullptr on failure
 */
inline std::tm* localtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return localtime_s(result, time) == 0 ? result : nullptr;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Local midnight of the calendar day containing @p tp
 * @param day_offset Whole days to shift the result (negative = past)
 */
inline auto start_of_local_day(std::chrono::system_clock::time_point tp,
                               int day_offset = 0)
    -> std::chrono::system_clock::time_point {
    const auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (localtime_safe(&tt, &tm) == nullptr) {
        return tp;
    }
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    tm.tm_mday += day_offset;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

/**
 * @brief Local midnight of the first day of the month containing @p tp
 * @param month_offset Whole months to shift the result (negative = past)
 */
inline auto start_of_local_month(std::chrono::system_clock::time_point tp,
                                 int month_offset = 0)
    -> std::chrono::system_clock::time_point {
    const auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (localtime_safe(&tt, &tm) == nullptr) {
        return tp;
    }
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    tm.tm_mday = 1;
    tm.tm_mon += month_offset;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

/**
 * @brief Format a time point as a local date using strftime syntax
 */
inline auto format_local(std::chrono::system_clock::time_point tp,
                         const char* pattern) -> std::string {
    const auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (localtime_safe(&tt, &tm) == nullptr) {
        return {};
    }
    char buf[64];
    const auto len = std::strftime(buf, sizeof(buf), pattern, &tm);
    return std::string(buf, len);
}

/**
 * @brief Milliseconds since the Unix epoch
 */
inline auto to_epoch_ms(std::chrono::system_clock::time_point tp)
    -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch())
        .count();
}

/**
 * @brief Time point from milliseconds since the Unix epoch
 */
inline auto from_epoch_ms(std::int64_t ms)
    -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds{ms})};
}

}  // namespace recall::compat
