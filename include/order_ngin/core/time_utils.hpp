#pragma once

#include <time.h>
#include <chrono>
#include <cstdio>
#include <string>
#include "order_ngin/core/types.hpp"

namespace order_ngin {
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
 * @brief ISO-8601 UTC representation with millisecond precision
 * @param ts Timestamp to format, epoch renders as an empty string
 */
inline std::string format_timestamp(const Timestamp& ts) {
    if (ts.time_since_epoch().count() == 0) {
        return "";
    }
    auto secs = std::chrono::system_clock::to_time_t(ts);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      ts.time_since_epoch()).count() % 1000;
    std::tm result;
    safe_gmtime(&secs, &result);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &result);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buffer, static_cast<int>(millis));
    return std::string(out);
}

}  // namespace core
}  // namespace order_ngin
