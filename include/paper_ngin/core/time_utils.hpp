#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include "paper_ngin/core/types.hpp"

namespace paper_ngin {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
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
 * @brief Inverse of gmtime: broken-down UTC time to time_t
 */
inline std::time_t safe_timegm(std::tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

/**
 * @brief Get current time as a string with specified format
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm result{};

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
 * @brief Format a timestamp as ISO-8601 UTC with second precision
 * e.g. 2024-11-04T03:45:00Z
 */
inline std::string format_timestamp(const Timestamp& ts) {
    auto tt = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    safe_gmtime(&tt, &tm);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buffer);
}

/**
 * @brief Parse the output of format_timestamp
 * @return std::nullopt when the text is not a valid timestamp
 */
inline std::optional<Timestamp> parse_timestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    std::time_t tt = safe_timegm(&tm);
    if (tt == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(tt);
}

}  // namespace core
}  // namespace paper_ngin
