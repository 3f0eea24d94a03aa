// utils.h

#pragma once

#include <chrono>
#include <ctime>
#include <cstdint>
#include <sstream>
#include <iomanip>
#include <string>

namespace baseload {
namespace utils {

constexpr uint64_t kMiB = 1024ULL * 1024ULL;
constexpr uint64_t kGiB = 1024ULL * kMiB;

/**
 * @brief Utility function to format timestamp as a string.
 * @param tp Timestamp to format.
 * @return Formatted string (YYYY-MM-DD HH:MM:SS.mmm).
 */
inline std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
    using namespace std::chrono;
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % milliseconds(1000);
    std::time_t tt = system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm); // Thread-safe on POSIX
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
       << "." << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

/**
 * @brief Hour of day (0-23) of a time point, in UTC.
 */
inline int utcHour(const std::chrono::system_clock::time_point& tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    return tm.tm_hour;
}

// "45.3%"
inline std::string formatPercent(double p) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << p << '%';
    return ss.str();
}

// "0.6"
inline std::string formatProbability(double p) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << p;
    return ss.str();
}

} // namespace utils
} // namespace baseload
