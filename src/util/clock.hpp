#ifndef MEDIGUARD_UTIL_CLOCK_HPP
#define MEDIGUARD_UTIL_CLOCK_HPP

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace mediguard {
namespace util {

/**
 * @brief Current UTC time as ISO-8601 with microseconds, e.g. "2025-03-01T08:15:02.123456Z".
 *
 * Lexicographic order of these strings equals chronological order, which the
 * store relies on when it sorts predictions by timestamp.
 */
inline std::string utcNowIso8601()
{
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;

    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return oss.str();
}

} // namespace util
} // namespace mediguard

#endif // MEDIGUARD_UTIL_CLOCK_HPP
