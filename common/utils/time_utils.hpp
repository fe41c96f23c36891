#ifndef CHATLIVE_TIME_UTILS_HPP
#define CHATLIVE_TIME_UTILS_HPP

/******************************************************************************
 *
 * @file       time_utils.hpp
 * @brief      Wall-clock helpers
 *
 *****************************************************************************/

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace chatlive {
namespace utils {
namespace TimeUtils {

// Unix time in milliseconds
inline uint64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
}

// Unix time in seconds with a fractional part, e.g. "1718000000.123456"
inline std::string unix_seconds_string() {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    std::ostringstream oss;
    oss << us / 1000000 << '.' << std::setw(6) << std::setfill('0') << us % 1000000;
    return oss.str();
}

}  // namespace TimeUtils
}  // namespace utils
}  // namespace chatlive

#endif  // CHATLIVE_TIME_UTILS_HPP
