#ifndef PLUGSEC_TIME_UTIL_H
#define PLUGSEC_TIME_UTIL_H

#include <chrono>
#include <string>

namespace plugsec {
namespace utils {

/**
 * @brief Format a time point as ISO-8601 UTC with milliseconds, e.g. "2024-05-01T12:00:00.000Z"
 */
std::string formatIso8601Utc(std::chrono::system_clock::time_point time);

/**
 * @brief Current time formatted by formatIso8601Utc()
 */
std::string currentIso8601Utc();

} // namespace utils
} // namespace plugsec

#endif // PLUGSEC_TIME_UTIL_H
