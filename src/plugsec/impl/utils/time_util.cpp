#include "utils/time_util.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace plugsec {
namespace utils {

std::string formatIso8601Utc(std::chrono::system_clock::time_point time) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()) % 1000;

    std::tm tmBuf;
#ifdef _WIN32
    gmtime_s(&tmBuf, &timeT);
#else
    gmtime_r(&timeT, &tmBuf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string currentIso8601Utc() {
    return formatIso8601Utc(std::chrono::system_clock::now());
}

} // namespace utils
} // namespace plugsec
