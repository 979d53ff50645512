#ifndef PLUGSEC_UTILS_LOG_H
#define PLUGSEC_UTILS_LOG_H

#include <iostream>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <ctime>
#include <string>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace utils {

enum class LogLevel {
    VERBOSE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

// Default log level - can be overridden at compile time
// Example: -DPLUGSEC_LOG_LEVEL_DEFAULT=::utils::LogLevel::INFO to hide VERBOSE and DEBUG
#ifndef PLUGSEC_LOG_LEVEL_DEFAULT
    #define PLUGSEC_LOG_LEVEL_DEFAULT ::utils::LogLevel::INFO
#endif

// Global maximum log level - logs below this level are suppressed
inline LogLevel g_max_log_level = PLUGSEC_LOG_LEVEL_DEFAULT;

inline void setLogLevel(LogLevel level) {
    g_max_log_level = level;
}

inline LogLevel getLogLevel() {
    return g_max_log_level;
}

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::VERBOSE: return "VERBOSE";
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name as written in configuration files
 * @param name Case-insensitive level name ("info", "WARN", "warning", ...)
 * @throws std::invalid_argument for unknown names
 */
inline LogLevel parseLogLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "VERBOSE") return LogLevel::VERBOSE;
    if (upper == "DEBUG")   return LogLevel::DEBUG;
    if (upper == "INFO")    return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR")   return LogLevel::ERROR;
    if (upper == "FATAL")   return LogLevel::FATAL;
    throw std::invalid_argument("Invalid log level: " + name);
}

inline std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    #ifdef _WIN32
        localtime_s(&tm_buf, &now_time_t);
    #else
        localtime_r(&now_time_t, &tm_buf);
    #endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << now_ms.count();
    return oss.str();
}

inline const char* extractFilename(const char* path) {
    const char* filename = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/' || *p == '\\') {
            filename = p + 1;
        }
    }
    return filename;
}

inline void log(LogLevel level, const char* file, int line, const std::string& message) {
    if (level < g_max_log_level) {
        return;
    }

    std::ostringstream oss;
    oss << "[" << getCurrentTimestamp() << "] "
        << "[" << logLevelToString(level) << "] "
        << "[" << extractFilename(file) << ":" << line << "] "
        << message;

    if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
        std::cerr << oss.str() << std::endl;
    } else {
        std::cout << oss.str() << std::endl;
    }
}

} // namespace utils

/**
 * @brief Log Level Filtering
 *
 * 1. Compile time (CMakeLists.txt):
 *    add_compile_definitions(PLUGSEC_LOG_LEVEL_DEFAULT=::utils::LogLevel::DEBUG)
 *
 * 2. Runtime:
 *    utils::setLogLevel(utils::LogLevel::WARNING);
 *    utils::setLogLevel(utils::parseLogLevel(props.getLogLevel()));
 *
 * Log levels (from lowest to highest):
 *   VERBOSE < DEBUG < INFO < WARNING < ERROR < FATAL
 */

#define LOGV(msg) ::utils::log(::utils::LogLevel::VERBOSE, __FILE__, __LINE__, msg)
#define LOGD(msg) ::utils::log(::utils::LogLevel::DEBUG, __FILE__, __LINE__, msg)
#define LOGI(msg) ::utils::log(::utils::LogLevel::INFO, __FILE__, __LINE__, msg)
#define LOGW(msg) ::utils::log(::utils::LogLevel::WARNING, __FILE__, __LINE__, msg)
#define LOGE(msg) ::utils::log(::utils::LogLevel::ERROR, __FILE__, __LINE__, msg)
#define LOGF(msg) ::utils::log(::utils::LogLevel::FATAL, __FILE__, __LINE__, msg)

// Stream-style formatting variants
#define LOGV_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGV(_oss.str()); }
#define LOGD_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGD(_oss.str()); }
#define LOGI_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGI(_oss.str()); }
#define LOGW_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGW(_oss.str()); }
#define LOGE_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGE(_oss.str()); }
#define LOGF_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGF(_oss.str()); }

#endif // PLUGSEC_UTILS_LOG_H
