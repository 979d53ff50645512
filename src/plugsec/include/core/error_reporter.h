#ifndef PLUGSEC_ERROR_REPORTER_H
#define PLUGSEC_ERROR_REPORTER_H

#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace plugsec {

/**
 * @brief Report categories emitted by the security subsystem
 */
namespace report_category {
    constexpr const char* SECURITY_VALIDATION_FAILED = "Plugin Security Validation Failed";
    constexpr const char* INTEGRITY_VALIDATION_FAILED = "Plugin Integrity Validation Failed";
    constexpr const char* MEMORY_VIOLATION = "Plugin Memory Violation";
    constexpr const char* EXECUTION_ERROR = "Plugin Execution Error";
    constexpr const char* EXECUTION_FAILED = "Plugin Execution Failed";
    constexpr const char* PERFORMANCE_WARNING = "Plugin Performance Warning";
    constexpr const char* REGISTRATION = "Plugin Registration";
}

/**
 * @brief Sink for integrity failures, sandbox violations and slow operations
 *
 * Implementations must be thread-safe; the sandbox reports from
 * worker threads.
 */
class ErrorReporter {
public:
    virtual ~ErrorReporter() = default;

    /**
     * @brief Record one error event
     * @param message Human readable description
     * @param category One of the report_category names
     * @param context Structured details (plugin id, durations, failed checks...)
     */
    virtual void report(const std::string& message,
                        const std::string& category,
                        const nlohmann::json& context) = 0;
};

/**
 * @brief Default reporter writing one ERROR log line per event
 */
class LoggingErrorReporter : public ErrorReporter {
public:
    void report(const std::string& message,
                const std::string& category,
                const nlohmann::json& context) override;
};

/**
 * @brief Return reporter, or a LoggingErrorReporter when reporter is null
 */
std::shared_ptr<ErrorReporter> reporterOrDefault(std::shared_ptr<ErrorReporter> reporter);

} // namespace plugsec

#endif // PLUGSEC_ERROR_REPORTER_H
