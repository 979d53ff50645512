#ifndef PLUGSEC_EXECUTION_ENVIRONMENT_H
#define PLUGSEC_EXECUTION_ENVIRONMENT_H

#include "security/host_services.h"
#include "utils/log.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace plugsec {
namespace sandbox {

/**
 * @brief Limits applied by an ExecutionEnvironment
 */
struct EnvironmentLimits {
    std::chrono::milliseconds fetchTimeout{10000};
    size_t maxJsonBytes = 1024 * 1024;
    std::chrono::milliseconds maxTimerDelay{30000};
    size_t maxLogLength = 1000;
};

/**
 * @class ExecutionEnvironment
 * @brief Generic safety facade handed to plugin code at run time
 *
 * Complements the per-capability ConstrainedContext:
 * - logging is sanitized and prefixed with "[PLUGIN] "
 * - fetch is limited to http/https and carries a short timeout
 * - JSON parse/stringify are bounded in size
 * - timer delays are capped
 *
 * Refusals throw security::PayloadRejectedError.
 */
class ExecutionEnvironment {
public:
    /**
     * @throws std::invalid_argument if host is null
     */
    ExecutionEnvironment(const std::string& pluginId,
                         std::shared_ptr<security::HostServices> host,
                         const EnvironmentLimits& limits = EnvironmentLimits());

    void log(const std::string& message) const;
    void info(const std::string& message) const;
    void warn(const std::string& message) const;
    void error(const std::string& message) const;

    /**
     * @brief Issue an HTTP request through the host with the fetch timeout
     * @throws security::PayloadRejectedError for non-HTTP(S) URLs
     */
    security::HttpResponse fetch(const security::HttpRequest& request) const;

    /**
     * @throws security::PayloadRejectedError "JSON payload too large" or "Invalid JSON format"
     */
    nlohmann::json parseJson(const std::string& text) const;

    /**
     * @throws security::PayloadRejectedError "JSON output too large" or "Failed to stringify JSON"
     */
    std::string stringifyJson(const nlohmann::json& value) const;

    /**
     * @brief Validate a timer delay requested by the plugin
     * @return The delay, unchanged
     * @throws security::PayloadRejectedError when the delay exceeds the cap
     */
    std::chrono::milliseconds checkTimerDelay(std::chrono::milliseconds delay) const;

    /**
     * @brief Remove script blocks and javascript: handlers, then truncate
     */
    static std::string sanitizeLogMessage(const std::string& message, size_t maxLength);

    const std::string& getPluginId() const { return pluginId_; }
    const EnvironmentLimits& getLimits() const { return limits_; }

private:
    void emit(::utils::LogLevel level, const std::string& message) const;

    std::string pluginId_;
    std::shared_ptr<security::HostServices> host_;
    EnvironmentLimits limits_;
};

} // namespace sandbox
} // namespace plugsec

#endif // PLUGSEC_EXECUTION_ENVIRONMENT_H
