#ifndef PLUGSEC_SECURITY_ERRORS_H
#define PLUGSEC_SECURITY_ERRORS_H

#include <stdexcept>
#include <string>

namespace plugsec {
namespace security {

/**
 * @brief Base class for every error raised by the security subsystem
 */
class SecurityError : public std::runtime_error {
public:
    explicit SecurityError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Thrown when a plugin invokes a host operation it was not granted
 */
class CapabilityDeniedError : public SecurityError {
public:
    CapabilityDeniedError(const std::string& pluginId, const std::string& capability)
        : SecurityError("Plugin '" + pluginId + "' does not have permission: " + capability),
          pluginId_(pluginId),
          capability_(capability) {}

    const std::string& getPluginId() const { return pluginId_; }

    /**
     * @brief Name of the missing capability, e.g. "networkAccess"
     */
    const std::string& getCapability() const { return capability_; }

private:
    std::string pluginId_;
    std::string capability_;
};

/**
 * @brief Base class for denials raised by the sandbox before or during execution
 */
class SandboxPolicyError : public SecurityError {
public:
    SandboxPolicyError(const std::string& pluginId, const std::string& message)
        : SecurityError(message), pluginId_(pluginId) {}

    const std::string& getPluginId() const { return pluginId_; }

private:
    std::string pluginId_;
};

class RateLimitExceededError : public SandboxPolicyError {
public:
    RateLimitExceededError(const std::string& pluginId, int maxRequests, long windowMs)
        : SandboxPolicyError(pluginId,
              "Plugin " + pluginId + " rate limit exceeded (" + std::to_string(maxRequests) +
              " requests per " + std::to_string(windowMs / 1000) + "s)") {}
};

class SandboxTimeoutError : public SandboxPolicyError {
public:
    SandboxTimeoutError(const std::string& pluginId, long timeoutMs)
        : SandboxPolicyError(pluginId,
              "Plugin " + pluginId + " operation timed out after " +
              std::to_string(timeoutMs) + "ms"),
          timeoutMs_(timeoutMs) {}

    long getTimeoutMs() const { return timeoutMs_; }

private:
    long timeoutMs_;
};

/**
 * @brief Thrown when a payload or URL is refused by the execution environment
 */
class PayloadRejectedError : public SandboxPolicyError {
public:
    PayloadRejectedError(const std::string& pluginId, const std::string& message)
        : SandboxPolicyError(pluginId, message) {}
};

/**
 * @brief Thrown when a manifest document cannot be parsed
 */
class ManifestParseError : public SecurityError {
public:
    explicit ManifestParseError(const std::string& message)
        : SecurityError(message) {}
};

} // namespace security
} // namespace plugsec

#endif // PLUGSEC_SECURITY_ERRORS_H
