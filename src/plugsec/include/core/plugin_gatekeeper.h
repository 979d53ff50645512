#ifndef PLUGSEC_PLUGIN_GATEKEEPER_H
#define PLUGSEC_PLUGIN_GATEKEEPER_H

#include "core/error_reporter.h"
#include "core/security_properties.h"
#include "manifest/plugin_manifest.h"
#include "sandbox/sandbox_executor.h"
#include "security/config_validator.h"
#include "security/host_services.h"
#include "security/integrity_verifier.h"
#include "security/permission_manager.h"
#include "security/security_errors.h"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace plugsec {

/**
 * @brief Combined view of a registered plugin's security posture
 */
struct PluginIntegrityInfo {
    std::string pluginId;
    security::ValidationResult validation;
    security::IntegrityCheckResult integrity;
    security::PluginPermissions permissions;
    security::IntegrityReport report;
    std::string overallStatus;  ///< "SECURE" when both stages pass, else "RISKY"

    nlohmann::json toJson() const;
};

/**
 * @brief Short security summary of a registered plugin
 */
struct PluginSecurityInfo {
    std::string pluginId;
    security::SecurityLevel securityLevel;
    security::PluginPermissions permissions;
    std::vector<std::string> warnings;
    bool hasIssues;

    nlohmann::json toJson() const;
};

/**
 * @class PluginGatekeeper
 * @brief Registration entry point running the full security pipeline
 *
 * Owns one instance of each stage. A manifest is accepted only when:
 * - ConfigValidator reports it valid and not critical
 * - IntegrityVerifier reports a trust score at or above the threshold
 *
 * Accepted plugins get their capabilities auto-granted and may then
 * run operations through the sandbox.
 *
 * Thread-safe.
 */
class PluginGatekeeper {
public:
    /**
     * @param props Configuration shared by every stage
     * @param host Host bindings for constrained contexts and isolated environments
     * @param reporter Error sink; LoggingErrorReporter when null
     * @param memoryProbe Memory snapshot source for the sandbox
     * @param clock Time source for the sandbox rate limiter
     */
    explicit PluginGatekeeper(const SecurityProperties& props = SecurityProperties(),
                              std::shared_ptr<security::HostServices> host = nullptr,
                              std::shared_ptr<ErrorReporter> reporter = nullptr,
                              std::shared_ptr<sandbox::MemoryProbe> memoryProbe = nullptr,
                              sandbox::RateLimiter::Clock clock = sandbox::RateLimiter::Clock());

    PluginGatekeeper(const PluginGatekeeper&) = delete;
    PluginGatekeeper& operator=(const PluginGatekeeper&) = delete;

    /**
     * @brief Validate, verify, grant and store a plugin
     *
     * Re-registering an id replaces the stored manifest.
     *
     * @throws security::SecurityError when validation or verification fails
     */
    void registerPlugin(const PluginManifest& manifest);

    /**
     * @brief Remove a plugin and revoke its grants
     * @return true if the plugin was registered
     */
    bool unregisterPlugin(const std::string& pluginId);

    bool isRegistered(const std::string& pluginId) const;

    std::optional<PluginManifest> getPlugin(const std::string& pluginId) const;

    std::vector<std::string> getPluginIds() const;

    /**
     * @brief Run an operation for a registered plugin inside the sandbox
     * @throws security::SecurityError "Plugin not found: <id>" for unknown plugins
     */
    template<typename F>
    auto executePluginOperation(const std::string& pluginId, F operation,
                                const sandbox::SandboxOptions& options = sandbox::SandboxOptions())
        -> typename std::invoke_result<F, sandbox::CancellationToken&>::type
    {
        requireRegistered(pluginId);
        return sandbox_.execute(pluginId, std::move(operation), options);
    }

    /**
     * @brief Re-run both stages for a registered plugin
     * @throws security::SecurityError for unknown plugins
     */
    PluginIntegrityInfo getIntegrityInfo(const std::string& pluginId) const;

    /**
     * @throws security::SecurityError for unknown plugins
     */
    PluginSecurityInfo getSecurityInfo(const std::string& pluginId) const;

    security::ConfigValidator& getValidator() { return validator_; }
    security::IntegrityVerifier& getVerifier() { return verifier_; }
    security::PermissionManager& getPermissionManager() { return permissions_; }
    sandbox::SandboxExecutor& getSandbox() { return sandbox_; }

private:
    void runPipeline(const PluginManifest& manifest);
    PluginManifest requireRegistered(const std::string& pluginId) const;

    std::shared_ptr<ErrorReporter> reporter_;
    security::ConfigValidator validator_;
    security::IntegrityVerifier verifier_;
    security::PermissionManager permissions_;
    sandbox::SandboxExecutor sandbox_;

    mutable std::mutex mutex_;
    std::map<std::string, PluginManifest> plugins_;
};

} // namespace plugsec

#endif // PLUGSEC_PLUGIN_GATEKEEPER_H
