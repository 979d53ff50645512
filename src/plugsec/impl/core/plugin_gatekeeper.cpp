#include "core/plugin_gatekeeper.h"
#include "utils/log.h"
#include <sstream>

namespace plugsec {

namespace {

std::string joinMessages(const std::vector<std::string>& messages) {
    std::ostringstream oss;
    for (size_t i = 0; i < messages.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << messages[i];
    }
    return oss.str();
}

} // anonymous namespace

nlohmann::json PluginIntegrityInfo::toJson() const {
    nlohmann::json checks = nlohmann::json::array();
    for (const auto& check : integrity.checks) {
        checks.push_back(check.toJson());
    }

    return {
        {"pluginId", pluginId},
        {"security", {
            {"level", security::securityLevelToString(validation.securityLevel)},
            {"warnings", validation.warnings},
            {"errors", validation.errors}
        }},
        {"integrity", {
            {"trustScore", integrity.trustScore},
            {"riskLevel", security::riskLevelToString(integrity.riskLevel)},
            {"checks", checks},
            {"recommendations", integrity.recommendations}
        }},
        {"permissions", permissions.toJson()},
        {"report", report.toJson()},
        {"overallStatus", overallStatus}
    };
}

nlohmann::json PluginSecurityInfo::toJson() const {
    return {
        {"pluginId", pluginId},
        {"securityLevel", security::securityLevelToString(securityLevel)},
        {"permissions", permissions.toJson()},
        {"warnings", warnings},
        {"hasIssues", hasIssues}
    };
}

PluginGatekeeper::PluginGatekeeper(const SecurityProperties& props,
                                   std::shared_ptr<security::HostServices> host,
                                   std::shared_ptr<ErrorReporter> reporter,
                                   std::shared_ptr<sandbox::MemoryProbe> memoryProbe,
                                   sandbox::RateLimiter::Clock clock)
    : reporter_(reporterOrDefault(std::move(reporter)))
    , validator_(props)
    , verifier_(props, reporter_)
    , permissions_(props, host)
    , sandbox_(props, reporter_, permissions_.getHostServices(), std::move(memoryProbe), std::move(clock))
{
    LOGI_FMT("PluginGatekeeper initialized ("
             << (props.isProductionMode() ? "production" : "development") << " mode)");
}

// ========== Registration ==========

void PluginGatekeeper::registerPlugin(const PluginManifest& manifest) {
    try {
        runPipeline(manifest);
    } catch (const std::exception& e) {
        reporter_->report(e.what(), report_category::REGISTRATION,
                          {{"pluginId", manifest.id}, {"pluginName", manifest.name}});
        throw;
    }
}

void PluginGatekeeper::runPipeline(const PluginManifest& manifest) {
    const security::ValidationResult validation = validator_.validate(manifest);

    if (!validation.isValid) {
        const std::string message = "Plugin " + manifest.id + " failed security validation: " +
                                    joinMessages(validation.errors);
        reporter_->report(message, report_category::SECURITY_VALIDATION_FAILED, {
            {"pluginId", manifest.id},
            {"securityErrors", validation.errors},
            {"securityWarnings", validation.warnings},
            {"securityLevel", security::securityLevelToString(validation.securityLevel)}
        });
        throw security::SecurityError(message);
    }

    const security::IntegrityCheckResult integrity = verifier_.verify(manifest);

    if (!integrity.isValid) {
        std::ostringstream message;
        message << "Plugin " << manifest.id << " failed integrity verification (trust score: "
                << integrity.trustScore << "%)";

        nlohmann::json failedChecks = nlohmann::json::array();
        for (const auto& check : integrity.checks) {
            if (!check.passed) {
                failedChecks.push_back(check.toJson());
            }
        }
        reporter_->report(message.str(), report_category::INTEGRITY_VALIDATION_FAILED, {
            {"pluginId", manifest.id},
            {"trustScore", integrity.trustScore},
            {"riskLevel", security::riskLevelToString(integrity.riskLevel)},
            {"failedChecks", failedChecks},
            {"recommendations", integrity.recommendations}
        });
        throw security::SecurityError(message.str());
    }

    if (integrity.riskLevel == security::RiskLevel::MEDIUM ||
        integrity.riskLevel == security::RiskLevel::HIGH) {
        LOGW_FMT("Plugin " << manifest.id << " integrity warnings: trust score "
                 << integrity.trustScore << "%, risk "
                 << security::riskLevelToString(integrity.riskLevel)
                 << ", recommendations: " << joinMessages(integrity.recommendations));
    }

    if (!validation.warnings.empty()) {
        LOGW_FMT("Plugin " << manifest.id << " security warnings: " << joinMessages(validation.warnings));
    }

    if (validation.securityLevel == security::SecurityLevel::CRITICAL) {
        throw security::SecurityError("Plugin " + manifest.id +
                                      " has critical security issues and cannot be registered");
    }

    // Grants derived from a previously registered manifest do not carry over
    permissions_.revokeAll(manifest.id);
    permissions_.autoGrant(manifest.id, manifest.capabilities);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool replaced = plugins_.find(manifest.id) != plugins_.end();
        plugins_[manifest.id] = manifest;
        LOGI_FMT("Plugin " << (replaced ? "re-registered: " : "registered: ") << manifest.id
                 << " (" << manifest.name << " " << manifest.version << ")");
    }
}

bool PluginGatekeeper::unregisterPlugin(const std::string& pluginId) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = plugins_.erase(pluginId) > 0;
    }

    if (removed) {
        permissions_.revokeAll(pluginId);
        LOGI_FMT("Plugin unregistered: " << pluginId);
    }
    return removed;
}

bool PluginGatekeeper::isRegistered(const std::string& pluginId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return plugins_.find(pluginId) != plugins_.end();
}

std::optional<PluginManifest> PluginGatekeeper::getPlugin(const std::string& pluginId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = plugins_.find(pluginId);
    if (it == plugins_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> PluginGatekeeper::getPluginIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& entry : plugins_) {
        ids.push_back(entry.first);
    }
    return ids;
}

PluginManifest PluginGatekeeper::requireRegistered(const std::string& pluginId) const {
    auto manifest = getPlugin(pluginId);
    if (!manifest) {
        throw security::SecurityError("Plugin not found: " + pluginId);
    }
    return *manifest;
}

// ========== Inspection ==========

PluginIntegrityInfo PluginGatekeeper::getIntegrityInfo(const std::string& pluginId) const {
    const PluginManifest manifest = requireRegistered(pluginId);

    PluginIntegrityInfo info;
    info.pluginId = pluginId;
    info.validation = validator_.validate(manifest);
    info.integrity = verifier_.verify(manifest);
    info.permissions = permissions_.getPermissions(pluginId);
    info.report = security::IntegrityVerifier::generateReport(info.integrity, pluginId);
    info.overallStatus = info.validation.isValid && info.integrity.isValid ? "SECURE" : "RISKY";
    return info;
}

PluginSecurityInfo PluginGatekeeper::getSecurityInfo(const std::string& pluginId) const {
    const PluginManifest manifest = requireRegistered(pluginId);
    const security::ValidationResult validation = validator_.validate(manifest);

    PluginSecurityInfo info;
    info.pluginId = pluginId;
    info.securityLevel = validation.securityLevel;
    info.permissions = permissions_.getPermissions(pluginId);
    info.warnings = validation.warnings;
    info.hasIssues = !validation.errors.empty() || !validation.warnings.empty();
    return info;
}

} // namespace plugsec
