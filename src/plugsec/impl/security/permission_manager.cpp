#include "security/permission_manager.h"
#include "utils/log.h"
#include <stdexcept>

namespace plugsec {
namespace security {

PermissionManager::PermissionManager(const SecurityProperties& props,
                                     std::shared_ptr<HostServices> host)
    : host_(host ? std::move(host) : std::make_shared<InMemoryHostServices>())
    , allowUnknownOperations_(props.isAllowUnknownOperations())
    , fetchTimeout_(std::chrono::milliseconds(props.getFetchTimeoutMs()))
{
    LOGD_FMT("PermissionManager initialized (unknown operations "
             << (allowUnknownOperations_ ? "allowed" : "denied") << ")");
}

void PermissionManager::grant(const std::string& pluginId, const PermissionGrant& permissions) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Creates the default record when absent
    PluginPermissions& record = permissions_[pluginId];
    record.apply(permissions);

    LOGI_FMT("Updated permissions for plugin " << pluginId << ": " << record.toJson().dump());
}

bool PermissionManager::has(const std::string& pluginId, Capability capability) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = permissions_.find(pluginId);
    if (it == permissions_.end()) {
        return PluginPermissions().get(capability);
    }
    return it->second.get(capability);
}

PluginPermissions PermissionManager::getPermissions(const std::string& pluginId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = permissions_.find(pluginId);
    if (it == permissions_.end()) {
        return PluginPermissions();
    }
    return it->second;
}

void PermissionManager::revokeAll(const std::string& pluginId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (permissions_.erase(pluginId) > 0) {
        LOGI_FMT("Revoked all permissions for plugin " << pluginId);
    }
}

PermissionCheckResult PermissionManager::checkOperation(const std::string& pluginId,
                                                        OperationKind operation) const {
    PluginPermissions permissions = getPermissions(pluginId);

    PermissionCheckResult result;
    result.pluginId = pluginId;
    result.operation = operationKindToString(operation);

    for (Capability capability : requiredCapabilities(operation)) {
        if (!permissions.get(capability)) {
            result.missingCapabilities.push_back(capabilityToString(capability));
        }
    }
    result.allowed = result.missingCapabilities.empty();

    if (!result.allowed) {
        LOGD_FMT("Plugin " << pluginId << " lacks capabilities for " << result.operation);
    }
    return result;
}

PermissionCheckResult PermissionManager::checkOperation(const std::string& pluginId,
                                                        const std::string& operation) const {
    OperationKind kind;
    try {
        kind = stringToOperationKind(operation);
    } catch (const std::invalid_argument&) {
        PermissionCheckResult result;
        result.pluginId = pluginId;
        result.operation = operation;
        result.unknownOperation = true;
        result.allowed = allowUnknownOperations_;
        LOGW_FMT("Unknown operation '" << operation << "' requested by plugin " << pluginId
                 << (allowUnknownOperations_ ? ", allowed by configuration" : ", denied"));
        return result;
    }
    return checkOperation(pluginId, kind);
}

void PermissionManager::autoGrant(const std::string& pluginId, const ManifestCapabilities& declared) {
    PermissionGrant permissions;
    permissions[Capability::FILE_UPLOAD] = true;

    // Declared endpoints are reached over the network
    if (declared.fileUpload() || declared.manualEntry()) {
        permissions[Capability::NETWORK_ACCESS] = true;
    }

    // Progress feedback for uploads and batches
    if (declared.fileUpload() || declared.batchProcessing()) {
        permissions[Capability::NOTIFICATIONS] = true;
    }

    grant(pluginId, permissions);
}

ConstrainedContext PermissionManager::buildConstrainedContext(const std::string& pluginId) const {
    return ConstrainedContext::build(pluginId, getPermissions(pluginId), host_, fetchTimeout_);
}

std::vector<std::string> PermissionManager::getPluginIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(permissions_.size());
    for (const auto& entry : permissions_) {
        ids.push_back(entry.first);
    }
    return ids;
}

bool PermissionManager::hasRecord(const std::string& pluginId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return permissions_.find(pluginId) != permissions_.end();
}

} // namespace security
} // namespace plugsec
