#ifndef PLUGSEC_PERMISSION_MANAGER_H
#define PLUGSEC_PERMISSION_MANAGER_H

#include "core/security_properties.h"
#include "manifest/plugin_manifest.h"
#include "security/constrained_context.h"
#include "security/host_services.h"
#include "security/permission_types.h"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace plugsec {
namespace security {

/**
 * @class PermissionManager
 * @brief Capability store and constrained-context factory, keyed by plugin id
 *
 * Every plugin conceptually has a permission record. Plugins without a
 * stored record use the secure default (fileUpload only), so lookups
 * never fail.
 *
 * Thread-safe for concurrent access. Each instance owns its own store;
 * independent subsystems can run side by side.
 */
class PermissionManager {
public:
    /**
     * @param props Reads PROP_ALLOW_UNKNOWN_OPERATIONS and PROP_FETCH_TIMEOUT_MS
     * @param host Host bindings used by constrained contexts; an
     *             InMemoryHostServices is created when null
     */
    explicit PermissionManager(const SecurityProperties& props = SecurityProperties(),
                               std::shared_ptr<HostServices> host = nullptr);

    PermissionManager(const PermissionManager&) = delete;
    PermissionManager& operator=(const PermissionManager&) = delete;

    /**
     * @brief Merge a partial grant into the plugin's record
     *
     * Starts from the default record when none exists. Capabilities not
     * named in the grant keep their current value.
     */
    void grant(const std::string& pluginId, const PermissionGrant& permissions);

    /**
     * @brief Stored value of a capability, or the default when no record exists
     */
    bool has(const std::string& pluginId, Capability capability) const;

    /**
     * @brief Copy of the plugin's record, or the default record
     */
    PluginPermissions getPermissions(const std::string& pluginId) const;

    /**
     * @brief Drop the stored record; later lookups see the default
     */
    void revokeAll(const std::string& pluginId);

    /**
     * @brief Report which capabilities an operation is missing
     */
    PermissionCheckResult checkOperation(const std::string& pluginId, OperationKind operation) const;

    /**
     * @brief checkOperation() for an operation given by name
     *
     * Unknown names are denied with unknownOperation set, unless
     * PROP_ALLOW_UNKNOWN_OPERATIONS is true, in which case they need
     * no capability and are allowed.
     */
    PermissionCheckResult checkOperation(const std::string& pluginId, const std::string& operation) const;

    /**
     * @brief Derive grants from the capabilities a manifest declares
     *
     * - fileUpload is always granted
     * - networkAccess when the manifest declares fileUpload or manualEntry
     * - notifications when the manifest declares fileUpload or batchProcessing
     */
    void autoGrant(const std::string& pluginId, const ManifestCapabilities& declared);

    /**
     * @brief Build a context gated by the plugin's current permissions
     */
    ConstrainedContext buildConstrainedContext(const std::string& pluginId) const;

    /**
     * @brief Ids with a stored record
     */
    std::vector<std::string> getPluginIds() const;

    bool hasRecord(const std::string& pluginId) const;

    std::shared_ptr<HostServices> getHostServices() const { return host_; }

private:
    mutable std::mutex mutex_;
    std::map<std::string, PluginPermissions> permissions_;
    std::shared_ptr<HostServices> host_;
    bool allowUnknownOperations_;
    std::chrono::milliseconds fetchTimeout_;
};

} // namespace security
} // namespace plugsec

#endif // PLUGSEC_PERMISSION_MANAGER_H
