#ifndef PLUGSEC_PERMISSION_TYPES_H
#define PLUGSEC_PERMISSION_TYPES_H

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace plugsec {
namespace security {

/**
 * @enum Capability
 * @brief Host capabilities a plugin can be granted
 */
enum class Capability {
    FILE_UPLOAD,       ///< "fileUpload"
    NETWORK_ACCESS,    ///< "networkAccess"
    LOCAL_STORAGE,     ///< "localStorage"
    COOKIES,           ///< "cookies"
    NOTIFICATIONS,     ///< "notifications"
    CLIPBOARD,         ///< "clipboard"
    CAMERA,            ///< "camera"
    MICROPHONE,        ///< "microphone"
    LOCATION,          ///< "location"
    DEVICE_INFO        ///< "deviceInfo"
};

/**
 * @enum OperationKind
 * @brief Sensitive operations gated by checkOperation()
 */
enum class OperationKind {
    FILE_UPLOAD,        ///< "fileUpload" -> fileUpload
    NETWORK_REQUEST,    ///< "networkRequest" -> networkAccess
    LOCAL_STORAGE,      ///< "localStorage" -> localStorage
    SHOW_NOTIFICATION,  ///< "showNotification" -> notifications
    CLIPBOARD_ACCESS,   ///< "clipboardAccess" -> clipboard
    DEVICE_INFO         ///< "deviceInfo" -> deviceInfo
};

/**
 * @brief Capability name as used in grants and error messages ("networkAccess")
 */
std::string capabilityToString(Capability capability);

/**
 * @throws std::invalid_argument if the name is not a capability
 */
Capability stringToCapability(const std::string& str);

/**
 * @brief All capabilities in declaration order
 */
const std::vector<Capability>& allCapabilities();

std::string operationKindToString(OperationKind operation);

/**
 * @throws std::invalid_argument if the name is not an operation kind
 */
OperationKind stringToOperationKind(const std::string& str);

/**
 * @brief Capabilities an operation needs
 */
std::vector<Capability> requiredCapabilities(OperationKind operation);

/**
 * @brief Partial permission update, applied on top of the existing record
 */
using PermissionGrant = std::map<Capability, bool>;

/**
 * @struct PluginPermissions
 * @brief Fixed record of capability flags for one plugin
 *
 * A default constructed record is the secure default: fileUpload only.
 */
struct PluginPermissions {
    bool fileUpload = true;
    bool networkAccess = false;
    bool localStorage = false;
    bool cookies = false;
    bool notifications = false;
    bool clipboard = false;
    bool camera = false;
    bool microphone = false;
    bool location = false;
    bool deviceInfo = false;

    bool get(Capability capability) const;
    void set(Capability capability, bool enabled);

    /**
     * @brief Overwrite the flags named in grant, leave others untouched
     */
    void apply(const PermissionGrant& grant);

    nlohmann::json toJson() const;

    bool operator==(const PluginPermissions& other) const;
    bool operator!=(const PluginPermissions& other) const;
};

/**
 * @struct PermissionCheckResult
 * @brief Answer to "may this plugin perform this operation?"
 */
struct PermissionCheckResult {
    bool allowed = false;
    std::vector<std::string> missingCapabilities;
    std::string operation;
    std::string pluginId;
    bool unknownOperation = false;   ///< operation name was not recognized

    nlohmann::json toJson() const;
};

} // namespace security
} // namespace plugsec

#endif // PLUGSEC_PERMISSION_TYPES_H
