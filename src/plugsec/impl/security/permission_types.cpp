#include "security/permission_types.h"
#include "utils/log.h"
#include <stdexcept>

namespace plugsec {
namespace security {

// ========== Capability ==========

std::string capabilityToString(Capability capability) {
    switch (capability) {
        case Capability::FILE_UPLOAD: return "fileUpload";
        case Capability::NETWORK_ACCESS: return "networkAccess";
        case Capability::LOCAL_STORAGE: return "localStorage";
        case Capability::COOKIES: return "cookies";
        case Capability::NOTIFICATIONS: return "notifications";
        case Capability::CLIPBOARD: return "clipboard";
        case Capability::CAMERA: return "camera";
        case Capability::MICROPHONE: return "microphone";
        case Capability::LOCATION: return "location";
        case Capability::DEVICE_INFO: return "deviceInfo";
        default: return "unknown";
    }
}

Capability stringToCapability(const std::string& str) {
    if (str == "fileUpload") return Capability::FILE_UPLOAD;
    if (str == "networkAccess") return Capability::NETWORK_ACCESS;
    if (str == "localStorage") return Capability::LOCAL_STORAGE;
    if (str == "cookies") return Capability::COOKIES;
    if (str == "notifications") return Capability::NOTIFICATIONS;
    if (str == "clipboard") return Capability::CLIPBOARD;
    if (str == "camera") return Capability::CAMERA;
    if (str == "microphone") return Capability::MICROPHONE;
    if (str == "location") return Capability::LOCATION;
    if (str == "deviceInfo") return Capability::DEVICE_INFO;
    LOGE_FMT("Invalid capability: " << str);
    throw std::invalid_argument("Invalid capability: " + str);
}

const std::vector<Capability>& allCapabilities() {
    static const std::vector<Capability> capabilities = {
        Capability::FILE_UPLOAD, Capability::NETWORK_ACCESS, Capability::LOCAL_STORAGE,
        Capability::COOKIES, Capability::NOTIFICATIONS, Capability::CLIPBOARD,
        Capability::CAMERA, Capability::MICROPHONE, Capability::LOCATION,
        Capability::DEVICE_INFO
    };
    return capabilities;
}

// ========== OperationKind ==========

std::string operationKindToString(OperationKind operation) {
    switch (operation) {
        case OperationKind::FILE_UPLOAD: return "fileUpload";
        case OperationKind::NETWORK_REQUEST: return "networkRequest";
        case OperationKind::LOCAL_STORAGE: return "localStorage";
        case OperationKind::SHOW_NOTIFICATION: return "showNotification";
        case OperationKind::CLIPBOARD_ACCESS: return "clipboardAccess";
        case OperationKind::DEVICE_INFO: return "deviceInfo";
        default: return "unknown";
    }
}

OperationKind stringToOperationKind(const std::string& str) {
    if (str == "fileUpload") return OperationKind::FILE_UPLOAD;
    if (str == "networkRequest") return OperationKind::NETWORK_REQUEST;
    if (str == "localStorage") return OperationKind::LOCAL_STORAGE;
    if (str == "showNotification") return OperationKind::SHOW_NOTIFICATION;
    if (str == "clipboardAccess") return OperationKind::CLIPBOARD_ACCESS;
    if (str == "deviceInfo") return OperationKind::DEVICE_INFO;
    throw std::invalid_argument("Invalid operation kind: " + str);
}

std::vector<Capability> requiredCapabilities(OperationKind operation) {
    switch (operation) {
        case OperationKind::FILE_UPLOAD: return {Capability::FILE_UPLOAD};
        case OperationKind::NETWORK_REQUEST: return {Capability::NETWORK_ACCESS};
        case OperationKind::LOCAL_STORAGE: return {Capability::LOCAL_STORAGE};
        case OperationKind::SHOW_NOTIFICATION: return {Capability::NOTIFICATIONS};
        case OperationKind::CLIPBOARD_ACCESS: return {Capability::CLIPBOARD};
        case OperationKind::DEVICE_INFO: return {Capability::DEVICE_INFO};
        default: return {};
    }
}

// ========== PluginPermissions ==========

bool PluginPermissions::get(Capability capability) const {
    switch (capability) {
        case Capability::FILE_UPLOAD: return fileUpload;
        case Capability::NETWORK_ACCESS: return networkAccess;
        case Capability::LOCAL_STORAGE: return localStorage;
        case Capability::COOKIES: return cookies;
        case Capability::NOTIFICATIONS: return notifications;
        case Capability::CLIPBOARD: return clipboard;
        case Capability::CAMERA: return camera;
        case Capability::MICROPHONE: return microphone;
        case Capability::LOCATION: return location;
        case Capability::DEVICE_INFO: return deviceInfo;
        default: return false;
    }
}

void PluginPermissions::set(Capability capability, bool enabled) {
    switch (capability) {
        case Capability::FILE_UPLOAD: fileUpload = enabled; break;
        case Capability::NETWORK_ACCESS: networkAccess = enabled; break;
        case Capability::LOCAL_STORAGE: localStorage = enabled; break;
        case Capability::COOKIES: cookies = enabled; break;
        case Capability::NOTIFICATIONS: notifications = enabled; break;
        case Capability::CLIPBOARD: clipboard = enabled; break;
        case Capability::CAMERA: camera = enabled; break;
        case Capability::MICROPHONE: microphone = enabled; break;
        case Capability::LOCATION: location = enabled; break;
        case Capability::DEVICE_INFO: deviceInfo = enabled; break;
    }
}

void PluginPermissions::apply(const PermissionGrant& grant) {
    for (const auto& entry : grant) {
        set(entry.first, entry.second);
    }
}

nlohmann::json PluginPermissions::toJson() const {
    nlohmann::json json = nlohmann::json::object();
    for (Capability capability : allCapabilities()) {
        json[capabilityToString(capability)] = get(capability);
    }
    return json;
}

bool PluginPermissions::operator==(const PluginPermissions& other) const {
    for (Capability capability : allCapabilities()) {
        if (get(capability) != other.get(capability)) {
            return false;
        }
    }
    return true;
}

bool PluginPermissions::operator!=(const PluginPermissions& other) const {
    return !(*this == other);
}

// ========== PermissionCheckResult ==========

nlohmann::json PermissionCheckResult::toJson() const {
    return nlohmann::json{
        {"allowed", allowed},
        {"missingCapabilities", missingCapabilities},
        {"operation", operation},
        {"pluginId", pluginId},
        {"unknownOperation", unknownOperation}
    };
}

} // namespace security
} // namespace plugsec
