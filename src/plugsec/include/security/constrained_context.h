#ifndef PLUGSEC_CONSTRAINED_CONTEXT_H
#define PLUGSEC_CONSTRAINED_CONTEXT_H

#include "security/host_services.h"
#include "security/permission_types.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace plugsec {
namespace security {

// ========== Capability gates ==========
//
// One interface per capability group. For each group the context holds
// either a bounded implementation forwarding to HostServices or a
// denied implementation throwing CapabilityDeniedError. The choice is
// made once in ConstrainedContext::build().

class FileGate {
public:
    virtual ~FileGate() = default;
    virtual void uploadFile(const std::string& fileName, const std::string& content) = 0;
};

class NetworkGate {
public:
    virtual ~NetworkGate() = default;
    virtual HttpResponse fetch(const HttpRequest& request) = 0;
};

class StorageGate {
public:
    virtual ~StorageGate() = default;
    virtual std::optional<std::string> getItem(const std::string& key) = 0;
    virtual void setItem(const std::string& key, const std::string& value) = 0;
};

class CookieGate {
public:
    virtual ~CookieGate() = default;
    virtual std::string getCookies() = 0;
};

class NotificationGate {
public:
    virtual ~NotificationGate() = default;
    virtual void showNotification(const std::string& message) = 0;
};

class ClipboardGate {
public:
    virtual ~ClipboardGate() = default;
    virtual std::string read() = 0;
    virtual void write(const std::string& text) = 0;
};

class DeviceInfoGate {
public:
    virtual ~DeviceInfoGate() = default;
    virtual DeviceInfo getDeviceInfo() = 0;
};

/**
 * @class ConstrainedContext
 * @brief Capability-gated facade handed to plugin code
 *
 * Built from a permission snapshot; later grants or revocations do not
 * affect an existing context. Every call is a single virtual dispatch,
 * with no policy lookup at call time.
 *
 * Bounds applied to granted operations:
 * - storage keys are namespaced as "plugin.<pluginId>.<key>"
 * - cookies whose name starts with "session" or "auth" are removed
 * - notification text is truncated to 100 characters
 * - clipboard writes are truncated to 1000 characters
 * - fetch runs with the configured timeout
 *
 * Denied operations throw CapabilityDeniedError naming the capability.
 */
class ConstrainedContext {
public:
    static constexpr size_t MAX_NOTIFICATION_LENGTH = 100;
    static constexpr size_t MAX_CLIPBOARD_LENGTH = 1000;

    /**
     * @brief Resolve every gate from a permission snapshot
     * @throws std::invalid_argument if host is null
     */
    static ConstrainedContext build(const std::string& pluginId,
                                    const PluginPermissions& permissions,
                                    std::shared_ptr<HostServices> host,
                                    std::chrono::milliseconds fetchTimeout);

    const std::string& getPluginId() const { return pluginId_; }
    const PluginPermissions& getPermissions() const { return permissions_; }

    void uploadFile(const std::string& fileName, const std::string& content);
    HttpResponse fetch(const HttpRequest& request);
    std::optional<std::string> getLocalStorage(const std::string& key);
    void setLocalStorage(const std::string& key, const std::string& value);
    std::string getCookies();
    void showNotification(const std::string& message);
    std::string readClipboard();
    void writeClipboard(const std::string& text);
    DeviceInfo getDeviceInfo();

private:
    ConstrainedContext() = default;

    std::string pluginId_;
    PluginPermissions permissions_;
    std::shared_ptr<FileGate> files_;
    std::shared_ptr<NetworkGate> network_;
    std::shared_ptr<StorageGate> storage_;
    std::shared_ptr<CookieGate> cookies_;
    std::shared_ptr<NotificationGate> notifications_;
    std::shared_ptr<ClipboardGate> clipboard_;
    std::shared_ptr<DeviceInfoGate> deviceInfo_;
};

} // namespace security
} // namespace plugsec

#endif // PLUGSEC_CONSTRAINED_CONTEXT_H
