#include "security/constrained_context.h"
#include "security/security_errors.h"
#include "utils/log.h"
#include <sstream>
#include <stdexcept>

namespace plugsec {
namespace security {

namespace {

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

bool startsWith(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

/**
 * Granted operations: forward to the host with bounds applied
 */
class HostGates : public FileGate, public NetworkGate, public StorageGate,
                  public CookieGate, public NotificationGate, public ClipboardGate,
                  public DeviceInfoGate {
public:
    HostGates(const std::string& pluginId, std::shared_ptr<HostServices> host,
              std::chrono::milliseconds fetchTimeout)
        : pluginId_(pluginId), host_(std::move(host)), fetchTimeout_(fetchTimeout) {}

    void uploadFile(const std::string& fileName, const std::string& content) override {
        host_->uploadFile(fileName, content);
    }

    HttpResponse fetch(const HttpRequest& request) override {
        return host_->fetch(request, fetchTimeout_);
    }

    std::optional<std::string> getItem(const std::string& key) override {
        return host_->getStorageItem(storageKey(key));
    }

    void setItem(const std::string& key, const std::string& value) override {
        host_->setStorageItem(storageKey(key), value);
    }

    std::string getCookies() override {
        std::istringstream stream(host_->getCookieHeader());
        std::string cookie;
        std::ostringstream filtered;
        bool first = true;
        while (std::getline(stream, cookie, ';')) {
            cookie = trim(cookie);
            if (cookie.empty() || startsWith(cookie, "session") || startsWith(cookie, "auth")) {
                continue;
            }
            if (!first) {
                filtered << "; ";
            }
            filtered << cookie;
            first = false;
        }
        return filtered.str();
    }

    void showNotification(const std::string& message) override {
        host_->showNotification("Plugin Notification",
                                message.substr(0, ConstrainedContext::MAX_NOTIFICATION_LENGTH));
    }

    std::string read() override {
        return host_->readClipboard();
    }

    void write(const std::string& text) override {
        host_->writeClipboard(text.substr(0, ConstrainedContext::MAX_CLIPBOARD_LENGTH));
    }

    DeviceInfo getDeviceInfo() override {
        return host_->getDeviceInfo();
    }

private:
    std::string storageKey(const std::string& key) const {
        return "plugin." + pluginId_ + "." + key;
    }

    std::string pluginId_;
    std::shared_ptr<HostServices> host_;
    std::chrono::milliseconds fetchTimeout_;
};

/**
 * Denied operations: every call throws naming the missing capability
 */
class DeniedGates : public FileGate, public NetworkGate, public StorageGate,
                    public CookieGate, public NotificationGate, public ClipboardGate,
                    public DeviceInfoGate {
public:
    DeniedGates(const std::string& pluginId, Capability capability)
        : pluginId_(pluginId), capability_(capabilityToString(capability)) {}

    void uploadFile(const std::string&, const std::string&) override { deny(); }
    HttpResponse fetch(const HttpRequest&) override { deny(); }
    std::optional<std::string> getItem(const std::string&) override { deny(); }
    void setItem(const std::string&, const std::string&) override { deny(); }
    std::string getCookies() override { deny(); }
    void showNotification(const std::string&) override { deny(); }
    std::string read() override { deny(); }
    void write(const std::string&) override { deny(); }
    DeviceInfo getDeviceInfo() override { deny(); }

private:
    [[noreturn]] void deny() const {
        LOGW_FMT("Denied operation for plugin '" << pluginId_ << "': missing " << capability_);
        throw CapabilityDeniedError(pluginId_, capability_);
    }

    std::string pluginId_;
    std::string capability_;
};

template<typename Gate>
std::shared_ptr<Gate> resolve(bool granted, const std::shared_ptr<HostGates>& host,
                              const std::string& pluginId, Capability capability) {
    if (granted) {
        return host;
    }
    return std::make_shared<DeniedGates>(pluginId, capability);
}

} // anonymous namespace

ConstrainedContext ConstrainedContext::build(const std::string& pluginId,
                                             const PluginPermissions& permissions,
                                             std::shared_ptr<HostServices> host,
                                             std::chrono::milliseconds fetchTimeout) {
    if (!host) {
        throw std::invalid_argument("Constrained context requires host services");
    }

    auto hostGates = std::make_shared<HostGates>(pluginId, std::move(host), fetchTimeout);

    ConstrainedContext context;
    context.pluginId_ = pluginId;
    context.permissions_ = permissions;
    context.files_ = resolve<FileGate>(permissions.fileUpload, hostGates, pluginId,
                                       Capability::FILE_UPLOAD);
    context.network_ = resolve<NetworkGate>(permissions.networkAccess, hostGates, pluginId,
                                            Capability::NETWORK_ACCESS);
    context.storage_ = resolve<StorageGate>(permissions.localStorage, hostGates, pluginId,
                                            Capability::LOCAL_STORAGE);
    context.cookies_ = resolve<CookieGate>(permissions.cookies, hostGates, pluginId,
                                           Capability::COOKIES);
    context.notifications_ = resolve<NotificationGate>(permissions.notifications, hostGates, pluginId,
                                                       Capability::NOTIFICATIONS);
    context.clipboard_ = resolve<ClipboardGate>(permissions.clipboard, hostGates, pluginId,
                                                Capability::CLIPBOARD);
    context.deviceInfo_ = resolve<DeviceInfoGate>(permissions.deviceInfo, hostGates, pluginId,
                                                  Capability::DEVICE_INFO);

    LOGD_FMT("Built constrained context for plugin '" << pluginId << "': "
             << permissions.toJson().dump());
    return context;
}

void ConstrainedContext::uploadFile(const std::string& fileName, const std::string& content) {
    files_->uploadFile(fileName, content);
}

HttpResponse ConstrainedContext::fetch(const HttpRequest& request) {
    return network_->fetch(request);
}

std::optional<std::string> ConstrainedContext::getLocalStorage(const std::string& key) {
    return storage_->getItem(key);
}

void ConstrainedContext::setLocalStorage(const std::string& key, const std::string& value) {
    storage_->setItem(key, value);
}

std::string ConstrainedContext::getCookies() {
    return cookies_->getCookies();
}

void ConstrainedContext::showNotification(const std::string& message) {
    notifications_->showNotification(message);
}

std::string ConstrainedContext::readClipboard() {
    return clipboard_->read();
}

void ConstrainedContext::writeClipboard(const std::string& text) {
    clipboard_->write(text);
}

DeviceInfo ConstrainedContext::getDeviceInfo() {
    return deviceInfo_->getDeviceInfo();
}

} // namespace security
} // namespace plugsec
