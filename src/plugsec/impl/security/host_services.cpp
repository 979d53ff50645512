#include "security/host_services.h"
#include "utils/log.h"
#include <stdexcept>

namespace plugsec {
namespace security {

nlohmann::json DeviceInfo::toJson() const {
    return nlohmann::json{
        {"userAgent", userAgent},
        {"language", language},
        {"platform", platform},
        {"screen", {{"width", screenWidth}, {"height", screenHeight}}}
    };
}

// ========== InMemoryHostServices ==========

InMemoryHostServices::InMemoryHostServices() {
    deviceInfo_.userAgent = "plugsec";
    deviceInfo_.language = "en-US";
#if defined(_WIN32)
    deviceInfo_.platform = "windows";
#elif defined(__APPLE__)
    deviceInfo_.platform = "macos";
#else
    deviceInfo_.platform = "linux";
#endif
}

void InMemoryHostServices::uploadFile(const std::string& fileName, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    uploads_[fileName] = content;
    LOGD_FMT("Stored upload " << fileName << " (" << content.size() << " bytes)");
}

HttpResponse InMemoryHostServices::fetch(const HttpRequest& request, std::chrono::milliseconds timeout) {
    FetchHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fetchLog_.push_back(request);
        handler = fetchHandler_;
    }
    if (!handler) {
        throw std::runtime_error("No network transport configured for " + request.url);
    }
    return handler(request, timeout);
}

std::optional<std::string> InMemoryHostServices::getStorageItem(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = storage_.find(key);
    if (it == storage_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryHostServices::setStorageItem(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    storage_[key] = value;
}

std::string InMemoryHostServices::getCookieHeader() {
    std::lock_guard<std::mutex> lock(mutex_);
    return cookies_;
}

void InMemoryHostServices::showNotification(const std::string& title, const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    notifications_.push_back({title, body});
}

std::string InMemoryHostServices::readClipboard() {
    std::lock_guard<std::mutex> lock(mutex_);
    return clipboard_;
}

void InMemoryHostServices::writeClipboard(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    clipboard_ = text;
}

DeviceInfo InMemoryHostServices::getDeviceInfo() {
    std::lock_guard<std::mutex> lock(mutex_);
    return deviceInfo_;
}

void InMemoryHostServices::setFetchHandler(FetchHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    fetchHandler_ = std::move(handler);
}

void InMemoryHostServices::setCookieHeader(const std::string& cookies) {
    std::lock_guard<std::mutex> lock(mutex_);
    cookies_ = cookies;
}

void InMemoryHostServices::setDeviceInfo(const DeviceInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    deviceInfo_ = info;
}

std::map<std::string, std::string> InMemoryHostServices::getUploads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploads_;
}

std::map<std::string, std::string> InMemoryHostServices::getStorage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return storage_;
}

std::vector<InMemoryHostServices::Notification> InMemoryHostServices::getNotifications() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notifications_;
}

std::vector<HttpRequest> InMemoryHostServices::getFetchLog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetchLog_;
}

} // namespace security
} // namespace plugsec
