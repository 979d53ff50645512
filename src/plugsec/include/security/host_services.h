#ifndef PLUGSEC_HOST_SERVICES_H
#define PLUGSEC_HOST_SERVICES_H

#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace plugsec {
namespace security {

/**
 * @brief Outbound HTTP request issued on behalf of a plugin
 */
struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;
};

/**
 * @brief Snapshot of host device properties exposed to plugins
 */
struct DeviceInfo {
    std::string userAgent;
    std::string language;
    std::string platform;
    int screenWidth = 0;
    int screenHeight = 0;

    nlohmann::json toJson() const;
};

/**
 * @brief Raw host capabilities
 *
 * The unrestricted implementations of every sensitive operation.
 * Plugins never see this interface directly; ConstrainedContext wraps
 * it with permission gates and bounds.
 */
class HostServices {
public:
    virtual ~HostServices() = default;

    virtual void uploadFile(const std::string& fileName, const std::string& content) = 0;

    /**
     * @brief Perform an HTTP request
     * @param timeout Upper bound enforced by the transport
     */
    virtual HttpResponse fetch(const HttpRequest& request, std::chrono::milliseconds timeout) = 0;

    virtual std::optional<std::string> getStorageItem(const std::string& key) = 0;
    virtual void setStorageItem(const std::string& key, const std::string& value) = 0;

    /**
     * @brief Raw cookie header, e.g. "theme=dark; session_id=abc"
     */
    virtual std::string getCookieHeader() = 0;

    virtual void showNotification(const std::string& title, const std::string& body) = 0;

    virtual std::string readClipboard() = 0;
    virtual void writeClipboard(const std::string& text) = 0;

    virtual DeviceInfo getDeviceInfo() = 0;
};

/**
 * @brief Process-local HostServices backed by in-memory state
 *
 * Used when the embedding application supplies no host bindings, and
 * by tests. fetch() delegates to a handler; without one it throws.
 */
class InMemoryHostServices : public HostServices {
public:
    using FetchHandler = std::function<HttpResponse(const HttpRequest&, std::chrono::milliseconds)>;

    struct Notification {
        std::string title;
        std::string body;
    };

    InMemoryHostServices();

    void uploadFile(const std::string& fileName, const std::string& content) override;
    HttpResponse fetch(const HttpRequest& request, std::chrono::milliseconds timeout) override;
    std::optional<std::string> getStorageItem(const std::string& key) override;
    void setStorageItem(const std::string& key, const std::string& value) override;
    std::string getCookieHeader() override;
    void showNotification(const std::string& title, const std::string& body) override;
    std::string readClipboard() override;
    void writeClipboard(const std::string& text) override;
    DeviceInfo getDeviceInfo() override;

    void setFetchHandler(FetchHandler handler);
    void setCookieHeader(const std::string& cookies);
    void setDeviceInfo(const DeviceInfo& info);

    std::map<std::string, std::string> getUploads() const;
    std::map<std::string, std::string> getStorage() const;
    std::vector<Notification> getNotifications() const;
    std::vector<HttpRequest> getFetchLog() const;

private:
    mutable std::mutex mutex_;
    FetchHandler fetchHandler_;
    std::map<std::string, std::string> uploads_;
    std::map<std::string, std::string> storage_;
    std::vector<Notification> notifications_;
    std::vector<HttpRequest> fetchLog_;
    std::string cookies_;
    std::string clipboard_;
    DeviceInfo deviceInfo_;
};

} // namespace security
} // namespace plugsec

#endif // PLUGSEC_HOST_SERVICES_H
