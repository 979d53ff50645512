#ifndef PLUGSEC_RATE_LIMITER_H
#define PLUGSEC_RATE_LIMITER_H

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace plugsec {
namespace sandbox {

/**
 * @brief Per-plugin fixed-window counter
 */
struct RateLimitState {
    int count = 0;
    std::chrono::steady_clock::time_point windowResetAt;
};

/**
 * @class RateLimiter
 * @brief Fixed-window request limiter keyed by plugin id
 *
 * The first call, or the first call at or after windowResetAt, opens a
 * new window with count 1. Within a window each call increments the
 * count; a call that would exceed the ceiling is rejected and does not
 * change the state.
 *
 * All state updates happen under one lock, so concurrent calls for the
 * same plugin never lose increments.
 */
class RateLimiter {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    /**
     * @param maxRequests Ceiling per window
     * @param window Window length
     * @param clock Time source; steady_clock::now when empty
     * @throws std::invalid_argument if maxRequests < 1 or window is not positive
     */
    RateLimiter(int maxRequests, std::chrono::milliseconds window, Clock clock = Clock());

    /**
     * @brief Count one request
     * @return false if the ceiling is exceeded
     */
    bool tryAcquire(const std::string& pluginId);

    /**
     * @brief tryAcquire() that throws on rejection
     * @throws security::RateLimitExceededError
     */
    void enforce(const std::string& pluginId);

    /**
     * @brief Forget a plugin's window
     */
    void reset(const std::string& pluginId);

    std::optional<RateLimitState> getState(const std::string& pluginId) const;

    int getMaxRequests() const { return maxRequests_; }
    std::chrono::milliseconds getWindow() const { return window_; }

private:
    const int maxRequests_;
    const std::chrono::milliseconds window_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::map<std::string, RateLimitState> states_;
};

} // namespace sandbox
} // namespace plugsec

#endif // PLUGSEC_RATE_LIMITER_H
