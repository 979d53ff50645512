#include "sandbox/rate_limiter.h"
#include "security/security_errors.h"
#include "utils/log.h"
#include <stdexcept>

namespace plugsec {
namespace sandbox {

RateLimiter::RateLimiter(int maxRequests, std::chrono::milliseconds window, Clock clock)
    : maxRequests_(maxRequests)
    , window_(window)
    , clock_(clock ? std::move(clock) : Clock([]() { return std::chrono::steady_clock::now(); }))
{
    if (maxRequests_ < 1) {
        throw std::invalid_argument("Rate limit must allow at least one request");
    }
    if (window_.count() <= 0) {
        throw std::invalid_argument("Rate limit window must be positive");
    }
}

bool RateLimiter::tryAcquire(const std::string& pluginId) {
    const auto now = clock_();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(pluginId);

    if (it == states_.end() || now >= it->second.windowResetAt) {
        RateLimitState& state = states_[pluginId];
        state.count = 1;
        state.windowResetAt = now + window_;
        return true;
    }

    if (it->second.count >= maxRequests_) {
        return false;
    }

    it->second.count++;
    return true;
}

void RateLimiter::enforce(const std::string& pluginId) {
    if (!tryAcquire(pluginId)) {
        LOGW_FMT("Rate limit exceeded for plugin " << pluginId);
        throw security::RateLimitExceededError(pluginId, maxRequests_,
                                               static_cast<long>(window_.count()));
    }
}

void RateLimiter::reset(const std::string& pluginId) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.erase(pluginId);
}

std::optional<RateLimitState> RateLimiter::getState(const std::string& pluginId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(pluginId);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace sandbox
} // namespace plugsec
