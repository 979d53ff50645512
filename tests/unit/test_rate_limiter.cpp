#include <gtest/gtest.h>
#include "sandbox/rate_limiter.h"
#include "security/security_errors.h"

using namespace plugsec;
using namespace plugsec::sandbox;

class RateLimiterTest : public ::testing::Test {
protected:
    RateLimiter::Clock clock() {
        return [this]() { return now_; };
    }

    void advance(long ms) {
        now_ += std::chrono::milliseconds(ms);
    }

    std::chrono::steady_clock::time_point now_{std::chrono::hours(1)};
};

TEST_F(RateLimiterTest, InvalidArguments) {
    EXPECT_THROW(RateLimiter(0, std::chrono::milliseconds(1000)), std::invalid_argument);
    EXPECT_THROW(RateLimiter(5, std::chrono::milliseconds(0)), std::invalid_argument);
}

TEST_F(RateLimiterTest, AllowsUpToLimitWithinWindow) {
    RateLimiter limiter(10, std::chrono::milliseconds(60000), clock());

    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(limiter.tryAcquire("amz-1")) << "request " << i;
    }
    EXPECT_FALSE(limiter.tryAcquire("amz-1"));

    // Rejections do not consume the budget
    EXPECT_EQ(10, limiter.getState("amz-1")->count);
}

TEST_F(RateLimiterTest, EnforceThrowsDescriptiveError) {
    RateLimiter limiter(2, std::chrono::milliseconds(60000), clock());
    limiter.enforce("amz-1");
    limiter.enforce("amz-1");

    try {
        limiter.enforce("amz-1");
        FAIL() << "Expected RateLimitExceededError";
    } catch (const security::RateLimitExceededError& e) {
        EXPECT_EQ("Plugin amz-1 rate limit exceeded (2 requests per 60s)", std::string(e.what()));
        EXPECT_EQ("amz-1", e.getPluginId());
    }
}

TEST_F(RateLimiterTest, WindowResetsAtExpiry) {
    RateLimiter limiter(3, std::chrono::milliseconds(1000), clock());
    for (int i = 0; i < 3; ++i) {
        limiter.enforce("amz-1");
    }
    EXPECT_FALSE(limiter.tryAcquire("amz-1"));

    advance(999);
    EXPECT_FALSE(limiter.tryAcquire("amz-1"));

    advance(1);
    EXPECT_TRUE(limiter.tryAcquire("amz-1"));
    auto state = limiter.getState("amz-1");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(1, state->count);
    EXPECT_EQ(now_ + std::chrono::milliseconds(1000), state->windowResetAt);
}

TEST_F(RateLimiterTest, PluginsHaveSeparateBudgets) {
    RateLimiter limiter(1, std::chrono::milliseconds(1000), clock());
    EXPECT_TRUE(limiter.tryAcquire("a"));
    EXPECT_FALSE(limiter.tryAcquire("a"));
    EXPECT_TRUE(limiter.tryAcquire("b"));
}

TEST_F(RateLimiterTest, ResetForgetsState) {
    RateLimiter limiter(1, std::chrono::milliseconds(1000), clock());
    limiter.enforce("amz-1");
    EXPECT_THROW(limiter.enforce("amz-1"), security::RateLimitExceededError);

    limiter.reset("amz-1");
    EXPECT_FALSE(limiter.getState("amz-1").has_value());
    EXPECT_NO_THROW(limiter.enforce("amz-1"));
}

TEST_F(RateLimiterTest, DefaultClockIsSteadyClock) {
    RateLimiter limiter(1, std::chrono::milliseconds(60000));
    EXPECT_TRUE(limiter.tryAcquire("amz-1"));
    EXPECT_FALSE(limiter.tryAcquire("amz-1"));
    EXPECT_EQ(1, limiter.getMaxRequests());
    EXPECT_EQ(std::chrono::milliseconds(60000), limiter.getWindow());
}
