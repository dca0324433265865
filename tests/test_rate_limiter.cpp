//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_rate_limiter.cpp
// Purpose: GoogleTests for the sliding-window RateLimiter using an injected clock
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>

#include "mcpgate/security/RateLimiter.hpp"

using namespace mcpgate::security;
using namespace std::chrono;

namespace {

//==========================================================================================================
// FakeClock
// Purpose: Manually advanced steady clock for window arithmetic.
//==========================================================================================================
struct FakeClock {
    RateLimiter::Clock::time_point t{RateLimiter::Clock::time_point{} + hours(1)};
    RateLimiter::NowFn fn() {
        return [this]() { return t; };
    }
};

} // namespace

TEST(RateLimiter, ThreePerMinute_FourthRefused) {
    FakeClock clock;
    RateLimiter limiter(3, seconds(60), clock.fn());
    EXPECT_TRUE(limiter.IsAllowed("10.0.0.1"));
    EXPECT_TRUE(limiter.IsAllowed("10.0.0.1"));
    EXPECT_TRUE(limiter.IsAllowed("10.0.0.1"));
    EXPECT_FALSE(limiter.IsAllowed("10.0.0.1"));
    EXPECT_EQ(limiter.GetRemainingRequests("10.0.0.1"), 0u);
}

TEST(RateLimiter, WindowSlidesAfterExpiry) {
    FakeClock clock;
    RateLimiter limiter(3, seconds(60), clock.fn());
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(limiter.IsAllowed("k"));
    }
    ASSERT_FALSE(limiter.IsAllowed("k"));
    clock.t += seconds(61);
    EXPECT_TRUE(limiter.IsAllowed("k"));
    EXPECT_EQ(limiter.GetRemainingRequests("k"), 2u);
}

TEST(RateLimiter, PartialSlideFreesOnlyExpiredSlots) {
    FakeClock clock;
    RateLimiter limiter(2, seconds(10), clock.fn());
    ASSERT_TRUE(limiter.IsAllowed("k"));
    clock.t += seconds(6);
    ASSERT_TRUE(limiter.IsAllowed("k"));
    ASSERT_FALSE(limiter.IsAllowed("k"));
    clock.t += seconds(5);
    // First entry is 11s old and no longer counts; the second still does.
    EXPECT_TRUE(limiter.IsAllowed("k"));
    EXPECT_FALSE(limiter.IsAllowed("k"));
}

TEST(RateLimiter, EntryExactlyOneWindowOldStillCounts) {
    FakeClock clock;
    RateLimiter limiter(1, seconds(60), clock.fn());
    ASSERT_TRUE(limiter.IsAllowed("k"));
    clock.t += seconds(60);
    EXPECT_FALSE(limiter.IsAllowed("k"));
    EXPECT_EQ(limiter.GetRemainingRequests("k"), 0u);
    clock.t += seconds(1);
    EXPECT_TRUE(limiter.IsAllowed("k"));
}

TEST(RateLimiter, PruneIdleDropsOnlyExpiredKeys) {
    FakeClock clock;
    RateLimiter limiter(5, seconds(60), clock.fn());
    ASSERT_TRUE(limiter.IsAllowed("old-1"));
    ASSERT_TRUE(limiter.IsAllowed("old-2"));
    clock.t += seconds(30);
    ASSERT_TRUE(limiter.IsAllowed("recent"));
    ASSERT_EQ(limiter.TrackedKeys(), 3u);

    clock.t += seconds(31);
    EXPECT_EQ(limiter.PruneIdle(), 2u);
    EXPECT_EQ(limiter.TrackedKeys(), 1u);
    EXPECT_EQ(limiter.GetRemainingRequests("recent"), 4u);
    EXPECT_EQ(limiter.PruneIdle(), 0u);
}

TEST(RateLimiter, KeysAreIndependent) {
    FakeClock clock;
    RateLimiter limiter(1, seconds(60), clock.fn());
    EXPECT_TRUE(limiter.IsAllowed("a"));
    EXPECT_FALSE(limiter.IsAllowed("a"));
    EXPECT_TRUE(limiter.IsAllowed("b"));
    EXPECT_EQ(limiter.GetRemainingRequests("never-seen"), 1u);
}

TEST(RateLimiter, ResetClearsHistory) {
    FakeClock clock;
    RateLimiter limiter(1, seconds(60), clock.fn());
    ASSERT_TRUE(limiter.IsAllowed("a"));
    ASSERT_FALSE(limiter.IsAllowed("a"));
    limiter.Reset("a");
    EXPECT_TRUE(limiter.IsAllowed("a"));
}
