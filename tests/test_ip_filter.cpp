//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_ip_filter.cpp
// Purpose: GoogleTests for IPFilter allow-lists (exact, CIDR, IPv6) and failed-attempt lockout
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>

#include "mcpgate/security/IPFilter.hpp"

using namespace mcpgate::security;
using namespace std::chrono;

TEST(IPFilter, EmptyAllowListAdmitsEveryone) {
    IPFilter filter;
    EXPECT_TRUE(filter.IsAllowed("192.0.2.1"));
    EXPECT_TRUE(filter.IsAllowed("2001:db8::1"));
    EXPECT_EQ(filter.AllowListSize(), 0u);
}

TEST(IPFilter, ExactAndCidrEntries) {
    IPFilter filter({"127.0.0.1", "10.1.0.0/16", "not-an-ip"});
    EXPECT_EQ(filter.AllowListSize(), 2u);
    EXPECT_TRUE(filter.IsAllowed("127.0.0.1"));
    EXPECT_TRUE(filter.IsAllowed("10.1.200.3"));
    EXPECT_FALSE(filter.IsAllowed("10.2.0.1"));
    EXPECT_FALSE(filter.IsAllowed("127.0.0.2"));
    EXPECT_FALSE(filter.IsAllowed("garbage"));
}

TEST(IPFilter, Ipv6AndMappedAddresses) {
    IPFilter filter({"2001:db8::/32", "192.168.1.10"});
    EXPECT_TRUE(filter.IsAllowed("2001:db8:abcd::5"));
    EXPECT_FALSE(filter.IsAllowed("2001:db9::1"));
    EXPECT_TRUE(filter.IsAllowed("::ffff:192.168.1.10"));
}

TEST(IPFilter, LockoutAfterFiveFailures) {
    IPFilter filter;
    for (int i = 0; i < 4; ++i) {
        EXPECT_FALSE(filter.RecordFailedAttempt("198.51.100.7"));
    }
    EXPECT_FALSE(filter.IsBlocked("198.51.100.7"));
    EXPECT_TRUE(filter.RecordFailedAttempt("198.51.100.7"));
    EXPECT_TRUE(filter.IsBlocked("198.51.100.7"));
    EXPECT_FALSE(filter.IsAllowed("198.51.100.7"));
    EXPECT_TRUE(filter.IsAllowed("198.51.100.8"));
}

TEST(IPFilter, LockoutOverridesAllowList) {
    IPFilter filter({"127.0.0.1"}, BanPolicy{2, seconds(0)});
    ASSERT_TRUE(filter.IsAllowed("127.0.0.1"));
    filter.RecordFailedAttempt("127.0.0.1");
    filter.RecordFailedAttempt("127.0.0.1");
    EXPECT_TRUE(filter.IsBlocked("127.0.0.1"));
    EXPECT_FALSE(filter.IsAllowed("127.0.0.1"));
}

TEST(IPFilter, TimedBanExpires) {
    IPFilter::Clock::time_point t = IPFilter::Clock::time_point{} + hours(1);
    IPFilter filter({}, BanPolicy{3, seconds(30)}, [&t]() { return t; });
    for (int i = 0; i < 3; ++i) {
        filter.RecordFailedAttempt("203.0.113.9");
    }
    ASSERT_TRUE(filter.IsBlocked("203.0.113.9"));
    t += seconds(29);
    EXPECT_TRUE(filter.IsBlocked("203.0.113.9"));
    t += seconds(1);
    EXPECT_FALSE(filter.IsBlocked("203.0.113.9"));
    EXPECT_EQ(filter.FailedAttempts("203.0.113.9"), 0u);
    EXPECT_TRUE(filter.IsAllowed("203.0.113.9"));
}

TEST(IPFilter, PermanentBanByDefault) {
    IPFilter::Clock::time_point t = IPFilter::Clock::time_point{} + hours(1);
    IPFilter filter({}, BanPolicy{}, [&t]() { return t; });
    for (int i = 0; i < 5; ++i) {
        filter.RecordFailedAttempt("203.0.113.10");
    }
    t += hours(24 * 365);
    EXPECT_TRUE(filter.IsBlocked("203.0.113.10"));
}
