//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgate/security/IPFilter.cpp
// Purpose: Allow-list and lockout implementation using Boost.Asio address/network types
//==========================================================================================================

#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>

#include "logging/Logger.h"
#include "mcpgate/security/IPFilter.hpp"

namespace mcpgate::security {

namespace ip = boost::asio::ip;

namespace {
// Parses an address, folding IPv4-mapped IPv6 ("::ffff:1.2.3.4") to plain IPv4.
std::optional<ip::address> parseAddress(const std::string& text) {
    boost::system::error_code ec;
    ip::address addr = ip::make_address(text, ec);
    if (ec) {
        return std::nullopt;
    }
    if (addr.is_v6() && addr.to_v6().is_v4_mapped()) {
        return ip::address(ip::make_address_v4(ip::v4_mapped, addr.to_v6()));
    }
    return addr;
}
} // namespace

IPFilter::IPFilter(const std::vector<std::string>& allowList, BanPolicy p, NowFn nowFn)
    : policy(p), now(std::move(nowFn)) {
    if (!now) {
        now = []() { return Clock::now(); };
    }
    for (const auto& raw : allowList) {
        if (raw.empty()) {
            continue;
        }
        boost::system::error_code ec;
        if (raw.find('/') != std::string::npos) {
            if (raw.find(':') != std::string::npos) {
                auto net = ip::make_network_v6(raw, ec);
                if (!ec) { v6Networks.push_back(net.canonical()); continue; }
            } else {
                auto net = ip::make_network_v4(raw, ec);
                if (!ec) { v4Networks.push_back(net.canonical()); continue; }
            }
        } else if (auto addr = parseAddress(raw)) {
            if (addr->is_v4()) {
                v4Networks.emplace_back(addr->to_v4(), 32);
            } else {
                v6Networks.emplace_back(addr->to_v6(), 128);
            }
            continue;
        }
        LOG_WARN("Ignoring invalid allow-list entry: {}", raw);
    }
}

bool IPFilter::matchesAllowList(const std::string& text) const {
    auto addr = parseAddress(text);
    if (!addr) {
        return false;
    }
    if (addr->is_v4()) {
        const auto a = addr->to_v4();
        for (const auto& net : v4Networks) {
            if (ip::network_v4(a, net.prefix_length()).canonical() == net) {
                return true;
            }
        }
        return false;
    }
    const auto a = addr->to_v6();
    for (const auto& net : v6Networks) {
        if (ip::network_v6(a, net.prefix_length()).canonical() == net) {
            return true;
        }
    }
    return false;
}

bool IPFilter::isBlockedLocked(const std::string& ip, Clock::time_point t) {
    auto it = blocked.find(ip);
    if (it == blocked.end()) {
        return false;
    }
    if (it->second.has_value() && t >= it->second.value()) {
        LOG_INFO("Ban expired for {}", ip);
        blocked.erase(it);
        failedAttempts.erase(ip);
        return false;
    }
    return true;
}

bool IPFilter::IsAllowed(const std::string& ip) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (isBlockedLocked(ip, now())) {
            return false;
        }
    }
    if (v4Networks.empty() && v6Networks.empty()) {
        return true;
    }
    return matchesAllowList(ip);
}

bool IPFilter::IsBlocked(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mtx);
    return isBlockedLocked(ip, now());
}

bool IPFilter::RecordFailedAttempt(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mtx);
    const auto t = now();
    if (isBlockedLocked(ip, t)) {
        return false;
    }
    const std::size_t count = ++failedAttempts[ip];
    LOG_WARN("Failed attempt {} of {} from {}", count, policy.threshold, ip);
    if (count < policy.threshold) {
        return false;
    }
    if (policy.duration.count() > 0) {
        blocked[ip] = t + policy.duration;
        LOG_WARN("Blocked {} for {}s after {} failed attempts", ip, policy.duration.count(), count);
    } else {
        blocked[ip] = std::nullopt;
        LOG_WARN("Blocked {} after {} failed attempts", ip, count);
    }
    return true;
}

std::size_t IPFilter::FailedAttempts(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = failedAttempts.find(ip);
    return it == failedAttempts.end() ? 0 : it->second;
}

} // namespace mcpgate::security
