//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: IPFilter.hpp
// Purpose: Allow-list matching and failed-attempt lockout for client addresses
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/ip/network_v4.hpp>
#include <boost/asio/ip/network_v6.hpp>

namespace mcpgate::security {

//==========================================================================================================
// BanPolicy
// Purpose: Lockout rules applied by IPFilter::RecordFailedAttempt.
// Fields:
//   threshold: Failed attempts that trigger a ban (default 5).
//   duration: Ban length; zero means the address stays banned for the process lifetime.
//==========================================================================================================
struct BanPolicy {
    std::size_t threshold{5};
    std::chrono::seconds duration{0};
};

class IPFilter {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    //==========================================================================================================
    // Constructs the filter.
    // Args:
    //   allowList: Exact addresses ("10.0.0.5", "::1") or CIDR blocks ("10.0.0.0/8"). Entries that do not
    //              parse are skipped with a warning. Empty means every address passes the allow-list.
    //   policy: Lockout threshold and ban duration.
    //   now: Time source for ban expiry.
    //==========================================================================================================
    explicit IPFilter(const std::vector<std::string>& allowList = {}, BanPolicy policy = {}, NowFn now = {});

    //==========================================================================================================
    // Returns false for blocked addresses, otherwise true when no allow-list is configured or when the
    // address matches one of its entries. Unparseable addresses never match a non-empty allow-list.
    //==========================================================================================================
    bool IsAllowed(const std::string& ip);

    // Block-set membership, honouring ban expiry.
    bool IsBlocked(const std::string& ip);

    //==========================================================================================================
    // Counts a failed authentication for ip; bans it once the count reaches the policy threshold.
    // Returns:
    //   true when this call banned the address.
    //==========================================================================================================
    bool RecordFailedAttempt(const std::string& ip);

    std::size_t FailedAttempts(const std::string& ip) const;

    // Number of allow-list entries that parsed.
    std::size_t AllowListSize() const { return v4Networks.size() + v6Networks.size(); }

private:
    bool isBlockedLocked(const std::string& ip, Clock::time_point t);
    bool matchesAllowList(const std::string& ip) const;

    BanPolicy policy;
    NowFn now;
    std::vector<boost::asio::ip::network_v4> v4Networks;
    std::vector<boost::asio::ip::network_v6> v6Networks;

    mutable std::mutex mtx;
    std::unordered_map<std::string, std::size_t> failedAttempts;
    // Banned address -> expiry (nullopt = permanent)
    std::unordered_map<std::string, std::optional<Clock::time_point>> blocked;
};

} // namespace mcpgate::security
