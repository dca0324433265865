//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RateLimiter.hpp
// Purpose: Per-key sliding-window request limiter
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mcpgate::security {

//==========================================================================================================
// RateLimiter
// Purpose: Allows at most maxRequests per key within any window of windowSeconds.
// Notes:
//   - Each key keeps a queue of accepted timestamps; entries older than now - window are evicted before
//     every check, so the window slides continuously rather than resetting at fixed boundaries. An entry
//     exactly one window old still counts.
//   - Rejected calls leave the queue untouched.
//   - All operations are serialized by one mutex; the limiter is shared by every connection.
//==========================================================================================================
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    RateLimiter(std::size_t maxRequests, std::chrono::seconds window, NowFn now = {});

    //==========================================================================================================
    // Checks and, when allowed, records one request for key.
    // Returns:
    //   true when fewer than maxRequests were accepted during the last window.
    //==========================================================================================================
    bool IsAllowed(const std::string& key);

    // Requests still available to key in the current window: max(0, maxRequests - count).
    std::size_t GetRemainingRequests(const std::string& key);

    // Drops keys with no request inside the current window. Returns the number of keys removed.
    std::size_t PruneIdle();

    std::size_t TrackedKeys() const;

    // Forgets all history for key.
    void Reset(const std::string& key);

    std::size_t MaxRequests() const { return maxRequests; }
    std::chrono::seconds Window() const { return window; }

private:
    void evictLocked(std::deque<Clock::time_point>& q, Clock::time_point now) const;

    const std::size_t maxRequests;
    const std::chrono::seconds window;
    NowFn now;
    mutable std::mutex mtx;
    std::unordered_map<std::string, std::deque<Clock::time_point>> requests;
};

} // namespace mcpgate::security
