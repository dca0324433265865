//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgate/security/RateLimiter.cpp
// Purpose: Sliding-window limiter implementation
//==========================================================================================================

#include "mcpgate/security/RateLimiter.hpp"

namespace mcpgate::security {

RateLimiter::RateLimiter(std::size_t maxRequests, std::chrono::seconds window, NowFn nowFn)
    : maxRequests(maxRequests), window(window), now(std::move(nowFn)) {
    if (!now) {
        now = []() { return Clock::now(); };
    }
}

void RateLimiter::evictLocked(std::deque<Clock::time_point>& q, Clock::time_point t) const {
    const auto cutoff = t - window;
    while (!q.empty() && q.front() < cutoff) {
        q.pop_front();
    }
}

bool RateLimiter::IsAllowed(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx);
    const auto t = now();
    auto& q = requests[key];
    evictLocked(q, t);
    if (q.size() < maxRequests) {
        q.push_back(t);
        return true;
    }
    return false;
}

std::size_t RateLimiter::GetRemainingRequests(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = requests.find(key);
    if (it == requests.end()) {
        return maxRequests;
    }
    evictLocked(it->second, now());
    if (it->second.empty()) {
        requests.erase(it);
        return maxRequests;
    }
    return it->second.size() >= maxRequests ? 0 : maxRequests - it->second.size();
}

std::size_t RateLimiter::PruneIdle() {
    std::lock_guard<std::mutex> lock(mtx);
    const auto t = now();
    std::size_t removed = 0;
    for (auto it = requests.begin(); it != requests.end();) {
        evictLocked(it->second, t);
        if (it->second.empty()) {
            it = requests.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t RateLimiter::TrackedKeys() const {
    std::lock_guard<std::mutex> lock(mtx);
    return requests.size();
}

void RateLimiter::Reset(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx);
    requests.erase(key);
}

} // namespace mcpgate::security
