//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MetricsCollector.hpp
// Purpose: Request counters, bounded request history and per-tool timing statistics
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <boost/circular_buffer.hpp>

#include "mcpgate/JSONRPCTypes.h"

namespace mcpgate {

// UTC ISO-8601 with millisecond precision, e.g. 2025-01-31T12:00:00.123Z
std::string FormatIso8601(std::chrono::system_clock::time_point tp);

//==========================================================================================================
// MetricsCollector
// Purpose: Thread-safe recorder shared by every connection of one server instance.
// Notes:
//   - Only raw counters are stored; success rate, error rate and averages are derived on read.
//   - The request history is a ring of the last historyCapacity records.
//   - activeConnections never drops below zero.
//==========================================================================================================
class MetricsCollector {
public:
    using Clock = std::chrono::system_clock;
    using NowFn = std::function<Clock::time_point()>;

    struct RequestRecord {
        std::string name;
        double seconds{0.0};
        bool success{true};
        Clock::time_point timestamp{};
    };

    struct ToolStats {
        uint64_t count{0};
        uint64_t errors{0};
        double totalSeconds{0.0};
        double minSeconds{0.0};
        double maxSeconds{0.0};
    };

    struct Counters {
        uint64_t requests{0};
        uint64_t errors{0};
        int64_t activeConnections{0};
        std::size_t historySize{0};
    };

    static constexpr std::size_t kDefaultHistory = 1000;

    explicit MetricsCollector(std::size_t historyCapacity = kDefaultHistory, NowFn now = {});

    //==========================================================================================================
    // Records one completed request.
    // Args:
    //   name: Tool name for tools/call, method name otherwise.
    //   seconds: Handling time.
    //   success: false for isError results and protocol failures.
    //==========================================================================================================
    void RecordRequest(const std::string& name, double seconds, bool success);

    // Adds delta to active connections, clamped at zero.
    void RecordConnectionChange(int delta);

    // {uptime_seconds, total_requests, total_errors, error_rate, average_response_time_ms,
    //  active_connections, tool_usage{name:count}}
    JSONValue GetMetrics() const;

    // {server_info{...}, request_metrics{..., recent_requests[10]}, tool_metrics{name:{...}}}
    JSONValue GetSummary() const;

    // Per-tool block as in GetSummary plus tool_name; nullopt when never recorded.
    std::optional<JSONValue> GetToolMetrics(const std::string& name) const;

    Counters GetCounters() const;
    std::optional<ToolStats> GetToolStats(const std::string& name) const;

    // Clears counters, history and per-tool stats and restarts the uptime clock.
    void Reset();

private:
    JSONValue toolBlockLocked(const ToolStats& s) const;

    NowFn now;
    mutable std::mutex mtx;
    Clock::time_point startTime;
    uint64_t requestCount{0};
    uint64_t errorCount{0};
    int64_t activeConnections{0};
    boost::circular_buffer<RequestRecord> history;
    std::map<std::string, ToolStats> toolStats;
};

} // namespace mcpgate
