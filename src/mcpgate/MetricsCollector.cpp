//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MetricsCollector.cpp
// Purpose: MetricsCollector implementation
//==========================================================================================================

#include <algorithm>
#include <cmath>
#include <ctime>

#include <fmt/format.h>

#include "mcpgate/MetricsCollector.hpp"

namespace mcpgate {

namespace {

double roundTo(double v, int digits) {
    const double scale = std::pow(10.0, digits);
    return std::round(v * scale) / scale;
}

std::string formatUptime(std::chrono::seconds up) {
    const auto total = up.count();
    const auto days = total / 86400;
    const auto hours = (total % 86400) / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto secs = total % 60;
    if (days > 0) {
        return fmt::format("{} day{}, {}:{:02}:{:02}", days, days == 1 ? "" : "s", hours, minutes, secs);
    }
    return fmt::format("{}:{:02}:{:02}", hours, minutes, secs);
}

} // namespace

std::string FormatIso8601(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                       ms < 0 ? ms + 1000 : ms);
}

MetricsCollector::MetricsCollector(std::size_t historyCapacity, NowFn nowFn)
    : now(std::move(nowFn)), history(historyCapacity == 0 ? 1 : historyCapacity) {
    if (!now) {
        now = []() { return Clock::now(); };
    }
    startTime = now();
}

void MetricsCollector::RecordRequest(const std::string& name, double seconds, bool success) {
    const auto ts = now();
    std::lock_guard<std::mutex> lock(mtx);
    ++requestCount;
    if (!success) {
        ++errorCount;
    }
    history.push_back(RequestRecord{name, seconds, success, ts});

    auto [it, inserted] = toolStats.try_emplace(name);
    ToolStats& s = it->second;
    if (inserted || s.count == 0) {
        s.minSeconds = seconds;
        s.maxSeconds = seconds;
    } else {
        s.minSeconds = std::min(s.minSeconds, seconds);
        s.maxSeconds = std::max(s.maxSeconds, seconds);
    }
    ++s.count;
    s.totalSeconds += seconds;
    if (!success) {
        ++s.errors;
    }
}

void MetricsCollector::RecordConnectionChange(int delta) {
    std::lock_guard<std::mutex> lock(mtx);
    activeConnections = std::max<int64_t>(0, activeConnections + delta);
}

JSONValue MetricsCollector::GetMetrics() const {
    const auto t = now();
    std::lock_guard<std::mutex> lock(mtx);
    double sum = 0.0;
    for (const auto& r : history) {
        sum += r.seconds;
    }
    const double avg = history.empty() ? 0.0 : sum / static_cast<double>(history.size());
    const double uptime = std::chrono::duration<double>(t - startTime).count();

    JSONValue::Object usage;
    for (const auto& [name, s] : toolStats) {
        SetMember(usage, name, JSONValue(static_cast<int64_t>(s.count)));
    }

    JSONValue::Object out;
    SetMember(out, "uptime_seconds", JSONValue(uptime));
    SetMember(out, "total_requests", JSONValue(static_cast<int64_t>(requestCount)));
    SetMember(out, "total_errors", JSONValue(static_cast<int64_t>(errorCount)));
    SetMember(out, "error_rate",
              JSONValue(static_cast<double>(errorCount) / static_cast<double>(std::max<uint64_t>(requestCount, 1))));
    SetMember(out, "average_response_time_ms", JSONValue(avg * 1000.0));
    SetMember(out, "active_connections", JSONValue(activeConnections));
    SetMember(out, "tool_usage", JSONValue(std::move(usage)));
    return JSONValue(std::move(out));
}

JSONValue MetricsCollector::toolBlockLocked(const ToolStats& s) const {
    JSONValue::Object o;
    const double rate = s.count > 0
        ? static_cast<double>(s.count - s.errors) / static_cast<double>(s.count) * 100.0 : 0.0;
    const double avg = s.count > 0 ? s.totalSeconds / static_cast<double>(s.count) : 0.0;
    SetMember(o, "count", JSONValue(static_cast<int64_t>(s.count)));
    SetMember(o, "errors", JSONValue(static_cast<int64_t>(s.errors)));
    SetMember(o, "success_rate", JSONValue(roundTo(rate, 2)));
    SetMember(o, "avg_response_time", JSONValue(roundTo(avg, 3)));
    SetMember(o, "min_response_time", JSONValue(roundTo(s.minSeconds, 3)));
    SetMember(o, "max_response_time", JSONValue(roundTo(s.maxSeconds, 3)));
    return JSONValue(std::move(o));
}

JSONValue MetricsCollector::GetSummary() const {
    const auto t = now();
    std::lock_guard<std::mutex> lock(mtx);

    const auto up = t - startTime;
    JSONValue::Object serverInfo;
    SetMember(serverInfo, "start_time", JSONValue(FormatIso8601(startTime)));
    SetMember(serverInfo, "uptime_seconds", JSONValue(std::chrono::duration<double>(up).count()));
    SetMember(serverInfo, "uptime_formatted",
              JSONValue(formatUptime(std::chrono::duration_cast<std::chrono::seconds>(up))));
    SetMember(serverInfo, "platform", JSONValue("Linux"));

    const double successRate = requestCount > 0
        ? static_cast<double>(requestCount - errorCount) / static_cast<double>(requestCount) * 100.0 : 0.0;

    JSONValue::Array recent;
    const std::size_t skip = history.size() > 10 ? history.size() - 10 : 0;
    for (std::size_t i = skip; i < history.size(); ++i) {
        const auto& r = history[i];
        JSONValue::Object item;
        SetMember(item, "tool", JSONValue(r.name));
        SetMember(item, "response_time", JSONValue(roundTo(r.seconds, 3)));
        SetMember(item, "success", JSONValue(r.success));
        SetMember(item, "timestamp", JSONValue(FormatIso8601(r.timestamp)));
        recent.push_back(std::make_shared<JSONValue>(std::move(item)));
    }

    JSONValue::Object requestMetrics;
    SetMember(requestMetrics, "total_requests", JSONValue(static_cast<int64_t>(requestCount)));
    SetMember(requestMetrics, "error_count", JSONValue(static_cast<int64_t>(errorCount)));
    SetMember(requestMetrics, "success_rate_percent", JSONValue(roundTo(successRate, 2)));
    SetMember(requestMetrics, "active_connections", JSONValue(activeConnections));
    SetMember(requestMetrics, "recent_requests", JSONValue(std::move(recent)));

    JSONValue::Object tools;
    for (const auto& [name, s] : toolStats) {
        SetMember(tools, name, toolBlockLocked(s));
    }

    JSONValue::Object out;
    SetMember(out, "server_info", JSONValue(std::move(serverInfo)));
    SetMember(out, "request_metrics", JSONValue(std::move(requestMetrics)));
    SetMember(out, "tool_metrics", JSONValue(std::move(tools)));
    return JSONValue(std::move(out));
}

std::optional<JSONValue> MetricsCollector::GetToolMetrics(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = toolStats.find(name);
    if (it == toolStats.end()) {
        return std::nullopt;
    }
    JSONValue block = toolBlockLocked(it->second);
    SetMember(std::get<JSONValue::Object>(block.value), "tool_name", JSONValue(name));
    return block;
}

MetricsCollector::Counters MetricsCollector::GetCounters() const {
    std::lock_guard<std::mutex> lock(mtx);
    return Counters{requestCount, errorCount, activeConnections, history.size()};
}

std::optional<MetricsCollector::ToolStats> MetricsCollector::GetToolStats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = toolStats.find(name);
    if (it == toolStats.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MetricsCollector::Reset() {
    const auto t = now();
    std::lock_guard<std::mutex> lock(mtx);
    requestCount = 0;
    errorCount = 0;
    activeConnections = 0;
    history.clear();
    toolStats.clear();
    startTime = t;
}

} // namespace mcpgate
