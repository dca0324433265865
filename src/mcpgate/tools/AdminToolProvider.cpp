//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgate/tools/AdminToolProvider.cpp
// Purpose: Diagnostics tool implementations
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <thread>

#include <sys/sysinfo.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <boost/asio/ip/host_name.hpp>
#include <boost/system/error_code.hpp>
#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpgate/tools/AdminToolProvider.hpp"

namespace mcpgate::tools {

namespace {

double percentOf(uint64_t part, uint64_t whole) {
    return whole == 0 ? 0.0 : static_cast<double>(part) / static_cast<double>(whole) * 100.0;
}

std::string gib(uint64_t bytes) {
    return fmt::format("{:.1f}GB", static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0));
}

HealthStatus grade(double value, double warnAt, double criticalAt) {
    if (value < warnAt) {
        return HealthStatus::Healthy;
    }
    return value < criticalAt ? HealthStatus::Warning : HealthStatus::Critical;
}

} // namespace

double SystemSnapshot::MemoryPercent() const { return percentOf(memoryUsedBytes, memoryTotalBytes); }
double SystemSnapshot::DiskPercent() const { return percentOf(diskUsedBytes, diskTotalBytes); }

double SystemSnapshot::LoadPercent() const {
    return cpuCount == 0 ? 0.0 : loadAverage1m / static_cast<double>(cpuCount) * 100.0;
}

SystemSnapshot CollectSystemSnapshot(const std::string& diskPath) {
    SystemSnapshot s;
    struct utsname u {};
    if (::uname(&u) == 0) {
        s.platform = std::string(u.sysname) + " " + u.release;
        s.architecture = u.machine;
    }
    boost::system::error_code hec;
    s.hostname = boost::asio::ip::host_name(hec);
    if (hec) {
        LOG_DEBUG("host_name failed: {}", hec.message());
    }
    s.cpuCount = std::thread::hardware_concurrency();

    struct sysinfo si {};
    if (::sysinfo(&si) == 0) {
        const uint64_t unit = si.mem_unit == 0 ? 1 : si.mem_unit;
        s.memoryTotalBytes = static_cast<uint64_t>(si.totalram) * unit;
        const uint64_t available = (static_cast<uint64_t>(si.freeram) + si.bufferram) * unit;
        s.memoryUsedBytes = s.memoryTotalBytes > available ? s.memoryTotalBytes - available : 0;
        s.loadAverage1m = static_cast<double>(si.loads[0]) / static_cast<double>(1 << SI_LOAD_SHIFT);
    }

    std::error_code ec;
    auto space = std::filesystem::space(diskPath, ec);
    if (!ec) {
        s.diskTotalBytes = space.capacity;
        s.diskUsedBytes = space.capacity - space.free;
    }
    s.processId = static_cast<long>(::getpid());
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        s.workingDirectory = cwd.string();
    }
    return s;
}

const char* ToString(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Warning: return "warning";
        case HealthStatus::Critical: return "critical";
    }
    return "unknown";
}

HealthReport EvaluateHealth(const SystemSnapshot& system, const MetricsCollector::Counters& counters,
                            std::size_t maxConnections) {
    HealthReport r;
    r.checks.push_back({"Memory", fmt::format("{:.1f}%", system.MemoryPercent()),
                        grade(system.MemoryPercent(), 80.0, 95.0)});
    r.checks.push_back({"Disk", fmt::format("{:.1f}%", system.DiskPercent()),
                        grade(system.DiskPercent(), 85.0, 95.0)});
    r.checks.push_back({"Load", fmt::format("{:.2f} ({:.1f}% of {} CPUs)", system.loadAverage1m,
                                            system.LoadPercent(), system.cpuCount),
                        grade(system.LoadPercent(), 80.0, 95.0)});

    const auto active = static_cast<std::size_t>(std::max<int64_t>(0, counters.activeConnections));
    const bool crowded = static_cast<double>(active) >= static_cast<double>(maxConnections) * 0.8;
    r.checks.push_back({"Connections", fmt::format("{}/{}", active, maxConnections),
                        crowded ? HealthStatus::Warning : HealthStatus::Healthy});

    const double errorRate = static_cast<double>(counters.errors) /
                             static_cast<double>(std::max<uint64_t>(counters.requests, 1));
    r.checks.push_back({"Error Rate", fmt::format("{:.2f}%", errorRate * 100.0), grade(errorRate, 0.05, 0.10)});

    for (const auto& c : r.checks) {
        r.overall = std::max(r.overall, c.status);
    }
    return r;
}

AdminToolProvider::AdminToolProvider(std::shared_ptr<MetricsCollector> m,
                                     std::shared_ptr<SessionManager> s,
                                     std::size_t maxConns)
    : metrics(std::move(m)), sessions(std::move(s)), maxConnections(maxConns) {}

std::vector<Tool> AdminToolProvider::GetToolDefinitions() const {
    return {
        Tool("echo", "Echo a message with client metadata and timestamp",
             MakeObjectSchema({{"message", "string", "Message to echo"}}, {"message"})),
        Tool("get_system_info", "Get host information and server status", MakeObjectSchema({})),
        Tool("get_metrics", "Get server performance metrics and statistics",
             MakeObjectSchema({{"detailed", "boolean", "Include per-tool statistics and recent requests"}})),
        Tool("health_check", "Grade host resources, connections and error rate", MakeObjectSchema({})),
    };
}

std::optional<ToolHandler> AdminToolProvider::GetHandler(const std::string& name) {
    if (name == "echo") {
        return ToolHandler([this](const JSONValue& a, const ClientSession& s) { return Echo(a, s); });
    }
    if (name == "get_system_info") {
        return ToolHandler([this](const JSONValue& a, const ClientSession& s) { return GetSystemInfo(a, s); });
    }
    if (name == "get_metrics") {
        return ToolHandler([this](const JSONValue& a, const ClientSession& s) { return GetMetrics(a, s); });
    }
    if (name == "health_check") {
        return ToolHandler([this](const JSONValue& a, const ClientSession& s) { return HealthCheck(a, s); });
    }
    return std::nullopt;
}

ToolResult AdminToolProvider::Echo(const JSONValue& args, const ClientSession& session) const {
    const std::string message = GetStringMember(args, "message").value_or("");
    return MakeTextResult(fmt::format("Echo Response:\nMessage: {}\nTimestamp: {}\nClient IP: {}\nRequest Count: {}",
                                      message, FormatIso8601(std::chrono::system_clock::now()),
                                      session.ipAddress, session.requestCount));
}

ToolResult AdminToolProvider::GetSystemInfo(const JSONValue&, const ClientSession& session) const {
    const SystemSnapshot sys = CollectSystemSnapshot();
    const auto counters = metrics->GetCounters();
    std::string text = fmt::format(
        "System Information:\n\n"
        "Host:\n"
        "- Platform: {}\n- Architecture: {}\n- Hostname: {}\n- CPUs: {}\n- Load (1m): {:.2f}\n"
        "- Memory: {:.1f}% used ({} / {})\n- Disk: {:.1f}% used ({} / {})\n\n"
        "Process:\n- Process ID: {}\n- Working Directory: {}\n\n"
        "Server Status:\n- Current Time: {}\n- Active Connections: {}\n- Active Sessions: {}\n"
        "- Total Requests: {}\n- Total Errors: {}\n\n"
        "Client Info:\n- Client ID: {}\n- Your IP: {}\n- Connected: {}\n- Requests Made: {}\n- Authenticated: {}",
        sys.platform, sys.architecture, sys.hostname, sys.cpuCount, sys.loadAverage1m,
        sys.MemoryPercent(), gib(sys.memoryUsedBytes), gib(sys.memoryTotalBytes),
        sys.DiskPercent(), gib(sys.diskUsedBytes), gib(sys.diskTotalBytes),
        sys.processId, sys.workingDirectory,
        FormatIso8601(std::chrono::system_clock::now()), counters.activeConnections, sessions->SessionCount(),
        counters.requests, counters.errors,
        session.clientId, session.ipAddress, FormatIso8601(session.connectedAt), session.requestCount,
        session.authenticated ? "true" : "false");
    if (session.userAgent.has_value()) {
        text += "\n- Client: " + session.userAgent.value();
    }
    return MakeTextResult(text);
}

ToolResult AdminToolProvider::GetMetrics(const JSONValue& args, const ClientSession&) const {
    const bool detailed = GetBoolMember(args, "detailed").value_or(false);
    return MakeTextResult(SerializeJSON(detailed ? metrics->GetSummary() : metrics->GetMetrics()));
}

ToolResult AdminToolProvider::HealthCheck(const JSONValue&, const ClientSession&) const {
    const HealthReport report = EvaluateHealth(CollectSystemSnapshot(), metrics->GetCounters(), maxConnections);
    std::string status = ToString(report.overall);
    std::transform(status.begin(), status.end(), status.begin(), [](unsigned char c) { return std::toupper(c); });
    std::string text = "Health Check - Status: " + status + "\n\nComponent Status:\n";
    for (const auto& c : report.checks) {
        text += fmt::format("- {}: {} - {}\n", c.name, c.value, ToString(c.status));
    }
    text += "\nLast Check: " + FormatIso8601(std::chrono::system_clock::now());
    return MakeTextResult(text);
}

} // namespace mcpgate::tools
