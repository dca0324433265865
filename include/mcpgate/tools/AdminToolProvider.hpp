//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AdminToolProvider.hpp
// Purpose: Diagnostics tools: echo, get_system_info, get_metrics and health_check
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcpgate/MetricsCollector.hpp"
#include "mcpgate/SessionManager.hpp"
#include "mcpgate/ToolRegistry.hpp"

namespace mcpgate::tools {

//==========================================================================================================
// SystemSnapshot
// Purpose: Host figures read from uname(2), sysinfo(2) and std::filesystem::space. Fields stay zero when
//          the corresponding call fails.
//==========================================================================================================
struct SystemSnapshot {
    std::string platform;      // sysname + release
    std::string architecture;
    std::string hostname;
    unsigned int cpuCount{0};
    double loadAverage1m{0.0};
    uint64_t memoryTotalBytes{0};
    uint64_t memoryUsedBytes{0};
    uint64_t diskTotalBytes{0};
    uint64_t diskUsedBytes{0};
    long processId{0};
    std::string workingDirectory;

    double MemoryPercent() const;
    double DiskPercent() const;
    // 1-minute load relative to CPU count, as a percentage.
    double LoadPercent() const;
};

SystemSnapshot CollectSystemSnapshot(const std::string& diskPath = "/");

enum class HealthStatus { Healthy, Warning, Critical };

const char* ToString(HealthStatus status);

struct HealthCheck {
    std::string name;
    std::string value;
    HealthStatus status{HealthStatus::Healthy};
};

struct HealthReport {
    HealthStatus overall{HealthStatus::Healthy};
    std::vector<HealthCheck> checks;
};

//==========================================================================================================
// EvaluateHealth
// Purpose: Grades host and server figures.
//   memory: <80% healthy, <95% warning, else critical
//   disk: <85% healthy, <95% warning, else critical
//   load: <80% of CPUs healthy, <95% warning, else critical
//   connections: below 80% of maxConnections healthy, else warning
//   error rate: <5% healthy, <10% warning, else critical
// The overall status is the worst individual status.
//==========================================================================================================
HealthReport EvaluateHealth(const SystemSnapshot& system, const MetricsCollector::Counters& counters,
                            std::size_t maxConnections);

class AdminToolProvider : public IToolProvider {
public:
    AdminToolProvider(std::shared_ptr<MetricsCollector> metrics,
                      std::shared_ptr<SessionManager> sessions,
                      std::size_t maxConnections);

    std::vector<Tool> GetToolDefinitions() const override;
    std::optional<ToolHandler> GetHandler(const std::string& name) override;

    ToolResult Echo(const JSONValue& args, const ClientSession& session) const;
    ToolResult GetSystemInfo(const JSONValue& args, const ClientSession& session) const;
    ToolResult GetMetrics(const JSONValue& args, const ClientSession& session) const;
    ToolResult HealthCheck(const JSONValue& args, const ClientSession& session) const;

private:
    std::shared_ptr<MetricsCollector> metrics;
    std::shared_ptr<SessionManager> sessions;
    std::size_t maxConnections;
};

} // namespace mcpgate::tools
