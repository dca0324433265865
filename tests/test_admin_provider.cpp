//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_admin_provider.cpp
// Purpose: GoogleTests for echo, metrics and health grading in AdminToolProvider
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "mcpgate/tools/AdminToolProvider.hpp"

using namespace mcpgate;
using namespace mcpgate::tools;

namespace {

std::string textOf(const ToolResult& r) {
    return r.content.empty() ? std::string() : GetStringMember(r.content.front(), "text").value_or("");
}

SystemSnapshot calmHost() {
    SystemSnapshot s;
    s.cpuCount = 4;
    s.loadAverage1m = 1.0;
    s.memoryTotalBytes = 1000;
    s.memoryUsedBytes = 500;
    s.diskTotalBytes = 1000;
    s.diskUsedBytes = 100;
    return s;
}

HealthStatus statusOf(const HealthReport& r, const std::string& name) {
    for (const auto& c : r.checks) {
        if (c.name == name) {
            return c.status;
        }
    }
    ADD_FAILURE() << "no check named " << name;
    return HealthStatus::Critical;
}

} // namespace

TEST(AdminTools, ExposesFourTools) {
    AdminToolProvider admin(std::make_shared<MetricsCollector>(), std::make_shared<SessionManager>(), 50);
    auto defs = admin.GetToolDefinitions();
    ASSERT_EQ(defs.size(), 4u);
    for (const auto& d : defs) {
        EXPECT_TRUE(admin.GetHandler(d.name).has_value()) << d.name;
    }
    EXPECT_FALSE(admin.GetHandler("rm_rf").has_value());
}

TEST(AdminTools, EchoIncludesMessageAndCaller) {
    AdminToolProvider admin(std::make_shared<MetricsCollector>(), std::make_shared<SessionManager>(), 50);
    ClientSession session;
    session.ipAddress = "127.0.0.1";
    session.requestCount = 3;
    JSONValue::Object a;
    SetMember(a, "message", JSONValue("hi"));
    auto r = admin.Echo(JSONValue(a), session);
    ASSERT_FALSE(r.isError);
    const std::string text = textOf(r);
    EXPECT_EQ(text.rfind("Echo Response:\nMessage: hi\n", 0), 0u);
    EXPECT_NE(text.find("Client IP: 127.0.0.1"), std::string::npos);
    EXPECT_NE(text.find("Request Count: 3"), std::string::npos);
}

TEST(AdminTools, GetMetricsReturnsJson) {
    auto metrics = std::make_shared<MetricsCollector>();
    metrics->RecordRequest("echo", 0.01, true);
    AdminToolProvider admin(metrics, std::make_shared<SessionManager>(), 50);
    ClientSession session;
    JSONValue plain = ParseJSON(textOf(admin.GetMetrics(JSONValue(JSONValue::Object{}), session)));
    EXPECT_EQ(GetIntMember(plain, "total_requests").value_or(0), 1);
    JSONValue::Object a;
    SetMember(a, "detailed", JSONValue(true));
    JSONValue detailed = ParseJSON(textOf(admin.GetMetrics(JSONValue(a), session)));
    EXPECT_NE(FindMember(detailed, "tool_metrics"), nullptr);
}

TEST(AdminTools, HealthyHostGradesHealthy) {
    MetricsCollector::Counters counters;
    counters.requests = 100;
    counters.errors = 1;
    counters.activeConnections = 3;
    auto report = EvaluateHealth(calmHost(), counters, 50);
    EXPECT_EQ(report.overall, HealthStatus::Healthy);
    EXPECT_EQ(report.checks.size(), 5u);
}

TEST(AdminTools, ThresholdsEscalateOverallStatus) {
    MetricsCollector::Counters counters;
    SystemSnapshot host = calmHost();
    host.memoryUsedBytes = 850;
    auto warn = EvaluateHealth(host, counters, 50);
    EXPECT_EQ(statusOf(warn, "Memory"), HealthStatus::Warning);
    EXPECT_EQ(warn.overall, HealthStatus::Warning);

    host.diskUsedBytes = 960;
    auto crit = EvaluateHealth(host, counters, 50);
    EXPECT_EQ(statusOf(crit, "Disk"), HealthStatus::Critical);
    EXPECT_EQ(crit.overall, HealthStatus::Critical);

    counters.requests = 10;
    counters.errors = 1;
    counters.activeConnections = 40;
    auto busy = EvaluateHealth(calmHost(), counters, 50);
    EXPECT_EQ(statusOf(busy, "Connections"), HealthStatus::Warning);
    EXPECT_EQ(statusOf(busy, "Error Rate"), HealthStatus::Critical);
}

TEST(AdminTools, HealthCheckTextNamesStatus) {
    AdminToolProvider admin(std::make_shared<MetricsCollector>(), std::make_shared<SessionManager>(), 50);
    ClientSession session;
    auto r = admin.HealthCheck(JSONValue(JSONValue::Object{}), session);
    const std::string text = textOf(r);
    EXPECT_EQ(text.rfind("Health Check - Status: ", 0), 0u);
    EXPECT_NE(text.find("Component Status:"), std::string::npos);
    EXPECT_NE(text.find("- Connections: 0/50 - healthy"), std::string::npos);
}
