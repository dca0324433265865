//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_config.cpp
// Purpose: GoogleTests for ServerConfig environment loading, command-line overrides and validation
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "mcpgate/ServerConfig.h"

using namespace mcpgate;

namespace {

//==========================================================================================================
// ScopedEnv
// Purpose: Sets an environment variable for the lifetime of the object.
//==========================================================================================================
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name(name) { ::setenv(name, value, 1); }
    ~ScopedEnv() { ::unsetenv(name); }

private:
    const char* name;
};

ServerConfig validBase() {
    ServerConfig c;
    c.authToken = "t";
    return c;
}

} // namespace

TEST(ServerConfig, DefaultsAreSane) {
    ServerConfig c;
    EXPECT_EQ(c.port, 3001);
    EXPECT_TRUE(c.authEnabled);
    EXPECT_EQ(c.rateLimitRequests, 100u);
    EXPECT_EQ(c.rateLimitWindow.count(), 60);
    EXPECT_EQ(c.maxConnections, 50u);
    EXPECT_EQ(c.idleTimeout.count(), 600);
    EXPECT_EQ(c.failedAttemptThreshold, 5u);
    EXPECT_FALSE(c.UsesTls());
    // Auth on by default needs a token.
    EXPECT_THROW(c.Validate(), ConfigError);
    EXPECT_NO_THROW(validBase().Validate());
}

TEST(ServerConfig, LoadsFromEnvironment) {
    ScopedEnv port("MCP_PORT", "4100");
    ScopedEnv host("MCP_HOST", "127.0.0.1");
    ScopedEnv auth("MCP_AUTH_ENABLED", "false");
    ScopedEnv ips("MCP_ALLOWED_IPS", "127.0.0.1, 10.0.0.0/8 ,");
    ScopedEnv rate("MCP_RATE_LIMIT_REQUESTS", "7");
    ScopedEnv timeout("MCP_REQUEST_TIMEOUT", "45");
    ScopedEnv tools("MCP_TOOL_PROVIDERS", "admin,database");
    auto c = ServerConfig::LoadFromEnvironment();
    EXPECT_EQ(c.port, 4100);
    EXPECT_EQ(c.host, "127.0.0.1");
    EXPECT_FALSE(c.authEnabled);
    ASSERT_EQ(c.allowedIps.size(), 2u);
    EXPECT_EQ(c.allowedIps[1], "10.0.0.0/8");
    EXPECT_EQ(c.rateLimitRequests, 7u);
    EXPECT_EQ(c.idleTimeout.count(), 45);
    ASSERT_EQ(c.toolProviders.size(), 2u);
    EXPECT_EQ(c.toolProviders[1], "database");
    EXPECT_NO_THROW(c.Validate());
}

TEST(ServerConfig, NonNumericEnvironmentValueIsConfigError) {
    ScopedEnv port("MCP_PORT", "eighty");
    EXPECT_THROW(ServerConfig::LoadFromEnvironment(), ConfigError);
}

TEST(ServerConfig, CommandLineOverrides) {
    ServerConfig c = validBase();
    std::vector<std::string> args = {"mcpgate_server", "--port=5001", "--auth-token=cli", "--max-connections=3",
                                     "--tools=files", "--file-root=/tmp", "--ignored", "--log-level=DEBUG"};
    std::vector<char*> argv;
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    c.ApplyCommandLine(static_cast<int>(argv.size()), argv.data());
    EXPECT_EQ(c.port, 5001);
    EXPECT_EQ(c.authToken, "cli");
    EXPECT_EQ(c.maxConnections, 3u);
    ASSERT_EQ(c.toolProviders.size(), 1u);
    EXPECT_EQ(c.toolProviders[0], "files");
    EXPECT_EQ(c.fileRoot, "/tmp");
    EXPECT_EQ(c.logLevel, "DEBUG");
}

TEST(ServerConfig, RedisServiceSettings) {
    ScopedEnv url("MCP_REDIS_SERVICE_URL", "http://cache.internal:9000");
    ScopedEnv tools("MCP_TOOL_PROVIDERS", "database,redis");
    ScopedEnv token("MCP_AUTH_TOKEN", "t");
    auto c = ServerConfig::LoadFromEnvironment();
    EXPECT_EQ(c.redisServiceUrl, "http://cache.internal:9000");
    EXPECT_NO_THROW(c.Validate());

    std::string prog = "x";
    std::string flag = "--redis-url=http://127.0.0.1:6380";
    char* argv[] = {prog.data(), flag.data()};
    c.ApplyCommandLine(2, argv);
    EXPECT_EQ(c.redisServiceUrl, "http://127.0.0.1:6380");
}

TEST(ServerConfig, BadCommandLineInteger) {
    ServerConfig c = validBase();
    std::string prog = "x";
    std::string port = "--port=12ab";
    char* argv[] = {prog.data(), port.data()};
    EXPECT_THROW(c.ApplyCommandLine(2, argv), ConfigError);
}

TEST(ServerConfig, ValidationFailures) {
    auto expectInvalid = [](auto mutate) {
        ServerConfig c = validBase();
        mutate(c);
        EXPECT_THROW(c.Validate(), ConfigError);
    };
    expectInvalid([](ServerConfig& c) { c.port = 0; });
    expectInvalid([](ServerConfig& c) { c.port = 70000; });
    expectInvalid([](ServerConfig& c) { c.host.clear(); });
    expectInvalid([](ServerConfig& c) { c.sslCertFile = "cert.pem"; });
    expectInvalid([](ServerConfig& c) { c.requireClientCert = true; });
    expectInvalid([](ServerConfig& c) { c.rateLimitRequests = 0; });
    expectInvalid([](ServerConfig& c) { c.maxConnections = 0; });
    expectInvalid([](ServerConfig& c) { c.workerThreads = 0; });
    expectInvalid([](ServerConfig& c) { c.failedAttemptThreshold = 0; });
    expectInvalid([](ServerConfig& c) { c.sessionMaxAge = std::chrono::seconds(0); });
    expectInvalid([](ServerConfig& c) { c.toolProviders = {"admin", "shell"}; });
}

TEST(ServerConfig, SplitListTrimsAndDropsEmpties) {
    auto v = SplitList(" a, b ,,c ,");
    ASSERT_EQ(v.size(), 3u);
    EXPECT_EQ(v[0], "a");
    EXPECT_EQ(v[1], "b");
    EXPECT_EQ(v[2], "c");
    EXPECT_TRUE(SplitList("").empty());
}
