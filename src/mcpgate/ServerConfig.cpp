//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Environment and command-line loading plus validation for ServerConfig
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpgate/ServerConfig.h"

namespace mcpgate {

namespace {

long long envInt(const char* name, long long def) {
    try {
        return GetEnvIntOrDefault(name, def);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
}

long long parseIntFlag(const std::string& key, const std::string& value) {
    std::size_t used = 0;
    long long out = 0;
    try {
        out = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw ConfigError(key + " expects an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw ConfigError(key + " expects an integer, got '" + value + "'");
    }
    return out;
}

std::size_t nonNegative(const char* what, long long v) {
    if (v < 0) {
        throw ConfigError(std::string(what) + " must not be negative");
    }
    return static_cast<std::size_t>(v);
}

//==========================================================================================================
// Parses simple key=value style command-line options.
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

} // namespace

std::vector<std::string> SplitList(const std::string& csv) {
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string item;
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    while (std::getline(ss, item, ',')) {
        item.erase(item.begin(), std::find_if(item.begin(), item.end(), notSpace));
        item.erase(std::find_if(item.rbegin(), item.rend(), notSpace).base(), item.end());
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

ServerConfig ServerConfig::LoadFromEnvironment() {
    ServerConfig c;
    c.host = GetEnvOrDefault("MCP_HOST", c.host);
    c.port = static_cast<int>(envInt("MCP_PORT", c.port));
    c.sslCertFile = GetEnvOrDefault("MCP_SSL_CERT", c.sslCertFile);
    c.sslKeyFile = GetEnvOrDefault("MCP_SSL_KEY", c.sslKeyFile);
    c.sslCaFile = GetEnvOrDefault("MCP_SSL_CA", c.sslCaFile);
    c.requireClientCert = GetEnvBoolOrDefault("MCP_SSL_REQUIRE_CLIENT_CERT", c.requireClientCert);

    c.authEnabled = GetEnvBoolOrDefault("MCP_AUTH_ENABLED", c.authEnabled);
    c.authToken = GetEnvOrDefault("MCP_AUTH_TOKEN", c.authToken);
    c.rateLimitRequests = nonNegative("MCP_RATE_LIMIT_REQUESTS",
        envInt("MCP_RATE_LIMIT_REQUESTS", static_cast<long long>(c.rateLimitRequests)));
    c.rateLimitWindow = std::chrono::seconds(envInt("MCP_RATE_LIMIT_WINDOW", c.rateLimitWindow.count()));
    c.allowedIps = SplitList(GetEnvOrDefault("MCP_ALLOWED_IPS", ""));
    c.failedAttemptThreshold = nonNegative("MCP_MAX_FAILED_ATTEMPTS",
        envInt("MCP_MAX_FAILED_ATTEMPTS", static_cast<long long>(c.failedAttemptThreshold)));
    c.banDuration = std::chrono::seconds(envInt("MCP_BAN_DURATION", c.banDuration.count()));
    c.maxConnections = nonNegative("MCP_MAX_CONNECTIONS",
        envInt("MCP_MAX_CONNECTIONS", static_cast<long long>(c.maxConnections)));

    c.idleTimeout = std::chrono::seconds(envInt("MCP_REQUEST_TIMEOUT", c.idleTimeout.count()));
    c.maxIdleTimeouts = static_cast<unsigned int>(nonNegative("MCP_MAX_IDLE_TIMEOUTS",
        envInt("MCP_MAX_IDLE_TIMEOUTS", c.maxIdleTimeouts)));
    c.maxLineBytes = nonNegative("MCP_MAX_LINE_BYTES",
        envInt("MCP_MAX_LINE_BYTES", static_cast<long long>(c.maxLineBytes)));

    c.sessionMaxAge = std::chrono::seconds(envInt("MCP_SESSION_MAX_AGE", c.sessionMaxAge.count()));
    c.sessionSweepInterval = std::chrono::seconds(envInt("MCP_SESSION_SWEEP_INTERVAL", c.sessionSweepInterval.count()));
    c.ioThreads = nonNegative("MCP_IO_THREADS", envInt("MCP_IO_THREADS", static_cast<long long>(c.ioThreads)));
    c.workerThreads = nonNegative("MCP_WORKER_THREADS",
        envInt("MCP_WORKER_THREADS", static_cast<long long>(c.workerThreads)));
    c.shutdownGrace = std::chrono::seconds(envInt("MCP_SHUTDOWN_GRACE", c.shutdownGrace.count()));

    c.logLevel = GetEnvOrDefault("MCP_LOG_LEVEL", c.logLevel);
    c.logFile = GetEnvOrDefault("MCP_LOG_FILE", c.logFile);

    c.serverName = GetEnvOrDefault("MCP_SERVER_NAME", c.serverName);
    c.serverDescription = GetEnvOrDefault("MCP_SERVER_DESCRIPTION", c.serverDescription);

    const std::string tools = GetEnvOrDefault("MCP_TOOL_PROVIDERS", "");
    if (!tools.empty()) {
        c.toolProviders = SplitList(tools);
    }
    c.fileRoot = GetEnvOrDefault("MCP_FILE_ROOT", c.fileRoot);
    c.maxFileSize = nonNegative("MCP_MAX_FILE_SIZE",
        envInt("MCP_MAX_FILE_SIZE", static_cast<long long>(c.maxFileSize)));
    c.databaseServiceUrl = GetEnvOrDefault("MCP_DATABASE_SERVICE_URL", c.databaseServiceUrl);
    c.databaseTimeout = std::chrono::seconds(envInt("MCP_DATABASE_SERVICE_TIMEOUT", c.databaseTimeout.count()));
    c.databaseRetryAttempts = static_cast<unsigned int>(nonNegative("MCP_DATABASE_SERVICE_RETRY_ATTEMPTS",
        envInt("MCP_DATABASE_SERVICE_RETRY_ATTEMPTS", c.databaseRetryAttempts)));
    c.redisServiceUrl = GetEnvOrDefault("MCP_REDIS_SERVICE_URL", c.redisServiceUrl);
    return c;
}

void ServerConfig::ApplyCommandLine(int argc, char** argv) {
    if (auto v = getArgValue(argc, argv, "--host")) host = *v;
    if (auto v = getArgValue(argc, argv, "--port")) port = static_cast<int>(parseIntFlag("--port", *v));
    if (auto v = getArgValue(argc, argv, "--ssl-cert")) sslCertFile = *v;
    if (auto v = getArgValue(argc, argv, "--ssl-key")) sslKeyFile = *v;
    if (auto v = getArgValue(argc, argv, "--ssl-ca")) sslCaFile = *v;
    if (auto v = getArgValue(argc, argv, "--auth-enabled")) authEnabled = ParseBoolString(*v, authEnabled);
    if (auto v = getArgValue(argc, argv, "--auth-token")) authToken = *v;
    if (auto v = getArgValue(argc, argv, "--allowed-ips")) allowedIps = SplitList(*v);
    if (auto v = getArgValue(argc, argv, "--max-connections")) {
        maxConnections = nonNegative("--max-connections", parseIntFlag("--max-connections", *v));
    }
    if (auto v = getArgValue(argc, argv, "--log-level")) logLevel = *v;
    if (auto v = getArgValue(argc, argv, "--log-file")) logFile = *v;
    if (auto v = getArgValue(argc, argv, "--tools")) toolProviders = SplitList(*v);
    if (auto v = getArgValue(argc, argv, "--file-root")) fileRoot = *v;
    if (auto v = getArgValue(argc, argv, "--database-url")) databaseServiceUrl = *v;
    if (auto v = getArgValue(argc, argv, "--redis-url")) redisServiceUrl = *v;
}

void ServerConfig::Validate() const {
    if (host.empty()) {
        throw ConfigError("Host is required");
    }
    if (port < 1 || port > 65535) {
        throw ConfigError("Port must be between 1 and 65535, got " + std::to_string(port));
    }
    if (authEnabled && authToken.empty()) {
        throw ConfigError("Authentication is enabled but no auth token is configured (MCP_AUTH_TOKEN)");
    }
    if (sslCertFile.empty() != sslKeyFile.empty()) {
        throw ConfigError("Both SSL certificate and key must be provided together");
    }
    if (requireClientCert && sslCaFile.empty()) {
        throw ConfigError("Client certificate verification requires a CA file (MCP_SSL_CA)");
    }
    if (rateLimitRequests == 0 || rateLimitWindow.count() <= 0) {
        throw ConfigError("Rate limit requests and window must be positive");
    }
    if (maxConnections == 0) {
        throw ConfigError("Max connections must be positive");
    }
    if (maxLineBytes == 0) {
        throw ConfigError("Max line size must be positive");
    }
    if (idleTimeout.count() <= 0) {
        throw ConfigError("Request timeout must be positive");
    }
    if (ioThreads == 0 || workerThreads == 0) {
        throw ConfigError("Thread counts must be positive");
    }
    if (failedAttemptThreshold == 0) {
        throw ConfigError("Failed attempt threshold must be positive");
    }
    if (banDuration.count() < 0 || sessionMaxAge.count() <= 0 || sessionSweepInterval.count() <= 0) {
        throw ConfigError("Ban duration, session max age and sweep interval must not be negative or zero");
    }
    for (const auto& name : toolProviders) {
        if (name != "admin" && name != "files" && name != "database" && name != "redis") {
            throw ConfigError("Unknown tool provider: " + name);
        }
    }
}

} // namespace mcpgate
