//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Startup configuration: defaults, environment/CLI loading and validation
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpgate {

//==========================================================================================================
// ConfigError
// Purpose: Raised for invalid configuration values; fatal only at startup.
//==========================================================================================================
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// ServerConfig
// Purpose: Immutable startup settings shared by ProtocolServer, the security services and tool providers.
// Notes:
//   Fields map to MCP_* environment variables (see LoadFromEnvironment) and --key=value flags
//   (see ApplyCommandLine).
//==========================================================================================================
struct ServerConfig {
    // Listener
    std::string host{"0.0.0.0"};
    int port{3001};
    std::string sslCertFile;
    std::string sslKeyFile;
    std::string sslCaFile;
    bool requireClientCert{false};

    // Admission
    bool authEnabled{true};
    std::string authToken;
    std::size_t rateLimitRequests{100};
    std::chrono::seconds rateLimitWindow{60};
    std::vector<std::string> allowedIps;
    std::size_t failedAttemptThreshold{5};
    std::chrono::seconds banDuration{0};
    std::size_t maxConnections{50};

    // Connection behaviour
    std::chrono::seconds idleTimeout{600};
    unsigned int maxIdleTimeouts{0};
    std::size_t maxLineBytes{1024 * 1024};
    std::chrono::seconds tlsHandshakeTimeout{10};

    // Sessions and lifecycle
    std::chrono::seconds sessionMaxAge{24 * 60 * 60};
    std::chrono::seconds sessionSweepInterval{300};
    std::size_t ioThreads{2};
    std::size_t workerThreads{4};
    std::chrono::seconds shutdownGrace{5};

    // Logging
    std::string logLevel{"INFO"};
    std::string logFile;

    // Identity
    std::string serverName{"mcpgate"};
    std::string serverDescription{"MCP protocol gateway"};

    // Tool providers
    std::vector<std::string> toolProviders{"admin", "files"};
    std::string fileRoot{"."};
    std::size_t maxFileSize{1024 * 1024};
    std::string databaseServiceUrl{"http://localhost:8000"};
    std::chrono::seconds databaseTimeout{30};
    unsigned int databaseRetryAttempts{3};
    // The Redis service shares the database timeout and retry settings.
    std::string redisServiceUrl{"http://localhost:8001"};

    bool UsesTls() const { return !sslCertFile.empty() && !sslKeyFile.empty(); }

    //==========================================================================================================
    // Builds a config from defaults overridden by MCP_* environment variables.
    // Throws:
    //   ConfigError when a numeric variable does not parse.
    //==========================================================================================================
    static ServerConfig LoadFromEnvironment();

    //==========================================================================================================
    // Applies --key=value overrides (--host, --port, --ssl-cert, --ssl-key, --ssl-ca, --auth-enabled,
    // --auth-token, --allowed-ips, --max-connections, --log-level, --log-file, --tools, --file-root,
    // --database-url, --redis-url). Unknown flags are ignored.
    // Throws:
    //   ConfigError when a numeric flag does not parse.
    //==========================================================================================================
    void ApplyCommandLine(int argc, char** argv);

    //==========================================================================================================
    // Checks invariants required before the listener binds.
    // Throws:
    //   ConfigError naming the first violated rule.
    //==========================================================================================================
    void Validate() const;
};

// Splits a comma separated list, trimming blanks and dropping empty items.
std::vector<std::string> SplitList(const std::string& csv);

} // namespace mcpgate
