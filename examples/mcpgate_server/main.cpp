//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcpgate server executable: config, logging, tool providers, listener and signal-driven shutdown
//==========================================================================================================

#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/system_error.hpp>

#include "logging/Logger.h"
#include "mcpgate/ProtocolServer.hpp"
#include "mcpgate/ServerConfig.h"
#include "mcpgate/version.h"
#include "mcpgate/tools/AdminToolProvider.hpp"
#include "mcpgate/tools/DatabaseServiceToolProvider.hpp"
#include "mcpgate/tools/RedisServiceToolProvider.hpp"
#include "mcpgate/tools/FileToolProvider.hpp"

using namespace mcpgate;

static void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [--key=value ...]\n"
              << "\n"
              << "Options (each overrides the matching MCP_* environment variable):\n"
              << "  --host=ADDR            Listen address (MCP_HOST, default 0.0.0.0)\n"
              << "  --port=N               Listen port (MCP_PORT, default 3001)\n"
              << "  --ssl-cert=FILE        PEM certificate chain; enables TLS with --ssl-key\n"
              << "  --ssl-key=FILE         PEM private key\n"
              << "  --ssl-ca=FILE          CA bundle for client certificate verification\n"
              << "  --auth-enabled=BOOL    Require an auth_token on requests (MCP_AUTH_ENABLED)\n"
              << "  --auth-token=TOKEN     Shared secret clients must present (MCP_AUTH_TOKEN)\n"
              << "  --allowed-ips=LIST     Comma separated addresses or CIDR blocks (MCP_ALLOWED_IPS)\n"
              << "  --max-connections=N    Concurrent connection limit (MCP_MAX_CONNECTIONS)\n"
              << "  --log-level=LEVEL      DEBUG, INFO, WARN or ERROR (MCP_LOG_LEVEL)\n"
              << "  --log-file=FILE        Also append log lines to FILE (MCP_LOG_FILE)\n"
              << "  --tools=LIST           Providers to load: admin, files, database, redis\n"
              << "                         (MCP_TOOL_PROVIDERS)\n"
              << "  --file-root=DIR        Root directory for file tools (MCP_FILE_ROOT)\n"
              << "  --database-url=URL     Database service address (MCP_DATABASE_SERVICE_URL)\n"
              << "  --redis-url=URL        Redis service address (MCP_REDIS_SERVICE_URL)\n"
              << "  --help                 Show this text\n"
              << "  --version              Print the version\n";
}

static bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && std::strcmp(argv[i], flag) == 0) {
            return true;
        }
    }
    return false;
}

//==========================================================================================================
// Registers the providers named in config.toolProviders.
// Returns:
//   Number of tools registered.
//==========================================================================================================
static std::size_t registerProviders(const ServerConfig& config, const ServerServices& services) {
    std::size_t total = 0;
    for (const auto& name : config.toolProviders) {
        std::size_t added = 0;
        if (name == "admin") {
            added = services.registry->AddProvider(std::make_shared<tools::AdminToolProvider>(
                services.metrics, services.sessions, config.maxConnections));
        } else if (name == "files") {
            added = services.registry->AddProvider(
                std::make_shared<tools::FileToolProvider>(config.fileRoot, config.maxFileSize));
        } else if (name == "database") {
            added = services.registry->AddProvider(std::make_shared<tools::DatabaseServiceToolProvider>(
                config.databaseServiceUrl, config.databaseTimeout, static_cast<int>(config.databaseRetryAttempts)));
        } else if (name == "redis") {
            added = services.registry->AddProvider(std::make_shared<tools::RedisServiceToolProvider>(
                config.redisServiceUrl, config.databaseTimeout, static_cast<int>(config.databaseRetryAttempts)));
        }
        LOG_INFO("Tool provider '{}' registered {} tool(s)", name, added);
        total += added;
    }
    return total;
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help")) {
        printUsage(argv[0]);
        return 0;
    }
    if (hasFlag(argc, argv, "--version")) {
        std::cout << "mcpgate " << getVersionString() << std::endl;
        return 0;
    }

    ServerConfig config;
    try {
        config = ServerConfig::LoadFromEnvironment();
        config.ApplyCommandLine(argc, argv);
        config.Validate();
    } catch (const ConfigError& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid configuration value: {}", e.what());
        return 1;
    }

    Logger::setLogLevelFromString(config.logLevel);
    if (!config.logFile.empty() && !Logger::setLogFile(config.logFile)) {
        LOG_WARN("Continuing without log file {}", config.logFile);
    }
    FUNC_SCOPE();

    try {
        ServerServices services;
        services.gate = security::SecurityGate::FromConfig(config);
        services.sessions = std::make_shared<SessionManager>();
        services.metrics = std::make_shared<MetricsCollector>();
        services.registry = std::make_shared<ToolRegistry>();
        const std::size_t toolCount = registerProviders(config, services);

        ProtocolServer server(config, services);
        server.Start();
        LOG_INFO("mcpgate {} ready with {} tool(s) on port {}", getVersionString(), toolCount, server.GetPort());

        boost::asio::io_context signals;
        boost::asio::signal_set set(signals, SIGINT, SIGTERM);
        set.async_wait([&server](const boost::system::error_code& ec, int signo) {
            if (ec) {
                return;
            }
            LOG_INFO("Received signal {}; shutting down", signo);
            server.Stop();
        });
        signals.run();
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("Server failed: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Server failed: {}", e.what());
        return 1;
    }
    LOG_INFO("mcpgate exited cleanly");
    return 0;
}
