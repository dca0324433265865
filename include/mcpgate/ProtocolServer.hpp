//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolServer.hpp
// Purpose: Line-delimited JSON-RPC listener over TCP or TLS built on Boost.Asio coroutines
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>

#include "mcpgate/MetricsCollector.hpp"
#include "mcpgate/ServerConfig.h"
#include "mcpgate/SessionManager.hpp"
#include "mcpgate/ToolRegistry.hpp"
#include "mcpgate/security/SecurityGate.hpp"

namespace mcpgate {

//==========================================================================================================
// ServerServices
// Purpose: Shared services injected into one ProtocolServer. Null members are built from the config.
//==========================================================================================================
struct ServerServices {
    std::shared_ptr<security::SecurityGate> gate;
    std::shared_ptr<SessionManager> sessions;
    std::shared_ptr<MetricsCollector> metrics;
    std::shared_ptr<ToolRegistry> registry;
};

class ProtocolServer {
public:
    explicit ProtocolServer(const ServerConfig& config, ServerServices services = {});
    ~ProtocolServer();

    ProtocolServer(const ProtocolServer&) = delete;
    ProtocolServer& operator=(const ProtocolServer&) = delete;

    //==========================================================================================================
    // Binds the listener, then runs the accept loop and session sweep on config.ioThreads threads.
    // Throws:
    //   std::invalid_argument for a port outside 0..65535,
    //   boost::system::system_error when resolve/bind/listen or TLS cert/key loading fails,
    //   std::logic_error when already running.
    //==========================================================================================================
    void Start();

    //==========================================================================================================
    // Stops accepting, waits up to config.shutdownGrace for connections to drain, then stops the I/O
    // context and joins all threads. Safe to call more than once.
    //==========================================================================================================
    void Stop();

    // Bound port (useful when configured with port 0); 0 before Start.
    unsigned short GetPort() const;

    std::size_t ActiveConnections() const;
    bool IsRunning() const;

    const ServerServices& Services() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpgate
