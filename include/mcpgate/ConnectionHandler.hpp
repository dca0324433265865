//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionHandler.hpp
// Purpose: Per-connection coroutine: admission, line framing, idle watchdog and ordered request handling
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/thread_pool.hpp>

#include "mcpgate/MetricsCollector.hpp"
#include "mcpgate/RequestDispatcher.hpp"
#include "mcpgate/ServerConfig.h"
#include "mcpgate/SessionManager.hpp"
#include "mcpgate/security/SecurityGate.hpp"

namespace mcpgate {

//==========================================================================================================
// ConnectionContext
// Purpose: Services and counters shared by every connection of one ProtocolServer.
// Fields:
//   config: Startup settings (limits, timeouts).
//   gate/sessions/metrics/dispatcher: Shared services; each carries its own lock.
//   workers: Pool on which RequestDispatcher::HandleLine runs so blocking tools do not stall I/O.
//   active: Connections currently holding a slot.
//   running: Cleared by ProtocolServer::Stop; errors seen afterwards are logged at DEBUG only.
//==========================================================================================================
struct ConnectionContext {
    ServerConfig config;
    std::shared_ptr<security::SecurityGate> gate;
    std::shared_ptr<SessionManager> sessions;
    std::shared_ptr<MetricsCollector> metrics;
    std::shared_ptr<RequestDispatcher> dispatcher;
    std::shared_ptr<boost::asio::thread_pool> workers;
    std::atomic<std::size_t> active{0};
    std::atomic<bool> running{false};

    // Takes one of config.maxConnections slots; false when all are in use.
    bool TryAcquireSlot();
    void ReleaseSlot();
};

//==========================================================================================================
// ConnectionHandler
// Purpose: Owns one accepted socket from admission to teardown.
// Notes:
//   - Run() must be spawned on the socket's strand; the idle watchdog shares that strand.
//   - Requests are handled strictly in order: each reply is written before the next line is read.
//   - Teardown (session removal, slot release, connection gauge, socket close) runs on every exit path.
//==========================================================================================================
class ConnectionHandler : public std::enable_shared_from_this<ConnectionHandler> {
public:
    //==========================================================================================================
    // Args:
    //   ctx: Shared server state.
    //   socket: Accepted TCP socket.
    //   tls: Server TLS context, or nullptr for plain TCP. Must outlive the handler.
    //==========================================================================================================
    ConnectionHandler(std::shared_ptr<ConnectionContext> ctx,
                      boost::asio::ip::tcp::socket socket,
                      boost::asio::ssl::context* tls);

    ConnectionHandler(const ConnectionHandler&) = delete;
    ConnectionHandler& operator=(const ConnectionHandler&) = delete;

    boost::asio::awaitable<void> Run();

    // Peer address with IPv4-mapped IPv6 folded to IPv4; empty when the socket has no peer.
    static std::string PeerAddress(const boost::asio::ip::tcp::socket& socket);

private:
    struct IdleState;

    template <typename Stream>
    boost::asio::awaitable<void> serve(Stream& stream);

    static boost::asio::awaitable<void> watchdog(std::shared_ptr<IdleState> idle, std::string clientId,
                                                 std::chrono::seconds timeout, unsigned int maxIdle);

    std::shared_ptr<ConnectionContext> ctx;
    boost::asio::ip::tcp::socket socket;
    boost::asio::ssl::context* tls;
    std::string ip;
};

} // namespace mcpgate
