//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgate/ConnectionHandler.cpp
// Purpose: Coroutine implementation of one client connection (plain TCP or TLS)
//==========================================================================================================

#include <functional>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include "logging/Logger.h"
#include "mcpgate/ConnectionHandler.hpp"

namespace mcpgate {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

bool ConnectionContext::TryAcquireSlot() {
    std::size_t current = active.load();
    while (current < config.maxConnections) {
        if (active.compare_exchange_weak(current, current + 1)) {
            return true;
        }
    }
    return false;
}

void ConnectionContext::ReleaseSlot() {
    std::size_t current = active.load();
    while (current > 0 && !active.compare_exchange_weak(current, current - 1)) {
    }
}

//==========================================================================================================
// IdleState
// Purpose: Shared between the read loop and the watchdog; both run on the connection strand.
//==========================================================================================================
struct ConnectionHandler::IdleState {
    explicit IdleState(const net::any_io_executor& ex) : timer(ex) {}

    net::steady_timer timer;
    std::chrono::steady_clock::time_point lastActivity{std::chrono::steady_clock::now()};
    unsigned int consecutive{0};
    bool done{false};
    std::function<void()> close;
};

ConnectionHandler::ConnectionHandler(std::shared_ptr<ConnectionContext> c, tcp::socket s, ssl::context* t)
    : ctx(std::move(c)), socket(std::move(s)), tls(t) {}

std::string ConnectionHandler::PeerAddress(const tcp::socket& sock) {
    boost::system::error_code ec;
    auto ep = sock.remote_endpoint(ec);
    if (ec) {
        return std::string();
    }
    auto addr = ep.address();
    if (addr.is_v6() && addr.to_v6().is_v4_mapped()) {
        return net::ip::make_address_v4(net::ip::v4_mapped, addr.to_v6()).to_string();
    }
    return addr.to_string();
}

net::awaitable<void> ConnectionHandler::Run() {
    auto self = shared_from_this();
    ip = PeerAddress(socket);
    if (ip.empty()) {
        boost::system::error_code ec;
        socket.close(ec);
        co_return;
    }

    auto admission = ctx->gate->CheckConnection(ip);
    if (!admission.allowed) {
        LOG_WARN("Rejected connection from {}: {}", ip, admission.reason);
        boost::system::error_code ec;
        socket.close(ec);
        co_return;
    }
    if (!ctx->TryAcquireSlot()) {
        LOG_WARN("Rejected connection from {}: connection limit ({}) reached", ip, ctx->config.maxConnections);
        boost::system::error_code ec;
        socket.close(ec);
        co_return;
    }
    ctx->metrics->RecordConnectionChange(1);

    // Slot and gauge are released on every path out of here, including a failed handshake.
    struct SlotGuard {
        ConnectionContext& c;
        const std::string& peer;
        ~SlotGuard() {
            c.ReleaseSlot();
            c.metrics->RecordConnectionChange(-1);
            LOG_INFO("Connection from {} closed ({} active)", peer, c.active.load());
        }
    } slotGuard{*ctx, ip};

    try {
        if (tls == nullptr) {
            co_await serve(socket);
            co_return;
        }

        ssl::stream<tcp::socket> stream(std::move(socket), *tls);
        net::steady_timer deadline(co_await net::this_coro::executor);
        deadline.expires_after(ctx->config.tlsHandshakeTimeout);
        auto& lowest = stream.lowest_layer();
        deadline.async_wait([&lowest](const boost::system::error_code& ec) {
            if (!ec) {
                boost::system::error_code ignored;
                lowest.close(ignored);
            }
        });
        boost::system::error_code ec;
        co_await stream.async_handshake(ssl::stream_base::server, net::redirect_error(net::use_awaitable, ec));
        deadline.cancel();
        if (ec) {
            LOG_WARN("TLS handshake with {} failed: {}", ip, ec.message());
            co_return;
        }
        co_await serve(stream);
    } catch (const boost::system::system_error& e) {
        if (!ctx->running.load()) {
            LOG_DEBUG("Connection {} error suppressed during shutdown: {}", ip, e.what());
        } else {
            LOG_ERROR("Connection {} error: {}", ip, e.what());
        }
    } catch (const std::exception& e) {
        if (!ctx->running.load()) {
            LOG_DEBUG("Connection {} error suppressed during shutdown: {}", ip, e.what());
        } else {
            LOG_ERROR("Connection {} error: {}", ip, e.what());
        }
    }
}

template <typename Stream>
net::awaitable<void> ConnectionHandler::serve(Stream& stream) {
    auto session = ctx->sessions->CreateSession(ip);
    if (!ctx->gate->AuthRequired()) {
        ctx->sessions->MarkAuthenticated(session);
    }
    LOG_INFO("Client connected: {} from {}", session->clientId, ip);

    struct SessionGuard {
        ConnectionContext& c;
        Stream& s;
        const std::string id;
        ~SessionGuard() {
            c.sessions->RemoveSession(id);
            boost::system::error_code ec;
            s.lowest_layer().shutdown(tcp::socket::shutdown_both, ec);
            s.lowest_layer().close(ec);
            LOG_INFO("Client disconnected: {}", id);
        }
    } sessionGuard{*ctx, stream, session->clientId};

    auto ex = co_await net::this_coro::executor;
    auto idle = std::make_shared<IdleState>(ex);
    idle->close = [&stream]() {
        boost::system::error_code ec;
        stream.lowest_layer().close(ec);
    };
    net::co_spawn(ex, watchdog(idle, session->clientId, ctx->config.idleTimeout, ctx->config.maxIdleTimeouts),
                  net::detached);
    struct WatchdogStop {
        std::shared_ptr<IdleState> idle;
        ~WatchdogStop() {
            idle->done = true;
            idle->timer.cancel();
        }
    } watchdogStop{idle};

    auto dispatcher = ctx->dispatcher;
    auto handle = [&](std::string line) -> net::awaitable<bool> {
        auto outcome = co_await net::co_spawn(
            ctx->workers->get_executor(),
            [dispatcher, session, line = std::move(line)]() -> net::awaitable<DispatchOutcome> {
                co_return dispatcher->HandleLine(line, session);
            },
            net::use_awaitable);
        if (outcome.reply.has_value()) {
            std::string out = std::move(outcome.reply.value());
            out.push_back('\n');
            boost::system::error_code ec;
            co_await net::async_write(stream, net::buffer(out), net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                LOG_WARN("Write to {} failed: {}", session->clientId, ec.message());
                co_return false;
            }
        }
        if (outcome.closeConnection) {
            LOG_WARN("Closing connection {}: {} is now blocked", session->clientId, ip);
            co_return false;
        }
        co_return true;
    };

    std::string buffer;
    for (;;) {
        boost::system::error_code ec;
        std::size_t n = co_await net::async_read_until(
            stream, net::dynamic_buffer(buffer, ctx->config.maxLineBytes), '\n',
            net::redirect_error(net::use_awaitable, ec));
        if (!ec) {
            idle->lastActivity = std::chrono::steady_clock::now();
            idle->consecutive = 0;
            std::string line = buffer.substr(0, n - 1);
            buffer.erase(0, n);
            if (!co_await handle(std::move(line))) {
                break;
            }
            if (!ctx->running.load()) {
                break;
            }
            continue;
        }
        if (ec == net::error::eof || ec == ssl::error::stream_truncated) {
            if (!buffer.empty()) {
                std::string last;
                last.swap(buffer);
                co_await handle(std::move(last));
            }
            LOG_DEBUG("Client {} closed the connection", session->clientId);
        } else if (ec == net::error::not_found) {
            LOG_WARN("Client {} exceeded the {} byte line limit; closing", session->clientId,
                     ctx->config.maxLineBytes);
        } else if (ec == net::error::operation_aborted || !ctx->running.load()) {
            LOG_DEBUG("Read on {} aborted: {}", session->clientId, ec.message());
        } else {
            LOG_WARN("Read from {} failed: {}", session->clientId, ec.message());
        }
        break;
    }
}

net::awaitable<void> ConnectionHandler::watchdog(std::shared_ptr<IdleState> idle, std::string clientId,
                                                 std::chrono::seconds timeout, unsigned int maxIdle) {
    while (!idle->done) {
        idle->timer.expires_at(idle->lastActivity + timeout);
        boost::system::error_code ec;
        co_await idle->timer.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (idle->done) {
            break;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now - idle->lastActivity < timeout) {
            continue;
        }
        ++idle->consecutive;
        idle->lastActivity = now;
        LOG_INFO("Client {} idle for {}s (consecutive idle periods: {})", clientId, timeout.count(),
                 idle->consecutive);
        if (maxIdle > 0 && idle->consecutive >= maxIdle) {
            LOG_WARN("Closing idle client {} after {} idle periods", clientId, idle->consecutive);
            idle->close();
            break;
        }
    }
}

} // namespace mcpgate
