//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgate/ProtocolServer.cpp
// Purpose: Listener, accept loop, session sweep and graceful shutdown
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcpgate/ConnectionHandler.hpp"
#include "mcpgate/ProtocolServer.hpp"
#include "mcpgate/version.h"

namespace mcpgate {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

namespace {

std::unique_ptr<ssl::context> makeTlsContext(const ServerConfig& config) {
    auto c = std::make_unique<ssl::context>(ssl::context::tls_server);
    c->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                   ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::single_dh_use);
    ::SSL_CTX_set_min_proto_version(c->native_handle(), TLS1_2_VERSION);
    try {
        c->use_certificate_chain_file(config.sslCertFile);
        c->use_private_key_file(config.sslKeyFile, ssl::context::file_format::pem);
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("ProtocolServer: failed to load certificate/key: {}", e.what());
        throw;
    }
    if (::SSL_CTX_check_private_key(c->native_handle()) != 1) {
        boost::system::error_code ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        LOG_ERROR("ProtocolServer: private key does not match certificate {}", config.sslCertFile);
        throw boost::system::system_error(ec, "SSL_CTX_check_private_key");
    }
    if (!config.sslCaFile.empty()) {
        c->load_verify_file(config.sslCaFile);
        ssl::verify_mode mode = ssl::verify_peer;
        if (config.requireClientCert) {
            mode |= ssl::verify_fail_if_no_peer_cert;
        }
        c->set_verify_mode(mode);
    }
    return c;
}

} // namespace

class ProtocolServer::Impl {
public:
    ServerConfig config;
    ServerServices services;
    std::shared_ptr<ConnectionContext> ctx;

    std::unique_ptr<net::io_context> ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx;
    std::vector<std::thread> ioThreads;
    std::atomic<unsigned short> boundPort{0};
    std::mutex lifecycle;

    Impl(const ServerConfig& c, ServerServices s) : config(c), services(std::move(s)) {
        if (!services.gate) {
            services.gate = security::SecurityGate::FromConfig(config);
        }
        if (!services.sessions) {
            services.sessions = std::make_shared<SessionManager>();
        }
        if (!services.metrics) {
            services.metrics = std::make_shared<MetricsCollector>();
        }
        if (!services.registry) {
            services.registry = std::make_shared<ToolRegistry>();
        }
        ctx = std::make_shared<ConnectionContext>();
        ctx->config = config;
        ctx->gate = services.gate;
        ctx->sessions = services.sessions;
        ctx->metrics = services.metrics;
        ctx->dispatcher = std::make_shared<RequestDispatcher>(
            services.gate, services.sessions, services.metrics, services.registry,
            Implementation(config.serverName, getVersionString(), config.serverDescription));
    }

    net::awaitable<void> acceptLoop() {
        while (ctx->running.load()) {
            tcp::socket socket(net::make_strand(*ioc));
            boost::system::error_code ec;
            co_await acceptor->async_accept(socket, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                if (!ctx->running.load() || ec == net::error::operation_aborted) {
                    LOG_DEBUG("ProtocolServer accept suppressed during shutdown: {}", ec.message());
                    break;
                }
                LOG_WARN("ProtocolServer accept error: {}", ec.message());
                continue;
            }
            auto ex = socket.get_executor();
            auto handler = std::make_shared<ConnectionHandler>(ctx, std::move(socket), sslCtx.get());
            net::co_spawn(ex, [handler]() { return handler->Run(); }, net::detached);
        }
    }

    net::awaitable<void> sweepLoop() {
        net::steady_timer timer(co_await net::this_coro::executor);
        while (ctx->running.load()) {
            timer.expires_after(config.sessionSweepInterval);
            boost::system::error_code ec;
            co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
            if (ec || !ctx->running.load()) {
                break;
            }
            const std::size_t removed = services.sessions->CleanupExpiredSessions(config.sessionMaxAge);
            if (removed > 0) {
                LOG_INFO("Session sweep removed {} expired session(s); {} remain", removed,
                         services.sessions->SessionCount());
            }
            const std::size_t idleKeys = services.gate->Limiter().PruneIdle();
            if (idleKeys > 0) {
                LOG_DEBUG("Session sweep dropped {} idle rate-limit key(s)", idleKeys);
            }
        }
    }

    void start() {
        std::lock_guard<std::mutex> lock(lifecycle);
        if (ctx->running.load()) {
            throw std::logic_error("ProtocolServer already running");
        }
        if (config.port < 0 || config.port > 65535) {
            throw std::invalid_argument("ProtocolServer invalid port (out of range): " + std::to_string(config.port));
        }
        if (config.UsesTls()) {
            sslCtx = makeTlsContext(config);
        }

        ioc = std::make_unique<net::io_context>(static_cast<int>(config.ioThreads));
        tcp::resolver resolver(*ioc);
        auto results = resolver.resolve(config.host, std::to_string(config.port));
        tcp::endpoint ep = *results.begin();

        acceptor = std::make_unique<tcp::acceptor>(net::make_strand(*ioc));
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());

        ctx->workers = std::make_shared<net::thread_pool>(config.workerThreads);
        ctx->running.store(true);

        net::co_spawn(acceptor->get_executor(), acceptLoop(), net::detached);
        net::co_spawn(net::make_strand(*ioc), sweepLoop(), net::detached);

        for (std::size_t i = 0; i < config.ioThreads; ++i) {
            ioThreads.emplace_back([this]() {
                try {
                    ioc->run();
                } catch (const std::exception& e) {
                    LOG_ERROR("ProtocolServer I/O thread terminated: {}", e.what());
                }
            });
        }
        LOG_INFO("{} {} listening on {}:{} ({}; io threads: {}, workers: {}, max connections: {})",
                 config.serverName, getVersionString(), ep.address().to_string(), boundPort.load(),
                 sslCtx ? "TLS" : "plain TCP", config.ioThreads, config.workerThreads, config.maxConnections);
    }

    void stop() {
        std::lock_guard<std::mutex> lock(lifecycle);
        if (!ctx->running.exchange(false)) {
            return;
        }
        LOG_INFO("ProtocolServer stopping; waiting up to {}s for {} connection(s)", config.shutdownGrace.count(),
                 ctx->active.load());
        net::post(acceptor->get_executor(), [this]() {
            boost::system::error_code ec;
            acceptor->close(ec);
        });

        const auto deadline = std::chrono::steady_clock::now() + config.shutdownGrace;
        while (ctx->active.load() > 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (ctx->active.load() > 0) {
            LOG_WARN("ProtocolServer forcing {} connection(s) closed", ctx->active.load());
        }

        ioc->stop();
        for (auto& t : ioThreads) {
            if (t.joinable()) {
                t.join();
            }
        }
        ioThreads.clear();
        // Destroying the pool and then the context unwinds every suspended connection, running its
        // teardown while the sockets' io_context still exists.
        ctx->workers->stop();
        ctx->workers->join();
        ctx->workers.reset();
        acceptor.reset();
        ioc.reset();
        boundPort.store(0);
        LOG_INFO("ProtocolServer stopped");
    }
};

ProtocolServer::ProtocolServer(const ServerConfig& config, ServerServices services)
    : pImpl(std::make_unique<Impl>(config, std::move(services))) {}

ProtocolServer::~ProtocolServer() {
    try {
        pImpl->stop();
    } catch (const std::exception& e) {
        LOG_ERROR("ProtocolServer shutdown error: {}", e.what());
    }
}

void ProtocolServer::Start() {
    FUNC_SCOPE();
    pImpl->start();
}

void ProtocolServer::Stop() {
    FUNC_SCOPE();
    pImpl->stop();
}

unsigned short ProtocolServer::GetPort() const {
    return pImpl->boundPort.load();
}

std::size_t ProtocolServer::ActiveConnections() const {
    return pImpl->ctx->active.load();
}

bool ProtocolServer::IsRunning() const {
    return pImpl->ctx->running.load();
}

const ServerServices& ProtocolServer::Services() const {
    return pImpl->services;
}

} // namespace mcpgate
