//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/FakeHttpService.hpp
// Purpose: In-process Beast HTTP server standing in for the database and Redis services in tests
//==========================================================================================================

#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace mcpgate::test_support {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

struct SeenRequest {
    std::string method;
    std::string target;
    std::string body;
    std::string contentType;
};

//==========================================================================================================
// FakeHttpService
// Purpose: Single-threaded HTTP/1.1 server answering every request with the reply chosen by a callback.
//          One request per connection ("Connection: close").
//==========================================================================================================
class FakeHttpService {
public:
    using Responder = std::function<std::pair<http::status, std::string>(const SeenRequest&)>;

    explicit FakeHttpService(Responder r) : responder(std::move(r)), acceptor(ioc) {
        tcp::endpoint ep(boost::asio::ip::make_address("127.0.0.1"), 0);
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
        worker = std::thread([this]() { serve(); });
    }

    ~FakeHttpService() {
        stopping.store(true);
        boost::system::error_code ec;
        // Wake the blocking accept.
        tcp::socket poke(ioc);
        poke.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port), ec);
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::string Url() const { return "http://127.0.0.1:" + std::to_string(port); }

    std::vector<SeenRequest> Seen() {
        std::lock_guard<std::mutex> lock(mtx);
        return seen;
    }

private:
    void serve() {
        while (!stopping.load()) {
            tcp::socket socket(ioc);
            boost::system::error_code ec;
            acceptor.accept(socket, ec);
            if (ec || stopping.load()) {
                break;
            }
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            http::read(socket, buffer, req, ec);
            if (ec) {
                continue;
            }
            SeenRequest s{std::string(req.method_string()), std::string(req.target()), req.body(),
                          std::string(req[http::field::content_type])};
            {
                std::lock_guard<std::mutex> lock(mtx);
                seen.push_back(s);
            }
            auto [status, body] = responder(s);
            http::response<http::string_body> res{status, 11};
            res.set(http::field::content_type, "application/json");
            res.keep_alive(false);
            res.body() = body;
            res.prepare_payload();
            http::write(socket, res, ec);
            socket.shutdown(tcp::socket::shutdown_both, ec);
        }
    }

    Responder responder;
    boost::asio::io_context ioc;
    tcp::acceptor acceptor;
    unsigned short port{0};
    std::atomic<bool> stopping{false};
    std::thread worker;
    std::mutex mtx;
    std::vector<SeenRequest> seen;
};

// Port with nothing listening on it.
inline unsigned short closedPort() {
    boost::asio::io_context ioc;
    tcp::acceptor acc(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    auto port = acc.local_endpoint().port();
    acc.close();
    return port;
}

} // namespace mcpgate::test_support
