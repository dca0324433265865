//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgate/tools/ServiceClient.cpp
// Purpose: Boost.Beast HTTP client behind the service-backed tools
//==========================================================================================================

#include <cctype>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpgate/tools/ServiceClient.hpp"
#include "mcpgate/version.h"

namespace mcpgate::tools {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

net::awaitable<ServiceReply> exchange(ServiceEndpoint ep, http::request<http::string_body> req,
                                      std::chrono::seconds timeout) {
    auto ex = co_await net::this_coro::executor;
    tcp::resolver resolver(ex);
    auto results = co_await resolver.async_resolve(ep.host, ep.port, net::use_awaitable);

    beast::tcp_stream stream(ex);
    stream.expires_after(timeout);
    co_await stream.async_connect(results, net::use_awaitable);

    stream.expires_after(timeout);
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    co_await http::async_read(stream, buffer, res, net::use_awaitable);

    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return ServiceReply{res.result_int(), std::move(res.body())};
}

} // namespace

ServiceEndpoint ParseServiceEndpoint(const std::string& url) {
    std::size_t pos = 0;
    const std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        const std::string scheme = url.substr(0, schemeEnd);
        if (scheme != "http") {
            throw std::invalid_argument("Unsupported service scheme: " + scheme);
        }
        pos = schemeEnd + 3;
    }
    ServiceEndpoint ep;
    const std::size_t slash = url.find('/', pos);
    std::string hostPort = slash == std::string::npos ? url.substr(pos) : url.substr(pos, slash - pos);
    if (slash != std::string::npos) {
        ep.basePath = url.substr(slash);
        while (!ep.basePath.empty() && ep.basePath.back() == '/') {
            ep.basePath.pop_back();
        }
    }
    const std::size_t colon = hostPort.rfind(':');
    if (colon == std::string::npos) {
        ep.host = hostPort;
        ep.port = "80";
    } else {
        ep.host = hostPort.substr(0, colon);
        ep.port = hostPort.substr(colon + 1);
    }
    if (ep.host.empty()) {
        throw std::invalid_argument("Service URL has no host: " + url);
    }
    if (ep.port.empty()) {
        ep.port = "80";
    }
    return ep;
}

std::string UrlEncode(const std::string& text) {
    std::string out;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out += fmt::format("%{:02X}", static_cast<unsigned int>(c));
        }
    }
    return out;
}

bool ServiceReplyIsError(const JSONValue& reply) {
    if (!reply.isObject()) {
        return false;
    }
    if (const JSONValue* err = FindMember(reply, "error"); err != nullptr && !err->isNull()) {
        return true;
    }
    auto success = GetBoolMember(reply, "success");
    return success.has_value() && !success.value();
}

ServiceClient::ServiceClient(std::string name, const std::string& url, std::chrono::seconds t, int retries)
    : label(std::move(name)),
      baseUrl(url),
      endpoint(ParseServiceEndpoint(url)),
      timeout(t),
      attempts(retries < 1 ? 1 : retries) {}

ServiceReply ServiceClient::Send(http::verb method, const std::string& target,
                                 const std::optional<std::string>& jsonBody) const {
    http::request<http::string_body> req{method, endpoint.basePath + target, 11};
    req.set(http::field::host, endpoint.host);
    req.set(http::field::user_agent, "mcpgate/" + getVersionString());
    req.set(http::field::accept, "application/json");
    req.set(http::field::connection, "close");
    if (jsonBody.has_value()) {
        req.set(http::field::content_type, "application/json");
        req.body() = jsonBody.value();
    }
    req.prepare_payload();

    boost::system::error_code lastError;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        net::io_context ioc;
        std::exception_ptr failure;
        ServiceReply reply;
        net::co_spawn(ioc, exchange(endpoint, req, timeout),
                      [&failure, &reply](std::exception_ptr e, ServiceReply r) {
                          if (e) {
                              failure = e;
                          } else {
                              reply = std::move(r);
                          }
                      });
        ioc.run();
        if (!failure) {
            LOG_DEBUG("{} service {} {} -> {}", label, std::string(req.method_string()), std::string(req.target()),
                      reply.status);
            return reply;
        }
        try {
            std::rethrow_exception(failure);
        } catch (const boost::system::system_error& e) {
            lastError = e.code();
        }
        LOG_WARN("{} service request {} {} failed (attempt {}/{}): {}", label, std::string(req.method_string()),
                 target, attempt, attempts, lastError.message());
        if (attempt < attempts) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100 * attempt));
        }
    }
    throw boost::system::system_error(lastError, label + " service request " + target);
}

std::variant<JSONValue, ToolResult> ServiceClient::Fetch(const std::string& tool, http::verb method,
                                                         const std::string& target,
                                                         const std::optional<std::string>& jsonBody) const {
    ServiceReply reply;
    try {
        reply = Send(method, target, jsonBody);
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("{}: {} service at {} unreachable: {}", tool, label, baseUrl, e.code().message());
        return MakeTextResult(fmt::format("{} service unavailable ({}): {}", label, baseUrl, e.code().message()),
                              true);
    }
    JSONValue parsed;
    try {
        parsed = ParseJSON(reply.body);
    } catch (const JSONParseError& e) {
        return MakeTextResult(fmt::format("Invalid response from {} service (HTTP {}): {}", label, reply.status,
                                          e.what()), true);
    }
    if (reply.status >= 400) {
        return MakeTextResult(fmt::format("{} service returned HTTP {}: {}", label, reply.status, reply.body), true);
    }
    return parsed;
}

} // namespace mcpgate::tools
