//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServiceClient.hpp
// Purpose: Blocking Boost.Beast HTTP/JSON client shared by the service-backed tool providers
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>

#include <boost/beast/http/verb.hpp>

#include "mcpgate/ToolRegistry.hpp"

namespace mcpgate::tools {

//==========================================================================================================
// ServiceEndpoint
// Purpose: Parsed "http://host[:port][/base]" service address. Only plain http is accepted.
// Throws:
//   std::invalid_argument from ParseServiceEndpoint for another scheme or an empty host.
//==========================================================================================================
struct ServiceEndpoint {
    std::string host;
    std::string port;
    std::string basePath;
};

ServiceEndpoint ParseServiceEndpoint(const std::string& url);

// Percent-encodes everything outside RFC 3986 unreserved characters.
std::string UrlEncode(const std::string& text);

//==========================================================================================================
// ServiceReply
// Purpose: Status code and raw body of one HTTP exchange.
//==========================================================================================================
struct ServiceReply {
    unsigned int status{0};
    std::string body;
};

//==========================================================================================================
// ServiceClient
// Purpose: One HTTP exchange per call against a backing service, with retries on transport failure.
// Notes:
//   - Every request opens its own connection on a private io_context, so tool handlers may share one
//     client across worker threads.
//   - label names the service in log lines and error text ("Database", "Redis").
//==========================================================================================================
class ServiceClient {
public:
    //==========================================================================================================
    // Args:
    //   label:   Service name used in messages.
    //   baseUrl: Service address, e.g. http://localhost:8000
    //   timeout: Per-attempt deadline covering connect, write and read.
    //   retries: Attempts per request; values below 1 mean one attempt.
    //==========================================================================================================
    ServiceClient(std::string label, const std::string& baseUrl, std::chrono::seconds timeout, int retries);

    //==========================================================================================================
    // Sends method to basePath + target, with a JSON body when one is given.
    // Throws:
    //   boost::system::system_error when every attempt fails at the transport level.
    //==========================================================================================================
    ServiceReply Send(boost::beast::http::verb method, const std::string& target,
                      const std::optional<std::string>& jsonBody) const;

    //==========================================================================================================
    // Sends the request and parses the reply.
    // Returns:
    //   The parsed body, or an isError result when the service is unreachable, the body is not JSON or the
    //   status is >= 400.
    //==========================================================================================================
    std::variant<JSONValue, ToolResult> Fetch(const std::string& tool, boost::beast::http::verb method,
                                              const std::string& target,
                                              const std::optional<std::string>& jsonBody) const;

    const ServiceEndpoint& Endpoint() const { return endpoint; }
    const std::string& BaseUrl() const { return baseUrl; }

private:
    std::string label;
    std::string baseUrl;
    ServiceEndpoint endpoint;
    std::chrono::seconds timeout;
    int attempts;
};

// True when the reply carries a non-null "error" or "success": false.
bool ServiceReplyIsError(const JSONValue& reply);

} // namespace mcpgate::tools
