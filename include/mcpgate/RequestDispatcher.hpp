//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestDispatcher.hpp
// Purpose: Per-line protocol logic: parse, rate limit, authenticate, dispatch and map errors
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "mcpgate/ClientSession.h"
#include "mcpgate/JSONRPCTypes.h"
#include "mcpgate/MetricsCollector.hpp"
#include "mcpgate/Protocol.h"
#include "mcpgate/SessionManager.hpp"
#include "mcpgate/ToolRegistry.hpp"
#include "mcpgate/security/SecurityGate.hpp"

namespace mcpgate {

//==========================================================================================================
// DispatchOutcome
// Purpose: What the connection should do after one line.
// Fields:
//   reply: Serialized response to write (without the trailing newline); nullopt means stay silent.
//   closeConnection: Set when the peer was just banned; the reply is written first.
//==========================================================================================================
struct DispatchOutcome {
    std::optional<std::string> reply;
    bool closeConnection{false};
};

//==========================================================================================================
// RequestDispatcher
// Purpose: Stateless with respect to connections; every call receives the session it acts on.
//          Runs on the worker pool, so tool handlers may block.
//==========================================================================================================
class RequestDispatcher {
public:
    RequestDispatcher(std::shared_ptr<security::SecurityGate> gate,
                      std::shared_ptr<SessionManager> sessions,
                      std::shared_ptr<MetricsCollector> metrics,
                      std::shared_ptr<ToolRegistry> registry,
                      Implementation serverInfo);

    //==========================================================================================================
    // Processes one frame.
    // Args:
    //   line: Frame text without '\n'; a trailing '\r' is tolerated.
    //   session: Session of the connection the line arrived on.
    // Returns:
    //   The reply (if any) and whether the connection must close afterwards.
    // Notes:
    //   Never throws; every failure past parsing becomes a JSON-RPC error or an isError tool result.
    //   Per-tool metrics are keyed by registered tool or known method name; anything else is counted
    //   under UnknownToolMetric or UnknownMethodMetric.
    //==========================================================================================================
    DispatchOutcome HandleLine(const std::string& line, const std::shared_ptr<ClientSession>& session);

    const Implementation& ServerInfo() const { return serverInfo; }

    // Metric keys for names the server does not know, so clients cannot add keys of their own.
    static constexpr const char* UnknownToolMetric = "<unknown-tool>";
    static constexpr const char* UnknownMethodMetric = "<unknown-method>";

private:
    DispatchOutcome process(const JSONRPCRequest& request, const std::shared_ptr<ClientSession>& session);
    JSONValue dispatch(const JSONRPCRequest& request, const std::shared_ptr<ClientSession>& session,
                       std::string& metricName, bool& success);
    JSONValue handleInitialize(const JSONRPCRequest& request, const std::shared_ptr<ClientSession>& session);
    JSONValue handleToolsList();
    JSONValue handleToolsCall(const JSONRPCRequest& request, const std::shared_ptr<ClientSession>& session,
                              std::string& metricName, bool& success);

    std::shared_ptr<security::SecurityGate> gate;
    std::shared_ptr<SessionManager> sessions;
    std::shared_ptr<MetricsCollector> metrics;
    std::shared_ptr<ToolRegistry> registry;
    Implementation serverInfo;
};

//==========================================================================================================
// DispatchError
// Purpose: Raised inside dispatch for protocol errors that carry their own code (e.g. -32602).
//==========================================================================================================
class DispatchError : public std::runtime_error {
public:
    DispatchError(int code, const std::string& message) : std::runtime_error(message), code(code) {}
    int code;
};

} // namespace mcpgate
