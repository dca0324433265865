//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestDispatcher.cpp
// Purpose: RequestDispatcher implementation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

#include "logging/Logger.h"
#include "mcpgate/RequestDispatcher.hpp"
#include "mcpgate/errors/Errors.h"

namespace mcpgate {

namespace {

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string errorReply(const JSONRPCId& id, int code, const std::string& message) {
    return errors::makeErrorResponse(id, errors::makeError(code, message))->Serialize();
}

bool isKnownMethod(const std::string& m) {
    return m == Methods::Initialize || m == Methods::Initialized || m == Methods::Ping || m == Methods::ListTools ||
           m == Methods::CallTool || m == Methods::ListResources || m == Methods::ListPrompts;
}

} // namespace

RequestDispatcher::RequestDispatcher(std::shared_ptr<security::SecurityGate> g,
                                     std::shared_ptr<SessionManager> s,
                                     std::shared_ptr<MetricsCollector> m,
                                     std::shared_ptr<ToolRegistry> r,
                                     Implementation info)
    : gate(std::move(g)), sessions(std::move(s)), metrics(std::move(m)), registry(std::move(r)),
      serverInfo(std::move(info)) {
    if (!gate || !sessions || !metrics || !registry) {
        throw std::invalid_argument("RequestDispatcher requires gate, sessions, metrics and registry");
    }
}

DispatchOutcome RequestDispatcher::HandleLine(const std::string& line, const std::shared_ptr<ClientSession>& session) {
    FUNC_SCOPE();
    DispatchOutcome outcome;
    std::string text = line;
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }
    if (isBlank(text)) {
        return outcome;
    }

    JSONRPCRequest request;
    std::string parseError;
    switch (ParseRequestLine(text, request, parseError)) {
        case RequestParseStatus::Ok:
            break;
        case RequestParseStatus::InvalidJson:
            LOG_WARN("Parse error from {} ({}): {}", session->ipAddress, session->clientId, parseError);
            outcome.reply = errorReply(nullptr, JSONRPCErrorCodes::ParseError, "Parse error");
            return outcome;
        case RequestParseStatus::NotAnObject:
        case RequestParseStatus::InvalidId:
            LOG_WARN("Invalid request from {}: {}", session->ipAddress, parseError);
            outcome.reply = errorReply(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
            return outcome;
        case RequestParseStatus::MissingMethod:
            if (request.id.has_value()) {
                outcome.reply = errorReply(request.id.value(), JSONRPCErrorCodes::InvalidRequest,
                                           "Invalid Request: missing method");
            } else {
                LOG_DEBUG("Dropping message without id or method from {}", session->ipAddress);
            }
            return outcome;
    }

    try {
        return process(request, session);
    } catch (const std::exception& e) {
        LOG_ERROR("Internal error handling {} from {}: {}", request.method, session->ipAddress, e.what());
        if (!request.IsNotification()) {
            outcome.reply = errorReply(request.id.value(), JSONRPCErrorCodes::InternalError,
                                       std::string("Internal error: ") + e.what());
        }
        return outcome;
    }
}

DispatchOutcome RequestDispatcher::process(const JSONRPCRequest& request,
                                           const std::shared_ptr<ClientSession>& session) {
    DispatchOutcome outcome;
    const std::string& ip = session->ipAddress;
    const bool notification = request.IsNotification();

    auto limit = gate->CheckRateLimit(ip);
    if (!limit.allowed) {
        LOG_WARN("Rate limit exceeded for {} (method {})", ip, request.method);
        if (!notification) {
            outcome.reply = errorReply(request.id.value(), JSONRPCErrorCodes::RateLimitExceeded, limit.reason);
        }
        return outcome;
    }

    if (gate->AuthRequired() && !session->authenticated) {
        auto auth = gate->Authenticate(ip, request.authToken);
        if (!auth.allowed) {
            LOG_WARN("Authentication failed for {} ({}): {}", ip, session->clientId, auth.reason);
            if (!notification) {
                outcome.reply = errorReply(request.id.value(), JSONRPCErrorCodes::AuthenticationFailed, auth.reason);
            }
            outcome.closeConnection = gate->Filter().IsBlocked(ip);
            return outcome;
        }
        sessions->MarkAuthenticated(session);
        LOG_INFO("Client {} authenticated from {}", session->clientId, ip);
    }

    sessions->UpdateSession(session);

    std::string metricName = isKnownMethod(request.method) ? request.method : std::string(UnknownMethodMetric);
    bool success = true;
    std::optional<JSONValue> result;
    std::unique_ptr<JSONRPCResponse> failure;
    const auto started = std::chrono::steady_clock::now();
    try {
        result = dispatch(request, session, metricName, success);
    } catch (const DispatchError& e) {
        success = false;
        failure = errors::makeErrorResponse(request.id.value_or(JSONRPCId(nullptr)),
                                            errors::makeError(e.code, e.what()));
    } catch (const std::exception& e) {
        success = false;
        LOG_ERROR("Internal error handling {} from {}: {}", request.method, ip, e.what());
        failure = errors::makeErrorResponse(
            request.id.value_or(JSONRPCId(nullptr)),
            errors::makeError(JSONRPCErrorCodes::InternalError, std::string("Internal error: ") + e.what()));
    }
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    metrics->RecordRequest(metricName, elapsed, success);

    if (notification) {
        return outcome;
    }
    if (failure) {
        outcome.reply = failure->Serialize();
    } else {
        JSONRPCResponse response(request.id.value(), std::move(result.value()));
        outcome.reply = response.Serialize();
    }
    return outcome;
}

JSONValue RequestDispatcher::dispatch(const JSONRPCRequest& request, const std::shared_ptr<ClientSession>& session,
                                      std::string& metricName, bool& success) {
    const std::string& m = request.method;
    LOG_DEBUG("Dispatching {} for {}", m, session->clientId);
    if (m == Methods::Initialize) {
        return handleInitialize(request, session);
    }
    if (m == Methods::Initialized) {
        LOG_INFO("Client {} finished initialization", session->clientId);
        return JSONValue(JSONValue::Object{});
    }
    if (m == Methods::Ping) {
        return JSONValue(JSONValue::Object{});
    }
    if (m == Methods::ListTools) {
        return handleToolsList();
    }
    if (m == Methods::CallTool) {
        return handleToolsCall(request, session, metricName, success);
    }
    if (m == Methods::ListResources) {
        JSONValue::Object o;
        SetMember(o, "resources", JSONValue(JSONValue::Array{}));
        return JSONValue(std::move(o));
    }
    if (m == Methods::ListPrompts) {
        JSONValue::Object o;
        SetMember(o, "prompts", JSONValue(JSONValue::Array{}));
        return JSONValue(std::move(o));
    }
    throw DispatchError(JSONRPCErrorCodes::MethodNotFound, "Method not found: " + m);
}

JSONValue RequestDispatcher::handleInitialize(const JSONRPCRequest& request,
                                              const std::shared_ptr<ClientSession>& session) {
    if (request.params.has_value()) {
        if (const JSONValue* info = FindMember(request.params.value(), "clientInfo")) {
            auto name = GetStringMember(*info, "name");
            auto version = GetStringMember(*info, "version");
            if (name.has_value()) {
                std::string ua = name.value();
                if (version.has_value() && !version->empty()) {
                    ua += "/" + version.value();
                }
                sessions->SetUserAgent(session, ua);
                LOG_INFO("Client {} identified as {}", session->clientId, ua);
            }
        }
    }

    JSONValue::Object capabilities;
    SetMember(capabilities, "tools", JSONValue(JSONValue::Object{}));

    JSONValue::Object info;
    SetMember(info, "name", JSONValue(serverInfo.name));
    SetMember(info, "version", JSONValue(serverInfo.version));
    if (!serverInfo.description.empty()) {
        SetMember(info, "description", JSONValue(serverInfo.description));
    }

    JSONValue::Object result;
    SetMember(result, "protocolVersion", JSONValue(PROTOCOL_VERSION));
    SetMember(result, "capabilities", JSONValue(std::move(capabilities)));
    SetMember(result, "serverInfo", JSONValue(std::move(info)));
    return JSONValue(std::move(result));
}

JSONValue RequestDispatcher::handleToolsList() {
    JSONValue::Array tools;
    for (const auto& t : registry->ListTools()) {
        tools.push_back(std::make_shared<JSONValue>(SerializeTool(t)));
    }
    JSONValue::Object result;
    SetMember(result, "tools", JSONValue(std::move(tools)));
    return JSONValue(std::move(result));
}

JSONValue RequestDispatcher::handleToolsCall(const JSONRPCRequest& request,
                                             const std::shared_ptr<ClientSession>& session,
                                             std::string& metricName, bool& success) {
    const JSONValue params = request.params.value_or(JSONValue(JSONValue::Object{}));
    auto name = GetStringMember(params, "name");
    if (!name.has_value() || name->empty()) {
        throw DispatchError(JSONRPCErrorCodes::InvalidParams, "Invalid params: missing tool name");
    }
    metricName = registry->HasTool(name.value()) ? name.value() : std::string(UnknownToolMetric);

    JSONValue arguments{JSONValue::Object{}};
    if (const JSONValue* a = FindMember(params, "arguments")) {
        if (a->isObject()) {
            arguments = *a;
        } else if (!a->isNull()) {
            throw DispatchError(JSONRPCErrorCodes::InvalidParams, "Invalid params: arguments must be an object");
        }
    }

    ToolResult result;
    try {
        result = registry->CallTool(name.value(), arguments, *session);
    } catch (const std::exception& e) {
        LOG_ERROR("Tool {} failed for {}: {}", name.value(), session->clientId, e.what());
        result = MakeTextResult(std::string("Internal error: ") + e.what(), true);
    }
    success = !result.isError;
    return SerializeToolResult(result);
}

} // namespace mcpgate
