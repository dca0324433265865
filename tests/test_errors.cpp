//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>

#include "mcpgate/JSONRPCTypes.h"
#include "mcpgate/RequestDispatcher.hpp"
#include "mcpgate/errors/Errors.h"

using namespace mcpgate;

TEST(Errors, CategoryMapping) {
    using mcpgate::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::RateLimitExceeded), ErrorCategory::RateLimited);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::AuthenticationFailed),
              ErrorCategory::AuthenticationFailed);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, ErrorValueRoundTripKeepsData) {
    auto err = errors::makeError(JSONRPCErrorCodes::InvalidParams, "bad");
    JSONValue::Object detail;
    SetMember(detail, "field", JSONValue("name"));
    err.data = JSONValue(detail);
    auto parsed = errors::mcpErrorFromErrorValue(errors::makeErrorValue(err));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, -32602);
    EXPECT_EQ(parsed->category, errors::ErrorCategory::JsonRpcInvalidParams);
    ASSERT_TRUE(parsed->data.has_value());
    EXPECT_EQ(GetStringMember(parsed->data.value(), "field").value_or(""), "name");
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue("not an object")).has_value());
}

//=============================== Dispatcher negative-path replies =================================

TEST(ErrorsDispatch, RejectionsParseAsTypedErrors) {
    auto filter = std::make_shared<security::IPFilter>();
    auto limiter = std::make_shared<security::RateLimiter>(1, std::chrono::seconds(60));
    auto gate = std::make_shared<security::SecurityGate>(filter, limiter, nullptr, false);
    auto sessions = std::make_shared<SessionManager>();
    RequestDispatcher dispatcher(gate, sessions, std::make_shared<MetricsCollector>(),
                                 std::make_shared<ToolRegistry>(), Implementation("t", "1"));
    auto session = sessions->CreateSession("10.1.1.1");

    auto first = dispatcher.HandleLine(R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{}})", session);
    ASSERT_TRUE(first.reply.has_value());
    JSONRPCResponse r1;
    ASSERT_TRUE(r1.Deserialize(first.reply.value()));
    auto e1 = errors::mcpErrorFromResponse(r1);
    ASSERT_TRUE(e1.has_value());
    EXPECT_EQ(e1->category, errors::ErrorCategory::JsonRpcInvalidParams);
    EXPECT_FALSE(e1->data.has_value());

    auto second = dispatcher.HandleLine(R"({"jsonrpc":"2.0","id":2,"method":"ping"})", session);
    ASSERT_TRUE(second.reply.has_value());
    JSONRPCResponse r2;
    ASSERT_TRUE(r2.Deserialize(second.reply.value()));
    auto e2 = errors::mcpErrorFromResponse(r2);
    ASSERT_TRUE(e2.has_value());
    EXPECT_EQ(e2->category, errors::ErrorCategory::RateLimited);
    EXPECT_EQ(std::get<int64_t>(r2.id), 2);
}
