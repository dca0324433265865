//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_tool_registry.cpp
// Purpose: GoogleTests for tool registration, provider composition and invocation
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "mcpgate/ToolRegistry.hpp"

using namespace mcpgate;

namespace {

std::string textOf(const ToolResult& r) {
    if (r.content.empty()) {
        return std::string();
    }
    return GetStringMember(r.content.front(), "text").value_or("");
}

//==========================================================================================================
// CountingProvider
// Purpose: Two tools, one of which is declared without a handler.
//==========================================================================================================
class CountingProvider : public IToolProvider {
public:
    std::vector<Tool> GetToolDefinitions() const override {
        return {Tool("count", "Counts calls", MakeObjectSchema({})),
                Tool("ghost", "Declared without a handler", MakeObjectSchema({}))};
    }
    std::optional<ToolHandler> GetHandler(const std::string& name) override {
        if (name != "count") {
            return std::nullopt;
        }
        return ToolHandler([this](const JSONValue&, const ClientSession&) {
            return MakeTextResult(std::to_string(++calls));
        });
    }
    int calls{0};
};

} // namespace

TEST(ToolRegistry, RegisterListAndCall) {
    ToolRegistry registry;
    registry.RegisterTool(Tool("b", "second"), [](const JSONValue&, const ClientSession&) { return MakeTextResult("B"); });
    registry.RegisterTool(Tool("a", "first"), [](const JSONValue& args, const ClientSession&) {
        return MakeTextResult(GetStringMember(args, "v").value_or("none"));
    });
    auto tools = registry.ListTools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "b");
    EXPECT_EQ(tools[1].name, "a");

    ClientSession session;
    JSONValue::Object args;
    SetMember(args, "v", JSONValue("hello"));
    auto r = registry.CallTool("a", JSONValue(args), session);
    EXPECT_FALSE(r.isError);
    EXPECT_EQ(textOf(r), "hello");
}

TEST(ToolRegistry, UnknownToolIsErrorResult) {
    ToolRegistry registry;
    ClientSession session;
    auto r = registry.CallTool("missing", JSONValue(JSONValue::Object{}), session);
    EXPECT_TRUE(r.isError);
    EXPECT_EQ(textOf(r), "Unknown tool: missing");
}

TEST(ToolRegistry, RejectsEmptyNameOrHandler) {
    ToolRegistry registry;
    EXPECT_THROW(registry.RegisterTool(Tool("", "x"), [](const JSONValue&, const ClientSession&) { return ToolResult{}; }),
                 std::invalid_argument);
    EXPECT_THROW(registry.RegisterTool(Tool("x", "x"), ToolHandler{}), std::invalid_argument);
    EXPECT_THROW(registry.AddProvider(nullptr), std::invalid_argument);
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(ToolRegistry, ReplacingKeepsPosition) {
    ToolRegistry registry;
    registry.RegisterTool(Tool("one", "v1"), [](const JSONValue&, const ClientSession&) { return MakeTextResult("1"); });
    registry.RegisterTool(Tool("two", "v1"), [](const JSONValue&, const ClientSession&) { return MakeTextResult("2"); });
    registry.RegisterTool(Tool("one", "v2"), [](const JSONValue&, const ClientSession&) { return MakeTextResult("1b"); });
    auto tools = registry.ListTools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "one");
    EXPECT_EQ(tools[0].description, "v2");
    ClientSession session;
    EXPECT_EQ(textOf(registry.CallTool("one", JSONValue(JSONValue::Object{}), session)), "1b");
}

TEST(ToolRegistry, ProviderToolsAreRegistered) {
    ToolRegistry registry;
    auto provider = std::make_shared<CountingProvider>();
    EXPECT_EQ(registry.AddProvider(provider), 1u);
    EXPECT_TRUE(registry.HasTool("count"));
    EXPECT_FALSE(registry.HasTool("ghost"));
    ClientSession session;
    registry.CallTool("count", JSONValue(JSONValue::Object{}), session);
    auto r = registry.CallTool("count", JSONValue(JSONValue::Object{}), session);
    EXPECT_EQ(textOf(r), "2");
    EXPECT_EQ(provider->calls, 2);
}

TEST(ToolRegistry, HandlerExceptionsPropagate) {
    ToolRegistry registry;
    registry.RegisterTool(Tool("boom", "throws"), [](const JSONValue&, const ClientSession&) -> ToolResult {
        throw std::runtime_error("kaput");
    });
    ClientSession session;
    EXPECT_THROW(registry.CallTool("boom", JSONValue(JSONValue::Object{}), session), std::runtime_error);
}
