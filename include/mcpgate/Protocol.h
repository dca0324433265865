//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures, method names and tool result helpers
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace mcpgate {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP protocol revision advertised by initialize
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Server identity reported in initialize.serverInfo
struct Implementation {
    std::string name;
    std::string version;
    std::string description;

    Implementation() = default;
    Implementation(std::string name, std::string version, std::string description = std::string())
        : name(std::move(name)), version(std::move(version)), description(std::move(description)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool definition returned by tools/list. inputSchema is descriptive only.
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

// Result of a tools/call: array of content items plus an error flag.
struct ToolResult {
    std::vector<JSONValue> content;
    bool isError = false;
};

//==========================================================================================================
// SchemaProperty
// Purpose: One entry of a tool input schema's "properties" map.
//==========================================================================================================
struct SchemaProperty {
    std::string name;
    std::string type;          // "string", "integer", "boolean", "object", ...
    std::string description;
};

//==========================================================================================================
// MakeObjectSchema
// Purpose: Builds {type:"object", properties:{...}, required:[...]}.
//==========================================================================================================
JSONValue MakeObjectSchema(const std::vector<SchemaProperty>& properties,
                           const std::vector<std::string>& required = {});

// {type:"text", text}
JSONValue MakeTextContent(const std::string& text);

// ToolResult with a single text item
ToolResult MakeTextResult(const std::string& text, bool isError = false);

// {content:[...], isError?}
JSONValue SerializeToolResult(const ToolResult& result);

// {name, description, inputSchema}
JSONValue SerializeTool(const Tool& tool);

///////////////////////////////////////// Methods ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ListPrompts = "prompts/list";
}

} // namespace mcpgate
