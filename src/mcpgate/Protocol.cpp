//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Builders for tool schemas, text content and tool results
//==========================================================================================================

#include "mcpgate/Protocol.h"

namespace mcpgate {

JSONValue MakeObjectSchema(const std::vector<SchemaProperty>& properties,
                           const std::vector<std::string>& required) {
    JSONValue::Object props;
    for (const auto& p : properties) {
        JSONValue::Object prop;
        SetMember(prop, "type", p.type);
        if (!p.description.empty()) {
            SetMember(prop, "description", p.description);
        }
        SetMember(props, p.name, JSONValue(std::move(prop)));
    }
    JSONValue::Array req;
    for (const auto& r : required) {
        req.push_back(std::make_shared<JSONValue>(r));
    }
    JSONValue::Object schema;
    SetMember(schema, "type", "object");
    SetMember(schema, "properties", JSONValue(std::move(props)));
    SetMember(schema, "required", JSONValue(std::move(req)));
    return JSONValue(std::move(schema));
}

JSONValue MakeTextContent(const std::string& text) {
    JSONValue::Object content;
    SetMember(content, "type", "text");
    SetMember(content, "text", text);
    return JSONValue(std::move(content));
}

ToolResult MakeTextResult(const std::string& text, bool isError) {
    ToolResult tr;
    tr.content.push_back(MakeTextContent(text));
    tr.isError = isError;
    return tr;
}

JSONValue SerializeToolResult(const ToolResult& result) {
    JSONValue::Array items;
    for (const auto& c : result.content) {
        items.push_back(std::make_shared<JSONValue>(c));
    }
    JSONValue::Object obj;
    SetMember(obj, "content", JSONValue(std::move(items)));
    if (result.isError) {
        SetMember(obj, "isError", true);
    }
    return JSONValue(std::move(obj));
}

JSONValue SerializeTool(const Tool& tool) {
    JSONValue::Object obj;
    SetMember(obj, "name", tool.name);
    SetMember(obj, "description", tool.description);
    if (tool.inputSchema.isObject()) {
        SetMember(obj, "inputSchema", tool.inputSchema);
    } else {
        SetMember(obj, "inputSchema", MakeObjectSchema({}));
    }
    return JSONValue(std::move(obj));
}

} // namespace mcpgate
