//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: ToolRegistry implementation
//==========================================================================================================

#include <mutex>
#include <stdexcept>

#include "logging/Logger.h"
#include "mcpgate/ToolRegistry.hpp"

namespace mcpgate {

void ToolRegistry::RegisterTool(const Tool& tool, ToolHandler handler) {
    FUNC_SCOPE();
    if (tool.name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler must not be empty: " + tool.name);
    }
    LOG_DEBUG("Registering tool: {}", tool.name);
    std::unique_lock<std::shared_mutex> lock(mtx);
    auto it = entries.find(tool.name);
    if (it == entries.end()) {
        order.push_back(tool.name);
        entries.emplace(tool.name, Entry{tool, std::move(handler)});
    } else {
        LOG_WARN("Replacing tool: {}", tool.name);
        it->second = Entry{tool, std::move(handler)};
    }
}

std::size_t ToolRegistry::AddProvider(std::shared_ptr<IToolProvider> provider) {
    if (!provider) {
        throw std::invalid_argument("Tool provider must not be null");
    }
    std::size_t added = 0;
    for (const auto& def : provider->GetToolDefinitions()) {
        auto handler = provider->GetHandler(def.name);
        if (!handler.has_value()) {
            LOG_WARN("Provider declared tool '{}' without a handler; skipping", def.name);
            continue;
        }
        RegisterTool(def, std::move(handler.value()));
        ++added;
    }
    std::unique_lock<std::shared_mutex> lock(mtx);
    providers.push_back(std::move(provider));
    return added;
}

std::vector<Tool> ToolRegistry::ListTools() const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    std::vector<Tool> out;
    out.reserve(order.size());
    for (const auto& name : order) {
        out.push_back(entries.at(name).tool);
    }
    return out;
}

bool ToolRegistry::HasTool(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    return entries.find(name) != entries.end();
}

std::size_t ToolRegistry::Size() const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    return entries.size();
}

ToolResult ToolRegistry::CallTool(const std::string& name, const JSONValue& arguments,
                                  const ClientSession& session) const {
    ToolHandler handler;
    {
        std::shared_lock<std::shared_mutex> lock(mtx);
        auto it = entries.find(name);
        if (it == entries.end()) {
            LOG_WARN("Unknown tool requested: {}", name);
            return MakeTextResult("Unknown tool: " + name, true);
        }
        handler = it->second.handler;
    }
    return handler(arguments, session);
}

} // namespace mcpgate
