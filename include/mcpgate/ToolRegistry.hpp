//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.hpp
// Purpose: Name -> (definition, handler) table for tools/list and tools/call
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpgate/ClientSession.h"
#include "mcpgate/Protocol.h"

namespace mcpgate {

//==========================================================================================================
// ToolHandler
// Purpose: Executes one tool. Runs on the worker pool and may block. Exceptions are turned into isError
//          results by the dispatcher.
// Args:
//   arguments: params.arguments of the tools/call request (an object, {} when absent).
//   session: Snapshot of the calling session.
//==========================================================================================================
using ToolHandler = std::function<ToolResult(const JSONValue& arguments, const ClientSession& session)>;

//==========================================================================================================
// IToolProvider
// Purpose: A family of tools contributed to the registry as one unit (admin, files, database, redis).
//==========================================================================================================
class IToolProvider {
public:
    virtual ~IToolProvider() = default;

    // Definitions in the order they should appear in tools/list.
    virtual std::vector<Tool> GetToolDefinitions() const = 0;

    // Handler for one of the names returned by GetToolDefinitions; nullopt for anything else.
    virtual std::optional<ToolHandler> GetHandler(const std::string& name) = 0;
};

class ToolRegistry {
public:
    ToolRegistry() = default;
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    //==========================================================================================================
    // Adds or replaces a tool. Registration is expected before the server starts.
    // Throws:
    //   std::invalid_argument when the name is empty or the handler is empty.
    //==========================================================================================================
    void RegisterTool(const Tool& tool, ToolHandler handler);

    //==========================================================================================================
    // Registers every tool of provider and keeps the provider alive for the registry lifetime.
    // Returns:
    //   Number of tools registered.
    //==========================================================================================================
    std::size_t AddProvider(std::shared_ptr<IToolProvider> provider);

    // Definitions in registration order.
    std::vector<Tool> ListTools() const;

    bool HasTool(const std::string& name) const;

    std::size_t Size() const;

    //==========================================================================================================
    // Runs the named tool.
    // Returns:
    //   The handler's result, or an isError "Unknown tool: <name>" result.
    // Notes:
    //   Handler exceptions propagate; the caller owns the error mapping.
    //==========================================================================================================
    ToolResult CallTool(const std::string& name, const JSONValue& arguments, const ClientSession& session) const;

private:
    struct Entry {
        Tool tool;
        ToolHandler handler;
    };

    mutable std::shared_mutex mtx;
    std::unordered_map<std::string, Entry> entries;
    std::vector<std::string> order;
    std::vector<std::shared_ptr<IToolProvider>> providers;
};

} // namespace mcpgate
