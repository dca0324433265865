//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RedisServiceToolProvider.hpp
// Purpose: Redis key-value tools proxied to the HTTP/JSON Redis service (Boost.Beast client)
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "mcpgate/ToolRegistry.hpp"
#include "mcpgate/tools/ServiceClient.hpp"

namespace mcpgate::tools {

//==========================================================================================================
// RedisServiceToolProvider
// Purpose: redis_health, redis_keys, redis_get, redis_set, redis_delete and redis_scan.
// Notes:
//   - Health is GET /admin/health; every other tool posts {"command", "args"} to /redis/command and reads
//     the "result" member of the reply.
//   - A null GET result or a DEL count of 0 is an isError result naming the key.
//   - redis_keys and redis_scan return at most "limit" keys and report the total seen.
//==========================================================================================================
class RedisServiceToolProvider : public IToolProvider {
public:
    RedisServiceToolProvider(const std::string& baseUrl, std::chrono::seconds timeout, int retries);

    std::vector<Tool> GetToolDefinitions() const override;
    std::optional<ToolHandler> GetHandler(const std::string& name) override;

    ToolResult RedisHealth(const JSONValue& args, const ClientSession& session) const;
    ToolResult RedisKeys(const JSONValue& args, const ClientSession& session) const;
    ToolResult RedisGet(const JSONValue& args, const ClientSession& session) const;
    ToolResult RedisSet(const JSONValue& args, const ClientSession& session) const;
    ToolResult RedisDelete(const JSONValue& args, const ClientSession& session) const;
    ToolResult RedisScan(const JSONValue& args, const ClientSession& session) const;

    const ServiceClient& Client() const { return client; }

private:
    //==========================================================================================================
    // Runs one Redis command through the service.
    // Returns:
    //   The "result" member (null when absent), or an isError result for transport, HTTP or service errors.
    //==========================================================================================================
    std::variant<JSONValue, ToolResult> command(const std::string& tool, const std::string& name,
                                                JSONValue::Array args,
                                                std::optional<int64_t> limit = std::nullopt) const;

    ServiceClient client;
};

} // namespace mcpgate::tools
