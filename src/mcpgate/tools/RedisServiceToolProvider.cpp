//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgate/tools/RedisServiceToolProvider.cpp
// Purpose: Redis tools mapped onto the Redis service's command route
//==========================================================================================================

#include <utility>
#include <variant>

#include <boost/beast/http/verb.hpp>
#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpgate/tools/RedisServiceToolProvider.hpp"

namespace mcpgate::tools {
namespace http = boost::beast::http;

namespace {

JSONValue::Array argList(std::initializer_list<JSONValue> items) {
    JSONValue::Array out;
    for (const auto& item : items) {
        out.push_back(std::make_shared<JSONValue>(item));
    }
    return out;
}

// Copies up to limit entries of a key array and returns the copy with the total length.
std::pair<JSONValue::Array, int64_t> firstKeys(const JSONValue* keys, int64_t limit) {
    JSONValue::Array out;
    if (keys == nullptr || !keys->isArray()) {
        return {out, 0};
    }
    const auto& all = std::get<JSONValue::Array>(keys->value);
    for (const auto& k : all) {
        if (static_cast<int64_t>(out.size()) >= limit) {
            break;
        }
        out.push_back(k);
    }
    return {out, static_cast<int64_t>(all.size())};
}

JSONValue keyListing(JSONValue::Array keys, int64_t total) {
    const auto returned = static_cast<int64_t>(keys.size());
    JSONValue::Object out;
    SetMember(out, "keys", JSONValue(std::move(keys)));
    SetMember(out, "count", JSONValue(returned));
    SetMember(out, "total", JSONValue(total));
    SetMember(out, "truncated", JSONValue(total > returned));
    return JSONValue(std::move(out));
}

std::optional<std::string> keyOf(const JSONValue& args) {
    auto key = GetStringMember(args, "key");
    if (!key.has_value() || key->empty()) {
        return std::nullopt;
    }
    return key;
}

} // namespace

RedisServiceToolProvider::RedisServiceToolProvider(const std::string& url, std::chrono::seconds t, int retries)
    : client("Redis", url, t, retries) {
    LOG_INFO("Redis service tools using {} (timeout {}s)", url, t.count());
}

std::vector<Tool> RedisServiceToolProvider::GetToolDefinitions() const {
    return {
        Tool("redis_health", "Check Redis service health and server statistics", MakeObjectSchema({})),
        Tool("redis_keys", "List keys matching a pattern",
             MakeObjectSchema({{"pattern", "string", "Glob pattern (default *)"},
                               {"limit", "integer", "Maximum keys returned (default 100)"}})),
        Tool("redis_get", "Get the value stored at a key",
             MakeObjectSchema({{"key", "string", "Key name"}}, {"key"})),
        Tool("redis_set", "Set a key, optionally with an expiry",
             MakeObjectSchema({{"key", "string", "Key name"},
                               {"value", "string", "Value to store"},
                               {"expire", "integer", "Expiry in seconds"}},
                              {"key", "value"})),
        Tool("redis_delete", "Delete a key",
             MakeObjectSchema({{"key", "string", "Key name"}}, {"key"})),
        Tool("redis_scan", "Incrementally scan keys matching a pattern",
             MakeObjectSchema({{"pattern", "string", "Glob pattern (default *)"},
                               {"count", "integer", "SCAN COUNT hint (default 10)"},
                               {"limit", "integer", "Maximum keys returned (default 100)"}})),
    };
}

std::optional<ToolHandler> RedisServiceToolProvider::GetHandler(const std::string& name) {
    using Member = ToolResult (RedisServiceToolProvider::*)(const JSONValue&, const ClientSession&) const;
    Member m = nullptr;
    if (name == "redis_health") {
        m = &RedisServiceToolProvider::RedisHealth;
    } else if (name == "redis_keys") {
        m = &RedisServiceToolProvider::RedisKeys;
    } else if (name == "redis_get") {
        m = &RedisServiceToolProvider::RedisGet;
    } else if (name == "redis_set") {
        m = &RedisServiceToolProvider::RedisSet;
    } else if (name == "redis_delete") {
        m = &RedisServiceToolProvider::RedisDelete;
    } else if (name == "redis_scan") {
        m = &RedisServiceToolProvider::RedisScan;
    }
    if (m == nullptr) {
        return std::nullopt;
    }
    return ToolHandler([this, m](const JSONValue& a, const ClientSession& s) { return (this->*m)(a, s); });
}

std::variant<JSONValue, ToolResult> RedisServiceToolProvider::command(const std::string& tool,
                                                                      const std::string& name,
                                                                      JSONValue::Array args,
                                                                      std::optional<int64_t> limit) const {
    JSONValue::Object body;
    SetMember(body, "command", JSONValue(name));
    SetMember(body, "args", JSONValue(std::move(args)));
    if (limit.has_value()) {
        SetMember(body, "limit", JSONValue(limit.value()));
    }
    auto fetched = client.Fetch(tool, http::verb::post, "/redis/command", SerializeJSON(JSONValue(std::move(body))));
    if (auto* failed = std::get_if<ToolResult>(&fetched)) {
        return std::move(*failed);
    }
    const JSONValue& reply = std::get<JSONValue>(fetched);
    if (ServiceReplyIsError(reply)) {
        return MakeTextResult(fmt::format("Redis {} failed: {}", name, SerializeJSON(reply)), true);
    }
    const JSONValue* result = FindMember(reply, "result");
    return result != nullptr ? *result : JSONValue(nullptr);
}

ToolResult RedisServiceToolProvider::RedisHealth(const JSONValue&, const ClientSession&) const {
    auto fetched = client.Fetch("redis_health", http::verb::get, "/admin/health", std::nullopt);
    if (auto* failed = std::get_if<ToolResult>(&fetched)) {
        return std::move(*failed);
    }
    const JSONValue& reply = std::get<JSONValue>(fetched);
    return MakeTextResult(SerializeJSON(reply), ServiceReplyIsError(reply));
}

ToolResult RedisServiceToolProvider::RedisKeys(const JSONValue& args, const ClientSession&) const {
    const std::string pattern = GetStringMember(args, "pattern").value_or("*");
    const int64_t limit = GetIntMember(args, "limit").value_or(100);
    if (limit < 1) {
        return MakeTextResult("Error: limit must be positive", true);
    }
    auto result = command("redis_keys", "KEYS", argList({JSONValue(pattern)}), limit);
    if (auto* failed = std::get_if<ToolResult>(&result)) {
        return std::move(*failed);
    }
    auto [keys, total] = firstKeys(&std::get<JSONValue>(result), limit);
    return MakeTextResult(SerializeJSON(keyListing(std::move(keys), total)));
}

ToolResult RedisServiceToolProvider::RedisGet(const JSONValue& args, const ClientSession&) const {
    auto key = keyOf(args);
    if (!key.has_value()) {
        return MakeTextResult("Error: key is required", true);
    }
    auto result = command("redis_get", "GET", argList({JSONValue(key.value())}));
    if (auto* failed = std::get_if<ToolResult>(&result)) {
        return std::move(*failed);
    }
    const JSONValue& value = std::get<JSONValue>(result);
    if (value.isNull()) {
        return MakeTextResult(fmt::format("Key '{}' not found in Redis", key.value()), true);
    }
    JSONValue::Object out;
    SetMember(out, "key", JSONValue(key.value()));
    SetMember(out, "value", value);
    return MakeTextResult(SerializeJSON(JSONValue(std::move(out))));
}

ToolResult RedisServiceToolProvider::RedisSet(const JSONValue& args, const ClientSession& session) const {
    auto key = keyOf(args);
    if (!key.has_value()) {
        return MakeTextResult("Error: key is required", true);
    }
    auto value = GetStringMember(args, "value");
    if (!value.has_value()) {
        return MakeTextResult("Error: value must be a string", true);
    }
    auto expire = GetIntMember(args, "expire");
    if (expire.has_value() && expire.value() < 1) {
        return MakeTextResult("Error: expire must be a positive number of seconds", true);
    }
    JSONValue::Array commandArgs = argList({JSONValue(key.value()), JSONValue(value.value())});
    if (expire.has_value()) {
        commandArgs.push_back(std::make_shared<JSONValue>("EX"));
        commandArgs.push_back(std::make_shared<JSONValue>(expire.value()));
    }
    LOG_INFO("redis_set {} requested by {}", key.value(), session.clientId);
    auto result = command("redis_set", "SET", std::move(commandArgs));
    if (auto* failed = std::get_if<ToolResult>(&result)) {
        return std::move(*failed);
    }
    const JSONValue& reply = std::get<JSONValue>(result);
    JSONValue::Object out;
    SetMember(out, "key", JSONValue(key.value()));
    SetMember(out, "result", reply.isNull() ? JSONValue("OK") : reply);
    if (expire.has_value()) {
        SetMember(out, "expire", JSONValue(expire.value()));
    }
    return MakeTextResult(SerializeJSON(JSONValue(std::move(out))));
}

ToolResult RedisServiceToolProvider::RedisDelete(const JSONValue& args, const ClientSession& session) const {
    auto key = keyOf(args);
    if (!key.has_value()) {
        return MakeTextResult("Error: key is required", true);
    }
    LOG_INFO("redis_delete {} requested by {}", key.value(), session.clientId);
    auto result = command("redis_delete", "DEL", argList({JSONValue(key.value())}));
    if (auto* failed = std::get_if<ToolResult>(&result)) {
        return std::move(*failed);
    }
    const JSONValue& reply = std::get<JSONValue>(result);
    const auto* deleted = std::get_if<int64_t>(&reply.value);
    if (deleted == nullptr || *deleted == 0) {
        return MakeTextResult(fmt::format("Key '{}' not found in Redis", key.value()), true);
    }
    JSONValue::Object out;
    SetMember(out, "key", JSONValue(key.value()));
    SetMember(out, "deleted", JSONValue(*deleted));
    return MakeTextResult(SerializeJSON(JSONValue(std::move(out))));
}

ToolResult RedisServiceToolProvider::RedisScan(const JSONValue& args, const ClientSession&) const {
    const std::string pattern = GetStringMember(args, "pattern").value_or("*");
    const int64_t count = GetIntMember(args, "count").value_or(10);
    const int64_t limit = GetIntMember(args, "limit").value_or(100);
    if (count < 1 || limit < 1) {
        return MakeTextResult("Error: count and limit must be positive", true);
    }
    auto result = command("redis_scan", "SCAN",
                          argList({JSONValue(int64_t{0}), JSONValue("MATCH"), JSONValue(pattern), JSONValue("COUNT"),
                                   JSONValue(count)}));
    if (auto* failed = std::get_if<ToolResult>(&result)) {
        return std::move(*failed);
    }
    // SCAN replies [cursor, [keys...]].
    const JSONValue& reply = std::get<JSONValue>(result);
    if (!reply.isArray() || std::get<JSONValue::Array>(reply.value).size() != 2) {
        return MakeTextResult("Unexpected SCAN reply from Redis service: " + SerializeJSON(reply), true);
    }
    const auto& pair = std::get<JSONValue::Array>(reply.value);
    auto [keys, total] = firstKeys(pair[1].get(), limit);
    JSONValue listing = keyListing(std::move(keys), total);
    SetMember(std::get<JSONValue::Object>(listing.value), "cursor", *pair[0]);
    return MakeTextResult(SerializeJSON(listing));
}

} // namespace mcpgate::tools
