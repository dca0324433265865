//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgate/tools/DatabaseServiceToolProvider.cpp
// Purpose: Database tools mapped onto the database service's admin and CRUD routes
//==========================================================================================================

#include <utility>
#include <variant>

#include <boost/beast/http/verb.hpp>
#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpgate/tools/DatabaseServiceToolProvider.hpp"

namespace mcpgate::tools {
namespace http = boost::beast::http;

namespace {

// Wraps the named array member of a listing reply as {key: [...], count: n}.
JSONValue withCount(const JSONValue& reply, const std::string& key) {
    JSONValue::Array items;
    if (const JSONValue* v = FindMember(reply, key); v != nullptr && v->isArray()) {
        items = std::get<JSONValue::Array>(v->value);
    }
    const auto count = static_cast<int64_t>(items.size());
    JSONValue::Object out;
    SetMember(out, key, JSONValue(std::move(items)));
    SetMember(out, "count", JSONValue(count));
    return JSONValue(std::move(out));
}

std::string sqlBody(const std::string& sql, const JSONValue* parameters) {
    JSONValue::Object body;
    SetMember(body, "sql", JSONValue(sql));
    if (parameters != nullptr && !parameters->isNull()) {
        body["parameters"] = std::make_shared<JSONValue>(*parameters);
    }
    return SerializeJSON(JSONValue(std::move(body)));
}

// Record ids arrive as strings or integers.
std::optional<std::string> recordIdOf(const JSONValue& args) {
    const JSONValue* v = FindMember(args, "record_id");
    if (v == nullptr) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&v->value); s != nullptr && !s->empty()) {
        return *s;
    }
    if (const auto* i = std::get_if<int64_t>(&v->value)) {
        return std::to_string(*i);
    }
    return std::nullopt;
}

std::string dataBody(const JSONValue& data) {
    JSONValue::Object body;
    SetMember(body, "data", data);
    return SerializeJSON(JSONValue(std::move(body)));
}

// Validates schema_name and table_name and returns "/crud/{schema}/{table}", or the error text.
std::variant<std::string, ToolResult> tableTarget(const JSONValue& args) {
    auto schema = GetStringMember(args, "schema_name");
    auto table = GetStringMember(args, "table_name");
    if (!schema.has_value() || schema->empty()) {
        return MakeTextResult("Error: schema_name is required", true);
    }
    if (!table.has_value() || table->empty()) {
        return MakeTextResult("Error: table_name is required", true);
    }
    return fmt::format("/crud/{}/{}", UrlEncode(schema.value()), UrlEncode(table.value()));
}

const JSONValue* recordData(const JSONValue& args) {
    const JSONValue* data = FindMember(args, "data");
    if (data == nullptr || !data->isObject() || std::get<JSONValue::Object>(data->value).empty()) {
        return nullptr;
    }
    return data;
}

} // namespace

DatabaseServiceToolProvider::DatabaseServiceToolProvider(const std::string& url, std::chrono::seconds t,
                                                         int retries)
    : client("Database", url, t, retries) {
    LOG_INFO("Database service tools using {} (timeout {}s, {} attempt(s))", url, t.count(), retries < 1 ? 1 : retries);
}

std::vector<Tool> DatabaseServiceToolProvider::GetToolDefinitions() const {
    return {
        Tool("database_health", "Check database service health and connectivity", MakeObjectSchema({})),
        Tool("list_databases", "List databases known to the database service", MakeObjectSchema({})),
        Tool("list_schemas", "List schemas in the database", MakeObjectSchema({})),
        Tool("list_tables", "List tables, optionally limited to one schema",
             MakeObjectSchema({{"schema_name", "string", "Schema to list"}})),
        Tool("execute_sql", "Execute a read-only SQL query",
             MakeObjectSchema({{"sql", "string", "SQL query"},
                               {"parameters", "object", "Named query parameters"}},
                              {"sql"})),
        Tool("execute_write_sql", "Execute a SQL write statement (INSERT, UPDATE, DELETE)",
             MakeObjectSchema({{"sql", "string", "SQL statement"},
                               {"parameters", "object", "Named statement parameters"}},
                              {"sql"})),
        Tool("read_records", "Read rows from a table with paging",
             MakeObjectSchema({{"schema_name", "string", "Schema name"},
                               {"table_name", "string", "Table name"},
                               {"limit", "integer", "Maximum rows (default 100)"},
                               {"offset", "integer", "Rows to skip (default 0)"},
                               {"order_by", "string", "Column to order by"}},
                              {"schema_name", "table_name"})),
        Tool("database_info", "Show database server version, size and connection details", MakeObjectSchema({})),
        Tool("test_connection", "Run a round trip against the database through the service", MakeObjectSchema({})),
        Tool("read_record", "Read one record by id",
             MakeObjectSchema({{"schema_name", "string", "Schema name"},
                               {"table_name", "string", "Table name"},
                               {"record_id", "string", "Record id"}},
                              {"schema_name", "table_name", "record_id"})),
        Tool("create_record", "Insert a record",
             MakeObjectSchema({{"schema_name", "string", "Schema name"},
                               {"table_name", "string", "Table name"},
                               {"data", "object", "Column values"}},
                              {"schema_name", "table_name", "data"})),
        Tool("update_record", "Update columns of an existing record",
             MakeObjectSchema({{"schema_name", "string", "Schema name"},
                               {"table_name", "string", "Table name"},
                               {"record_id", "string", "Record id"},
                               {"data", "object", "Columns to change"}},
                              {"schema_name", "table_name", "record_id", "data"})),
        Tool("upsert_record", "Update a record, inserting it when the id does not exist",
             MakeObjectSchema({{"schema_name", "string", "Schema name"},
                               {"table_name", "string", "Table name"},
                               {"record_id", "string", "Record id"},
                               {"data", "object", "Column values"}},
                              {"schema_name", "table_name", "record_id", "data"})),
        Tool("delete_record", "Delete a record by id",
             MakeObjectSchema({{"schema_name", "string", "Schema name"},
                               {"table_name", "string", "Table name"},
                               {"record_id", "string", "Record id"}},
                              {"schema_name", "table_name", "record_id"})),
    };
}

std::optional<ToolHandler> DatabaseServiceToolProvider::GetHandler(const std::string& name) {
    using Member = ToolResult (DatabaseServiceToolProvider::*)(const JSONValue&, const ClientSession&) const;
    Member m = nullptr;
    if (name == "database_health") {
        m = &DatabaseServiceToolProvider::DatabaseHealth;
    } else if (name == "list_databases") {
        m = &DatabaseServiceToolProvider::ListDatabases;
    } else if (name == "list_schemas") {
        m = &DatabaseServiceToolProvider::ListSchemas;
    } else if (name == "list_tables") {
        m = &DatabaseServiceToolProvider::ListTables;
    } else if (name == "execute_sql") {
        m = &DatabaseServiceToolProvider::ExecuteSql;
    } else if (name == "execute_write_sql") {
        m = &DatabaseServiceToolProvider::ExecuteWriteSql;
    } else if (name == "read_records") {
        m = &DatabaseServiceToolProvider::ReadRecords;
    } else if (name == "database_info") {
        m = &DatabaseServiceToolProvider::DatabaseInfo;
    } else if (name == "test_connection") {
        m = &DatabaseServiceToolProvider::TestConnection;
    } else if (name == "read_record") {
        m = &DatabaseServiceToolProvider::ReadRecord;
    } else if (name == "create_record") {
        m = &DatabaseServiceToolProvider::CreateRecord;
    } else if (name == "update_record") {
        m = &DatabaseServiceToolProvider::UpdateRecord;
    } else if (name == "upsert_record") {
        m = &DatabaseServiceToolProvider::UpsertRecord;
    } else if (name == "delete_record") {
        m = &DatabaseServiceToolProvider::DeleteRecord;
    }
    if (m == nullptr) {
        return std::nullopt;
    }
    return ToolHandler([this, m](const JSONValue& a, const ClientSession& s) { return (this->*m)(a, s); });
}

ToolResult DatabaseServiceToolProvider::forward(const std::string& tool, http::verb method, const std::string& target,
                                                const std::optional<std::string>& jsonBody) const {
    auto fetched = client.Fetch(tool, method, target, jsonBody);
    if (auto* failed = std::get_if<ToolResult>(&fetched)) {
        return std::move(*failed);
    }
    const JSONValue& parsed = std::get<JSONValue>(fetched);
    if (tool == "list_databases") {
        return MakeTextResult(SerializeJSON(withCount(parsed, "databases")), ServiceReplyIsError(parsed));
    }
    if (tool == "list_schemas") {
        return MakeTextResult(SerializeJSON(withCount(parsed, "schemas")), ServiceReplyIsError(parsed));
    }
    return MakeTextResult(SerializeJSON(parsed), ServiceReplyIsError(parsed));
}

ToolResult DatabaseServiceToolProvider::forwardSql(const std::string& tool, const std::string& target,
                                                   const JSONValue& args) const {
    auto sql = GetStringMember(args, "sql");
    if (!sql.has_value() || sql->empty()) {
        return MakeTextResult("Error: sql is required", true);
    }
    const JSONValue* parameters = FindMember(args, "parameters");
    if (parameters != nullptr && !parameters->isNull() && !parameters->isObject()) {
        return MakeTextResult("Error: parameters must be an object", true);
    }
    return forward(tool, http::verb::post, target, sqlBody(sql.value(), parameters));
}

ToolResult DatabaseServiceToolProvider::DatabaseHealth(const JSONValue&, const ClientSession&) const {
    return forward("database_health", http::verb::get, "/admin/health", std::nullopt);
}

ToolResult DatabaseServiceToolProvider::ListDatabases(const JSONValue&, const ClientSession&) const {
    return forward("list_databases", http::verb::get, "/admin/databases", std::nullopt);
}

ToolResult DatabaseServiceToolProvider::ListSchemas(const JSONValue&, const ClientSession&) const {
    return forward("list_schemas", http::verb::get, "/admin/schemas", std::nullopt);
}

ToolResult DatabaseServiceToolProvider::ListTables(const JSONValue& args, const ClientSession&) const {
    std::string target = "/admin/tables";
    if (auto schema = GetStringMember(args, "schema_name"); schema.has_value() && !schema->empty()) {
        target += "/" + UrlEncode(schema.value());
    }
    return forward("list_tables", http::verb::get, target, std::nullopt);
}

ToolResult DatabaseServiceToolProvider::ExecuteSql(const JSONValue& args, const ClientSession& session) const {
    LOG_INFO("execute_sql requested by {} ({})", session.clientId, session.ipAddress);
    return forwardSql("execute_sql", "/crud/raw-sql", args);
}

ToolResult DatabaseServiceToolProvider::ExecuteWriteSql(const JSONValue& args, const ClientSession& session) const {
    LOG_WARN("execute_write_sql requested by {} ({})", session.clientId, session.ipAddress);
    return forwardSql("execute_write_sql", "/crud/raw-sql/write", args);
}

ToolResult DatabaseServiceToolProvider::ReadRecords(const JSONValue& args, const ClientSession&) const {
    auto table = tableTarget(args);
    if (auto* invalid = std::get_if<ToolResult>(&table)) {
        return std::move(*invalid);
    }
    const int64_t limit = GetIntMember(args, "limit").value_or(100);
    const int64_t offset = GetIntMember(args, "offset").value_or(0);
    if (limit < 1 || offset < 0) {
        return MakeTextResult("Error: limit must be positive and offset non-negative", true);
    }
    std::string target = fmt::format("{}?limit={}&offset={}", std::get<std::string>(table), limit, offset);
    if (auto orderBy = GetStringMember(args, "order_by"); orderBy.has_value() && !orderBy->empty()) {
        target += "&order_by=" + UrlEncode(orderBy.value());
    }
    return forward("read_records", http::verb::get, target, std::nullopt);
}

ToolResult DatabaseServiceToolProvider::DatabaseInfo(const JSONValue&, const ClientSession&) const {
    return forward("database_info", http::verb::get, "/admin/db-info", std::nullopt);
}

ToolResult DatabaseServiceToolProvider::TestConnection(const JSONValue&, const ClientSession&) const {
    return forward("test_connection", http::verb::get, "/admin/test-connection", std::nullopt);
}

ToolResult DatabaseServiceToolProvider::ReadRecord(const JSONValue& args, const ClientSession&) const {
    auto table = tableTarget(args);
    if (auto* invalid = std::get_if<ToolResult>(&table)) {
        return std::move(*invalid);
    }
    auto id = recordIdOf(args);
    if (!id.has_value()) {
        return MakeTextResult("Error: record_id is required", true);
    }
    return forward("read_record", http::verb::get, std::get<std::string>(table) + "/" + UrlEncode(id.value()),
                   std::nullopt);
}

ToolResult DatabaseServiceToolProvider::CreateRecord(const JSONValue& args, const ClientSession& session) const {
    auto table = tableTarget(args);
    if (auto* invalid = std::get_if<ToolResult>(&table)) {
        return std::move(*invalid);
    }
    const JSONValue* data = recordData(args);
    if (data == nullptr) {
        return MakeTextResult("Error: data must be a non-empty object", true);
    }
    LOG_INFO("create_record on {} requested by {} ({})", std::get<std::string>(table), session.clientId,
             session.ipAddress);
    return forward("create_record", http::verb::post, std::get<std::string>(table), dataBody(*data));
}

ToolResult DatabaseServiceToolProvider::UpdateRecord(const JSONValue& args, const ClientSession& session) const {
    auto table = tableTarget(args);
    if (auto* invalid = std::get_if<ToolResult>(&table)) {
        return std::move(*invalid);
    }
    auto id = recordIdOf(args);
    if (!id.has_value()) {
        return MakeTextResult("Error: record_id is required", true);
    }
    const JSONValue* data = recordData(args);
    if (data == nullptr) {
        return MakeTextResult("Error: data must be a non-empty object", true);
    }
    LOG_INFO("update_record {} on {} requested by {}", id.value(), std::get<std::string>(table), session.clientId);
    return forward("update_record", http::verb::put, std::get<std::string>(table) + "/" + UrlEncode(id.value()),
                   dataBody(*data));
}

ToolResult DatabaseServiceToolProvider::UpsertRecord(const JSONValue& args, const ClientSession& session) const {
    auto table = tableTarget(args);
    if (auto* invalid = std::get_if<ToolResult>(&table)) {
        return std::move(*invalid);
    }
    auto id = recordIdOf(args);
    if (!id.has_value()) {
        return MakeTextResult("Error: record_id is required", true);
    }
    const JSONValue* data = recordData(args);
    if (data == nullptr) {
        return MakeTextResult("Error: data must be a non-empty object", true);
    }
    LOG_INFO("upsert_record {} on {} requested by {}", id.value(), std::get<std::string>(table), session.clientId);
    auto fetched = client.Fetch("upsert_record", http::verb::patch,
                                std::get<std::string>(table) + "/" + UrlEncode(id.value()), dataBody(*data));
    if (auto* failed = std::get_if<ToolResult>(&fetched)) {
        return std::move(*failed);
    }
    JSONValue reply = std::move(std::get<JSONValue>(fetched));
    if (ServiceReplyIsError(reply) || !reply.isObject()) {
        return MakeTextResult(SerializeJSON(reply), ServiceReplyIsError(reply));
    }
    // "updated" tells whether the id existed; surface it as an explicit operation.
    const bool updated = GetBoolMember(reply, "updated").value_or(false);
    auto& members = std::get<JSONValue::Object>(reply.value);
    SetMember(members, "operation", JSONValue(updated ? "updated" : "inserted"));
    return MakeTextResult(SerializeJSON(reply), false);
}

ToolResult DatabaseServiceToolProvider::DeleteRecord(const JSONValue& args, const ClientSession& session) const {
    auto table = tableTarget(args);
    if (auto* invalid = std::get_if<ToolResult>(&table)) {
        return std::move(*invalid);
    }
    auto id = recordIdOf(args);
    if (!id.has_value()) {
        return MakeTextResult("Error: record_id is required", true);
    }
    LOG_WARN("delete_record {} on {} requested by {} ({})", id.value(), std::get<std::string>(table),
             session.clientId, session.ipAddress);
    return forward("delete_record", http::verb::delete_, std::get<std::string>(table) + "/" + UrlEncode(id.value()),
                   std::nullopt);
}

} // namespace mcpgate::tools
