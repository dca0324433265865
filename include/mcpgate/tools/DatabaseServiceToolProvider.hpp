//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DatabaseServiceToolProvider.hpp
// Purpose: Database tools proxied to an external HTTP/JSON database service (Boost.Beast client)
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
// DatabaseServiceToolProvider
// Purpose: Catalog tools (database_health, database_info, test_connection, list_databases, list_schemas,
//          list_tables), SQL tools (execute_sql, execute_write_sql) and record tools (read_records,
//          read_record, create_record, update_record, upsert_record, delete_record). Each is a single
//          request against the database service.
// Notes:
//   - Connect, resolve and I/O failures are retried; the last error becomes an isError result.
//   - Record routes are /crud/{schema}/{table}/{id}: GET reads, PUT updates, PATCH upserts and DELETE
//     deletes. POST /crud/{schema}/{table} creates.
//   - A reply carrying a top-level "error", or "success": false, or an HTTP status >= 400, is an isError
//     result with the service body as text.
//==========================================================================================================
class DatabaseServiceToolProvider : public IToolProvider {
public:
    //==========================================================================================================
    // Args:
    //   baseUrl: Service address, e.g. http://localhost:8000
    //   timeout: Per-attempt deadline covering connect, write and read.
    //   retries: Attempts per request; values below 1 mean one attempt.
    //==========================================================================================================
    DatabaseServiceToolProvider(const std::string& baseUrl, std::chrono::seconds timeout, int retries);

    std::vector<Tool> GetToolDefinitions() const override;
    std::optional<ToolHandler> GetHandler(const std::string& name) override;

    ToolResult DatabaseHealth(const JSONValue& args, const ClientSession& session) const;
    ToolResult ListDatabases(const JSONValue& args, const ClientSession& session) const;
    ToolResult ListSchemas(const JSONValue& args, const ClientSession& session) const;
    ToolResult ListTables(const JSONValue& args, const ClientSession& session) const;
    ToolResult ExecuteSql(const JSONValue& args, const ClientSession& session) const;
    ToolResult ExecuteWriteSql(const JSONValue& args, const ClientSession& session) const;
    ToolResult ReadRecords(const JSONValue& args, const ClientSession& session) const;
    ToolResult DatabaseInfo(const JSONValue& args, const ClientSession& session) const;
    ToolResult TestConnection(const JSONValue& args, const ClientSession& session) const;
    ToolResult ReadRecord(const JSONValue& args, const ClientSession& session) const;
    ToolResult CreateRecord(const JSONValue& args, const ClientSession& session) const;
    ToolResult UpdateRecord(const JSONValue& args, const ClientSession& session) const;
    ToolResult UpsertRecord(const JSONValue& args, const ClientSession& session) const;
    ToolResult DeleteRecord(const JSONValue& args, const ClientSession& session) const;

    const ServiceClient& Client() const { return client; }

private:
    ToolResult forward(const std::string& tool, boost::beast::http::verb method, const std::string& target,
                       const std::optional<std::string>& jsonBody) const;
    ToolResult forwardSql(const std::string& tool, const std::string& target, const JSONValue& args) const;

    ServiceClient client;
};

} // namespace mcpgate::tools
