//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_database_provider.cpp
// Purpose: GoogleTests for DatabaseServiceToolProvider against an in-process Beast HTTP server
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "FakeHttpService.hpp"
#include "mcpgate/tools/DatabaseServiceToolProvider.hpp"

using namespace mcpgate;
using namespace mcpgate::tools;
using mcpgate::test_support::FakeHttpService;
using mcpgate::test_support::SeenRequest;
using mcpgate::test_support::closedPort;
namespace http = boost::beast::http;

namespace {

std::string textOf(const ToolResult& r) {
    return r.content.empty() ? std::string() : GetStringMember(r.content.front(), "text").value_or("");
}

JSONValue object(std::initializer_list<std::pair<const char*, JSONValue>> kv) {
    JSONValue::Object o;
    for (const auto& [k, v] : kv) {
        SetMember(o, k, v);
    }
    return JSONValue(std::move(o));
}

} // namespace

TEST(ServiceEndpoint, ParsesHostPortAndBase) {
    auto a = ParseServiceEndpoint("http://db.internal:8000/api/");
    EXPECT_EQ(a.host, "db.internal");
    EXPECT_EQ(a.port, "8000");
    EXPECT_EQ(a.basePath, "/api");
    auto b = ParseServiceEndpoint("localhost");
    EXPECT_EQ(b.host, "localhost");
    EXPECT_EQ(b.port, "80");
    EXPECT_EQ(b.basePath, "");
    EXPECT_THROW(ParseServiceEndpoint("https://secure:443"), std::invalid_argument);
    EXPECT_THROW(ParseServiceEndpoint("http://:8000"), std::invalid_argument);
}

TEST(ServiceEndpoint, UrlEncodeEscapesReserved) {
    EXPECT_EQ(UrlEncode("public"), "public");
    EXPECT_EQ(UrlEncode("a b/c&d"), "a%20b%2Fc%26d");
}

TEST(DatabaseTools, ListDatabasesAddsCount) {
    FakeHttpService svc([](const SeenRequest&) {
        return std::make_pair(http::status::ok, std::string(R"({"databases":["main","audit"]})"));
    });
    DatabaseServiceToolProvider db(svc.Url(), std::chrono::seconds(5), 1);
    auto r = db.ListDatabases(JSONValue(JSONValue::Object{}), ClientSession{});
    ASSERT_FALSE(r.isError) << textOf(r);
    JSONValue v = ParseJSON(textOf(r));
    EXPECT_EQ(GetIntMember(v, "count").value_or(0), 2);
    auto seen = svc.Seen();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].method, "GET");
    EXPECT_EQ(seen[0].target, "/admin/databases");
}

TEST(DatabaseTools, ListTablesForSchema) {
    FakeHttpService svc([](const SeenRequest&) {
        return std::make_pair(http::status::ok, std::string(R"({"tables":["users"]})"));
    });
    DatabaseServiceToolProvider db(svc.Url(), std::chrono::seconds(5), 1);
    auto r = db.ListTables(object({{"schema_name", JSONValue("sales data")}}), ClientSession{});
    ASSERT_FALSE(r.isError);
    EXPECT_EQ(svc.Seen().at(0).target, "/admin/tables/sales%20data");
}

TEST(DatabaseTools, ExecuteSqlPostsJsonBody) {
    FakeHttpService svc([](const SeenRequest&) {
        return std::make_pair(http::status::ok, std::string(R"({"success":true,"rows":[[1]]})"));
    });
    DatabaseServiceToolProvider db(svc.Url(), std::chrono::seconds(5), 1);
    JSONValue::Object params;
    SetMember(params, "id", JSONValue(int64_t{42}));
    auto r = db.ExecuteSql(object({{"sql", JSONValue("SELECT :id")}, {"parameters", JSONValue(params)}}),
                           ClientSession{});
    ASSERT_FALSE(r.isError) << textOf(r);
    auto seen = svc.Seen();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].method, "POST");
    EXPECT_EQ(seen[0].target, "/crud/raw-sql");
    EXPECT_EQ(seen[0].contentType, "application/json");
    JSONValue body = ParseJSON(seen[0].body);
    EXPECT_EQ(GetStringMember(body, "sql").value_or(""), "SELECT :id");
    const JSONValue* p = FindMember(body, "parameters");
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(GetIntMember(*p, "id").value_or(0), 42);
}

TEST(DatabaseTools, WriteSqlUsesWriteEndpointAndReportsServiceErrors) {
    FakeHttpService svc([](const SeenRequest&) {
        return std::make_pair(http::status::ok, std::string(R"({"success":false,"error":"read-only replica"})"));
    });
    DatabaseServiceToolProvider db(svc.Url(), std::chrono::seconds(5), 1);
    auto r = db.ExecuteWriteSql(object({{"sql", JSONValue("DELETE FROM t")}}), ClientSession{});
    EXPECT_TRUE(r.isError);
    EXPECT_NE(textOf(r).find("read-only replica"), std::string::npos);
    EXPECT_EQ(svc.Seen().at(0).target, "/crud/raw-sql/write");
}

TEST(DatabaseTools, ReadRecordsBuildsQuery) {
    FakeHttpService svc([](const SeenRequest&) {
        return std::make_pair(http::status::ok, std::string(R"({"records":[]})"));
    });
    DatabaseServiceToolProvider db(svc.Url(), std::chrono::seconds(5), 1);
    auto r = db.ReadRecords(object({{"schema_name", JSONValue("public")},
                                    {"table_name", JSONValue("users")},
                                    {"limit", JSONValue(int64_t{10})},
                                    {"order_by", JSONValue("id")}}),
                            ClientSession{});
    ASSERT_FALSE(r.isError) << textOf(r);
    EXPECT_EQ(svc.Seen().at(0).target, "/crud/public/users?limit=10&offset=0&order_by=id");
}

TEST(DatabaseTools, MissingArgumentsDoNotCallService) {
    FakeHttpService svc([](const SeenRequest&) {
        return std::make_pair(http::status::ok, std::string("{}"));
    });
    DatabaseServiceToolProvider db(svc.Url(), std::chrono::seconds(5), 1);
    EXPECT_TRUE(db.ExecuteSql(JSONValue(JSONValue::Object{}), ClientSession{}).isError);
    EXPECT_TRUE(db.ReadRecords(object({{"schema_name", JSONValue("public")}}), ClientSession{}).isError);
    EXPECT_TRUE(db.ExecuteSql(object({{"sql", JSONValue("x")}, {"parameters", JSONValue("nope")}}), ClientSession{})
                    .isError);
    EXPECT_TRUE(svc.Seen().empty());
}

TEST(DatabaseTools, HttpErrorStatusIsErrorResult) {
    FakeHttpService svc([](const SeenRequest&) {
        return std::make_pair(http::status::internal_server_error, std::string(R"({"detail":"boom"})"));
    });
    DatabaseServiceToolProvider db(svc.Url(), std::chrono::seconds(5), 1);
    auto r = db.DatabaseHealth(JSONValue(JSONValue::Object{}), ClientSession{});
    EXPECT_TRUE(r.isError);
    EXPECT_NE(textOf(r).find("HTTP 500"), std::string::npos);
}

TEST(DatabaseTools, UnreachableServiceIsRetriedThenReported) {
    const unsigned short port = closedPort();
    DatabaseServiceToolProvider db("http://127.0.0.1:" + std::to_string(port), std::chrono::seconds(2), 2);
    auto r = db.ListSchemas(JSONValue(JSONValue::Object{}), ClientSession{});
    EXPECT_TRUE(r.isError);
    EXPECT_EQ(textOf(r).rfind("Database service unavailable", 0), 0u);
}

TEST(DatabaseTools, RegistersEveryToolWithAHandler) {
    DatabaseServiceToolProvider db("http://localhost:8000", std::chrono::seconds(1), 1);
    auto defs = db.GetToolDefinitions();
    EXPECT_EQ(defs.size(), 14u);
    for (const auto& d : defs) {
        EXPECT_TRUE(db.GetHandler(d.name).has_value()) << d.name;
    }
    EXPECT_FALSE(db.GetHandler("drop_database").has_value());
}

TEST(DatabaseTools, InfoAndConnectionTestUseAdminRoutes) {
    FakeHttpService svc([](const SeenRequest& req) {
        if (req.target == "/admin/db-info") {
            return std::make_pair(http::status::ok, std::string(R"({"version":"PostgreSQL 16.2","size":"42 MB"})"));
        }
        return std::make_pair(http::status::ok, std::string(R"({"success":true,"latency_ms":3})"));
    });
    DatabaseServiceToolProvider db(svc.Url(), std::chrono::seconds(5), 1);
    auto info = db.DatabaseInfo(JSONValue(JSONValue::Object{}), ClientSession{});
    ASSERT_FALSE(info.isError) << textOf(info);
    EXPECT_EQ(GetStringMember(ParseJSON(textOf(info)), "version").value_or(""), "PostgreSQL 16.2");
    auto roundTrip = db.TestConnection(JSONValue(JSONValue::Object{}), ClientSession{});
    ASSERT_FALSE(roundTrip.isError) << textOf(roundTrip);
    auto seen = svc.Seen();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].method, "GET");
    EXPECT_EQ(seen[1].target, "/admin/test-connection");
}

TEST(DatabaseTools, ReadRecordAcceptsIntegerId) {
    FakeHttpService svc([](const SeenRequest&) {
        return std::make_pair(http::status::ok, std::string(R"({"data":{"id":7,"name":"ada"}})"));
    });
    DatabaseServiceToolProvider db(svc.Url(), std::chrono::seconds(5), 1);
    auto r = db.ReadRecord(object({{"schema_name", JSONValue("public")},
                                   {"table_name", JSONValue("users")},
                                   {"record_id", JSONValue(int64_t{7})}}),
                           ClientSession{});
    ASSERT_FALSE(r.isError) << textOf(r);
    JSONValue reply = ParseJSON(textOf(r));
    const JSONValue* data = FindMember(reply, "data");
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(GetStringMember(*data, "name").value_or(""), "ada");
    auto seen = svc.Seen();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].method, "GET");
    EXPECT_EQ(seen[0].target, "/crud/public/users/7");
}

TEST(DatabaseTools, ReadRecordNotFoundIsErrorResult) {
    FakeHttpService svc([](const SeenRequest&) {
        return std::make_pair(http::status::not_found, std::string(R"({"detail":"Record not found"})"));
    });
    DatabaseServiceToolProvider db(svc.Url(), std::chrono::seconds(5), 1);
    auto r = db.ReadRecord(object({{"schema_name", JSONValue("public")},
                                   {"table_name", JSONValue("users")},
                                   {"record_id", JSONValue("a/b")}}),
                           ClientSession{});
    EXPECT_TRUE(r.isError);
    EXPECT_NE(textOf(r).find("HTTP 404"), std::string::npos);
    EXPECT_EQ(svc.Seen().at(0).target, "/crud/public/users/a%2Fb");
}

TEST(DatabaseTools, CreateRecordPostsDataEnvelope) {
    FakeHttpService svc([](const SeenRequest&) {
        return std::make_pair(http::status::created, std::string(R"({"id":12,"data":{"name":"grace"}})"));
    });
    DatabaseServiceToolProvider db(svc.Url(), std::chrono::seconds(5), 1);
    JSONValue::Object row;
    SetMember(row, "name", JSONValue("grace"));
    auto r = db.CreateRecord(object({{"schema_name", JSONValue("public")},
                                     {"table_name", JSONValue("users")},
                                     {"data", JSONValue(row)}}),
                             ClientSession{});
    ASSERT_FALSE(r.isError) << textOf(r);
    EXPECT_EQ(GetIntMember(ParseJSON(textOf(r)), "id").value_or(0), 12);
    auto seen = svc.Seen();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].method, "POST");
    EXPECT_EQ(seen[0].target, "/crud/public/users");
    EXPECT_EQ(seen[0].contentType, "application/json");
    JSONValue body = ParseJSON(seen[0].body);
    const JSONValue* sent = FindMember(body, "data");
    ASSERT_NE(sent, nullptr);
    EXPECT_EQ(GetStringMember(*sent, "name").value_or(""), "grace");
}

TEST(DatabaseTools, UpdateRecordUsesPut) {
    FakeHttpService svc([](const SeenRequest&) {
        return std::make_pair(http::status::ok, std::string(R"({"data":{"id":"u-1","active":false}})"));
    });
    DatabaseServiceToolProvider db(svc.Url(), std::chrono::seconds(5), 1);
    JSONValue::Object change;
    SetMember(change, "active", JSONValue(false));
    auto r = db.UpdateRecord(object({{"schema_name", JSONValue("public")},
                                     {"table_name", JSONValue("users")},
                                     {"record_id", JSONValue("u-1")},
                                     {"data", JSONValue(change)}}),
                             ClientSession{});
    ASSERT_FALSE(r.isError) << textOf(r);
    auto seen = svc.Seen();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].method, "PUT");
    EXPECT_EQ(seen[0].target, "/crud/public/users/u-1");
    JSONValue body = ParseJSON(seen[0].body);
    const JSONValue* sent = FindMember(body, "data");
    ASSERT_NE(sent, nullptr);
    EXPECT_FALSE(GetBoolMember(*sent, "active").value_or(true));
}

TEST(DatabaseTools, UpsertRecordReportsInsertOrUpdate) {
    FakeHttpService svc([](const SeenRequest& req) {
        if (req.target == "/crud/public/users/1") {
            return std::make_pair(http::status::ok, std::string(R"({"record":{"id":1},"updated":true})"));
        }
        return std::make_pair(http::status::ok, std::string(R"({"record":{"id":2},"updated":false})"));
    });
    DatabaseServiceToolProvider db(svc.Url(), std::chrono::seconds(5), 1);
    JSONValue::Object row;
    SetMember(row, "name", JSONValue("linus"));
    auto existing = db.UpsertRecord(object({{"schema_name", JSONValue("public")},
                                            {"table_name", JSONValue("users")},
                                            {"record_id", JSONValue(int64_t{1})},
                                            {"data", JSONValue(row)}}),
                                    ClientSession{});
    ASSERT_FALSE(existing.isError) << textOf(existing);
    EXPECT_EQ(GetStringMember(ParseJSON(textOf(existing)), "operation").value_or(""), "updated");
    auto fresh = db.UpsertRecord(object({{"schema_name", JSONValue("public")},
                                         {"table_name", JSONValue("users")},
                                         {"record_id", JSONValue(int64_t{2})},
                                         {"data", JSONValue(row)}}),
                                 ClientSession{});
    ASSERT_FALSE(fresh.isError) << textOf(fresh);
    EXPECT_EQ(GetStringMember(ParseJSON(textOf(fresh)), "operation").value_or(""), "inserted");
    auto seen = svc.Seen();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].method, "PATCH");
    EXPECT_EQ(seen[1].target, "/crud/public/users/2");
}

TEST(DatabaseTools, DeleteRecordUsesDelete) {
    FakeHttpService svc([](const SeenRequest&) {
        return std::make_pair(http::status::ok, std::string(R"({"success":true,"deleted":1})"));
    });
    DatabaseServiceToolProvider db(svc.Url(), std::chrono::seconds(5), 1);
    auto r = db.DeleteRecord(object({{"schema_name", JSONValue("audit")},
                                     {"table_name", JSONValue("events")},
                                     {"record_id", JSONValue("99")}}),
                             ClientSession{});
    ASSERT_FALSE(r.isError) << textOf(r);
    auto seen = svc.Seen();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].method, "DELETE");
    EXPECT_EQ(seen[0].target, "/crud/audit/events/99");
    EXPECT_TRUE(seen[0].body.empty());
}

TEST(DatabaseTools, RecordToolsRejectMissingIdOrData) {
    FakeHttpService svc([](const SeenRequest&) {
        return std::make_pair(http::status::ok, std::string("{}"));
    });
    DatabaseServiceToolProvider db(svc.Url(), std::chrono::seconds(5), 1);
    const JSONValue noId = object({{"schema_name", JSONValue("public")}, {"table_name", JSONValue("users")}});
    EXPECT_TRUE(db.ReadRecord(noId, ClientSession{}).isError);
    EXPECT_TRUE(db.DeleteRecord(noId, ClientSession{}).isError);
    EXPECT_TRUE(db.CreateRecord(noId, ClientSession{}).isError);
    const JSONValue emptyData = object({{"schema_name", JSONValue("public")},
                                        {"table_name", JSONValue("users")},
                                        {"record_id", JSONValue("1")},
                                        {"data", JSONValue(JSONValue::Object{})}});
    auto update = db.UpdateRecord(emptyData, ClientSession{});
    EXPECT_TRUE(update.isError);
    EXPECT_NE(textOf(update).find("data"), std::string::npos);
    EXPECT_TRUE(db.UpsertRecord(emptyData, ClientSession{}).isError);
    EXPECT_TRUE(db.ReadRecord(object({{"table_name", JSONValue("users")}, {"record_id", JSONValue("1")}}),
                              ClientSession{})
                    .isError);
    EXPECT_TRUE(svc.Seen().empty());
}
