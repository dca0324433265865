//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model, strict parser/serializer and JSON-RPC 2.0 envelopes for the line protocol
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace mcpgate {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&) noexcept;
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&) noexcept;
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
};

//==========================================================================================================
// JSONParseError
// Purpose: Raised by ParseJSON for malformed input; what() carries the offset and reason.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    JSONParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset(offset) {}
    std::size_t offset;
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete JSON document. Trailing non-whitespace is rejected.
// Throws:
//   JSONParseError on malformed input.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact JSON text for a value. Strings are escaped per RFC 8259.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

///////////////////////////////////////// Field access helpers ///////////////////////////////////////////
// Returns the member value or nullptr when obj is not an object or has no such key.
const JSONValue* FindMember(const JSONValue& obj, const std::string& key);
std::optional<std::string> GetStringMember(const JSONValue& obj, const std::string& key);
std::optional<int64_t> GetIntMember(const JSONValue& obj, const std::string& key);
std::optional<bool> GetBoolMember(const JSONValue& obj, const std::string& key);

// Object builder shorthand used across handlers: obj[key] = make_shared<JSONValue>(v)
template <typename T>
inline void SetMember(JSONValue::Object& obj, const std::string& key, T&& v) {
    obj[key] = std::make_shared<JSONValue>(std::forward<T>(v));
}

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

JSONValue IdToJSON(const JSONRPCId& id);
std::string IdToString(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual std::string Serialize() const = 0;
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: Incoming JSON-RPC 2.0 request or notification.
// Fields:
//   id: Present for requests, absent (nullopt) for notifications. A literal null id is a request.
//   method: Method name.
//   params: Optional params value.
//   authToken: Optional credential from top-level "auth_token" or params.auth_token.
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    std::optional<JSONRPCId> id;
    std::string method;
    std::optional<JSONValue> params;
    std::optional<std::string> authToken;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    bool IsNotification() const { return !id.has_value(); }

    std::string Serialize() const override;
};

//==========================================================================================================
// RequestParseStatus
// Purpose: Outcome of decoding one wire line into a JSONRPCRequest.
//==========================================================================================================
enum class RequestParseStatus {
    Ok,
    InvalidJson,       // not JSON at all
    NotAnObject,       // valid JSON, wrong top-level shape
    MissingMethod,     // object without a string "method"
    InvalidId          // "id" present but not string/integer/null
};

//==========================================================================================================
// ParseRequestLine
// Purpose: Decodes one line into a request. On failures other than InvalidJson/NotAnObject, out.id is
//          populated when the object carried a usable id so the caller can address the error reply.
// Args:
//   line: Raw text of one frame (without the trailing newline).
//   out: Populated request.
//   error: Human-readable reason when the status is not Ok.
//==========================================================================================================
RequestParseStatus ParseRequestLine(const std::string& line, JSONRPCRequest& out, std::string& error);

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() : id(nullptr) {}
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json);

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus the server's application codes.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    // Application codes
    constexpr int RateLimitExceeded = -32000;
    constexpr int AuthenticationFailed = -32001;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Wrap an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace mcpgate
