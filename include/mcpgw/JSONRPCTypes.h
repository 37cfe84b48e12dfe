//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model, parser/serializer and JSON-RPC 2.0 envelope types for the gateway
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace mcpgw {

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

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
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

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isBool() const { return std::holds_alternative<bool>(value); }
    bool isInteger() const { return std::holds_alternative<int64_t>(value); }
    bool isNumber() const { return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
};

//==========================================================================================================
// JSONParseError
// Purpose: Raised by parseJSON for malformed text; what() carries the reason and byte offset.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    JSONParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset_(offset) {}
    std::size_t offset() const { return offset_; }
private:
    std::size_t offset_;
};

// Maximum container nesting accepted by the parser.
constexpr std::size_t kMaxJSONParseDepth = 512;

//==========================================================================================================
// parseJSON
// Purpose: Strict RFC 8259 parse of a complete document (no trailing content, bounded nesting).
// Throws:
//   JSONParseError on malformed input.
//==========================================================================================================
JSONValue parseJSON(const std::string& text);

// Non-throwing variant; fills errorMessage on failure.
bool tryParseJSON(const std::string& text, JSONValue& out, std::string& errorMessage);

// Compact serialization; object keys are emitted in sorted order.
std::string serializeJSONValue(const JSONValue& value);

// Two-space indented serialization; object keys are emitted in sorted order.
std::string serializeJSONValuePretty(const JSONValue& value);

// Shortest round-trip text for a double ("120", "0.1", "1e+21").
std::string formatJSONNumber(double v);

// Structural equality; int64 and double are distinct kinds (1 != 1.0).
bool jsonEquals(const JSONValue& a, const JSONValue& b);

// Returns the member value, or nullptr when v is not an object or has no such (non-null pointer) member.
const JSONValue* findMember(const JSONValue& v, const std::string& key);

// Numeric value as double when v is int64 or double.
std::optional<double> asDouble(const JSONValue& v);

// Shorthand for building object members.
inline std::shared_ptr<JSONValue> makeJSON(JSONValue v) { return std::make_shared<JSONValue>(std::move(v)); }

//==========================================================================================================
// UTF-8 helpers
//==========================================================================================================
bool isValidUtf8(const std::string& text);

// Replaces invalid sequences with U+FFFD.
std::string sanitizeUtf8(const std::string& text);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, number (integer or fractional), or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, double, std::nullptr_t>;

// Converts an id to its JSON representation.
JSONValue idToJSONValue(const JSONRPCId& id);

// Accepts string/number/null values; returns nullopt for any other JSON kind.
std::optional<JSONRPCId> idFromJSONValue(const JSONValue& v);

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request envelope with id, method, and params.
// Methods:
//   FromJSONValue(v, errorMessage): Structural check of an already-parsed value; returns false
//     with a description when the shape does not match the envelope.
//==========================================================================================================
class JSONRPCRequest {
public:
    std::string jsonrpc = "2.0";
    JSONRPCId id{nullptr};
    std::string method;
    JSONValue params{JSONValue::Object{}};

    bool FromJSONValue(const JSONValue& v, std::string& errorMessage);
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response envelope carrying either result or error.
// Methods:
//   Serialize()/Deserialize(json)
//   IsError(): True when error is present.
//==========================================================================================================
class JSONRPCResponse {
public:
    std::string jsonrpc = "2.0";
    JSONRPCId id{nullptr};
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    std::string Serialize() const;
    bool Deserialize(const std::string& json);

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus the gateway's generic domain error.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    // Config not found, tool not found, argument validation and action failures
    constexpr int ServerError = -32000;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

} // namespace mcpgw
