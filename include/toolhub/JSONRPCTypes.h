//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value type and JSON-RPC 2.0 message types shared by provider links and the hub
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace toolhub {

struct JSONValue;

//==========================================================================================================
// JSONObject
// Purpose: JSON object that keeps members in insertion order so that decode/encode is byte-stable.
// Notes:
//   - operator[] appends a null member when the key is absent (map-like).
//   - Lookup is linear; JSON-RPC envelopes and params are small.
//==========================================================================================================
class JSONObject {
public:
    using Entry = std::pair<std::string, std::shared_ptr<JSONValue>>;
    using iterator = std::vector<Entry>::iterator;
    using const_iterator = std::vector<Entry>::const_iterator;

    std::shared_ptr<JSONValue>& operator[](const std::string& key);

    iterator find(const std::string& key);
    const_iterator find(const std::string& key) const;
    std::size_t count(const std::string& key) const { return find(key) == end() ? 0u : 1u; }
    std::size_t erase(const std::string& key);

    iterator begin() { return entries.begin(); }
    iterator end() { return entries.end(); }
    const_iterator begin() const { return entries.begin(); }
    const_iterator end() const { return entries.end(); }
    std::size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

private:
    std::vector<Entry> entries;
};

//==========================================================================================================
// JSONValue
// Purpose: Closed JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: insertion-ordered JSONObject.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = JSONObject;

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
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
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
// Purpose: Raised by ParseJSON for malformed text (bad token, bad escape, trailing garbage).
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    JSONParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset(offset) {}
    std::size_t Offset() const { return offset; }
private:
    std::size_t offset;
};

// Strict recursive-descent parse of a complete JSON document. Throws JSONParseError.
JSONValue ParseJSON(const std::string& text);

// Compact serialization; never emits a raw newline.
std::string serializeJSONValue(const JSONValue& value);

// Returns the member value or nullptr when absent (or when the member holds an empty pointer).
const JSONValue* FindMember(const JSONValue::Object& obj, const std::string& key);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

JSONValue IdToValue(const JSONRPCId& id);
std::string IdToString(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
// Methods:
//   Serialize(): Returns the canonical single-line JSON text for the message.
//   Deserialize(json): Parses JSON text into this object; returns true on success.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual std::string Serialize() const = 0;
    virtual bool Deserialize(const std::string& json) = 0;
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request. A request without an id is a notification and is never answered.
// Methods:
//   IsNotification(): True when id is absent.
//   Validate(): Returns a reason when jsonrpc != "2.0" or method is empty; nullopt when valid.
//   FromValue(v): Shape-level decode from an already parsed object.
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    std::optional<JSONRPCId> id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(std::optional<JSONRPCId> id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    bool IsNotification() const { return !id.has_value(); }
    std::optional<std::string> Validate() const;

    JSONValue ToValue() const;
    bool FromValue(const JSONValue& v);

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response carrying either result or error; id echoes the request.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id{nullptr};
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    bool IsError() const { return error.has_value(); }

    JSONValue ToValue() const;
    bool FromValue(const JSONValue& v);

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus toolhub registry codes surfaced over the hub.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    // toolhub specific codes (server error range)
    constexpr int ProviderNotFound = -32001;
    constexpr int AlreadyConnected = -32002;
    constexpr int ProviderUnavailable = -32003;
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
JSONRPCResponse CreateErrorResponse(const JSONRPCId& id, int code, const std::string& message,
                                    const std::optional<JSONValue>& data = std::nullopt);

} // namespace toolhub
