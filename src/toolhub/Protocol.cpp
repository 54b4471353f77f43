//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON conversion for the tool protocol structures
//==========================================================================================================

#include "toolhub/Protocol.h"
#include "toolhub/errors/Errors.h"

namespace toolhub {

const JSONValue::Object& RequireObject(const JSONValue& v, const char* what) {
    if (!v.isObject()) {
        throw RpcException(JSONRPCErrorCodes::InvalidParams, std::string(what) + " must be an object");
    }
    return std::get<JSONValue::Object>(v.value);
}

std::string RequireString(const JSONValue::Object& obj, const char* key) {
    const JSONValue* v = FindMember(obj, key);
    if (!v || !v->isString()) {
        throw RpcException(JSONRPCErrorCodes::InvalidParams, std::string("missing or non-string '") + key + "'");
    }
    return std::get<std::string>(v->value);
}

std::optional<std::string> OptionalString(const JSONValue::Object& obj, const char* key) {
    const JSONValue* v = FindMember(obj, key);
    if (!v || v->isNull()) {
        return std::nullopt;
    }
    if (!v->isString()) {
        throw RpcException(JSONRPCErrorCodes::InvalidParams, std::string("'") + key + "' must be a string");
    }
    return std::get<std::string>(v->value);
}

std::optional<int64_t> OptionalInt(const JSONValue::Object& obj, const char* key) {
    const JSONValue* v = FindMember(obj, key);
    if (!v || v->isNull()) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(v->value)) {
        throw RpcException(JSONRPCErrorCodes::InvalidParams, std::string("'") + key + "' must be an integer");
    }
    return std::get<int64_t>(v->value);
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
JSONValue Implementation::ToJSON() const {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(name);
    obj["version"] = std::make_shared<JSONValue>(version);
    return JSONValue(std::move(obj));
}

Implementation Implementation::FromJSON(const JSONValue& v) {
    const auto& obj = RequireObject(v, "implementation");
    return Implementation(RequireString(obj, "name"), RequireString(obj, "version"));
}

///////////////////////////////////////// InitializeParams ///////////////////////////////////////////
JSONValue InitializeParams::ToJSON() const {
    JSONValue::Object obj;
    obj["protocolVersion"] = std::make_shared<JSONValue>(protocolVersion);
    obj["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
    obj["clientInfo"] = std::make_shared<JSONValue>(clientInfo.ToJSON());
    return JSONValue(std::move(obj));
}

InitializeParams InitializeParams::FromJSON(const JSONValue& v) {
    const auto& obj = RequireObject(v, "initialize params");
    InitializeParams p;
    p.protocolVersion = RequireString(obj, "protocolVersion");
    const JSONValue* info = FindMember(obj, "clientInfo");
    if (!info) {
        throw RpcException(JSONRPCErrorCodes::InvalidParams, "missing 'clientInfo'");
    }
    p.clientInfo = Implementation::FromJSON(*info);
    return p;
}

///////////////////////////////////////// ToolDescriptor ///////////////////////////////////////////
JSONValue ToolDescriptor::ToJSON() const {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(name);
    obj["description"] = std::make_shared<JSONValue>(description);
    obj["inputSchema"] = std::make_shared<JSONValue>(inputSchema);
    return JSONValue(std::move(obj));
}

ToolDescriptor ToolDescriptor::FromJSON(const JSONValue& v) {
    const auto& obj = RequireObject(v, "tool");
    ToolDescriptor d;
    d.name = RequireString(obj, "name");
    d.description = OptionalString(obj, "description").value_or(std::string());
    if (const JSONValue* schema = FindMember(obj, "inputSchema")) {
        d.inputSchema = *schema;
    } else {
        d.inputSchema = JSONValue(JSONValue::Object{});
    }
    return d;
}

///////////////////////////////////////// ToolsListResult ///////////////////////////////////////////
JSONValue ToolsListResult::ToJSON() const {
    JSONValue::Array arr;
    arr.reserve(tools.size());
    for (const auto& t : tools) {
        arr.push_back(std::make_shared<JSONValue>(t.ToJSON()));
    }
    JSONValue::Object obj;
    obj["tools"] = std::make_shared<JSONValue>(std::move(arr));
    return JSONValue(std::move(obj));
}

ToolsListResult ToolsListResult::FromJSON(const JSONValue& v) {
    const auto& obj = RequireObject(v, "tools/list result");
    const JSONValue* tools = FindMember(obj, "tools");
    if (!tools || !tools->isArray()) {
        throw RpcException(JSONRPCErrorCodes::InvalidParams, "tools/list result lacks a 'tools' array");
    }
    ToolsListResult r;
    for (const auto& item : std::get<JSONValue::Array>(tools->value)) {
        if (!item) {
            throw RpcException(JSONRPCErrorCodes::InvalidParams, "null tool descriptor");
        }
        r.tools.push_back(ToolDescriptor::FromJSON(*item));
    }
    return r;
}

///////////////////////////////////////// CallToolParams ///////////////////////////////////////////
JSONValue CallToolParams::ToJSON() const {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(name);
    obj["arguments"] = std::make_shared<JSONValue>(arguments);
    return JSONValue(std::move(obj));
}

CallToolParams CallToolParams::FromJSON(const JSONValue& v) {
    const auto& obj = RequireObject(v, "tools/call params");
    CallToolParams p;
    p.name = RequireString(obj, "name");
    if (const JSONValue* args = FindMember(obj, "arguments")) {
        if (!args->isNull() && !args->isObject()) {
            throw RpcException(JSONRPCErrorCodes::InvalidParams, "'arguments' must be an object");
        }
        if (args->isObject()) {
            p.arguments = *args;
        }
    }
    return p;
}

///////////////////////////////////////// ToolCallResult ///////////////////////////////////////////
JSONValue ToolCallResult::ToJSON() const {
    JSONValue::Object obj;
    obj["success"] = std::make_shared<JSONValue>(success);
    obj["result"] = std::make_shared<JSONValue>(result.has_value() ? result.value() : JSONValue(nullptr));
    if (!success) {
        obj["message"] = std::make_shared<JSONValue>(message);
    }
    return JSONValue(std::move(obj));
}

} // namespace toolhub
