//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Tool protocol data structures, method names and JSON conversion helpers
//==========================================================================================================

#pragma once

#include "toolhub/JSONRPCTypes.h"

#include <optional>
#include <string>
#include <vector>

namespace toolhub {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}

    JSONValue ToJSON() const;
    static Implementation FromJSON(const JSONValue& v);
};

///////////////////////////////////////// Handshake ///////////////////////////////////////////
// initialize params; capabilities are sent as an empty object.
struct InitializeParams {
    std::string protocolVersion{PROTOCOL_VERSION};
    Implementation clientInfo;

    JSONValue ToJSON() const;
    static InitializeParams FromJSON(const JSONValue& v);
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// inputSchema is opaque and passed through untouched.
struct ToolDescriptor {
    std::string name;
    std::string description;
    JSONValue inputSchema;

    JSONValue ToJSON() const;
    static ToolDescriptor FromJSON(const JSONValue& v);
};

struct ToolsListResult {
    std::vector<ToolDescriptor> tools;

    JSONValue ToJSON() const;
    static ToolsListResult FromJSON(const JSONValue& v);
};

struct CallToolParams {
    std::string name;
    JSONValue arguments{JSONValue::Object{}};

    JSONValue ToJSON() const;
    static CallToolParams FromJSON(const JSONValue& v);
};

//==========================================================================================================
// ToolCallResult
// Purpose: Outcome of a tool invocation as seen by callers of the connection/registry.
// Fields:
//   success: false for provider application errors (error reply or isError result) and transport failures.
//   result: Raw provider result (present on success; present for isError results too).
//   message: Failure description when success is false.
//==========================================================================================================
struct ToolCallResult {
    bool success{false};
    std::optional<JSONValue> result;
    std::string message;

    JSONValue ToJSON() const;
};

//==========================================================================================================
// Param decoding helpers used by typed FromJSON and method handlers.
// All of them throw RpcException(InvalidParams) on shape mismatch.
//==========================================================================================================
const JSONValue::Object& RequireObject(const JSONValue& v, const char* what);
std::string RequireString(const JSONValue::Object& obj, const char* key);
std::optional<std::string> OptionalString(const JSONValue::Object& obj, const char* key);
std::optional<int64_t> OptionalInt(const JSONValue::Object& obj, const char* key);

} // namespace toolhub
