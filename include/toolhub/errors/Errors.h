//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, JSON-RPC error mapping helpers and the toolhub exception taxonomy
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "toolhub/JSONRPCTypes.h"

namespace toolhub {
namespace errors {

// Categorization of JSON-RPC and toolhub error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    ProviderNotFound,
    AlreadyConnected,
    ProviderUnavailable,
    Application,
    Unknown
};

// Typed wire-level error (the value carried in a response's "error" member).
struct RpcError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: JSON-RPC standard, toolhub-specific, or provider-defined code.
//
// Returns:
//   ErrorCategory; codes outside the reserved -32768..-32000 range are Application errors.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::ProviderNotFound: return ErrorCategory::ProviderNotFound;
        case JSONRPCErrorCodes::AlreadyConnected: return ErrorCategory::AlreadyConnected;
        case JSONRPCErrorCodes::ProviderUnavailable: return ErrorCategory::ProviderUnavailable;
        default: break;
    }
    if (code < -32768 || code > -32000) {
        return ErrorCategory::Application;
    }
    return ErrorCategory::Unknown;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to RpcError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<RpcError> rpcErrorFromErrorValue(const JSONValue& errVal) {
    if (!errVal.isObject()) {
        return std::nullopt;
    }
    const auto& obj = std::get<JSONValue::Object>(errVal.value);
    const JSONValue* code = FindMember(obj, "code");
    const JSONValue* msg = FindMember(obj, "message");
    if (!code || !msg) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(code->value) || !msg->isString()) {
        return std::nullopt;
    }
    RpcError e;
    e.code = static_cast<int>(std::get<int64_t>(code->value));
    e.message = std::get<std::string>(msg->value);
    if (const JSONValue* data = FindMember(obj, "data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract RpcError from a JSONRPCResponse if it carries an error.
inline std::optional<RpcError> rpcErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return rpcErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed RpcError.
inline JSONValue makeErrorValue(const RpcError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create an error JSONRPCResponse from RpcError and id.
inline JSONRPCResponse makeErrorResponse(const JSONRPCId& id, const RpcError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors

//==========================================================================================================
// RpcException
// Purpose: Thrown by method handlers (or param decoders) to answer with a specific JSON-RPC error code.
//==========================================================================================================
class RpcException : public std::runtime_error {
public:
    RpcException(int code, const std::string& message, std::optional<JSONValue> data = std::nullopt)
        : std::runtime_error(message), code(code), data(std::move(data)) {}

    int Code() const { return code; }
    const std::optional<JSONValue>& Data() const { return data; }

    errors::RpcError ToRpcError() const {
        errors::RpcError e;
        e.code = code;
        e.message = what();
        e.data = data;
        e.category = errors::errorCategoryFromCode(code);
        return e;
    }

private:
    int code;
    std::optional<JSONValue> data;
};

//==========================================================================================================
// TransportError
// Purpose: The byte stream under a connection failed or was closed; fatal to that connection only.
//==========================================================================================================
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A request exceeded its configured deadline. The connection itself stays usable.
class TimeoutError : public TransportError {
public:
    using TransportError::TransportError;
};

// The provider subprocess could not be launched.
class SpawnError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// initialize or tools/list failed while bringing a provider to ready.
class HandshakeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class RegistryErrorCode {
    AlreadyConnected,
    ProviderNotFound
};

//==========================================================================================================
// RegistryError
// Purpose: Synchronous registry rejection; raised before any side effect takes place.
//==========================================================================================================
class RegistryError : public std::runtime_error {
public:
    RegistryError(RegistryErrorCode code, const std::string& provider)
        : std::runtime_error(describe(code, provider)), code(code), provider(provider) {}

    RegistryErrorCode Code() const { return code; }
    const std::string& Provider() const { return provider; }

    // JSON-RPC code used when the rejection is reported to a hub peer.
    int RpcCode() const {
        return code == RegistryErrorCode::AlreadyConnected ? JSONRPCErrorCodes::AlreadyConnected
                                                           : JSONRPCErrorCodes::ProviderNotFound;
    }

private:
    static std::string describe(RegistryErrorCode code, const std::string& provider) {
        if (code == RegistryErrorCode::AlreadyConnected) {
            return "provider already connected: " + provider;
        }
        return "provider not found: " + provider;
    }

    RegistryErrorCode code;
    std::string provider;
};

} // namespace toolhub
