//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DispatchRouter.cpp
// Purpose: Default implementation for JSON-RPC method dispatch
//========================================================================================================

#include <algorithm>
#include <mutex>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "toolhub/DispatchRouter.h"
#include "toolhub/errors/Errors.h"

namespace toolhub {

namespace {
// Best-effort id recovery for error replies to malformed requests.
JSONRPCId recoverId(const JSONValue::Object& obj) {
    const JSONValue* idVal = FindMember(obj, "id");
    if (idVal) {
        if (idVal->isString()) return std::get<std::string>(idVal->value);
        if (std::holds_alternative<int64_t>(idVal->value)) return std::get<int64_t>(idVal->value);
    }
    return nullptr;
}
} // namespace

void DispatchRouter::Register(const std::string& method, Handler handler) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    handlers[method] = std::move(handler);
}

bool DispatchRouter::Unregister(const std::string& method) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    return handlers.erase(method) > 0;
}

bool DispatchRouter::HasMethod(const std::string& method) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return handlers.find(method) != handlers.end();
}

std::vector<std::string> DispatchRouter::Methods() const {
    std::vector<std::string> names;
    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        names.reserve(handlers.size());
        for (const auto& [name, handler] : handlers) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

DispatchRouter::MessageKind DispatchRouter::Classify(const JSONValue& message) {
    if (!message.isObject()) {
        return MessageKind::Unknown;
    }
    const auto& obj = std::get<JSONValue::Object>(message.value);
    if (obj.count("method") > 0) {
        return obj.count("id") > 0 ? MessageKind::Request : MessageKind::Notification;
    }
    if (obj.count("id") > 0 && (obj.count("result") > 0 || obj.count("error") > 0)) {
        return MessageKind::Response;
    }
    return MessageKind::Unknown;
}

std::optional<JSONRPCResponse> DispatchRouter::Handle(const JSONRPCRequest& request) const {
    FUNC_SCOPE();
    const bool notification = request.IsNotification();
    const JSONRPCId replyId = notification ? JSONRPCId(nullptr) : request.id.value();

    if (auto reason = request.Validate()) {
        LOG_WARN("Router: invalid request ({}): method='{}'", reason.value(), request.method);
        if (notification) {
            return std::nullopt;
        }
        return CreateErrorResponse(replyId, JSONRPCErrorCodes::InvalidRequest, reason.value());
    }

    Handler handler;
    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        auto it = handlers.find(request.method);
        if (it != handlers.end()) {
            handler = it->second;
        }
    }
    if (!handler) {
        if (notification) {
            LOG_DEBUG("Router: no handler for notification {}", request.method);
            return std::nullopt;
        }
        return CreateErrorResponse(replyId, JSONRPCErrorCodes::MethodNotFound,
                                   "Method not found: " + request.method);
    }

    JSONValue::Object params;
    if (request.params.has_value() && !request.params->isNull()) {
        if (!request.params->isObject()) {
            if (notification) {
                LOG_WARN("Router: notification {} carries non-object params", request.method);
                return std::nullopt;
            }
            return CreateErrorResponse(replyId, JSONRPCErrorCodes::InvalidParams, "params must be an object");
        }
        params = std::get<JSONValue::Object>(request.params->value);
    }

    try {
        JSONValue result = handler(params);
        if (notification) {
            return std::nullopt;
        }
        return JSONRPCResponse(replyId, std::move(result));
    } catch (const RpcException& e) {
        LOG_DEBUG("Router: handler {} raised rpc error {}: {}", request.method, e.Code(), e.what());
        if (notification) {
            return std::nullopt;
        }
        return errors::makeErrorResponse(replyId, e.ToRpcError());
    } catch (const std::exception& e) {
        LOG_ERROR("Router: handler {} failed: {}", request.method, e.what());
        if (notification) {
            return std::nullopt;
        }
        return CreateErrorResponse(replyId, JSONRPCErrorCodes::InternalError, e.what());
    } catch (...) {
        LOG_ERROR("Router: handler {} failed with a non-standard exception", request.method);
        if (notification) {
            return std::nullopt;
        }
        return CreateErrorResponse(replyId, JSONRPCErrorCodes::InternalError, "unknown handler failure");
    }
}

std::optional<std::string> DispatchRouter::HandleFrame(const std::string& frame) const {
    FUNC_SCOPE();
    JSONValue message;
    try {
        message = ParseJSON(frame);
    } catch (const JSONParseError& e) {
        LOG_WARN("Router: unparseable frame: {}", e.what());
        return CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error").Serialize();
    }

    switch (Classify(message)) {
        case MessageKind::Response:
            LOG_WARN("Router: dropping inbound response (no outstanding requests on this side)");
            return std::nullopt;
        case MessageKind::Unknown: {
            JSONRPCId id = message.isObject() ? recoverId(std::get<JSONValue::Object>(message.value)) : JSONRPCId(nullptr);
            return CreateErrorResponse(id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request").Serialize();
        }
        case MessageKind::Request:
        case MessageKind::Notification:
            break;
    }

    JSONRPCRequest request;
    if (!request.FromValue(message)) {
        const auto& obj = std::get<JSONValue::Object>(message.value);
        if (obj.count("id") == 0) {
            LOG_WARN("Router: malformed notification dropped");
            return std::nullopt;
        }
        return CreateErrorResponse(recoverId(obj), JSONRPCErrorCodes::InvalidRequest, "Invalid Request").Serialize();
    }

    auto response = Handle(request);
    if (!response.has_value()) {
        return std::nullopt;
    }
    return response->Serialize();
}

} // namespace toolhub
