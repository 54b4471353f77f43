//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DispatchRouter.h
// Purpose: Method name -> handler dispatch for JSON-RPC requests and notifications
//========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolhub/JSONRPCTypes.h"

namespace toolhub {

//========================================================================================================
// DispatchRouter
// Purpose: Shared by provider processes (inbound requests over stdio) and the hub (inbound frames over
//          WebSocket). Registration and dispatch may happen from any thread.
// Notes:
//   - Handlers receive the params object (empty when params are absent) and return the result value.
//   - A handler throwing RpcException answers with that code; any other failure becomes InternalError
//     carrying the failure text.
//   - Notifications never produce output, not even errors.
//========================================================================================================
class DispatchRouter {
public:
    using Handler = std::function<JSONValue(const JSONValue::Object& params)>;

    enum class MessageKind {
        Request,
        Notification,
        Response,
        Unknown
    };

    // Installs or replaces the handler for a method.
    void Register(const std::string& method, Handler handler);

    // Returns true when a handler was removed.
    bool Unregister(const std::string& method);

    bool HasMethod(const std::string& method) const;

    // Registered method names, sorted.
    std::vector<std::string> Methods() const;

    // Classify a parsed message without invoking handlers.
    static MessageKind Classify(const JSONValue& message);

    //====================================================================================================
    // Handle
    // Purpose: Validate, look up and invoke the handler for a decoded request.
    // Returns:
    //   The response to send back, or std::nullopt for notifications.
    //====================================================================================================
    std::optional<JSONRPCResponse> Handle(const JSONRPCRequest& request) const;

    //====================================================================================================
    // HandleFrame
    // Purpose: Decode one raw frame and dispatch it.
    // Returns:
    //   Serialized response, or std::nullopt for notifications and for inbound responses (which are
    //   dropped with a diagnostic).
    //====================================================================================================
    std::optional<std::string> HandleFrame(const std::string& frame) const;

private:
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, Handler> handlers;
};

} // namespace toolhub
