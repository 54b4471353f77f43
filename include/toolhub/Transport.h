//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Framed JSON-RPC transport interface - request/response correlation over a duplex byte stream
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "toolhub/JSONRPCTypes.h"

namespace toolhub {

class DispatchRouter;

//==========================================================================================================
// ITransport
// Purpose: One peer connection speaking line-delimited JSON-RPC 2.0.
// Notes:
//   - Outbound ids are integers allocated per transport starting at 1 and never reused.
//   - Every pending request is removed exactly once: by its reply, a write failure, a timeout, or closure.
//   - Handlers must be installed before StartReading().
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the dedicated reader loop. Replies complete their pending entry; end-of-stream cancels every
    // pending entry and fires the close handler.
    //==========================================================================================================
    virtual void StartReading() = 0;

    //==========================================================================================================
    // Cancels every pending request (callers observe TransportError) and releases the streams. Idempotent.
    //==========================================================================================================
    virtual void Close() = 0;

    //==========================================================================================================
    // True until the stream ends or Close() is called.
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Sends a request and returns a receipt without waiting for the reply.
    // Args:
    //   method: JSON-RPC method name.
    //   params: Optional params value.
    // Returns:
    //   Future that yields the response, or throws TransportError / TimeoutError.
    // Throws:
    //   TransportError when the frame cannot be written (no pending entry remains).
    //==========================================================================================================
    virtual std::future<JSONRPCResponse> Send(const std::string& method, std::optional<JSONValue> params) = 0;

    //==========================================================================================================
    // Send + blocking wait on the receipt. Only the calling thread is suspended.
    //==========================================================================================================
    virtual JSONRPCResponse SendAndWait(const std::string& method, std::optional<JSONValue> params) = 0;

    //==========================================================================================================
    // Writes a notification frame (no id, no pending entry).
    //==========================================================================================================
    virtual void SendNotification(const std::string& method, std::optional<JSONValue> params) = 0;

    /////////////////////////////////////////// Inbound handling ///////////////////////////////////////////
    // Requests from the peer are dispatched through the router; without one they get MethodNotFound.
    virtual void SetRouter(std::shared_ptr<DispatchRouter> router) = 0;

    // Notifications the router does not handle are passed here.
    using NotificationHandler = std::function<void(const JSONRPCRequest&)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    // Invoked exactly once, when the stream ends or the transport is closed.
    using CloseHandler = std::function<void()>;
    virtual void SetCloseHandler(CloseHandler handler) = 0;
};

} // namespace toolhub
