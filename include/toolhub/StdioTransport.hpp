//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Line-delimited JSON-RPC transport over a pair of pipe/stdio file descriptors
//==========================================================================================================
#pragma once

#include "toolhub/Transport.h"
#include "toolhub/LineFramer.h"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace toolhub {

//==========================================================================================================
// StdioTransport
// Purpose: Client side of a provider's stdin/stdout (or, inside a provider, its own STDIN/STDOUT).
// Notes:
//   - Takes ownership of both descriptors; they are closed by Close() or the destructor.
//   - The reader thread co-owns the state, so a close handler may destroy the transport.
//   - Environment: TOOLHUB_REQUEST_TIMEOUT_MS sets the default per-request deadline (0 = none).
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    struct Options {
        std::size_t maxLineBytes{DefaultMaxLineBytes};
        uint64_t requestTimeoutMs{0}; // 0 = wait indefinitely
    };

    StdioTransport(int readFd, int writeFd);
    StdioTransport(int readFd, int writeFd, const Options& opts);
    virtual ~StdioTransport();

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    void StartReading() override;
    void Close() override;
    bool IsConnected() const override;

    std::future<JSONRPCResponse> Send(const std::string& method, std::optional<JSONValue> params) override;
    JSONRPCResponse SendAndWait(const std::string& method, std::optional<JSONValue> params) override;
    void SendNotification(const std::string& method, std::optional<JSONValue> params) override;

    void SetRouter(std::shared_ptr<DispatchRouter> router) override;
    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

    ////////////////////////////////////////// Configuration //////////////////////////////////////////
    //==========================================================================================================
    // Per-request deadline for requests sent after the call. On expiry the pending entry is removed and the
    // caller gets TimeoutError; a late reply is then treated as unmatched.
    //==========================================================================================================
    void SetRequestTimeoutMs(uint64_t timeoutMs);

    // Lines longer than this are discarded with a diagnostic. Takes effect at StartReading().
    void SetMaxLineBytes(std::size_t maxBytes);

    // Number of outstanding requests (diagnostics/tests).
    std::size_t PendingCount() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace toolhub
