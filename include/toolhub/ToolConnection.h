//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolConnection.h
// Purpose: One provider subprocess bound to one transport: handshake, tool catalog and lifecycle
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "toolhub/LineFramer.h"
#include "toolhub/ProviderProcess.h"
#include "toolhub/Protocol.h"

namespace toolhub {

enum class ConnectionStatus {
    Connecting,
    Ready,
    Closed
};

// "connecting" | "ready" | "closed"
const char* ToString(ConnectionStatus status);

//==========================================================================================================
// ToolConnection
// Purpose: Owns a ProviderProcess and the StdioTransport over its pipes.
// Notes:
//   - Status moves connecting -> ready -> closed, or connecting -> closed on failure.
//   - Abrupt provider exit cancels in-flight calls with TransportError and moves status to closed.
//   - The cached tool set is replaced wholesale; readers always see a complete set.
//==========================================================================================================
class ToolConnection {
public:
    using StatusHandler = std::function<void(const std::string& provider, ConnectionStatus status)>;

    struct Options {
        Implementation clientInfo;           // defaults to {"toolhub", <library version>}
        uint64_t requestTimeoutMs{0};        // 0 = no deadline (env TOOLHUB_REQUEST_TIMEOUT_MS applies)
        std::size_t maxLineBytes{DefaultMaxLineBytes};
        StatusHandler onStatusChange;        // invoked on ready/closed transitions
    };

    //==========================================================================================================
    // Connect
    // Purpose: spawn -> initialize -> notifications/initialized -> tools/list -> ready.
    // Throws:
    //   SpawnError when the process cannot be started; HandshakeError when initialize or tools/list fails
    //   (including provider exit during the handshake). The subprocess is terminated before the throw.
    //==========================================================================================================
    static std::unique_ptr<ToolConnection> Connect(const std::string& name, const LaunchSpec& spec,
                                                   const Options& opts);
    static std::unique_ptr<ToolConnection> Connect(const std::string& name, const LaunchSpec& spec);

    ~ToolConnection();
    ToolConnection(const ToolConnection&) = delete;
    ToolConnection& operator=(const ToolConnection&) = delete;

    const std::string& Name() const;
    ConnectionStatus Status() const;

    //==========================================================================================================
    // CallTool
    // Purpose: tools/call {name, arguments}.
    // Returns:
    //   success=true with the raw result; success=false with a message for a JSON-RPC error reply or a
    //   result flagged isError.
    // Throws:
    //   TransportError (or TimeoutError) when the connection is closed or fails mid-call.
    //==========================================================================================================
    ToolCallResult CallTool(const std::string& tool, const JSONValue& arguments);

    //==========================================================================================================
    // RefreshTools
    // Purpose: Re-issue tools/list and replace the cached set atomically.
    // Throws:
    //   TransportError on transport failure; RpcException when the provider answers with an error or a
    //   malformed catalog (the previous set is kept).
    //==========================================================================================================
    std::vector<ToolDescriptor> RefreshTools();

    // Snapshot copy of the cached set.
    std::vector<ToolDescriptor> GetTools() const;

    // No further requests; transport closed, subprocess killed. Idempotent.
    void Close();

private:
    class Impl;
    explicit ToolConnection(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhub
