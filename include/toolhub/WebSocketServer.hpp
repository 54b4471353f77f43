//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketServer.hpp
// Purpose: Coroutine-based WebSocket (ws/wss) front end for the connection hub using Boost.Beast
//          (TLS 1.3 only for wss)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "toolhub/ConnectionHub.h"
#include "toolhub/DispatchRouter.h"

namespace toolhub {

  class WebSocketServer {
  public:
    using ErrorHandler = std::function<void(const std::string&)>;

    //==========================================================================================================
    // Options
    // Purpose: Bind address/port, upgrade path and TLS files.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 8080; "0" picks an ephemeral port, see BoundPort())
    //   path: Upgrade path; requests for any other target are answered 404
    //   scheme: "ws" or "wss" (TLS 1.3 only for wss)
    //   certFile/keyFile: PEM files required when scheme == wss
    //   handlerThreads: Worker threads running router handlers
    //   writeTimeout: Upper bound a hub write/ping waits before the peer counts as failed
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"8080"};
        std::string path{"/ws/a2a"};
        std::string scheme{"ws"}; // "ws" or "wss"
        std::string certFile; // PEM (required for wss)
        std::string keyFile;  // PEM (required for wss)
        std::size_t handlerThreads{4};
        std::chrono::milliseconds writeTimeout{5000};
    };

    //==========================================================================================================
    // Args:
    //   hub: Receives a Register per accepted peer and an Unregister when its read side fails.
    //   router: Dispatches every inbound frame; the response goes back to the sending peer only.
    // Throws:
    //   std::exception when wss certificate/key files cannot be loaded.
    //==========================================================================================================
    WebSocketServer(const Options& opts, ConnectionHub& hub, std::shared_ptr<DispatchRouter> router);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    //==========================================================================================================
    // Binds the listener and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the I/O context is running; carries the exception when the
    //   port is invalid or the bind fails.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops accepting, stops the I/O context, closes every session socket and joins worker threads.
    // Returns:
    //   Future that completes when shutdown has finished.
    //==========================================================================================================
    std::future<void> Stop();

    // Port actually bound (useful with port "0"); 0 before Start().
    unsigned short BoundPort() const;

    void SetErrorHandler(ErrorHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
  };

  //==========================================================================================================
  // WebSocketServerFactory
  // Purpose: Builds server Options from a uri-form configuration string:
  //            - "ws://<address>:<port>/<path>" (e.g., ws://127.0.0.1:0/ws/a2a)
  //            - "wss://<address>:<port>/<path>?cert=<pem>&key=<pem>"
  //          Unknown parameters are ignored. If scheme is omitted, defaults to ws. If the path is
  //          omitted, the Options default is kept.
  //==========================================================================================================
  class WebSocketServerFactory {
  public:
    static WebSocketServer::Options ParseOptions(const std::string& config);

    std::unique_ptr<WebSocketServer> CreateServer(const std::string& config, ConnectionHub& hub,
                                                  std::shared_ptr<DispatchRouter> router);
  };

} // namespace toolhub
