//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionHub.h
// Purpose: Single-owner event loop over the set of live hub peers (register/unregister/broadcast/ping)
//==========================================================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "toolhub/JSONRPCTypes.h"

namespace toolhub {

//==========================================================================================================
// IPeer
// Purpose: One bidirectional hub connection as seen by the loop.
// Notes:
//   - Send/Ping block until the frame is written (or fails) and report the outcome.
//   - Close may be called more than once.
//==========================================================================================================
class IPeer {
public:
    virtual ~IPeer() = default;
    virtual const std::string& Id() const = 0;
    virtual bool Send(const std::string& frame) = 0;
    virtual bool Ping() = 0;
    virtual void Close() = 0;
};

//==========================================================================================================
// ConnectionHub
// Purpose: All Peer Set mutation happens on the loop thread; every other thread talks to it through the
//          event queue. Events are processed in submission order, so per-peer write order is preserved.
// Notes:
//   - A failed write or ping removes and closes that peer; other peers are unaffected.
//   - Env: TOOLHUB_HUB_PING_INTERVAL_MS overrides the default ping interval (30000 ms).
//==========================================================================================================
class ConnectionHub {
public:
    struct Options {
        std::chrono::milliseconds pingInterval{30000};
    };

    ConnectionHub();
    explicit ConnectionHub(const Options& opts);
    ~ConnectionHub();

    ConnectionHub(const ConnectionHub&) = delete;
    ConnectionHub& operator=(const ConnectionHub&) = delete;

    // Starts the loop thread. Events queued before Start() are processed once it runs.
    void Start();

    // Stops the loop and closes every registered peer, including ones still queued. Events posted
    // afterwards are dropped; a peer registered after Stop() is closed at once. Idempotent.
    void Stop();

    bool IsRunning() const;

    // Adds the peer; registering a peer that is already present is a no-op.
    void Register(std::shared_ptr<IPeer> peer);

    // Removes the peer if present and closes it; an unknown peer is a no-op.
    void Unregister(std::shared_ptr<IPeer> peer);

    // Writes the frame to every registered peer.
    void Broadcast(std::string frame);

    // Builds a JSON-RPC notification frame and broadcasts it.
    void BroadcastNotification(const std::string& method, std::optional<JSONValue> params);

    // Answered by the loop after every earlier event has been processed.
    std::future<std::size_t> PeerCount();

private:
    struct RegisterEvent { std::shared_ptr<IPeer> peer; };
    struct UnregisterEvent { std::shared_ptr<IPeer> peer; };
    struct BroadcastEvent { std::string frame; };
    struct CountQuery { std::promise<std::size_t> reply; };
    using Event = std::variant<RegisterEvent, UnregisterEvent, BroadcastEvent, CountQuery>;

    void post(Event ev);
    void discard(Event& ev);
    void run(std::stop_token st);
    void handle(Event& ev);
    void pingAll();
    void removeAndClose(std::size_t index, const char* reason);

    Options opts;
    mutable std::mutex queueMutex;
    std::condition_variable_any queueCv;
    std::deque<Event> queue;
    bool running{false};
    bool stopped{false};
    std::jthread loopThread;

    // Owned by the loop thread only
    std::vector<std::shared_ptr<IPeer>> peers;
};

} // namespace toolhub
