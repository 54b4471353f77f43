//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionHub.cpp
// Purpose: Hub actor loop implementation
//==========================================================================================================

#include <algorithm>
#include <utility>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhub/ConnectionHub.h"

namespace toolhub {

ConnectionHub::ConnectionHub() : ConnectionHub(Options{}) {}

ConnectionHub::ConnectionHub(const Options& o) : opts(o) {
    const uint64_t envMs = GetEnvUintOrDefault("TOOLHUB_HUB_PING_INTERVAL_MS", 0);
    if (envMs > 0) {
        opts.pingInterval = std::chrono::milliseconds(static_cast<int64_t>(envMs));
    }
}

ConnectionHub::~ConnectionHub() {
    Stop();
}

void ConnectionHub::Start() {
    {
        std::lock_guard<std::mutex> lk(queueMutex);
        if (running) {
            return;
        }
        running = true;
        stopped = false;
    }
    loopThread = std::jthread([this](std::stop_token st) { run(st); });
    LOG_INFO("ConnectionHub: started (ping interval {} ms)", static_cast<long long>(opts.pingInterval.count()));
}

void ConnectionHub::Stop() {
    {
        std::lock_guard<std::mutex> lk(queueMutex);
        if (!running) {
            return;
        }
        running = false;
        stopped = true;
    }
    loopThread.request_stop();
    queueCv.notify_all();
    if (loopThread.joinable()) {
        loopThread.join();
    }
    // Unanswered queries resolve to an empty hub
    std::deque<Event> leftover;
    {
        std::lock_guard<std::mutex> lk(queueMutex);
        leftover.swap(queue);
    }
    for (auto& ev : leftover) {
        discard(ev);
    }
    LOG_INFO("ConnectionHub: stopped");
}

bool ConnectionHub::IsRunning() const {
    std::lock_guard<std::mutex> lk(queueMutex);
    return running;
}

void ConnectionHub::post(Event ev) {
    {
        std::lock_guard<std::mutex> lk(queueMutex);
        if (!stopped) {
            queue.push_back(std::move(ev));
            queueCv.notify_one();
            return;
        }
    }
    discard(ev);
}

// Events that never reach the loop: peers are closed, queries resolve to an empty hub.
void ConnectionHub::discard(Event& ev) {
    if (auto* r = std::get_if<RegisterEvent>(&ev)) {
        LOG_DEBUG("ConnectionHub: closing peer {} registered after stop", r->peer->Id());
        r->peer->Close();
    } else if (auto* q = std::get_if<CountQuery>(&ev)) {
        q->reply.set_value(0);
    }
}

void ConnectionHub::Register(std::shared_ptr<IPeer> peer) {
    if (!peer) {
        return;
    }
    post(RegisterEvent{std::move(peer)});
}

void ConnectionHub::Unregister(std::shared_ptr<IPeer> peer) {
    if (!peer) {
        return;
    }
    post(UnregisterEvent{std::move(peer)});
}

void ConnectionHub::Broadcast(std::string frame) {
    post(BroadcastEvent{std::move(frame)});
}

void ConnectionHub::BroadcastNotification(const std::string& method, std::optional<JSONValue> params) {
    JSONRPCRequest note(std::nullopt, method, std::move(params));
    Broadcast(note.Serialize());
}

std::future<std::size_t> ConnectionHub::PeerCount() {
    CountQuery q;
    auto fut = q.reply.get_future();
    {
        std::lock_guard<std::mutex> lk(queueMutex);
        if (stopped) {
            // Loop already stopped: nothing will answer
            q.reply.set_value(0);
            return fut;
        }
        queue.push_back(std::move(q));
    }
    queueCv.notify_one();
    return fut;
}

void ConnectionHub::run(std::stop_token st) {
    using Clock = std::chrono::steady_clock;
    auto nextPing = Clock::now() + opts.pingInterval;
    while (!st.stop_requested()) {
        std::deque<Event> batch;
        {
            std::unique_lock<std::mutex> lk(queueMutex);
            queueCv.wait_until(lk, st, nextPing, [&]{ return !queue.empty(); });
            batch.swap(queue);
        }
        for (auto& ev : batch) {
            handle(ev);
        }
        if (Clock::now() >= nextPing) {
            pingAll();
            nextPing = Clock::now() + opts.pingInterval;
        }
    }
    for (auto& peer : peers) {
        peer->Close();
    }
    LOG_DEBUG("ConnectionHub: loop exited, closed {} peer(s)", peers.size());
    peers.clear();
}

void ConnectionHub::handle(Event& ev) {
    std::visit([this](auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, RegisterEvent>) {
            if (std::find(peers.begin(), peers.end(), e.peer) != peers.end()) {
                LOG_DEBUG("ConnectionHub: peer {} already registered", e.peer->Id());
                return;
            }
            peers.push_back(std::move(e.peer));
            LOG_INFO("ConnectionHub: peer {} registered ({} total)", peers.back()->Id(), peers.size());
        } else if constexpr (std::is_same_v<T, UnregisterEvent>) {
            auto it = std::find(peers.begin(), peers.end(), e.peer);
            if (it == peers.end()) {
                return;
            }
            removeAndClose(static_cast<std::size_t>(it - peers.begin()), "unregistered");
        } else if constexpr (std::is_same_v<T, BroadcastEvent>) {
            for (std::size_t i = 0; i < peers.size();) {
                if (peers[i]->Send(e.frame)) {
                    ++i;
                } else {
                    removeAndClose(i, "write failed");
                }
            }
        } else if constexpr (std::is_same_v<T, CountQuery>) {
            e.reply.set_value(peers.size());
        }
    }, ev);
}

void ConnectionHub::pingAll() {
    for (std::size_t i = 0; i < peers.size();) {
        if (peers[i]->Ping()) {
            ++i;
        } else {
            removeAndClose(i, "ping failed");
        }
    }
}

void ConnectionHub::removeAndClose(std::size_t index, const char* reason) {
    std::shared_ptr<IPeer> peer = std::move(peers[index]);
    peers.erase(peers.begin() + static_cast<std::ptrdiff_t>(index));
    LOG_INFO("ConnectionHub: peer {} removed ({}), {} remaining", peer->Id(), reason, peers.size());
    peer->Close();
}

} // namespace toolhub
