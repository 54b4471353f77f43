//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Line-delimited JSON-RPC transport implementation (poll + eventfd reader, pending-request table)
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <sys/eventfd.h>
#include <cstring>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "logging/Logger.h"
#include "env/EnvVars.h"
#include "toolhub/DispatchRouter.h"
#include "toolhub/JSONRPCTypes.h"
#include "toolhub/StdioTransport.hpp"
#include "toolhub/errors/Errors.h"

namespace toolhub {

namespace {
std::once_flag gSigpipeOnce;

// A peer that exits while we write must surface as EPIPE, not kill the process.
void ignoreSigpipe() {
    std::call_once(gSigpipeOnce, []() {
        ::signal(SIGPIPE, SIG_IGN);
    });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}
} // namespace

class StdioTransport::Impl {
public:
    using Clock = std::chrono::steady_clock;

    int readFd{-1};
    int writeFd{-1};
    int wakeEventFd{-1};

    std::size_t maxLineBytes{DefaultMaxLineBytes};
    std::chrono::milliseconds requestTimeout{0};

    std::shared_ptr<DispatchRouter> router;
    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;
    ITransport::CloseHandler closeHandler;

    // Pending-request table; 'closed' lives under the same mutex so no entry can be added after cancellation.
    mutable std::mutex pendingMutex;
    std::unordered_map<int64_t, std::promise<JSONRPCResponse>> pending;
    std::unordered_map<int64_t, Clock::time_point> deadlines;
    bool closed{false};
    std::condition_variable_any deadlineCv;

    std::atomic<int64_t> nextId{1};
    std::mutex writeMutex;

    std::thread readerThread;
    std::jthread timeoutThread;
    std::atomic<bool> started{false};
    std::atomic<bool> closeCalled{false};
    std::atomic<bool> closeNotified{false};

    Impl(int rfd, int wfd, const StdioTransport::Options& opts)
        : readFd(rfd), writeFd(wfd), maxLineBytes(opts.maxLineBytes),
          requestTimeout(opts.requestTimeoutMs) {
        ignoreSigpipe();
        const uint64_t envTimeout = GetEnvUintOrDefault("TOOLHUB_REQUEST_TIMEOUT_MS", 0);
        if (envTimeout > 0 && opts.requestTimeoutMs == 0) {
            requestTimeout = std::chrono::milliseconds(static_cast<int64_t>(envTimeout));
        }
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ~Impl() {
        closeFd(wakeEventFd);
        closeFd(readFd);
        closeFd(writeFd);
    }

    void reportError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    void wakeReader() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        ssize_t wr;
        do {
            wr = ::write(wakeEventFd, &one, sizeof(one));
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    //------------------------------------------------------------------------------------------------------
    // Writer path
    //------------------------------------------------------------------------------------------------------
    void writeFrame(const std::string& payload) {
        std::string frame = payload;
        frame.push_back('\n');
        std::lock_guard<std::mutex> lk(writeMutex);
        if (writeFd < 0) {
            throw TransportError("StdioTransport: write on closed transport");
        }
        std::size_t total = 0;
        while (total < frame.size()) {
            ssize_t w = ::write(writeFd, frame.data() + total, frame.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
            } else if (w < 0 && errno == EINTR) {
                continue;
            } else {
                const int err = errno;
                LOG_ERROR("StdioTransport: write error (errno={} msg={})", err, ::strerror(err));
                throw TransportError(std::string("StdioTransport: write failed: ") + ::strerror(err));
            }
        }
    }

    //------------------------------------------------------------------------------------------------------
    // Pending table
    //------------------------------------------------------------------------------------------------------
    using PendingMap = std::unordered_map<int64_t, std::promise<JSONRPCResponse>>;

    // Marks the table closed and takes every outstanding entry; nothing can be added afterwards.
    PendingMap drainPending() {
        PendingMap drained;
        {
            std::lock_guard<std::mutex> lk(pendingMutex);
            closed = true;
            drained.swap(pending);
            deadlines.clear();
        }
        deadlineCv.notify_all();
        return drained;
    }

    static void failDrained(PendingMap& drained, const std::string& reason) {
        if (!drained.empty()) {
            LOG_INFO("StdioTransport: cancelling {} pending request(s): {}", drained.size(), reason);
        }
        for (auto& [id, promise] : drained) {
            promise.set_exception(std::make_exception_ptr(TransportError(reason)));
        }
        drained.clear();
    }

    void completePending(JSONRPCResponse&& response) {
        if (!std::holds_alternative<int64_t>(response.id)) {
            LOG_WARN("StdioTransport: dropping response with non-integer id {}", IdToString(response.id));
            return;
        }
        const int64_t id = std::get<int64_t>(response.id);
        std::promise<JSONRPCResponse> promise;
        {
            std::lock_guard<std::mutex> lk(pendingMutex);
            auto it = pending.find(id);
            if (it == pending.end()) {
                LOG_WARN("StdioTransport: dropping unmatched response id={}", id);
                return;
            }
            promise = std::move(it->second);
            pending.erase(it);
            deadlines.erase(id);
        }
        promise.set_value(std::move(response));
    }

    void notifyClosedOnce() {
        if (closeNotified.exchange(true)) {
            return;
        }
        if (closeHandler) {
            try {
                closeHandler();
            } catch (const std::exception& e) {
                LOG_ERROR("StdioTransport: close handler threw: {}", e.what());
            }
        }
    }

    //------------------------------------------------------------------------------------------------------
    // Inbound dispatch
    //------------------------------------------------------------------------------------------------------
    void processFrame(const std::string& line) {
        JSONValue message;
        try {
            message = ParseJSON(line);
        } catch (const JSONParseError& e) {
            LOG_WARN("StdioTransport: skipping malformed frame: {}", e.what());
            reportError(std::string("StdioTransport: malformed frame: ") + e.what());
            return;
        }

        switch (DispatchRouter::Classify(message)) {
            case DispatchRouter::MessageKind::Response: {
                JSONRPCResponse response;
                if (!response.FromValue(message)) {
                    LOG_WARN("StdioTransport: skipping malformed response frame");
                    return;
                }
                completePending(std::move(response));
                return;
            }
            case DispatchRouter::MessageKind::Request:
                handleRequest(message);
                return;
            case DispatchRouter::MessageKind::Notification:
                handleNotification(message);
                return;
            case DispatchRouter::MessageKind::Unknown:
                LOG_WARN("StdioTransport: skipping frame that is not a JSON-RPC message");
                return;
        }
    }

    void handleRequest(const JSONValue& message) {
        JSONRPCRequest request;
        std::optional<JSONRPCResponse> response;
        if (!request.FromValue(message)) {
            response = CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
        } else if (router) {
            response = router->Handle(request);
        } else {
            response = CreateErrorResponse(request.id.value(), JSONRPCErrorCodes::MethodNotFound,
                                           "Method not found: " + request.method);
        }
        if (!response.has_value()) {
            return;
        }
        try {
            writeFrame(response->Serialize());
        } catch (const TransportError& e) {
            LOG_WARN("StdioTransport: failed to write response: {}", e.what());
            reportError(e.what());
        }
    }

    void handleNotification(const JSONValue& message) {
        JSONRPCRequest note;
        if (!note.FromValue(message)) {
            LOG_WARN("StdioTransport: skipping malformed notification");
            return;
        }
        if (router && router->HasMethod(note.method)) {
            (void)router->Handle(note);
            return;
        }
        if (notificationHandler) {
            try {
                notificationHandler(note);
            } catch (const std::exception& e) {
                LOG_ERROR("StdioTransport: notification handler threw: {}", e.what());
            }
            return;
        }
        LOG_DEBUG("StdioTransport: unhandled notification {}", note.method);
    }

    //------------------------------------------------------------------------------------------------------
    // Reader loop
    //------------------------------------------------------------------------------------------------------
    void readerLoop() {
        auto framer = MakeLineFramer(maxLineBytes);
        std::string buffer;
        std::vector<char> tmp(64 * 1024);
        std::string endReason = "StdioTransport: stream closed";

        for (;;) {
            struct pollfd pfds[2];
            pfds[0].fd = readFd; pfds[0].events = POLLIN; pfds[0].revents = 0;
            int nfds = 1;
            if (wakeEventFd >= 0) {
                pfds[1].fd = wakeEventFd; pfds[1].events = POLLIN; pfds[1].revents = 0;
                nfds = 2;
            }
            int rc = ::poll(pfds, static_cast<nfds_t>(nfds), -1);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("StdioTransport: poll failed (errno={} msg={})", errno, ::strerror(errno));
                endReason = "StdioTransport: poll failed";
                reportError(endReason);
                break;
            }
            if (nfds == 2 && (pfds[1].revents & POLLIN)) {
                // Close() requested
                break;
            }
            if ((pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            ssize_t n = ::read(readFd, tmp.data(), tmp.size());
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                    continue;
                }
                LOG_ERROR("StdioTransport: read error (errno={} msg={})", errno, ::strerror(errno));
                endReason = "StdioTransport: read error";
                reportError(endReason);
                break;
            }
            if (n == 0) {
                LOG_INFO("StdioTransport: EOF on input stream");
                endReason = "StdioTransport: peer closed the stream";
                break;
            }
            buffer.append(tmp.data(), static_cast<std::size_t>(n));
            for (;;) {
                auto r = framer->next(buffer);
                if (r.status == ILineFramer::DecodeStatus::Incomplete) {
                    break;
                }
                if (r.status == ILineFramer::DecodeStatus::LineTooLarge) {
                    reportError("StdioTransport: line too large");
                    continue;
                }
                processFrame(r.payload.value());
            }
        }

        // Observers see the closed state before any cancelled caller wakes up
        PendingMap drained = drainPending();
        notifyClosedOnce();
        failDrained(drained, endReason);
    }

    //------------------------------------------------------------------------------------------------------
    // Deadline sweeper
    //------------------------------------------------------------------------------------------------------
    void timeoutLoop(std::stop_token st) {
        std::unique_lock<std::mutex> lk(pendingMutex);
        while (!st.stop_requested()) {
            if (deadlines.empty()) {
                deadlineCv.wait(lk, st, [&]{ return !deadlines.empty(); });
                continue;
            }
            auto earliest = std::min_element(deadlines.begin(), deadlines.end(),
                [](const auto& a, const auto& b){ return a.second < b.second; })->second;
            if (Clock::now() < earliest) {
                deadlineCv.wait_until(lk, st, earliest, []{ return false; });
                continue;
            }
            std::vector<std::pair<int64_t, std::promise<JSONRPCResponse>>> expired;
            const auto now = Clock::now();
            for (auto it = deadlines.begin(); it != deadlines.end();) {
                if (it->second <= now) {
                    auto p = pending.find(it->first);
                    if (p != pending.end()) {
                        expired.emplace_back(it->first, std::move(p->second));
                        pending.erase(p);
                    }
                    it = deadlines.erase(it);
                } else {
                    ++it;
                }
            }
            lk.unlock();
            for (auto& [id, promise] : expired) {
                LOG_WARN("StdioTransport: request id={} timed out after {} ms", id, static_cast<long long>(requestTimeout.count()));
                promise.set_exception(std::make_exception_ptr(
                    TimeoutError("StdioTransport: request " + std::to_string(id) + " timed out")));
            }
            lk.lock();
        }
    }
};

StdioTransport::StdioTransport(int readFd, int writeFd)
    : StdioTransport(readFd, writeFd, Options{}) {}

StdioTransport::StdioTransport(int readFd, int writeFd, const Options& opts)
    : pImpl(std::make_shared<Impl>(readFd, writeFd, opts)) {}

StdioTransport::~StdioTransport() {
    Close();
    if (pImpl->readerThread.joinable()) {
        // Only reachable when Close() ran on the reader thread itself; its reference keeps Impl alive
        pImpl->readerThread.detach();
    }
}

void StdioTransport::StartReading() {
    FUNC_SCOPE();
    if (pImpl->started.exchange(true)) {
        return;
    }
    pImpl->timeoutThread = std::jthread([impl = pImpl.get()](std::stop_token st) {
        impl->timeoutLoop(st);
    });
    pImpl->readerThread = std::thread([impl = pImpl]() {
        impl->readerLoop();
    });
}

void StdioTransport::Close() {
    FUNC_SCOPE();
    if (pImpl->closeCalled.exchange(true)) {
        return;
    }
    Impl::PendingMap drained = pImpl->drainPending();
    {
        // Closing our write end lets the peer see EOF on its input
        std::lock_guard<std::mutex> lk(pImpl->writeMutex);
        closeFd(pImpl->writeFd);
    }
    pImpl->wakeReader();
    if (pImpl->readerThread.joinable() && pImpl->readerThread.get_id() != std::this_thread::get_id()) {
        pImpl->readerThread.join();
        closeFd(pImpl->readFd);
    }
    if (pImpl->timeoutThread.joinable()) {
        pImpl->timeoutThread.request_stop();
        pImpl->timeoutThread.join();
    }
    pImpl->notifyClosedOnce();
    Impl::failDrained(drained, "StdioTransport: transport closed");
}

bool StdioTransport::IsConnected() const {
    std::lock_guard<std::mutex> lk(pImpl->pendingMutex);
    return !pImpl->closed;
}

std::future<JSONRPCResponse> StdioTransport::Send(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    const int64_t id = pImpl->nextId.fetch_add(1);
    std::promise<JSONRPCResponse> promise;
    auto fut = promise.get_future();
    {
        std::lock_guard<std::mutex> lk(pImpl->pendingMutex);
        if (pImpl->closed) {
            throw TransportError("StdioTransport: transport closed");
        }
        pImpl->pending.emplace(id, std::move(promise));
        if (pImpl->requestTimeout.count() > 0) {
            pImpl->deadlines[id] = Impl::Clock::now() + pImpl->requestTimeout;
        }
    }
    pImpl->deadlineCv.notify_all();

    JSONRPCRequest request(JSONRPCId(id), method, std::move(params));
    try {
        pImpl->writeFrame(request.Serialize());
    } catch (const TransportError&) {
        std::lock_guard<std::mutex> lk(pImpl->pendingMutex);
        pImpl->pending.erase(id);
        pImpl->deadlines.erase(id);
        throw;
    }
    LOG_DEBUG("StdioTransport: sent request id={} method={}", id, method);
    return fut;
}

JSONRPCResponse StdioTransport::SendAndWait(const std::string& method, std::optional<JSONValue> params) {
    auto fut = Send(method, std::move(params));
    return fut.get();
}

void StdioTransport::SendNotification(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    JSONRPCRequest note(std::nullopt, method, std::move(params));
    pImpl->writeFrame(note.Serialize());
}

void StdioTransport::SetRouter(std::shared_ptr<DispatchRouter> router) {
    pImpl->router = std::move(router);
}

void StdioTransport::SetNotificationHandler(NotificationHandler handler) {
    pImpl->notificationHandler = std::move(handler);
}

void StdioTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

void StdioTransport::SetCloseHandler(CloseHandler handler) {
    pImpl->closeHandler = std::move(handler);
}

void StdioTransport::SetRequestTimeoutMs(uint64_t timeoutMs) {
    std::lock_guard<std::mutex> lk(pImpl->pendingMutex);
    pImpl->requestTimeout = std::chrono::milliseconds(static_cast<int64_t>(timeoutMs));
}

void StdioTransport::SetMaxLineBytes(std::size_t maxBytes) {
    pImpl->maxLineBytes = maxBytes;
}

std::size_t StdioTransport::PendingCount() const {
    std::lock_guard<std::mutex> lk(pImpl->pendingMutex);
    return pImpl->pending.size();
}

} // namespace toolhub
