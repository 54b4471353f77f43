//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/toolhub/WebSocketServer.cpp
// Purpose: WebSocket/secure WebSocket hub front end using Boost.Beast (TLS 1.3 only for wss)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <deque>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <fmt/format.h>
#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "toolhub/WebSocketServer.hpp"
#include "toolhub/version.h"

namespace toolhub {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {

constexpr auto kUpgradeTimeout = std::chrono::seconds(30);

std::string targetPath(beast::string_view target) {
    std::string t(target);
    auto q = t.find('?');
    return q == std::string::npos ? t : t.substr(0, q);
}

//==========================================================================================================
// SessionPeer
// Purpose: Hub peer plus the server-side hooks used by the session read loop and by shutdown.
//==========================================================================================================
class SessionPeer : public IPeer {
public:
    // Fire-and-forget write of a router response; ordered with hub writes on the same peer.
    virtual void Reply(std::string frame) = 0;
    // Closes the socket synchronously; only valid once the I/O thread has been joined.
    virtual void CloseNow() = 0;
};

//==========================================================================================================
// WebSocketPeer
// Purpose: One accepted connection. All stream operations run on the I/O thread; callers on other
//          threads hand work over with net::post and, for hub writes, wait on a promise.
//==========================================================================================================
template <class NextLayer>
class WebSocketPeer : public SessionPeer, public std::enable_shared_from_this<WebSocketPeer<NextLayer>> {
public:
    WebSocketPeer(NextLayer&& next, std::string id, std::shared_ptr<net::io_context> ioc,
                  std::chrono::milliseconds writeTimeout)
        : ws(std::move(next)), peerId(std::move(id)), ioc(std::move(ioc)), writeTimeout(writeTimeout) {}

    websocket::stream<NextLayer>& Stream() { return ws; }

    const std::string& Id() const override { return peerId; }

    bool Send(const std::string& frame) override {
        return submitAndWait(Outgoing{Outgoing::Kind::Text, frame, nullptr});
    }

    bool Ping() override {
        return submitAndWait(Outgoing{Outgoing::Kind::Ping, std::string(), nullptr});
    }

    void Reply(std::string frame) override {
        if (!usable()) {
            LOG_DEBUG("WebSocketServer: dropping reply for closed peer {}", peerId);
            return;
        }
        net::post(*ioc, [self = this->shared_from_this(),
                         item = Outgoing{Outgoing::Kind::Text, std::move(frame), nullptr}]() mutable {
            self->enqueue(std::move(item));
        });
    }

    void Close() override {
        if (closeRequested.exchange(true)) {
            return;
        }
        if (ioc->stopped()) {
            closeSocket();
            return;
        }
        net::post(*ioc, [self = this->shared_from_this()]() {
            self->closeSocket();
            self->failQueued();
        });
    }

    void CloseNow() override {
        closeRequested.store(true);
        closeSocket();
        failQueued();
    }

private:
    struct Outgoing {
        enum class Kind { Text, Ping };
        Kind kind;
        std::string payload;
        std::shared_ptr<std::promise<bool>> done;
    };

    bool usable() const {
        return !closeRequested.load() && !broken.load() && !ioc->stopped();
    }

    bool submitAndWait(Outgoing item) {
        if (!usable()) {
            return false;
        }
        auto done = std::make_shared<std::promise<bool>>();
        auto fut = done->get_future();
        item.done = std::move(done);
        net::post(*ioc, [self = this->shared_from_this(), item = std::move(item)]() mutable {
            self->enqueue(std::move(item));
        });
        if (fut.wait_for(writeTimeout) != std::future_status::ready) {
            LOG_WARN("WebSocketServer: write to {} timed out after {} ms", peerId,
                     static_cast<long long>(writeTimeout.count()));
            return false;
        }
        try {
            return fut.get();
        } catch (const std::future_error&) {
            // Handler dropped with the I/O context
            return false;
        }
    }

    // I/O thread
    void enqueue(Outgoing item) {
        if (closeRequested.load() || broken.load()) {
            settle(item, false);
            return;
        }
        outbox.push_back(std::move(item));
        if (!writing) {
            writing = true;
            net::co_spawn(*ioc, drain(this->shared_from_this()), net::detached);
        }
    }

    // I/O thread; the argument keeps the peer alive for the life of the coroutine frame
    net::awaitable<void> drain(std::shared_ptr<WebSocketPeer> /*self*/) {
        while (!outbox.empty()) {
            Outgoing item = std::move(outbox.front());
            outbox.pop_front();
            bool ok = true;
            try {
                if (item.kind == Outgoing::Kind::Ping) {
                    co_await ws.async_ping(websocket::ping_data{}, net::use_awaitable);
                } else {
                    co_await ws.async_write(net::buffer(item.payload), net::use_awaitable);
                }
            } catch (const boost::system::system_error& e) {
                ok = false;
                LOG_DEBUG("WebSocketServer: write to {} failed: {}", peerId, e.what());
            }
            settle(item, ok);
            if (!ok) {
                broken.store(true);
                failQueued();
                break;
            }
        }
        writing = false;
        co_return;
    }

    void failQueued() {
        while (!outbox.empty()) {
            settle(outbox.front(), false);
            outbox.pop_front();
        }
    }

    static void settle(Outgoing& item, bool ok) {
        if (item.done) {
            item.done->set_value(ok);
            item.done.reset();
        }
    }

    void closeSocket() {
        std::lock_guard<std::mutex> lk(socketMutex);
        beast::error_code ec;
        beast::get_lowest_layer(ws).socket().close(ec);
    }

    websocket::stream<NextLayer> ws;
    std::string peerId;
    std::shared_ptr<net::io_context> ioc;
    std::chrono::milliseconds writeTimeout;

    std::atomic<bool> closeRequested{false};
    std::atomic<bool> broken{false};
    std::mutex socketMutex;

    // I/O thread only
    std::deque<Outgoing> outbox;
    bool writing{false};
};

} // namespace

class WebSocketServer::Impl {
public:
    WebSocketServer::Options opts;
    ConnectionHub& hub;
    std::shared_ptr<DispatchRouter> router;
    std::atomic<bool> running{false};

    // Shared with peers so a peer outliving the server never posts to a destroyed context
    std::shared_ptr<net::io_context> ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==wss
    std::unique_ptr<net::thread_pool> pool;
    std::thread ioThread;
    std::atomic<unsigned short> boundPort{0};
    std::atomic<uint64_t> peerSeq{0};

    std::mutex sessionsMutex;
    std::vector<std::weak_ptr<SessionPeer>> sessions;

    WebSocketServer::ErrorHandler errorHandler;

    Impl(const WebSocketServer::Options& o, ConnectionHub& h, std::shared_ptr<DispatchRouter> r)
        : opts(o), hub(h), router(std::move(r)), ioc(std::make_shared<net::io_context>()) {
        if (!router) {
            router = std::make_shared<DispatchRouter>();
        }
        if (opts.scheme == "wss") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("WebSocketServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        shutdown();
    }

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    void listen() {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty()) {
            throw std::invalid_argument("WebSocketServer invalid port: empty");
        }
        bool allDigits = std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
        if (!allDigits || opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
            throw std::invalid_argument("WebSocketServer invalid port: " + opts.port);
        }
        tcp::resolver resolver(*ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(*ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
        pool = std::make_unique<net::thread_pool>(std::max<std::size_t>(1, opts.handlerThreads));
    }

    void shutdown() {
        running.store(false);
        ioc->stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
        if (acceptor) {
            boost::system::error_code ec;
            acceptor->close(ec);
        }
        std::vector<std::weak_ptr<SessionPeer>> drained;
        {
            std::lock_guard<std::mutex> lk(sessionsMutex);
            drained.swap(sessions);
        }
        for (auto& weak : drained) {
            if (auto peer = weak.lock()) {
                peer->CloseNow();
            }
        }
        if (pool) {
            pool->stop();
            pool->join();
        }
    }

    void track(const std::shared_ptr<SessionPeer>& peer) {
        std::lock_guard<std::mutex> lk(sessionsMutex);
        sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
                                      [](const std::weak_ptr<SessionPeer>& w){ return w.expired(); }),
                       sessions.end());
        sessions.push_back(peer);
    }

    void dispatch(std::shared_ptr<SessionPeer> peer, std::string frame) {
        net::post(*pool, [r = router, peer = std::move(peer), frame = std::move(frame)]() {
            try {
                std::optional<std::string> reply = r->HandleFrame(frame);
                if (reply) {
                    peer->Reply(std::move(*reply));
                }
            } catch (const std::exception& e) {
                LOG_ERROR("WebSocketServer: dispatch for {} failed: {}", peer->Id(), e.what());
            }
        });
    }

    void reportSessionError(const char* kind, const std::exception& e) {
        if (!running.load()) {
            // Suppress shutdown-related errors; log at DEBUG only in debug builds
#ifdef _DEBUG
            LOG_DEBUG("WebSocketServer {} session suppressed during shutdown: {}", kind, e.what());
#endif
        } else {
            setError(fmt::format("WebSocketServer {} session error: {}", kind, e.what()));
        }
    }

    template <class NextLayer>
    net::awaitable<void> serve(NextLayer stream) {
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        beast::get_lowest_layer(stream).expires_after(kUpgradeTimeout);
        co_await http::async_read(stream, buffer, req, net::use_awaitable);

        if (!websocket::is_upgrade(req) || targetPath(req.target()) != opts.path) {
            http::response<http::string_body> res{http::status::not_found, req.version()};
            res.set(http::field::content_type, "application/json");
            res.keep_alive(false);
            res.body() = std::string("{\"error\":\"Not found\"}");
            res.prepare_payload();
            co_await http::async_write(stream, res, net::use_awaitable);
            co_return;
        }
        beast::get_lowest_layer(stream).expires_never();

        auto peer = std::make_shared<WebSocketPeer<NextLayer>>(
            std::move(stream), fmt::format("peer-{}", ++peerSeq), ioc, opts.writeTimeout);
        auto& ws = peer->Stream();
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, "toolhub/" + getVersionString());
        }));
        co_await ws.async_accept(req, net::use_awaitable);
        ws.text(true);

        track(peer);
        hub.Register(peer);

        try {
            for (;;) {
                beast::flat_buffer msg;
                co_await ws.async_read(msg, net::use_awaitable);
                dispatch(peer, beast::buffers_to_string(msg.data()));
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() == websocket::error::closed) {
                LOG_INFO("WebSocketServer: {} closed by remote", peer->Id());
            } else {
                LOG_DEBUG("WebSocketServer: {} read ended: {}", peer->Id(), e.what());
            }
        } catch (const std::exception& e) {
            LOG_WARN("WebSocketServer: {} read loop failed: {}", peer->Id(), e.what());
        }
        hub.Unregister(peer);
        co_return;
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            co_await serve(beast::tcp_stream(std::move(socket)));
        } catch (const std::exception& e) {
            reportSessionError("plain", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            beast::ssl_stream<beast::tcp_stream> tls(beast::tcp_stream(std::move(socket)), *sslCtx);
            beast::get_lowest_layer(tls).expires_after(kUpgradeTimeout);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serve(std::move(tls));
        } catch (const std::exception& e) {
            reportSessionError("TLS", e);
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (sslCtx) {
                    net::co_spawn(*ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(*ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                // Suppress shutdown-related errors (e.g., operation_aborted when acceptor is closed)
                #ifdef _DEBUG
                LOG_DEBUG("WebSocketServer accept suppressed during shutdown: {}", e.what());
                #endif
            } else {
                setError(std::string("WebSocketServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

WebSocketServer::WebSocketServer(const Options& opts, ConnectionHub& hub, std::shared_ptr<DispatchRouter> router)
    : pImpl(std::make_unique<Impl>(opts, hub, std::move(router))) {}

WebSocketServer::~WebSocketServer() = default;

std::future<void> WebSocketServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    try {
        pImpl->listen();
    } catch (const std::exception& e) {
        pImpl->setError(std::string("WebSocketServer listen failed: ") + e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    LOG_INFO("WebSocketServer: listening on {}://{}:{}{}", pImpl->opts.scheme, pImpl->opts.address,
             pImpl->boundPort.load(), pImpl->opts.path);
    pImpl->ioThread = std::thread([this, pr = std::move(ready)]() mutable {
        try {
            net::co_spawn(*pImpl->ioc, pImpl->acceptLoop(), net::detached);
            pr.set_value();
            pImpl->ioc->run();
        } catch (const std::exception& e) {
            pImpl->setError(std::string("WebSocketServer I/O thread error: ") + e.what());
        }
    });
    return fut;
}

std::future<void> WebSocketServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->shutdown();
    LOG_INFO("WebSocketServer: stopped");
    done.set_value();
    return fut;
}

unsigned short WebSocketServer::BoundPort() const {
    return pImpl->boundPort.load();
}

void WebSocketServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

WebSocketServer::Options WebSocketServerFactory::ParseOptions(const std::string& config) {
    WebSocketServer::Options opts;
    // Factory default: ws if scheme omitted
    opts.scheme = "ws";

    std::string cfg = config;
    // Trim leading/trailing spaces
    auto trim = [](std::string& s){
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "ws://")) {
        cfg = cfg.substr(5);
    } else if (startsWith(cfg, "wss://")) {
        opts.scheme = "wss";
        cfg = cfg.substr(6);
    }

    // Split query params
    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }

    std::string hostPort = hostPortPath;
    auto slash = hostPortPath.find('/');
    if (slash != std::string::npos) {
        hostPort = hostPortPath.substr(0, slash);
        std::string path = hostPortPath.substr(slash);
        if (path.size() > 1) {
            opts.path = path;
        }
    }
    trim(hostPort);

    // Parse host[:port] including IPv4/IPv6 in [addr]:port form
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(opts.port);
        if (opts.port.empty()) opts.port = "8080"; // default
    }

    // Parse query parameters: cert, key
    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") opts.certFile = val;
            else if (key == "key") opts.keyFile = val;
        }
    }
    return opts;
}

std::unique_ptr<WebSocketServer> WebSocketServerFactory::CreateServer(const std::string& config, ConnectionHub& hub,
                                                                      std::shared_ptr<DispatchRouter> router) {
    return std::make_unique<WebSocketServer>(ParseOptions(config), hub, std::move(router));
}

} // namespace toolhub
