//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_websocket_server.cpp
// Purpose: WebSocket hub endpoint: request/response, broadcast, unknown paths, listen-address parsing
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "toolhub/ConnectionHub.h"
#include "toolhub/DispatchRouter.h"
#include "toolhub/WebSocketServer.hpp"
#include "toolhub/errors/Errors.h"

using namespace toolhub;
using namespace std::chrono_literals;

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {

std::shared_ptr<DispatchRouter> makeRouter() {
    auto router = std::make_shared<DispatchRouter>();
    router->Register("echo", [](const JSONValue::Object& params) {
        return JSONValue(params);
    });
    return router;
}

WebSocketServer::Options loopbackOptions() {
    WebSocketServer::Options opts;
    opts.address = "127.0.0.1";
    opts.port = "0";
    opts.handlerThreads = 2;
    return opts;
}

bool waitForPeers(ConnectionHub& hub, std::size_t expected) {
    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (std::chrono::steady_clock::now() < deadline) {
        auto fut = hub.PeerCount();
        if (fut.wait_for(1s) == std::future_status::ready && fut.get() == expected) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

struct WsClient {
    net::io_context ioc;
    websocket::stream<tcp::socket> ws{ioc};

    void connect(unsigned short port, const std::string& path = "/ws/a2a") {
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve("127.0.0.1", std::to_string(port));
        net::connect(ws.next_layer(), results);
        ws.handshake("127.0.0.1:" + std::to_string(port), path);
        ws.text(true);
    }

    void send(const std::string& text) {
        ws.write(net::buffer(text));
    }

    std::string receive() {
        beast::flat_buffer buf;
        ws.read(buf);
        return beast::buffers_to_string(buf.data());
    }

    void close() {
        beast::error_code ec;
        ws.close(websocket::close_code::normal, ec);
    }
};

} // namespace

//=============================== E2E WebSocket ==============================================================

TEST(WebSocketServer, RequestResponseOverWebSocket) {
    ConnectionHub hub;
    hub.Start();
    WebSocketServer server(loopbackOptions(), hub, makeRouter());
    server.Start().get();
    ASSERT_NE(server.BoundPort(), 0);

    WsClient client;
    client.connect(server.BoundPort());
    client.send("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"echo\",\"params\":{\"hello\":\"world\"}}");
    EXPECT_EQ(client.receive(), "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"hello\":\"world\"}}");

    client.send("{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"missing\"}");
    JSONRPCResponse resp;
    ASSERT_TRUE(resp.Deserialize(client.receive()));
    auto err = errors::rpcErrorFromResponse(resp);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::MethodNotFound);

    client.send("garbage");
    JSONRPCResponse parseErr;
    ASSERT_TRUE(parseErr.Deserialize(client.receive()));
    EXPECT_EQ(errors::rpcErrorFromResponse(parseErr)->code, JSONRPCErrorCodes::ParseError);

    client.close();
    EXPECT_TRUE(waitForPeers(hub, 0));
    server.Stop().get();
    hub.Stop();
}

TEST(WebSocketServer, BroadcastReachesConnectedClients) {
    ConnectionHub hub;
    hub.Start();
    WebSocketServer server(loopbackOptions(), hub, makeRouter());
    server.Start().get();

    WsClient first;
    WsClient second;
    first.connect(server.BoundPort());
    second.connect(server.BoundPort());
    ASSERT_TRUE(waitForPeers(hub, 2));

    JSONValue::Object params;
    params["provider"] = std::make_shared<JSONValue>("fs");
    params["status"] = std::make_shared<JSONValue>("closed");
    hub.BroadcastNotification("providers/status", JSONValue(params));
    hub.Broadcast("{\"jsonrpc\":\"2.0\",\"method\":\"second\"}");

    for (auto* c : {&first, &second}) {
        EXPECT_EQ(c->receive(), "{\"jsonrpc\":\"2.0\",\"method\":\"providers/status\",\"params\":{\"provider\":\"fs\",\"status\":\"closed\"}}");
        EXPECT_EQ(c->receive(), "{\"jsonrpc\":\"2.0\",\"method\":\"second\"}");
    }

    first.close();
    EXPECT_TRUE(waitForPeers(hub, 1));
    second.close();
    server.Stop().get();
    hub.Stop();
}

TEST(WebSocketServer, UnknownPathIsNotFound) {
    ConnectionHub hub;
    hub.Start();
    WebSocketServer server(loopbackOptions(), hub, makeRouter());
    server.Start().get();

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    stream.connect(resolver.resolve("127.0.0.1", std::to_string(server.BoundPort())));
    http::request<http::empty_body> req{http::verb::get, "/elsewhere", 11};
    req.set(http::field::host, "127.0.0.1");
    http::write(stream, req);
    beast::flat_buffer buf;
    http::response<http::string_body> res;
    http::read(stream, buf, res);
    EXPECT_EQ(res.result(), http::status::not_found);
    EXPECT_EQ(res.body(), "{\"error\":\"Not found\"}");
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    WsClient wrongPath;
    EXPECT_THROW(wrongPath.connect(server.BoundPort(), "/other"), boost::system::system_error);

    auto count = hub.PeerCount();
    ASSERT_EQ(count.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(count.get(), 0u);
    server.Stop().get();
    hub.Stop();
}

TEST(WebSocketServer, StopClosesClientConnections) {
    ConnectionHub hub;
    hub.Start();
    WebSocketServer server(loopbackOptions(), hub, makeRouter());
    server.Start().get();
    WsClient client;
    client.connect(server.BoundPort());
    ASSERT_TRUE(waitForPeers(hub, 1));

    server.Stop().get();
    beast::flat_buffer buf;
    beast::error_code ec;
    client.ws.read(buf, ec);
    EXPECT_TRUE(ec);
    hub.Stop();
}

TEST(WebSocketServer, InvalidPortFailsStart) {
    ConnectionHub hub;
    WebSocketServer::Options opts = loopbackOptions();
    opts.port = "99999";
    WebSocketServer server(opts, hub, makeRouter());
    auto fut = server.Start();
    EXPECT_THROW(fut.get(), std::invalid_argument);

    opts.port = "80a";
    WebSocketServer other(opts, hub, makeRouter());
    EXPECT_THROW(other.Start().get(), std::invalid_argument);
}

//=============================== Listen address parsing =====================================================

TEST(WebSocketServerFactory, ParsesPlainUrl) {
    auto o = WebSocketServerFactory::ParseOptions("ws://127.0.0.1:9001/hub");
    EXPECT_EQ(o.scheme, "ws");
    EXPECT_EQ(o.address, "127.0.0.1");
    EXPECT_EQ(o.port, "9001");
    EXPECT_EQ(o.path, "/hub");
}

TEST(WebSocketServerFactory, DefaultsPortAndPath) {
    auto o = WebSocketServerFactory::ParseOptions("  ws://localhost  ");
    EXPECT_EQ(o.address, "localhost");
    EXPECT_EQ(o.port, "8080");
    EXPECT_EQ(o.path, "/ws/a2a");

    auto root = WebSocketServerFactory::ParseOptions("ws://0.0.0.0:7000/");
    EXPECT_EQ(root.path, "/ws/a2a");
    EXPECT_EQ(root.port, "7000");
}

TEST(WebSocketServerFactory, ParsesIpv6AndTlsQuery) {
    auto o = WebSocketServerFactory::ParseOptions("wss://[::1]:8443/secure?cert=/etc/hub.pem&key=/etc/hub.key");
    EXPECT_EQ(o.scheme, "wss");
    EXPECT_EQ(o.address, "::1");
    EXPECT_EQ(o.port, "8443");
    EXPECT_EQ(o.path, "/secure");
    EXPECT_EQ(o.certFile, "/etc/hub.pem");
    EXPECT_EQ(o.keyFile, "/etc/hub.key");
}

TEST(WebSocketServerFactory, SchemeIsOptional) {
    auto o = WebSocketServerFactory::ParseOptions("127.0.0.1:6000");
    EXPECT_EQ(o.scheme, "ws");
    EXPECT_EQ(o.address, "127.0.0.1");
    EXPECT_EQ(o.port, "6000");
}
