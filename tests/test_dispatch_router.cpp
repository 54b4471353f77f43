//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_dispatch_router.cpp
// Purpose: DispatchRouter classification, handler dispatch and error mapping
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>

#include "toolhub/DispatchRouter.h"
#include "toolhub/errors/Errors.h"

using namespace toolhub;

namespace {

int errorCode(const std::string& frame) {
    JSONRPCResponse resp;
    EXPECT_TRUE(resp.Deserialize(frame)) << frame;
    auto err = errors::rpcErrorFromResponse(resp);
    return err ? err->code : 0;
}

std::unique_ptr<DispatchRouter> makeEchoRouter() {
    auto router = std::make_unique<DispatchRouter>();
    router->Register("echo", [](const JSONValue::Object& params) {
        return JSONValue(params);
    });
    return router;
}

} // namespace

TEST(DispatchRouter, ClassifiesMessages) {
    using Kind = DispatchRouter::MessageKind;
    EXPECT_EQ(DispatchRouter::Classify(ParseJSON("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"m\"}")), Kind::Request);
    EXPECT_EQ(DispatchRouter::Classify(ParseJSON("{\"jsonrpc\":\"2.0\",\"method\":\"m\"}")), Kind::Notification);
    EXPECT_EQ(DispatchRouter::Classify(ParseJSON("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}")), Kind::Response);
    EXPECT_EQ(DispatchRouter::Classify(ParseJSON("{\"jsonrpc\":\"2.0\",\"id\":1,\"error\":{}}")), Kind::Response);
    EXPECT_EQ(DispatchRouter::Classify(ParseJSON("{\"jsonrpc\":\"2.0\",\"id\":1}")), Kind::Unknown);
    EXPECT_EQ(DispatchRouter::Classify(ParseJSON("[1,2]")), Kind::Unknown);
}

TEST(DispatchRouter, RegisterUnregisterAndListing) {
    DispatchRouter router;
    router.Register("zeta", [](const JSONValue::Object&) { return JSONValue(); });
    router.Register("alpha", [](const JSONValue::Object&) { return JSONValue(); });
    EXPECT_TRUE(router.HasMethod("zeta"));
    auto names = router.Methods();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "alpha");
    EXPECT_EQ(names[1], "zeta");
    EXPECT_TRUE(router.Unregister("zeta"));
    EXPECT_FALSE(router.Unregister("zeta"));
    EXPECT_FALSE(router.HasMethod("zeta"));
}

TEST(DispatchRouter, RequestGetsResultWithSameId) {
    auto router = makeEchoRouter();
    auto out = router->HandleFrame("{\"jsonrpc\":\"2.0\",\"id\":\"req-1\",\"method\":\"echo\",\"params\":{\"v\":1}}");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out.value(), "{\"jsonrpc\":\"2.0\",\"id\":\"req-1\",\"result\":{\"v\":1}}");
}

TEST(DispatchRouter, MissingParamsAreAnEmptyObject) {
    auto router = makeEchoRouter();
    auto out = router->HandleFrame("{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"echo\"}");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out.value(), "{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":{}}");
}

TEST(DispatchRouter, NotificationsNeverProduceReplies) {
    std::atomic<int> calls{0};
    DispatchRouter router;
    router.Register("ping", [&](const JSONValue::Object&) { ++calls; return JSONValue(); });
    router.Register("boom", [&](const JSONValue::Object&) -> JSONValue { ++calls; throw std::runtime_error("x"); });

    EXPECT_FALSE(router.HandleFrame("{\"jsonrpc\":\"2.0\",\"method\":\"ping\"}").has_value());
    EXPECT_FALSE(router.HandleFrame("{\"jsonrpc\":\"2.0\",\"method\":\"boom\"}").has_value());
    EXPECT_FALSE(router.HandleFrame("{\"jsonrpc\":\"2.0\",\"method\":\"unknown\"}").has_value());
    EXPECT_FALSE(router.HandleFrame("{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"params\":[1]}").has_value());
    EXPECT_EQ(calls.load(), 2);
}

TEST(DispatchRouter, InboundResponsesAreDropped) {
    auto router = makeEchoRouter();
    EXPECT_FALSE(router->HandleFrame("{\"jsonrpc\":\"2.0\",\"id\":5,\"result\":true}").has_value());
}

TEST(DispatchRouter, ParseErrorHasNullId) {
    auto router = makeEchoRouter();
    auto out = router->HandleFrame("{\"jsonrpc\":");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(errorCode(out.value()), JSONRPCErrorCodes::ParseError);
    EXPECT_NE(out->find("\"id\":null"), std::string::npos);
}

TEST(DispatchRouter, InvalidRequestShapes) {
    auto router = makeEchoRouter();
    auto notObject = router->HandleFrame("[1,2,3]");
    ASSERT_TRUE(notObject.has_value());
    EXPECT_EQ(errorCode(notObject.value()), JSONRPCErrorCodes::InvalidRequest);

    auto noMethod = router->HandleFrame("{\"jsonrpc\":\"2.0\",\"id\":4}");
    ASSERT_TRUE(noMethod.has_value());
    EXPECT_EQ(errorCode(noMethod.value()), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_NE(noMethod->find("\"id\":4"), std::string::npos);

    auto methodNotString = router->HandleFrame("{\"jsonrpc\":\"2.0\",\"id\":6,\"method\":7}");
    ASSERT_TRUE(methodNotString.has_value());
    EXPECT_EQ(errorCode(methodNotString.value()), JSONRPCErrorCodes::InvalidRequest);

    auto wrongVersion = router->HandleFrame("{\"jsonrpc\":\"1.0\",\"id\":8,\"method\":\"echo\"}");
    ASSERT_TRUE(wrongVersion.has_value());
    EXPECT_EQ(errorCode(wrongVersion.value()), JSONRPCErrorCodes::InvalidRequest);
}

TEST(DispatchRouter, UnknownMethod) {
    auto router = makeEchoRouter();
    auto out = router->HandleFrame("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"nope\"}");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(errorCode(out.value()), JSONRPCErrorCodes::MethodNotFound);
}

TEST(DispatchRouter, NonObjectParamsAreInvalid) {
    auto router = makeEchoRouter();
    auto out = router->HandleFrame("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"echo\",\"params\":[1]}");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(errorCode(out.value()), JSONRPCErrorCodes::InvalidParams);
}

TEST(DispatchRouter, HandlerFailuresMapToErrors) {
    DispatchRouter router;
    router.Register("typed", [](const JSONValue::Object&) -> JSONValue {
        throw RpcException(JSONRPCErrorCodes::ProviderNotFound, "provider not found: x");
    });
    router.Register("crash", [](const JSONValue::Object&) -> JSONValue {
        throw std::runtime_error("disk on fire");
    });

    JSONRPCRequest typed(JSONRPCId(static_cast<int64_t>(1)), "typed");
    auto r1 = router.Handle(typed);
    ASSERT_TRUE(r1.has_value());
    auto e1 = errors::rpcErrorFromResponse(r1.value());
    ASSERT_TRUE(e1.has_value());
    EXPECT_EQ(e1->code, JSONRPCErrorCodes::ProviderNotFound);
    EXPECT_EQ(e1->message, "provider not found: x");

    JSONRPCRequest crash(JSONRPCId(static_cast<int64_t>(2)), "crash");
    auto r2 = router.Handle(crash);
    ASSERT_TRUE(r2.has_value());
    auto e2 = errors::rpcErrorFromResponse(r2.value());
    ASSERT_TRUE(e2.has_value());
    EXPECT_EQ(e2->code, JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(e2->message, "disk on fire");
    EXPECT_EQ(std::get<int64_t>(r2->id), 2);
}
