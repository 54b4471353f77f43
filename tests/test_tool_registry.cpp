//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_registry.cpp
// Purpose: ToolRegistry name uniqueness, lookup failures, call routing and bulk connect
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include "toolhub/ToolRegistry.h"
#include "toolhub/errors/Errors.h"

using namespace toolhub;
using namespace std::chrono_literals;

namespace {
const std::string kProvider = TOOLHUB_TEST_PROVIDER;

RegistryErrorCode registryCode(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const RegistryError& e) {
        return e.Code();
    }
    ADD_FAILURE() << "expected RegistryError";
    return RegistryErrorCode::ProviderNotFound;
}
} // namespace

TEST(ToolRegistry, ConnectListAndCall) {
    ToolRegistry registry;
    registry.Connect("alpha", kProvider, {});
    registry.Connect("beta", kProvider, {"--tools", "1"});

    auto providers = registry.ListProviders();
    ASSERT_EQ(providers.size(), 2u);
    EXPECT_EQ(providers[0].name, "alpha");
    EXPECT_EQ(providers[0].status, ConnectionStatus::Ready);
    EXPECT_EQ(providers[0].toolCount, 3u);
    EXPECT_EQ(providers[1].name, "beta");
    EXPECT_EQ(providers[1].toolCount, 1u);

    EXPECT_TRUE(registry.Contains("alpha"));
    EXPECT_EQ(registry.GetStatus("beta"), ConnectionStatus::Ready);
    EXPECT_EQ(registry.ListTools("beta").at(0).name, "echo");

    ToolCallResult r = registry.CallTool("alpha", "add", ParseJSON("{\"a\":1,\"b\":2}"));
    EXPECT_TRUE(r.success);
    EXPECT_EQ(serializeJSONValue(r.ToJSON()),
              "{\"success\":true,\"result\":{\"content\":[{\"type\":\"text\",\"text\":\"3\"}]}}");
}

TEST(ToolRegistry, DuplicateNameIsRejectedWithoutSideEffects) {
    ToolRegistry registry;
    registry.Connect("dup", kProvider, {});
    EXPECT_EQ(registryCode([&]{ registry.Connect("dup", kProvider, {"--tools", "1"}); }),
              RegistryErrorCode::AlreadyConnected);
    auto providers = registry.ListProviders();
    ASSERT_EQ(providers.size(), 1u);
    EXPECT_EQ(providers[0].toolCount, 3u);
}

TEST(ToolRegistry, NameIsReservedWhileConnecting) {
    ToolRegistry registry;
    auto slow = std::async(std::launch::async, [&] {
        registry.Connect("pending", kProvider, {"--init-delay", "500"});
    });
    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(registry.Contains("pending"));
    EXPECT_EQ(registryCode([&]{ registry.Connect("pending", kProvider, {}); }),
              RegistryErrorCode::AlreadyConnected);
    ASSERT_EQ(slow.wait_for(5s), std::future_status::ready);
    slow.get();
    EXPECT_TRUE(registry.Contains("pending"));
}

TEST(ToolRegistry, UnknownProviderIsNotFound) {
    ToolRegistry registry;
    EXPECT_EQ(registryCode([&]{ registry.CallTool("missing", "echo", JSONValue(JSONValue::Object{})); }),
              RegistryErrorCode::ProviderNotFound);
    EXPECT_EQ(registryCode([&]{ registry.Disconnect("missing"); }), RegistryErrorCode::ProviderNotFound);
    EXPECT_EQ(registryCode([&]{ registry.ListTools("missing"); }), RegistryErrorCode::ProviderNotFound);
    EXPECT_EQ(registryCode([&]{ registry.GetStatus("missing"); }), RegistryErrorCode::ProviderNotFound);
    EXPECT_EQ(registryCode([&]{ registry.RefreshTools("missing"); }), RegistryErrorCode::ProviderNotFound);
}

TEST(ToolRegistry, FailedConnectLeavesNoTrace) {
    ToolRegistry registry;
    EXPECT_THROW(registry.Connect("broken", kProvider, {"--fail-init"}), HandshakeError);
    EXPECT_FALSE(registry.Contains("broken"));
    EXPECT_THROW(registry.Connect("ghost", "/nonexistent/provider", {}), SpawnError);
    EXPECT_TRUE(registry.ListProviders().empty());
    // The name is free again
    registry.Connect("broken", kProvider, {});
    EXPECT_TRUE(registry.Contains("broken"));
}

TEST(ToolRegistry, DisconnectRemovesProvider) {
    ToolRegistry registry;
    registry.Connect("gone", kProvider, {});
    registry.Disconnect("gone");
    EXPECT_FALSE(registry.Contains("gone"));
    EXPECT_EQ(registryCode([&]{ registry.Disconnect("gone"); }), RegistryErrorCode::ProviderNotFound);
    registry.Connect("gone", kProvider, {});
    EXPECT_TRUE(registry.Contains("gone"));
}

TEST(ToolRegistry, TransportFailureBecomesUnsuccessfulResult) {
    ToolRegistry registry;
    registry.Connect("crashy", kProvider, {"--crash-on-call"});
    ToolCallResult r = registry.CallTool("crashy", "echo", ParseJSON("{\"text\":\"x\"}"));
    EXPECT_FALSE(r.success);
    EXPECT_FALSE(r.message.empty());
    EXPECT_EQ(registry.GetStatus("crashy"), ConnectionStatus::Closed);
    // A closed provider stays registered until disconnected
    EXPECT_TRUE(registry.Contains("crashy"));
    ToolCallResult again = registry.CallTool("crashy", "echo", ParseJSON("{\"text\":\"x\"}"));
    EXPECT_FALSE(again.success);
}

TEST(ToolRegistry, ConnectAllReportsFailuresPerProvider) {
    std::map<std::string, ProviderConfig> configs;
    configs["good"] = ProviderConfig{kProvider, {}, {}};
    configs["bad"] = ProviderConfig{kProvider, {"--fail-init"}, {}};
    configs["missing"] = ProviderConfig{"/nonexistent/provider", {}, {}};

    ToolRegistry registry;
    auto failures = registry.ConnectAll(configs);
    EXPECT_EQ(failures.size(), 2u);
    EXPECT_EQ(failures.count("bad"), 1u);
    EXPECT_EQ(failures.count("missing"), 1u);
    EXPECT_TRUE(registry.Contains("good"));

    registry.DisconnectAll();
    EXPECT_TRUE(registry.ListProviders().empty());
}

TEST(ToolRegistry, InFlightCallObservesDisconnect) {
    ToolRegistry registry;
    registry.Connect("busy", kProvider, {});
    auto call = std::async(std::launch::async, [&] {
        return registry.CallTool("busy", "sleep", ParseJSON("{\"ms\":3000}"));
    });
    std::this_thread::sleep_for(200ms);
    registry.Disconnect("busy");
    ASSERT_EQ(call.wait_for(2s), std::future_status::ready);
    ToolCallResult r = call.get();
    EXPECT_FALSE(r.success);
}
