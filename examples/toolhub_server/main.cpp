//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: toolhub server example: provider config -> registry -> router -> hub -> WebSocket server
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhub/ConnectionHub.h"
#include "toolhub/DispatchRouter.h"
#include "toolhub/ProviderConfig.h"
#include "toolhub/ToolRegistry.h"
#include "toolhub/WebSocketServer.hpp"
#include "toolhub/capabilities/RegistryMethods.h"
#include "toolhub/capabilities/TerminalMethods.h"
#include "toolhub/version.h"

using namespace toolhub;

static std::atomic<bool> gRunning{true};

static void handleSig(int) {
    gRunning.store(false);
}

//==========================================================================================================
// Parses --key=value command-line options.
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static JSONValue statusParams(const std::string& provider, ConnectionStatus status) {
    JSONValue::Object obj;
    obj["provider"] = std::make_shared<JSONValue>(provider);
    obj["status"] = std::make_shared<JSONValue>(ToString(status));
    return JSONValue(std::move(obj));
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::configureFromEnv();
    ::signal(SIGTERM, handleSig);
    ::signal(SIGINT, handleSig);

    const std::string listen = getArgValue(argc, argv, "--listen")
        .value_or(GetEnvOrDefault("TOOLHUB_LISTEN", "ws://127.0.0.1:8080/ws/a2a"));
    const std::string configPath = getArgValue(argc, argv, "--config")
        .value_or(GetEnvOrDefault("TOOLHUB_PROVIDERS_CONFIG", ""));
    const bool enableTerminal = getArgValue(argc, argv, "--terminal")
        .value_or(GetEnvOrDefault("TOOLHUB_ENABLE_TERMINAL", "1")) != "0";

    LOG_INFO("toolhub {} starting", getVersionString());

    ConnectionHub hub;
    hub.Start();

    ToolConnection::Options connOpts;
    connOpts.onStatusChange = [&hub](const std::string& provider, ConnectionStatus status) {
        hub.BroadcastNotification("providers/status", statusParams(provider, status));
    };
    auto registry = std::make_shared<ToolRegistry>(connOpts);

    if (!configPath.empty()) {
        try {
            auto failures = registry->ConnectAll(LoadProviderConfigs(configPath));
            for (const auto& [name, why] : failures) {
                LOG_WARN("Provider '{}' unavailable: {}", name, why);
            }
        } catch (const ConfigError& e) {
            LOG_ERROR("Provider configuration rejected: {}", e.what());
            hub.Stop();
            return 1;
        }
    }

    auto router = std::make_shared<DispatchRouter>();
    RegisterRegistryMethods(*router, registry, [](const std::string& provider, ConnectionStatus status) {
        LOG_INFO("Provider '{}' is now {}", provider, ToString(status));
    });
    if (enableTerminal) {
        RegisterTerminalMethods(*router);
    }

    WebSocketServerFactory factory;
    std::unique_ptr<WebSocketServer> server;
    try {
        server = factory.CreateServer(listen, hub, router);
        server->SetErrorHandler([](const std::string& err) { LOG_WARN("Server: {}", err); });
        server->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot start server at {}: {}", listen, e.what());
        registry->DisconnectAll();
        hub.Stop();
        return 1;
    }
    LOG_INFO("Hub listening at {} ({} method(s))", listen, router->Methods().size());

    while (gRunning.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LOG_INFO("Shutting down");
    server->Stop().get();
    registry->DisconnectAll();
    hub.Stop();
    return 0;
}
