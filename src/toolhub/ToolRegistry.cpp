//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Provider registry (reader/writer locked map + reserved names for in-flight connects)
//==========================================================================================================

#include <algorithm>
#include <mutex>
#include <utility>

#include "logging/Logger.h"
#include "toolhub/ToolRegistry.h"
#include "toolhub/errors/Errors.h"

namespace toolhub {

ToolRegistry::ToolRegistry(ToolConnection::Options connectionOptions)
    : connectionOptions(std::move(connectionOptions)) {}

ToolRegistry::~ToolRegistry() {
    DisconnectAll();
}

std::shared_ptr<ToolConnection> ToolRegistry::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = connections.find(name);
    if (it == connections.end()) {
        throw RegistryError(RegistryErrorCode::ProviderNotFound, name);
    }
    return it->second;
}

bool ToolRegistry::Contains(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return connections.count(name) > 0;
}

void ToolRegistry::Connect(const std::string& name, const std::string& command,
                           const std::vector<std::string>& args,
                           const std::map<std::string, std::string>& env) {
    FUNC_SCOPE();
    {
        std::unique_lock<std::shared_mutex> lock(mutex);
        if (connections.count(name) > 0 || connecting.count(name) > 0) {
            throw RegistryError(RegistryErrorCode::AlreadyConnected, name);
        }
        connecting.insert(name);
    }

    std::unique_ptr<ToolConnection> conn;
    try {
        conn = ToolConnection::Connect(name, LaunchSpec{command, args, env}, connectionOptions);
    } catch (const std::exception& e) {
        LOG_ERROR("ToolRegistry: connect '{}' failed: {}", name, e.what());
        std::unique_lock<std::shared_mutex> lock(mutex);
        connecting.erase(name);
        throw;
    }

    std::unique_lock<std::shared_mutex> lock(mutex);
    connecting.erase(name);
    connections.emplace(name, std::shared_ptr<ToolConnection>(std::move(conn)));
    LOG_INFO("ToolRegistry: provider '{}' connected", name);
}

std::map<std::string, std::string> ToolRegistry::ConnectAll(const std::map<std::string, ProviderConfig>& configs) {
    std::map<std::string, std::string> failures;
    for (const auto& [name, cfg] : configs) {
        try {
            Connect(name, cfg.command, cfg.args, cfg.env);
        } catch (const std::exception& e) {
            failures[name] = e.what();
        }
    }
    if (!failures.empty()) {
        LOG_WARN("ToolRegistry: {} of {} provider(s) failed to connect", failures.size(), configs.size());
    }
    return failures;
}

ToolCallResult ToolRegistry::CallTool(const std::string& provider, const std::string& tool,
                                      const JSONValue& arguments) {
    FUNC_SCOPE();
    std::shared_ptr<ToolConnection> conn = find(provider);
    try {
        return conn->CallTool(tool, arguments);
    } catch (const TransportError& e) {
        LOG_WARN("ToolRegistry: call {}/{} failed: {}", provider, tool, e.what());
        ToolCallResult out;
        out.success = false;
        out.message = e.what();
        return out;
    }
}

void ToolRegistry::Disconnect(const std::string& name) {
    std::shared_ptr<ToolConnection> conn;
    {
        std::unique_lock<std::shared_mutex> lock(mutex);
        auto it = connections.find(name);
        if (it == connections.end()) {
            throw RegistryError(RegistryErrorCode::ProviderNotFound, name);
        }
        conn = std::move(it->second);
        connections.erase(it);
    }
    // Close outside the lock; in-flight callers holding the connection observe TransportError
    conn->Close();
    LOG_INFO("ToolRegistry: provider '{}' disconnected", name);
}

void ToolRegistry::DisconnectAll() {
    std::unordered_map<std::string, std::shared_ptr<ToolConnection>> drained;
    {
        std::unique_lock<std::shared_mutex> lock(mutex);
        drained.swap(connections);
    }
    for (auto& [name, conn] : drained) {
        conn->Close();
    }
    if (!drained.empty()) {
        LOG_INFO("ToolRegistry: disconnected {} provider(s)", drained.size());
    }
}

std::vector<ToolRegistry::ProviderInfo> ToolRegistry::ListProviders() const {
    std::vector<ProviderInfo> out;
    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        out.reserve(connections.size());
        for (const auto& [name, conn] : connections) {
            out.push_back(ProviderInfo{name, conn->Status(), conn->GetTools().size()});
        }
    }
    std::sort(out.begin(), out.end(), [](const ProviderInfo& a, const ProviderInfo& b){ return a.name < b.name; });
    return out;
}

std::vector<ToolDescriptor> ToolRegistry::ListTools(const std::string& provider) const {
    return find(provider)->GetTools();
}

ConnectionStatus ToolRegistry::GetStatus(const std::string& provider) const {
    return find(provider)->Status();
}

std::vector<ToolDescriptor> ToolRegistry::RefreshTools(const std::string& provider) {
    return find(provider)->RefreshTools();
}

} // namespace toolhub
