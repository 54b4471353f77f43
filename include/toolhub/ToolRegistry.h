//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Name-keyed collection of provider connections; routes tool calls by provider name
//==========================================================================================================

#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "toolhub/ProviderConfig.h"
#include "toolhub/ToolConnection.h"

namespace toolhub {

//==========================================================================================================
// ToolRegistry
// Purpose: Owns every ToolConnection. Lookups take a shared lock; publish/remove take it exclusively.
// Notes:
//   - A name is reserved while its handshake runs, so a slow provider never blocks other callers and a
//     concurrent Connect for the same name is rejected with AlreadyConnected.
//   - A connection is published only after it reached ready.
//==========================================================================================================
class ToolRegistry {
public:
    struct ProviderInfo {
        std::string name;
        ConnectionStatus status;
        std::size_t toolCount;
    };

    explicit ToolRegistry(ToolConnection::Options connectionOptions = {});
    ~ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    //==========================================================================================================
    // Connect
    // Throws:
    //   RegistryError(AlreadyConnected) when the name is present or being connected (existing entry untouched);
    //   SpawnError / HandshakeError from the lifecycle (nothing is published).
    //==========================================================================================================
    void Connect(const std::string& name, const std::string& command,
                 const std::vector<std::string>& args,
                 const std::map<std::string, std::string>& env = {});

    //==========================================================================================================
    // ConnectAll
    // Purpose: Connect every configured provider; failures are collected instead of aborting.
    // Returns:
    //   provider name -> failure text, for the providers that could not be connected.
    //==========================================================================================================
    std::map<std::string, std::string> ConnectAll(const std::map<std::string, ProviderConfig>& configs);

    //==========================================================================================================
    // CallTool
    // Throws:
    //   RegistryError(ProviderNotFound) when the provider is absent.
    // Returns:
    //   The provider's outcome; transport failures are reported as success=false, never thrown.
    //==========================================================================================================
    ToolCallResult CallTool(const std::string& provider, const std::string& tool, const JSONValue& arguments);

    // Throws RegistryError(ProviderNotFound) when absent.
    void Disconnect(const std::string& name);

    // Closes and removes every entry. Also run on destruction.
    void DisconnectAll();

    std::vector<ProviderInfo> ListProviders() const;

    // Throws RegistryError(ProviderNotFound) when absent.
    std::vector<ToolDescriptor> ListTools(const std::string& provider) const;
    ConnectionStatus GetStatus(const std::string& provider) const;
    std::vector<ToolDescriptor> RefreshTools(const std::string& provider);

    bool Contains(const std::string& name) const;

private:
    std::shared_ptr<ToolConnection> find(const std::string& name) const;

    ToolConnection::Options connectionOptions;
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<ToolConnection>> connections;
    std::unordered_set<std::string> connecting;
};

} // namespace toolhub
