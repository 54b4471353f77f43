//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RegistryMethods.h
// Purpose: tools/* and providers/* hub methods over a ToolRegistry
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "toolhub/DispatchRouter.h"
#include "toolhub/ToolRegistry.h"

namespace toolhub {

// Invoked after a hub peer connected or disconnected a provider.
using ProviderEventHandler = std::function<void(const std::string& provider, ConnectionStatus status)>;

//==========================================================================================================
// RegisterRegistryMethods
// Purpose: Installs on the router:
//   tools/list        {provider?}                     -> {tools:[{provider,name,description,inputSchema}]}
//   tools/call        {provider, name, arguments?}    -> {success, result, message?}
//   tools/refresh     {provider}                      -> {provider, tools:[...]}
//   providers/list    {}                              -> {providers:[{name,status,toolCount}]}
//   providers/connect {name, command, args?, env?}    -> {name, status, toolCount}
//   providers/disconnect {name}                       -> {name, status:"closed"}
// Notes:
//   - RegistryError answers with ProviderNotFound / AlreadyConnected carrying {"provider": name} as data.
//   - Lifecycle failures from providers/connect (spawn, handshake) answer ProviderUnavailable.
//==========================================================================================================
void RegisterRegistryMethods(DispatchRouter& router, std::shared_ptr<ToolRegistry> registry,
                             ProviderEventHandler onProviderEvent = {});

} // namespace toolhub
