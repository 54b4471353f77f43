//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProviderConfig.h
// Purpose: Provider launch configuration (name -> {command, args, env}) loaded from JSON
//==========================================================================================================

#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "toolhub/JSONRPCTypes.h"
#include "toolhub/ProviderProcess.h"

namespace toolhub {

struct ProviderConfig {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    LaunchSpec ToLaunchSpec() const { return LaunchSpec{command, args, env}; }
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// ParseProviderConfigs
// Purpose: Accepts {"providers": {"<name>": {...}}} or a bare {"<name>": {...}} mapping.
//   Each entry: "command" (string, required), "args" (array of strings), "env" (object of strings).
// Throws:
//   ConfigError naming the offending provider/field.
//==========================================================================================================
std::map<std::string, ProviderConfig> ParseProviderConfigs(const JSONValue& doc);

// Reads and parses a JSON file. Throws ConfigError when unreadable or malformed.
std::map<std::string, ProviderConfig> LoadProviderConfigs(const std::string& path);

} // namespace toolhub
