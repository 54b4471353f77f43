//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProviderConfig.cpp
// Purpose: Provider configuration file parsing
//==========================================================================================================

#include <fstream>
#include <sstream>

#include "logging/Logger.h"
#include "toolhub/ProviderConfig.h"

namespace toolhub {

namespace {
ProviderConfig parseEntry(const std::string& name, const JSONValue& v) {
    if (!v.isObject()) {
        throw ConfigError("provider '" + name + "': entry must be an object");
    }
    const auto& obj = std::get<JSONValue::Object>(v.value);
    ProviderConfig cfg;

    const JSONValue* command = FindMember(obj, "command");
    if (!command || !command->isString() || std::get<std::string>(command->value).empty()) {
        throw ConfigError("provider '" + name + "': 'command' must be a non-empty string");
    }
    cfg.command = std::get<std::string>(command->value);

    if (const JSONValue* args = FindMember(obj, "args")) {
        if (!args->isArray()) {
            throw ConfigError("provider '" + name + "': 'args' must be an array");
        }
        for (const auto& a : std::get<JSONValue::Array>(args->value)) {
            if (!a || !a->isString()) {
                throw ConfigError("provider '" + name + "': 'args' entries must be strings");
            }
            cfg.args.push_back(std::get<std::string>(a->value));
        }
    }

    if (const JSONValue* env = FindMember(obj, "env")) {
        if (!env->isObject()) {
            throw ConfigError("provider '" + name + "': 'env' must be an object");
        }
        for (const auto& [key, val] : std::get<JSONValue::Object>(env->value)) {
            if (!val || !val->isString()) {
                throw ConfigError("provider '" + name + "': env '" + key + "' must be a string");
            }
            cfg.env[key] = std::get<std::string>(val->value);
        }
    }
    return cfg;
}
} // namespace

std::map<std::string, ProviderConfig> ParseProviderConfigs(const JSONValue& doc) {
    if (!doc.isObject()) {
        throw ConfigError("provider configuration must be a JSON object");
    }
    const JSONValue::Object* providers = &std::get<JSONValue::Object>(doc.value);
    if (const JSONValue* wrapped = FindMember(*providers, "providers")) {
        if (!wrapped->isObject()) {
            throw ConfigError("'providers' must be an object");
        }
        providers = &std::get<JSONValue::Object>(wrapped->value);
    }

    std::map<std::string, ProviderConfig> out;
    for (const auto& [name, entry] : *providers) {
        if (!entry) {
            throw ConfigError("provider '" + name + "': empty entry");
        }
        out[name] = parseEntry(name, *entry);
    }
    return out;
}

std::map<std::string, ProviderConfig> LoadProviderConfigs(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("cannot open provider configuration: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    JSONValue doc;
    try {
        doc = ParseJSON(ss.str());
    } catch (const JSONParseError& e) {
        throw ConfigError("invalid JSON in " + path + ": " + e.what());
    }
    auto configs = ParseProviderConfigs(doc);
    LOG_INFO("Loaded {} provider configuration(s) from {}", configs.size(), path);
    return configs;
}

} // namespace toolhub
