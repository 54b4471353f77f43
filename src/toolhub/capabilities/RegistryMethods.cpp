//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RegistryMethods.cpp
// Purpose: Registry-backed hub methods
//==========================================================================================================

#include <map>
#include <utility>
#include <vector>

#include "logging/Logger.h"
#include "toolhub/Protocol.h"
#include "toolhub/capabilities/RegistryMethods.h"
#include "toolhub/errors/Errors.h"

namespace toolhub {

namespace {

std::shared_ptr<JSONValue> str(const std::string& s) { return std::make_shared<JSONValue>(s); }

// Runs fn, translating registry rejections into wire errors.
template <typename Fn>
JSONValue withRegistryErrors(Fn&& fn) {
    try {
        return fn();
    } catch (const RegistryError& e) {
        JSONValue::Object data;
        data["provider"] = str(e.Provider());
        throw RpcException(e.RpcCode(), e.what(), JSONValue(std::move(data)));
    }
}

void appendDescriptors(const std::string& provider, const std::vector<ToolDescriptor>& tools,
                       JSONValue::Array& into) {
    for (const auto& t : tools) {
        JSONValue entry = t.ToJSON();
        auto& obj = std::get<JSONValue::Object>(entry.value);
        JSONValue::Object tagged;
        tagged["provider"] = str(provider);
        for (const auto& [k, v] : obj) {
            tagged[k] = v;
        }
        into.push_back(std::make_shared<JSONValue>(std::move(tagged)));
    }
}

JSONValue providerInfoToJSON(const ToolRegistry::ProviderInfo& info) {
    JSONValue::Object o;
    o["name"] = str(info.name);
    o["status"] = str(ToString(info.status));
    o["toolCount"] = std::make_shared<JSONValue>(static_cast<int64_t>(info.toolCount));
    return JSONValue(std::move(o));
}

std::vector<std::string> stringArray(const JSONValue::Object& params, const char* key) {
    std::vector<std::string> out;
    const JSONValue* v = FindMember(params, key);
    if (!v || v->isNull()) {
        return out;
    }
    if (!v->isArray()) {
        throw RpcException(JSONRPCErrorCodes::InvalidParams, std::string("'") + key + "' must be an array");
    }
    for (const auto& item : std::get<JSONValue::Array>(v->value)) {
        if (!item || !item->isString()) {
            throw RpcException(JSONRPCErrorCodes::InvalidParams, std::string("'") + key + "' entries must be strings");
        }
        out.push_back(std::get<std::string>(item->value));
    }
    return out;
}

std::map<std::string, std::string> stringMap(const JSONValue::Object& params, const char* key) {
    std::map<std::string, std::string> out;
    const JSONValue* v = FindMember(params, key);
    if (!v || v->isNull()) {
        return out;
    }
    for (const auto& [k, val] : RequireObject(*v, key)) {
        if (!val || !val->isString()) {
            throw RpcException(JSONRPCErrorCodes::InvalidParams, std::string("'") + key + "." + k + "' must be a string");
        }
        out[k] = std::get<std::string>(val->value);
    }
    return out;
}

} // namespace

void RegisterRegistryMethods(DispatchRouter& router, std::shared_ptr<ToolRegistry> registry,
                             ProviderEventHandler onProviderEvent) {
    router.Register("tools/list", [registry](const JSONValue::Object& params) {
        return withRegistryErrors([&] {
            JSONValue::Array tools;
            if (auto provider = OptionalString(params, "provider")) {
                appendDescriptors(*provider, registry->ListTools(*provider), tools);
            } else {
                for (const auto& info : registry->ListProviders()) {
                    try {
                        appendDescriptors(info.name, registry->ListTools(info.name), tools);
                    } catch (const RegistryError&) {
                        // Disconnected between the two calls
                    }
                }
            }
            JSONValue::Object out;
            out["tools"] = std::make_shared<JSONValue>(std::move(tools));
            return JSONValue(std::move(out));
        });
    });

    router.Register("tools/call", [registry](const JSONValue::Object& params) {
        const std::string provider = RequireString(params, "provider");
        const std::string name = RequireString(params, "name");
        JSONValue arguments{JSONValue::Object{}};
        if (const JSONValue* a = FindMember(params, "arguments"); a && !a->isNull()) {
            RequireObject(*a, "arguments");
            arguments = *a;
        }
        return withRegistryErrors([&] {
            return registry->CallTool(provider, name, arguments).ToJSON();
        });
    });

    router.Register("tools/refresh", [registry](const JSONValue::Object& params) {
        const std::string provider = RequireString(params, "provider");
        return withRegistryErrors([&] {
            JSONValue::Array tools;
            appendDescriptors(provider, registry->RefreshTools(provider), tools);
            JSONValue::Object out;
            out["provider"] = str(provider);
            out["tools"] = std::make_shared<JSONValue>(std::move(tools));
            return JSONValue(std::move(out));
        });
    });

    router.Register("providers/list", [registry](const JSONValue::Object&) {
        JSONValue::Array providers;
        for (const auto& info : registry->ListProviders()) {
            providers.push_back(std::make_shared<JSONValue>(providerInfoToJSON(info)));
        }
        JSONValue::Object out;
        out["providers"] = std::make_shared<JSONValue>(std::move(providers));
        return JSONValue(std::move(out));
    });

    router.Register("providers/connect", [registry, onProviderEvent](const JSONValue::Object& params) {
        const std::string name = RequireString(params, "name");
        const std::string command = RequireString(params, "command");
        const auto args = stringArray(params, "args");
        const auto env = stringMap(params, "env");
        return withRegistryErrors([&] {
            try {
                registry->Connect(name, command, args, env);
            } catch (const SpawnError& e) {
                throw RpcException(JSONRPCErrorCodes::ProviderUnavailable, e.what());
            } catch (const HandshakeError& e) {
                throw RpcException(JSONRPCErrorCodes::ProviderUnavailable, e.what());
            }
            if (onProviderEvent) {
                onProviderEvent(name, ConnectionStatus::Ready);
            }
            JSONValue out(JSONValue::Object{});
            for (const auto& info : registry->ListProviders()) {
                if (info.name == name) {
                    out = providerInfoToJSON(info);
                }
            }
            return out;
        });
    });

    router.Register("providers/disconnect", [registry, onProviderEvent](const JSONValue::Object& params) {
        const std::string name = RequireString(params, "name");
        return withRegistryErrors([&] {
            registry->Disconnect(name);
            if (onProviderEvent) {
                onProviderEvent(name, ConnectionStatus::Closed);
            }
            JSONValue::Object out;
            out["name"] = str(name);
            out["status"] = str(ToString(ConnectionStatus::Closed));
            return JSONValue(std::move(out));
        });
    });

    LOG_INFO("Registry: hub methods registered");
}

} // namespace toolhub
