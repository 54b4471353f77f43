//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolConnection.cpp
// Purpose: Provider lifecycle (spawn, handshake, catalog, calls, close)
//==========================================================================================================

#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <utility>

#include "logging/Logger.h"
#include "toolhub/StdioTransport.hpp"
#include "toolhub/ToolConnection.h"
#include "toolhub/errors/Errors.h"
#include "toolhub/version.h"

namespace toolhub {

const char* ToString(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Connecting: return "connecting";
        case ConnectionStatus::Ready: return "ready";
        case ConnectionStatus::Closed: return "closed";
    }
    return "closed";
}

namespace {
// First text content item of an isError result, when the provider supplied one.
std::string errorTextFromResult(const JSONValue& result) {
    if (!result.isObject()) {
        return "tool reported an error";
    }
    const auto& obj = std::get<JSONValue::Object>(result.value);
    const JSONValue* content = FindMember(obj, "content");
    if (content && content->isArray()) {
        for (const auto& item : std::get<JSONValue::Array>(content->value)) {
            if (!item || !item->isObject()) continue;
            const JSONValue* text = FindMember(std::get<JSONValue::Object>(item->value), "text");
            if (text && text->isString()) {
                return std::get<std::string>(text->value);
            }
        }
    }
    return "tool reported an error";
}

bool isErrorFlagged(const JSONValue& result) {
    if (!result.isObject()) {
        return false;
    }
    const JSONValue* flag = FindMember(std::get<JSONValue::Object>(result.value), "isError");
    return flag && std::holds_alternative<bool>(flag->value) && std::get<bool>(flag->value);
}
} // namespace

class ToolConnection::Impl {
public:
    std::string name;
    ToolConnection::Options opts;
    std::unique_ptr<ProviderProcess> process;
    std::unique_ptr<StdioTransport> transport;
    std::atomic<ConnectionStatus> status{ConnectionStatus::Connecting};

    mutable std::shared_mutex toolsMutex;
    std::vector<ToolDescriptor> tools;

    std::mutex closeMutex;
    bool closed{false};

    // Terminate() runs from both the reader thread (stream end) and shutdown()
    std::mutex processMutex;

    Impl(std::string n, ToolConnection::Options o) : name(std::move(n)), opts(std::move(o)) {}

    void setStatus(ConnectionStatus next) {
        ConnectionStatus prev = status.exchange(next);
        if (prev == next) {
            return;
        }
        LOG_INFO("ToolConnection[{}]: {} -> {}", name, ToString(prev), ToString(next));
        if (opts.onStatusChange) {
            try {
                opts.onStatusChange(name, next);
            } catch (const std::exception& e) {
                LOG_ERROR("ToolConnection[{}]: status observer threw: {}", name, e.what());
            }
        }
    }

    void ensureReady() const {
        if (status.load() != ConnectionStatus::Ready) {
            throw TransportError("ToolConnection[" + name + "]: connection is " + ToString(status.load()));
        }
    }

    std::vector<ToolDescriptor> fetchTools() {
        JSONRPCResponse resp = transport->SendAndWait(Methods::ListTools, JSONValue(JSONValue::Object{}));
        if (auto err = errors::rpcErrorFromResponse(resp)) {
            throw RpcException(err->code, "tools/list failed: " + err->message, err->data);
        }
        if (resp.IsError()) {
            throw RpcException(JSONRPCErrorCodes::InternalError, "tools/list failed with a malformed error");
        }
        return ToolsListResult::FromJSON(resp.result.value_or(JSONValue(nullptr))).tools;
    }

    void replaceTools(std::vector<ToolDescriptor> fresh) {
        std::unique_lock<std::shared_mutex> lock(toolsMutex);
        tools = std::move(fresh);
    }

    void handshake() {
        InitializeParams init;
        init.clientInfo = opts.clientInfo;
        JSONRPCResponse resp = transport->SendAndWait(Methods::Initialize, init.ToJSON());
        if (resp.IsError()) {
            auto err = errors::rpcErrorFromResponse(resp);
            throw HandshakeError("initialize rejected by '" + name + "': " +
                                 (err ? err->message : std::string("malformed error")));
        }
        transport->SendNotification(Methods::Initialized, std::nullopt);
        try {
            replaceTools(fetchTools());
        } catch (const RpcException& e) {
            throw HandshakeError("tools/list failed for '" + name + "': " + e.what());
        }
    }

    void killProcess() {
        std::lock_guard<std::mutex> lk(processMutex);
        if (process) {
            process->Terminate();
        }
    }

    // Reader thread: the provider's stream ended or failed
    void onTransportClosed() {
        setStatus(ConnectionStatus::Closed);
        killProcess();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lk(closeMutex);
            if (closed) {
                return;
            }
            closed = true;
        }
        if (transport) {
            transport->Close();
        }
        killProcess();
        setStatus(ConnectionStatus::Closed);
    }
};

ToolConnection::ToolConnection(std::unique_ptr<Impl> impl) : pImpl(std::move(impl)) {}

ToolConnection::~ToolConnection() {
    Close();
}

std::unique_ptr<ToolConnection> ToolConnection::Connect(const std::string& name, const LaunchSpec& spec) {
    return Connect(name, spec, Options{});
}

std::unique_ptr<ToolConnection> ToolConnection::Connect(const std::string& name, const LaunchSpec& spec,
                                                        const Options& opts) {
    FUNC_SCOPE();
    Options effective = opts;
    if (effective.clientInfo.name.empty()) {
        effective.clientInfo = Implementation("toolhub", getVersionString());
    }
    auto impl = std::make_unique<Impl>(name, std::move(effective));
    Impl* raw = impl.get();

    impl->process = ProviderProcess::Spawn(spec);

    StdioTransport::Options topts;
    topts.maxLineBytes = impl->opts.maxLineBytes;
    topts.requestTimeoutMs = impl->opts.requestTimeoutMs;
    const int childStdout = impl->process->TakeStdout();
    const int childStdin = impl->process->TakeStdin();
    impl->transport = std::make_unique<StdioTransport>(childStdout, childStdin, topts);
    impl->transport->SetCloseHandler([raw]() {
        raw->onTransportClosed();
    });
    impl->transport->SetErrorHandler([raw](const std::string& err) {
        LOG_WARN("ToolConnection[{}]: {}", raw->name, err);
    });
    impl->transport->StartReading();

    try {
        impl->handshake();
    } catch (const HandshakeError& e) {
        LOG_ERROR("ToolConnection[{}]: {}", name, e.what());
        impl->shutdown();
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("ToolConnection[{}]: handshake failed: {}", name, e.what());
        impl->shutdown();
        throw HandshakeError("handshake with '" + name + "' failed: " + e.what());
    }

    impl->setStatus(ConnectionStatus::Ready);
    LOG_INFO("ToolConnection[{}]: ready with {} tool(s)", name, impl->tools.size());
    return std::unique_ptr<ToolConnection>(new ToolConnection(std::move(impl)));
}

const std::string& ToolConnection::Name() const {
    return pImpl->name;
}

ConnectionStatus ToolConnection::Status() const {
    return pImpl->status.load();
}

ToolCallResult ToolConnection::CallTool(const std::string& tool, const JSONValue& arguments) {
    FUNC_SCOPE();
    pImpl->ensureReady();
    CallToolParams params;
    params.name = tool;
    params.arguments = arguments.isNull() ? JSONValue(JSONValue::Object{}) : arguments;

    JSONRPCResponse resp = pImpl->transport->SendAndWait(Methods::CallTool, params.ToJSON());

    ToolCallResult out;
    if (resp.IsError()) {
        auto err = errors::rpcErrorFromResponse(resp);
        out.success = false;
        out.message = err ? err->message : std::string("provider returned a malformed error");
        LOG_DEBUG("ToolConnection[{}]: {} failed: {}", pImpl->name, tool, out.message);
        return out;
    }
    out.result = resp.result.value_or(JSONValue(nullptr));
    if (isErrorFlagged(out.result.value())) {
        out.success = false;
        out.message = errorTextFromResult(out.result.value());
        return out;
    }
    out.success = true;
    return out;
}

std::vector<ToolDescriptor> ToolConnection::RefreshTools() {
    FUNC_SCOPE();
    pImpl->ensureReady();
    std::vector<ToolDescriptor> fresh = pImpl->fetchTools();
    pImpl->replaceTools(fresh);
    return fresh;
}

std::vector<ToolDescriptor> ToolConnection::GetTools() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->toolsMutex);
    return pImpl->tools;
}

void ToolConnection::Close() {
    pImpl->shutdown();
}

} // namespace toolhub
