//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TerminalMethods.cpp
// Purpose: Shell command execution for terminal/execute
//==========================================================================================================

#include <errno.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "toolhub/ProviderProcess.h"
#include "toolhub/Protocol.h"
#include "toolhub/capabilities/TerminalMethods.h"
#include "toolhub/errors/Errors.h"

namespace toolhub {

JSONValue CommandResult::ToJSON() const {
    JSONValue::Object obj;
    obj["success"] = std::make_shared<JSONValue>(success);
    obj["output"] = std::make_shared<JSONValue>(output);
    obj["exit_code"] = std::make_shared<JSONValue>(static_cast<int64_t>(exitCode));
    obj["command"] = std::make_shared<JSONValue>(command);
    return JSONValue(std::move(obj));
}

CommandResult RunShellCommand(const std::string& command, const TerminalOptions& opts) {
    FUNC_SCOPE();
    LaunchSpec spec;
    spec.command = opts.shell;
    spec.args = {"-c", command};
    spec.mergeStderr = true;
    auto proc = ProviderProcess::Spawn(spec);

    int inFd = proc->TakeStdin();
    if (inFd >= 0) {
        ::close(inFd);
    }
    int outFd = proc->TakeStdout();

    CommandResult result;
    result.command = command;

    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + opts.timeout;
    char buf[4096];
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            break;
        }
        struct pollfd pfd{outFd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_WARN("Terminal: poll failed: {}", ::strerror(errno));
            break;
        }
        if (rc == 0) {
            result.timedOut = true;
            break;
        }
        ssize_t n = ::read(outFd, buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<std::size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            LOG_WARN("Terminal: read failed: {}", ::strerror(errno));
            break;
        }
    }
    ::close(outFd);

    if (result.timedOut) {
        proc->Terminate();
        result.exitCode = -1;
        LOG_WARN("Terminal: '{}' killed after {} ms", command, static_cast<long long>(opts.timeout.count()));
    } else {
        int status = proc->Wait();
        result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }
    result.success = result.exitCode == 0;
    LOG_DEBUG("Terminal: '{}' exited with {} ({} bytes of output)", command, result.exitCode, result.output.size());
    return result;
}

void RegisterTerminalMethods(DispatchRouter& router, TerminalOptions opts) {
    router.Register("terminal/execute", [opts](const JSONValue::Object& params) {
        const std::string command = RequireString(params, "command");
        try {
            return RunShellCommand(command, opts).ToJSON();
        } catch (const SpawnError& e) {
            throw std::runtime_error(fmt::format("command execution failed: {}", e.what()));
        }
    });
}

} // namespace toolhub
