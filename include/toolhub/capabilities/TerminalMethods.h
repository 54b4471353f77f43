//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TerminalMethods.h
// Purpose: terminal/execute hub method (one-shot shell commands with a deadline)
//==========================================================================================================

#pragma once

#include <chrono>
#include <string>

#include "toolhub/DispatchRouter.h"
#include "toolhub/JSONRPCTypes.h"

namespace toolhub {

struct TerminalOptions {
    std::string shell{"bash"};
    std::chrono::milliseconds timeout{30000};
};

//==========================================================================================================
// CommandResult
// Fields:
//   output: Combined stdout and stderr.
//   exitCode: Process exit status; -1 when killed by a signal or by the deadline.
//==========================================================================================================
struct CommandResult {
    bool success{false};
    std::string output;
    int exitCode{-1};
    std::string command;
    bool timedOut{false};

    // {success, output, exit_code, command}
    JSONValue ToJSON() const;
};

//==========================================================================================================
// RunShellCommand
// Purpose: Runs `<shell> -c <command>` with stdin closed and waits at most opts.timeout.
//          On expiry the shell is killed and whatever output arrived so far is kept.
// Throws:
//   SpawnError when the shell cannot be started.
//==========================================================================================================
CommandResult RunShellCommand(const std::string& command, const TerminalOptions& opts = {});

// Installs terminal/execute {command} on the router.
void RegisterTerminalMethods(DispatchRouter& router, TerminalOptions opts = {});

} // namespace toolhub
