//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProviderProcess.h
// Purpose: RAII handle for a tool provider subprocess and its stdin/stdout pipes
//==========================================================================================================

#pragma once

#include <sys/types.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolhub {

//==========================================================================================================
// LaunchSpec
// Purpose: How to start a provider.
// Fields:
//   command: Executable name or path; resolved against PATH when it has no '/'.
//   args: Arguments after argv[0].
//   env: Variables layered over the parent environment (values here win).
//   mergeStderr: Route the child's stderr into the stdout pipe instead of inheriting it.
//==========================================================================================================
struct LaunchSpec {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool mergeStderr{false};
};

//==========================================================================================================
// ProviderProcess
// Purpose: Owns the child pid and the parent ends of its stdin/stdout pipes. stderr is inherited unless
//          LaunchSpec::mergeStderr is set.
// Notes:
//   - Destruction kills (SIGKILL) and reaps the child; there is no graceful shutdown request.
//   - Pipe descriptors are close-on-exec in the parent so sibling providers never inherit them.
//==========================================================================================================
class ProviderProcess {
public:
    //==========================================================================================================
    // Spawn
    // Purpose: fork + exec the provider with pipes wired to its stdin/stdout.
    // Throws:
    //   SpawnError when pipes cannot be created, fork fails, or exec fails in the child.
    //==========================================================================================================
    static std::unique_ptr<ProviderProcess> Spawn(const LaunchSpec& spec);

    ~ProviderProcess();
    ProviderProcess(const ProviderProcess&) = delete;
    ProviderProcess& operator=(const ProviderProcess&) = delete;

    // Ownership transfer of the parent ends; returns -1 when already taken.
    int TakeStdin();
    int TakeStdout();

    pid_t Pid() const { return pid; }

    // Non-blocking liveness probe; reaps the child when it has exited.
    bool IsRunning();

    // SIGKILL + waitpid. Idempotent.
    void Terminate();

    // Blocks until the child exits and returns its raw wait status.
    int Wait();

    // Raw wait status once the child has been reaped.
    std::optional<int> WaitStatus() const { return waitStatus; }

private:
    ProviderProcess(pid_t pid, int stdinFd, int stdoutFd);

    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    std::optional<int> waitStatus;
};

} // namespace toolhub
