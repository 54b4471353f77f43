//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProviderProcess.cpp
// Purpose: fork/exec of tool providers with close-on-exec pipes and exec failure detection
//==========================================================================================================

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cstring>

#include <string>
#include <utility>
#include <vector>

#include "logging/Logger.h"
#include "toolhub/ProviderProcess.h"
#include "toolhub/errors/Errors.h"

extern char** environ;

namespace toolhub {

namespace {
struct PipePair {
    int fds[2]{-1, -1};
    ~PipePair() { closeBoth(); }
    void closeBoth() {
        for (int& fd : fds) {
            if (fd >= 0) { ::close(fd); fd = -1; }
        }
    }
    int release(int idx) { int fd = fds[idx]; fds[idx] = -1; return fd; }
};

void makePipe(PipePair& p, const char* what) {
    if (::pipe2(p.fds, O_CLOEXEC) != 0) {
        throw SpawnError(std::string("ProviderProcess: pipe for ") + what + " failed: " + ::strerror(errno));
    }
}

std::vector<std::string> mergedEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string kv(*e);
        auto eq = kv.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& [k, v] : overrides) {
        merged[k] = v;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [k, v] : merged) {
        out.push_back(k + "=" + v);
    }
    return out;
}
} // namespace

ProviderProcess::ProviderProcess(pid_t pid, int stdinFd, int stdoutFd)
    : pid(pid), stdinFd(stdinFd), stdoutFd(stdoutFd) {}

std::unique_ptr<ProviderProcess> ProviderProcess::Spawn(const LaunchSpec& spec) {
    FUNC_SCOPE();
    if (spec.command.empty()) {
        throw SpawnError("ProviderProcess: empty command");
    }

    PipePair toChild;   // child's stdin
    PipePair fromChild; // child's stdout
    PipePair execErr;   // closes on successful exec; carries errno otherwise
    makePipe(toChild, "stdin");
    makePipe(fromChild, "stdout");
    makePipe(execErr, "exec status");

    // Everything the child needs is prepared before fork()
    std::vector<std::string> argvStore;
    argvStore.push_back(spec.command);
    argvStore.insert(argvStore.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& a : argvStore) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> envStore = mergedEnvironment(spec.env);
    std::vector<char*> envp;
    for (auto& e : envStore) envp.push_back(e.data());
    envp.push_back(nullptr);

    pid_t child = ::fork();
    if (child < 0) {
        throw SpawnError(std::string("ProviderProcess: fork failed: ") + ::strerror(errno));
    }
    if (child == 0) {
        // Child: only async-signal-safe calls from here on
        ::signal(SIGPIPE, SIG_DFL);
        if (::dup2(toChild.fds[0], STDIN_FILENO) < 0 || ::dup2(fromChild.fds[1], STDOUT_FILENO) < 0 ||
            (spec.mergeStderr && ::dup2(fromChild.fds[1], STDERR_FILENO) < 0)) {
            int err = errno;
            (void)!::write(execErr.fds[1], &err, sizeof(err));
            ::_exit(127);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        (void)!::write(execErr.fds[1], &err, sizeof(err));
        ::_exit(127);
    }

    // Parent
    ::close(toChild.release(0));
    ::close(fromChild.release(1));
    ::close(execErr.release(1));

    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(execErr.fds[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    if (n > 0) {
        int status = 0;
        while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {}
        LOG_ERROR("ProviderProcess: exec of '{}' failed: {}", spec.command, ::strerror(childErr));
        throw SpawnError("ProviderProcess: cannot execute '" + spec.command + "': " + ::strerror(childErr));
    }

    LOG_INFO("ProviderProcess: started '{}' (pid={})", spec.command, static_cast<long long>(child));
    return std::unique_ptr<ProviderProcess>(
        new ProviderProcess(child, toChild.release(1), fromChild.release(0)));
}

ProviderProcess::~ProviderProcess() {
    Terminate();
}

int ProviderProcess::TakeStdin() {
    int fd = stdinFd;
    stdinFd = -1;
    return fd;
}

int ProviderProcess::TakeStdout() {
    int fd = stdoutFd;
    stdoutFd = -1;
    return fd;
}

bool ProviderProcess::IsRunning() {
    if (pid <= 0 || waitStatus.has_value()) {
        return false;
    }
    int status = 0;
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
        waitStatus = status;
        return false;
    }
    return r == 0;
}

int ProviderProcess::Wait() {
    if (waitStatus.has_value()) {
        return *waitStatus;
    }
    if (pid <= 0) {
        return 0;
    }
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid, &status, 0);
    } while (r < 0 && errno == EINTR);
    waitStatus = (r == pid) ? status : 0;
    return *waitStatus;
}

void ProviderProcess::Terminate() {
    if (stdinFd >= 0) { ::close(stdinFd); stdinFd = -1; }
    if (stdoutFd >= 0) { ::close(stdoutFd); stdoutFd = -1; }
    if (pid <= 0 || waitStatus.has_value()) {
        return;
    }
    if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
        LOG_WARN("ProviderProcess: kill({}) failed: {}", static_cast<long long>(pid), ::strerror(errno));
    }
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r == pid) {
        waitStatus = status;
    } else {
        // ECHILD: already reaped elsewhere
        waitStatus = 0;
    }
    LOG_DEBUG("ProviderProcess: pid {} reaped", static_cast<long long>(pid));
}

} // namespace toolhub
