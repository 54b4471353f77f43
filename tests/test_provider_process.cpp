//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_provider_process.cpp
// Purpose: Subprocess launch, environment merging, stderr merging and reaping
//==========================================================================================================

#include <gtest/gtest.h>
#include <string>

#include <sys/wait.h>
#include <unistd.h>

#include "toolhub/ProviderProcess.h"
#include "toolhub/errors/Errors.h"

using namespace toolhub;

namespace {
std::string readAll(int fd) {
    std::string out;
    char buf[1024];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n <= 0) break;
        out.append(buf, static_cast<std::size_t>(n));
    }
    ::close(fd);
    return out;
}
} // namespace

TEST(ProviderProcess, CapturesStdout) {
    auto proc = ProviderProcess::Spawn(LaunchSpec{"/bin/sh", {"-c", "echo hello"}, {}});
    ASSERT_NE(proc, nullptr);
    EXPECT_GT(proc->Pid(), 0);
    ::close(proc->TakeStdin());
    EXPECT_EQ(readAll(proc->TakeStdout()), "hello\n");
    int status = proc->Wait();
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
    EXPECT_FALSE(proc->IsRunning());
}

TEST(ProviderProcess, EnvironmentOverridesWinAndParentIsInherited) {
    ::setenv("TOOLHUB_TEST_INHERITED", "from-parent", 1);
    ::setenv("TOOLHUB_TEST_OVERRIDE", "parent", 1);
    LaunchSpec spec{"/bin/sh", {"-c", "echo $TOOLHUB_TEST_INHERITED:$TOOLHUB_TEST_OVERRIDE"},
                    {{"TOOLHUB_TEST_OVERRIDE", "child"}}};
    auto proc = ProviderProcess::Spawn(spec);
    ::close(proc->TakeStdin());
    EXPECT_EQ(readAll(proc->TakeStdout()), "from-parent:child\n");
    proc->Wait();
}

TEST(ProviderProcess, StderrIsSeparateUnlessMerged) {
    auto separate = ProviderProcess::Spawn(LaunchSpec{"/bin/sh", {"-c", "echo out; echo err 1>&2"}, {}});
    ::close(separate->TakeStdin());
    EXPECT_EQ(readAll(separate->TakeStdout()), "out\n");
    separate->Wait();

    LaunchSpec merged{"/bin/sh", {"-c", "echo out; echo err 1>&2"}, {}};
    merged.mergeStderr = true;
    auto proc = ProviderProcess::Spawn(merged);
    ::close(proc->TakeStdin());
    EXPECT_EQ(readAll(proc->TakeStdout()), "out\nerr\n");
    proc->Wait();
}

TEST(ProviderProcess, ExitCodeIsReported) {
    auto proc = ProviderProcess::Spawn(LaunchSpec{"/bin/sh", {"-c", "exit 7"}, {}});
    int status = proc->Wait();
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 7);
    ASSERT_TRUE(proc->WaitStatus().has_value());
    EXPECT_EQ(proc->Wait(), status);
}

TEST(ProviderProcess, MissingExecutableIsSpawnError) {
    EXPECT_THROW(ProviderProcess::Spawn(LaunchSpec{"/nonexistent/toolhub-provider", {}, {}}), SpawnError);
    EXPECT_THROW(ProviderProcess::Spawn(LaunchSpec{"", {}, {}}), SpawnError);
}

TEST(ProviderProcess, TerminateKillsAndReaps) {
    auto proc = ProviderProcess::Spawn(LaunchSpec{"/bin/sh", {"-c", "exec sleep 30"}, {}});
    EXPECT_TRUE(proc->IsRunning());
    proc->Terminate();
    EXPECT_FALSE(proc->IsRunning());
    ASSERT_TRUE(proc->WaitStatus().has_value());
    EXPECT_TRUE(WIFSIGNALED(proc->WaitStatus().value()));
    EXPECT_EQ(::waitpid(proc->Pid(), nullptr, WNOHANG), -1);
}
