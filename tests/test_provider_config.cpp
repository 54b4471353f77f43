//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_provider_config.cpp
// Purpose: Provider configuration parsing and validation
//==========================================================================================================

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>

#include <unistd.h>

#include "toolhub/ProviderConfig.h"

using namespace toolhub;

TEST(ProviderConfig, ParsesWrappedMapping) {
    auto configs = ParseProviderConfigs(ParseJSON(R"({
        "providers": {
            "fs": {"command": "fs-provider", "args": ["--root", "/tmp"], "env": {"LOG": "debug"}},
            "git": {"command": "git-provider"}
        }
    })"));
    ASSERT_EQ(configs.size(), 2u);
    const auto& fs = configs.at("fs");
    EXPECT_EQ(fs.command, "fs-provider");
    ASSERT_EQ(fs.args.size(), 2u);
    EXPECT_EQ(fs.args[1], "/tmp");
    EXPECT_EQ(fs.env.at("LOG"), "debug");
    EXPECT_TRUE(configs.at("git").args.empty());

    LaunchSpec spec = fs.ToLaunchSpec();
    EXPECT_EQ(spec.command, "fs-provider");
    EXPECT_EQ(spec.args, fs.args);
    EXPECT_FALSE(spec.mergeStderr);
}

TEST(ProviderConfig, ParsesBareMapping) {
    auto configs = ParseProviderConfigs(ParseJSON(R"({"only": {"command": "x"}})"));
    ASSERT_EQ(configs.size(), 1u);
    EXPECT_EQ(configs.at("only").command, "x");
}

TEST(ProviderConfig, EmptyMappingIsValid) {
    EXPECT_TRUE(ParseProviderConfigs(ParseJSON("{}")).empty());
    EXPECT_TRUE(ParseProviderConfigs(ParseJSON(R"({"providers": {}})")).empty());
}

TEST(ProviderConfig, RejectsInvalidEntries) {
    EXPECT_THROW(ParseProviderConfigs(ParseJSON("[]")), ConfigError);
    EXPECT_THROW(ParseProviderConfigs(ParseJSON(R"({"providers": []})")), ConfigError);
    EXPECT_THROW(ParseProviderConfigs(ParseJSON(R"({"p": "cmd"})")), ConfigError);
    EXPECT_THROW(ParseProviderConfigs(ParseJSON(R"({"p": {}})")), ConfigError);
    EXPECT_THROW(ParseProviderConfigs(ParseJSON(R"({"p": {"command": ""}})")), ConfigError);
    EXPECT_THROW(ParseProviderConfigs(ParseJSON(R"({"p": {"command": 3}})")), ConfigError);
    EXPECT_THROW(ParseProviderConfigs(ParseJSON(R"({"p": {"command": "c", "args": "a b"}})")), ConfigError);
    EXPECT_THROW(ParseProviderConfigs(ParseJSON(R"({"p": {"command": "c", "args": [1]}})")), ConfigError);
    EXPECT_THROW(ParseProviderConfigs(ParseJSON(R"({"p": {"command": "c", "env": {"K": 1}}})")), ConfigError);
}

TEST(ProviderConfig, ErrorNamesTheProvider) {
    try {
        ParseProviderConfigs(ParseJSON(R"({"weather": {"args": []}})"));
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("weather"), std::string::npos);
    }
}

TEST(ProviderConfig, LoadFromFile) {
    char path[] = "/tmp/toolhub_providers_XXXXXX";
    int fd = ::mkstemp(path);
    ASSERT_GE(fd, 0);
    ::close(fd);
    {
        std::ofstream out(path);
        out << R"({"providers": {"echo": {"command": "/bin/cat"}}})";
    }
    auto configs = LoadProviderConfigs(path);
    EXPECT_EQ(configs.at("echo").command, "/bin/cat");

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ not json";
    }
    EXPECT_THROW(LoadProviderConfigs(path), ConfigError);
    std::remove(path);

    EXPECT_THROW(LoadProviderConfigs("/nonexistent/dir/providers.json"), ConfigError);
}
