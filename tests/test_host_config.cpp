//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_host_config.cpp
// Purpose: Tests for HostConfig defaults, environment overrides and server configuration parsing
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include "toolhost/HostConfig.h"

using namespace toolhost;
using namespace std::chrono_literals;

namespace {
// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name_); }

private:
    const char* name_;
};
} // namespace

TEST(HostConfigTest, Defaults) {
    HostConfig c;
    EXPECT_EQ(c.maxServers, 10u);
    EXPECT_EQ(c.toolCallTimeout, 25000ms);
    EXPECT_EQ(c.initializeTimeout, 10000ms);
    EXPECT_EQ(c.discoveryTimeout, 3000ms);
    EXPECT_EQ(c.toolCallAttempts, 3);
    EXPECT_EQ(c.retryBackoffStep, 2000ms);
    EXPECT_EQ(c.stopGracePeriod, 5000ms);
    EXPECT_EQ(c.clientInfo.name, "toolhost");
    EXPECT_FALSE(c.clientInfo.version.empty());
    EXPECT_TRUE(c.escalateStderrErrors);
}

TEST(HostConfigTest, EnvironmentOverrides) {
    ScopedEnv a("TOOLHOST_MAX_SERVERS", "4");
    ScopedEnv b("TOOLHOST_TOOL_CALL_ATTEMPTS", "0");
    ScopedEnv c("TOOLHOST_STOP_GRACE_MS", "250");
    ScopedEnv d("TOOLHOST_ESCALATE_STDERR", "off");
    ScopedEnv e("TOOLHOST_STDERR_MARKERS", "FATAL,,panic");
    ScopedEnv f("TOOLHOST_DISCOVERY_TIMEOUT_MS", "soon");

    HostConfig cfg = HostConfig::FromEnvironment();
    EXPECT_EQ(cfg.maxServers, 4u);
    EXPECT_EQ(cfg.toolCallAttempts, 1);
    EXPECT_EQ(cfg.stopGracePeriod, 250ms);
    EXPECT_FALSE(cfg.escalateStderrErrors);
    ASSERT_EQ(cfg.stderrErrorMarkers.size(), 2u);
    EXPECT_EQ(cfg.stderrErrorMarkers[0], "FATAL");
    EXPECT_EQ(cfg.stderrErrorMarkers[1], "panic");
    EXPECT_EQ(cfg.discoveryTimeout, 3000ms);
}

TEST(ServerConfigParsing, ParsesEntriesSortedById) {
    const char* json = R"({
        "mcpServers": {
            "web-search": {"command": "node", "args": ["search.js", "--port", "0"], "env": {"API_KEY": "k"}},
            "file-system": {"command": "npx", "name": "Files", "description": "Local files", "cwd": "/tmp", "autoStart": true}
        }
    })";
    auto servers = ParseServerConfigs(json);
    ASSERT_EQ(servers.size(), 2u);

    EXPECT_EQ(servers[0].id, "file-system");
    EXPECT_EQ(servers[0].name, "Files");
    EXPECT_EQ(servers[0].description, "Local files");
    ASSERT_TRUE(servers[0].workingDirectory.has_value());
    EXPECT_EQ(*servers[0].workingDirectory, "/tmp");
    EXPECT_TRUE(servers[0].autoStart);

    EXPECT_EQ(servers[1].id, "web-search");
    EXPECT_EQ(servers[1].name, "Web Search");
    EXPECT_EQ(servers[1].description, "Imported from server configuration: web-search");
    EXPECT_EQ(servers[1].command, "node");
    ASSERT_EQ(servers[1].args.size(), 3u);
    EXPECT_EQ(servers[1].args[1], "--port");
    EXPECT_EQ(servers[1].env.at("API_KEY"), "k");
    EXPECT_FALSE(servers[1].autoStart);
}

TEST(ServerConfigParsing, SkipsDisabledEntries) {
    auto servers = ParseServerConfigs(R"({"mcpServers":{
        "a":{"command":"x","disabled":true},
        "b":{"command":"y","disabled":false}}})");
    ASSERT_EQ(servers.size(), 1u);
    EXPECT_EQ(servers[0].id, "b");
}

TEST(ServerConfigParsing, RejectsInvalidDocuments) {
    EXPECT_THROW(ParseServerConfigs("not json"), std::invalid_argument);
    EXPECT_THROW(ParseServerConfigs(R"({"servers":{}})"), std::invalid_argument);
    EXPECT_THROW(ParseServerConfigs(R"({"mcpServers":[]})"), std::invalid_argument);
    EXPECT_THROW(ParseServerConfigs(R"({"mcpServers":{"a":{}}})"), std::invalid_argument);
    EXPECT_THROW(ParseServerConfigs(R"({"mcpServers":{"a":{"command":"x","args":"y"}}})"), std::invalid_argument);
    EXPECT_THROW(ParseServerConfigs(R"({"mcpServers":{"a":{"command":"x","args":[1]}}})"), std::invalid_argument);
    EXPECT_THROW(ParseServerConfigs(R"({"mcpServers":{"a":{"command":"x","env":{"K":1}}}})"), std::invalid_argument);
    EXPECT_TRUE(ParseServerConfigs(R"({"mcpServers":{}})").empty());
}

TEST(ServerConfigParsing, DisplayNames) {
    EXPECT_EQ(DisplayNameFromId("file-system"), "File System");
    EXPECT_EQ(DisplayNameFromId("git"), "Git");
    EXPECT_EQ(DisplayNameFromId("a-b-c"), "A B C");
}

TEST(ServerConfigParsing, LoadFromFile) {
    char path[] = "/tmp/toolhost_cfg_XXXXXX";
    int fd = ::mkstemp(path);
    ASSERT_GE(fd, 0);
    ::close(fd);
    {
        std::ofstream out(path);
        out << R"({"mcpServers":{"echo":{"command":"echo","args":["hi"]}}})";
    }
    auto servers = LoadServerConfigs(path);
    std::remove(path);
    ASSERT_EQ(servers.size(), 1u);
    EXPECT_EQ(servers[0].command, "echo");
    EXPECT_THROW(LoadServerConfigs("/nonexistent/toolhost/servers.json"), std::runtime_error);
}
