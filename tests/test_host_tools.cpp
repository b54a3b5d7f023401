//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_host_tools.cpp
// Purpose: End-to-end tests for tool lookup, tool calls, retries and server-initiated traffic
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include "HostTestSupport.h"
#include "toolhost/Host.hpp"
#include "toolhost/errors/Errors.h"

using namespace toolhost;
using namespace std::chrono_literals;
using toolhost_test::FastConfig;
using toolhost_test::RunFor;
using toolhost_test::RunSync;
using toolhost_test::RunUntil;
using toolhost_test::StubConfig;

namespace {
class HostToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        host.Events().Subscribe([this](const HostEvent& e) { events.push_back(e); });
    }

    void TearDown() override {
        RunSync(io, host.Cleanup());
    }

    void startStub(const std::string& id, std::vector<std::string> args = {}) {
        RunSync(io, host.AddServer(StubConfig(id, std::move(args))));
        RunSync(io, host.StartServer(id));
    }

    std::size_t countStderr(const std::string& needle) const {
        std::size_t n = 0;
        for (const auto& e : events) {
            if (e.type == HostEventType::ServerStderr && e.text.find(needle) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

    std::size_t countType(HostEventType type) const {
        std::size_t n = 0;
        for (const auto& e : events) {
            if (e.type == type) ++n;
        }
        return n;
    }

    boost::asio::io_context io;
    Host host{io, FastConfig()};
    std::vector<HostEvent> events;
};
} // namespace

TEST_F(HostToolsTest, PingEchoesParameters) {
    startStub("stub");
    JSONValue params = ParseJSON(R"({"message":"hello","n":3,"nested":{"ok":true}})");
    JSONValue result = RunSync(io, host.ExecuteTool(ToolCall{"ping", "stub", params}));
    EXPECT_EQ(result, params);
    EXPECT_EQ(host.PendingRequestCount(), 0u);
}

TEST_F(HostToolsTest, FindToolAcrossServers) {
    startStub("b-server");
    startStub("a-server");
    auto any = host.FindTool("ping");
    ASSERT_TRUE(any.has_value());
    EXPECT_EQ(any->serverId, "a-server");
    auto scoped = host.FindTool("ping", std::string("b-server"));
    ASSERT_TRUE(scoped.has_value());
    EXPECT_EQ(scoped->serverId, "b-server");
    EXPECT_FALSE(host.FindTool("nope").has_value());
    EXPECT_FALSE(host.FindTool("ping", std::string("c-server")).has_value());

    RunSync(io, host.StopServer("a-server"));
    EXPECT_EQ(host.FindTool("ping")->serverId, "b-server");
}

TEST_F(HostToolsTest, RetriesExactlyTheConfiguredNumberOfTimes) {
    startStub("flaky", {"--fail-tools-call"});
    try {
        RunSync(io, host.ExecuteTool(ToolCall{"ping", "flaky", ParseJSON("{}")}));
        FAIL() << "expected ToolExecutionError";
    } catch (const errors::ToolExecutionError& e) {
        EXPECT_EQ(e.attempts(), 3);
        EXPECT_NE(e.lastError().find("simulated failure"), std::string::npos);
    }
    ASSERT_TRUE(RunUntil(io, [&] { return countStderr("stub: tools/call") >= 3; }, 3s));
    RunFor(io, 100ms);
    EXPECT_EQ(countStderr("stub: tools/call"), 3u);
    // a failing tool does not change the server state
    EXPECT_EQ(host.GetServerStatus("flaky"), ServerStatus::Running);
}

TEST_F(HostToolsTest, RejectsCallsWithoutIo) {
    RunSync(io, host.AddServer(StubConfig("idle")));
    EXPECT_THROW(RunSync(io, host.ExecuteTool(ToolCall{"ping", "idle", ParseJSON("{}")})),
                 errors::NotRunningError);
    EXPECT_THROW(RunSync(io, host.ExecuteTool(ToolCall{"ping", "ghost", ParseJSON("{}")})),
                 errors::NotFoundError);

    startStub("live");
    EXPECT_THROW(RunSync(io, host.ExecuteTool(ToolCall{"missing_tool", "live", ParseJSON("{}")})),
                 errors::NotFoundError);
    RunFor(io, 100ms);
    EXPECT_EQ(countStderr("stub: tools/call"), 0u);
}

TEST_F(HostToolsTest, ToolListChangedTriggersRediscovery) {
    startStub("dyn");
    EXPECT_FALSE(host.FindTool("pong").has_value());
    const std::size_t discoveredBefore = countType(HostEventType::ToolsDiscovered);

    RunSync(io, host.ExecuteTool(ToolCall{"notify_tools_changed", "dyn", ParseJSON("{}")}));
    ASSERT_TRUE(RunUntil(io, [&] { return host.FindTool("pong").has_value(); }));
    EXPECT_GT(countType(HostEventType::ToolsDiscovered), discoveredBefore);

    JSONValue result = RunSync(io, host.ExecuteTool(ToolCall{"pong", "dyn", ParseJSON("{}")}));
    EXPECT_EQ(result, ParseJSON(R"({"pong":true})"));
}

TEST_F(HostToolsTest, AnswersPingFromServer) {
    startStub("pinger");
    JSONValue result = RunSync(io, host.ExecuteTool(ToolCall{"ping_host", "pinger", ParseJSON("{}")}));
    EXPECT_EQ(result, ParseJSON(R"({"hostAnswered":true})"));

    bool sawPing = false;
    for (const auto& e : events) {
        if (e.type == HostEventType::ServerMessage && e.message.has_value() &&
            GetStringMember(*e.message, "method").value_or("") == "ping") {
            sawPing = true;
        }
    }
    EXPECT_TRUE(sawPing);
}

TEST_F(HostToolsTest, StopFailsPendingCalls) {
    startStub("sleepy");
    auto pending = boost::asio::co_spawn(
        io, host.ExecuteTool(ToolCall{"slow", "sleepy", ParseJSON(R"({"ms":5000})")}), boost::asio::use_future);
    ASSERT_TRUE(RunUntil(io, [&] { return host.PendingRequestCount() == 1; }));

    RunSync(io, host.StopServer("sleepy"));
    ASSERT_TRUE(RunUntil(io, [&] { return pending.wait_for(0s) == std::future_status::ready; }));
    try {
        pending.get();
        FAIL() << "expected ToolExecutionError";
    } catch (const errors::ToolExecutionError& e) {
        EXPECT_EQ(e.attempts(), 1);
    }
    EXPECT_EQ(host.PendingRequestCount(), 0u);
}

TEST_F(HostToolsTest, CrashDuringCallStopsServer) {
    startStub("crashy");
    EXPECT_THROW(RunSync(io, host.ExecuteTool(ToolCall{"crash", "crashy", ParseJSON(R"({"code":3})")})),
                 errors::ToolExecutionError);
    ASSERT_TRUE(RunUntil(io, [&] { return host.GetServerStatus("crashy") == ServerStatus::Stopped; }));
    EXPECT_FALSE(host.GetServer("crashy")->hasProcess);
    EXPECT_EQ(countType(HostEventType::ServerStopped), 1u);
}

TEST_F(HostToolsTest, StderrErrorMarkerEscalatesToError) {
    startStub("noisy");
    RunSync(io, host.ExecuteTool(ToolCall{"stderr", "noisy", ParseJSON(R"({"text":"just a note"})")}));
    ASSERT_TRUE(RunUntil(io, [&] { return countStderr("just a note") == 1; }));
    EXPECT_EQ(host.GetServerStatus("noisy"), ServerStatus::Running);

    RunSync(io, host.ExecuteTool(ToolCall{"stderr", "noisy", ParseJSON(R"({"text":"Error: disk full"})")}));
    ASSERT_TRUE(RunUntil(io, [&] { return host.GetServerStatus("noisy") == ServerStatus::Error; }));
    EXPECT_EQ(host.GetServer("noisy")->lastError.value_or(""), "Error: disk full");
    EXPECT_EQ(countType(HostEventType::ServerError), 1u);
    EXPECT_TRUE(host.GetAllTools().empty());
    EXPECT_THROW(RunSync(io, host.ExecuteTool(ToolCall{"ping", "noisy", ParseJSON("{}")})),
                 errors::NotRunningError);

    // a server in error can be restarted
    RunSync(io, host.StartServer("noisy"));
    EXPECT_EQ(host.GetServerStatus("noisy"), ServerStatus::Running);
    EXPECT_FALSE(host.GetServer("noisy")->lastError.has_value());
}

TEST_F(HostToolsTest, UnmatchedResponseIsIgnored) {
    startStub("quiet");
    const std::size_t before = events.size();
    host.DeliverOutput("quiet", R"({"jsonrpc":"2.0","id":9999,"result":{}})" "\n");
    EXPECT_EQ(events.size(), before);
    EXPECT_EQ(host.PendingRequestCount(), 0u);
    EXPECT_EQ(host.GetServerStatus("quiet"), ServerStatus::Running);
}

TEST_F(HostToolsTest, NonProtocolOutputBecomesServerMessage) {
    startStub("chatty", {"--banner"});
    bool sawBanner = false;
    for (const auto& e : events) {
        if (e.type == HostEventType::ServerMessage && e.text == "stub tool server ready") {
            sawBanner = true;
            EXPECT_FALSE(e.message.has_value());
        }
    }
    EXPECT_TRUE(sawBanner);

    host.DeliverOutput("chatty", "partial {\"jsonrpc\"");
    const std::size_t before = events.size();
    host.DeliverOutput("chatty", ":\"2.0\",\"method\":\"custom/event\",\"params\":{\"k\":1}}\n");
    // joined with the previous chunk the line starts with "partial", so it is diagnostic text
    ASSERT_EQ(events.size(), before + 1);
    EXPECT_EQ(events.back().type, HostEventType::ServerMessage);

    host.DeliverOutput("chatty", "{\"jsonrpc\":\"2.0\",\"method\":\"custom/event\"}\n");
    ASSERT_EQ(events.size(), before + 2);
    ASSERT_TRUE(events.back().message.has_value());
    EXPECT_EQ(GetStringMember(*events.back().message, "method").value_or(""), "custom/event");
    EXPECT_THROW(host.DeliverOutput("ghost", "x\n"), errors::NotFoundError);
}
