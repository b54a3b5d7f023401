//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_host_lifecycle.cpp
// Purpose: End-to-end tests for registering, starting, stopping and removing tool servers
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
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
using toolhost_test::RunSync;
using toolhost_test::RunUntil;
using toolhost_test::StubConfig;

namespace {
std::vector<HostEventType> lifecycleTypes(const std::vector<HostEvent>& events, const std::string& id) {
    std::vector<HostEventType> out;
    for (const auto& e : events) {
        if (e.serverId != id || e.type == HostEventType::ServerStderr || e.type == HostEventType::ServerMessage) {
            continue;
        }
        out.push_back(e.type);
    }
    return out;
}

void expectInvariants(const Host& host) {
    for (const auto& s : host.GetServers()) {
        if (s.status == ServerStatus::Running) {
            EXPECT_TRUE(s.hasProcess) << s.config.id;
            EXPECT_TRUE(s.pid.has_value()) << s.config.id;
        }
        if (s.status == ServerStatus::Stopped) {
            EXPECT_FALSE(s.hasProcess) << s.config.id;
            EXPECT_FALSE(s.pid.has_value()) << s.config.id;
        }
    }
}
} // namespace

TEST(HostLifecycle, AddRegistersStoppedServer) {
    boost::asio::io_context io;
    Host host(io, FastConfig());
    std::vector<HostEvent> events;
    host.Events().Subscribe([&](const HostEvent& e) { events.push_back(e); });

    ServerConfig cfg = StubConfig("file-system");
    RunSync(io, host.AddServer(cfg));

    auto snap = host.GetServer("file-system");
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, ServerStatus::Stopped);
    EXPECT_EQ(snap->config.name, "File System");
    EXPECT_FALSE(snap->hasProcess);
    EXPECT_TRUE(snap->tools.empty());
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, HostEventType::ServerAdded);
    EXPECT_TRUE(host.GetAllTools().empty());
}

TEST(HostLifecycle, DuplicateIdAndInvalidConfigRejected) {
    boost::asio::io_context io;
    Host host(io, FastConfig());
    RunSync(io, host.AddServer(StubConfig("dup")));
    EXPECT_THROW(RunSync(io, host.AddServer(StubConfig("dup"))), errors::DuplicateServerError);

    ServerConfig noCommand;
    noCommand.id = "empty";
    EXPECT_THROW(RunSync(io, host.AddServer(noCommand)), std::invalid_argument);
    EXPECT_EQ(host.GetServers().size(), 1u);
}

TEST(HostLifecycle, UnknownServerOperations) {
    boost::asio::io_context io;
    Host host(io, FastConfig());
    EXPECT_THROW(RunSync(io, host.StartServer("ghost")), errors::NotFoundError);
    EXPECT_THROW(RunSync(io, host.StopServer("ghost")), errors::NotFoundError);
    EXPECT_NO_THROW(RunSync(io, host.RemoveServer("ghost")));
    EXPECT_FALSE(host.GetServerStatus("ghost").has_value());
}

TEST(HostLifecycle, NonConformingCommandEndsInError) {
    boost::asio::io_context io;
    Host host(io, FastConfig());
    std::vector<HostEvent> events;
    host.Events().Subscribe([&](const HostEvent& e) { events.push_back(e); });

    ServerConfig cfg;
    cfg.id = "echo";
    cfg.command = "echo";
    RunSync(io, host.AddServer(cfg));
    EXPECT_THROW(RunSync(io, host.StartServer("echo")), errors::HandshakeError);

    auto snap = host.GetServer("echo");
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, ServerStatus::Error);
    ASSERT_TRUE(snap->lastError.has_value());
    EXPECT_FALSE(snap->lastError->empty());
    EXPECT_FALSE(snap->hasProcess);
    EXPECT_EQ(lifecycleTypes(events, "echo"),
              (std::vector<HostEventType>{HostEventType::ServerAdded, HostEventType::ServerStarting,
                                          HostEventType::ServerError}));
    EXPECT_EQ(host.PendingRequestCount(), 0u);
}

TEST(HostLifecycle, MissingExecutableEndsInError) {
    boost::asio::io_context io;
    Host host(io, FastConfig());
    ServerConfig cfg;
    cfg.id = "missing";
    cfg.command = "toolhost-no-such-binary";
    RunSync(io, host.AddServer(cfg));
    try {
        RunSync(io, host.StartServer("missing"));
        FAIL() << "expected HandshakeError";
    } catch (const errors::HandshakeError& e) {
        EXPECT_NE(e.cause().find("toolhost-no-such-binary"), std::string::npos);
    }
    EXPECT_EQ(host.GetServerStatus("missing"), ServerStatus::Error);
}

TEST(HostLifecycle, SilentServerTimesOutDuringHandshake) {
    boost::asio::io_context io;
    HostConfig cfg = FastConfig();
    cfg.initializeTimeout = 300ms;
    Host host(io, cfg);
    RunSync(io, host.AddServer(StubConfig("silent", {"--silent-initialize"})));
    const auto begin = std::chrono::steady_clock::now();
    EXPECT_THROW(RunSync(io, host.StartServer("silent")), errors::HandshakeError);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 3s);

    auto snap = host.GetServer("silent");
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, ServerStatus::Error);
    ASSERT_TRUE(snap->lastError.has_value());
    EXPECT_NE(snap->lastError->find("timed out"), std::string::npos);
    EXPECT_FALSE(snap->hasProcess);
}

TEST(HostLifecycle, ConformingServerExposesOneTool) {
    boost::asio::io_context io;
    Host host(io, FastConfig());
    std::vector<HostEvent> events;
    host.Events().Subscribe([&](const HostEvent& e) { events.push_back(e); });

    RunSync(io, host.AddServer(StubConfig("stub", {"--only-ping"})));
    RunSync(io, host.StartServer("stub"));

    auto tools = host.GetAllTools();
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0].name, "ping");
    EXPECT_EQ(tools[0].serverId, "stub");

    auto snap = host.GetServer("stub");
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, ServerStatus::Running);
    ASSERT_TRUE(snap->serverInfo.has_value());
    EXPECT_EQ(snap->serverInfo->name, "stub");
    EXPECT_EQ(snap->protocolVersion, PROTOCOL_VERSION);
    EXPECT_NE(FindMember(snap->capabilities, "tools"), nullptr);
    EXPECT_TRUE(snap->startedAt.has_value());
    expectInvariants(host);

    EXPECT_EQ(lifecycleTypes(events, "stub"),
              (std::vector<HostEventType>{HostEventType::ServerAdded, HostEventType::ServerStarting,
                                          HostEventType::ServerStarted, HostEventType::ToolsDiscovered}));
    ASSERT_EQ(events.back().tools.size(), 1u);

    RunSync(io, host.Cleanup());
}

TEST(HostLifecycle, AutoStartAndIdempotentStart) {
    boost::asio::io_context io;
    Host host(io, FastConfig());
    ServerConfig cfg = StubConfig("auto");
    cfg.autoStart = true;
    RunSync(io, host.AddServer(cfg));
    EXPECT_EQ(host.GetServerStatus("auto"), ServerStatus::Running);
    const auto pid = host.GetServer("auto")->pid;

    int starting = 0;
    host.Events().Subscribe(HostEventType::ServerStarting, [&](const HostEvent&) { ++starting; });
    RunSync(io, host.StartServer("auto"));
    EXPECT_EQ(starting, 0);
    EXPECT_EQ(host.GetServer("auto")->pid, pid);

    RunSync(io, host.Cleanup());
}

TEST(HostLifecycle, SecondStartWhileStartingIsRejected) {
    boost::asio::io_context io;
    Host host(io, FastConfig());
    RunSync(io, host.AddServer(StubConfig("race")));
    auto first = boost::asio::co_spawn(io, host.StartServer("race"), boost::asio::use_future);
    EXPECT_THROW(RunSync(io, host.StartServer("race")), errors::HandshakeError);
    ASSERT_TRUE(RunUntil(io, [&] { return first.wait_for(0s) == std::future_status::ready; }));
    EXPECT_NO_THROW(first.get());
    EXPECT_EQ(host.GetServerStatus("race"), ServerStatus::Running);
    RunSync(io, host.Cleanup());
}

TEST(HostLifecycle, CapacityLimitCountsRunningServers) {
    boost::asio::io_context io;
    HostConfig cfg = FastConfig();
    cfg.maxServers = 1;
    Host host(io, cfg);
    RunSync(io, host.AddServer(StubConfig("one")));
    RunSync(io, host.AddServer(StubConfig("two")));
    RunSync(io, host.StartServer("one"));
    EXPECT_THROW(RunSync(io, host.StartServer("two")), errors::CapacityError);
    EXPECT_EQ(host.GetServerStatus("two"), ServerStatus::Stopped);

    RunSync(io, host.StopServer("one"));
    EXPECT_NO_THROW(RunSync(io, host.StartServer("two")));
    RunSync(io, host.Cleanup());
}

TEST(HostLifecycle, StopTerminatesAndClearsState) {
    boost::asio::io_context io;
    Host host(io, FastConfig());
    std::vector<HostEvent> events;
    host.Events().Subscribe([&](const HostEvent& e) { events.push_back(e); });
    RunSync(io, host.AddServer(StubConfig("s")));
    RunSync(io, host.StartServer("s"));
    const pid_t pid = *host.GetServer("s")->pid;

    RunSync(io, host.StopServer("s"));
    auto snap = host.GetServer("s");
    EXPECT_EQ(snap->status, ServerStatus::Stopped);
    EXPECT_TRUE(snap->tools.empty());
    EXPECT_FALSE(snap->hasProcess);
    EXPECT_NE(::kill(pid, 0), 0);
    EXPECT_TRUE(host.GetAllTools().empty());
    EXPECT_EQ(lifecycleTypes(events, "s").back(), HostEventType::ServerStopped);
    expectInvariants(host);

    // stopping a stopped server changes nothing
    const std::size_t before = events.size();
    RunSync(io, host.StopServer("s"));
    EXPECT_EQ(events.size(), before);

    // and it can be started again
    RunSync(io, host.StartServer("s"));
    EXPECT_EQ(host.GetServerStatus("s"), ServerStatus::Running);
    EXPECT_NE(*host.GetServer("s")->pid, pid);
    RunSync(io, host.Cleanup());
}

TEST(HostLifecycle, StopKillsServerIgnoringSigterm) {
    boost::asio::io_context io;
    HostConfig cfg = FastConfig();
    cfg.stopGracePeriod = 400ms;
    Host host(io, cfg);
    RunSync(io, host.AddServer(StubConfig("stubborn", {"--ignore-sigterm"})));
    RunSync(io, host.StartServer("stubborn"));
    const pid_t pid = *host.GetServer("stubborn")->pid;

    const auto begin = std::chrono::steady_clock::now();
    RunSync(io, host.StopServer("stubborn"));
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_GE(elapsed, 350ms);
    EXPECT_LT(elapsed, cfg.stopGracePeriod + 1000ms);
    EXPECT_EQ(host.GetServerStatus("stubborn"), ServerStatus::Stopped);
    EXPECT_NE(::kill(pid, 0), 0);
}

TEST(HostLifecycle, RemoveStopsRunningServer) {
    boost::asio::io_context io;
    Host host(io, FastConfig());
    std::vector<HostEvent> events;
    host.Events().Subscribe([&](const HostEvent& e) { events.push_back(e); });
    RunSync(io, host.AddServer(StubConfig("gone")));
    RunSync(io, host.StartServer("gone"));
    RunSync(io, host.RemoveServer("gone"));

    EXPECT_FALSE(host.GetServer("gone").has_value());
    auto types = lifecycleTypes(events, "gone");
    ASSERT_GE(types.size(), 2u);
    EXPECT_EQ(types[types.size() - 2], HostEventType::ServerStopped);
    EXPECT_EQ(types.back(), HostEventType::ServerRemoved);
    EXPECT_TRUE(host.GetAllTools().empty());
}

TEST(HostLifecycle, CleanupStopsEveryServer) {
    boost::asio::io_context io;
    Host host(io, FastConfig());
    for (const char* id : {"a", "b", "c"}) {
        RunSync(io, host.AddServer(StubConfig(id)));
    }
    RunSync(io, host.StartServer("a"));
    RunSync(io, host.StartServer("b"));

    RunSync(io, host.Cleanup());
    for (const auto& s : host.GetServers()) {
        EXPECT_EQ(s.status, ServerStatus::Stopped) << s.config.id;
    }
    EXPECT_EQ(host.GetServers().size(), 3u);
    expectInvariants(host);
    EXPECT_NO_THROW(RunSync(io, host.Cleanup()));
}

TEST(HostLifecycle, ServersListedInIdOrder) {
    boost::asio::io_context io;
    Host host(io, FastConfig());
    for (const char* id : {"zeta", "alpha", "mid"}) {
        RunSync(io, host.AddServer(StubConfig(id)));
    }
    auto servers = host.GetServers();
    ASSERT_EQ(servers.size(), 3u);
    EXPECT_EQ(servers[0].config.id, "alpha");
    EXPECT_EQ(servers[1].config.id, "mid");
    EXPECT_EQ(servers[2].config.id, "zeta");
}

TEST(HostLifecycle, ExitWhileRunningMovesToStopped) {
    boost::asio::io_context io;
    Host host(io, FastConfig());
    std::vector<HostEvent> events;
    host.Events().Subscribe([&](const HostEvent& e) { events.push_back(e); });
    RunSync(io, host.AddServer(StubConfig("s")));
    RunSync(io, host.StartServer("s"));
    const pid_t pid = *host.GetServer("s")->pid;

    ASSERT_EQ(::kill(pid, SIGKILL), 0);
    ASSERT_TRUE(RunUntil(io, [&] { return host.GetServerStatus("s") == ServerStatus::Stopped; }));
    EXPECT_FALSE(host.GetServer("s")->hasProcess);
    EXPECT_EQ(lifecycleTypes(events, "s").back(), HostEventType::ServerStopped);
    for (const auto& e : events) {
        if (e.type == HostEventType::ServerStopped) {
            EXPECT_NE(e.text.find("signal"), std::string::npos);
        }
    }
}
