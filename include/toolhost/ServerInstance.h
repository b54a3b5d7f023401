//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerInstance.h
// Purpose: Server configuration, lifecycle status and the per-server state owned by the Host
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "toolhost/ChildProcess.hpp"
#include "toolhost/LineFramer.h"
#include "toolhost/Protocol.h"

namespace toolhost {

//==========================================================================================================
// ServerConfig
// Purpose: Launch description of one tool server; immutable once registered.
// Fields:
//   id: Unique key within a Host.
//   name, description: Display metadata.
//   command, args: Program and arguments (argv[0] is command).
//   env: Overrides merged over the host environment.
//   workingDirectory: Child working directory; host's when unset.
//   autoStart: AddServer starts the server immediately.
//==========================================================================================================
struct ServerConfig {
    std::string id;
    std::string name;
    std::string description;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> workingDirectory;
    bool autoStart{false};
};

enum class ServerStatus {
    Stopped,
    Starting,
    Running,
    Error
};

const char* ToString(ServerStatus status);

//==========================================================================================================
// ServerSnapshot
// Purpose: Copyable read-only view of a ServerInstance returned by Host accessors.
//==========================================================================================================
struct ServerSnapshot {
    ServerConfig config;
    ServerStatus status{ServerStatus::Stopped};
    bool hasProcess{false};
    std::optional<pid_t> pid;
    JSONValue capabilities;
    std::optional<Implementation> serverInfo;
    std::string protocolVersion;
    std::vector<Tool> tools;
    std::optional<std::string> lastError;
    std::optional<std::chrono::system_clock::time_point> startedAt;
};

//==========================================================================================================
// ServerInstance
// Purpose: One registered server plus everything derived from its current subprocess.
// Notes:
//   Owned exclusively by the Host registry. `generation` increases on every spawn so callbacks
//   from an earlier subprocess can recognise they are stale.
//==========================================================================================================
struct ServerInstance {
    explicit ServerInstance(ServerConfig cfg) : config(std::move(cfg)) {}

    ServerConfig config;
    ServerStatus status{ServerStatus::Stopped};
    std::unique_ptr<ChildProcess> process;
    std::optional<pid_t> pid;
    JSONValue capabilities;
    std::optional<Implementation> serverInfo;
    std::string protocolVersion;
    std::vector<Tool> tools;
    std::optional<std::string> lastError;
    std::optional<std::chrono::system_clock::time_point> startedAt;

    std::string inboundBuffer;
    std::string stderrBuffer;
    std::unique_ptr<IMessageFramer> framer;
    uint64_t generation{0};
    bool stopping{false};
    bool rediscovering{false};
    bool rediscoverAgain{false};

    ServerSnapshot Snapshot() const;

    // Drops the subprocess (killing it if alive) and every field derived from it.
    void ClearProcessState();
};

} // namespace toolhost
