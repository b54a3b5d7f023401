//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerInstance.cpp
// Purpose: ServerStatus names and ServerInstance helpers
//==========================================================================================================

#include "toolhost/ServerInstance.h"

namespace toolhost {

const char* ToString(ServerStatus status) {
    switch (status) {
        case ServerStatus::Stopped: return "stopped";
        case ServerStatus::Starting: return "starting";
        case ServerStatus::Running: return "running";
        case ServerStatus::Error: return "error";
    }
    return "unknown";
}

ServerSnapshot ServerInstance::Snapshot() const {
    ServerSnapshot s;
    s.config = config;
    s.status = status;
    s.hasProcess = static_cast<bool>(process);
    s.pid = pid;
    s.capabilities = capabilities;
    s.serverInfo = serverInfo;
    s.protocolVersion = protocolVersion;
    s.tools = tools;
    s.lastError = lastError;
    s.startedAt = startedAt;
    return s;
}

void ServerInstance::ClearProcessState() {
    process.reset();
    pid.reset();
    startedAt.reset();
    capabilities = JSONValue{};
    serverInfo.reset();
    protocolVersion.clear();
    tools.clear();
    inboundBuffer.clear();
    stderrBuffer.clear();
    framer.reset();
    rediscovering = false;
    rediscoverAgain = false;
}

} // namespace toolhost
