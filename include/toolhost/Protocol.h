//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Tool-server protocol constants and data structures shared by the host
//==========================================================================================================

#pragma once

#include "toolhost/JSONRPCTypes.h"
#include <string>
#include <vector>

namespace toolhost {
//==========================================================================================================
// Protocol types and constants
// Purpose: Method names, the negotiated protocol revision and the host-side value types for tools.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol revision sent in initialize
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* Log = "notifications/message";
    constexpr const char* Ping = "ping";
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Name/version pair exchanged as clientInfo and serverInfo
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// A callable tool advertised by one server
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters, kept opaque
    std::string serverId;

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema, std::string serverId)
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)), serverId(std::move(serverId)) {}
};

// Request to invoke a tool on a specific server
struct ToolCall {
    std::string tool;
    std::string server;
    JSONValue parameters;
};

} // namespace toolhost
