//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Host.hpp
// Purpose: Tool-server host: registry, lifecycle, handshake, discovery and tool dispatch
//==========================================================================================================
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "toolhost/HostConfig.h"
#include "toolhost/HostEvents.h"
#include "toolhost/Protocol.h"
#include "toolhost/ServerInstance.h"

namespace toolhost {

//==========================================================================================================
// Host
// Purpose: Launches tool servers as child processes and talks newline-delimited JSON-RPC with them.
// Notes:
//   Single-threaded: every operation, I/O completion, timer and event handler runs on the
//   io_context passed to the constructor. Suspending operations are awaitables and must be
//   co_awaited (or co_spawned) on that io_context.
//   Errors are reported with the exceptions declared in toolhost/errors/Errors.h.
//==========================================================================================================
class Host {
public:
    explicit Host(boost::asio::io_context& io, HostConfig config = HostConfig{});
    ~Host();

    Host(const Host&) = delete;
    Host& operator=(const Host&) = delete;

    //==========================================================================================================
    // Events
    // Purpose: Per-Host event registry (server_added, server_started, tools_discovered, ...).
    //==========================================================================================================
    EventBus& Events();

    const HostConfig& Config() const;

    //==========================================================================================================
    // AddServer
    // Purpose: Registers a stopped server and publishes server_added.
    // Args:
    //   config: Launch description; config.id must be unique within this Host.
    // Returns:
    //   Completes after registration, or after StartServer when config.autoStart is set.
    //   Throws DuplicateServerError for a known id, std::invalid_argument for an empty id or
    //   command, and whatever StartServer throws when auto-starting.
    //==========================================================================================================
    boost::asio::awaitable<void> AddServer(ServerConfig config);

    //==========================================================================================================
    // StartServer
    // Purpose: Spawns the server, performs initialize / initialized / tools/list and marks it running.
    // Returns:
    //   No-op when already running. Throws NotFoundError, CapacityError, or HandshakeError
    //   (instance left in error with lastError set and the subprocess killed).
    //==========================================================================================================
    boost::asio::awaitable<void> StartServer(std::string id);

    //==========================================================================================================
    // StopServer
    // Purpose: SIGTERM, then SIGKILL after the grace period; the instance always ends stopped.
    // Throws NotFoundError for an unknown id.
    //==========================================================================================================
    boost::asio::awaitable<void> StopServer(std::string id);

    // Stops the server when it has a process, then unregisters it. Unknown ids are ignored.
    boost::asio::awaitable<void> RemoveServer(std::string id);

    //==========================================================================================================
    // ExecuteTool
    // Purpose: Sends tools/call with retry (attempt N waits N x retryBackoffStep before N+1).
    // Returns:
    //   The result payload of the response. Throws NotFoundError (server or tool unknown),
    //   NotRunningError (checked before any I/O) or ToolExecutionError after the last attempt.
    //==========================================================================================================
    boost::asio::awaitable<JSONValue> ExecuteTool(ToolCall call);

    // Stops every registered server concurrently; servers stay registered.
    boost::asio::awaitable<void> Cleanup();

    ///////////////////////////////////////// Read accessors ///////////////////////////////////////////
    // Snapshots ordered by server id.
    std::vector<ServerSnapshot> GetServers() const;
    std::optional<ServerSnapshot> GetServer(const std::string& id) const;
    std::optional<ServerStatus> GetServerStatus(const std::string& id) const;

    // Tools of running servers only.
    std::vector<Tool> GetAllTools() const;
    std::optional<Tool> FindTool(const std::string& name,
                                 const std::optional<std::string>& serverId = std::nullopt) const;

    //==========================================================================================================
    // DeliverOutput
    // Purpose: Feeds bytes to a server's framer exactly as if they were read from its stdout.
    // Throws NotFoundError for an unknown id.
    //==========================================================================================================
    void DeliverOutput(const std::string& serverId, std::string_view chunk);

    std::size_t PendingRequestCount() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace toolhost
