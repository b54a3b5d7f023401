//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostConfig.h
// Purpose: Host tunables and server-configuration document parsing
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "toolhost/Protocol.h"
#include "toolhost/ServerInstance.h"

namespace toolhost {

//==========================================================================================================
// HostConfig
// Purpose: Timeouts, limits and heuristics applied by one Host.
// Notes:
//   FromEnvironment() starts from the defaults and applies TOOLHOST_* overrides:
//     TOOLHOST_MAX_SERVERS, TOOLHOST_REQUEST_TIMEOUT_MS, TOOLHOST_INITIALIZE_TIMEOUT_MS,
//     TOOLHOST_DISCOVERY_TIMEOUT_MS, TOOLHOST_TOOL_CALL_TIMEOUT_MS, TOOLHOST_TOOL_CALL_ATTEMPTS,
//     TOOLHOST_RETRY_BACKOFF_MS, TOOLHOST_STOP_GRACE_MS, TOOLHOST_MAX_LINE_BYTES,
//     TOOLHOST_LOG_SERVER_STDERR, TOOLHOST_ESCALATE_STDERR, TOOLHOST_STDERR_MARKERS (comma separated),
//     TOOLHOST_AUGMENT_PATH.
//==========================================================================================================
struct HostConfig {
    std::size_t maxServers{10};
    std::chrono::milliseconds initializeTimeout{10000};
    std::chrono::milliseconds discoveryTimeout{3000};
    std::chrono::milliseconds toolCallTimeout{25000};
    int toolCallAttempts{3};
    std::chrono::milliseconds retryBackoffStep{2000};
    std::chrono::milliseconds stopGracePeriod{5000};
    std::size_t maxLineLength{4 * 1024 * 1024};
    std::size_t maxDiscoveryPages{32};
    bool logServerStderr{true};
    bool escalateStderrErrors{true};
    std::vector<std::string> stderrErrorMarkers{"Error", "ENOENT", "command not found"};
    bool augmentSearchPath;
    Implementation clientInfo;

    HostConfig();

    static HostConfig FromEnvironment();
};

//==========================================================================================================
// ParseServerConfigs
// Purpose: Reads a {"mcpServers": {"<id>": {command, args?, env?, disabled?}}} document.
// Notes:
//   Disabled entries are skipped. name defaults to DisplayNameFromId(id); the optional fields
//   name, description, cwd and autoStart are honoured when present.
// Returns:
//   Configs ordered by id. Throws std::invalid_argument for malformed documents.
//==========================================================================================================
std::vector<ServerConfig> ParseServerConfigs(const std::string& json);

// Reads the file at path and parses it with ParseServerConfigs; throws std::runtime_error on I/O failure.
std::vector<ServerConfig> LoadServerConfigs(const std::string& path);

// "brave-search" -> "Brave Search"
std::string DisplayNameFromId(const std::string& id);

} // namespace toolhost
