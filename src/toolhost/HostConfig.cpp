//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostConfig.cpp
// Purpose: HostConfig defaults, environment overrides and server-configuration parsing
//==========================================================================================================

#include "toolhost/HostConfig.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/ChildProcess.hpp"
#include "toolhost/version.h"

namespace toolhost {

namespace {
bool envFlag(const char* name, bool defaultValue) {
    std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    LOG_WARN("Ignoring unrecognised boolean {}={}", name, v);
    return defaultValue;
}

std::chrono::milliseconds envMs(const char* name, std::chrono::milliseconds defaultValue) {
    return std::chrono::milliseconds(
        GetEnvUint64OrDefault(name, static_cast<uint64_t>(defaultValue.count())));
}

const std::string* stringField(const JSONValue& obj, const char* key, const std::string& serverId) {
    const JSONValue* v = FindMember(obj, key);
    if (v == nullptr) {
        return nullptr;
    }
    const auto* s = std::get_if<std::string>(&v->value);
    if (s == nullptr) {
        throw std::invalid_argument("Server '" + serverId + "': field '" + key + "' must be a string");
    }
    return s;
}

bool boolField(const JSONValue& obj, const char* key, const std::string& serverId) {
    const JSONValue* v = FindMember(obj, key);
    if (v == nullptr || v->isNull()) {
        return false;
    }
    const auto* b = std::get_if<bool>(&v->value);
    if (b == nullptr) {
        throw std::invalid_argument("Server '" + serverId + "': field '" + key + "' must be a boolean");
    }
    return *b;
}
} // namespace

HostConfig::HostConfig()
    : augmentSearchPath(DefaultAugmentSearchPath()),
      clientInfo("toolhost", getVersionString()) {}

HostConfig HostConfig::FromEnvironment() {
    FUNC_SCOPE();
    HostConfig c;
    c.maxServers = static_cast<std::size_t>(GetEnvUint64OrDefault("TOOLHOST_MAX_SERVERS", c.maxServers));
    c.initializeTimeout = envMs("TOOLHOST_INITIALIZE_TIMEOUT_MS", c.initializeTimeout);
    c.discoveryTimeout = envMs("TOOLHOST_DISCOVERY_TIMEOUT_MS", c.discoveryTimeout);
    c.toolCallTimeout = envMs("TOOLHOST_TOOL_CALL_TIMEOUT_MS", c.toolCallTimeout);
    c.toolCallAttempts = static_cast<int>(std::max<uint64_t>(
        1, GetEnvUint64OrDefault("TOOLHOST_TOOL_CALL_ATTEMPTS", static_cast<uint64_t>(c.toolCallAttempts))));
    c.retryBackoffStep = envMs("TOOLHOST_RETRY_BACKOFF_MS", c.retryBackoffStep);
    c.stopGracePeriod = envMs("TOOLHOST_STOP_GRACE_MS", c.stopGracePeriod);
    c.maxLineLength = static_cast<std::size_t>(GetEnvUint64OrDefault("TOOLHOST_MAX_LINE_BYTES", c.maxLineLength));
    c.logServerStderr = envFlag("TOOLHOST_LOG_SERVER_STDERR", c.logServerStderr);
    c.escalateStderrErrors = envFlag("TOOLHOST_ESCALATE_STDERR", c.escalateStderrErrors);
    c.augmentSearchPath = envFlag("TOOLHOST_AUGMENT_PATH", c.augmentSearchPath);

    const std::string markers = GetEnvOrDefault("TOOLHOST_STDERR_MARKERS", "");
    if (!markers.empty()) {
        c.stderrErrorMarkers.clear();
        std::stringstream ss(markers);
        std::string m;
        while (std::getline(ss, m, ',')) {
            if (!m.empty()) c.stderrErrorMarkers.push_back(m);
        }
    }
    return c;
}

std::string DisplayNameFromId(const std::string& id) {
    std::string out;
    out.reserve(id.size());
    bool startOfWord = true;
    for (char c : id) {
        if (c == '-') {
            out.push_back(' ');
            startOfWord = true;
            continue;
        }
        out.push_back(startOfWord ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c);
        startOfWord = false;
    }
    return out;
}

std::vector<ServerConfig> ParseServerConfigs(const std::string& json) {
    FUNC_SCOPE();
    JSONValue doc;
    try {
        doc = ParseJSON(json);
    } catch (const std::runtime_error& e) {
        throw std::invalid_argument(std::string("Invalid server configuration JSON: ") + e.what());
    }
    const JSONValue* servers = FindMember(doc, "mcpServers");
    if (servers == nullptr || !servers->isObject()) {
        throw std::invalid_argument("Server configuration must contain an \"mcpServers\" object");
    }

    // unordered_map iteration order is unspecified; sort by id for stable registration order
    std::map<std::string, const JSONValue*> ordered;
    for (const auto& [id, entry] : std::get<JSONValue::Object>(servers->value)) {
        ordered.emplace(id, entry.get());
    }

    std::vector<ServerConfig> out;
    for (const auto& [id, entry] : ordered) {
        if (entry == nullptr || !entry->isObject()) {
            throw std::invalid_argument("Server '" + id + "' must be an object");
        }
        if (boolField(*entry, "disabled", id)) {
            LOG_INFO("Skipping disabled server '{}'", id);
            continue;
        }
        const std::string* command = stringField(*entry, "command", id);
        if (command == nullptr || command->empty()) {
            throw std::invalid_argument("Server '" + id + "' is missing \"command\"");
        }

        ServerConfig cfg;
        cfg.id = id;
        cfg.command = *command;
        const std::string* name = stringField(*entry, "name", id);
        cfg.name = name ? *name : DisplayNameFromId(id);
        const std::string* description = stringField(*entry, "description", id);
        cfg.description = description ? *description : "Imported from server configuration: " + id;
        if (const std::string* cwd = stringField(*entry, "cwd", id)) {
            cfg.workingDirectory = *cwd;
        }
        cfg.autoStart = boolField(*entry, "autoStart", id);

        if (const JSONValue* args = FindMember(*entry, "args")) {
            if (!args->isArray()) {
                throw std::invalid_argument("Server '" + id + "': \"args\" must be an array");
            }
            for (const auto& a : std::get<JSONValue::Array>(args->value)) {
                const auto* s = a ? std::get_if<std::string>(&a->value) : nullptr;
                if (s == nullptr) {
                    throw std::invalid_argument("Server '" + id + "': \"args\" entries must be strings");
                }
                cfg.args.push_back(*s);
            }
        }
        if (const JSONValue* env = FindMember(*entry, "env")) {
            if (!env->isObject()) {
                throw std::invalid_argument("Server '" + id + "': \"env\" must be an object");
            }
            for (const auto& [k, v] : std::get<JSONValue::Object>(env->value)) {
                const auto* s = v ? std::get_if<std::string>(&v->value) : nullptr;
                if (s == nullptr) {
                    throw std::invalid_argument("Server '" + id + "': env '" + k + "' must be a string");
                }
                cfg.env[k] = *s;
            }
        }
        out.push_back(std::move(cfg));
    }
    return out;
}

std::vector<ServerConfig> LoadServerConfigs(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open server configuration file: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return ParseServerConfigs(ss.str());
}

} // namespace toolhost
