//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Command-line front end: start tool servers, list their tools and optionally call one
//==========================================================================================================
//
// Usage:
//   toolhost_cli --config=servers.json [--call=TOOL [--server=ID] [--params=JSON]]
//   toolhost_cli --command=npx --arg=-y --arg=@scope/server [--id=ID] [--call=...]
//   --loglevel=debug|info|warn|error overrides TOOLHOST_LOG_LEVEL; --logfile=PATH also appends to a file.

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include "logging/Logger.h"
#include "toolhost/Host.hpp"
#include "toolhost/errors/Errors.h"
#include "toolhost/version.h"

using namespace toolhost;

namespace {
struct CliOptions {
    std::optional<std::string> configPath;
    std::optional<std::string> command;
    std::vector<std::string> args;
    std::string id{"cli"};
    std::optional<std::string> call;
    std::optional<std::string> server;
    std::string params{"{}"};
};

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Returns:
//   Optional string containing the value of the first occurrence when present
//==========================================================================================================
std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

std::vector<std::string> getArgValues(int argc, char** argv, const std::string& key) {
    std::vector<std::string> out;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            out.push_back(a.substr(eq + 1));
        }
    }
    return out;
}

boost::asio::awaitable<int> run(Host& host, CliOptions opts) {
    std::vector<ServerConfig> configs;
    if (opts.configPath.has_value()) {
        configs = LoadServerConfigs(*opts.configPath);
    } else {
        ServerConfig cfg;
        cfg.id = opts.id;
        cfg.command = *opts.command;
        cfg.args = opts.args;
        configs.push_back(std::move(cfg));
    }

    for (auto& cfg : configs) {
        const std::string id = cfg.id;
        co_await host.AddServer(std::move(cfg));
        if (host.GetServerStatus(id) == ServerStatus::Running) {
            continue; // autoStart
        }
        try {
            co_await host.StartServer(id);
        } catch (const errors::HostError& e) {
            LOG_ERROR("{}", e.what());
        }
    }

    for (const auto& s : host.GetServers()) {
        std::cout << s.config.id << " [" << ToString(s.status) << "]";
        if (s.lastError.has_value()) {
            std::cout << " " << *s.lastError;
        }
        std::cout << "\n";
    }
    for (const auto& tool : host.GetAllTools()) {
        std::cout << "  " << tool.serverId << "/" << tool.name;
        if (!tool.description.empty()) {
            std::cout << " - " << tool.description;
        }
        std::cout << "\n";
    }
    std::cout.flush();

    int rc = 0;
    if (opts.call.has_value()) {
        auto tool = host.FindTool(*opts.call, opts.server);
        if (!tool.has_value()) {
            LOG_ERROR("Tool '{}' not found on any running server", *opts.call);
            rc = 1;
        } else {
            try {
                JSONValue result = co_await host.ExecuteTool(
                    ToolCall{tool->name, tool->serverId, ParseJSON(opts.params)});
                std::cout << SerializeJSON(result) << std::endl;
            } catch (const errors::HostError& e) {
                LOG_ERROR("{} ({})", e.what(), errors::toString(e.kind()));
                rc = 1;
            }
        }
    }

    co_await host.Cleanup();
    co_return rc;
}
} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();
    if (auto lvl = getArgValue(argc, argv, "--loglevel")) {
        Logger::setLogLevelFromString(*lvl);
    }
    if (auto file = getArgValue(argc, argv, "--logfile")) {
        Logger::setLogFile(*file);
    }

    CliOptions opts;
    opts.configPath = getArgValue(argc, argv, "--config");
    opts.command = getArgValue(argc, argv, "--command");
    opts.args = getArgValues(argc, argv, "--arg");
    opts.id = getArgValue(argc, argv, "--id").value_or(opts.id);
    opts.call = getArgValue(argc, argv, "--call");
    opts.server = getArgValue(argc, argv, "--server");
    opts.params = getArgValue(argc, argv, "--params").value_or(opts.params);

    if (!opts.configPath.has_value() && !opts.command.has_value()) {
        std::cerr << "toolhost_cli " << getVersionString() << "\n"
                  << "usage: toolhost_cli (--config=FILE | --command=CMD [--arg=A]... [--id=ID])\n"
                  << "                    [--call=TOOL [--server=ID] [--params=JSON]] [--loglevel=LEVEL] [--logfile=PATH]\n";
        return 2;
    }
    if (!TryParseJSON(opts.params).has_value()) {
        LOG_ERROR("--params is not valid JSON: {}", opts.params);
        return 2;
    }

    boost::asio::io_context io;
    Host host(io, HostConfig::FromEnvironment());
    host.Events().Subscribe(HostEventType::ServerError, [](const HostEvent& e) {
        LOG_WARN("Server '{}' error: {}", e.serverId, e.text);
    });

    int rc = 0;
    boost::asio::co_spawn(io, run(host, std::move(opts)),
        [&io, &rc](std::exception_ptr ep, int code) {
            rc = code;
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    LOG_ERROR("toolhost_cli failed: {}", e.what());
                    rc = 1;
                }
            }
            io.stop();
        });
    io.run();
    return rc;
}
