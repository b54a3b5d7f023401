//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Host.cpp
// Purpose: Host implementation: lifecycle state machine, handshake, discovery, tool calls
//==========================================================================================================

#include "toolhost/Host.hpp"

#include <algorithm>
#include <csignal>
#include <exception>
#include <format>
#include <iterator>
#include <map>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/ChildProcess.hpp"
#include "toolhost/JsonRpcMessageRouter.h"
#include "toolhost/LineFramer.h"
#include "toolhost/RequestCorrelator.hpp"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {
constexpr std::size_t kMaxStderrLine = 64 * 1024;

JSONValue makeObject(std::initializer_list<std::pair<const char*, JSONValue>> members) {
    JSONValue::Object obj;
    for (const auto& [k, v] : members) {
        obj[k] = std::make_shared<JSONValue>(v);
    }
    return JSONValue(std::move(obj));
}

JSONValue emptyObject() {
    return JSONValue(JSONValue::Object{});
}

// Logs a failed detached coroutine instead of dropping the exception
void logDetachedFailure(const char* what, const std::string& serverId, std::exception_ptr ep) {
    if (!ep) {
        return;
    }
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        LOG_WARN("{} for server '{}' failed: {}", what, serverId, e.what());
    }
}
} // namespace

//==========================================================================================================
// Host::Impl
//==========================================================================================================
class Host::Impl : public std::enable_shared_from_this<Host::Impl> {
public:
    Impl(boost::asio::io_context& ioc, HostConfig cfg)
        : io(ioc), config(std::move(cfg)), correlator(ioc.get_executor()),
          router(MakeDefaultJsonRpcMessageRouter()) {}

    boost::asio::io_context& io;
    HostConfig config;
    EventBus events;
    RequestCorrelator correlator;
    std::unique_ptr<IJsonRpcMessageRouter> router;
    std::map<std::string, std::unique_ptr<ServerInstance>> servers;
    uint64_t generationCounter{0};

    ///////////////////////////////////////// Lookup ///////////////////////////////////////////
    ServerInstance* find(const std::string& id) {
        auto it = servers.find(id);
        return it == servers.end() ? nullptr : it->second.get();
    }

    const ServerInstance* find(const std::string& id) const {
        auto it = servers.find(id);
        return it == servers.end() ? nullptr : it->second.get();
    }

    // Instance still attached to the subprocess incarnation `gen`
    ServerInstance* findLive(const std::string& id, uint64_t gen) {
        ServerInstance* inst = find(id);
        if (inst == nullptr || inst->generation != gen) {
            return nullptr;
        }
        return inst;
    }

    ServerInstance& requireStarting(const std::string& id, uint64_t gen) {
        ServerInstance* inst = findLive(id, gen);
        if (inst == nullptr) {
            throw errors::ProcessError("server was removed during startup");
        }
        if (inst->stopping || inst->status != ServerStatus::Starting) {
            throw errors::ProcessError("server was stopped during startup");
        }
        if (!inst->process) {
            throw errors::ProcessError("server has no process");
        }
        if (auto exit = inst->process->Exit()) {
            throw errors::ProcessError("server process " + exit->ToString() + " during startup");
        }
        return *inst;
    }

    std::size_t activeCount() const {
        std::size_t n = 0;
        for (const auto& [id, inst] : servers) {
            if (inst->status == ServerStatus::Running || inst->status == ServerStatus::Starting) {
                ++n;
            }
        }
        return n;
    }

    void publish(HostEventType type, const std::string& serverId, std::string text = {},
                 std::vector<Tool> tools = {}, std::optional<JSONValue> message = std::nullopt) {
        HostEvent ev{type, serverId, std::move(text), std::move(tools), std::move(message)};
        events.Publish(ev);
    }

    ///////////////////////////////////////// Transport ///////////////////////////////////////////
    RequestCorrelator::Writer writerFor(const std::string& id, uint64_t gen) {
        return [this, id, gen](const std::string& frame) {
            ServerInstance* inst = findLive(id, gen);
            if (inst == nullptr || !inst->process) {
                throw errors::ProcessError("server '" + id + "' has no process");
            }
            inst->process->Write(frame);
        };
    }

    boost::asio::awaitable<JSONValue> request(std::string id, uint64_t gen, std::string method,
                                              std::optional<JSONValue> params,
                                              std::chrono::milliseconds timeout) {
        co_return co_await correlator.Send(id, method, std::move(params), timeout, writerFor(id, gen));
    }

    void spawnProcess(ServerInstance& inst) {
        SpawnOptions opts;
        opts.command = inst.config.command;
        opts.args = inst.config.args;
        opts.environment = BuildChildEnvironment(SnapshotEnvironment(), inst.config.env,
                                                 config.augmentSearchPath);
        opts.workingDirectory = inst.config.workingDirectory;

        inst.process = ChildProcess::Spawn(io.get_executor(), opts);
        inst.pid = inst.process->Pid();
        inst.startedAt = std::chrono::system_clock::now();
        inst.framer = MakeNewlineFramer(config.maxLineLength);
        inst.inboundBuffer.clear();
        inst.stderrBuffer.clear();

        std::weak_ptr<Impl> weak = weak_from_this();
        const std::string id = inst.config.id;
        const uint64_t gen = inst.generation;
        inst.process->OnStdout([weak, id, gen](std::string_view chunk) {
            if (auto self = weak.lock()) self->onStdout(id, gen, chunk);
        });
        inst.process->OnStderr([weak, id, gen](std::string_view chunk) {
            if (auto self = weak.lock()) self->onStderr(id, gen, chunk);
        });
        inst.process->OnExit([weak, id, gen](const ExitStatus& status) {
            if (auto self = weak.lock()) self->onExit(id, gen, status);
        });
        inst.process->Start();
    }

    ///////////////////////////////////////// Inbound ///////////////////////////////////////////
    void onStdout(const std::string& id, uint64_t gen, std::string_view chunk) {
        ServerInstance* inst = findLive(id, gen);
        if (inst == nullptr || !inst->framer) {
            return;
        }
        inst->inboundBuffer.append(chunk.data(), chunk.size());
        drainLines(id, gen);
    }

    void drainLines(const std::string& id, uint64_t gen) {
        while (true) {
            ServerInstance* inst = findLive(id, gen);
            if (inst == nullptr || !inst->framer) {
                return;
            }
            auto line = inst->framer->tryDecode(inst->inboundBuffer);
            if (!line.has_value()) {
                return;
            }
            handleLine(id, gen, *line);
        }
    }

    void handleLine(const std::string& id, uint64_t gen, const std::string& line) {
        RouterHandlers handlers;
        handlers.diagnosticHandler = [this, &id](const std::string& text) {
            publish(HostEventType::ServerMessage, id, text);
        };
        handlers.unknownHandler = [this, &id](const std::string& text) {
            publish(HostEventType::ServerMessage, id, text, {}, TryParseJSON(text));
        };
        handlers.notificationHandler = [this, &id, gen, &line](std::unique_ptr<JSONRPCNotification> n) {
            onNotification(id, gen, line, *n);
        };
        handlers.requestHandler = [this, &id, &line](const JSONRPCRequest& req) -> std::unique_ptr<JSONRPCResponse> {
            publish(HostEventType::ServerMessage, id, line, {}, TryParseJSON(line));
            if (req.method == Methods::Ping) {
                return std::make_unique<JSONRPCResponse>(req.id, emptyObject());
            }
            LOG_DEBUG("Server '{}' sent unsupported request '{}'", id, req.method);
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound,
                                       "Method not found: " + req.method);
        };

        auto reply = router->route(line, handlers, [this](JSONRPCResponse&& response) {
            return correlator.Resolve(std::move(response));
        });
        if (!reply.has_value()) {
            return;
        }
        ServerInstance* inst = findLive(id, gen);
        if (inst == nullptr || !inst->process || !inst->framer) {
            return;
        }
        try {
            inst->process->Write(inst->framer->encode(*reply));
        } catch (const errors::ProcessError& e) {
            LOG_WARN("Could not answer request from server '{}': {}", id, e.what());
        }
    }

    void onNotification(const std::string& id, uint64_t gen, const std::string& line,
                        const JSONRPCNotification& n) {
        if (n.method == Methods::ToolListChanged) {
            scheduleRediscovery(id, gen);
            return;
        }
        if (n.method == Methods::Log && n.params.has_value()) {
            const JSONValue* data = FindMember(n.params.value(), "data");
            LOG_INFO("[{}] {}", id, SerializeJSON(data ? *data : n.params.value()));
        }
        publish(HostEventType::ServerMessage, id, line, {}, TryParseJSON(line));
    }

    void onStderr(const std::string& id, uint64_t gen, std::string_view chunk) {
        ServerInstance* inst = findLive(id, gen);
        if (inst == nullptr) {
            return;
        }
        inst->stderrBuffer.append(chunk.data(), chunk.size());
        while (true) {
            inst = findLive(id, gen);
            if (inst == nullptr) {
                return;
            }
            std::string& buf = inst->stderrBuffer;
            std::size_t eol = buf.find('\n');
            std::string text;
            if (eol != std::string::npos) {
                text = buf.substr(0, eol);
                buf.erase(0, eol + 1);
            } else if (buf.size() > kMaxStderrLine) {
                text = std::move(buf);
                buf.clear();
            } else {
                return;
            }
            if (!text.empty() && text.back() == '\r') {
                text.pop_back();
            }
            if (text.find_first_not_of(" \t") == std::string::npos) {
                continue;
            }
            handleStderrLine(id, gen, text);
        }
    }

    bool matchesErrorMarker(const std::string& text) const {
        for (const auto& marker : config.stderrErrorMarkers) {
            if (!marker.empty() && text.find(marker) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    void handleStderrLine(const std::string& id, uint64_t gen, const std::string& text) {
        if (config.logServerStderr) {
            LOG_WARN("[{} stderr] {}", id, text);
        }
        publish(HostEventType::ServerStderr, id, text);

        ServerInstance* inst = findLive(id, gen);
        if (inst == nullptr || !config.escalateStderrErrors || inst->stopping ||
            inst->status != ServerStatus::Running || !matchesErrorMarker(text)) {
            return;
        }
        LOG_ERROR("Server '{}' reported an error on stderr: {}", id, text);
        inst->status = ServerStatus::Error;
        inst->lastError = text;
        correlator.FailServer(id, "server reported an error: " + text);
        publish(HostEventType::ServerError, id, text);
    }

    void onExit(const std::string& id, uint64_t gen, const ExitStatus& status) {
        ServerInstance* inst = findLive(id, gen);
        if (inst == nullptr) {
            return;
        }
        const std::string reason = "server process " + status.ToString();
        if (inst->stopping) {
            LOG_DEBUG("Server '{}' {} while stopping", id, status.ToString());
            return;
        }
        switch (inst->status) {
            case ServerStatus::Starting:
                // The handshake observes the exit and moves the instance to error
                LOG_WARN("Server '{}' {} during startup", id, status.ToString());
                correlator.FailServer(id, reason);
                break;
            case ServerStatus::Running:
            case ServerStatus::Error:
                LOG_WARN("Server '{}' {}", id, status.ToString());
                correlator.FailServer(id, reason);
                inst->ClearProcessState();
                inst->status = ServerStatus::Stopped;
                publish(HostEventType::ServerStopped, id, reason);
                break;
            case ServerStatus::Stopped:
                inst->ClearProcessState();
                break;
        }
    }

    ///////////////////////////////////////// Discovery ///////////////////////////////////////////
    static std::vector<Tool> parseTools(const JSONValue& result, const std::string& serverId,
                                        std::unordered_set<std::string>& seen) {
        std::vector<Tool> tools;
        const JSONValue* list = FindMember(result, "tools");
        if (list == nullptr || !list->isArray()) {
            throw std::runtime_error("tools/list result has no \"tools\" array");
        }
        for (const auto& item : std::get<JSONValue::Array>(list->value)) {
            if (!item) {
                continue;
            }
            auto name = GetStringMember(*item, "name");
            if (!name.has_value() || name->empty()) {
                LOG_WARN("Server '{}' advertised a tool without a name; skipped", serverId);
                continue;
            }
            if (!seen.insert(*name).second) {
                LOG_WARN("Server '{}' advertised tool '{}' twice; keeping the first", serverId, *name);
                continue;
            }
            const JSONValue* schema = FindMember(*item, "inputSchema");
            tools.emplace_back(*name, GetStringMember(*item, "description").value_or(""),
                               schema ? *schema : emptyObject(), serverId);
        }
        return tools;
    }

    // Returns std::nullopt when discovery failed; the failure is only logged
    boost::asio::awaitable<std::optional<std::vector<Tool>>> discoverTools(std::string id, uint64_t gen) {
        std::vector<Tool> tools;
        std::unordered_set<std::string> seen;
        std::optional<std::string> cursor;
        try {
            for (std::size_t page = 0; page < config.maxDiscoveryPages; ++page) {
                JSONValue params = cursor ? makeObject({{"cursor", JSONValue(*cursor)}}) : emptyObject();
                JSONValue result = co_await request(id, gen, Methods::ListTools, std::move(params),
                                                    config.discoveryTimeout);
                auto pageTools = parseTools(result, id, seen);
                tools.insert(tools.end(), std::make_move_iterator(pageTools.begin()),
                             std::make_move_iterator(pageTools.end()));
                cursor = GetStringMember(result, "nextCursor");
                if (!cursor.has_value() || cursor->empty()) {
                    break;
                }
                if (page + 1 == config.maxDiscoveryPages) {
                    LOG_WARN("Server '{}' still paginating after {} tools/list pages; stopping",
                             id, config.maxDiscoveryPages);
                }
            }
        } catch (const std::exception& e) {
            LOG_WARN("Tool discovery for server '{}' failed: {}", id, e.what());
            co_return std::nullopt;
        }
        LOG_INFO("Server '{}' exposes {} tool(s)", id, tools.size());
        co_return tools;
    }

    void scheduleRediscovery(const std::string& id, uint64_t gen) {
        ServerInstance* inst = findLive(id, gen);
        if (inst == nullptr || inst->status != ServerStatus::Running) {
            return;
        }
        if (inst->rediscovering) {
            inst->rediscoverAgain = true;
            return;
        }
        inst->rediscovering = true;
        auto self = shared_from_this();
        boost::asio::co_spawn(io, rediscover(id, gen),
            [self, id](std::exception_ptr ep) { logDetachedFailure("Tool rediscovery", id, ep); });
    }

    boost::asio::awaitable<void> rediscover(std::string id, uint64_t gen) {
        while (true) {
            auto tools = co_await discoverTools(id, gen);
            ServerInstance* inst = findLive(id, gen);
            if (inst == nullptr || inst->status != ServerStatus::Running) {
                co_return;
            }
            if (tools.has_value()) {
                inst->tools = *tools;
                publish(HostEventType::ToolsDiscovered, id, {}, std::move(*tools));
                inst = findLive(id, gen);
                if (inst == nullptr) {
                    co_return;
                }
            }
            if (!inst->rediscoverAgain) {
                inst->rediscovering = false;
                co_return;
            }
            inst->rediscoverAgain = false;
        }
    }

    ///////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    boost::asio::awaitable<void> addServer(ServerConfig cfg) {
        if (cfg.id.empty()) {
            throw std::invalid_argument("Server id must not be empty");
        }
        if (cfg.command.empty()) {
            throw std::invalid_argument("Server '" + cfg.id + "' has an empty command");
        }
        if (servers.count(cfg.id) != 0) {
            throw errors::DuplicateServerError(cfg.id);
        }
        if (cfg.name.empty()) {
            cfg.name = DisplayNameFromId(cfg.id);
        }
        const std::string id = cfg.id;
        const bool autoStart = cfg.autoStart;
        servers.emplace(id, std::make_unique<ServerInstance>(std::move(cfg)));
        LOG_INFO("Registered server '{}'", id);
        publish(HostEventType::ServerAdded, id);
        if (autoStart) {
            co_await startServer(id);
        }
    }

    boost::asio::awaitable<void> handshake(std::string id, uint64_t gen) {
        JSONValue initParams = makeObject({
            {"protocolVersion", JSONValue(PROTOCOL_VERSION)},
            {"capabilities", makeObject({
                {"tools", emptyObject()},
                {"resources", emptyObject()},
                {"prompts", emptyObject()},
            })},
            {"clientInfo", makeObject({
                {"name", JSONValue(config.clientInfo.name)},
                {"version", JSONValue(config.clientInfo.version)},
            })},
        });
        JSONValue initResult = co_await request(id, gen, Methods::Initialize, std::move(initParams),
                                                config.initializeTimeout);
        if (!initResult.isObject()) {
            throw std::runtime_error("initialize returned a non-object result");
        }

        ServerInstance* inst = &requireStarting(id, gen);
        const JSONValue* caps = FindMember(initResult, "capabilities");
        inst->capabilities = (caps && caps->isObject()) ? *caps : emptyObject();
        inst->protocolVersion = GetStringMember(initResult, "protocolVersion").value_or("");
        if (const JSONValue* info = FindMember(initResult, "serverInfo")) {
            inst->serverInfo = Implementation(GetStringMember(*info, "name").value_or(""),
                                              GetStringMember(*info, "version").value_or(""));
        }
        if (!inst->protocolVersion.empty() && inst->protocolVersion != PROTOCOL_VERSION) {
            LOG_INFO("Server '{}' negotiated protocol {}", id, inst->protocolVersion);
        }

        correlator.Notify(Methods::Initialized, std::nullopt, writerFor(id, gen));

        auto tools = co_await discoverTools(id, gen);
        inst = &requireStarting(id, gen);
        inst->tools = tools.value_or(std::vector<Tool>{});
    }

    boost::asio::awaitable<void> startServer(std::string id) {
        ServerInstance* inst = find(id);
        if (inst == nullptr) {
            throw errors::NotFoundError("Server '" + id + "' not found");
        }
        if (inst->status == ServerStatus::Running) {
            co_return;
        }
        if (inst->status == ServerStatus::Starting || inst->stopping) {
            throw errors::HandshakeError(id, inst->stopping ? "server is stopping" : "startup already in progress");
        }
        if (activeCount() >= config.maxServers) {
            throw errors::CapacityError(config.maxServers);
        }

        // Leftover process from an escalated error
        if (inst->process) {
            correlator.FailServer(id, "server is restarting");
            inst->ClearProcessState();
        }
        inst->status = ServerStatus::Starting;
        inst->lastError.reset();
        const uint64_t gen = ++generationCounter;
        inst->generation = gen;
        LOG_INFO("Starting server '{}': {}", id, inst->config.command);
        publish(HostEventType::ServerStarting, id);

        std::string failure;
        try {
            inst = find(id);
            if (inst == nullptr || inst->generation != gen || inst->status != ServerStatus::Starting) {
                throw errors::ProcessError("server changed state before spawn");
            }
            spawnProcess(*inst);
            co_await handshake(id, gen);
        } catch (const std::exception& e) {
            failure = e.what();
        }

        if (!failure.empty()) {
            ServerInstance* cur = findLive(id, gen);
            if (cur != nullptr && !cur->stopping && cur->status == ServerStatus::Starting) {
                LOG_ERROR("Server '{}' failed to start: {}", id, failure);
                correlator.FailServer(id, failure);
                cur->ClearProcessState();
                cur->status = ServerStatus::Error;
                cur->lastError = failure;
                publish(HostEventType::ServerError, id, failure);
            }
            throw errors::HandshakeError(id, failure);
        }

        inst = findLive(id, gen);
        if (inst == nullptr) {
            throw errors::HandshakeError(id, "server was removed during startup");
        }
        inst->status = ServerStatus::Running;
        inst->lastError.reset();
        LOG_INFO("Server '{}' running (pid {}, {} tool(s))", id,
                 inst->pid ? static_cast<int>(*inst->pid) : -1, inst->tools.size());
        std::vector<Tool> tools = inst->tools;
        publish(HostEventType::ServerStarted, id);
        publish(HostEventType::ToolsDiscovered, id, {}, std::move(tools));
    }

    boost::asio::awaitable<void> stopServer(std::string id) {
        ServerInstance* inst = find(id);
        if (inst == nullptr) {
            throw errors::NotFoundError("Server '" + id + "' not found");
        }
        if (!inst->process) {
            if (inst->status != ServerStatus::Stopped) {
                correlator.FailServer(id, "server stopped");
                inst->ClearProcessState();
                inst->status = ServerStatus::Stopped;
                publish(HostEventType::ServerStopped, id);
            }
            co_return;
        }
        if (inst->stopping) {
            // Another stop owns the shutdown; wait for the same process to go away
            co_await inst->process->WaitForExit(config.stopGracePeriod + std::chrono::seconds(1));
            co_return;
        }

        const uint64_t gen = inst->generation;
        inst->stopping = true;
        correlator.FailServer(id, "server is stopping");
        LOG_INFO("Stopping server '{}' (pid {})", id, inst->pid ? static_cast<int>(*inst->pid) : -1);

        bool exited = inst->process->HasExited();
        if (!exited) {
            inst->process->Signal(SIGTERM);
            exited = co_await inst->process->WaitForExit(config.stopGracePeriod);
        }

        inst = findLive(id, gen);
        if (inst == nullptr) {
            co_return;
        }
        if (!exited && inst->process) {
            LOG_WARN("Server '{}' ignored SIGTERM for {} ms; sending SIGKILL", id,
                     static_cast<long long>(config.stopGracePeriod.count()));
        }
        // Release kills (SIGKILL) and reaps a child that is still alive
        inst->ClearProcessState();
        inst->status = ServerStatus::Stopped;
        inst->stopping = false;
        LOG_INFO("Server '{}' stopped", id);
        publish(HostEventType::ServerStopped, id);
    }

    boost::asio::awaitable<void> removeServer(std::string id) {
        ServerInstance* inst = find(id);
        if (inst == nullptr) {
            co_return;
        }
        if (inst->process || inst->status != ServerStatus::Stopped) {
            co_await stopServer(id);
        }
        if (servers.erase(id) == 0) {
            co_return;
        }
        LOG_INFO("Removed server '{}'", id);
        publish(HostEventType::ServerRemoved, id);
    }

    boost::asio::awaitable<JSONValue> executeTool(ToolCall call) {
        ServerInstance* inst = find(call.server);
        if (inst == nullptr) {
            throw errors::NotFoundError("Server '" + call.server + "' not found");
        }
        if (inst->status != ServerStatus::Running) {
            throw errors::NotRunningError(call.server, ToString(inst->status));
        }
        bool known = false;
        for (const auto& t : inst->tools) {
            if (t.name == call.tool) {
                known = true;
                break;
            }
        }
        if (!known) {
            throw errors::NotFoundError("Tool '" + call.tool + "' not found on server '" + call.server + "'");
        }

        const int maxAttempts = std::max(1, config.toolCallAttempts);
        int attemptsMade = 0;
        std::string lastError;
        for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
            inst = find(call.server);
            if (inst == nullptr || inst->status != ServerStatus::Running || !inst->process || inst->stopping) {
                if (lastError.empty()) {
                    lastError = "server is no longer running";
                }
                break;
            }
            const uint64_t gen = inst->generation;
            ++attemptsMade;
            JSONValue params = makeObject({{"name", JSONValue(call.tool)}, {"arguments", call.parameters}});
            std::optional<JSONValue> result;
            try {
                result = co_await request(call.server, gen, Methods::CallTool, std::move(params),
                                          config.toolCallTimeout);
            } catch (const errors::HostError& e) {
                lastError = e.what();
                LOG_WARN("Tool '{}' on server '{}' attempt {}/{} failed: {}",
                         call.tool, call.server, attempt, maxAttempts, lastError);
            }
            if (result.has_value()) {
                co_return std::move(*result);
            }
            if (attempt < maxAttempts) {
                boost::asio::steady_timer delay(io);
                delay.expires_after(config.retryBackoffStep * attempt);
                boost::system::error_code ec;
                co_await delay.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            }
        }
        throw errors::ToolExecutionError(call.tool, call.server, attemptsMade, lastError);
    }

    boost::asio::awaitable<void> cleanup() {
        auto self = shared_from_this();
        std::vector<std::string> ids;
        for (const auto& [id, inst] : servers) {
            if (inst->process || inst->status != ServerStatus::Stopped) {
                ids.push_back(id);
            }
        }
        if (ids.empty()) {
            co_return;
        }
        LOG_INFO("Stopping {} server(s)", ids.size());
        auto remaining = std::make_shared<std::size_t>(ids.size());
        auto latch = std::make_shared<boost::asio::steady_timer>(io, boost::asio::steady_timer::time_point::max());
        for (const auto& id : ids) {
            boost::asio::co_spawn(io, stopServer(id),
                [self, remaining, latch, id](std::exception_ptr ep) {
                    logDetachedFailure("Stop", id, ep);
                    if (--*remaining == 0) {
                        latch->cancel();
                    }
                });
        }
        while (*remaining > 0) {
            boost::system::error_code ec;
            co_await latch->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
    }

    void shutdown() {
        for (auto& [id, inst] : servers) {
            correlator.FailServer(id, "host is shutting down");
            inst->ClearProcessState();
            inst->status = ServerStatus::Stopped;
        }
    }
};

//==========================================================================================================
// Host
//==========================================================================================================
Host::Host(boost::asio::io_context& io, HostConfig config)
    : pImpl(std::make_shared<Impl>(io, std::move(config))) {
    FUNC_SCOPE();
    IgnoreSigpipe();
}

Host::~Host() {
    FUNC_SCOPE();
    pImpl->shutdown();
}

EventBus& Host::Events() { return pImpl->events; }

const HostConfig& Host::Config() const { return pImpl->config; }

boost::asio::awaitable<void> Host::AddServer(ServerConfig config) {
    FUNC_SCOPE();
    auto impl = pImpl;
    co_await impl->addServer(std::move(config));
}

boost::asio::awaitable<void> Host::StartServer(std::string id) {
    FUNC_SCOPE();
    auto impl = pImpl;
    co_await impl->startServer(std::move(id));
}

boost::asio::awaitable<void> Host::StopServer(std::string id) {
    FUNC_SCOPE();
    auto impl = pImpl;
    co_await impl->stopServer(std::move(id));
}

boost::asio::awaitable<void> Host::RemoveServer(std::string id) {
    FUNC_SCOPE();
    auto impl = pImpl;
    co_await impl->removeServer(std::move(id));
}

boost::asio::awaitable<JSONValue> Host::ExecuteTool(ToolCall call) {
    FUNC_SCOPE();
    auto impl = pImpl;
    co_return co_await impl->executeTool(std::move(call));
}

boost::asio::awaitable<void> Host::Cleanup() {
    FUNC_SCOPE();
    auto impl = pImpl;
    co_await impl->cleanup();
}

std::vector<ServerSnapshot> Host::GetServers() const {
    std::vector<ServerSnapshot> out;
    out.reserve(pImpl->servers.size());
    for (const auto& [id, inst] : pImpl->servers) {
        out.push_back(inst->Snapshot());
    }
    return out;
}

std::optional<ServerSnapshot> Host::GetServer(const std::string& id) const {
    const ServerInstance* inst = std::as_const(*pImpl).find(id);
    if (inst == nullptr) {
        return std::nullopt;
    }
    return inst->Snapshot();
}

std::optional<ServerStatus> Host::GetServerStatus(const std::string& id) const {
    const ServerInstance* inst = std::as_const(*pImpl).find(id);
    if (inst == nullptr) {
        return std::nullopt;
    }
    return inst->status;
}

std::vector<Tool> Host::GetAllTools() const {
    std::vector<Tool> out;
    for (const auto& [id, inst] : pImpl->servers) {
        if (inst->status == ServerStatus::Running) {
            out.insert(out.end(), inst->tools.begin(), inst->tools.end());
        }
    }
    return out;
}

std::optional<Tool> Host::FindTool(const std::string& name, const std::optional<std::string>& serverId) const {
    for (const auto& [id, inst] : pImpl->servers) {
        if (serverId.has_value() && id != serverId.value()) {
            continue;
        }
        if (inst->status != ServerStatus::Running) {
            continue;
        }
        for (const auto& tool : inst->tools) {
            if (tool.name == name) {
                return tool;
            }
        }
    }
    return std::nullopt;
}

void Host::DeliverOutput(const std::string& serverId, std::string_view chunk) {
    ServerInstance* inst = pImpl->find(serverId);
    if (inst == nullptr) {
        throw errors::NotFoundError("Server '" + serverId + "' not found");
    }
    if (!inst->framer) {
        inst->framer = MakeNewlineFramer(pImpl->config.maxLineLength);
    }
    inst->inboundBuffer.append(chunk.data(), chunk.size());
    pImpl->drainLines(serverId, inst->generation);
}

std::size_t Host::PendingRequestCount() const {
    return pImpl->correlator.PendingCount();
}

} // namespace toolhost
