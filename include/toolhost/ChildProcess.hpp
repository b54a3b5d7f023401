//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.hpp
// Purpose: Scoped subprocess with asynchronous stdio pipes and exit observation
//==========================================================================================================
#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sys/types.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

namespace toolhost {

//==========================================================================================================
// SpawnOptions
// Purpose: Everything needed to launch one subprocess.
// Fields:
//   command: Program name or path; resolved through PATH of `environment` when it has no '/'.
//   args: Arguments after argv[0].
//   environment: Complete child environment (see BuildChildEnvironment).
//   workingDirectory: Directory to chdir into before exec; inherits the host's when unset.
//==========================================================================================================
struct SpawnOptions {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> environment;
    std::optional<std::string> workingDirectory;
};

struct ExitStatus {
    int exitCode{-1};   // valid when signal == 0
    int signal{0};      // terminating signal, 0 for a normal exit

    std::string ToString() const;
};

//==========================================================================================================
// ChildProcess
// Purpose: Owns one spawned subprocess and its three pipes.
// Notes:
//   Destruction (or Release) kills a still-running child with SIGKILL, reaps it and closes every
//   descriptor; handlers are never invoked afterwards.
//   All methods and handlers run on the executor given to Spawn.
//==========================================================================================================
class ChildProcess {
public:
    using OutputHandler = std::function<void(std::string_view chunk)>;
    using ExitHandler = std::function<void(const ExitStatus& status)>;

    //==========================================================================================================
    // Spawn
    // Purpose: fork/exec the command with stdin, stdout and stderr connected to pipes.
    // Returns:
    //   A live process. Throws errors::ProcessError when pipes cannot be created, fork fails or
    //   exec fails in the child (the errno text is carried in the message).
    //==========================================================================================================
    static std::unique_ptr<ChildProcess> Spawn(boost::asio::any_io_executor executor,
                                               const SpawnOptions& options);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Register handlers, then call Start() to begin reading and exit observation.
    void OnStdout(OutputHandler handler);
    void OnStderr(OutputHandler handler);
    void OnExit(ExitHandler handler);
    void Start();

    pid_t Pid() const;
    bool HasExited() const;
    std::optional<ExitStatus> Exit() const;

    //==========================================================================================================
    // Write
    // Purpose: Queues bytes for the child's stdin; writes are issued one at a time.
    // Throws errors::ProcessError when stdin is closed, broken or the child has exited.
    //==========================================================================================================
    void Write(std::string data);
    void CloseStdin();

    // Sends a signal; returns false when the child is already reaped or kill() fails.
    bool Signal(int signo);

    // Suspends until the child exits or the timeout elapses; returns true when it has exited.
    boost::asio::awaitable<bool> WaitForExit(std::chrono::milliseconds timeout);

    void Release();

private:
    ChildProcess();

    class Impl;
    std::shared_ptr<Impl> pImpl;
};

//==========================================================================================================
// BuildChildEnvironment
// Purpose: Overlays per-server overrides onto the host environment.
// Args:
//   base: Host environment (usually SnapshotEnvironment()).
//   overrides: ServerConfig env entries; they win over base.
//   augmentSearchPath: Prepend standard tool directories to PATH (skipping ones already present)
//                      and fill HOME, TMPDIR, USER, SHELL, LOGNAME, LANG and TERM when missing.
//==========================================================================================================
std::map<std::string, std::string> BuildChildEnvironment(
    const std::map<std::string, std::string>& base,
    const std::map<std::string, std::string>& overrides,
    bool augmentSearchPath);

// Directories prepended to PATH when augmentation is on.
const std::vector<std::string>& StandardToolSearchPath();

// True on platforms where packaged apps start with a minimal PATH (macOS).
bool DefaultAugmentSearchPath();

// Ignores SIGPIPE process-wide (once) so a dead child surfaces as a write error.
void IgnoreSigpipe();

} // namespace toolhost
