//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.cpp
// Purpose: fork/exec subprocess management on top of Boost.Asio descriptors
//==========================================================================================================

#include "toolhost/ChildProcess.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <deque>
#include <format>
#include <mutex>
#include <sstream>

#include <fcntl.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/asio/post.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {
int openPidfd(pid_t pid) {
#ifdef SYS_pidfd_open
    return static_cast<int>(::syscall(SYS_pidfd_open, pid, 0));
#else
    (void)pid;
    errno = ENOSYS;
    return -1;
#endif
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

ExitStatus decodeWaitStatus(int status) {
    ExitStatus s;
    if (WIFEXITED(status)) {
        s.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        s.signal = WTERMSIG(status);
    }
    return s;
}

// Blocking reap used after SIGKILL and after a failed exec
ExitStatus reapBlocking(pid_t pid) {
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r < 0) {
        LOG_WARN("waitpid({}) failed: {}", static_cast<int>(pid), std::strerror(errno));
        return ExitStatus{};
    }
    return decodeWaitStatus(status);
}
} // namespace

std::string ExitStatus::ToString() const {
    if (signal != 0) {
        const char* name = ::strsignal(signal);
        return std::format("terminated by signal {} ({})", signal, name ? name : "unknown");
    }
    return std::format("exited with code {}", exitCode);
}

//==========================================================================================================
// ChildProcess::Impl
//==========================================================================================================
class ChildProcess::Impl : public std::enable_shared_from_this<ChildProcess::Impl> {
public:
    explicit Impl(boost::asio::any_io_executor ex)
        : executor(ex), stdinPipe(ex), stdoutPipe(ex), stderrPipe(ex), pidfdStream(ex) {}

    boost::asio::any_io_executor executor;
    pid_t pid{-1};
    std::string command;

    boost::asio::posix::stream_descriptor stdinPipe;
    boost::asio::posix::stream_descriptor stdoutPipe;
    boost::asio::posix::stream_descriptor stderrPipe;
    boost::asio::posix::stream_descriptor pidfdStream;
    std::unique_ptr<boost::asio::signal_set> sigchld;

    std::optional<ExitStatus> exit;
    bool started{false};
    bool released{false};

    std::deque<std::string> writeQueue;
    bool writing{false};
    bool stdinBroken{false};
    bool stdinClosing{false};

    std::array<char, 64 * 1024> outBuf{};
    std::array<char, 16 * 1024> errBuf{};

    OutputHandler onStdout;
    OutputHandler onStderr;
    ExitHandler onExit;

    std::vector<std::shared_ptr<boost::asio::steady_timer>> exitWaiters;

    void readStdout() {
        auto self = shared_from_this();
        stdoutPipe.async_read_some(boost::asio::buffer(outBuf),
            [self](const boost::system::error_code& ec, std::size_t n) {
                if (self->released) return;
                if (n > 0 && self->onStdout) {
                    OutputHandler h = self->onStdout;
                    h(std::string_view(self->outBuf.data(), n));
                }
                if (ec) {
                    if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
                        LOG_WARN("stdout read from pid {} failed: {}", static_cast<int>(self->pid), ec.message());
                    }
                    return;
                }
                if (!self->released) self->readStdout();
            });
    }

    void readStderr() {
        auto self = shared_from_this();
        stderrPipe.async_read_some(boost::asio::buffer(errBuf),
            [self](const boost::system::error_code& ec, std::size_t n) {
                if (self->released) return;
                if (n > 0 && self->onStderr) {
                    OutputHandler h = self->onStderr;
                    h(std::string_view(self->errBuf.data(), n));
                }
                if (ec) {
                    if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
                        LOG_WARN("stderr read from pid {} failed: {}", static_cast<int>(self->pid), ec.message());
                    }
                    return;
                }
                if (!self->released) self->readStderr();
            });
    }

    void watchExit() {
        int fd = openPidfd(pid);
        if (fd >= 0) {
            pidfdStream.assign(fd);
            waitPidfd();
            return;
        }
        LOG_DEBUG("pidfd_open unavailable ({}); observing pid {} through SIGCHLD",
                  std::strerror(errno), static_cast<int>(pid));
        sigchld = std::make_unique<boost::asio::signal_set>(executor, SIGCHLD);
        waitSigchld();
        // The child may have exited before the signal handler was installed
        auto self = shared_from_this();
        boost::asio::post(executor, [self]() {
            if (!self->released && !self->exit) self->tryReap();
        });
    }

    void waitPidfd() {
        auto self = shared_from_this();
        pidfdStream.async_wait(boost::asio::posix::stream_descriptor::wait_read,
            [self](const boost::system::error_code& ec) {
                if (ec || self->released) return;
                if (!self->tryReap()) self->waitPidfd();
            });
    }

    void waitSigchld() {
        auto self = shared_from_this();
        sigchld->async_wait([self](const boost::system::error_code& ec, int) {
            if (ec || self->released) return;
            if (!self->tryReap()) self->waitSigchld();
        });
    }

    bool tryReap() {
        if (exit) return true;
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid, &status, WNOHANG);
        } while (r < 0 && errno == EINTR);
        if (r == 0) {
            return false;
        }
        if (r < 0) {
            LOG_WARN("waitpid({}) failed: {}", static_cast<int>(pid), std::strerror(errno));
            exit = ExitStatus{};
        } else {
            exit = decodeWaitStatus(status);
        }
        LOG_DEBUG("Process {} ({}) {}", static_cast<int>(pid), command, exit->ToString());
        stopObservers();
        if (onExit) {
            ExitHandler h = onExit;
            h(*exit);
        }
        return true;
    }

    void stopObservers() {
        boost::system::error_code ec;
        if (pidfdStream.is_open()) {
            pidfdStream.close(ec);
        }
        if (sigchld) {
            sigchld->cancel(ec);
        }
        for (auto& t : exitWaiters) {
            t->cancel();
        }
    }

    void write(std::string data) {
        if (released || exit.has_value() || stdinBroken || stdinClosing || !stdinPipe.is_open()) {
            throw errors::ProcessError(std::format("stdin of process {} ({}) is not writable",
                                                   static_cast<int>(pid), command));
        }
        writeQueue.push_back(std::move(data));
        if (!writing) {
            writeNext();
        }
    }

    void writeNext() {
        if (writeQueue.empty()) {
            writing = false;
            if (stdinClosing) {
                boost::system::error_code ec;
                stdinPipe.close(ec);
            }
            return;
        }
        writing = true;
        auto self = shared_from_this();
        boost::asio::async_write(stdinPipe, boost::asio::buffer(writeQueue.front()),
            [self](const boost::system::error_code& ec, std::size_t) {
                self->writeQueue.pop_front();
                if (self->released) return;
                if (ec) {
                    if (ec != boost::asio::error::operation_aborted) {
                        LOG_WARN("write to stdin of pid {} failed: {}", static_cast<int>(self->pid), ec.message());
                    }
                    self->stdinBroken = true;
                    self->writing = false;
                    return;
                }
                self->writeNext();
            });
    }

    void release() {
        if (released) return;
        released = true;
        onStdout = nullptr;
        onStderr = nullptr;
        onExit = nullptr;
        if (pid > 0 && !exit) {
            if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
                LOG_WARN("kill({}, SIGKILL) failed: {}", static_cast<int>(pid), std::strerror(errno));
            }
            exit = reapBlocking(pid);
            LOG_DEBUG("Released process {} ({}): {}", static_cast<int>(pid), command, exit->ToString());
        }
        boost::system::error_code ec;
        stdinPipe.close(ec);
        stdoutPipe.close(ec);
        stderrPipe.close(ec);
        stopObservers();
    }
};

//==========================================================================================================
// ChildProcess
//==========================================================================================================
ChildProcess::ChildProcess() = default;

ChildProcess::~ChildProcess() {
    if (pImpl) {
        pImpl->release();
    }
}

std::unique_ptr<ChildProcess> ChildProcess::Spawn(boost::asio::any_io_executor executor,
                                                  const SpawnOptions& options) {
    FUNC_SCOPE();
    IgnoreSigpipe();
    if (options.command.empty()) {
        throw errors::ProcessError("Cannot spawn an empty command");
    }

    // Everything the child touches is prepared before fork
    std::vector<std::string> argvStore;
    argvStore.reserve(options.args.size() + 1);
    argvStore.push_back(options.command);
    argvStore.insert(argvStore.end(), options.args.begin(), options.args.end());
    std::vector<char*> argv;
    for (auto& a : argvStore) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> envStore;
    envStore.reserve(options.environment.size());
    for (const auto& [k, v] : options.environment) envStore.push_back(k + "=" + v);
    std::vector<char*> envp;
    for (auto& e : envStore) envp.push_back(e.data());
    envp.push_back(nullptr);

    const char* workDir = options.workingDirectory ? options.workingDirectory->c_str() : nullptr;

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    auto closeAll = [&]() {
        for (int* p : {inPipe, outPipe, errPipe, statusPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };
    if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
        ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(statusPipe, O_CLOEXEC) != 0) {
        int e = errno;
        closeAll();
        throw errors::ProcessError(std::format("Failed to create pipes for '{}': {}",
                                               options.command, std::strerror(e)));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int e = errno;
        closeAll();
        throw errors::ProcessError(std::format("fork failed for '{}': {}", options.command, std::strerror(e)));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        struct sigaction dfl {};
        dfl.sa_handler = SIG_DFL;
        ::sigemptyset(&dfl.sa_mask);
        ::sigaction(SIGPIPE, &dfl, nullptr);
        sigset_t none;
        ::sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        auto redirect = [](int fd, int target) {
            if (fd == target) {
                ::fcntl(fd, F_SETFD, 0);
                return true;
            }
            return ::dup2(fd, target) >= 0;
        };
        auto reportAndExit = [&statusPipe]() {
            int e = errno;
            ssize_t w = ::write(statusPipe[1], &e, sizeof(e));
            (void)w;
            ::_exit(127);
        };
        if (!redirect(inPipe[0], STDIN_FILENO) || !redirect(outPipe[1], STDOUT_FILENO) ||
            !redirect(errPipe[1], STDERR_FILENO)) {
            reportAndExit();
        }
        if (workDir != nullptr && ::chdir(workDir) != 0) {
            reportAndExit();
        }
        environ = envp.data();
        ::execvp(argv[0], argv.data());
        reportAndExit();
    }

    // Parent
    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(statusPipe[1]);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
        LOG_WARN("Reading exec status of '{}' failed: {}", options.command, std::strerror(errno));
    }
    closeFd(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        reapBlocking(pid);
        closeAll();
        throw errors::ProcessError(std::format("Failed to start '{}': {}",
                                               options.command, std::strerror(childErrno)));
    }

    std::unique_ptr<ChildProcess> child(new ChildProcess());
    child->pImpl = std::make_shared<Impl>(executor);
    child->pImpl->pid = pid;
    child->pImpl->command = options.command;
    child->pImpl->stdinPipe.assign(inPipe[1]);
    inPipe[1] = -1;
    child->pImpl->stdoutPipe.assign(outPipe[0]);
    outPipe[0] = -1;
    child->pImpl->stderrPipe.assign(errPipe[0]);
    errPipe[0] = -1;
    LOG_INFO("Spawned '{}' as pid {}", options.command, static_cast<int>(pid));
    return child;
}

void ChildProcess::OnStdout(OutputHandler handler) { pImpl->onStdout = std::move(handler); }
void ChildProcess::OnStderr(OutputHandler handler) { pImpl->onStderr = std::move(handler); }
void ChildProcess::OnExit(ExitHandler handler) { pImpl->onExit = std::move(handler); }

void ChildProcess::Start() {
    FUNC_SCOPE();
    if (pImpl->started || pImpl->released) {
        return;
    }
    pImpl->started = true;
    pImpl->readStdout();
    pImpl->readStderr();
    pImpl->watchExit();
}

pid_t ChildProcess::Pid() const { return pImpl->pid; }
bool ChildProcess::HasExited() const { return pImpl->exit.has_value(); }
std::optional<ExitStatus> ChildProcess::Exit() const { return pImpl->exit; }

void ChildProcess::Write(std::string data) {
    pImpl->write(std::move(data));
}

void ChildProcess::CloseStdin() {
    pImpl->stdinClosing = true;
    if (!pImpl->writing) {
        boost::system::error_code ec;
        pImpl->stdinPipe.close(ec);
    }
}

bool ChildProcess::Signal(int signo) {
    if (pImpl->released || pImpl->exit.has_value() || pImpl->pid <= 0) {
        return false;
    }
    if (::kill(pImpl->pid, signo) != 0) {
        LOG_WARN("kill({}, {}) failed: {}", static_cast<int>(pImpl->pid), signo, std::strerror(errno));
        return false;
    }
    return true;
}

boost::asio::awaitable<bool> ChildProcess::WaitForExit(std::chrono::milliseconds timeout) {
    std::shared_ptr<Impl> impl = pImpl;
    if (impl->exit.has_value() || impl->released) {
        co_return impl->exit.has_value();
    }
    auto timer = std::make_shared<boost::asio::steady_timer>(impl->executor);
    timer->expires_after(timeout);
    impl->exitWaiters.push_back(timer);
    boost::system::error_code ec;
    co_await timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    std::erase(impl->exitWaiters, timer);
    co_return impl->exit.has_value();
}

void ChildProcess::Release() {
    FUNC_SCOPE();
    pImpl->release();
}

//==========================================================================================================
// Environment helpers
//==========================================================================================================
const std::vector<std::string>& StandardToolSearchPath() {
    static const std::vector<std::string> dirs = {
        "/usr/local/bin",
        "/opt/homebrew/bin",
        "/opt/homebrew/sbin",
        "/usr/bin",
        "/bin",
        "/usr/sbin",
        "/sbin",
        "/Applications/Xcode.app/Contents/Developer/usr/bin",
        "/Applications/Xcode.app/Contents/Developer/Toolchains/XcodeDefault.xctoolchain/usr/bin",
    };
    return dirs;
}

bool DefaultAugmentSearchPath() {
#if defined(__APPLE__)
    return true;
#else
    return false;
#endif
}

std::map<std::string, std::string> BuildChildEnvironment(
    const std::map<std::string, std::string>& base,
    const std::map<std::string, std::string>& overrides,
    bool augmentSearchPath) {
    std::map<std::string, std::string> env = base;
    for (const auto& [k, v] : overrides) {
        env[k] = v;
    }
    if (!augmentSearchPath) {
        return env;
    }

    std::vector<std::string> current;
    auto pathIt = env.find("PATH");
    if (pathIt != env.end()) {
        std::stringstream ss(pathIt->second);
        std::string part;
        while (std::getline(ss, part, ':')) {
            current.push_back(part);
        }
    }
    std::string path;
    for (const auto& dir : StandardToolSearchPath()) {
        if (std::find(current.begin(), current.end(), dir) == current.end()) {
            if (!path.empty()) path += ':';
            path += dir;
        }
    }
    for (const auto& dir : current) {
        if (!path.empty()) path += ':';
        path += dir;
    }
    env["PATH"] = path;

    auto fill = [&env](const char* key, const std::string& value) {
        auto it = env.find(key);
        if (it == env.end() || it->second.empty()) {
            env[key] = value;
        }
    };
    fill("USER", GetEnvOrDefault("USER", "unknown"));
    fill("HOME", GetEnvOrDefault("HOME", "/Users/" + env["USER"]));
    fill("TMPDIR", "/tmp");
    fill("SHELL", "/bin/zsh");
    fill("LOGNAME", env["USER"]);
    fill("LANG", "en_US.UTF-8");
    fill("TERM", "xterm-256color");
    return env;
}

void IgnoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, []() {
        struct sigaction ign {};
        ign.sa_handler = SIG_IGN;
        ::sigemptyset(&ign.sa_mask);
        if (::sigaction(SIGPIPE, &ign, nullptr) != 0) {
            LOG_WARN("Failed to ignore SIGPIPE: {}", std::strerror(errno));
        }
    });
}

} // namespace toolhost
