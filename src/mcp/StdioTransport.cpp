// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcphub
{

namespace
{

    /// @brief Grace period between SIGTERM and SIGKILL when closing.
    constexpr auto TerminateGracePeriod = std::chrono::milliseconds(500);

    void ignoreSigpipeOnce()
    {
        static auto flag = std::once_flag {};
        std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    /// @brief Parent environment merged with the configured overrides.
    auto buildEnvironment(const std::map<std::string, std::string>& overrides) -> std::vector<std::string>
    {
        auto merged = std::map<std::string, std::string> {};
        if (environ)
        {
            for (auto** e = environ; *e; ++e)
            {
                auto const entry = std::string_view(*e);
                auto const eq = entry.find('=');
                if (eq == std::string_view::npos)
                    continue;
                merged.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
            }
        }
        for (const auto& [key, value]: overrides)
            merged[key] = value;

        auto envStrings = std::vector<std::string> {};
        envStrings.reserve(merged.size());
        for (const auto& [key, value]: merged)
            envStrings.push_back(std::format("{}={}", key, value));
        return envStrings;
    }

    /// @brief Forwards the child's stderr to the debug log, one line at a time.
    void pumpStderr(const std::stop_token& stopToken, int fd, const std::string& name)
    {
        auto pending = std::string {};
        auto buf = std::array<char, 1024> {};

        while (!stopToken.stop_requested())
        {
            auto pfd = pollfd { .fd = fd, .events = POLLIN, .revents = 0 };
            auto const rc = ::poll(&pfd, 1, 100);
            if (rc < 0 && errno != EINTR)
                break;
            if (rc <= 0)
                continue;

            auto const n = ::read(fd, buf.data(), buf.size());
            if (n < 0 && (errno == EINTR || errno == EAGAIN))
                continue;
            if (n <= 0)
                break;

            pending.append(buf.data(), static_cast<size_t>(n));
            for (auto pos = pending.find('\n'); pos != std::string::npos; pos = pending.find('\n'))
            {
                if (pos > 0)
                    log::debug("[{} stderr] {}", name, pending.substr(0, pos));
                pending.erase(0, pos + 1);
            }
        }

        if (!pending.empty())
            log::debug("[{} stderr] {}", name, pending);
        ::close(fd);
    }

} // namespace

struct StdioTransport::Impl
{
    std::string name;
    pid_t childPid = -1;
    pid_t processGroup = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    std::atomic<bool> connected = false;
    std::string readBuffer;
    std::jthread stderrPump;

    /// @brief Signals the child's process group and reaps the child.
    /// The group is signalled even when the child itself was already reaped,
    /// so processes it left behind (e.g. node under npx) are terminated too.
    void terminateChild()
    {
        if (processGroup <= 0)
            return;

        ::kill(-processGroup, SIGTERM);

        auto const deadline = std::chrono::steady_clock::now() + TerminateGracePeriod;
        auto status = 0;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (childPid > 0)
            {
                auto const rc = ::waitpid(childPid, &status, WNOHANG);
                if (rc == childPid || (rc < 0 && errno == ECHILD))
                    childPid = -1;
            }
            if (childPid <= 0 && !processGroupExists())
            {
                processGroup = -1;
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        log::debug("MCP server '{}' did not exit after SIGTERM, sending SIGKILL", name);
        ::kill(-processGroup, SIGKILL);
        if (childPid > 0)
            ::waitpid(childPid, &status, 0);
        childPid = -1;
        processGroup = -1;
    }

    [[nodiscard]] auto processGroupExists() const -> bool
    {
        return ::kill(-processGroup, 0) == 0 || errno == EPERM;
    }
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    close();
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::ProcessSpawnFailed, "Transport already connected");

    ignoreSigpipeOnce();
    _impl->name = config.name.empty() ? config.command : config.name;

    auto const spawnError = [&](std::string_view what, int err) {
        return makeError(ErrorCode::ProcessSpawnFailed,
                         std::format("Failed to spawn '{}': {}: {}", config.command, what, std::strerror(err)));
    };

    // All pipe ends are close-on-exec; dup2 onto 0/1/2 clears the flag for the child's copies.
    int stdinPipe[2] = { -1, -1 };
    int stdoutPipe[2] = { -1, -1 };
    int stderrPipe[2] = { -1, -1 };
    auto const closeAll = [&] {
        for (auto* p: { stdinPipe, stdoutPipe, stderrPipe })
        {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0 || ::pipe2(stdoutPipe, O_CLOEXEC) != 0
        || ::pipe2(stderrPipe, O_CLOEXEC) != 0)
    {
        auto const err = errno;
        closeAll();
        return spawnError("cannot create pipes", err);
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

    // Own process group, so close() also reaches grandchildren (npx -> node, uvx -> python).
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attr, 0);

    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = buildEnvironment(config.env);
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, &attr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    closeFd(stdinPipe[0]);
    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);

    if (status != 0)
    {
        closeAll();
        return spawnError("posix_spawnp failed", status);
    }

    _impl->childPid = pid;
    _impl->processGroup = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->readBuffer.clear();
    _impl->stderrPump = std::jthread(
        [fd = stderrPipe[0], name = _impl->name](const std::stop_token& token) { pumpStderr(token, fd, name); });

    _impl->connected = true;
    log::info("MCP server '{}' started: {} (pid {})", _impl->name, config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::ConnectionFailed, std::format("Server '{}' is not connected", _impl->name));

    auto const data = message.dump() + "\n";
    log::trace("[{}] --> {}", _impl->name, message.dump());

    auto offset = size_t { 0 };
    while (offset < data.size())
    {
        auto const written = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
            {
                _impl->connected = false;
                return makeError(ErrorCode::ConnectionFailed,
                                 std::format("Server '{}' closed its stdin", _impl->name));
            }
            return makeError(ErrorCode::IoError,
                             std::format("Failed to write to server '{}': {}", _impl->name, std::strerror(errno)));
        }
        offset += static_cast<size_t>(written);
    }

    return {};
}

auto StdioTransport::receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return makeError(ErrorCode::ConnectionFailed, std::format("Server '{}' is not connected", _impl->name));

    auto const deadline = std::chrono::steady_clock::now() + timeout;

    // Read until we get a complete, non-empty line or the deadline passes.
    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                continue;

            log::trace("[{}] <-- {}", _impl->name, line);
            return json::parse(line);
        }

        auto const remaining =
            std::chrono::ceil<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return makeTimeoutError(std::format("waiting for response from server '{}'", _impl->name),
                                    static_cast<uint64_t>(timeout.count()));

        auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        auto const rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::IoError,
                             std::format("poll on server '{}' failed: {}", _impl->name, std::strerror(errno)));
        }
        if (rc == 0)
            continue;

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            return makeError(ErrorCode::IoError,
                             std::format("Failed to read from server '{}': {}", _impl->name, std::strerror(errno)));
        }
        if (bytesRead == 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::ConnectionFailed, std::format("Server '{}' closed connection", _impl->name));
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

void StdioTransport::close()
{
    if (!_impl->connected && _impl->processGroup <= 0 && _impl->stdinWrite < 0)
        return;

    _impl->connected = false;

    // EOF on stdin first, then terminate and reap.
    closeFd(_impl->stdinWrite);
    closeFd(_impl->stdoutRead);
    _impl->terminateChild();

    if (_impl->stderrPump.joinable())
    {
        _impl->stderrPump.request_stop();
        _impl->stderrPump.join();
    }

    log::debug("MCP server '{}' transport closed", _impl->name);
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::isAlive() -> bool
{
    if (_impl->childPid <= 0)
        return false;

    auto status = 0;
    auto const rc = ::waitpid(_impl->childPid, &status, WNOHANG);
    if (rc == 0)
        return _impl->connected;

    if (rc == _impl->childPid && WIFEXITED(status))
        log::warning("MCP server '{}' exited with status {}", _impl->name, WEXITSTATUS(status));
    else if (rc == _impl->childPid && WIFSIGNALED(status))
        log::warning("MCP server '{}' killed by signal {}", _impl->name, WTERMSIG(status));
    else
        log::warning("MCP server '{}' is no longer a child process", _impl->name);

    _impl->childPid = -1;
    _impl->connected = false;
    return false;
}

auto StdioTransport::pid() const -> int
{
    return _impl->childPid;
}

} // namespace mcphub
