// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

#include <sys/stat.h>
#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcphub
{

namespace
{
    constexpr auto DefaultSearchPath = std::string_view { "/usr/local/bin:/usr/bin:/bin" };

    void ignoreSigPipe()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
    }

    auto isExecutableFile(const std::string& path) -> bool
    {
        struct stat st {};
        return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    /// Reads one newline-terminated line from @p fd into @p buffer, waking early when
    /// @p wakeFd becomes readable. Returns std::nullopt on EOF, error or wake-up.
    auto readLine(int fd, int wakeFd, std::string& buffer) -> std::optional<std::string>
    {
        while (true)
        {
            auto const newlinePos = buffer.find('\n');
            if (newlinePos != std::string::npos)
            {
                auto line = buffer.substr(0, newlinePos);
                buffer.erase(0, newlinePos + 1);
                return line;
            }

            auto fds = std::array<struct pollfd, 2> {};
            fds[0] = { .fd = fd, .events = POLLIN, .revents = 0 };
            fds[1] = { .fd = wakeFd, .events = POLLIN, .revents = 0 };

            auto const pollResult = ::poll(fds.data(), fds.size(), -1);
            if (pollResult < 0)
            {
                if (errno == EINTR)
                    continue;
                return std::nullopt;
            }

            if (fds[1].revents != 0)
                return std::nullopt;

            auto buf = std::array<char, 4096> {};
            auto const bytesRead = ::read(fd, buf.data(), buf.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead <= 0)
                return std::nullopt;
            buffer.append(buf.data(), static_cast<size_t>(bytesRead));
        }
    }
} // namespace

auto resolveExecutable(const std::string& command, const std::string& searchPath) -> Result<std::string>
{
    if (command.empty())
        return makeError(ErrorCode::LaunchError, "No command configured");

    if (command.find('/') != std::string::npos)
    {
        if (isExecutableFile(command))
            return command;
        return makeError(ErrorCode::LaunchError, std::format("Command not found or not executable: {}", command));
    }

    auto const path = searchPath.empty() ? std::string(DefaultSearchPath) : searchPath;
    size_t start = 0;
    while (start <= path.size())
    {
        auto end = path.find(':', start);
        if (end == std::string::npos)
            end = path.size();

        auto dir = path.substr(start, end - start);
        if (dir.empty())
            dir = ".";

        auto candidate = std::format("{}/{}", dir, command);
        if (isExecutableFile(candidate))
            return candidate;

        start = end + 1;
    }

    return makeError(ErrorCode::LaunchError, std::format("Command not found in PATH: {}", command));
}

struct StdioTransport::Impl
{
    StdioTransportConfig config;

    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
    std::array<int, 2> wakePipe { -1, -1 };

    std::atomic<bool> connected = false;
    std::mutex writeMutex;
    std::mutex lifecycleMutex;
    bool shutDown = false;

    std::string stdoutBuffer;
    std::string stderrBuffer;
};

StdioTransport::StdioTransport(StdioTransportConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

StdioTransport::~StdioTransport()
{
    close();
}

auto StdioTransport::open() -> VoidResult
{
    auto const& config = _impl->config;

    if (_impl->childPid > 0)
        return makeError(ErrorCode::LaunchError, "Transport already started");

    auto searchPath = std::string {};
    if (auto const it = config.env.find("PATH"); it != config.env.end())
        searchPath = it->second;
    else if (auto const* inherited = std::getenv("PATH"))
        searchPath = inherited;

    auto executable = resolveExecutable(config.command, searchPath);
    if (!executable)
        return std::unexpected(executable.error());

    if (!config.workingDirectory.empty())
    {
        struct stat st {};
        if (::stat(config.workingDirectory.c_str(), &st) != 0 || !S_ISDIR(st.st_mode))
            return makeError(ErrorCode::LaunchError,
                             std::format("Working directory does not exist: {}", config.workingDirectory));
    }

    ignoreSigPipe();

    // Every end is close-on-exec so that no child, including servers spawned concurrently,
    // inherits another server's pipes. The dup2 onto 0/1/2 clears the flag on the child's copies.
    int stdinPipe[2];
    int stdoutPipe[2];
    int stderrPipe[2];

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::LaunchError, "Failed to create stdin pipe");
    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::LaunchError, "Failed to create stdout pipe");
    }
    if (::pipe2(stderrPipe, O_CLOEXEC) != 0)
    {
        for (auto const fd: { stdinPipe[0], stdinPipe[1], stdoutPipe[0], stdoutPipe[1] })
            ::close(fd);
        return makeError(ErrorCode::LaunchError, "Failed to create stderr pipe");
    }
    if (::pipe2(_impl->wakePipe.data(), O_CLOEXEC) != 0)
    {
        for (auto const fd: { stdinPipe[0], stdinPipe[1], stdoutPipe[0], stdoutPipe[1], stderrPipe[0], stderrPipe[1] })
            ::close(fd);
        return makeError(ErrorCode::LaunchError, "Failed to create wake-up pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);
    if (!config.workingDirectory.empty())
        posix_spawn_file_actions_addchdir_np(&actions, config.workingDirectory.c_str());

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit + config overrides)
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto entry = std::string_view(*e);
            auto const key = entry.substr(0, entry.find('='));
            if (!config.env.contains(std::string(key)))
                envStrings.emplace_back(entry);
        }
    }
    for (const auto& [key, value]: config.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status = posix_spawn(&pid, executable->c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        ::close(stderrPipe[0]);
        closeFd(_impl->wakePipe[0]);
        closeFd(_impl->wakePipe[1]);
        return makeError(ErrorCode::LaunchError,
                         std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->stderrRead = stderrPipe[0];
    _impl->shutDown = false;
    _impl->connected = true;

    log::info("MCP server started: {} (pid {})", *executable, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    auto const lock = std::lock_guard(_impl->writeMutex);

    if (!_impl->connected || _impl->stdinWrite < 0)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const data = jsonrpc::encodeLine(message);
    size_t offset = 0;
    while (offset < data.size())
    {
        auto const result = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (result < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", strerror(errno)));
        }
        offset += static_cast<size_t>(result);
    }

    return {};
}

auto StdioTransport::receive() -> Result<nlohmann::json>
{
    if (_impl->stdoutRead < 0)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    // Read until we get a complete, non-empty line
    while (true)
    {
        auto line = readLine(_impl->stdoutRead, _impl->wakePipe[0], _impl->stdoutBuffer);
        if (!line)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, "Process stdout closed");
        }

        if (line->empty() || *line == "\r")
            continue;

        return jsonrpc::decodeLine(*line);
    }
}

auto StdioTransport::receiveDiagnostic() -> std::optional<std::string>
{
    if (_impl->stderrRead < 0)
        return std::nullopt;

    auto line = readLine(_impl->stderrRead, _impl->wakePipe[0], _impl->stderrBuffer);
    if (line && !line->empty() && line->back() == '\r')
        line->pop_back();
    return line;
}

void StdioTransport::shutdown()
{
    auto const lifecycleLock = std::lock_guard(_impl->lifecycleMutex);
    if (_impl->shutDown || _impl->childPid <= 0)
        return;
    _impl->shutDown = true;
    _impl->connected = false;

    {
        auto const lock = std::lock_guard(_impl->writeMutex);
        closeFd(_impl->stdinWrite);
    }

    auto const pid = _impl->childPid;
    ::kill(pid, SIGTERM);

    auto status = 0;
    auto reaped = false;
    auto const deadline = std::chrono::steady_clock::now() + _impl->config.stopGrace;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (::waitpid(pid, &status, WNOHANG) != 0)
        {
            reaped = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    if (!reaped)
    {
        log::warning("MCP server (pid {}) did not exit within {}ms, killing it",
                     pid,
                     _impl->config.stopGrace.count());
        ::kill(pid, SIGKILL);
        ::waitpid(pid, &status, 0);
    }

    _impl->childPid = -1;

    auto const wake = char { 1 };
    if (_impl->wakePipe[1] >= 0 && ::write(_impl->wakePipe[1], &wake, 1) < 0)
        log::warning("Failed to wake MCP transport readers: {}", strerror(errno));

    log::debug("MCP server (pid {}) stopped", pid);
}

void StdioTransport::close()
{
    shutdown();

    auto const lifecycleLock = std::lock_guard(_impl->lifecycleMutex);
    closeFd(_impl->stdoutRead);
    closeFd(_impl->stderrRead);
    closeFd(_impl->wakePipe[0]);
    closeFd(_impl->wakePipe[1]);
    _impl->stdoutBuffer.clear();
    _impl->stderrBuffer.clear();
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::processId() const -> int
{
    return _impl->childPid;
}

} // namespace mcphub
