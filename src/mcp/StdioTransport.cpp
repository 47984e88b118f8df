// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cstring>
#include <format>
#include <limits>
#include <map>
#include <optional>
#include <thread>
#include <utility>

#ifdef _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#else
    #include <sys/wait.h>

    #include <cerrno>
    #include <fcntl.h>
    #include <mutex>
    #include <poll.h>
    #include <signal.h>
    #include <spawn.h>
    #include <unistd.h>

extern char** environ;
#endif

namespace mcphub
{

namespace
{
    /// @brief Upper bound on the retained stderr output of a child.
    constexpr auto MaxStderrTail = size_t { 4096 };

    auto withDiagnostics(std::string_view stderrTail) -> std::string
    {
        if (stderrTail.empty())
            return {};
        return std::format(" (stderr: {})", stderrTail);
    }

#ifndef _WIN32
    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto makePipe(std::array<int, 2>& fds) -> bool
    {
    #if defined(__linux__)
        return pipe2(fds.data(), O_CLOEXEC) == 0;
    #else
        if (pipe(fds.data()) != 0)
            return false;
        fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        return true;
    #endif
    }

    void setNonBlocking(int fd)
    {
        auto const flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    /// @brief A write to a pipe whose reader has exited must fail with EPIPE, not kill us.
    void ignoreSigpipe()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { signal(SIGPIPE, SIG_IGN); });
    }

    auto describeExit(int status) -> std::string
    {
        if (WIFEXITED(status))
            return std::format("exited with code {}", WEXITSTATUS(status));
        if (WIFSIGNALED(status))
            return std::format("was killed by signal {}", WTERMSIG(status));
        return "terminated";
    }

    /// @brief Looks @p command up in a PATH taken from the configured environment overlay.
    /// A command containing a slash, or an overlay without PATH, is returned unchanged.
    auto resolveExecutable(const std::string& command, const std::map<std::string, std::string>& env)
        -> std::optional<std::string>
    {
        auto const path = env.find("PATH");
        if (path == env.end() || command.find('/') != std::string::npos)
            return command;

        auto remaining = std::string_view(path->second);
        while (true)
        {
            auto const separator = remaining.find(':');
            auto directory = remaining.substr(0, separator);
            if (directory.empty())
                directory = ".";

            auto const candidate = std::format("{}/{}", directory, command);
            if (access(candidate.c_str(), X_OK) == 0)
                return candidate;

            if (separator == std::string_view::npos)
                return std::nullopt;
            remaining.remove_prefix(separator + 1);
        }
    }
#endif
} // namespace

struct StdioTransport::Impl
{
    StdioTransportConfig config;
#ifdef _WIN32
    HANDLE childProcess = INVALID_HANDLE_VALUE;
    HANDLE stdinWrite = INVALID_HANDLE_VALUE;
    HANDLE stdoutRead = INVALID_HANDLE_VALUE;
#else
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
    std::optional<int> exitStatus;
#endif
    bool connected = false;
    std::string readBuffer;
    std::string stderrBuffer;

    [[nodiscard]] auto commandName() const -> std::string_view
    {
        return config.argv.empty() ? std::string_view("<none>") : std::string_view(config.argv.front());
    }

    void appendStderr(std::string_view chunk)
    {
        stderrBuffer.append(chunk);
        if (stderrBuffer.size() > MaxStderrTail)
            stderrBuffer.erase(0, stderrBuffer.size() - MaxStderrTail);
    }

#ifndef _WIN32
    void drainStderr()
    {
        auto buf = std::array<char, 1024> {};
        while (stderrRead >= 0)
        {
            auto const bytesRead = ::read(stderrRead, buf.data(), buf.size());
            if (bytesRead > 0)
            {
                appendStderr(std::string_view(buf.data(), static_cast<size_t>(bytesRead)));
                continue;
            }
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead == 0)
                closeFd(stderrRead);
            return;
        }
    }

    /// @brief Collects the child's exit status if it has terminated.
    /// @return True if there is no running child anymore.
    auto reap() -> bool
    {
        if (childPid <= 0)
            return true;

        auto status = 0;
        auto const result = waitpid(childPid, &status, WNOHANG);
        if (result == 0)
            return false;

        if (result == childPid)
            exitStatus = status;
        childPid = -1;
        return true;
    }

    void closeAll()
    {
        closeFd(stdinWrite);
        closeFd(stdoutRead);
        closeFd(stderrRead);
    }
#endif
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
    if (_impl->connected)
        return makeError(ErrorCode::LaunchError, "Transport already connected");

    auto const& config = _impl->config;
    if (config.argv.empty() || config.argv.front().empty())
        return makeError(ErrorCode::LaunchError, "No command configured");

    _impl->readBuffer.clear();
    _impl->stderrBuffer.clear();

#ifdef _WIN32
    SECURITY_ATTRIBUTES sa {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE stdinRead, stdinWrite, stdoutRead, stdoutWrite;
    if (!CreatePipe(&stdinRead, &stdinWrite, &sa, 0))
        return makeError(ErrorCode::LaunchError, "Failed to create stdin pipe");
    if (!CreatePipe(&stdoutRead, &stdoutWrite, &sa, 0))
    {
        CloseHandle(stdinRead);
        CloseHandle(stdinWrite);
        return makeError(ErrorCode::LaunchError, "Failed to create stdout pipe");
    }

    SetHandleInformation(stdinWrite, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(stdoutRead, HANDLE_FLAG_INHERIT, 0);

    auto cmdLine = std::string {};
    for (const auto& arg: config.argv)
    {
        if (!cmdLine.empty())
            cmdLine += ' ';
        cmdLine += arg.find(' ') != std::string::npos ? std::format("\"{}\"", arg) : arg;
    }

    // Environment block: inherited variables not overridden, then the overrides.
    auto envBlock = std::string {};
    if (auto* inherited = GetEnvironmentStringsA())
    {
        for (auto const* e = inherited; *e; e += std::strlen(e) + 1)
        {
            auto const entry = std::string_view(e);
            auto const key = std::string(entry.substr(0, entry.find('=', 1)));
            if (!config.env.contains(key))
                envBlock.append(entry).push_back('\0');
        }
        FreeEnvironmentStringsA(inherited);
    }
    for (const auto& [key, value]: config.env)
        envBlock.append(std::format("{}={}", key, value)).push_back('\0');
    envBlock.push_back('\0');

    STARTUPINFOA si {};
    si.cb = sizeof(si);
    si.hStdInput = stdinRead;
    si.hStdOutput = stdoutWrite;
    si.hStdError = GetStdHandle(STD_ERROR_HANDLE);
    si.dwFlags |= STARTF_USESTDHANDLES;

    PROCESS_INFORMATION pi {};
    if (!CreateProcessA(
            nullptr, cmdLine.data(), nullptr, nullptr, TRUE, 0, envBlock.data(), nullptr, &si, &pi))
    {
        CloseHandle(stdinRead);
        CloseHandle(stdinWrite);
        CloseHandle(stdoutRead);
        CloseHandle(stdoutWrite);
        return makeError(ErrorCode::LaunchError,
                         std::format("Failed to start process: {}", _impl->commandName()));
    }

    CloseHandle(stdinRead);
    CloseHandle(stdoutWrite);
    CloseHandle(pi.hThread);

    _impl->childProcess = pi.hProcess;
    _impl->stdinWrite = stdinWrite;
    _impl->stdoutRead = stdoutRead;

    auto const started = std::chrono::steady_clock::now();
    while (true)
    {
        auto const waited =
            WaitForSingleObject(_impl->childProcess, static_cast<DWORD>(config.probe.interval.count()));
        if (waited == WAIT_OBJECT_0)
        {
            DWORD exitCode = 0;
            GetExitCodeProcess(_impl->childProcess, &exitCode);
            CloseHandle(_impl->stdinWrite);
            CloseHandle(_impl->stdoutRead);
            CloseHandle(_impl->childProcess);
            _impl->stdinWrite = _impl->stdoutRead = _impl->childProcess = INVALID_HANDLE_VALUE;
            return makeError(
                ErrorCode::LaunchError,
                std::format("Process '{}' exited with code {} during startup", _impl->commandName(), exitCode));
        }
        auto const elapsed = std::chrono::steady_clock::now() - started;
        if (elapsed >= config.probe.settle || elapsed >= config.probe.window)
            break;
    }
#else
    ignoreSigpipe();

    auto const executable = resolveExecutable(config.argv.front(), config.env);
    if (!executable)
        return makeError(ErrorCode::LaunchError,
                         std::format("Executable '{}' not found in the configured PATH '{}'",
                                     config.argv.front(),
                                     config.env.at("PATH")));

    auto stdinPipe = std::array<int, 2> { -1, -1 };
    auto stdoutPipe = std::array<int, 2> { -1, -1 };
    auto stderrPipe = std::array<int, 2> { -1, -1 };
    auto const closePipes = [&] {
        for (auto* pipe: { &stdinPipe, &stdoutPipe, &stderrPipe })
        {
            closeFd((*pipe)[0]);
            closeFd((*pipe)[1]);
        }
    };

    if (!makePipe(stdinPipe) || !makePipe(stdoutPipe) || !makePipe(stderrPipe))
    {
        auto const reason = std::string(strerror(errno));
        closePipes();
        return makeError(ErrorCode::LaunchError, std::format("Failed to create pipes: {}", reason));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

    // Build argv
    auto argCopies = config.argv;
    auto argv = std::vector<char*> {};
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit + config overrides)
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            if (!config.env.contains(std::string(entry.substr(0, entry.find('=')))))
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
    auto const status = posix_spawnp(&pid, executable->c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    closeFd(stdinPipe[0]);
    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);

    if (status != 0)
    {
        closePipes();
        return makeError(
            ErrorCode::LaunchError,
            std::format("Failed to spawn process '{}': {}", _impl->commandName(), strerror(status)));
    }

    _impl->childPid = pid;
    _impl->exitStatus.reset();
    _impl->stdinWrite = std::exchange(stdinPipe[1], -1);
    _impl->stdoutRead = std::exchange(stdoutPipe[0], -1);
    _impl->stderrRead = std::exchange(stderrPipe[0], -1);
    setNonBlocking(_impl->stdoutRead);
    setNonBlocking(_impl->stderrRead);

    // The process is not ready just because it was spawned: watch it for a while.
    auto const started = std::chrono::steady_clock::now();
    while (true)
    {
        std::this_thread::sleep_for(config.probe.interval);
        _impl->drainStderr();

        if (_impl->reap())
        {
            _impl->drainStderr();
            auto const exitDescription =
                _impl->exitStatus ? describeExit(*_impl->exitStatus) : std::string("exited");
            auto const diagnostics = _impl->stderrBuffer;
            _impl->closeAll();
            return makeError(ErrorCode::LaunchError,
                             std::format("Process '{}' {} during startup{}",
                                         _impl->commandName(),
                                         exitDescription,
                                         withDiagnostics(diagnostics)));
        }

        auto const elapsed = std::chrono::steady_clock::now() - started;
        if (elapsed >= config.probe.settle || elapsed >= config.probe.window)
            break;
    }
#endif

    _impl->connected = true;
    log::info("MCP server process started: {}", _impl->commandName());
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const data = message.dump() + "\n";

#ifdef _WIN32
    DWORD written;
    if (!WriteFile(_impl->stdinWrite, data.c_str(), static_cast<DWORD>(data.size()), &written, nullptr))
    {
        _impl->connected = false;
        return makeError(ErrorCode::TransportError, "Failed to write to process stdin");
    }
#else
    auto offset = size_t { 0 };
    while (offset < data.size())
    {
        auto const result = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (result < 0)
        {
            if (errno == EINTR)
                continue;
            auto const reason = std::string(strerror(errno));
            _impl->connected = false;
            _impl->drainStderr();
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}{}",
                                         reason,
                                         withDiagnostics(_impl->stderrBuffer)));
        }
        offset += static_cast<size_t>(result);
    }
#endif

    log::trace("-> {}: {}", _impl->commandName(), data.substr(0, data.size() - 1));
    return {};
}

auto StdioTransport::receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const deadline = std::chrono::steady_clock::now() + timeout;

    // Read until we get a complete line
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

            log::trace("<- {}: {}", _impl->commandName(), line);
            auto parsed = json::parse(line);
            if (!parsed)
                return makeError(ErrorCode::ProtocolError,
                                 std::format("'{}' sent a non-JSON line: {}", _impl->commandName(), line));
            return parsed;
        }

        auto buf = std::array<char, 4096> {};
#ifdef _WIN32
        // No readiness polling for anonymous pipes: the read blocks until the server writes.
        (void) deadline;
        DWORD bytesRead;
        if (!ReadFile(_impl->stdoutRead, buf.data(), static_cast<DWORD>(buf.size()), &bytesRead, nullptr)
            || bytesRead == 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, "Process stdout closed");
        }
        _impl->readBuffer.append(buf.data(), bytesRead);
#else
        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return makeError(ErrorCode::TimeoutError,
                             std::format("No response from '{}' within {} ms",
                                         _impl->commandName(),
                                         timeout.count()));

        auto fds = std::array<pollfd, 2> {
            pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 },
            pollfd { .fd = _impl->stderrRead, .events = POLLIN, .revents = 0 },
        };
        auto const fdCount = _impl->stderrRead >= 0 ? nfds_t { 2 } : nfds_t { 1 };

        // poll() takes an int; longer deadlines are reached over several rounds.
        auto const pollTimeout =
            std::min<std::chrono::milliseconds::rep>(remaining.count(), std::numeric_limits<int>::max());
        auto const ready = ::poll(fds.data(), fdCount, static_cast<int>(pollTimeout));
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, std::format("poll() failed: {}", strerror(errno)));
        }
        if (ready == 0)
            continue;

        if (fdCount == 2 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) != 0)
            _impl->drainStderr();

        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
            continue;

        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead > 0)
        {
            _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
            continue;
        }
        if (bytesRead < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
            continue;

        _impl->connected = false;
        _impl->drainStderr();
        return makeError(ErrorCode::TransportError,
                         std::format("Process '{}' closed its stdout{}",
                                     _impl->commandName(),
                                     withDiagnostics(_impl->stderrBuffer)));
#endif
    }
}

void StdioTransport::close()
{
    _impl->connected = false;

#ifdef _WIN32
    if (_impl->stdinWrite != INVALID_HANDLE_VALUE)
    {
        CloseHandle(_impl->stdinWrite);
        _impl->stdinWrite = INVALID_HANDLE_VALUE;
    }
    if (_impl->childProcess != INVALID_HANDLE_VALUE)
    {
        if (WaitForSingleObject(_impl->childProcess, static_cast<DWORD>(_impl->config.shutdownGrace.count()))
            != WAIT_OBJECT_0)
        {
            TerminateProcess(_impl->childProcess, 1);
            WaitForSingleObject(_impl->childProcess, INFINITE);
        }
        CloseHandle(_impl->childProcess);
        _impl->childProcess = INVALID_HANDLE_VALUE;
    }
    if (_impl->stdoutRead != INVALID_HANDLE_VALUE)
    {
        CloseHandle(_impl->stdoutRead);
        _impl->stdoutRead = INVALID_HANDLE_VALUE;
    }
#else
    if (_impl->childPid <= 0 && _impl->stdinWrite < 0 && _impl->stdoutRead < 0 && _impl->stderrRead < 0)
        return;

    // Closing stdin is the polite request; well-behaved servers exit on EOF.
    closeFd(_impl->stdinWrite);

    if (_impl->childPid > 0 && !_impl->reap())
    {
        kill(_impl->childPid, SIGTERM);

        auto const deadline = std::chrono::steady_clock::now() + _impl->config.shutdownGrace;
        while (!_impl->reap() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(20));

        if (_impl->childPid > 0)
        {
            log::warning("MCP server '{}' ignored SIGTERM, killing it", _impl->commandName());
            kill(_impl->childPid, SIGKILL);
            auto status = 0;
            waitpid(_impl->childPid, &status, 0);
            _impl->exitStatus = status;
            _impl->childPid = -1;
        }
    }

    _impl->drainStderr();
    _impl->closeAll();
#endif

    _impl->readBuffer.clear();
    log::debug("MCP transport closed: {}", _impl->commandName());
}

auto StdioTransport::isConnected() const -> bool
{
    if (!_impl->connected)
        return false;

#ifdef _WIN32
    return WaitForSingleObject(_impl->childProcess, 0) == WAIT_TIMEOUT;
#else
    return !_impl->reap();
#endif
}

auto StdioTransport::stderrTail() const -> std::string
{
    return _impl->stderrBuffer;
}

} // namespace mcphub
