/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/runner.hpp"
#include "cascade/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <fstream>
#include <sstream>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace cascade {

namespace {
constexpr auto kPollInterval = std::chrono::milliseconds(100);

// Closes a descriptor on scope exit.
struct FdGuard {
    int fd = -1;
    ~FdGuard() {
        if (fd >= 0) {
            ::close(fd);
        }
    }
};

void writeAll(int fd, const std::string& text) noexcept {
    const char* data = text.data();
    std::size_t left = text.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        data += n;
        left -= static_cast<std::size_t>(n);
    }
}

std::vector<std::string> buildEnvironment(const RunRequest& request) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        bool overridden = std::any_of(request.environment.begin(), request.environment.end(),
                                      [&](const auto& kv) { return kv.first == key; });
        if (!overridden) {
            env.push_back(std::move(entry));
        }
    }
    for (const auto& kv : request.environment) {
        env.push_back(kv.first + "=" + kv.second);
    }
    return env;
}

std::vector<char*> toCArray(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}
}

Runner::Runner(std::chrono::milliseconds killGrace) noexcept : killGrace_(killGrace) {
}

RunResult Runner::run(const RunRequest& request, const CancellationToken& cancel) const noexcept {
    RunResult aggregate;
    try {
        if (request.commands.empty()) {
            aggregate.error = "no commands to run";
            return aggregate;
        }

        if (request.logPath.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(request.logPath.parent_path(), ec);
            if (ec) {
                aggregate.error = "cannot create log directory: " + ec.message();
                return aggregate;
            }
        }

        FdGuard log;
        log.fd = ::open(request.logPath.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (log.fd < 0) {
            aggregate.error = "cannot open log " + request.logPath.string() + ": " + std::strerror(errno);
            return aggregate;
        }

        for (const auto& command : request.commands) {
            if (cancel.cancelled()) {
                aggregate.ok = false;
                aggregate.cancelled = true;
                aggregate.error = "cancelled";
                return aggregate;
            }

            RunResult step = runCommand(request, command, log.fd, cancel);
            if (step.peakMemoryMiB) {
                aggregate.peakMemoryMiB = std::max(aggregate.peakMemoryMiB.value_or(0), *step.peakMemoryMiB);
            }
            aggregate.exitCode = step.exitCode;
            aggregate.signal = step.signal;
            aggregate.cancelled = step.cancelled;
            if (!step.ok) {
                aggregate.ok = false;
                aggregate.error = step.error;
                return aggregate;
            }
        }

        aggregate.ok = true;
        return aggregate;
    } catch (const std::exception& e) {
        LOG_ERROR("Runner error (" + request.label + "): " + std::string(e.what()));
        aggregate.ok = false;
        aggregate.error = e.what();
        return aggregate;
    }
}

RunResult Runner::runCommand(const RunRequest& request, const Command& command, int logFd,
                             const CancellationToken& cancel) const {
    RunResult result;
    if (command.argv.empty()) {
        result.error = "empty command";
        return result;
    }

    writeAll(logFd, "$ " + joinCommand(command) + "\n");

    // Everything the child touches is prepared before fork
    std::vector<std::string> args = command.argv;
    std::vector<char*> argv = toCArray(args);
    std::vector<std::string> envStrings = buildEnvironment(request);
    std::vector<char*> envp = toCArray(envStrings);
    std::string workDir = command.workingDir.string();

    FdGuard devnull;
    devnull.fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);
        if (devnull.fd >= 0) {
            ::dup2(devnull.fd, STDIN_FILENO);
        }
        ::dup2(logFd, STDOUT_FILENO);
        ::dup2(logFd, STDERR_FILENO);
        if (!workDir.empty() && ::chdir(workDir.c_str()) != 0) {
            static const char msg[] = "cascade: cannot enter working directory\n";
            (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
            ::_exit(126);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        static const char msg[] = "cascade: exec failed\n";
        (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        ::_exit(127);
    }

    ::setpgid(pid, pid);

    auto start = std::chrono::steady_clock::now();
    auto nextHeartbeat = start + std::chrono::seconds(request.heartbeatSeconds);
    std::optional<std::chrono::steady_clock::time_point> killDeadline;
    bool killed = false;

    int status = 0;
    struct rusage usage;
    std::memset(&usage, 0, sizeof(usage));

    while (true) {
        pid_t r = ::wait4(pid, &status, WNOHANG, &usage);
        if (r == pid) {
            break;
        }
        if (r < 0 && errno != EINTR) {
            result.error = std::string("wait failed: ") + std::strerror(errno);
            ::kill(-pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            return result;
        }

        auto now = std::chrono::steady_clock::now();
        if (cancel.cancelled() && !killDeadline) {
            LOG_WARN("Terminating " + request.label + " (cancelled)");
            ::kill(-pid, SIGTERM);
            killDeadline = now + killGrace_;
            result.cancelled = true;
        }
        if (killDeadline && !killed && now >= *killDeadline) {
            LOG_WARN("Killing " + request.label + " after grace period");
            ::kill(-pid, SIGKILL);
            killed = true;
        }
        if (request.heartbeatSeconds > 0 && now >= nextHeartbeat) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - start).count();
            LOG_INFO(request.label + " still running (" + std::to_string(elapsed) + "s)");
            nextHeartbeat = now + std::chrono::seconds(request.heartbeatSeconds);
        }

        std::this_thread::sleep_for(kPollInterval);
    }

    // ru_maxrss is in KiB on Linux; zero means the kernel did not report it
    if (usage.ru_maxrss > 0) {
        result.peakMemoryMiB = static_cast<std::int64_t>(usage.ru_maxrss) / 1024;
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        result.ok = result.exitCode == 0 && !result.cancelled;
        if (result.exitCode != 0) {
            result.error = argv[0] + std::string(" exited with code ") + std::to_string(result.exitCode);
        }
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exitCode = 128 + result.signal;
        result.error = argv[0] + std::string(" killed by signal ") + std::to_string(result.signal);
    }
    if (result.cancelled) {
        result.ok = false;
        result.error = "cancelled";
    }
    return result;
}

std::string tailLines(const std::filesystem::path& path, std::size_t n) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file || n == 0) {
            return "";
        }

        constexpr std::streamoff kWindow = 64 * 1024;
        file.seekg(0, std::ios::end);
        std::streamoff size = file.tellg();
        std::streamoff begin = std::max<std::streamoff>(0, size - kWindow);
        file.seekg(begin);

        std::deque<std::string> lines;
        std::string line;
        bool first = begin > 0;
        while (std::getline(file, line)) {
            if (first) {
                first = false;  // partial line
                continue;
            }
            lines.push_back(line);
            if (lines.size() > n) {
                lines.pop_front();
            }
        }

        std::ostringstream oss;
        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) oss << '\n';
            oss << lines[i];
        }
        return oss.str();
    } catch (const std::exception& e) {
        LOG_DEBUG("Cannot read tail of " + path.string() + ": " + std::string(e.what()));
        return "";
    }
}

std::optional<std::filesystem::path> findExecutable(const std::string& name) noexcept {
    try {
        if (name.empty()) {
            return std::nullopt;
        }
        if (name.find('/') != std::string::npos) {
            if (::access(name.c_str(), X_OK) == 0) {
                return std::filesystem::path(name);
            }
            return std::nullopt;
        }

        const char* pathEnv = std::getenv("PATH");
        std::string paths = pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin";
        std::istringstream in(paths);
        std::string dir;
        while (std::getline(in, dir, ':')) {
            if (dir.empty()) dir = ".";
            std::filesystem::path candidate = std::filesystem::path(dir) / name;
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec) &&
                ::access(candidate.c_str(), X_OK) == 0) {
                return candidate;
            }
        }
        return std::nullopt;
    } catch (const std::exception& e) {
        LOG_DEBUG("Executable lookup failed for " + name + ": " + std::string(e.what()));
        return std::nullopt;
    }
}

std::string joinCommand(const Command& command) {
    std::string out;
    for (const auto& arg : command.argv) {
        if (!out.empty()) out += ' ';
        bool quote = arg.empty() || arg.find_first_of(" \t'\"") != std::string::npos;
        out += quote ? "'" + arg + "'" : arg;
    }
    return out;
}

}
