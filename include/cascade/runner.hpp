/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cascade {

struct Command {
    std::vector<std::string> argv;
    std::filesystem::path workingDir;
};

struct RunRequest {
    std::string label;
    std::vector<Command> commands;  // run in order, stop at the first failure
    std::filesystem::path logPath;  // stdout and stderr of every command, appended
    std::vector<std::pair<std::string, std::string>> environment;
    int heartbeatSeconds = 60;
};

struct RunResult {
    bool ok = false;
    int exitCode = -1;
    int signal = 0;
    bool cancelled = false;
    std::optional<std::int64_t> peakMemoryMiB;  // unknown when the OS did not report it
    std::string error;

    explicit operator bool() const noexcept { return ok; }
};

class CancellationToken final {
public:
    void cancel() noexcept { cancelled_.store(true); }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Spawns external tools in their own process group and supervises them.
class Runner final {
public:
    explicit Runner(std::chrono::milliseconds killGrace = std::chrono::seconds(10)) noexcept;

    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;

    [[nodiscard]] RunResult run(const RunRequest& request, const CancellationToken& cancel) const noexcept;

private:
    [[nodiscard]] RunResult runCommand(const RunRequest& request, const Command& command,
                                       int logFd, const CancellationToken& cancel) const;

    std::chrono::milliseconds killGrace_;
};

// Last n lines of a (possibly large) text file.
[[nodiscard]] std::string tailLines(const std::filesystem::path& path, std::size_t n) noexcept;

// Resolves name against PATH unless it already contains a slash.
[[nodiscard]] std::optional<std::filesystem::path> findExecutable(const std::string& name) noexcept;

[[nodiscard]] std::string joinCommand(const Command& command);

}
