/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

namespace cascade {

// Environment-derived defaults; command-line flags override them.
struct Settings {
    std::filesystem::path basePath = "/data";
    int heartbeatSeconds = 60;
    int memoryReservePercent = 10;
    int parallelBatches = 1;
};

constexpr int kMinHeartbeatSeconds = 10;

[[nodiscard]] int env_int(const char* name, int defv) noexcept;
[[nodiscard]] std::string env_string(const char* name, const std::string& defv);

[[nodiscard]] Settings loadSettings();

// Parses a positive integer; false on junk, trailing characters or values <= 0.
[[nodiscard]] bool parsePositive(const std::string& text, int& out) noexcept;

}
