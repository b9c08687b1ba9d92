/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace cascade {

// Raw host capacity as seen by the probe.
struct HostTotals {
    int cpus = 0;
    std::int64_t totalMemoryMiB = 0;
    std::int64_t availableMemoryMiB = 0;
    bool probed = false;  // false when the documented defaults were used
};

// Immutable snapshot of what one batch may consume.
struct ResourceBudget {
    int totalCpus = 0;
    int reservedCpus = 0;
    int usableCpus = 0;
    std::int64_t totalMemoryMiB = 0;
    std::int64_t availableMemoryMiB = 0;
    std::int64_t reservedMemoryMiB = 0;
    std::int64_t usableMemoryMiB = 0;
    int parallelBatches = 1;
};

struct MemInfo {
    std::optional<std::int64_t> totalKiB;
    std::optional<std::int64_t> availableKiB;
};

class ResourceProbe final {
public:
    static constexpr int kFallbackCpus = 4;
    static constexpr std::int64_t kFallbackTotalMiB = 8192;
    static constexpr std::int64_t kFallbackAvailableMiB = 6144;
    static constexpr int kMinUsableCpus = 2;

    // Never fails: falls back to the defaults above with a warning.
    [[nodiscard]] static HostTotals probeHost() noexcept;

    [[nodiscard]] static ResourceBudget budget(const HostTotals& host, int parallelBatches = 1,
                                               int memoryReservePercent = 10) noexcept;

    [[nodiscard]] static int cpuReserve(int cpus) noexcept;

    // Parses /proc/meminfo formatted text.
    [[nodiscard]] static MemInfo parseMemInfo(const std::string& text) noexcept;

    // Free space on the filesystem holding path, in MiB.
    [[nodiscard]] static std::optional<std::int64_t> freeDiskMiB(const std::filesystem::path& path) noexcept;
};

[[nodiscard]] std::string describeBudget(const ResourceBudget& budget);

}
