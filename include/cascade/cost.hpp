/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <vector>

namespace cascade {

// Threads chosen when at least minCpus usable CPUs are available.
struct ThreadBand {
    int minCpus = 0;
    int threads = 1;
};

struct CostParameters {
    std::vector<ThreadBand> bands;
    int defaultThreads = 2;
    std::int64_t fixedOverheadMiB = 0;
    std::int64_t baseWorkingMiB = 1024;
    std::int64_t perThreadMiB = 512;
    std::int64_t ceilingMinMiB = 2048;
    std::int64_t ceilingMaxMiB = 65536;
    int maxThreads = 16;
    int expansionCap = 12;
    int minimalThreads = 2;
};

// Per-stage resource heuristics. The scheduler only talks to this interface.
class CostModel {
public:
    virtual ~CostModel() = default;

    [[nodiscard]] virtual int threadsFor(int usableCpus) const noexcept = 0;
    [[nodiscard]] virtual std::int64_t memoryRequiredMiB(int threads) const noexcept = 0;
    [[nodiscard]] virtual std::int64_t memoryCeilingMiB(int parallelJobs,
                                                        std::int64_t usableMemoryMiB) const noexcept = 0;
    [[nodiscard]] virtual int maxThreads() const noexcept = 0;
    [[nodiscard]] virtual int expansionCap() const noexcept = 0;
    [[nodiscard]] virtual int minimalThreads() const noexcept = 0;
};

class BandedCostModel final : public CostModel {
public:
    explicit BandedCostModel(CostParameters params);

    [[nodiscard]] int threadsFor(int usableCpus) const noexcept override;
    [[nodiscard]] std::int64_t memoryRequiredMiB(int threads) const noexcept override;
    [[nodiscard]] std::int64_t memoryCeilingMiB(int parallelJobs,
                                                std::int64_t usableMemoryMiB) const noexcept override;
    [[nodiscard]] int maxThreads() const noexcept override { return params_.maxThreads; }
    [[nodiscard]] int expansionCap() const noexcept override { return params_.expansionCap; }
    [[nodiscard]] int minimalThreads() const noexcept override { return params_.minimalThreads; }

    [[nodiscard]] const CostParameters& parameters() const noexcept { return params_; }

private:
    CostParameters params_;
};

// Memory a shared on-disk resource (an index) occupies once loaded:
// size * factor rounded up to whole GiB, clamped to [minMiB, maxMiB].
// A missing or unreadable resource yields fallbackMiB.
[[nodiscard]] std::int64_t estimateFixedOverheadMiB(const std::filesystem::path& resource,
                                                    double factor = 2.0,
                                                    std::int64_t minMiB = 2048,
                                                    std::int64_t maxMiB = 32768,
                                                    std::int64_t fallbackMiB = 6144) noexcept;

[[nodiscard]] std::uintmax_t diskUsageBytes(const std::filesystem::path& path) noexcept;

}
