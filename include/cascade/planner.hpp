/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "cascade/cost.hpp"
#include "cascade/resources.hpp"
#include "cascade/types.hpp"

namespace cascade {

enum class Binding : std::uint8_t { Cpu, Memory, Pending };

// How a tier will run. Reported and logged; the controller only reads
// parallelJobs and the derived profile.
struct TierPlan {
    Tier tier = Tier::One;
    int threadsPerJob = 1;
    int parallelJobs = 0;
    int cpuBound = 0;
    int memoryBound = 0;
    Binding binding = Binding::Pending;
    std::int64_t memoryPerJobMiB = 0;
    std::int64_t memoryCeilingMiB = 0;
    FidelityMode fidelity = FidelityMode::Full;
    bool expanded = false;

    [[nodiscard]] JobResourceProfile profile() const noexcept;
};

struct Concurrency {
    int parallelJobs = 0;
    int cpuBound = 0;
    int memoryBound = 0;
    Binding binding = Binding::Pending;
};

class Planner final {
public:
    Planner(const ResourceBudget& budget, const CostModel& cost) noexcept;

    // min(cpu bound, memory bound, pending); 0 when nothing is pending.
    [[nodiscard]] static Concurrency concurrency(std::size_t pending, int threadsPerJob,
                                                 int usableCpus, std::int64_t usableMemoryMiB,
                                                 std::int64_t memoryPerJobMiB) noexcept;

    [[nodiscard]] TierPlan planTier(Tier tier, std::size_t pending) const noexcept;

    // Tier-1 thread count forced by the operator. Disables re-expansion.
    void overrideThreads(std::optional<int> threads) noexcept { threadsOverride_ = threads; }

private:
    [[nodiscard]] TierPlan planParallel(std::size_t pending) const noexcept;
    [[nodiscard]] TierPlan planSequential(Tier tier, std::size_t pending) const noexcept;

    ResourceBudget budget_;
    const CostModel& cost_;
    std::optional<int> threadsOverride_;
};

[[nodiscard]] const char* bindingToString(Binding binding) noexcept;
[[nodiscard]] std::string describePlan(const TierPlan& plan);

}
