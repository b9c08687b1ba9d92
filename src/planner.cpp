/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/planner.hpp"
#include "cascade/logger.hpp"
#include <algorithm>
#include <sstream>

namespace cascade {

JobResourceProfile TierPlan::profile() const noexcept {
    JobResourceProfile p;
    p.tier = tier;
    p.threads = threadsPerJob;
    p.memoryRequiredMiB = memoryPerJobMiB;
    p.memoryCeilingMiB = memoryCeilingMiB;
    p.fidelity = fidelity;
    return p;
}

Planner::Planner(const ResourceBudget& budget, const CostModel& cost) noexcept
    : budget_(budget), cost_(cost) {
}

Concurrency Planner::concurrency(std::size_t pending, int threadsPerJob, int usableCpus,
                                 std::int64_t usableMemoryMiB,
                                 std::int64_t memoryPerJobMiB) noexcept {
    Concurrency c;
    c.cpuBound = std::max(1, usableCpus / std::max(1, threadsPerJob));
    c.memoryBound = static_cast<int>(std::max<std::int64_t>(
        1, usableMemoryMiB / std::max<std::int64_t>(1, memoryPerJobMiB)));

    int hardware = std::min(c.cpuBound, c.memoryBound);
    c.binding = c.memoryBound < c.cpuBound ? Binding::Memory : Binding::Cpu;

    if (pending < static_cast<std::size_t>(hardware)) {
        c.parallelJobs = static_cast<int>(pending);
        c.binding = Binding::Pending;
    } else {
        c.parallelJobs = hardware;
    }
    return c;
}

TierPlan Planner::planTier(Tier tier, std::size_t pending) const noexcept {
    return tier == Tier::One ? planParallel(pending) : planSequential(tier, pending);
}

TierPlan Planner::planParallel(std::size_t pending) const noexcept {
    TierPlan plan;
    plan.tier = Tier::One;
    plan.threadsPerJob = threadsOverride_ ? *threadsOverride_ : cost_.threadsFor(budget_.usableCpus);
    plan.memoryPerJobMiB = cost_.memoryRequiredMiB(plan.threadsPerJob);

    Concurrency c = concurrency(pending, plan.threadsPerJob, budget_.usableCpus,
                                budget_.usableMemoryMiB, plan.memoryPerJobMiB);
    plan.parallelJobs = c.parallelJobs;
    plan.cpuBound = c.cpuBound;
    plan.memoryBound = c.memoryBound;
    plan.binding = c.binding;

    // A lone job gets the idle cores, as far as memory allows
    if (plan.parallelJobs == 1 && !threadsOverride_) {
        int cap = std::min(budget_.usableCpus, cost_.expansionCap());
        for (int t = cap; t > plan.threadsPerJob; --t) {
            if (cost_.memoryRequiredMiB(t) <= budget_.usableMemoryMiB) {
                LOG_DEBUG("Single job: raising threads " + std::to_string(plan.threadsPerJob) +
                          " -> " + std::to_string(t));
                plan.threadsPerJob = t;
                plan.memoryPerJobMiB = cost_.memoryRequiredMiB(t);
                plan.expanded = true;
                break;
            }
        }
    }

    plan.memoryCeilingMiB = cost_.memoryCeilingMiB(std::max(1, plan.parallelJobs),
                                                   budget_.usableMemoryMiB);
    return plan;
}

TierPlan Planner::planSequential(Tier tier, std::size_t pending) const noexcept {
    TierPlan plan;
    plan.tier = tier;
    if (tier == Tier::Two) {
        plan.threadsPerJob = std::max(cost_.minimalThreads(),
                                      std::min(budget_.usableCpus, cost_.maxThreads()));
    } else {
        plan.threadsPerJob = cost_.minimalThreads();
        plan.fidelity = FidelityMode::Reduced;
    }
    plan.memoryPerJobMiB = cost_.memoryRequiredMiB(plan.threadsPerJob);
    plan.parallelJobs = pending > 0 ? 1 : 0;
    plan.cpuBound = 1;
    plan.memoryBound = 1;
    plan.binding = pending > 0 ? Binding::Cpu : Binding::Pending;
    plan.memoryCeilingMiB = cost_.memoryCeilingMiB(1, budget_.usableMemoryMiB);
    return plan;
}

const char* bindingToString(Binding binding) noexcept {
    switch (binding) {
        case Binding::Cpu: return "cpu";
        case Binding::Memory: return "memory";
        case Binding::Pending: return "pending";
        default: return "unknown";
    }
}

std::string describePlan(const TierPlan& plan) {
    std::ostringstream oss;
    oss << "tier " << tierNumber(plan.tier) << ": " << plan.parallelJobs << " parallel x "
        << plan.threadsPerJob << " threads, ~" << plan.memoryPerJobMiB << " MiB/job, ceiling "
        << plan.memoryCeilingMiB << " MiB, " << fidelityToString(plan.fidelity) << " fidelity";
    if (plan.tier == Tier::One) {
        oss << " (cpu bound " << plan.cpuBound << ", memory bound " << plan.memoryBound
            << ", bound by " << bindingToString(plan.binding) << ")";
    }
    if (plan.expanded) {
        oss << " [threads re-expanded]";
    }
    return oss.str();
}

}
