/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <mutex>
#include <vector>

#include "cascade/planner.hpp"
#include "cascade/progress.hpp"
#include "cascade/runner.hpp"
#include "cascade/types.hpp"

namespace cascade {

// One attempt of one job under a given profile.
using AttemptFn = std::function<AttemptRecord(const Job&, const JobResourceProfile&)>;

struct TierOutcome {
    std::vector<JobId> succeeded;          // tier 1 or 2
    std::vector<JobId> succeededDegraded;  // tier 3
    std::vector<JobId> failed;             // failed tier 3
    std::vector<JobId> unresolved;         // never finished because of cancellation
    std::vector<TierPlan> plans;
    std::vector<AttemptRecord> attempts;
    bool cancelled = false;
};

// Tier 1 runs in parallel, then failures retry one at a time with maximum
// resources (tier 2), then with minimal resources and reduced fidelity (tier 3).
class TierController final {
public:
    TierController(const Planner& planner, ProgressStore& store, AttemptFn attempt,
                   const CancellationToken& cancel) noexcept;

    TierController(const TierController&) = delete;
    TierController& operator=(const TierController&) = delete;

    // Updates each job's state as it moves through the tiers.
    [[nodiscard]] TierOutcome run(std::vector<Job>& pending);

private:
    // Returns the jobs that failed this tier, sorted by id.
    std::vector<Job*> runTier(Tier tier, const std::vector<Job*>& jobs, TierOutcome& outcome);

    const Planner& planner_;
    ProgressStore& store_;
    AttemptFn attempt_;
    const CancellationToken& cancel_;
    std::mutex outcomeMutex_;
};

}
