/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/tiers.hpp"
#include "cascade/logger.hpp"
#include "cascade/pool.hpp"
#include <algorithm>
#include <set>
#include <unordered_map>

namespace cascade {

TierController::TierController(const Planner& planner, ProgressStore& store, AttemptFn attempt,
                               const CancellationToken& cancel) noexcept
    : planner_(planner), store_(store), attempt_(std::move(attempt)), cancel_(cancel) {
}

TierOutcome TierController::run(std::vector<Job>& pending) {
    TierOutcome outcome;

    std::vector<Job*> tier1;
    std::vector<Job*> resumedTier2;
    std::vector<Job*> resumedTier3;
    for (auto& job : pending) {
        job.state = JobState::Pending;
        switch (store_.resumeTier(job.id)) {
            case Tier::Two: resumedTier2.push_back(&job); break;
            case Tier::Three: resumedTier3.push_back(&job); break;
            default: tier1.push_back(&job); break;
        }
    }
    if (!resumedTier2.empty() || !resumedTier3.empty()) {
        LOG_INFO("Resuming " + std::to_string(resumedTier2.size()) + " job(s) at tier 2 and " +
                 std::to_string(resumedTier3.size()) + " at tier 3");
    }

    auto merge = [](std::vector<Job*> a, const std::vector<Job*>& b) {
        a.insert(a.end(), b.begin(), b.end());
        std::sort(a.begin(), a.end(), [](const Job* x, const Job* y) { return x->id < y->id; });
        return a;
    };

    std::vector<Job*> failed1 = runTier(Tier::One, tier1, outcome);
    std::vector<Job*> failed2 = runTier(Tier::Two, merge(failed1, resumedTier2), outcome);
    std::vector<Job*> failed3 = runTier(Tier::Three, merge(failed2, resumedTier3), outcome);

    for (Job* job : failed3) {
        job->state = JobState::Failed;
        outcome.failed.push_back(job->id);
    }

    std::set<JobId> resolved(outcome.succeeded.begin(), outcome.succeeded.end());
    resolved.insert(outcome.succeededDegraded.begin(), outcome.succeededDegraded.end());
    resolved.insert(outcome.failed.begin(), outcome.failed.end());
    for (const auto& job : pending) {
        if (resolved.count(job.id) == 0) {
            outcome.unresolved.push_back(job.id);
        }
    }

    outcome.cancelled = cancel_.cancelled();
    std::sort(outcome.succeeded.begin(), outcome.succeeded.end());
    std::sort(outcome.succeededDegraded.begin(), outcome.succeededDegraded.end());
    std::sort(outcome.failed.begin(), outcome.failed.end());
    return outcome;
}

std::vector<Job*> TierController::runTier(Tier tier, const std::vector<Job*>& jobs,
                                          TierOutcome& outcome) {
    std::vector<Job*> failures;
    const int n = tierNumber(tier);

    if (jobs.empty()) {
        LOG_DEBUG("Tier " + std::to_string(n) + ": nothing to do");
        return failures;
    }
    if (cancel_.cancelled()) {
        LOG_WARN("Tier " + std::to_string(n) + " skipped (cancelled), " +
                 std::to_string(jobs.size()) + " job(s) left for a later run");
        return failures;
    }

    TierPlan plan = planner_.planTier(tier, jobs.size());
    outcome.plans.push_back(plan);
    LOG_INFO("Planning " + std::to_string(jobs.size()) + " job(s), " + describePlan(plan));

    const JobResourceProfile profile = plan.profile();
    std::unordered_map<JobId, Job*> byId;
    for (Job* job : jobs) {
        byId.emplace(job->id, job);
    }

    Pool pool(plan.parallelJobs, "T" + std::to_string(n));
    bool started = pool.start([&](const JobId& jobId, int workerId) {
        (void)workerId;
        if (cancel_.cancelled()) {
            return;
        }
        Job* job = byId.at(jobId);
        job->state = JobState::Running;
        AttemptRecord record = attempt_(*job, profile);
        record.tier = tier;
        // A failure below tier 3 goes back to Pending for the next tier
        job->state = record.outcome == Outcome::Success ? JobState::Succeeded : JobState::Pending;

        if (!store_.append(record)) {
            LOG_ERROR("Could not persist attempt of " + jobId + " at tier " + std::to_string(n));
        }

        std::lock_guard<std::mutex> lock(outcomeMutex_);
        outcome.attempts.push_back(record);
        switch (record.outcome) {
            case Outcome::Success:
                (tier == Tier::Three ? outcome.succeededDegraded : outcome.succeeded).push_back(jobId);
                break;
            case Outcome::Failure:
                failures.push_back(job);
                break;
            case Outcome::Cancelled:
                break;
        }
    });
    if (!started) {
        LOG_ERROR("Failed to start tier " + std::to_string(n) + " workers");
        return failures;
    }

    for (const Job* job : jobs) {
        if (!pool.submit(job->id)) {
            LOG_ERROR("Could not queue " + job->id + " for tier " + std::to_string(n));
        }
    }

    // Barrier: every attempt of this tier finishes before the next tier starts
    pool.wait();
    pool.stop();

    std::sort(failures.begin(), failures.end(), [](const Job* a, const Job* b) { return a->id < b->id; });
    LOG_INFO("Tier " + std::to_string(n) + " finished: " + std::to_string(failures.size()) + " of " +
             std::to_string(jobs.size()) + " failed");
    return failures;
}

}
