/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "cascade/tiers.hpp"
#include "test_util.hpp"

#include <map>

namespace cascade {
namespace unittest {

namespace {
ResourceBudget budget() {
    ResourceBudget b;
    b.totalCpus = 8;
    b.usableCpus = 8;
    b.availableMemoryMiB = 16384;
    b.usableMemoryMiB = 16384;
    return b;
}

CostParameters params() {
    CostParameters p;
    p.bands = {{8, 2}};
    p.baseWorkingMiB = 1024;
    p.perThreadMiB = 256;
    p.ceilingMinMiB = 1024;
    p.maxThreads = 16;
    p.minimalThreads = 1;
    return p;
}

std::vector<Job> jobs(const std::vector<std::string>& ids) {
    std::vector<Job> out;
    for (const auto& id : ids) {
        Job job;
        job.id = id;
        out.push_back(job);
    }
    return out;
}

using FailUntil = std::map<JobId, int>;

// Highest tier at which each job still fails; 0 succeeds at tier 1, 3 never succeeds.
class ScriptedAttempts {
public:
    explicit ScriptedAttempts(FailUntil failUntil) : failUntil_(std::move(failUntil)) {}

    AttemptFn fn() {
        return [this](const Job& job, const JobResourceProfile& profile) {
            std::lock_guard<std::mutex> lock(mutex_);
            seen.push_back({job.id, profile});
            AttemptRecord r;
            r.jobId = job.id;
            r.tier = profile.tier;
            r.threads = profile.threads;
            bool fails = tierNumber(profile.tier) <= failUntil_[job.id];
            r.outcome = fails ? Outcome::Failure : Outcome::Success;
            r.exitCode = fails ? 1 : 0;
            return r;
        };
    }

    std::vector<std::pair<JobId, JobResourceProfile>> seen;

private:
    FailUntil failUntil_;
    std::mutex mutex_;
};
}

TEST_CASE("Failures escalate through the tiers", "[tiers]") {
    TempDir study;
    FileProgressStore store(study.path(), "test");
    REQUIRE(store.begin(false));

    BandedCostModel model(params());
    Planner planner(budget(), model);
    CancellationToken cancel;
    ScriptedAttempts script(FailUntil{{"a", 0}, {"b", 1}, {"c", 2}, {"d", 3}});

    TierController controller(planner, store, script.fn(), cancel);
    auto pending = jobs({"a", "b", "c", "d"});
    TierOutcome outcome = controller.run(pending);

    REQUIRE(outcome.succeeded == std::vector<JobId>{"a", "b"});
    REQUIRE(outcome.succeededDegraded == std::vector<JobId>{"c"});
    REQUIRE(outcome.failed == std::vector<JobId>{"d"});
    REQUIRE(outcome.unresolved.empty());
    REQUIRE_FALSE(outcome.cancelled);

    REQUIRE(pending[0].state == JobState::Succeeded);
    REQUIRE(pending[2].state == JobState::Succeeded);
    REQUIRE(pending[3].state == JobState::Failed);

    SECTION("attempt counts per job") {
        std::map<JobId, int> count;
        for (const auto& s : script.seen) {
            ++count[s.first];
        }
        REQUIRE(count["a"] == 1);
        REQUIRE(count["b"] == 2);
        REQUIRE(count["c"] == 3);
        REQUIRE(count["d"] == 3);
        REQUIRE(outcome.attempts.size() == 9);
    }

    SECTION("tiers run strictly in order") {
        int lastTier = 1;
        for (const auto& s : script.seen) {
            int t = tierNumber(s.second.tier);
            REQUIRE(t >= lastTier);
            lastTier = t;
        }
    }

    SECTION("profiles degrade per tier") {
        REQUIRE(outcome.plans.size() == 3);
        REQUIRE(outcome.plans[0].tier == Tier::One);
        REQUIRE(outcome.plans[0].threadsPerJob == 2);
        REQUIRE(outcome.plans[0].parallelJobs == 4);
        REQUIRE(outcome.plans[1].parallelJobs == 1);
        REQUIRE(outcome.plans[1].threadsPerJob == 8);
        REQUIRE(outcome.plans[2].threadsPerJob == 1);
        REQUIRE(outcome.plans[2].fidelity == FidelityMode::Reduced);

        for (const auto& s : script.seen) {
            if (s.second.tier == Tier::Three) {
                REQUIRE(s.second.fidelity == FidelityMode::Reduced);
            } else {
                REQUIRE(s.second.fidelity == FidelityMode::Full);
            }
        }
    }

    SECTION("every attempt is persisted") {
        REQUIRE(store.attempts().size() == 9);
        REQUIRE(store.list(Category::Tier1Failed) == std::vector<JobId>{"b", "c", "d"});
        REQUIRE(store.list(Category::Tier2Failed) == std::vector<JobId>{"c", "d"});
        REQUIRE(store.list(Category::Tier3Failed) == std::vector<JobId>{"d"});
        REQUIRE(store.resolution("c") == Resolution::SucceededDegraded);
        REQUIRE(store.resolution("d") == Resolution::Failed);
    }
}

TEST_CASE("Tiers with nothing to do are skipped", "[tiers]") {
    TempDir study;
    FileProgressStore store(study.path(), "test");
    REQUIRE(store.begin(false));
    BandedCostModel model(params());
    Planner planner(budget(), model);
    CancellationToken cancel;

    SECTION("all succeed at tier 1") {
        ScriptedAttempts script(FailUntil{{"a", 0}, {"b", 0}});
        TierController controller(planner, store, script.fn(), cancel);
        auto pending = jobs({"a", "b"});
        TierOutcome outcome = controller.run(pending);
        REQUIRE(outcome.plans.size() == 1);
        REQUIRE(outcome.succeeded.size() == 2);
    }

    SECTION("empty pending set") {
        ScriptedAttempts script(FailUntil{});
        TierController controller(planner, store, script.fn(), cancel);
        std::vector<Job> none;
        TierOutcome outcome = controller.run(none);
        REQUIRE(outcome.plans.empty());
        REQUIRE(script.seen.empty());
    }
}

TEST_CASE("Cancellation stops further tiers", "[tiers]") {
    TempDir study;
    FileProgressStore store(study.path(), "test");
    REQUIRE(store.begin(false));
    BandedCostModel model(params());
    Planner planner(budget(), model);
    CancellationToken cancel;

    SECTION("before the run") {
        cancel.cancel();
        ScriptedAttempts script(FailUntil{{"a", 0}});
        TierController controller(planner, store, script.fn(), cancel);
        auto pending = jobs({"a", "b"});
        TierOutcome outcome = controller.run(pending);
        REQUIRE(outcome.cancelled);
        REQUIRE(script.seen.empty());
        REQUIRE(outcome.unresolved == std::vector<JobId>{"a", "b"});
    }

    SECTION("during tier 1") {
        AttemptFn fn = [&cancel](const Job& job, const JobResourceProfile& profile) {
            cancel.cancel();
            AttemptRecord r;
            r.jobId = job.id;
            r.tier = profile.tier;
            r.outcome = Outcome::Failure;
            return r;
        };
        Planner serial(budget(), model);
        TierController controller(serial, store, fn, cancel);
        auto pending = jobs({"a"});
        TierOutcome outcome = controller.run(pending);
        REQUIRE(outcome.cancelled);
        REQUIRE(outcome.plans.size() == 1);
        REQUIRE(outcome.unresolved == std::vector<JobId>{"a"});
        REQUIRE(pending[0].state == JobState::Pending);
        REQUIRE(store.resumeTier("a") == Tier::Two);
    }
}

TEST_CASE("Resumed jobs re-enter at their next tier", "[tiers]") {
    TempDir study;
    {
        FileProgressStore store(study.path(), "test");
        REQUIRE(store.begin(false));
        AttemptRecord r;
        r.jobId = "x";
        r.tier = Tier::One;
        r.outcome = Outcome::Failure;
        REQUIRE(store.append(r));
        r.jobId = "y";
        REQUIRE(store.append(r));
        r.tier = Tier::Two;
        REQUIRE(store.append(r));
    }

    FileProgressStore store(study.path(), "test");
    REQUIRE(store.begin(false));
    REQUIRE(store.resumed());

    BandedCostModel model(params());
    Planner planner(budget(), model);
    CancellationToken cancel;
    ScriptedAttempts script(FailUntil{{"x", 0}, {"y", 0}, {"z", 0}});
    TierController controller(planner, store, script.fn(), cancel);
    auto pending = jobs({"x", "y", "z"});
    TierOutcome outcome = controller.run(pending);

    std::map<JobId, Tier> firstTier;
    for (const auto& s : script.seen) {
        firstTier.emplace(s.first, s.second.tier);
    }
    REQUIRE(firstTier["x"] == Tier::Two);
    REQUIRE(firstTier["y"] == Tier::Three);
    REQUIRE(firstTier["z"] == Tier::One);
    REQUIRE(outcome.succeeded == std::vector<JobId>{"x", "z"});
    REQUIRE(outcome.succeededDegraded == std::vector<JobId>{"y"});
}

}
}
