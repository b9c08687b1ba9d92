/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "cascade/orchestrator.hpp"
#include "cascade/processor.hpp"
#include "cascade/progress.hpp"
#include "cascade/stages.hpp"
#include "test_util.hpp"

#include <algorithm>
#include <cstdlib>

namespace cascade {
namespace unittest {

namespace {
// good succeeds, flaky only succeeds at reduced fidelity, bad always fails.
const char* const kWorkScript =
    "job=$1; out=$2; fidelity=$3\n"
    "echo \"$job\" >> \"$CASCADE_TEST_CALLS\"\n"
    "case \"$job\" in\n"
    "  bad) echo 'simulated crash' >&2; exit 1 ;;\n"
    "  flaky) [ \"$fidelity\" = reduced ] || exit 2 ;;\n"
    "esac\n"
    "echo \"$job $fidelity threads=$CASCADE_THREADS auth=$4\" > \"$out/result.txt\"\n";

class Fixture {
public:
    Fixture() {
        writeFile(base / "work.sh", kWorkScript);
        calls = base / "calls.txt";
        ::setenv("CASCADE_TEST_CALLS", calls.c_str(), 1);

        options.stageName = "work";
        options.commandTemplate = "sh " + (base / "work.sh").string() + " {job} {output} {fidelity}";
        options.jobMemoryMiB = 512;
        options.outputFile = "result.txt";

        batch.basePath = base.path();
        batch.heartbeatSeconds = 10;
        batch.lowDiskWarnMiB = 0;
        batch.host = HostTotals{4, 8192, 8192, true};
    }

    void addJobs(const std::string& study, const std::vector<std::string>& ids) {
        for (const auto& id : ids) {
            writeFile(base / study / "input" / id / "data.txt", id);
        }
    }

    StudyRequest request(const std::string& study) const {
        StudyRequest r;
        r.outputUnit = study;
        return r;
    }

    std::size_t callCount() const { return countLines(calls); }

    TempDir base;
    std::filesystem::path calls;
    CommandOptions options;
    BatchOptions batch;
    CancellationToken cancel;
};
}

TEST_CASE("A batch resolves every job through the tiers", "[orchestrator]") {
    Fixture f;
    f.addJobs("S1", {"good", "flaky", "bad"});
    CommandStage stage(f.options);
    Orchestrator orchestrator(stage, f.batch, f.cancel);

    BatchResult first = orchestrator.runBatch({f.request("S1")});
    REQUIRE(first.exitCode == kExitPartialFailure);
    REQUIRE(first.reports.size() == 1);

    const StudyReport& report = first.reports[0];
    REQUIRE(report.processed);
    REQUIRE(report.succeeded == std::vector<JobId>{"good"});
    REQUIRE(report.succeededDegraded == std::vector<JobId>{"flaky"});
    REQUIRE(report.failed == std::vector<JobId>{"bad"});
    REQUIRE(report.attempts == 7);
    REQUIRE(report.plans.size() == 3);
    REQUIRE(f.callCount() == 7);

    auto study = f.base / "S1";
    SECTION("outputs and markers") {
        REQUIRE(isNonEmptyFile(study / "output/good/result.txt"));
        REQUIRE_FALSE(std::filesystem::exists(study / "output/good" / kDegradedMarker));
        REQUIRE(isNonEmptyFile(study / "output/flaky/result.txt"));
        REQUIRE(readFile(study / "output/flaky/result.txt").find("reduced") != std::string::npos);
        REQUIRE(isNonEmptyFile(study / "output/flaky" / kDegradedMarker));
        // Failed jobs leave nothing behind
        REQUIRE_FALSE(std::filesystem::exists(study / "output/bad"));
        REQUIRE_FALSE(std::filesystem::exists(study / ".scratch/work/bad"));
    }

    SECTION("progress, logs and reports") {
        FileProgressStore store(study, "work");
        REQUIRE(store.load());
        REQUIRE(store.runState() == "complete");
        // Tier 1 runs in parallel, so list order is completion order
        auto tier1 = store.list(Category::Tier1Failed);
        std::sort(tier1.begin(), tier1.end());
        REQUIRE(tier1 == std::vector<JobId>{"bad", "flaky"});
        REQUIRE(store.list(Category::Tier3Failed) == std::vector<JobId>{"bad"});
        REQUIRE(store.list(Category::SucceededDegraded) == std::vector<JobId>{"flaky"});

        REQUIRE(std::filesystem::exists(study / "logs/work/bad.tier3.log"));
        REQUIRE(readFile(study / "logs/work/bad.tier1.log").find("simulated crash") != std::string::npos);

        REQUIRE(std::filesystem::exists(study / "work_summary.txt"));
        ManifestResult retry = Manifest::parseFile(study / "work_retry.tsv");
        REQUIRE(retry);
        REQUIRE(retry.studies[0].items == std::vector<std::string>{"bad"});
    }

    SECTION("a second run only retries what failed") {
        BatchResult second = orchestrator.runBatch({f.request("S1")});
        REQUIRE(second.exitCode == kExitPartialFailure);
        const StudyReport& again = second.reports[0];
        REQUIRE(again.skipped == std::vector<JobId>{"good"});
        // Degraded output is still reported as degraded, not as a plain skip
        REQUIRE(again.succeededDegraded == std::vector<JobId>{"flaky"});
        REQUIRE(again.failed == std::vector<JobId>{"bad"});
        REQUIRE(again.attempts == 3);
        REQUIRE(f.callCount() == 10);
        REQUIRE(std::filesystem::exists(study / "output/flaky" / kDegradedMarker));

        FileProgressStore store(study, "work");
        REQUIRE(store.load());
        REQUIRE(store.list(Category::SucceededDegraded) == std::vector<JobId>{"flaky"});
        REQUIRE(store.list(Category::Skipped) == std::vector<JobId>{"flaky", "good"});
        REQUIRE(readFile(study / "work_summary.txt").find("Succeeded (degraded): 1") != std::string::npos);
    }
}

TEST_CASE("Complete studies are not reprocessed", "[orchestrator]") {
    Fixture f;
    f.addJobs("S1", {"a", "b", "c"});
    CommandStage stage(f.options);

    {
        Orchestrator orchestrator(stage, f.batch, f.cancel);
        BatchResult first = orchestrator.runBatch({f.request("S1")});
        REQUIRE(first.exitCode == kExitSuccess);
        REQUIRE(first.reports[0].succeeded.size() == 3);
        REQUIRE(first.reports[0].outputs.size() == 3);
        REQUIRE(f.callCount() == 3);
        REQUIRE_FALSE(std::filesystem::exists(f.base / "S1/work_retry.tsv"));
    }

    SECTION("rerun skips everything") {
        Orchestrator orchestrator(stage, f.batch, f.cancel);
        BatchResult second = orchestrator.runBatch({f.request("S1")});
        REQUIRE(second.exitCode == kExitSuccess);
        REQUIRE(second.reports[0].skipped.size() == 3);
        REQUIRE(second.reports[0].attempts == 0);
        REQUIRE(second.reports[0].plans.empty());
        REQUIRE(f.callCount() == 3);
    }

    SECTION("force reruns everything") {
        f.batch.force = true;
        Orchestrator orchestrator(stage, f.batch, f.cancel);
        BatchResult forced = orchestrator.runBatch({f.request("S1")});
        REQUIRE(forced.exitCode == kExitSuccess);
        REQUIRE(forced.reports[0].succeeded.size() == 3);
        REQUIRE(f.callCount() == 6);
    }

    SECTION("selected samples only") {
        Orchestrator orchestrator(stage, f.batch, f.cancel);
        std::filesystem::remove_all(f.base / "S1/output");
        StudyRequest request = f.request("S1");
        Manifest::applySelector(request, "b,ghost");
        BatchResult partial = orchestrator.runBatch({request});
        REQUIRE(partial.reports[0].succeeded == std::vector<JobId>{"b"});
        REQUIRE(partial.reports[0].missing == std::vector<std::string>{"ghost"});
        REQUIRE(partial.reports[0].selected == 1);
        REQUIRE(f.callCount() == 4);
    }
}

TEST_CASE("Interrupted runs resume at the recorded tier", "[orchestrator]") {
    Fixture f;
    f.addJobs("S1", {"a", "b"});

    {
        FileProgressStore store(f.base / "S1", "work");
        REQUIRE(store.begin(false));
        AttemptRecord r;
        r.jobId = "a";
        r.tier = Tier::One;
        r.outcome = Outcome::Failure;
        REQUIRE(store.append(r));
    }

    CommandStage stage(f.options);
    Orchestrator orchestrator(stage, f.batch, f.cancel);
    BatchResult result = orchestrator.runBatch({f.request("S1")});
    REQUIRE(result.exitCode == kExitSuccess);

    FileProgressStore store(f.base / "S1", "work");
    REQUIRE(store.load());
    auto attempts = store.attempts();
    REQUIRE(attempts.size() == 3);
    REQUIRE(attempts[0].jobId == "a");
    REQUIRE(attempts[0].tier == Tier::One);

    bool aAtTierTwo = false;
    for (const auto& a : attempts) {
        if (a.jobId == "a" && a.tier == Tier::Two && a.outcome == Outcome::Success) {
            aAtTierTwo = true;
        }
        if (a.jobId == "b") {
            REQUIRE(a.tier == Tier::One);
        }
    }
    REQUIRE(aAtTierTwo);
    REQUIRE(store.runState() == "complete");
}

TEST_CASE("Recorded successes are checked against the outputs", "[orchestrator]") {
    Fixture f;
    f.addJobs("S1", {"a", "b", "c"});

    {
        FileProgressStore store(f.base / "S1", "work");
        REQUIRE(store.begin(false));
        for (const auto& id : {"a", "b", "c"}) {
            AttemptRecord r;
            r.jobId = id;
            r.tier = std::string(id) == "b" ? Tier::Three : Tier::One;
            r.outcome = Outcome::Success;
            REQUIRE(store.append(r));
        }
        REQUIRE(store.finish(false));
    }
    // Only c still has its output
    writeFile(f.base / "S1/output/c/result.txt", "c full");

    CommandStage stage(f.options);
    Orchestrator orchestrator(stage, f.batch, f.cancel);
    BatchResult result = orchestrator.runBatch({f.request("S1")});
    REQUIRE(result.exitCode == kExitSuccess);

    const StudyReport& report = result.reports[0];
    REQUIRE(report.succeeded == std::vector<JobId>{"a", "b", "c"});
    REQUIRE(report.succeededDegraded.empty());
    REQUIRE(f.callCount() == 2);
    REQUIRE(isNonEmptyFile(f.base / "S1/output/a/result.txt"));
    REQUIRE(isNonEmptyFile(f.base / "S1/output/b/result.txt"));
    REQUIRE(readFile(f.base / "S1/output/c/result.txt") == "c full");

    FileProgressStore store(f.base / "S1", "work");
    REQUIRE(store.load());
    REQUIRE(store.resolution("b") == Resolution::Succeeded);
    REQUIRE(store.list(Category::SucceededDegraded).empty());
    REQUIRE(store.attempts().size() == 5);
}

TEST_CASE("Each study runs with its own credential", "[orchestrator]") {
    Fixture f;
    f.addJobs("S1", {"a"});
    f.addJobs("S2", {"b"});
    f.addJobs("S3", {"c"});
    f.options.commandTemplate += " {auth}";

    StudyRequest s1 = f.request("S1");
    s1.auth = (f.base / "k1.ngc").string();
    StudyRequest s2 = f.request("S2");
    s2.auth = (f.base / "k2.ngc").string();
    writeFile(s1.auth, "key one");
    writeFile(s2.auth, "key two");

    CommandStage stage(f.options);
    Orchestrator orchestrator(stage, f.batch, f.cancel);
    BatchResult result = orchestrator.runBatch({s1, s2, f.request("S3")});
    REQUIRE(result.exitCode == kExitSuccess);

    REQUIRE(readFile(f.base / "S1/output/a/result.txt").find("auth=" + s1.auth) != std::string::npos);
    REQUIRE(readFile(f.base / "S2/output/b/result.txt").find("auth=" + s2.auth) != std::string::npos);
    REQUIRE(readFile(f.base / "S3/output/c/result.txt").find("auth=\n") != std::string::npos);
}

TEST_CASE("Batch level failures", "[orchestrator]") {
    Fixture f;
    f.addJobs("S1", {"a"});

    SECTION("missing executable stops the batch") {
        f.options.commandTemplate = "cascade-no-such-tool-xyz {job}";
        CommandStage stage(f.options);
        Orchestrator orchestrator(stage, f.batch, f.cancel);
        BatchResult result = orchestrator.runBatch({f.request("S1")});
        REQUIRE(result.exitCode == kExitInfrastructure);
        REQUIRE(result.reports.empty());
        REQUIRE(result.error.find("cascade-no-such-tool-xyz") != std::string::npos);
        REQUIRE_FALSE(std::filesystem::exists(f.base / "S1/work_run.state"));
    }

    SECTION("nothing requested") {
        CommandStage stage(f.options);
        Orchestrator orchestrator(stage, f.batch, f.cancel);
        REQUIRE(orchestrator.runBatch({}).exitCode == kExitUsage);
    }

    SECTION("cancelled before start") {
        f.cancel.cancel();
        CommandStage stage(f.options);
        Orchestrator orchestrator(stage, f.batch, f.cancel);
        BatchResult result = orchestrator.runBatch({f.request("S1")});
        REQUIRE(result.exitCode == kExitCancelled);
        REQUIRE(result.reports.empty());
    }

    SECTION("a broken study does not stop the others") {
        f.addJobs("S2", {"x", "y"});
        f.batch.parallelBatches = 2;
        CommandStage stage(f.options);
        Orchestrator orchestrator(stage, f.batch, f.cancel);

        BatchResult result = orchestrator.runBatch({f.request("missing"), f.request("S1"), f.request("S2")});
        REQUIRE(result.exitCode == kExitPartialFailure);
        REQUIRE(result.reports.size() == 3);
        REQUIRE_FALSE(result.reports[0].processed);
        REQUIRE(result.reports[0].error.find("not found") != std::string::npos);
        REQUIRE(result.reports[1].succeeded == std::vector<JobId>{"a"});
        REQUIRE(result.reports[2].succeeded == std::vector<JobId>{"x", "y"});
        REQUIRE(f.callCount() == 3);
    }
}

TEST_CASE("Processor attempt lifecycle", "[orchestrator][processor]") {
    TempDir study;
    CommandOptions options;
    options.stageName = "work";
    options.outputFile = "result.txt";

    Job job;
    job.id = "j1";
    job.sourceDir = study / "input/j1";
    job.outputDir = study / "output/j1";

    JobResourceProfile profile;
    profile.tier = Tier::Three;
    profile.threads = 1;
    profile.memoryCeilingMiB = 1024;
    profile.fidelity = FidelityMode::Reduced;
    CancellationToken cancel;

    SECTION("exit 0 without outputs is a failure") {
        options.commandTemplate = "true";
        CommandStage stage(options);
        Processor processor(study.path(), stage, 10);
        writeFile(job.outputDir / "stale.txt", "left over");

        AttemptRecord record = processor.process(job, profile, cancel);
        REQUIRE(record.outcome == Outcome::Failure);
        REQUIRE(record.exitCode == 0);
        REQUIRE_FALSE(std::filesystem::exists(job.outputDir));
        REQUIRE(std::filesystem::exists(processor.logPath("j1", Tier::Three)));
    }

    SECTION("reduced fidelity success writes the marker") {
        options.commandTemplate = "sh " + (study / "ok.sh").string() + " {output}";
        writeFile(study / "ok.sh", "test -d \"$TMPDIR\" && echo \"$CASCADE_FIDELITY\" > \"$1/result.txt\"\n");
        CommandStage stage(options);
        Processor processor(study.path(), stage, 10);

        AttemptRecord record = processor.process(job, profile, cancel);
        REQUIRE(record.outcome == Outcome::Success);
        REQUIRE(record.tier == Tier::Three);
        REQUIRE(readFile(job.outputDir / "result.txt") == "reduced\n");
        REQUIRE(isNonEmptyFile(job.outputDir / kDegradedMarker));
        REQUIRE_FALSE(std::filesystem::exists(processor.scratchPath("j1")));
    }

    SECTION("cancelled before start") {
        options.commandTemplate = "true";
        CommandStage stage(options);
        Processor processor(study.path(), stage, 10);
        cancel.cancel();
        REQUIRE(processor.process(job, profile, cancel).outcome == Outcome::Cancelled);
    }
}

}
}
