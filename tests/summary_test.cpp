/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>

#include "cascade/stage.hpp"
#include "cascade/summary.hpp"
#include "test_util.hpp"

namespace cascade {
namespace unittest {

namespace {
StudyReport processedReport(const std::filesystem::path& dir) {
    StudyReport r;
    r.study = "PRJ1";
    r.stage = "quant";
    r.studyDir = dir;
    r.processed = true;
    r.selected = 4;
    r.succeeded = {"GSM1"};
    r.succeededDegraded = {"GSM2"};
    r.skipped = {"GSM4"};
    r.logDir = dir / "logs" / "quant";
    return r;
}
}

TEST_CASE("Study exit codes", "[summary]") {
    TempDir tmp;
    StudyReport r = processedReport(tmp.path());
    REQUIRE(r.exitCode() == kExitSuccess);

    r.failed = {"GSM3"};
    REQUIRE(r.exitCode() == kExitPartialFailure);

    r.cancelled = true;
    REQUIRE(r.exitCode() == kExitCancelled);

    StudyReport unprocessed;
    unprocessed.processed = false;
    REQUIRE(unprocessed.exitCode() == kExitPartialFailure);
}

TEST_CASE("Batch exit code", "[summary]") {
    TempDir tmp;
    StudyReport ok = processedReport(tmp.path());
    StudyReport bad = processedReport(tmp.path());
    bad.failed = {"GSM9"};
    StudyReport cancelled = processedReport(tmp.path());
    cancelled.cancelled = true;

    REQUIRE(batchExitCode({ok, ok}) == kExitSuccess);
    REQUIRE(batchExitCode({ok, bad}) == kExitPartialFailure);
    REQUIRE(batchExitCode({bad, cancelled}) == kExitCancelled);
    REQUIRE(batchExitCode({}) == kExitSuccess);
}

TEST_CASE("Peak memory attempt", "[summary]") {
    std::vector<AttemptRecord> attempts(3);
    attempts[0].jobId = "a";
    attempts[1].jobId = "b";
    attempts[1].peakMemoryMiB = 900;
    attempts[2].jobId = "c";
    attempts[2].peakMemoryMiB = 1200;

    auto peak = peakMemoryAttempt(attempts);
    REQUIRE(peak);
    REQUIRE(peak->jobId == "c");

    attempts.resize(1);
    REQUIRE_FALSE(peakMemoryAttempt(attempts));
}

TEST_CASE("Summary report", "[summary]") {
    TempDir tmp;
    StudyReport r = processedReport(tmp.path());
    r.failed = {"GSM3"};
    AttemptRecord peak;
    peak.jobId = "GSM1";
    peak.tier = Tier::One;
    peak.threads = 6;
    peak.peakMemoryMiB = 12345;
    r.peakAttempt = peak;

    std::string text = renderSummary(r);
    REQUIRE(text.find("PRJ1") != std::string::npos);
    REQUIRE(text.find("12345 MiB") != std::string::npos);
    REQUIRE(text.find(kDegradedMarker) != std::string::npos);
    REQUIRE(text.find("GSM3") != std::string::npos);
    REQUIRE(text.find("quant_retry.tsv") != std::string::npos);

    REQUIRE(writeSummary(r));
    REQUIRE(readFile(summaryPath(r)) .find("Failed after all tiers") != std::string::npos);

    std::string overview = renderBatchOverview({r});
    REQUIRE(overview.find("1 study") != std::string::npos);
    REQUIRE(overview.find("1 failed") != std::string::npos);

    StudyReport skipped;
    skipped.study = "PRJ2";
    skipped.error = "Trimmed_data directory not found";
    REQUIRE(renderSummary(skipped).find("not processed") != std::string::npos);
}

TEST_CASE("Retry list", "[summary]") {
    TempDir tmp;
    StudyReport r = processedReport(tmp.path());
    StudyRequest request;
    request.outputUnit = "PRJ1";
    request.accession = "GSE1";

    r.failed = {"GSM3", "GSM5"};
    REQUIRE(writeRetryManifest(r, request));
    ManifestResult retry = Manifest::parseFile(retryPath(r));
    REQUIRE(retry);
    REQUIRE(retry.studies[0].outputUnit == "PRJ1");
    REQUIRE(retry.studies[0].items == std::vector<std::string>{"GSM3", "GSM5"});

    r.failed.clear();
    REQUIRE(writeRetryManifest(r, request));
    REQUIRE_FALSE(std::filesystem::exists(retryPath(r)));
}

}
}
