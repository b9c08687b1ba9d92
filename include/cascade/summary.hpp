/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cascade/manifest.hpp"
#include "cascade/planner.hpp"
#include "cascade/progress.hpp"
#include "cascade/resources.hpp"

namespace cascade {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 1;
constexpr int kExitInfrastructure = 2;
constexpr int kExitPartialFailure = 3;
constexpr int kExitCancelled = 130;

// Everything the end-of-run report needs about one study.
struct StudyReport {
    std::string study;
    std::string stage;
    std::filesystem::path studyDir;
    bool processed = false;
    bool cancelled = false;
    std::string error;

    ResourceBudget budget;
    std::vector<TierPlan> plans;

    std::size_t selected = 0;
    std::vector<JobId> skipped;
    std::vector<JobId> succeeded;
    std::vector<JobId> succeededDegraded;
    std::vector<JobId> failed;
    std::vector<JobId> unresolved;
    std::vector<std::string> missing;

    std::size_t attempts = 0;
    std::optional<AttemptRecord> peakAttempt;
    std::vector<std::filesystem::path> outputs;
    std::filesystem::path logDir;
    double seconds = 0.0;

    [[nodiscard]] int exitCode() const noexcept;
};

[[nodiscard]] std::string renderSummary(const StudyReport& report);
[[nodiscard]] std::string renderBatchOverview(const std::vector<StudyReport>& reports);

[[nodiscard]] std::filesystem::path summaryPath(const StudyReport& report);
[[nodiscard]] std::filesystem::path retryPath(const StudyReport& report);

[[nodiscard]] bool writeSummary(const StudyReport& report) noexcept;

// Failed jobs as a job specification that can be fed back with --input-file.
[[nodiscard]] bool writeRetryManifest(const StudyReport& report, const StudyRequest& request) noexcept;

// Attempt with the highest measured peak memory, if any was measured.
[[nodiscard]] std::optional<AttemptRecord> peakMemoryAttempt(const std::vector<AttemptRecord>& attempts);

[[nodiscard]] int batchExitCode(const std::vector<StudyReport>& reports) noexcept;

}
