/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/orchestrator.hpp"
#include "cascade/logger.hpp"
#include "cascade/planner.hpp"
#include "cascade/pool.hpp"
#include "cascade/processor.hpp"
#include "cascade/progress.hpp"
#include "cascade/scanner.hpp"
#include "cascade/tiers.hpp"
#include <algorithm>
#include <chrono>
#include <set>

namespace cascade {

Orchestrator::Orchestrator(const Stage& stage, BatchOptions options, const CancellationToken& cancel)
    : stage_(stage), options_(std::move(options)), cancel_(cancel) {
    LOG_DEBUG("Orchestrator created - stage: " + stage_.name() + ", base: " + options_.basePath.string());
}

std::filesystem::path Orchestrator::studyPath(const StudyRequest& request) const {
    std::filesystem::path unit(request.outputUnit);
    return unit.is_absolute() ? unit : options_.basePath / unit;
}

void Orchestrator::checkInfrastructure(const std::vector<StudyRequest>& requests) const {
    std::vector<std::string> missing;
    for (const auto& exe : stage_.requiredExecutables()) {
        if (auto path = findExecutable(exe)) {
            LOG_DEBUG("Found " + exe + ": " + path->string());
        } else {
            missing.push_back(exe);
        }
    }
    if (!missing.empty()) {
        std::string list;
        for (const auto& m : missing) {
            list += (list.empty() ? "" : ", ") + m;
        }
        throw InfrastructureError("missing required executables: " + list);
    }

    std::string error;
    if (!stage_.checkResources(error)) {
        throw InfrastructureError(error);
    }
    for (const auto& request : requests) {
        if (!stage_.checkAuth(request.auth, error)) {
            throw InfrastructureError(request.outputUnit + ": " + error);
        }
    }
}

BatchResult Orchestrator::runBatch(const std::vector<StudyRequest>& requests) {
    BatchResult result;
    setThreadName("Main");

    try {
        checkInfrastructure(requests);
    } catch (const InfrastructureError& e) {
        LOG_ERROR(std::string(e.what()));
        result.error = e.what();
        result.exitCode = kExitInfrastructure;
        return result;
    }

    if (requests.empty()) {
        result.error = "no studies to process";
        result.exitCode = kExitUsage;
        return result;
    }

    HostTotals host = options_.host ? *options_.host : ResourceProbe::probeHost();
    int parallel = std::max(1, std::min(options_.parallelBatches, static_cast<int>(requests.size())));
    ResourceBudget budget = ResourceProbe::budget(host, parallel, options_.memoryReservePercent);

    LOG_DEBUG("========================================");
    LOG_DEBUG("cascade " + stage_.name() + " batch starting");
    LOG_DEBUG("========================================");
    LOG_DEBUG("Studies: " + std::to_string(requests.size()));
    LOG_DEBUG("Parallel studies: " + std::to_string(parallel));
    LOG_DEBUG("Base path: " + options_.basePath.string());
    LOG_DEBUG("Force: " + std::string(options_.force ? "yes" : "no"));
    LOG_DEBUG("========================================");
    LOG_INFO("Resources per study: " + describeBudget(budget));

    result.reports.resize(requests.size());
    std::vector<char> ran(requests.size(), 0);

    if (parallel == 1) {
        for (std::size_t i = 0; i < requests.size(); ++i) {
            if (cancel_.cancelled()) {
                break;
            }
            result.reports[i] = runStudy(requests[i], budget);
            ran[i] = 1;
        }
    } else {
        Pool pool(parallel, "Study");
        bool started = pool.start([&](const JobId& index, int workerId) {
            (void)workerId;
            std::size_t i = std::stoul(index);
            if (cancel_.cancelled()) {
                return;
            }
            result.reports[i] = runStudy(requests[i], budget);
            ran[i] = 1;
        });
        if (!started) {
            result.error = "failed to start study workers";
            result.exitCode = kExitInfrastructure;
            return result;
        }
        for (std::size_t i = 0; i < requests.size(); ++i) {
            if (!pool.submit(std::to_string(i))) {
                LOG_ERROR("Could not queue study " + requests[i].outputUnit);
            }
        }
        pool.wait();
        pool.stop();
    }

    // Studies never started because of cancellation are not reported
    std::vector<StudyReport> reports;
    for (std::size_t i = 0; i < requests.size(); ++i) {
        if (ran[i]) {
            reports.push_back(std::move(result.reports[i]));
        }
    }
    result.reports = std::move(reports);

    result.exitCode = cancel_.cancelled() ? kExitCancelled : batchExitCode(result.reports);
    return result;
}

StudyReport Orchestrator::runStudy(const StudyRequest& request, const ResourceBudget& budget) {
    auto started = std::chrono::steady_clock::now();
    auto elapsed = [&started] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    };

    StudyReport report;
    report.study = request.outputUnit;
    report.stage = stage_.name();
    report.studyDir = studyPath(request);
    report.budget = budget;

    LOG_INFO("Processing study " + request.outputUnit + " (" + report.studyDir.string() + ")");

    try {
        std::string error;
        if (!stage_.validate(report.studyDir, error)) {
            LOG_ERROR(request.outputUnit + ": " + error);
            report.error = error;
            report.seconds = elapsed();
            return report;
        }

        if (auto free = ResourceProbe::freeDiskMiB(report.studyDir)) {
            if (*free < options_.lowDiskWarnMiB) {
                LOG_WARN("Low disk space in " + report.studyDir.string() + ": " +
                         std::to_string(*free) + " MiB free");
            }
        }

        Scanner scanner(report.studyDir, stage_);
        Selection selection = scanner.select(request.allItems ? std::vector<std::string>{} : request.items);
        report.missing = selection.missing;
        if (selection.jobs.empty()) {
            report.error = request.allItems ? "no " + stage_.name() + " jobs found"
                                            : "none of the requested samples were found";
            LOG_ERROR(request.outputUnit + ": " + report.error);
            report.seconds = elapsed();
            return report;
        }
        report.selected = selection.jobs.size();

        auto cost = stage_.costModel(budget);
        Planner planner(budget, *cost);
        planner.overrideThreads(options_.threadsOverride);

        FileProgressStore store(report.studyDir, stage_.name());
        if (!store.begin(options_.force)) {
            report.error = "cannot write progress files in " + report.studyDir.string();
            report.seconds = elapsed();
            return report;
        }

        std::vector<Job> pending;
        std::vector<JobId> pendingIds;
        for (auto job : selection.jobs) {
            job.auth = request.auth;
            Resolution resolution = store.resolution(job.id);
            bool complete = !options_.force && stage_.isComplete(job);

            if (complete && (resolution == Resolution::Succeeded ||
                             resolution == Resolution::SucceededDegraded)) {
                (resolution == Resolution::Succeeded ? report.succeeded : report.succeededDegraded)
                    .push_back(job.id);
                continue;
            }
            // A recorded result whose output is gone no longer counts
            if (!complete && resolution != Resolution::Unresolved && resolution != Resolution::Failed) {
                LOG_WARN("Output of " + job.id + " is missing, running it again");
                if (!store.reopen(job.id)) {
                    LOG_WARN("Could not reset progress of " + job.id);
                }
                resolution = Resolution::Unresolved;
            }

            // Disk decides what is already done; the log only says how it got there
            if (complete) {
                std::error_code ec;
                bool degraded = std::filesystem::exists(job.outputDir / kDegradedMarker, ec);
                LOG_DEBUG("Already complete, skipping: " + job.id + (degraded ? " (degraded)" : ""));
                if (!store.markSkipped(job.id, degraded)) {
                    LOG_WARN("Could not record skipped job " + job.id);
                }
                (degraded ? report.succeededDegraded : report.skipped).push_back(job.id);
                continue;
            }
            if (resolution == Resolution::Failed) {
                report.failed.push_back(job.id);
                continue;
            }
            pendingIds.push_back(job.id);
            pending.push_back(job);
        }

        if (!store.markPending(pendingIds)) {
            LOG_WARN("Could not record pending jobs for " + request.outputUnit);
        }
        LOG_INFO(request.outputUnit + ": " + std::to_string(pending.size()) + " to run, " +
                 std::to_string(report.skipped.size()) + " already complete");

        Processor processor(report.studyDir, stage_, options_.heartbeatSeconds);
        TierController controller(planner, store,
            [&processor, this](const Job& job, const JobResourceProfile& profile) {
                return processor.process(job, profile, cancel_);
            },
            cancel_);
        TierOutcome outcome = controller.run(pending);

        report.plans = outcome.plans;
        report.succeeded.insert(report.succeeded.end(), outcome.succeeded.begin(), outcome.succeeded.end());
        report.succeededDegraded.insert(report.succeededDegraded.end(),
                                        outcome.succeededDegraded.begin(), outcome.succeededDegraded.end());
        report.failed.insert(report.failed.end(), outcome.failed.begin(), outcome.failed.end());
        report.unresolved = outcome.unresolved;
        report.cancelled = outcome.cancelled;

        for (auto* list : {&report.succeeded, &report.succeededDegraded, &report.failed, &report.skipped}) {
            std::sort(list->begin(), list->end());
        }

        auto attempts = store.attempts();
        report.attempts = attempts.size();
        report.peakAttempt = peakMemoryAttempt(attempts);
        report.logDir = processor.logDir();

        std::set<JobId> done(report.succeeded.begin(), report.succeeded.end());
        done.insert(report.succeededDegraded.begin(), report.succeededDegraded.end());
        done.insert(report.skipped.begin(), report.skipped.end());
        for (const auto& job : selection.jobs) {
            if (done.count(job.id) > 0) {
                auto outputs = stage_.expectedOutputs(job);
                report.outputs.insert(report.outputs.end(), outputs.begin(), outputs.end());
            }
        }

        if (!store.finish(!report.cancelled)) {
            LOG_WARN("Could not update run state for " + request.outputUnit);
        }
        report.processed = true;
    } catch (const std::exception& e) {
        LOG_ERROR("Study " + request.outputUnit + " aborted: " + std::string(e.what()));
        report.error = e.what();
        report.processed = false;
    }

    report.seconds = elapsed();
    if (!writeSummary(report)) {
        LOG_WARN("Summary not written for " + request.outputUnit);
    }
    if (report.processed && !writeRetryManifest(report, request)) {
        LOG_WARN("Retry list not written for " + request.outputUnit);
    }

    LOG_INFO(request.outputUnit + ": " + std::to_string(report.succeeded.size()) + " succeeded, " +
             std::to_string(report.succeededDegraded.size()) + " degraded, " +
             std::to_string(report.failed.size()) + " failed, " +
             std::to_string(report.skipped.size()) + " skipped");
    return report;
}

}
