/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/summary.hpp"
#include "cascade/logger.hpp"
#include "cascade/stage.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace cascade {

namespace {
const char* const kRule = "==========================================";

std::string now() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&t, &local);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return buf;
}

void listSection(std::ostringstream& out, const std::string& title, const std::vector<std::string>& ids) {
    if (ids.empty()) {
        return;
    }
    out << "\n" << title << " (" << ids.size() << "):\n";
    for (const auto& id : ids) {
        out << "  " << id << "\n";
    }
}
}

int StudyReport::exitCode() const noexcept {
    if (cancelled) return kExitCancelled;
    if (!processed || !failed.empty()) return kExitPartialFailure;
    return kExitSuccess;
}

std::optional<AttemptRecord> peakMemoryAttempt(const std::vector<AttemptRecord>& attempts) {
    std::optional<AttemptRecord> peak;
    for (const auto& a : attempts) {
        if (a.peakMemoryMiB && (!peak || *a.peakMemoryMiB > *peak->peakMemoryMiB)) {
            peak = a;
        }
    }
    return peak;
}

std::string renderSummary(const StudyReport& report) {
    std::ostringstream out;
    out << kRule << "\n";
    out << "cascade " << report.stage << " summary\n";
    out << kRule << "\n";
    out << "Study:      " << report.study << "\n";
    out << "Finished:   " << now() << "\n";
    out << "Duration:   " << std::fixed << std::setprecision(1) << report.seconds << "s\n";

    if (!report.processed) {
        out << "\nStudy was not processed: " << report.error << "\n";
        return out.str();
    }

    out << "Resources:  " << describeBudget(report.budget) << "\n";
    if (!report.plans.empty()) {
        out << "\nTier plans:\n";
        for (const auto& plan : report.plans) {
            out << "  " << describePlan(plan) << "\n";
        }
    }

    out << "\nJobs:\n";
    out << "  Selected:             " << report.selected << "\n";
    out << "  Skipped (complete):   " << report.skipped.size() << "\n";
    out << "  Succeeded:            " << report.succeeded.size() << "\n";
    out << "  Succeeded (degraded): " << report.succeededDegraded.size() << "\n";
    out << "  Failed:               " << report.failed.size() << "\n";
    if (!report.unresolved.empty()) {
        out << "  Not finished:         " << report.unresolved.size() << " (cancelled, resumable)\n";
    }
    out << "  Attempts:             " << report.attempts << "\n";

    if (report.peakAttempt) {
        out << "\nPeak memory: " << *report.peakAttempt->peakMemoryMiB << " MiB ("
            << report.peakAttempt->jobId << ", tier " << tierNumber(report.peakAttempt->tier)
            << ", " << report.peakAttempt->threads << " threads)\n";
    } else {
        out << "\nPeak memory: not measured\n";
    }
    out << "Logs:        " << report.logDir.string() << "\n";

    if (!report.succeededDegraded.empty()) {
        out << "\nDegraded jobs carry " << kDegradedMarker << " in their output directory.\n";
    }
    listSection(out, "Succeeded with reduced fidelity", report.succeededDegraded);
    listSection(out, "Failed after all tiers", report.failed);
    listSection(out, "Not finished", report.unresolved);
    listSection(out, "Requested but not found", report.missing);

    if (!report.outputs.empty()) {
        out << "\nOutputs (" << report.outputs.size() << "):\n";
        for (const auto& path : report.outputs) {
            out << "  " << path.string() << "\n";
        }
    }

    if (!report.failed.empty()) {
        out << "\nRetry list: " << retryPath(report).string() << "\n";
    }
    return out.str();
}

std::string renderBatchOverview(const std::vector<StudyReport>& reports) {
    std::ostringstream out;
    std::size_t ok = 0, degraded = 0, failed = 0, skipped = 0;
    for (const auto& r : reports) {
        ok += r.succeeded.size();
        degraded += r.succeededDegraded.size();
        failed += r.failed.size();
        skipped += r.skipped.size();
    }

    out << "\n  " << reports.size() << " stud" << (reports.size() == 1 ? "y" : "ies") << ": "
        << ok << " succeeded, " << degraded << " degraded, " << failed << " failed, "
        << skipped << " skipped\n";
    for (const auto& r : reports) {
        out << "    " << std::left << std::setw(24) << r.study << "  ";
        if (!r.processed) {
            out << "not processed: " << r.error << "\n";
            continue;
        }
        out << r.succeeded.size() << " ok";
        if (!r.succeededDegraded.empty()) out << ", " << r.succeededDegraded.size() << " degraded";
        if (!r.failed.empty()) out << ", " << r.failed.size() << " failed";
        if (!r.skipped.empty()) out << ", " << r.skipped.size() << " skipped";
        if (r.cancelled) out << ", cancelled";
        out << "\n";
    }
    return out.str();
}

std::filesystem::path summaryPath(const StudyReport& report) {
    return report.studyDir / (report.stage + "_summary.txt");
}

std::filesystem::path retryPath(const StudyReport& report) {
    return report.studyDir / (report.stage + "_retry.tsv");
}

bool writeSummary(const StudyReport& report) noexcept {
    try {
        std::error_code ec;
        if (!std::filesystem::is_directory(report.studyDir, ec)) {
            return false;
        }
        auto path = summaryPath(report);
        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            LOG_ERROR("Cannot write summary " + path.string());
            return false;
        }
        file << renderSummary(report);
        LOG_INFO("Summary written to " + path.string());
        return file.good();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write summary: " + std::string(e.what()));
        return false;
    }
}

bool writeRetryManifest(const StudyReport& report, const StudyRequest& request) noexcept {
    try {
        auto path = retryPath(report);
        std::error_code ec;
        if (report.failed.empty()) {
            std::filesystem::remove(path, ec);
            return true;
        }

        StudyRequest retry = request;
        retry.allItems = false;
        retry.items = report.failed;

        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            LOG_ERROR("Cannot write retry list " + path.string());
            return false;
        }
        file << "# " << report.stage << " jobs that failed all tiers\n";
        file << Manifest::formatRow(retry) << "\n";
        return file.good();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write retry list: " + std::string(e.what()));
        return false;
    }
}

int batchExitCode(const std::vector<StudyReport>& reports) noexcept {
    int code = kExitSuccess;
    for (const auto& r : reports) {
        int c = r.exitCode();
        if (c == kExitCancelled) return kExitCancelled;
        if (c != kExitSuccess) code = kExitPartialFailure;
    }
    return code;
}

}
