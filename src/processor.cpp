/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/processor.hpp"
#include "cascade/logger.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {
std::mutex g_output_mutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
    return buf;
}

void printStatus(const std::string& jobId, int tier, const char* color, const std::string& status) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << "    \033[90m" << timestamp() << "\033[0m  " << jobId << "  \033[90mT" << tier
              << "\033[0m  " << color << status << "\033[0m\n" << std::flush;
}

// Scratch space belongs to one attempt and goes away with it.
struct ScratchGuard {
    std::filesystem::path path;
    ~ScratchGuard() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

}

namespace cascade {

Processor::Processor(const std::filesystem::path& studyDir, const Stage& stage, int heartbeatSeconds)
    : studyDir_(studyDir), stage_(stage), heartbeatSeconds_(heartbeatSeconds) {
    LOG_DEBUG("Processor created for " + studyDir_.string() + " stage " + stage_.name());
}

std::filesystem::path Processor::logDir() const {
    return studyDir_ / "logs" / stage_.name();
}

std::filesystem::path Processor::logPath(const JobId& jobId, Tier tier) const {
    return logDir() / (jobId + ".tier" + std::to_string(tierNumber(tier)) + ".log");
}

std::filesystem::path Processor::scratchPath(const JobId& jobId) const {
    return studyDir_ / ".scratch" / stage_.name() / jobId;
}

AttemptRecord Processor::process(const Job& job, const JobResourceProfile& profile,
                                 const CancellationToken& cancel) noexcept {
    AttemptRecord record;
    record.jobId = job.id;
    record.tier = profile.tier;
    record.threads = profile.threads;
    record.outcome = Outcome::Failure;

    const int tier = tierNumber(profile.tier);
    auto startTime = std::chrono::steady_clock::now();
    auto elapsed = [&startTime] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    };

    try {
        if (cancel.cancelled()) {
            record.outcome = Outcome::Cancelled;
            return record;
        }

        ScratchGuard scratch{scratchPath(job.id)};
        if (!prepare(job, scratch.path)) {
            finalizeFailure(job, profile.tier, "could not prepare output or scratch directories");
            record.seconds = elapsed();
            return record;
        }

        RunRequest request;
        request.label = stage_.name() + ":" + job.id + " (tier " + std::to_string(tier) + ")";
        request.commands = stage_.commands(job, profile, scratch.path);
        request.logPath = logPath(job.id, profile.tier);
        request.heartbeatSeconds = heartbeatSeconds_;
        request.environment = {
            {"CASCADE_THREADS", std::to_string(profile.threads)},
            {"CASCADE_MEMORY_MIB", std::to_string(profile.memoryCeilingMiB)},
            {"CASCADE_FIDELITY", fidelityToString(profile.fidelity)},
            {"TMPDIR", scratch.path.string()}};

        printStatus(job.id, tier, "\033[33m", "running");
        LOG_INFO("Starting " + request.label + " with " + std::to_string(profile.threads) +
                 " threads, ceiling " + std::to_string(profile.memoryCeilingMiB) + " MiB");

        RunResult result = runner_.run(request, cancel);
        record.exitCode = result.exitCode;
        record.peakMemoryMiB = result.peakMemoryMiB;
        record.seconds = elapsed();

        if (result.cancelled) {
            record.outcome = Outcome::Cancelled;
            (void)stage_.cleanPartialOutput(job);
            printStatus(job.id, tier, "\033[90m", "cancelled");
            LOG_WARN("Cancelled " + request.label);
            return record;
        }

        if (!result.ok) {
            finalizeFailure(job, profile.tier, result.error);
            printStatus(job.id, tier, "\033[31m", "failed");
            return record;
        }

        // Exit code 0 is not enough; the outputs must be there
        if (!finalizeSuccess(job, profile)) {
            finalizeFailure(job, profile.tier, "tool exited 0 but expected outputs are missing or empty");
            printStatus(job.id, tier, "\033[31m", "failed");
            return record;
        }

        record.outcome = Outcome::Success;
        std::ostringstream took;
        took << std::fixed << std::setprecision(1) << record.seconds << "s";
        printStatus(job.id, tier, "\033[32m", profile.tier == Tier::Three ? "done (degraded)  " + took.str()
                                                                            : "done  " + took.str());
        LOG_INFO("JOB COMPLETED: " + job.id + " at tier " + std::to_string(tier) + " in " + took.str() +
                 (record.peakMemoryMiB ? ", peak " + std::to_string(*record.peakMemoryMiB) + " MiB" : ""));
        return record;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing job " + job.id + ": " + std::string(e.what()));
        finalizeFailure(job, profile.tier, "internal processing error: " + std::string(e.what()));
        record.outcome = Outcome::Failure;
        record.seconds = elapsed();
        return record;
    }
}

bool Processor::prepare(const Job& job, const std::filesystem::path& scratch) noexcept {
    try {
        if (!stage_.cleanPartialOutput(job)) {
            return false;
        }

        std::error_code ec;
        std::filesystem::remove(job.outputDir / kDegradedMarker, ec);
        ec.clear();

        std::filesystem::remove_all(scratch, ec);
        ec.clear();
        std::filesystem::create_directories(scratch, ec);
        if (ec) {
            LOG_ERROR("Cannot create scratch " + scratch.string() + ": " + ec.message());
            return false;
        }
        std::filesystem::create_directories(job.outputDir, ec);
        if (ec) {
            LOG_ERROR("Cannot create output " + job.outputDir.string() + ": " + ec.message());
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to prepare job " + job.id + ": " + std::string(e.what()));
        return false;
    }
}

bool Processor::finalizeSuccess(const Job& job, const JobResourceProfile& profile) noexcept {
    try {
        if (!stage_.isComplete(job)) {
            return false;
        }

        if (profile.tier == Tier::Three) {
            auto tempPath = job.outputDir / (std::string(kDegradedMarker) + ".tmp");
            {
                std::ofstream file(tempPath, std::ios::binary);
                if (!file) return false;
                file << stage_.degradedNotice(job);
                file.flush();
                if (!file.good()) return false;
            }
            std::filesystem::rename(tempPath, job.outputDir / kDegradedMarker);
            LOG_WARN("Job " + job.id + " completed with reduced fidelity");
        }

        LOG_DEBUG("Job finalized successfully: " + job.id);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to finalize success for job " + job.id + ": " + std::string(e.what()));
        return false;
    }
}

void Processor::finalizeFailure(const Job& job, Tier tier, const std::string& error) noexcept {
    try {
        (void)stage_.cleanPartialOutput(job);

        std::string tail = tailLines(logPath(job.id, tier), 10);
        LOG_ERROR("Job " + job.id + " failed at tier " + std::to_string(tierNumber(tier)) + ": " + error);
        if (!tail.empty()) {
            LOG_ERROR("Last log lines for " + job.id + ":\n" + tail);
        }
        LOG_ERROR("Full log: " + logPath(job.id, tier).string());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to finalize failure for job " + job.id + ": " + std::string(e.what()));
    }
}

}
