/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "cascade/types.hpp"

namespace cascade {

struct AttemptRecord {
    JobId jobId;
    Tier tier = Tier::One;
    int threads = 0;
    Outcome outcome = Outcome::Failure;
    std::optional<std::int64_t> peakMemoryMiB;
    int exitCode = -1;
    double seconds = 0.0;
};

enum class Category : std::uint8_t {
    Pending,
    Tier1Failed,
    Tier2Failed,
    Tier3Failed,
    Succeeded,
    SucceededDegraded,
    Skipped
};

// Final disposition of a job as far as the store knows.
enum class Resolution : std::uint8_t { Unresolved, Skipped, Succeeded, SucceededDegraded, Failed };

class ProgressStore {
public:
    virtual ~ProgressStore() = default;

    // Starts a run. Resumes the previous run when it never completed,
    // unless fresh is set. Returns false when the store cannot be written.
    [[nodiscard]] virtual bool begin(bool fresh) = 0;
    [[nodiscard]] virtual bool resumed() const noexcept = 0;

    [[nodiscard]] virtual bool markPending(const std::vector<JobId>& jobs) = 0;
    // degraded: the output on disk carries the reduced-fidelity marker.
    [[nodiscard]] virtual bool markSkipped(const JobId& jobId, bool degraded) = 0;
    // Forgets every recorded disposition of a job so it starts again at tier 1.
    // The attempt log keeps its history.
    [[nodiscard]] virtual bool reopen(const JobId& jobId) = 0;
    [[nodiscard]] virtual bool append(const AttemptRecord& record) = 0;

    // complete=false leaves the run resumable.
    [[nodiscard]] virtual bool finish(bool complete) = 0;

    [[nodiscard]] virtual Resolution resolution(const JobId& jobId) const = 0;
    [[nodiscard]] virtual bool isResolved(const JobId& jobId) const = 0;

    // Jobs of all that are not resolved yet, in input order.
    [[nodiscard]] std::vector<JobId> pendingSet(const std::vector<JobId>& all) const;

    // Tier an unresolved job enters next: one past its highest recorded failure.
    [[nodiscard]] virtual Tier resumeTier(const JobId& jobId) const = 0;

    [[nodiscard]] virtual std::vector<JobId> list(Category category) const = 0;
    [[nodiscard]] virtual std::vector<AttemptRecord> attempts() const = 0;
};

// Plain-text lists and a TSV attempt log in the study directory:
// <stage>_pending.txt, <stage>_tier{1,2,3}_failed.txt, <stage>_succeeded.txt,
// <stage>_succeeded_degraded.txt, <stage>_skipped.txt, <stage>_attempts.tsv
// and the <stage>_run.state marker.
class FileProgressStore final : public ProgressStore {
public:
    FileProgressStore(const std::filesystem::path& studyDir, const std::string& stage);

    FileProgressStore(const FileProgressStore&) = delete;
    FileProgressStore& operator=(const FileProgressStore&) = delete;

    // Read-only view of whatever is on disk.
    [[nodiscard]] bool load();

    [[nodiscard]] bool begin(bool fresh) override;
    [[nodiscard]] bool resumed() const noexcept override { return resumed_; }

    [[nodiscard]] bool markPending(const std::vector<JobId>& jobs) override;
    [[nodiscard]] bool markSkipped(const JobId& jobId, bool degraded) override;
    [[nodiscard]] bool reopen(const JobId& jobId) override;
    [[nodiscard]] bool append(const AttemptRecord& record) override;
    [[nodiscard]] bool finish(bool complete) override;

    [[nodiscard]] Resolution resolution(const JobId& jobId) const override;
    [[nodiscard]] bool isResolved(const JobId& jobId) const override;
    [[nodiscard]] Tier resumeTier(const JobId& jobId) const override;

    [[nodiscard]] std::vector<JobId> list(Category category) const override;
    [[nodiscard]] std::vector<AttemptRecord> attempts() const override;

    [[nodiscard]] std::filesystem::path pathFor(Category category) const;
    [[nodiscard]] std::filesystem::path attemptsPath() const;
    [[nodiscard]] std::filesystem::path statePath() const;
    [[nodiscard]] std::string runState() const;

    [[nodiscard]] static std::string formatAttempt(const AttemptRecord& record);
    [[nodiscard]] static std::optional<AttemptRecord> parseAttempt(const std::string& line);

private:
    struct IdList {
        std::set<JobId> ids;
        std::vector<JobId> order;
    };

    [[nodiscard]] bool appendUnique(Category category, const JobId& jobId);
    [[nodiscard]] bool rewriteLocked(Category category);
    [[nodiscard]] bool writeState(const std::string& state);
    [[nodiscard]] bool hasLocked(Category category, const JobId& jobId) const;
    void loadLocked();

    std::filesystem::path studyDir_;
    std::string stage_;
    bool resumed_ = false;

    mutable std::mutex mutex_;
    std::map<Category, IdList> lists_;
    std::vector<AttemptRecord> attempts_;
};

[[nodiscard]] const char* categoryToString(Category category) noexcept;
[[nodiscard]] std::optional<Category> categoryFromString(const std::string& text) noexcept;

}
