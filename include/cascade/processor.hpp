/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include "cascade/progress.hpp"
#include "cascade/runner.hpp"
#include "cascade/stage.hpp"
#include "cascade/types.hpp"

namespace cascade {

// Runs one attempt of one job: clean slate, scratch, tool run, output check.
class Processor final {
public:
    Processor(const std::filesystem::path& studyDir, const Stage& stage, int heartbeatSeconds);

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;

    [[nodiscard]] AttemptRecord process(const Job& job, const JobResourceProfile& profile,
                                        const CancellationToken& cancel) noexcept;

    [[nodiscard]] std::filesystem::path logPath(const JobId& jobId, Tier tier) const;
    [[nodiscard]] std::filesystem::path scratchPath(const JobId& jobId) const;
    [[nodiscard]] std::filesystem::path logDir() const;

private:
    [[nodiscard]] bool prepare(const Job& job, const std::filesystem::path& scratch) noexcept;
    [[nodiscard]] bool finalizeSuccess(const Job& job, const JobResourceProfile& profile) noexcept;
    void finalizeFailure(const Job& job, Tier tier, const std::string& error) noexcept;

    std::filesystem::path studyDir_;
    const Stage& stage_;
    int heartbeatSeconds_;
    Runner runner_;
};

}
