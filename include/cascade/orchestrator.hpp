/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "cascade/manifest.hpp"
#include "cascade/resources.hpp"
#include "cascade/runner.hpp"
#include "cascade/stage.hpp"
#include "cascade/summary.hpp"

namespace cascade {

// Raised for problems that make the whole batch pointless to start.
class InfrastructureError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct BatchOptions {
    std::filesystem::path basePath = "/data";
    int parallelBatches = 1;
    bool force = false;
    std::optional<int> threadsOverride;
    int heartbeatSeconds = 60;
    int memoryReservePercent = 10;
    std::int64_t lowDiskWarnMiB = 10240;
    std::optional<HostTotals> host;  // probed when unset
};

struct BatchResult {
    int exitCode = kExitSuccess;
    std::vector<StudyReport> reports;
    std::string error;
};

class Orchestrator final {
public:
    Orchestrator(const Stage& stage, BatchOptions options, const CancellationToken& cancel);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    [[nodiscard]] BatchResult runBatch(const std::vector<StudyRequest>& requests);
    [[nodiscard]] StudyReport runStudy(const StudyRequest& request, const ResourceBudget& budget);

    // Throws InfrastructureError when a tool, a shared resource or a
    // study's credential is missing.
    void checkInfrastructure(const std::vector<StudyRequest>& requests) const;

    [[nodiscard]] std::filesystem::path studyPath(const StudyRequest& request) const;

private:
    const Stage& stage_;
    BatchOptions options_;
    const CancellationToken& cancel_;
};

}
