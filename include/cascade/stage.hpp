/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "cascade/cost.hpp"
#include "cascade/resources.hpp"
#include "cascade/runner.hpp"
#include "cascade/types.hpp"

namespace cascade {

// Written next to the outputs of a job that only succeeded at reduced fidelity.
constexpr const char* kDegradedMarker = "DEGRADED_FIDELITY.txt";

// A job body: what a stage discovers, runs and accepts as finished output.
// The scheduler knows nothing about the tool behind it.
class Stage {
public:
    virtual ~Stage() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual std::vector<std::string> requiredExecutables() const = 0;

    // Shared resources every study needs (indexes, keys, templates).
    // A failure here stops the batch before any job runs.
    [[nodiscard]] virtual bool checkResources(std::string& error) const;

    // Credential named by a study's auth column.
    [[nodiscard]] virtual bool checkAuth(const std::string& auth, std::string& error) const;

    // Per-study layout checks.
    [[nodiscard]] virtual bool validate(const std::filesystem::path& study, std::string& error) const;

    // Jobs of a study, sorted by id, output directories assigned.
    [[nodiscard]] virtual std::vector<Job> discover(const std::filesystem::path& study) const = 0;

    [[nodiscard]] virtual std::vector<std::filesystem::path> expectedOutputs(const Job& job) const = 0;

    // True when every expected output exists and is non-empty.
    [[nodiscard]] virtual bool isComplete(const Job& job) const;

    // Removes whatever a failed or interrupted attempt may have left behind.
    [[nodiscard]] virtual bool cleanPartialOutput(const Job& job) const;

    [[nodiscard]] virtual std::vector<Command> commands(const Job& job,
                                                        const JobResourceProfile& profile,
                                                        const std::filesystem::path& scratch) const = 0;

    [[nodiscard]] virtual std::unique_ptr<CostModel> costModel(const ResourceBudget& budget) const = 0;

    // Text of the marker written next to a reduced-fidelity result.
    [[nodiscard]] virtual std::string degradedNotice(const Job& job) const;
};

// Regular files directly inside dir, sorted by name.
[[nodiscard]] std::vector<std::filesystem::path> listFiles(const std::filesystem::path& dir);
[[nodiscard]] std::vector<std::filesystem::path> listDirectories(const std::filesystem::path& dir);

[[nodiscard]] bool startsWith(const std::string& value, const std::string& prefix) noexcept;
[[nodiscard]] bool endsWith(const std::string& value, const std::string& suffix) noexcept;

[[nodiscard]] bool isNonEmptyFile(const std::filesystem::path& path) noexcept;

}
