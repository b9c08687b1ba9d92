/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "cascade/stage.hpp"
#include "cascade/types.hpp"

namespace cascade {

struct Selection {
    std::vector<Job> jobs;
    std::vector<std::string> missing;  // requested but not discovered
};

class Scanner {
public:
    Scanner(const std::filesystem::path& study, const Stage& stage) noexcept;

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    [[nodiscard]] std::vector<Job> scan() const noexcept;

    // Empty items selects every discovered job.
    [[nodiscard]] Selection select(const std::vector<std::string>& items) const noexcept;

private:
    std::filesystem::path study_;
    const Stage& stage_;
};

}
