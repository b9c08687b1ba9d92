/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <ostream>
#include <string>

#include "cascade/progress.hpp"

namespace cascade {

constexpr int kStatusClean = 0;
constexpr int kStatusFailed = 1;
constexpr int kStatusUnfinished = 2;

[[nodiscard]] const char* resolutionToString(Resolution resolution) noexcept;

// Writes the report cascade-status prints and returns its exit status.
// query: empty for per-category counts, a category name for its ids,
// anything else is taken as a job id.
[[nodiscard]] int printStatus(const FileProgressStore& store, const std::string& stage,
                              const std::string& query, std::ostream& out);

}
