/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/scanner.hpp"
#include "cascade/logger.hpp"
#include <algorithm>
#include <set>

namespace cascade {

Scanner::Scanner(const std::filesystem::path& study, const Stage& stage) noexcept
    : study_(study), stage_(stage) {
}

std::vector<Job> Scanner::scan() const noexcept {
    std::vector<Job> jobs;

    try {
        jobs = stage_.discover(study_);
        for (const auto& job : jobs) {
            LOG_TRACE("Found job: " + job.id + " (" + std::to_string(job.inputs.size()) + " inputs)");
        }

        // Stable order for planning and reports
        std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) { return a.id < b.id; });

        LOG_DEBUG("Scanner found " + std::to_string(jobs.size()) + " " + stage_.name() + " jobs in " +
                  study_.string());
    } catch (const std::exception& e) {
        LOG_ERROR("Scanner error: " + std::string(e.what()));
        jobs.clear();
    }

    return jobs;
}

Selection Scanner::select(const std::vector<std::string>& items) const noexcept {
    Selection selection;
    std::vector<Job> all = scan();

    if (items.empty()) {
        selection.jobs = std::move(all);
        return selection;
    }

    try {
        std::set<std::string> wanted(items.begin(), items.end());
        std::set<std::string> found;
        for (auto& job : all) {
            if (wanted.count(job.id) > 0) {
                found.insert(job.id);
                selection.jobs.push_back(std::move(job));
            }
        }
        for (const auto& item : items) {
            if (found.count(item) == 0) {
                LOG_WARN("Requested sample not found: " + item);
                selection.missing.push_back(item);
            }
        }
        LOG_INFO("Selected " + std::to_string(selection.jobs.size()) + " of " +
                 std::to_string(items.size()) + " requested samples");
    } catch (const std::exception& e) {
        LOG_ERROR("Selection error: " + std::string(e.what()));
    }

    return selection;
}

}
