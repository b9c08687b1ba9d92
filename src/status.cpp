/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/status.hpp"
#include <iomanip>

namespace cascade {

const char* resolutionToString(Resolution resolution) noexcept {
    switch (resolution) {
        case Resolution::Unresolved: return "UNFINISHED";
        case Resolution::Skipped: return "SKIPPED";
        case Resolution::Succeeded: return "SUCCEEDED";
        case Resolution::SucceededDegraded: return "SUCCEEDED_DEGRADED";
        case Resolution::Failed: return "FAILED";
        default: return "UNKNOWN";
    }
}

int printStatus(const FileProgressStore& store, const std::string& stage,
                const std::string& query, std::ostream& out) {
    if (query.empty()) {
        std::string state = store.runState();
        out << stage << " run state: " << (state.empty() ? "none" : state) << "\n";
        for (auto c : {Category::Pending, Category::Skipped, Category::Succeeded,
                       Category::SucceededDegraded, Category::Tier1Failed,
                       Category::Tier2Failed, Category::Tier3Failed}) {
            out << "  " << std::left << std::setw(20) << categoryToString(c) << store.list(c).size() << "\n";
        }
        out << "  " << std::left << std::setw(20) << "attempts" << store.attempts().size() << "\n";
        return store.list(Category::Tier3Failed).empty() ? kStatusClean : kStatusFailed;
    }

    if (auto category = categoryFromString(query)) {
        for (const auto& id : store.list(*category)) {
            out << id << "\n";
        }
        return kStatusClean;
    }

    Resolution resolution = store.resolution(query);
    out << query << "\t" << resolutionToString(resolution) << "\n";
    for (const auto& attempt : store.attempts()) {
        if (attempt.jobId == query) {
            out << "  " << FileProgressStore::formatAttempt(attempt) << "\n";
        }
    }
    if (resolution == Resolution::Failed) return kStatusFailed;
    if (resolution == Resolution::Unresolved) return kStatusUnfinished;
    return kStatusClean;
}

}
