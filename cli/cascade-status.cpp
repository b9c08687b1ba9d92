/*
 * cascade - Progress retrieval tool (cascade-status)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/logger.hpp"
#include "cascade/progress.hpp"
#include "cascade/status.hpp"
#include <iostream>

using namespace cascade;

void printUsage(const char* progName) {
    std::cout << "cascade Progress Retrieval Tool\n\n";
    std::cout << "Usage: " << progName << " <study_dir> <stage> [category | job_id]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  study_dir     Study directory holding the progress files\n";
    std::cout << "  stage         Stage name (fetch, trim, quant, or a command stage name)\n";
    std::cout << "  category      pending, tier1_failed, tier2_failed, tier3_failed,\n";
    std::cout << "                succeeded, succeeded_degraded, skipped\n";
    std::cout << "  job_id        Specific job to report on\n\n";
    std::cout << "Behavior:\n";
    std::cout << "  - No third argument: counts per category and run state\n";
    std::cout << "  - Category: job ids in that category, one per line\n";
    std::cout << "  - Job id: final state of that job\n\n";
    std::cout << "Exit status: 0 nothing failed, 1 failures or error, 2 job not finished\n";
}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    Logger::setLevel(LogLevel::WARN);

    if (argc < 3) {
        printUsage(argv[0]);
        return kStatusFailed;
    }

    std::string studyDir = argv[1];
    std::string stage = argv[2];
    std::string query = argc > 3 ? argv[3] : "";

    try {
        FileProgressStore store(studyDir, stage);
        if (!store.load()) {
            std::cerr << "Cannot read progress files in " << studyDir << std::endl;
            return kStatusFailed;
        }

        return printStatus(store, stage, query, std::cout);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kStatusFailed;
    }
}
