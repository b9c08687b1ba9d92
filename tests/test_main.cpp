/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "cascade/logger.hpp"

#include <cstdlib>

int main(int argc, char* argv[]) {
    // Keep test output readable; CASCADE_LOG_LEVEL still wins when set
    if (!std::getenv("CASCADE_LOG_LEVEL")) {
        cascade::Logger::setLevel(cascade::LogLevel::ERROR);
    }
    return Catch::Session().run(argc, argv);
}
