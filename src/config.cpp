/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/config.hpp"
#include "cascade/logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace cascade {

int env_int(const char* name, int defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t used = 0;
        int parsed = std::stoi(val, &used);
        return used == std::char_traits<char>::length(val) ? parsed : defv;
    } catch (const std::exception&) {
        return defv;
    }
}

std::string env_string(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : defv;
}

bool parsePositive(const std::string& text, int& out) noexcept {
    try {
        std::size_t used = 0;
        int parsed = std::stoi(text, &used);
        if (used != text.size() || parsed <= 0) {
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

Settings loadSettings() {
    Settings settings;
    settings.basePath = env_string("CASCADE_BASE_PATH", "/data");

    int heartbeat = env_int("CASCADE_HEARTBEAT_SEC", 60);
    if (heartbeat < kMinHeartbeatSeconds) {
        LOG_WARN("CASCADE_HEARTBEAT_SEC below " + std::to_string(kMinHeartbeatSeconds) +
                 "s, clamping");
        heartbeat = kMinHeartbeatSeconds;
    }
    settings.heartbeatSeconds = heartbeat;

    int reserve = env_int("CASCADE_MEMORY_RESERVE_PCT", 10);
    settings.memoryReservePercent = std::clamp(reserve, 0, 90);

    settings.parallelBatches = std::max(1, env_int("CASCADE_PARALLEL", 1));
    return settings;
}

}
