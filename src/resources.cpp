/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/resources.hpp"
#include "cascade/logger.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace cascade {

namespace {
constexpr std::int64_t kKiBPerMiB = 1024;

int detectCpus() noexcept {
    long online = ::sysconf(_SC_NPROCESSORS_ONLN);
    if (online > 0) {
        return static_cast<int>(online);
    }
    unsigned hc = std::thread::hardware_concurrency();
    return hc > 0 ? static_cast<int>(hc) : 0;
}

std::int64_t sysconfTotalMiB() noexcept {
    long pages = ::sysconf(_SC_PHYS_PAGES);
    long pageSize = ::sysconf(_SC_PAGE_SIZE);
    if (pages <= 0 || pageSize <= 0) {
        return 0;
    }
    return static_cast<std::int64_t>(pages) * pageSize / (1024 * 1024);
}

std::int64_t sysconfAvailableMiB() noexcept {
    long pages = ::sysconf(_SC_AVPHYS_PAGES);
    long pageSize = ::sysconf(_SC_PAGE_SIZE);
    if (pages <= 0 || pageSize <= 0) {
        return 0;
    }
    return static_cast<std::int64_t>(pages) * pageSize / (1024 * 1024);
}
}

MemInfo ResourceProbe::parseMemInfo(const std::string& text) noexcept {
    MemInfo info;
    try {
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line)) {
            std::istringstream fields(line);
            std::string key;
            std::int64_t value = 0;
            if (!(fields >> key >> value)) {
                continue;
            }
            if (key == "MemTotal:") {
                info.totalKiB = value;
            } else if (key == "MemAvailable:") {
                info.availableKiB = value;
            }
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to parse meminfo: " + std::string(e.what()));
        return MemInfo{};
    }
    return info;
}

HostTotals ResourceProbe::probeHost() noexcept {
    HostTotals host;
    host.probed = true;

    host.cpus = detectCpus();
    if (host.cpus <= 0) {
        LOG_WARN("Could not detect CPU count, assuming " + std::to_string(kFallbackCpus));
        host.cpus = kFallbackCpus;
        host.probed = false;
    }

    try {
        std::ifstream file("/proc/meminfo");
        if (file) {
            std::stringstream buffer;
            buffer << file.rdbuf();
            MemInfo info = parseMemInfo(buffer.str());
            if (info.totalKiB && *info.totalKiB > 0) {
                host.totalMemoryMiB = *info.totalKiB / kKiBPerMiB;
                if (info.availableKiB) {
                    host.availableMemoryMiB = *info.availableKiB / kKiBPerMiB;
                } else {
                    // Older kernels lack MemAvailable
                    host.availableMemoryMiB = host.totalMemoryMiB * 70 / 100;
                    LOG_DEBUG("MemAvailable missing, assuming 70% of MemTotal");
                }
            }
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to read /proc/meminfo: " + std::string(e.what()));
    }

    if (host.totalMemoryMiB <= 0) {
        host.totalMemoryMiB = sysconfTotalMiB();
        host.availableMemoryMiB = sysconfAvailableMiB();
    }

    if (host.totalMemoryMiB <= 0 || host.availableMemoryMiB <= 0) {
        LOG_WARN("Could not detect memory, assuming " + std::to_string(kFallbackTotalMiB) +
                 " MiB total / " + std::to_string(kFallbackAvailableMiB) + " MiB available");
        host.totalMemoryMiB = kFallbackTotalMiB;
        host.availableMemoryMiB = kFallbackAvailableMiB;
        host.probed = false;
    }

    LOG_DEBUG("Host: " + std::to_string(host.cpus) + " CPUs, " +
              std::to_string(host.totalMemoryMiB) + " MiB total, " +
              std::to_string(host.availableMemoryMiB) + " MiB available");
    return host;
}

int ResourceProbe::cpuReserve(int cpus) noexcept {
    if (cpus <= 4) return 0;
    if (cpus <= 8) return 1;
    return 2;
}

ResourceBudget ResourceProbe::budget(const HostTotals& host, int parallelBatches,
                                     int memoryReservePercent) noexcept {
    ResourceBudget b;
    b.parallelBatches = std::max(1, parallelBatches);

    b.totalCpus = std::max(1, host.cpus / b.parallelBatches);
    b.reservedCpus = cpuReserve(b.totalCpus);
    b.usableCpus = std::max(kMinUsableCpus, b.totalCpus - b.reservedCpus);

    int pct = std::clamp(memoryReservePercent, 0, 90);
    b.totalMemoryMiB = host.totalMemoryMiB / b.parallelBatches;
    b.availableMemoryMiB = std::max<std::int64_t>(0, host.availableMemoryMiB / b.parallelBatches);
    b.reservedMemoryMiB = b.availableMemoryMiB * pct / 100;
    b.usableMemoryMiB = b.availableMemoryMiB - b.reservedMemoryMiB;
    return b;
}

std::optional<std::int64_t> ResourceProbe::freeDiskMiB(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    auto info = std::filesystem::space(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(info.available / (1024 * 1024));
}

std::string describeBudget(const ResourceBudget& budget) {
    std::ostringstream oss;
    oss << "CPU " << budget.usableCpus << "/" << budget.totalCpus
        << " usable (reserve " << budget.reservedCpus << "), memory "
        << budget.usableMemoryMiB << "/" << budget.availableMemoryMiB
        << " MiB usable (reserve " << budget.reservedMemoryMiB << " MiB)";
    if (budget.parallelBatches > 1) {
        oss << ", share 1/" << budget.parallelBatches;
    }
    return oss.str();
}

}
