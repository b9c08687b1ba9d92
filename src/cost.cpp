/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/cost.hpp"
#include "cascade/logger.hpp"
#include <algorithm>
#include <cmath>

namespace cascade {

BandedCostModel::BandedCostModel(CostParameters params) : params_(std::move(params)) {
    std::sort(params_.bands.begin(), params_.bands.end(),
              [](const ThreadBand& a, const ThreadBand& b) { return a.minCpus > b.minCpus; });
    params_.minimalThreads = std::max(1, params_.minimalThreads);
    params_.maxThreads = std::max(params_.minimalThreads, params_.maxThreads);
}

int BandedCostModel::threadsFor(int usableCpus) const noexcept {
    for (const auto& band : params_.bands) {
        if (usableCpus >= band.minCpus) {
            return band.threads;
        }
    }
    return params_.defaultThreads;
}

std::int64_t BandedCostModel::memoryRequiredMiB(int threads) const noexcept {
    return params_.fixedOverheadMiB + params_.baseWorkingMiB +
           static_cast<std::int64_t>(std::max(1, threads)) * params_.perThreadMiB;
}

std::int64_t BandedCostModel::memoryCeilingMiB(int parallelJobs,
                                               std::int64_t usableMemoryMiB) const noexcept {
    std::int64_t share = usableMemoryMiB / std::max(1, parallelJobs);
    std::int64_t ceiling = std::clamp(share, params_.ceilingMinMiB, params_.ceilingMaxMiB);
    // The stage floor never promises more than the host can give
    return usableMemoryMiB > 0 ? std::min(ceiling, usableMemoryMiB) : ceiling;
}

std::uintmax_t diskUsageBytes(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec)) {
        auto size = std::filesystem::file_size(path, ec);
        return ec ? 0 : size;
    }

    std::uintmax_t total = 0;
    std::filesystem::recursive_directory_iterator it(path, ec), end;
    while (!ec && it != end) {
        if (it->is_regular_file(ec)) {
            auto size = it->file_size(ec);
            if (!ec) {
                total += size;
            }
        }
        it.increment(ec);
    }
    return total;
}

std::int64_t estimateFixedOverheadMiB(const std::filesystem::path& resource, double factor,
                                      std::int64_t minMiB, std::int64_t maxMiB,
                                      std::int64_t fallbackMiB) noexcept {
    std::error_code ec;
    if (resource.empty() || !std::filesystem::exists(resource, ec)) {
        LOG_DEBUG("Resource not found, using default overhead of " +
                  std::to_string(fallbackMiB) + " MiB");
        return fallbackMiB;
    }

    std::uintmax_t bytes = diskUsageBytes(resource);
    if (bytes == 0) {
        return fallbackMiB;
    }

    constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;
    auto gib = static_cast<std::int64_t>(std::ceil(static_cast<double>(bytes) * factor / kGiB));
    std::int64_t estimate = std::clamp(gib * 1024, minMiB, maxMiB);
    LOG_DEBUG("Resource " + resource.string() + " is " + std::to_string(bytes / (1024 * 1024)) +
              " MiB on disk, estimated " + std::to_string(estimate) + " MiB resident");
    return estimate;
}

}
