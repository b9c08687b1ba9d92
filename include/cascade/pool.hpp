/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "cascade/types.hpp"

namespace cascade {

using JobProcessor = std::function<void(const JobId&, int workerId)>;

class Pool {
public:
    explicit Pool(int workers, std::string name = "Worker") noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobProcessor processor);
    void stop() noexcept;
    [[nodiscard]] bool submit(const JobId& jobId) noexcept;

    // Blocks until every submitted job has been processed.
    void wait() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);

    int workers_;
    std::string name_;
    JobProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::condition_variable idle_;
    std::queue<JobId> jobQueue_;
    std::size_t outstanding_ = 0;

    std::vector<std::thread> workerThreads_;
};

}
