/*
 * cascade - Tiered Batch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cascade/pool.hpp"
#include "cascade/logger.hpp"
#include <algorithm>

namespace cascade {

Pool::Pool(int workers, std::string name) noexcept
    : workers_(std::max(1, workers)), name_(std::move(name)) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid job processor provided");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }

        LOG_DEBUG("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load() && workerThreads_.empty()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");

    shutdown_.store(true);
    running_.store(false);

    jobAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    workerThreads_.clear();

    // Jobs never claimed are dropped
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        while (!jobQueue_.empty()) {
            jobQueue_.pop();
        }
        outstanding_ = 0;
    }
    idle_.notify_all();

    LOG_DEBUG("Pool stopped");
}

bool Pool::submit(const JobId& jobId) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot submit job to stopped pool: " + jobId);
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            jobQueue_.push(jobId);
            ++outstanding_;
        }

        jobAvailable_.notify_one();
        LOG_TRACE("Job queued: " + jobId);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue job " + jobId + ": " + std::string(e.what()));
        return false;
    }
}

void Pool::wait() noexcept {
    try {
        std::unique_lock<std::mutex> lock(queueMutex_);
        idle_.wait(lock, [this] { return outstanding_ == 0 || shutdown_.load(); });
    } catch (const std::exception& e) {
        LOG_ERROR("Pool wait failed: " + std::string(e.what()));
    }
}

std::size_t Pool::queueSize() const noexcept {
    try {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return jobQueue_.size();
    } catch (const std::exception&) {
        return 0;
    }
}

void Pool::workerLoop(int workerId) {
    setThreadName(name_ + "-" + std::to_string(workerId));
    LOG_TRACE(name_ + "-" + std::to_string(workerId) + " thread started");

    try {
        while (!shutdown_.load()) {
            JobId jobId;

            {
                std::unique_lock<std::mutex> lock(queueMutex_);

                jobAvailable_.wait(lock, [this] {
                    return !jobQueue_.empty() || shutdown_.load();
                });

                if (shutdown_.load()) {
                    break;
                }

                if (jobQueue_.empty()) {
                    continue;
                }

                jobId = jobQueue_.front();
                jobQueue_.pop();
            }

            // Process job outside of lock
            LOG_DEBUG(name_ + "-" + std::to_string(workerId) + " claimed job: " + jobId);

            try {
                processor_(jobId, workerId);
            } catch (const std::exception& e) {
                LOG_ERROR("Worker " + std::to_string(workerId) + " job processing error: " +
                          std::string(e.what()) + " (job: " + jobId + ")");
            } catch (...) {
                LOG_ERROR("Worker " + std::to_string(workerId) +
                          " unknown job processing error (job: " + jobId + ")");
            }

            {
                std::lock_guard<std::mutex> lock(queueMutex_);
                if (outstanding_ > 0) {
                    --outstanding_;
                }
                if (outstanding_ == 0) {
                    idle_.notify_all();
                }
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Worker " + std::to_string(workerId) + " fatal error: " + std::string(e.what()));
    }

    LOG_TRACE("Worker " + std::to_string(workerId) + " stopped");
}

}
