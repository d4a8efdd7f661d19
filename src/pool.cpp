/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/pool.hpp"
#include "loopcast/logger.hpp"

namespace loopcast {

Pool::Pool(std::string role, int workers) noexcept
    : role_(std::move(role)), workers_(workers < 1 ? 1 : workers) {
    LOG_DEBUG(role_ + " pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    (void)stop();
}

bool Pool::start(JobProcessor processor) {
    if (running_.load()) {
        LOG_WARN(role_ + " pool already running");
        return false;
    }
    if (!processor) {
        LOG_ERROR(role_ + " pool started without a processor");
        return false;
    }

    processor_ = std::move(processor);
    shutdown_.store(false);
    running_.store(true);

    try {
        workerThreads_.reserve(static_cast<std::size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        LOG_INFO(role_ + " pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start " + role_ + " pool: " + std::string(e.what()));
        (void)stop();
        return false;
    }
}

std::vector<JobId> Pool::stop() noexcept {
    std::vector<JobId> dropped;
    if (!running_.exchange(false)) {
        return dropped;
    }

    LOG_DEBUG("Stopping " + role_ + " pool...");
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
    }
    jobAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        try {
            dropped.reserve(jobQueue_.size());
            while (!jobQueue_.empty()) {
                dropped.push_back(jobQueue_.front());
                jobQueue_.pop();
            }
        } catch (const std::exception& e) {
            LOG_ERROR(role_ + " pool could not collect queued jobs: " + std::string(e.what()));
        }
        std::queue<JobId>().swap(jobQueue_);
    }
    if (!dropped.empty()) {
        LOG_INFO(role_ + " pool dropped " + std::to_string(dropped.size()) + " queued job(s)");
    }
    LOG_INFO(role_ + " pool stopped");
    return dropped;
}

bool Pool::submit(JobId jobId) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot submit job " + std::to_string(jobId) + " to stopped " + role_ + " pool");
        return false;
    }
    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            jobQueue_.push(jobId);
        }
        jobAvailable_.notify_one();
        LOG_DEBUG("Job " + std::to_string(jobId) + " queued for " + role_);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue job " + std::to_string(jobId) + ": " + e.what());
        return false;
    }
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return jobQueue_.size();
}

void Pool::workerLoop(int workerId) {
    const std::string name = getThreadName(role_.c_str(), workerId);
    setThreadName(name);
    LOG_DEBUG(name + " thread started");

    while (true) {
        JobId jobId = 0;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            jobAvailable_.wait(lock, [this] {
                return !jobQueue_.empty() || shutdown_.load();
            });
            if (shutdown_.load()) {
                break;
            }
            jobId = jobQueue_.front();
            jobQueue_.pop();
        }

        LOG_DEBUG(name + " claimed job " + std::to_string(jobId));
        ++active_;
        try {
            processor_(jobId, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR(name + " job processing error: " + std::string(e.what()) +
                      " (job " + std::to_string(jobId) + ")");
        }
        --active_;
    }

    LOG_DEBUG(name + " stopped");
}

}
