/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "loopcast/types.hpp"

namespace loopcast {

using JobProcessor = std::function<void(JobId, int workerId)>;

// Fixed set of worker threads draining a FIFO of job ids.
class Pool final {
public:
    Pool(std::string role, int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobProcessor processor);
    // Finishes in-flight jobs, drops queued ones and returns their ids.
    std::vector<JobId> stop() noexcept;
    [[nodiscard]] bool submit(JobId jobId) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] std::size_t activeCount() const noexcept { return active_.load(); }
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);

    std::string role_;
    int workers_;
    JobProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<std::size_t> active_{0};

    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::queue<JobId> jobQueue_;

    std::vector<std::thread> workerThreads_;
};

}
