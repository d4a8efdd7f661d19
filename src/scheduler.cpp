/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/scheduler.hpp"
#include "loopcast/logger.hpp"
#include "loopcast/store.hpp"

namespace loopcast {

UploadScheduler::UploadScheduler(JobStore& store, Dispatcher dispatcher,
                                 std::chrono::seconds pollInterval)
    : store_(store), dispatcher_(std::move(dispatcher)), pollInterval_(pollInterval) {
    if (pollInterval_.count() < 1) {
        pollInterval_ = std::chrono::seconds(1);
    }
}

std::size_t UploadScheduler::tick(TimePoint now) noexcept {
    ++ticks_;
    std::size_t dispatched = 0;

    std::vector<Job> ready;
    try {
        ready = store_.listReadyForUpload();
    } catch (const std::exception& e) {
        LOG_ERROR("Scheduler tick error: " + std::string(e.what()));
        return 0;
    }

    for (const auto& job : ready) {
        if (stop_.load()) {
            break;
        }
        if (job.spec.scheduledAt > now) {
            continue;
        }

        const std::string tag = "Job " + std::to_string(job.id);
        bool flipped = false;
        try {
            auto flip = store_.updateUploadStatus(job.id, UploadStatus::Uploading);
            if (!flip) {
                // Another tick or process got there first
                LOG_DEBUG(tag + " not flipped to uploading: " + flip.message);
                continue;
            }
            flipped = true;
            (void)store_.appendLog(job.id, "Schedule reached. Uploading...");
            LOG_INFO(tag + " due at " + formatTime(job.spec.scheduledAt) + ", dispatching upload");

            if (dispatcher_) {
                dispatcher_(job.id);
            }
            ++dispatched;
        } catch (const std::exception& e) {
            LOG_ERROR(tag + " scheduler error: " + std::string(e.what()));
            if (flipped) {
                // Dispatch never happened; nothing else will move the job out of uploading.
                (void)store_.updateUploadStatus(job.id, UploadStatus::Failed);
            }
            (void)store_.appendLog(job.id, "Scheduler error: " + std::string(e.what()));
        }
    }

    if (dispatched > 0) {
        LOG_DEBUG("Scheduler dispatched " + std::to_string(dispatched) + " upload(s)");
    }
    return dispatched;
}

void UploadScheduler::run() {
    setThreadName("Scheduler");
    LOG_INFO("Upload scheduler started, polling every " + std::to_string(pollInterval_.count()) + "s");

    while (!stop_.load()) {
        (void)tick(Clock::now());

        std::unique_lock<std::mutex> lock(wakeMutex_);
        wake_.wait_for(lock, pollInterval_, [this] { return woken_ || stop_.load(); });
        woken_ = false;
    }

    LOG_INFO("Upload scheduler stopped");
}

void UploadScheduler::notify() noexcept {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        woken_ = true;
    }
    wake_.notify_all();
}

void UploadScheduler::stop() noexcept {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        stop_.store(true);
    }
    wake_.notify_all();
}

}
