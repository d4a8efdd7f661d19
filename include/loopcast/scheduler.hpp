/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

#include "loopcast/types.hpp"

namespace loopcast {

class JobStore;

/*
 * Moves rendered jobs into the upload phase once their scheduled time has
 * passed. Each tick flips a due job from waiting_schedule to uploading in the
 * store before handing it to the dispatcher; the flip is a compare-and-set,
 * so a job leaves the ready set exactly once and is dispatched at most once.
 */
class UploadScheduler final {
public:
    using Dispatcher = std::function<void(JobId)>;

    UploadScheduler(JobStore& store, Dispatcher dispatcher,
                    std::chrono::seconds pollInterval = std::chrono::seconds(20));

    UploadScheduler(const UploadScheduler&) = delete;
    UploadScheduler& operator=(const UploadScheduler&) = delete;

    // One evaluation against `now`. Returns the number of jobs dispatched.
    std::size_t tick(TimePoint now) noexcept;

    // Ticks every poll interval, or earlier after notify(), until stop().
    void run();

    // Wakes the loop before the poll interval elapses (e.g. after a render succeeds).
    void notify() noexcept;
    void stop() noexcept;

    [[nodiscard]] std::size_t ticks() const noexcept { return ticks_.load(); }

private:
    JobStore& store_;
    Dispatcher dispatcher_;
    std::chrono::seconds pollInterval_;

    std::atomic<bool> stop_{false};
    std::atomic<std::size_t> ticks_{0};
    std::mutex wakeMutex_;
    std::condition_variable wake_;
    bool woken_ = false;
};

}
