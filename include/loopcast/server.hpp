/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

#include "loopcast/config.hpp"
#include "loopcast/work.hpp"

namespace loopcast {

class JobStore;
class Pool;
class RenderWorker;
class SessionProvider;
class UploadScheduler;
class UploadWorker;
class VideoHost;

/*
 * Daemon core: a bounded render pool fed by a scan of pending jobs, the
 * upload scheduler on its own thread, and an upload pool it dispatches to.
 * The store, session provider and host are owned by the caller and must
 * outlive the server. One server per workspace: start() holds an exclusive
 * flock on <ws>/.loopcastd.lock until shutdown.
 */
class Server final {
public:
    Server(Config config, JobStore& store, SessionProvider& sessions, VideoHost& host);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    // In-process submission; the job is queued for render immediately.
    [[nodiscard]] SubmitResult submit(const JobSpec& spec) noexcept;

private:
    [[nodiscard]] bool acquireDaemonLock();
    void releaseDaemonLock() noexcept;
    [[nodiscard]] std::size_t recoverOrphanedJobs() noexcept;
    void failQueuedUploads(const std::vector<JobId>& ids) noexcept;
    bool queueRender(JobId id);
    void scanLoop();

    Config config_;
    JobStore& store_;
    SessionProvider& sessions_;
    VideoHost& host_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    int daemonLockFd_ = -1;

    std::unique_ptr<RenderWorker> renderWorker_;
    std::unique_ptr<UploadWorker> uploadWorker_;
    std::unique_ptr<Pool> renderPool_;
    std::unique_ptr<Pool> uploadPool_;
    std::unique_ptr<UploadScheduler> scheduler_;

    std::mutex submittedMutex_;
    std::unordered_set<JobId> submittedJobs_;

    std::thread scannerThread_;
    std::thread schedulerThread_;
};

}
