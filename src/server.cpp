/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/server.hpp"
#include "loopcast/logger.hpp"
#include "loopcast/pool.hpp"
#include "loopcast/render.hpp"
#include "loopcast/scheduler.hpp"
#include "loopcast/store.hpp"
#include "loopcast/upload.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace loopcast {

// Signal handling is done by loopcastd, not here

Server::Server(Config config, JobStore& store, SessionProvider& sessions, VideoHost& host)
    : config_(std::move(config)), store_(store), sessions_(sessions), host_(host) {
    LOG_DEBUG("Server created - workspace: " + store_.workspace().string() +
              ", render workers: " + std::to_string(config_.renderWorkers) +
              ", upload workers: " + std::to_string(config_.uploadWorkers));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting loopcast server...");

    if (!store_.isOpen() && !store_.open()) {
        LOG_ERROR("Failed to open workspace " + store_.workspace().string());
        return false;
    }

    // Orphan recovery below is only sound while no other daemon serves the workspace
    if (!acquireDaemonLock()) {
        return false;
    }

    std::size_t orphans = recoverOrphanedJobs();
    if (orphans > 0) {
        LOG_WARN("Marked " + std::to_string(orphans) + " interrupted job(s) as failed");
    }

    setThreadName("Main");
    LOG_DEBUG("Encoder: " + config_.encoderPath + ", accelerator probe: " + config_.accelProbe);
    LOG_DEBUG("Poll interval: " + std::to_string(config_.pollInterval.count()) + "s, scan interval: " +
              std::to_string(config_.scanInterval.count()) + "s");

    try {
        RenderOptions renderOptions;
        renderOptions.encoder = config_.encoderPath;
        renderOptions.accelProbe = config_.accelProbe;
        renderOptions.outputDir = store_.outputDir();
        renderWorker_ = std::make_unique<RenderWorker>(store_, renderOptions);

        UploadOptions uploadOptions;
        uploadOptions.chunkBytes = config_.chunkBytes;
        uploadOptions.categoryId = config_.categoryId;
        uploadWorker_ = std::make_unique<UploadWorker>(store_, sessions_, host_, uploadOptions);

        renderPool_ = std::make_unique<Pool>("Render", config_.renderWorkers);
        uploadPool_ = std::make_unique<Pool>("Upload", config_.uploadWorkers);

        scheduler_ = std::make_unique<UploadScheduler>(store_, [this](JobId id) {
            if (!uploadPool_->submit(id)) {
                throw std::runtime_error("upload pool is not accepting jobs");
            }
        }, config_.pollInterval);

        // A finished render wakes the scheduler instead of waiting out the poll
        renderWorker_->setSuccessHook([this](JobId) { scheduler_->notify(); });

        if (!uploadPool_->start([this](JobId id, int) { (void)uploadWorker_->run(id); })) {
            LOG_ERROR("Failed to start upload pool");
            releaseDaemonLock();
            return false;
        }
        if (!renderPool_->start([this](JobId id, int) {
            (void)renderWorker_->run(id);
            std::lock_guard<std::mutex> lock(submittedMutex_);
            submittedJobs_.erase(id);
        })) {
            LOG_ERROR("Failed to start render pool");
            (void)uploadPool_->stop();
            releaseDaemonLock();
            return false;
        }

        shutdown_.store(false);
        running_.store(true);

        schedulerThread_ = std::thread([this] { scheduler_->run(); });
        scannerThread_ = std::thread(&Server::scanLoop, this);

        LOG_INFO("Server started");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        releaseDaemonLock();
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Shutting down server...");
    shutdown_.store(true);

    if (scannerThread_.joinable()) {
        scannerThread_.join();
    }
    if (scheduler_) {
        scheduler_->stop();
    }
    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }

    // In-flight renders and uploads run to completion. Queued renders are
    // still pending and get picked up on the next start; queued uploads were
    // already flipped to uploading and must not be left there.
    if (renderPool_) {
        (void)renderPool_->stop();
    }
    if (uploadPool_) {
        failQueuedUploads(uploadPool_->stop());
    }

    scheduler_.reset();
    renderPool_.reset();
    uploadPool_.reset();
    uploadWorker_.reset();
    renderWorker_.reset();
    releaseDaemonLock();

    LOG_INFO("Server shutdown complete");
}

SubmitResult Server::submit(const JobSpec& spec) noexcept {
    Work work(store_);
    SubmitResult result = work.submit(spec);
    if (result && running_.load()) {
        try {
            (void)queueRender(result.id);
        } catch (const std::exception& e) {
            // The scan loop picks the job up on its next pass
            LOG_WARN("Job " + std::to_string(result.id) + " not queued directly: " + e.what());
        }
    }
    return result;
}

bool Server::acquireDaemonLock() {
    auto path = store_.workspace() / ".loopcastd.lock";
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        LOG_ERROR("Cannot open " + path.string() + ": " + std::strerror(errno));
        return false;
    }
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            LOG_ERROR("Another loopcastd is already serving " + store_.workspace().string());
        } else {
            LOG_ERROR("Cannot lock " + path.string() + ": " + std::strerror(err));
        }
        return false;
    }
    daemonLockFd_ = fd;
    return true;
}

void Server::releaseDaemonLock() noexcept {
    if (daemonLockFd_ >= 0) {
        ::flock(daemonLockFd_, LOCK_UN);
        ::close(daemonLockFd_);
        daemonLockFd_ = -1;
    }
}

void Server::failQueuedUploads(const std::vector<JobId>& ids) noexcept {
    for (JobId id : ids) {
        try {
            auto marked = store_.updateUploadStatus(id, UploadStatus::Failed);
            if (!marked) {
                LOG_ERROR("Could not fail queued upload " + std::to_string(id) + ": " + marked.message);
                continue;
            }
            (void)store_.updateProgress(id, 0, "failed");
            auto job = store_.get(id);
            std::string artifact = job && job->outputArtifact ? *job->outputArtifact : "?";
            (void)store_.appendLog(id, "Upload failed: daemon stopped before the upload started. Artifact kept at " +
                                       artifact + ".");
            LOG_WARN("Job " + std::to_string(id) + " upload was queued at shutdown; marked failed");
        } catch (const std::exception& e) {
            LOG_ERROR("Could not fail queued upload " + std::to_string(id) + ": " + e.what());
        }
    }
}

std::size_t Server::recoverOrphanedJobs() noexcept {
    std::size_t marked = 0;

    for (const auto& job : store_.listByRenderStatus(RenderStatus::Rendering)) {
        LOG_WARN("Job " + std::to_string(job.id) + " was rendering when the daemon stopped");
        auto result = store_.updateRenderStatus(job.id, RenderStatus::Failed);
        if (!result) {
            LOG_ERROR("Could not fail interrupted job " + std::to_string(job.id) + ": " + result.message);
            continue;
        }
        (void)store_.updateProgress(job.id, job.progressPercent, "failed");
        (void)store_.appendLog(job.id, "Rendering failed: interrupted by daemon restart.");
        ++marked;
    }

    for (const auto& job : store_.listByUploadStatus(UploadStatus::Uploading)) {
        LOG_WARN("Job " + std::to_string(job.id) + " was uploading when the daemon stopped");
        auto result = store_.updateUploadStatus(job.id, UploadStatus::Failed);
        if (!result) {
            LOG_ERROR("Could not fail interrupted job " + std::to_string(job.id) + ": " + result.message);
            continue;
        }
        (void)store_.updateProgress(job.id, 0, "failed");
        (void)store_.appendLog(job.id, "Upload failed: interrupted by daemon restart. Artifact kept at " +
                                       job.outputArtifact.value_or("?") + ".");
        ++marked;
    }

    return marked;
}

bool Server::queueRender(JobId id) {
    std::lock_guard<std::mutex> lock(submittedMutex_);
    if (submittedJobs_.count(id) > 0) {
        return false;
    }
    if (!renderPool_->submit(id)) {
        return false;
    }
    submittedJobs_.insert(id);
    return true;
}

void Server::scanLoop() {
    setThreadName("Scanner");
    LOG_DEBUG("Scanner loop started");

    const auto scanInterval = config_.scanInterval;

    while (!shutdown_.load()) {
        try {
            int newCount = 0;
            for (const auto& job : store_.listByRenderStatus(RenderStatus::Pending)) {
                if (shutdown_.load()) break;
                if (queueRender(job.id)) {
                    newCount++;
                }
            }
            if (newCount > 0) {
                LOG_DEBUG("Queued " + std::to_string(newCount) + " pending job(s) for render");
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Scanner loop error: " + std::string(e.what()));
        }

        auto sleepEnd = std::chrono::steady_clock::now() + scanInterval;
        while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    LOG_DEBUG("Scanner loop stopped");
}

}
