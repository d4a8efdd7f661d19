/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "loopcast/types.hpp"

namespace loopcast {

enum class StoreError : uint8_t {
    None = 0,
    NotFound,
    IoError,
    IllegalTransition,
    AlreadySet,
    InvalidValue,
    Closed
};

struct StoreResult {
    bool ok = false;
    StoreError error = StoreError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct CreateResult {
    bool ok = false;
    JobId id = 0;
    StoreError error = StoreError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

[[nodiscard]] const char* toString(StoreError error) noexcept;

/*
 * Job table persisted in a workspace directory:
 *
 *   <ws>/jobs/<id>/job.json         immutable submission fields
 *   <ws>/jobs/<id>/render           render_status
 *   <ws>/jobs/<id>/upload           upload_status
 *   <ws>/jobs/<id>/render_progress  "<percent>\n<eta label>"
 *   <ws>/jobs/<id>/upload_progress
 *   <ws>/jobs/<id>/output           output artifact (write-once)
 *   <ws>/jobs/<id>/external_id      platform id (write-once)
 *   <ws>/jobs/<id>/log              append-only, timestamped
 *
 * Every field write lands with a rename, so readers never see a partial value.
 * Read-modify-write operations hold an exclusive flock on <ws>/.lock, which
 * serialises threads of this process and other processes (lcsub) alike.
 */
class JobStore final {
public:
    explicit JobStore(const std::filesystem::path& workspace) noexcept;
    ~JobStore();

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;
    JobStore(JobStore&&) = delete;
    JobStore& operator=(JobStore&&) = delete;

    // Creates the workspace layout when missing.
    [[nodiscard]] bool open(bool createIfMissing = true) noexcept;
    void close() noexcept;
    [[nodiscard]] bool isOpen() const noexcept { return open_.load(); }

    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }
    [[nodiscard]] std::filesystem::path outputDir() const { return workspace_ / "outputs"; }

    [[nodiscard]] CreateResult create(const JobSpec& spec) noexcept;
    [[nodiscard]] std::optional<Job> get(JobId id) const noexcept;
    [[nodiscard]] std::vector<Job> listAll() const noexcept;
    // render_status = success AND upload_status = waiting_schedule
    [[nodiscard]] std::vector<Job> listReadyForUpload() const noexcept;
    [[nodiscard]] std::vector<Job> listByRenderStatus(RenderStatus status) const noexcept;
    [[nodiscard]] std::vector<Job> listByUploadStatus(UploadStatus status) const noexcept;

    // Guarded by the transition tables in lifecycle.hpp; a rejected transition
    // leaves the record untouched and reports IllegalTransition.
    [[nodiscard]] StoreResult updateRenderStatus(JobId id, RenderStatus status) noexcept;
    [[nodiscard]] StoreResult updateUploadStatus(JobId id, UploadStatus status) noexcept;

    [[nodiscard]] StoreResult setOutputArtifact(JobId id, const std::string& artifact) noexcept;
    [[nodiscard]] StoreResult setExternalId(JobId id, const std::string& externalId) noexcept;

    // rendering -> success together with the output artifact, under one lock.
    // Nothing is written unless the job is still rendering.
    [[nodiscard]] StoreResult completeRender(JobId id, const std::string& artifact) noexcept;

    // Clamped to [0,100]. Routed to the active phase; render progress never decreases.
    [[nodiscard]] StoreResult updateProgress(JobId id, int percent, const std::string& etaLabel) noexcept;

    [[nodiscard]] StoreResult appendLog(JobId id, const std::string& message) noexcept;

private:
    std::filesystem::path workspace_;
    std::atomic<bool> open_{false};

    [[nodiscard]] std::filesystem::path jobDir(JobId id) const;
    [[nodiscard]] std::optional<Job> readJob(const std::filesystem::path& dir) const;
    [[nodiscard]] std::vector<Job> listMatching(bool (*match)(const Job&, const void*), const void* arg) const noexcept;
    [[nodiscard]] JobId allocateId();
    [[nodiscard]] StoreResult precheck(JobId id) const;
    [[nodiscard]] StoreResult setOnce(JobId id, const char* field, const std::string& value) noexcept;
};

}
