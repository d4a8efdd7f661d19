/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "loopcast/types.hpp"

namespace loopcast {

class JobStore;
class SessionProvider;
class VideoHost;

enum class UploadError : uint8_t {
    None = 0,
    AuthUnavailable,
    ArtifactMissing,
    UploadTransportFailure,
    StoreError
};

struct UploadResult {
    bool ok = false;
    UploadError error = UploadError::None;
    std::string message;
    std::string externalId;
    explicit operator bool() const noexcept { return ok; }
};

[[nodiscard]] const char* toString(UploadError error) noexcept;

struct UploadOptions {
    std::size_t chunkBytes = 8 * 1024 * 1024;
    std::string categoryId = "22";
};

struct UploadInput {
    JobId id = 0;
    std::string artifact;
    std::string title;
    std::string description;
    std::vector<std::string> tags;
};

/*
 * Publishes one rendered artifact. The job must already be in the uploading
 * state (the scheduler flips it before dispatch); the worker only moves it to
 * success or failed. The artifact is never removed.
 */
class UploadWorker final {
public:
    UploadWorker(JobStore& store, SessionProvider& sessions, VideoHost& host, UploadOptions options);

    UploadWorker(const UploadWorker&) = delete;
    UploadWorker& operator=(const UploadWorker&) = delete;

    [[nodiscard]] UploadResult run(JobId id) noexcept;
    [[nodiscard]] UploadResult run(const UploadInput& input) noexcept;

private:
    JobStore& store_;
    SessionProvider& sessions_;
    VideoHost& host_;
    UploadOptions options_;

    UploadResult fail(JobId id, UploadError error, const std::string& message) noexcept;
};

}
