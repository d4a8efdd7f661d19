/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/upload.hpp"
#include "loopcast/config.hpp"
#include "loopcast/credentials.hpp"
#include "loopcast/logger.hpp"
#include "loopcast/platform.hpp"
#include "loopcast/progress.hpp"
#include "loopcast/store.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace loopcast {

const char* toString(UploadError error) noexcept {
    switch (error) {
        case UploadError::None: return "none";
        case UploadError::AuthUnavailable: return "cannot authenticate";
        case UploadError::ArtifactMissing: return "artifact missing";
        case UploadError::UploadTransportFailure: return "transport failure";
        case UploadError::StoreError: return "store error";
    }
    return "unknown";
}

UploadWorker::UploadWorker(JobStore& store, SessionProvider& sessions, VideoHost& host,
                           UploadOptions options)
    : store_(store), sessions_(sessions), host_(host), options_(std::move(options)) {
    options_.chunkBytes = roundChunkSize(options_.chunkBytes);
}

UploadResult UploadWorker::run(JobId id) noexcept {
    auto job = store_.get(id);
    if (!job) {
        LOG_ERROR("Upload requested for unknown job " + std::to_string(id));
        return {false, UploadError::StoreError, "job not found", ""};
    }
    UploadInput input;
    input.id = job->id;
    input.artifact = job->outputArtifact.value_or("");
    input.title = job->spec.title;
    input.description = job->spec.description;
    input.tags = job->spec.tags;
    return run(input);
}

UploadResult UploadWorker::run(const UploadInput& input) noexcept {
    const JobId id = input.id;
    const std::string tag = "Job " + std::to_string(id);

    try {
        auto job = store_.get(id);
        if (!job) {
            return {false, UploadError::StoreError, "job not found", ""};
        }
        if (job->uploadStatus != UploadStatus::Uploading) {
            LOG_WARN(tag + " not in uploading state (" + toString(job->uploadStatus) + "), skipped");
            return {false, UploadError::StoreError,
                    std::string("job is ") + toString(job->uploadStatus), ""};
        }

        std::error_code ec;
        if (input.artifact.empty() || !std::filesystem::is_regular_file(input.artifact, ec)) {
            return fail(id, UploadError::ArtifactMissing, "Rendered file not found: " + input.artifact);
        }
        const std::uint64_t total = std::filesystem::file_size(input.artifact, ec);
        if (ec || total == 0) {
            return fail(id, UploadError::ArtifactMissing, "Rendered file is empty or unreadable: " + input.artifact);
        }

        SessionResult session = sessions_.acquire();
        if (!session) {
            return fail(id, UploadError::AuthUnavailable, session.message);
        }

        VideoMetadata metadata;
        metadata.title = input.title;
        metadata.description = input.description;
        metadata.tags = input.tags;
        metadata.categoryId = options_.categoryId;

        UploadSession upload = host_.startUpload(session.session, metadata, total);
        if (!upload) {
            return fail(id, UploadError::UploadTransportFailure, upload.error);
        }
        LOG_INFO(tag + " uploading " + std::to_string(total) + " bytes");

        std::ifstream file(input.artifact, std::ios::binary);
        if (!file) {
            return fail(id, UploadError::ArtifactMissing, "Cannot open " + input.artifact);
        }

        std::string chunk;
        std::uint64_t offset = 0;
        int lastPercent = -1;
        while (true) {
            std::size_t length = static_cast<std::size_t>(
                std::min<std::uint64_t>(options_.chunkBytes, total - offset));
            chunk.resize(length);
            file.clear();
            file.seekg(static_cast<std::streamoff>(offset));
            if (!file.read(&chunk[0], static_cast<std::streamsize>(length))) {
                return fail(id, UploadError::ArtifactMissing,
                            "Read failed at byte " + std::to_string(offset) + " of " + input.artifact);
            }

            // Sessions may expire during long uploads; the provider refreshes as needed.
            session = sessions_.acquire();
            if (!session) {
                return fail(id, UploadError::AuthUnavailable, session.message);
            }

            ChunkStatus status = host_.sendChunk(session.session, upload.uploadUrl, chunk, offset, total);
            if (!status) {
                return fail(id, UploadError::UploadTransportFailure,
                            "Chunk at byte " + std::to_string(offset) + ": " + status.error);
            }

            if (status.complete) {
                auto recorded = store_.setExternalId(id, status.videoId);
                if (!recorded) {
                    return fail(id, UploadError::StoreError, "Could not record platform id: " + recorded.message);
                }
                (void)store_.updateProgress(id, 100, "uploaded");
                auto done = store_.updateUploadStatus(id, UploadStatus::Success);
                if (!done) {
                    LOG_ERROR(tag + " could not mark upload success: " + done.message);
                    return {false, UploadError::StoreError, done.message, status.videoId};
                }
                (void)store_.appendLog(id, "Upload success! ID: " + status.videoId);
                LOG_INFO(tag + " published as " + status.videoId);
                return {true, UploadError::None, "", status.videoId};
            }

            if (status.committed <= offset || status.committed > total) {
                return fail(id, UploadError::UploadTransportFailure,
                            "Platform acknowledged no progress past byte " + std::to_string(offset));
            }
            offset = status.committed;

            int percent = fractionToPercent(static_cast<double>(offset) / static_cast<double>(total));
            if (percent >= 100) {
                percent = kMaxRunningPercent;
            }
            if (percent != lastPercent) {
                (void)store_.updateProgress(id, percent, "uploading");
                LOG_DEBUG(tag + " upload " + std::to_string(percent) + "%");
                lastPercent = percent;
            }
        }
    } catch (const std::exception& e) {
        return fail(id, UploadError::UploadTransportFailure, "Internal upload error: " + std::string(e.what()));
    }
}

UploadResult UploadWorker::fail(JobId id, UploadError error, const std::string& message) noexcept {
    LOG_WARN("Job " + std::to_string(id) + " upload failed (" + toString(error) + "): " + message);
    try {
        auto marked = store_.updateUploadStatus(id, UploadStatus::Failed);
        if (!marked) {
            LOG_ERROR("Job " + std::to_string(id) + " could not mark upload failed: " + marked.message);
        }
        (void)store_.updateProgress(id, 0, "failed");
        (void)store_.appendLog(id, "Upload failed: " + message);
    } catch (const std::exception& e) {
        LOG_ERROR("Job " + std::to_string(id) + " could not record upload failure: " + e.what());
    }
    return {false, error, message, ""};
}

}
