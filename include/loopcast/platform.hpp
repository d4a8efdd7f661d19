/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "loopcast/credentials.hpp"

namespace loopcast {

class HttpClient;

struct VideoMetadata {
    std::string title;
    std::string description;
    std::vector<std::string> tags;
    std::string categoryId = "22";
    std::string privacy = "private";
    bool madeForKids = false;
};

struct UploadSession {
    bool ok = false;
    std::string uploadUrl;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

struct ChunkStatus {
    bool ok = false;
    bool complete = false;
    std::uint64_t committed = 0;    // bytes the host has durably received
    std::string videoId;            // set once complete
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Resumable chunked upload against a video hosting platform.
class VideoHost {
public:
    virtual ~VideoHost() = default;

    [[nodiscard]] virtual UploadSession startUpload(const Session& session,
                                                    const VideoMetadata& metadata,
                                                    std::uint64_t totalBytes) = 0;

    // Sends bytes [offset, offset+data.size()) of a totalBytes file.
    [[nodiscard]] virtual ChunkStatus sendChunk(const Session& session,
                                                const std::string& uploadUrl,
                                                const std::string& data,
                                                std::uint64_t offset,
                                                std::uint64_t totalBytes) = 0;
};

class YouTubeHost final : public VideoHost {
public:
    explicit YouTubeHost(const HttpClient& http);

    [[nodiscard]] UploadSession startUpload(const Session& session,
                                            const VideoMetadata& metadata,
                                            std::uint64_t totalBytes) override;
    [[nodiscard]] ChunkStatus sendChunk(const Session& session,
                                        const std::string& uploadUrl,
                                        const std::string& data,
                                        std::uint64_t offset,
                                        std::uint64_t totalBytes) override;

private:
    const HttpClient& http_;
};

// "bytes=0-262143" -> 262144; absent or malformed -> 0
[[nodiscard]] std::uint64_t parseCommittedRange(const std::string& rangeHeader) noexcept;

}
