/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/platform.hpp"
#include "loopcast/http.hpp"
#include "loopcast/logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>

namespace loopcast {

using json = nlohmann::json;

namespace {
constexpr const char* kUploadEndpoint =
    "https://www.googleapis.com/upload/youtube/v3/videos?uploadType=resumable&part=snippet,status";

std::string bearer(const Session& session) {
    return "Authorization: Bearer " + session.accessToken;
}

std::string describeFailure(const HttpResponse& response) {
    if (!response.ok) {
        return response.error;
    }
    std::string text = "HTTP " + std::to_string(response.status);
    try {
        auto body = json::parse(response.body);
        if (body.contains("error") && body["error"].contains("message")) {
            text += ": " + body["error"]["message"].get<std::string>();
            return text;
        }
    } catch (const json::exception&) {
    }
    if (!response.body.empty()) {
        text += ": " + response.body.substr(0, 200);
    }
    return text;
}
}

std::uint64_t parseCommittedRange(const std::string& rangeHeader) noexcept {
    auto dash = rangeHeader.rfind('-');
    if (dash == std::string::npos || dash + 1 >= rangeHeader.size()) {
        return 0;
    }
    const char* begin = rangeHeader.c_str() + dash + 1;
    char* end = nullptr;
    unsigned long long last = std::strtoull(begin, &end, 10);
    if (end == begin) {
        return 0;
    }
    return static_cast<std::uint64_t>(last) + 1;
}

YouTubeHost::YouTubeHost(const HttpClient& http) : http_(http) {}

UploadSession YouTubeHost::startUpload(const Session& session,
                                       const VideoMetadata& metadata,
                                       std::uint64_t totalBytes) {
    json body = {
        {"snippet", {
            {"title", metadata.title},
            {"description", metadata.description},
            {"tags", metadata.tags},
            {"categoryId", metadata.categoryId},
        }},
        {"status", {
            {"privacyStatus", metadata.privacy},
            {"selfDeclaredMadeForKids", metadata.madeForKids},
        }},
    };

    HttpRequest request;
    request.method = "POST";
    request.url = kUploadEndpoint;
    request.headers = {
        bearer(session),
        "Content-Type: application/json; charset=UTF-8",
        "X-Upload-Content-Type: video/mp4",
        "X-Upload-Content-Length: " + std::to_string(totalBytes),
    };
    request.body = body.dump();
    request.timeoutMs = 60000;

    HttpResponse response = http_.perform(request);
    if (!response.ok || response.status != 200) {
        return {false, "", "Could not open upload session: " + describeFailure(response)};
    }
    auto location = response.headers.find("location");
    if (location == response.headers.end() || location->second.empty()) {
        return {false, "", "Upload session response carried no location"};
    }
    LOG_DEBUG("Upload session opened for " + std::to_string(totalBytes) + " bytes");
    return {true, location->second, ""};
}

ChunkStatus YouTubeHost::sendChunk(const Session& session,
                                   const std::string& uploadUrl,
                                   const std::string& data,
                                   std::uint64_t offset,
                                   std::uint64_t totalBytes) {
    ChunkStatus status;
    if (data.empty()) {
        status.error = "empty chunk";
        return status;
    }

    const std::uint64_t last = offset + data.size() - 1;
    HttpRequest request;
    request.method = "PUT";
    request.url = uploadUrl;
    request.headers = {
        bearer(session),
        "Content-Type: video/mp4",
        "Content-Range: bytes " + std::to_string(offset) + "-" + std::to_string(last) +
            "/" + std::to_string(totalBytes),
        "Expect:",
    };
    request.body = data;

    HttpResponse response = http_.perform(request);
    if (!response.ok) {
        status.error = describeFailure(response);
        return status;
    }

    if (response.status == 308) {
        auto range = response.headers.find("range");
        status.ok = true;
        status.committed = range == response.headers.end() ? 0 : parseCommittedRange(range->second);
        return status;
    }

    if (response.status == 200 || response.status == 201) {
        try {
            auto body = json::parse(response.body);
            status.videoId = body.value("id", "");
        } catch (const json::exception& e) {
            status.error = "Unreadable upload response: " + std::string(e.what());
            return status;
        }
        if (status.videoId.empty()) {
            status.error = "Upload response carried no video id";
            return status;
        }
        status.ok = true;
        status.complete = true;
        status.committed = totalBytes;
        return status;
    }

    status.error = describeFailure(response);
    return status;
}

}
