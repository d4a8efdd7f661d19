/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/work.hpp"
#include "loopcast/logger.hpp"
#include "loopcast/store.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <vector>

namespace loopcast {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool validateSource(std::string& source, const char* kind,
                    const std::vector<std::string>& extensions, std::string& error) {
    if (source.empty()) {
        error = std::string(kind) + " source is required";
        return false;
    }
    std::filesystem::path path(source);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        error = std::string(kind) + " file not found: " + source;
        return false;
    }
    std::string ext = toLowerCopy(path.extension().string());
    if (std::find(extensions.begin(), extensions.end(), ext) == extensions.end()) {
        error = std::string("Unsupported ") + kind + " extension: " + source;
        return false;
    }
    // The daemon may run from another directory
    auto absolute = std::filesystem::absolute(path, ec);
    if (!ec) {
        source = absolute.lexically_normal().string();
    }
    return true;
}
}

const char* toString(SubmissionError error) noexcept {
    switch (error) {
        case SubmissionError::None: return "none";
        case SubmissionError::InvalidSource: return "invalid source";
        case SubmissionError::InvalidDuration: return "invalid duration";
        case SubmissionError::InvalidMetadata: return "invalid metadata";
        case SubmissionError::InvalidSchedule: return "invalid schedule";
        case SubmissionError::StoreError: return "store error";
    }
    return "unknown";
}

Work::Work(JobStore& store) noexcept : store_(store) {}

SubmitResult Work::validate(JobSpec& spec) {
    static const std::vector<std::string> videoExt = {".mp4", ".mov"};
    static const std::vector<std::string> audioExt = {".mp3", ".wav", ".aac"};

    SubmitResult result;
    std::string error;
    if (!validateSource(spec.videoSource, "video", videoExt, error) ||
        !validateSource(spec.audioSource, "audio", audioExt, error)) {
        result.error = SubmissionError::InvalidSource;
        result.message = error;
        return result;
    }

    if (!std::isfinite(spec.targetDurationHours) ||
        spec.targetDurationHours < kMinDurationHours ||
        spec.targetDurationHours > kMaxDurationHours) {
        result.error = SubmissionError::InvalidDuration;
        result.message = "Duration must be between 0.1 and 24 hours";
        return result;
    }

    if (spec.title.empty()) {
        result.error = SubmissionError::InvalidMetadata;
        result.message = "Title is required";
        return result;
    }
    if (spec.title.size() > kMaxTitleLength) {
        result.error = SubmissionError::InvalidMetadata;
        result.message = "Title exceeds " + std::to_string(kMaxTitleLength) + " characters";
        return result;
    }
    if (spec.description.size() > kMaxDescriptionLength) {
        result.error = SubmissionError::InvalidMetadata;
        result.message = "Description exceeds " + std::to_string(kMaxDescriptionLength) + " characters";
        return result;
    }

    if (spec.scheduledAt == TimePoint{}) {
        result.error = SubmissionError::InvalidSchedule;
        result.message = "Scheduled time is required";
        return result;
    }

    result.ok = true;
    return result;
}

SubmitResult Work::submit(const JobSpec& input) noexcept {
    try {
        JobSpec spec = input;
        SubmitResult result = validate(spec);
        if (!result) {
            LOG_WARN("Submission rejected: " + result.message);
            return result;
        }

        auto created = store_.create(spec);
        if (!created) {
            LOG_ERROR("Could not record job: " + created.message);
            return {false, 0, SubmissionError::StoreError, created.message};
        }
        LOG_INFO("Job " + std::to_string(created.id) + " submitted: \"" + spec.title +
                 "\", scheduled " + formatTime(spec.scheduledAt));
        return {true, created.id, SubmissionError::None, ""};
    } catch (const std::exception& e) {
        return {false, 0, SubmissionError::StoreError, e.what()};
    }
}

}
