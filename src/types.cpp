/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/types.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace loopcast {

namespace {
std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}
}

const char* toString(RenderStatus status) noexcept {
    switch (status) {
        case RenderStatus::Pending: return "pending";
        case RenderStatus::Rendering: return "rendering";
        case RenderStatus::Success: return "success";
        case RenderStatus::Failed: return "failed";
    }
    return "unknown";
}

const char* toString(UploadStatus status) noexcept {
    switch (status) {
        case UploadStatus::Idle: return "idle";
        case UploadStatus::WaitingSchedule: return "waiting_schedule";
        case UploadStatus::Uploading: return "uploading";
        case UploadStatus::Success: return "success";
        case UploadStatus::Failed: return "failed";
    }
    return "unknown";
}

const char* toString(WatermarkMode mode) noexcept {
    switch (mode) {
        case WatermarkMode::None: return "none";
        case WatermarkMode::CropOnly: return "crop_only";
        case WatermarkMode::Blur: return "blur";
        case WatermarkMode::ZoomTopLeft: return "zoom_top_left";
    }
    return "unknown";
}

std::optional<RenderStatus> parseRenderStatus(const std::string& text) noexcept {
    if (text == "pending") return RenderStatus::Pending;
    if (text == "rendering") return RenderStatus::Rendering;
    if (text == "success") return RenderStatus::Success;
    if (text == "failed") return RenderStatus::Failed;
    return std::nullopt;
}

std::optional<UploadStatus> parseUploadStatus(const std::string& text) noexcept {
    if (text == "idle") return UploadStatus::Idle;
    if (text == "waiting_schedule") return UploadStatus::WaitingSchedule;
    if (text == "uploading") return UploadStatus::Uploading;
    if (text == "success") return UploadStatus::Success;
    if (text == "failed") return UploadStatus::Failed;
    return std::nullopt;
}

std::optional<WatermarkMode> parseWatermarkMode(const std::string& text) noexcept {
    if (text == "none") return WatermarkMode::None;
    if (text == "crop_only") return WatermarkMode::CropOnly;
    if (text == "blur") return WatermarkMode::Blur;
    if (text == "zoom_top_left" || text == "zoom_tl") return WatermarkMode::ZoomTopLeft;
    return std::nullopt;
}

std::optional<JobId> parseJobId(const std::string& text) noexcept {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        unsigned long long value = std::stoull(text, &consumed);
        if (consumed != text.size() || value == 0) {
            return std::nullopt;
        }
        return static_cast<JobId>(value);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::vector<std::string> splitTags(const std::string& csv) {
    std::vector<std::string> tags;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            tags.push_back(item);
        }
    }
    return tags;
}

std::string formatTime(TimePoint tp) {
    auto time = Clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&time, &local);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return buf;
}

std::optional<TimePoint> parseTime(const std::string& text) {
    std::string value = trim(text);
    std::replace(value.begin(), value.end(), 'T', ' ');

    for (const char* format : {"%Y-%m-%d %H:%M:%S", "%Y-%m-%d %H:%M"}) {
        std::tm tm{};
        std::istringstream in(value);
        in >> std::get_time(&tm, format);
        if (in.fail()) {
            continue;
        }
        in >> std::ws;
        if (!in.eof()) {
            continue;
        }
        tm.tm_isdst = -1;
        std::time_t t = std::mktime(&tm);
        if (t == static_cast<std::time_t>(-1)) {
            return std::nullopt;
        }
        return Clock::from_time_t(t);
    }
    return std::nullopt;
}

} // namespace loopcast
