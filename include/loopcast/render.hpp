/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

#include "loopcast/types.hpp"

namespace loopcast {

class JobStore;

enum class RenderError : uint8_t {
    None = 0,
    ToolUnavailable,
    SpawnFailure,
    EncodeFailure,
    StoreError
};

struct RenderResult {
    bool ok = false;
    RenderError error = RenderError::None;
    std::string message;
    std::string outputPath;
    explicit operator bool() const noexcept { return ok; }
};

[[nodiscard]] const char* toString(RenderError error) noexcept;

struct RenderOptions {
    std::string encoder = "ffmpeg";
    std::string accelProbe = "nvidia-smi";
    std::filesystem::path outputDir;
    std::size_t tailLines = 20;
};

struct RenderInput {
    JobId id = 0;
    std::string videoSource;
    std::string audioSource;
    double targetDurationHours = 1.0;
    WatermarkMode watermarkMode = WatermarkMode::None;
    bool muteOriginal = true;
};

class RenderWorker final {
public:
    using SuccessHook = std::function<void(JobId)>;

    RenderWorker(JobStore& store, RenderOptions options);

    RenderWorker(const RenderWorker&) = delete;
    RenderWorker& operator=(const RenderWorker&) = delete;

    // Called after a job becomes upload-eligible.
    void setSuccessHook(SuccessHook hook) { successHook_ = std::move(hook); }

    // Loads the job from the store and renders it.
    [[nodiscard]] RenderResult run(JobId id) noexcept;
    [[nodiscard]] RenderResult run(const RenderInput& input) noexcept;

private:
    JobStore& store_;
    RenderOptions options_;
    SuccessHook successHook_;

    RenderResult fail(JobId id, RenderError error, const std::string& message, const std::string& tail) noexcept;
};

}
