/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include "loopcast/types.hpp"

namespace loopcast {

// Render: pending -> rendering -> {success | failed}. pending -> failed is
// also accepted for a job rejected before any worker claims it.
[[nodiscard]] bool canTransition(RenderStatus from, RenderStatus to) noexcept;

// Upload: idle -> waiting_schedule -> uploading -> {success | failed}.
// Nothing leaves idle/waiting_schedule unless the render succeeded.
[[nodiscard]] bool canTransition(UploadStatus from, UploadStatus to, RenderStatus render) noexcept;

[[nodiscard]] constexpr bool isTerminal(RenderStatus s) noexcept {
    return s == RenderStatus::Success || s == RenderStatus::Failed;
}

[[nodiscard]] constexpr bool isTerminal(UploadStatus s) noexcept {
    return s == UploadStatus::Success || s == UploadStatus::Failed;
}

// Upload phase owns progress/eta once the scheduler has claimed the job.
[[nodiscard]] constexpr bool uploadPhaseActive(UploadStatus s) noexcept {
    return s == UploadStatus::Uploading || isTerminal(s);
}

}
