/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/lifecycle.hpp"

namespace loopcast {

bool canTransition(RenderStatus from, RenderStatus to) noexcept {
    switch (from) {
        case RenderStatus::Pending:
            return to == RenderStatus::Rendering || to == RenderStatus::Failed;
        case RenderStatus::Rendering:
            return to == RenderStatus::Success || to == RenderStatus::Failed;
        case RenderStatus::Success:
        case RenderStatus::Failed:
            return false;
    }
    return false;
}

bool canTransition(UploadStatus from, UploadStatus to, RenderStatus render) noexcept {
    if (render != RenderStatus::Success) {
        return false;
    }
    switch (from) {
        case UploadStatus::Idle:
            return to == UploadStatus::WaitingSchedule;
        case UploadStatus::WaitingSchedule:
            return to == UploadStatus::Uploading;
        case UploadStatus::Uploading:
            return to == UploadStatus::Success || to == UploadStatus::Failed;
        case UploadStatus::Success:
        case UploadStatus::Failed:
            return false;
    }
    return false;
}

}
