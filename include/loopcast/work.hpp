/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "loopcast/types.hpp"

namespace loopcast {

class JobStore;

constexpr double kMinDurationHours = 0.1;
constexpr double kMaxDurationHours = 24.0;
constexpr std::size_t kMaxTitleLength = 100;
constexpr std::size_t kMaxDescriptionLength = 5000;

enum class SubmissionError : uint8_t {
    None = 0,
    InvalidSource,
    InvalidDuration,
    InvalidMetadata,
    InvalidSchedule,
    StoreError
};

struct SubmitResult {
    bool ok = false;
    JobId id = 0;
    SubmissionError error = SubmissionError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

[[nodiscard]] const char* toString(SubmissionError error) noexcept;

// Validates a submission and records it as a pending job.
class Work final {
public:
    explicit Work(JobStore& store) noexcept;

    Work(const Work&) = delete;
    Work& operator=(const Work&) = delete;

    [[nodiscard]] SubmitResult submit(const JobSpec& spec) noexcept;

private:
    JobStore& store_;

    [[nodiscard]] static SubmitResult validate(JobSpec& spec);
};

}
