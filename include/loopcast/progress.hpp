/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>

#include "loopcast/types.hpp"

namespace loopcast {

// Highest percent reported while the encoder is still running; 100 is only
// written once the exit code confirms success.
constexpr int kMaxRunningPercent = 99;

struct Estimate {
    int percent = 0;
    std::optional<double> speed;            // encoded seconds per wall second
    std::optional<double> remainingSeconds;
    std::optional<TimePoint> eta;
    std::string label;
};

// Finds "time=HH:MM:SS.ff" in one diagnostic line and returns total seconds.
[[nodiscard]] std::optional<double> parseEncodedTime(const std::string& line) noexcept;

// percent = min(99, floor(100*cur/target)); when cur > 0 and wall time has
// elapsed, speed = cur/elapsed and eta = now + (target-cur)/speed.
[[nodiscard]] Estimate estimate(double encodedSeconds, double targetSeconds,
                                double elapsedSeconds, TimePoint now);

// "1h 05m", "29m 00s", "42s"
[[nodiscard]] std::string formatRemaining(double seconds);

// Upload fraction (0..1) to an integer percent in [0,100].
[[nodiscard]] int fractionToPercent(double fraction) noexcept;

}
