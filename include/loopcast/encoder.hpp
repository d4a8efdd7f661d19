/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <vector>

#include "loopcast/types.hpp"

namespace loopcast {

// Height of the bottom overlay band and width of the right band removed by zoom_top_left.
constexpr int kBottomBand = 86;
constexpr int kRightBand = 150;

struct CodecChoice {
    std::string videoCodec;
    std::string preset;
    bool accelerated = false;
};

struct EncodeRequest {
    std::string encoder;
    std::string videoSource;
    std::string audioSource;
    double targetDurationHours = 1.0;
    WatermarkMode watermarkMode = WatermarkMode::None;
    bool muteOriginal = true;
    CodecChoice codec;
    std::string outputPath;
};

[[nodiscard]] CodecChoice selectCodec(bool accelerated);

// True when the probe command exists and exits 0.
[[nodiscard]] bool probeAccelerator(const std::string& probeCommand);

// Geometric filter chain for a watermark mode; empty for none.
[[nodiscard]] std::string videoFilter(WatermarkMode mode);

[[nodiscard]] std::string describeWatermark(WatermarkMode mode);

[[nodiscard]] double targetSeconds(double hours) noexcept;

// Full argv, program first. Both inputs loop forever; -t cuts the output.
[[nodiscard]] std::vector<std::string> buildEncodeCommand(const EncodeRequest& request);

}
