/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/encoder.hpp"
#include "loopcast/logger.hpp"
#include "loopcast/process.hpp"

#include <cmath>
#include <cstdio>

namespace loopcast {

namespace {
// Millisecond resolution; whole seconds print without a fraction.
std::string formatDuration(double seconds) {
    long long millis = std::llround(seconds * 1000.0);
    if (millis % 1000 == 0) {
        return std::to_string(millis / 1000);
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%lld.%03lld", millis / 1000, millis % 1000);
    return buf;
}
}

CodecChoice selectCodec(bool accelerated) {
    if (accelerated) {
        return {"h264_nvenc", "p1", true};
    }
    return {"libx264", "ultrafast", false};
}

bool probeAccelerator(const std::string& probeCommand) {
    if (probeCommand.empty()) {
        return false;
    }
    auto code = runQuiet({probeCommand});
    bool present = code && *code == 0;
    LOG_DEBUG("Accelerator probe '" + probeCommand + "': " + (present ? "present" : "absent"));
    return present;
}

std::string videoFilter(WatermarkMode mode) {
    const std::string band = std::to_string(kBottomBand);
    switch (mode) {
        case WatermarkMode::None:
            return "";
        case WatermarkMode::CropOnly:
            return "crop=in_w:in_h-" + band + ":0:0";
        case WatermarkMode::Blur:
            return "delogo=x=0:y=h-" + band + ":w=w:h=" + band;
        case WatermarkMode::ZoomTopLeft:
            return "crop=in_w-" + std::to_string(kRightBand) + ":in_h-" + band +
                   ":0:0,scale=1920:1080:flags=lanczos";
    }
    return "";
}

std::string describeWatermark(WatermarkMode mode) {
    switch (mode) {
        case WatermarkMode::None:
            return "Watermark: none, original frame kept.";
        case WatermarkMode::CropOnly:
            return "Watermark: crop only, cutting bottom " + std::to_string(kBottomBand) + "px.";
        case WatermarkMode::Blur:
            return "Watermark: blur, obscuring bottom " + std::to_string(kBottomBand) + "px.";
        case WatermarkMode::ZoomTopLeft:
            return "Watermark: zoom top-left, cropping bottom " + std::to_string(kBottomBand) +
                   "px and right " + std::to_string(kRightBand) + "px, rescaling to 1920x1080.";
    }
    return "";
}

double targetSeconds(double hours) noexcept {
    return hours * 3600.0;
}

std::vector<std::string> buildEncodeCommand(const EncodeRequest& request) {
    std::vector<std::string> cmd = {
        request.encoder, "-hide_banner", "-nostdin", "-y",
        "-stream_loop", "-1", "-i", request.videoSource,
        "-stream_loop", "-1", "-i", request.audioSource
    };

    const std::string filter = videoFilter(request.watermarkMode);
    if (request.muteOriginal) {
        if (!filter.empty()) {
            cmd.insert(cmd.end(), {"-vf", filter});
        }
        cmd.insert(cmd.end(), {"-map", "0:v:0", "-map", "1:a:0"});
    } else {
        std::string graph;
        std::string videoOut = "0:v:0";
        if (!filter.empty()) {
            graph = "[0:v]" + filter + "[vout];";
            videoOut = "[vout]";
        }
        graph += "[0:a][1:a]amix=inputs=2:duration=shortest[aout]";
        cmd.insert(cmd.end(), {"-filter_complex", graph, "-map", videoOut, "-map", "[aout]"});
    }

    cmd.insert(cmd.end(), {
        "-t", formatDuration(targetSeconds(request.targetDurationHours)),
        "-c:v", request.codec.videoCodec, "-preset", request.codec.preset,
        "-c:a", "aac", "-b:a", "192k",
        request.outputPath
    });
    return cmd;
}

}
