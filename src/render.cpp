/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/render.hpp"
#include "loopcast/encoder.hpp"
#include "loopcast/logger.hpp"
#include "loopcast/process.hpp"
#include "loopcast/progress.hpp"
#include "loopcast/store.hpp"

#include <chrono>
#include <deque>
#include <sstream>

namespace loopcast {

namespace {
std::string joinCommand(const std::vector<std::string>& argv) {
    std::ostringstream out;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i) out << ' ';
        if (argv[i].find(' ') != std::string::npos) {
            out << '"' << argv[i] << '"';
        } else {
            out << argv[i];
        }
    }
    return out.str();
}

std::string joinTail(const std::deque<std::string>& tail) {
    std::string text;
    for (const auto& line : tail) {
        text += line;
        text += '\n';
    }
    return text;
}

std::string outputFileName(JobId id) {
    auto unix = std::chrono::duration_cast<std::chrono::seconds>(
        Clock::now().time_since_epoch()).count();
    return "loop_" + std::to_string(id) + "_" + std::to_string(unix) + ".mp4";
}
}

const char* toString(RenderError error) noexcept {
    switch (error) {
        case RenderError::None: return "none";
        case RenderError::ToolUnavailable: return "encoder unavailable";
        case RenderError::SpawnFailure: return "spawn failure";
        case RenderError::EncodeFailure: return "encode failure";
        case RenderError::StoreError: return "store error";
    }
    return "unknown";
}

RenderWorker::RenderWorker(JobStore& store, RenderOptions options)
    : store_(store), options_(std::move(options)) {
    if (options_.outputDir.empty()) {
        options_.outputDir = store_.outputDir();
    }
}

RenderResult RenderWorker::run(JobId id) noexcept {
    auto job = store_.get(id);
    if (!job) {
        LOG_ERROR("Render requested for unknown job " + std::to_string(id));
        return {false, RenderError::StoreError, "job not found", ""};
    }
    RenderInput input;
    input.id = job->id;
    input.videoSource = job->spec.videoSource;
    input.audioSource = job->spec.audioSource;
    input.targetDurationHours = job->spec.targetDurationHours;
    input.watermarkMode = job->spec.watermarkMode;
    input.muteOriginal = job->spec.muteOriginal;
    return run(input);
}

RenderResult RenderWorker::run(const RenderInput& input) noexcept {
    const JobId id = input.id;
    const std::string tag = "Job " + std::to_string(id);

    try {
        // Step 1: claim the job; only one worker can move it out of pending
        auto claimed = store_.updateRenderStatus(id, RenderStatus::Rendering);
        if (!claimed) {
            LOG_WARN(tag + " not claimed for render: " + claimed.message);
            return {false, RenderError::StoreError, claimed.message, ""};
        }

        // Step 2: the encoder must exist before anything is spawned
        auto encoder = findExecutable(options_.encoder);
        if (!encoder) {
            return fail(id, RenderError::ToolUnavailable,
                        "Encoder not found: " + options_.encoder, "");
        }

        // Step 3: encoder selection is re-detected for every job
        EncodeRequest request;
        request.encoder = *encoder;
        request.videoSource = input.videoSource;
        request.audioSource = input.audioSource;
        request.targetDurationHours = input.targetDurationHours;
        request.watermarkMode = input.watermarkMode;
        request.muteOriginal = input.muteOriginal;
        request.codec = selectCodec(probeAccelerator(options_.accelProbe));
        request.outputPath = (options_.outputDir / outputFileName(id)).string();

        (void)store_.appendLog(id, std::string("Render started. ") +
            (request.codec.accelerated ? "Accelerator detected, using " : "No accelerator, using ") +
            request.codec.videoCodec + " preset " + request.codec.preset + ".");
        (void)store_.appendLog(id, describeWatermark(input.watermarkMode));
        (void)store_.appendLog(id, input.muteOriginal
            ? "Audio: external track only."
            : "Audio: original mixed with external track, shorter of the two.");
        (void)store_.updateProgress(id, 0, "starting");

        auto argv = buildEncodeCommand(request);
        LOG_INFO(tag + " render: " + joinCommand(argv));

        // Step 4: supervise the encoder
        Process process;
        std::string spawnError;
        if (!process.spawn(argv, spawnError)) {
            return fail(id, RenderError::SpawnFailure, "Could not start encoder: " + spawnError, "");
        }

        const double target = targetSeconds(input.targetDurationHours);
        const auto started = std::chrono::steady_clock::now();
        std::deque<std::string> tail;
        int lastPercent = -1;

        std::string line;
        while (process.readLine(line)) {
            tail.push_back(line);
            if (tail.size() > options_.tailLines) {
                tail.pop_front();
            }

            auto encoded = parseEncodedTime(line);
            if (!encoded) {
                continue;
            }
            double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
            Estimate est = estimate(*encoded, target, elapsed, Clock::now());
            auto pushed = store_.updateProgress(id, est.percent, est.label);
            if (!pushed) {
                LOG_WARN(tag + " progress update failed: " + pushed.message);
            }
            if (est.percent != lastPercent) {
                LOG_DEBUG(tag + " " + std::to_string(est.percent) + "% " + est.label);
                lastPercent = est.percent;
            }
        }

        int exitCode = process.wait();
        if (exitCode != 0) {
            return fail(id, RenderError::EncodeFailure,
                        "Encoder exited with code " + std::to_string(exitCode), joinTail(tail));
        }

        // Step 5: exit code confirmed, finalize
        auto rendered = store_.completeRender(id, request.outputPath);
        if (rendered.error == StoreError::IllegalTransition) {
            // Someone else settled the job while the encoder ran; leave it as found
            LOG_ERROR(tag + " could not mark render success: " + rendered.message);
            return {false, RenderError::StoreError, rendered.message, ""};
        }
        if (!rendered) {
            return fail(id, RenderError::StoreError, "Could not record output: " + rendered.message, "");
        }
        (void)store_.updateProgress(id, 100, "done");
        auto waiting = store_.updateUploadStatus(id, UploadStatus::WaitingSchedule);
        if (!waiting) {
            LOG_ERROR(tag + " could not queue upload: " + waiting.message);
            return {false, RenderError::StoreError, waiting.message, request.outputPath};
        }
        (void)store_.appendLog(id, "Render finished: " + request.outputPath + ". Waiting for schedule time.");

        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        LOG_INFO(tag + " rendered in " + formatRemaining(elapsed) + " -> " + request.outputPath);

        if (successHook_) {
            successHook_(id);
        }
        return {true, RenderError::None, "", request.outputPath};

    } catch (const std::exception& e) {
        return fail(id, RenderError::StoreError, "Internal render error: " + std::string(e.what()), "");
    }
}

RenderResult RenderWorker::fail(JobId id, RenderError error, const std::string& message,
                                const std::string& tail) noexcept {
    LOG_WARN("Job " + std::to_string(id) + " render failed (" + toString(error) + "): " + message);
    try {
        auto marked = store_.updateRenderStatus(id, RenderStatus::Failed);
        if (!marked) {
            LOG_ERROR("Job " + std::to_string(id) + " could not mark render failed: " + marked.message);
        }
        (void)store_.updateProgress(id, 0, "failed");
        std::string entry = "Rendering failed: " + message;
        if (!tail.empty()) {
            entry += "\n" + tail;
        }
        (void)store_.appendLog(id, entry);
    } catch (const std::exception& e) {
        LOG_ERROR("Job " + std::to_string(id) + " could not record render failure: " + e.what());
    }
    return {false, error, message, ""};
}

}
