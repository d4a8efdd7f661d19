/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace loopcast {

struct Config {
    std::filesystem::path workspace;

    std::string encoderPath = "ffmpeg";
    std::string accelProbe = "nvidia-smi";

    int renderWorkers = 2;
    int uploadWorkers = 1;

    std::chrono::seconds pollInterval{20};
    std::chrono::seconds scanInterval{2};

    std::filesystem::path tokenFile;
    std::filesystem::path secretsFile;
    std::size_t chunkBytes = 8 * 1024 * 1024;
    std::string categoryId = "22";

    // Defaults, then LOOPCAST_* environment overrides.
    [[nodiscard]] static Config fromEnv(const std::filesystem::path& workspace);
};

// Upload chunks must be a multiple of 256 KiB except the last one.
[[nodiscard]] std::size_t roundChunkSize(std::size_t bytes) noexcept;

}
