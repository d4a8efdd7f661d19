/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/config.hpp"
#include "loopcast/logger.hpp"
#include <cstdlib>
#include <stdexcept>

namespace loopcast {

namespace {
constexpr std::size_t kChunkQuantum = 256 * 1024;

std::size_t env_size(const char* name, std::size_t defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::logic_error&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

std::string env_string(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : defv;
}
}

Config Config::fromEnv(const std::filesystem::path& workspace) {
    Config config;
    config.workspace = workspace;
    config.encoderPath = env_string("LOOPCAST_FFMPEG", config.encoderPath);
    config.accelProbe = env_string("LOOPCAST_ACCEL_PROBE", config.accelProbe);
    config.renderWorkers = static_cast<int>(env_size("LOOPCAST_RENDER_WORKERS", 2));
    config.uploadWorkers = static_cast<int>(env_size("LOOPCAST_UPLOAD_WORKERS", 1));
    config.pollInterval = std::chrono::seconds(env_size("LOOPCAST_POLL_SECONDS", 20));
    config.scanInterval = std::chrono::seconds(env_size("LOOPCAST_SCAN_SECONDS", 2));
    config.tokenFile = env_string("LOOPCAST_TOKEN_FILE", (workspace / "token.json").string());
    config.secretsFile = env_string("LOOPCAST_SECRETS_FILE", (workspace / "client_secrets.json").string());
    config.chunkBytes = roundChunkSize(env_size("LOOPCAST_CHUNK_MB", 8) * 1024 * 1024);
    config.categoryId = env_string("LOOPCAST_CATEGORY", config.categoryId);
    return config;
}

std::size_t roundChunkSize(std::size_t bytes) noexcept {
    if (bytes < kChunkQuantum) {
        return kChunkQuantum;
    }
    return bytes - (bytes % kChunkQuantum);
}

}
