/*
 * loopcast - Render and publish daemon (loopcastd)
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/config.hpp"
#include "loopcast/credentials.hpp"
#include "loopcast/encoder.hpp"
#include "loopcast/http.hpp"
#include "loopcast/logger.hpp"
#include "loopcast/platform.hpp"
#include "loopcast/process.hpp"
#include "loopcast/server.hpp"
#include "loopcast/store.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <thread>
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

using namespace loopcast;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "loopcast Render & Publish Daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> [options]\n";
    std::cout << "       " << progName << " --check\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --render-workers <n>  Concurrent renders (default 2)\n";
    std::cout << "  --upload-workers <n>      Concurrent uploads (default 1)\n";
    std::cout << "  --poll <seconds>          Upload schedule poll period (default 20)\n";
    std::cout << "  --check                   Report encoder and accelerator status\n";
    std::cout << "  -h, --help                Show this help message\n";
    std::cout << "  -v, --version             Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  LOOPCAST_LOG_LEVEL        Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  LOOPCAST_LOG_FILE         Also append log lines to this file\n";
    std::cout << "  LOOPCAST_FFMPEG           Encoder executable (default ffmpeg)\n";
    std::cout << "  LOOPCAST_ACCEL_PROBE      Accelerator probe command (default nvidia-smi)\n";
    std::cout << "  LOOPCAST_RENDER_WORKERS   Concurrent renders\n";
    std::cout << "  LOOPCAST_UPLOAD_WORKERS   Concurrent uploads\n";
    std::cout << "  LOOPCAST_POLL_SECONDS     Upload schedule poll period\n";
    std::cout << "  LOOPCAST_SCAN_SECONDS     Pending job scan period (default 2)\n";
    std::cout << "  LOOPCAST_TOKEN_FILE       OAuth token (default <workspace>/token.json)\n";
    std::cout << "  LOOPCAST_SECRETS_FILE     OAuth client secrets (default <workspace>/client_secrets.json)\n";
    std::cout << "  LOOPCAST_CHUNK_MB         Upload chunk size in MiB (default 8)\n";
    std::cout << "  LOOPCAST_CATEGORY         Platform category id (default 22)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./studio\n";
    std::cout << "  " << progName << " ./studio -w 1 --poll 10\n";
}

int runCheck() {
    Config config = Config::fromEnv(std::filesystem::current_path());
    auto encoder = findExecutable(config.encoderPath);
    bool accelerated = probeAccelerator(config.accelProbe);
    CodecChoice codec = selectCodec(accelerated);

    std::cout << "Encoder      " << (encoder ? *encoder : config.encoderPath + " (not found)") << "\n";
    std::cout << "Accelerator  " << (accelerated ? "detected" : "not detected") << "\n";
    std::cout << "Video codec  " << codec.videoCodec << " preset " << codec.preset << "\n";
    return encoder ? 0 : 2;
}

std::optional<pid_t> readPidFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    long pid = 0;
    file >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

int parsePositive(const char* value, const char* what) {
    int parsed = 0;
    try {
        parsed = std::stoi(value);
    } catch (const std::logic_error&) {
        parsed = 0;
    }
    if (parsed < 1) {
        throw std::invalid_argument(std::string("Invalid ") + what + ": " + value);
    }
    return parsed;
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
        if (arg == "--check") {
            return runCheck();
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::filesystem::path workspace = argv[1];
    Config config = Config::fromEnv(workspace);

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-w" || arg == "--render-workers") && i + 1 < argc) {
                config.renderWorkers = parsePositive(argv[++i], "worker count");
            } else if (arg == "--upload-workers" && i + 1 < argc) {
                config.uploadWorkers = parsePositive(argv[++i], "worker count");
            } else if (arg == "--poll" && i + 1 < argc) {
                config.pollInterval = std::chrono::seconds(parsePositive(argv[++i], "poll period"));
            } else {
                std::cerr << "Error: Unknown option: " << arg << "\n";
                return 1;
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::filesystem::path pidPath = workspace / ".loopcastd.pid";
    if (auto pid = readPidFile(pidPath); pid && *pid != getpid() && isProcessAlive(*pid)) {
        std::cerr << "Error: loopcastd is already running on " << workspace.string()
                  << " (pid " << *pid << ")\n";
        return 1;
    }

    try {
        JobStore store(workspace);
        if (!store.open()) {
            std::cerr << "Error: Cannot open workspace: " << workspace << "\n";
            return 1;
        }

        if (!findExecutable(config.encoderPath)) {
            LOG_WARN("Encoder " + config.encoderPath + " not found; renders will fail until it is installed");
        }
        if (!std::filesystem::exists(config.tokenFile)) {
            LOG_WARN("No token at " + config.tokenFile.string() + "; uploads will fail until authorized");
        }

        HttpClient http;
        TokenFileSessionProvider sessions(http, config.tokenFile, config.secretsFile);
        YouTubeHost host(http);
        Server server(config, store, sessions, host);

        if (!server.start()) {
            std::cerr << "Error: Failed to start\n";
            return 1;
        }

        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            }
        }

        std::cout << "loopcastd " << VERSION << " running\n";
        std::cout << "  Workspace       " << workspace.string() << "\n";
        std::cout << "  Render workers  " << config.renderWorkers << "\n";
        std::cout << "  Upload workers  " << config.uploadWorkers << "\n";
        std::cout << "  Poll            " << config.pollInterval.count() << "s\n";
        std::cout << "  Submit:  lcsub " << workspace.string() << " --video <file> --audio <file> ...\n";
        std::cout << "  Status:  lcls " << workspace.string() << " [job-id]\n" << std::flush;

        while (!g_shutdown_requested && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, waiting for running jobs..." << std::endl;
        }
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }
        server.shutdown();
        store.close();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("loopcast daemon stopped");
    return 0;
}
