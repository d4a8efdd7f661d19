/*
 * loopcast - Job submission tool (lcsub)
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/logger.hpp"
#include "loopcast/store.hpp"
#include "loopcast/work.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace loopcast;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "loopcast Job Submission Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> --video <file> --audio <file> --title <text> [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Options:\n";
    std::cout << "  --video <file>        Video loop (mp4, mov)\n";
    std::cout << "  --audio <file>        Audio track (mp3, wav, aac)\n";
    std::cout << "  --hours <h>           Output duration, 0.1 to 24 (default 1)\n";
    std::cout << "  --watermark <mode>    none | crop_only | blur | zoom_top_left (default none)\n";
    std::cout << "  --mute                Use only the external audio track (default)\n";
    std::cout << "  --keep-audio          Mix the video's own audio with the external track\n";
    std::cout << "  --title <text>        Video title\n";
    std::cout << "  --description <text>  Video description\n";
    std::cout << "  --tags <a,b,c>        Comma-separated tags\n";
    std::cout << "  --schedule <time>     Publish time \"YYYY-MM-DD HH:MM\" local, or \"now\" (default)\n";
    std::cout << "  -h, --help            Show this help message\n";
    std::cout << "  -v, --version         Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  LOOPCAST_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./studio --video rain.mp4 --audio brown.mp3 --hours 8 \\\n";
    std::cout << "      --watermark crop_only --title \"8 Hours of Rain\" --tags rain,sleep \\\n";
    std::cout << "      --schedule \"2025-06-01 18:00\"\n";
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; LOOPCAST_LOG_LEVEL overrides
    if (!std::getenv("LOOPCAST_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

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
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace = argv[1];
    JobSpec spec;
    std::string schedule = "now";

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " requires a value");
            }
            return argv[++i];
        };
        try {
            if (arg == "--video") {
                spec.videoSource = value();
            } else if (arg == "--audio") {
                spec.audioSource = value();
            } else if (arg == "--hours") {
                std::string hours = value();
                try {
                    spec.targetDurationHours = std::stod(hours);
                } catch (const std::logic_error&) {
                    throw std::invalid_argument("Invalid duration: " + hours);
                }
            } else if (arg == "--watermark") {
                std::string mode = value();
                auto parsed = parseWatermarkMode(mode);
                if (!parsed) {
                    throw std::invalid_argument("Unknown watermark mode: " + mode);
                }
                spec.watermarkMode = *parsed;
            } else if (arg == "--mute") {
                spec.muteOriginal = true;
            } else if (arg == "--keep-audio") {
                spec.muteOriginal = false;
            } else if (arg == "--title") {
                spec.title = value();
            } else if (arg == "--description") {
                spec.description = value();
            } else if (arg == "--tags") {
                spec.tags = splitTags(value());
            } else if (arg == "--schedule") {
                schedule = value();
            } else {
                throw std::invalid_argument("Unknown option: " + arg);
            }
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    if (schedule == "now") {
        spec.scheduledAt = Clock::now();
    } else if (auto parsed = parseTime(schedule)) {
        spec.scheduledAt = *parsed;
    } else {
        std::cerr << "Error: Cannot parse schedule time: " << schedule << "\n";
        return 1;
    }

    try {
        JobStore store(workspace);
        if (!store.open()) {
            std::cerr << "Error: Cannot open workspace: " << workspace << "\n";
            return 1;
        }

        Work work(store);
        SubmitResult result = work.submit(spec);
        if (result.ok) {
            // Just the job ID - clean for piping
            std::cout << result.id << std::endl;
            return 0;
        }
        std::cerr << "Error: " << result.message << std::endl;
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
