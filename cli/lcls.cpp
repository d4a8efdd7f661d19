/*
 * loopcast - Job status tool (lcls)
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/lifecycle.hpp"
#include "loopcast/logger.hpp"
#include "loopcast/store.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace loopcast;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "loopcast Job Status Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace>                list all jobs\n";
    std::cout << "       " << progName << " <workspace> <job-id> [-w]   show one job\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --wait     Block until the job reaches a terminal state\n";
    std::cout << "  -h, --help     Show this help message\n";
    std::cout << "  -v, --version  Show version\n\n";
    std::cout << "Exit codes (single job): 0 published, 1 failed or error, 2 not finished\n";
}

std::string progressCell(const Job& job) {
    std::string cell = std::to_string(job.progressPercent) + "%";
    if (!job.etaLabel.empty()) {
        cell += " " + job.etaLabel;
    }
    return cell;
}

void printTable(const std::vector<Job>& jobs) {
    std::cout << std::left
              << std::setw(6) << "ID"
              << std::setw(32) << "TITLE"
              << std::setw(11) << "RENDER"
              << std::setw(18) << "UPLOAD"
              << std::setw(21) << "SCHEDULED"
              << "PROGRESS\n";
    for (const auto& job : jobs) {
        std::string title = job.spec.title;
        if (title.size() > 30) {
            title = title.substr(0, 27) + "...";
        }
        std::cout << std::left
                  << std::setw(6) << job.id
                  << std::setw(32) << title
                  << std::setw(11) << toString(job.renderStatus)
                  << std::setw(18) << toString(job.uploadStatus)
                  << std::setw(21) << formatTime(job.spec.scheduledAt)
                  << progressCell(job) << "\n";
    }
}

void printJob(const Job& job) {
    std::cout << "Job " << job.id << ": " << job.spec.title << "\n";
    std::cout << "  Video       " << job.spec.videoSource << "\n";
    std::cout << "  Audio       " << job.spec.audioSource
              << (job.spec.muteOriginal ? " (only)" : " (mixed with original)") << "\n";
    std::cout << "  Duration    " << job.spec.targetDurationHours << " h\n";
    std::cout << "  Watermark   " << toString(job.spec.watermarkMode) << "\n";
    std::cout << "  Scheduled   " << formatTime(job.spec.scheduledAt) << "\n";
    std::cout << "  Created     " << formatTime(job.createdAt) << "\n";
    std::cout << "  Render      " << toString(job.renderStatus) << "\n";
    std::cout << "  Upload      " << toString(job.uploadStatus) << "\n";
    std::cout << "  Progress    " << progressCell(job) << "\n";
    if (job.outputArtifact) {
        std::cout << "  Output      " << *job.outputArtifact << "\n";
    }
    if (job.externalId) {
        std::cout << "  Video ID    " << *job.externalId << "\n";
    }
    std::cout << "\n" << job.log;
    if (!job.log.empty() && job.log.back() != '\n') {
        std::cout << "\n";
    }
}

bool isSettled(const Job& job) {
    if (job.renderStatus == RenderStatus::Failed) {
        return true;
    }
    return isTerminal(job.uploadStatus);
}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
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
    std::string jobArg;
    bool wait = false;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-w" || arg == "--wait") {
            wait = true;
        } else {
            jobArg = arg;
        }
    }

    try {
        JobStore store(workspace);
        if (!store.open(false)) {
            std::cerr << "Error: Not a workspace: " << workspace << "\n";
            return 1;
        }

        if (jobArg.empty()) {
            auto jobs = store.listAll();
            if (jobs.empty()) {
                std::cout << "No jobs\n";
                return 0;
            }
            printTable(jobs);
            return 0;
        }

        auto parsed = parseJobId(jobArg);
        if (!parsed) {
            std::cerr << "Error: Invalid job id: " << jobArg << "\n";
            return 1;
        }
        JobId id = *parsed;

        auto job = store.get(id);
        if (!job) {
            std::cerr << "Job not found: " << id << std::endl;
            return 1;
        }

        while (wait && !isSettled(*job)) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            job = store.get(id);
            if (!job) {
                std::cerr << "Job disappeared: " << id << std::endl;
                return 1;
            }
        }

        printJob(*job);
        if (job->renderStatus == RenderStatus::Failed || job->uploadStatus == UploadStatus::Failed) {
            return 1;
        }
        return job->uploadStatus == UploadStatus::Success ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
