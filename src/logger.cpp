/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace loopcast {

static LogLevel g_level = LogLevel::INFO;
static std::mutex g_log_mutex;
static bool g_level_initialized = false;
static std::unordered_map<std::thread::id, std::string> g_thread_names;
static std::ofstream g_log_file;
static bool g_log_file_opened = false;

namespace {
// Optional copy of every line, for the daemon running detached.
void openLogFileLocked() {
    if (g_log_file_opened) {
        return;
    }
    g_log_file_opened = true;
    const char* path = std::getenv("LOOPCAST_LOG_FILE");
    if (path && *path) {
        g_log_file.open(path, std::ios::app);
    }
}
}

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

void Logger::initFromEnv() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = parseEnvLevel();
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = parseEnvLevel();
        g_level_initialized = true;
    }
    return g_level;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local{};
        localtime_r(&time_t, &local);

        std::lock_guard<std::mutex> lock(g_log_mutex);

        std::string thread_info;
        auto it = g_thread_names.find(std::this_thread::get_id());
        if (it != g_thread_names.end()) {
            thread_info = it->second;
        } else {
            std::ostringstream oss;
            oss << "T" << std::this_thread::get_id();
            thread_info = oss.str();
        }

        std::ostringstream line;
        line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        line << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        line << " [" << levelToString(level) << "]";
        line << " [" << thread_info << "]";
        line << " " << message;

        // stdout stays reserved for tool output
        std::cerr << line.str() << std::endl;

        openLogFileLocked();
        if (g_log_file.is_open()) {
            g_log_file << line.str() << '\n' << std::flush;
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "log write failed: %s\n", e.what());
    }
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env_val = std::getenv("LOOPCAST_LOG_LEVEL");
    if (!env_val) return LogLevel::INFO;

    std::string level_str(env_val);
    std::transform(level_str.begin(), level_str.end(), level_str.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level_str == "error") return LogLevel::ERROR;
    if (level_str == "warn" || level_str == "warning") return LogLevel::WARN;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "trace") return LogLevel::TRACE;

    return LogLevel::INFO;
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

std::string getThreadName(const char* role, int worker_id) {
    return std::string(role) + "-" + std::to_string(worker_id);
}

}
