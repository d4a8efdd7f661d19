/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace loopcast {

// Resolves a program the way execvp would. Names containing '/' are checked
// directly; bare names are searched on PATH.
[[nodiscard]] std::optional<std::string> findExecutable(const std::string& program);

// Child process with its stderr connected to a pipe. stdin and stdout are
// /dev/null. The destructor reaps a child that was never waited for.
class Process final {
public:
    Process() = default;
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) = delete;
    Process& operator=(Process&&) = delete;

    // argv[0] is the program. On failure returns false and fills error.
    [[nodiscard]] bool spawn(const std::vector<std::string>& argv, std::string& error);

    // Next line of diagnostic output. '\r' terminates a line as well as '\n'
    // because encoders redraw their status line in place. Empty lines are
    // skipped. Returns false at end of stream.
    [[nodiscard]] bool readLine(std::string& line);

    // Blocks until exit. Exit code, or 128 + signal for a killed child.
    [[nodiscard]] int wait();

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

private:
    pid_t pid_ = -1;
    int errFd_ = -1;
    std::string buffer_;
    bool eof_ = false;
    std::optional<int> exitCode_;
};

// Runs a command to completion with all output discarded.
// Returns the exit code, or nullopt when it could not be started.
[[nodiscard]] std::optional<int> runQuiet(const std::vector<std::string>& argv);

}
