/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/process.hpp"
#include "loopcast/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace loopcast {

namespace {
bool isExecutableFile(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::vector<char*> toArgv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}
}

std::optional<std::string> findExecutable(const std::string& program) {
    if (program.empty()) {
        return std::nullopt;
    }
    if (program.find('/') != std::string::npos) {
        return isExecutableFile(program) ? std::optional<std::string>(program) : std::nullopt;
    }

    const char* path = std::getenv("PATH");
    std::stringstream dirs(path ? path : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + program;
        if (isExecutableFile(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

Process::~Process() {
    closeFd(errFd_);
    if (pid_ > 0 && !exitCode_) {
        (void)wait();
    }
}

bool Process::spawn(const std::vector<std::string>& args, std::string& error) {
    if (args.empty()) {
        error = "empty command";
        return false;
    }
    if (pid_ > 0) {
        error = "process already started";
        return false;
    }

    int errPipe[2];
    int execPipe[2];
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        error = std::string("pipe: ") + std::strerror(errno);
        return false;
    }
    if (::pipe2(execPipe, O_CLOEXEC) != 0) {
        error = std::string("pipe: ") + std::strerror(errno);
        ::close(errPipe[0]);
        ::close(errPipe[1]);
        return false;
    }

    auto argv = toArgv(args);
    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork: ") + std::strerror(errno);
        ::close(errPipe[0]);
        ::close(errPipe[1]);
        ::close(execPipe[0]);
        ::close(execPipe[1]);
        return false;
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
        }
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        // Report the exec errno through the close-on-exec pipe.
        int code = errno;
        ssize_t ignored = ::write(execPipe[1], &code, sizeof(code));
        (void)ignored;
        ::_exit(127);
    }

    ::close(errPipe[1]);
    ::close(execPipe[1]);

    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    ::close(execPipe[0]);

    pid_ = pid;
    errFd_ = errPipe[0];

    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        error = "exec " + args[0] + ": " + std::strerror(execErrno);
        closeFd(errFd_);
        (void)wait();
        return false;
    }

    LOG_DEBUG("Spawned " + args[0] + " (pid " + std::to_string(pid_) + ")");
    return true;
}

bool Process::readLine(std::string& line) {
    for (;;) {
        auto cut = buffer_.find_first_of("\r\n");
        while (cut == 0) {
            buffer_.erase(0, 1);
            cut = buffer_.find_first_of("\r\n");
        }
        if (cut != std::string::npos) {
            line = buffer_.substr(0, cut);
            buffer_.erase(0, cut + 1);
            return true;
        }
        if (eof_ || errFd_ < 0) {
            if (buffer_.empty()) {
                return false;
            }
            line.swap(buffer_);
            buffer_.clear();
            return true;
        }

        char chunk[4096];
        ssize_t n = ::read(errFd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<std::size_t>(n));
        } else if (n == 0) {
            eof_ = true;
            closeFd(errFd_);
        } else if (errno != EINTR) {
            LOG_WARN("Read from child failed: " + std::string(std::strerror(errno)));
            eof_ = true;
            closeFd(errFd_);
        }
    }
}

int Process::wait() {
    if (exitCode_) {
        return *exitCode_;
    }
    if (pid_ <= 0) {
        return -1;
    }
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);

    exitCode_ = r == pid_ ? decodeStatus(status) : -1;
    return *exitCode_;
}

std::optional<int> runQuiet(const std::vector<std::string>& argv) {
    if (argv.empty() || !findExecutable(argv[0])) {
        return std::nullopt;
    }
    Process process;
    std::string error;
    if (!process.spawn(argv, error)) {
        LOG_DEBUG("runQuiet: " + error);
        return std::nullopt;
    }
    std::string line;
    while (process.readLine(line)) {
    }
    return process.wait();
}

}
