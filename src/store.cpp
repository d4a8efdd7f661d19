/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/store.hpp"
#include "loopcast/lifecycle.hpp"
#include "loopcast/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace loopcast {

using json = nlohmann::json;

namespace {

constexpr const char* kJobFile = "job.json";
constexpr const char* kRenderFile = "render";
constexpr const char* kUploadFile = "upload";
constexpr const char* kRenderProgressFile = "render_progress";
constexpr const char* kUploadProgressFile = "upload_progress";
constexpr const char* kOutputFile = "output";
constexpr const char* kExternalIdFile = "external_id";
constexpr const char* kLogFile = "log";

std::atomic<uint64_t> g_temp_counter{0};

// Exclusive flock on <ws>/.lock for the lifetime of the object.
class WorkspaceLock {
public:
    explicit WorkspaceLock(const std::filesystem::path& workspace) {
        fd_ = ::open((workspace / ".lock").c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ >= 0 && ::flock(fd_, LOCK_EX) != 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }
    ~WorkspaceLock() {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }
    WorkspaceLock(const WorkspaceLock&) = delete;
    WorkspaceLock& operator=(const WorkspaceLock&) = delete;

    [[nodiscard]] bool held() const noexcept { return fd_ >= 0; }

private:
    int fd_ = -1;
};

std::optional<std::string> readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

bool writeFileAtomic(const std::filesystem::path& path, const std::string& content) {
    auto temp = path;
    temp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(g_temp_counter.fetch_add(1));
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            return false;
        }
        file << content;
        file.flush();
        if (!file.good()) {
            std::error_code ec;
            std::filesystem::remove(temp, ec);
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        return false;
    }
    return true;
}

std::string chomp(std::string value) {
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r')) {
        value.pop_back();
    }
    return value;
}

std::int64_t toUnix(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint fromUnix(std::int64_t seconds) {
    return TimePoint(std::chrono::seconds(seconds));
}

json specToJson(JobId id, const JobSpec& spec, TimePoint createdAt) {
    return json{
        {"id", id},
        {"video_source", spec.videoSource},
        {"audio_source", spec.audioSource},
        {"target_duration_hours", spec.targetDurationHours},
        {"watermark_mode", toString(spec.watermarkMode)},
        {"mute_original", spec.muteOriginal},
        {"title", spec.title},
        {"description", spec.description},
        {"tags", spec.tags},
        {"scheduled_at", toUnix(spec.scheduledAt)},
        {"scheduled_at_local", formatTime(spec.scheduledAt)},
        {"created_at", toUnix(createdAt)}
    };
}

struct Progress {
    int percent = 0;
    std::string eta;
};

Progress parseProgress(const std::optional<std::string>& content) {
    Progress progress;
    if (!content) {
        return progress;
    }
    std::istringstream in(*content);
    std::string line;
    if (std::getline(in, line)) {
        try {
            progress.percent = std::clamp(std::stoi(line), 0, 100);
        } catch (const std::logic_error&) {
            progress.percent = 0;
        }
    }
    std::getline(in, progress.eta);
    return progress;
}

std::string logStamp() {
    return "[" + formatTime(Clock::now()) + "] ";
}

}

const char* toString(StoreError error) noexcept {
    switch (error) {
        case StoreError::None: return "none";
        case StoreError::NotFound: return "not found";
        case StoreError::IoError: return "i/o error";
        case StoreError::IllegalTransition: return "illegal transition";
        case StoreError::AlreadySet: return "already set";
        case StoreError::InvalidValue: return "invalid value";
        case StoreError::Closed: return "store closed";
    }
    return "unknown";
}

JobStore::JobStore(const std::filesystem::path& workspace) noexcept
    : workspace_(workspace) {
}

JobStore::~JobStore() {
    close();
}

bool JobStore::open(bool createIfMissing) noexcept {
    try {
        if (!std::filesystem::exists(workspace_)) {
            if (!createIfMissing) {
                LOG_ERROR("Workspace does not exist: " + workspace_.string());
                return false;
            }
            std::filesystem::create_directories(workspace_);
        }
        std::filesystem::create_directories(workspace_ / "writing");
        std::filesystem::create_directories(workspace_ / "jobs");
        std::filesystem::create_directories(workspace_ / "outputs");

        open_.store(true);
        LOG_DEBUG("Job store opened: " + workspace_.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to open job store: " + std::string(e.what()));
        return false;
    }
}

void JobStore::close() noexcept {
    if (open_.exchange(false)) {
        LOG_DEBUG("Job store closed: " + workspace_.string());
    }
}

std::filesystem::path JobStore::jobDir(JobId id) const {
    return workspace_ / "jobs" / std::to_string(id);
}

JobId JobStore::allocateId() {
    auto counterPath = workspace_ / "next_id";
    JobId next = 1;
    if (auto content = readFile(counterPath)) {
        try {
            next = std::stoull(chomp(*content));
        } catch (const std::logic_error&) {
            next = 1;
        }
    }
    // Never reuse an id even if the counter file was lost.
    for (const auto& entry : std::filesystem::directory_iterator(workspace_ / "jobs")) {
        try {
            JobId existing = std::stoull(entry.path().filename().string());
            next = std::max(next, existing + 1);
        } catch (const std::logic_error&) {
            continue;
        }
    }
    if (!writeFileAtomic(counterPath, std::to_string(next + 1))) {
        throw std::runtime_error("cannot update id counter");
    }
    return next;
}

CreateResult JobStore::create(const JobSpec& spec) noexcept {
    if (!isOpen()) {
        return {false, 0, StoreError::Closed, "store closed"};
    }
    try {
        WorkspaceLock lock(workspace_);
        if (!lock.held()) {
            return {false, 0, StoreError::IoError, "cannot lock workspace"};
        }

        JobId id = allocateId();
        auto staging = workspace_ / "writing" / std::to_string(id);
        std::filesystem::create_directories(staging);

        auto now = Clock::now();
        bool written = writeFileAtomic(staging / kJobFile, specToJson(id, spec, now).dump(2))
            && writeFileAtomic(staging / kRenderFile, toString(RenderStatus::Pending))
            && writeFileAtomic(staging / kUploadFile, toString(UploadStatus::Idle))
            && writeFileAtomic(staging / kRenderProgressFile, "0\n")
            && writeFileAtomic(staging / kLogFile, logStamp() + "Job created.\n");

        if (!written) {
            std::error_code ec;
            std::filesystem::remove_all(staging, ec);
            return {false, 0, StoreError::IoError, "failed to write job record"};
        }

        std::filesystem::rename(staging, jobDir(id));
        LOG_DEBUG("Job record created: " + std::to_string(id));
        return {true, id, StoreError::None, ""};
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create job: " + std::string(e.what()));
        return {false, 0, StoreError::IoError, e.what()};
    }
}

std::optional<Job> JobStore::readJob(const std::filesystem::path& dir) const {
    auto document = readFile(dir / kJobFile);
    if (!document) {
        return std::nullopt;
    }

    json j = json::parse(*document);
    Job job;
    job.id = j.at("id").get<JobId>();
    job.spec.videoSource = j.at("video_source").get<std::string>();
    job.spec.audioSource = j.at("audio_source").get<std::string>();
    job.spec.targetDurationHours = j.at("target_duration_hours").get<double>();
    job.spec.watermarkMode = parseWatermarkMode(j.at("watermark_mode").get<std::string>())
        .value_or(WatermarkMode::None);
    job.spec.muteOriginal = j.at("mute_original").get<bool>();
    job.spec.title = j.value("title", "");
    job.spec.description = j.value("description", "");
    job.spec.tags = j.value("tags", std::vector<std::string>{});
    job.spec.scheduledAt = fromUnix(j.at("scheduled_at").get<std::int64_t>());
    job.createdAt = fromUnix(j.value("created_at", std::int64_t{0}));

    job.renderStatus = parseRenderStatus(chomp(readFile(dir / kRenderFile).value_or("")))
        .value_or(RenderStatus::Pending);
    job.uploadStatus = parseUploadStatus(chomp(readFile(dir / kUploadFile).value_or("")))
        .value_or(UploadStatus::Idle);

    const char* progressFile = uploadPhaseActive(job.uploadStatus) ? kUploadProgressFile : kRenderProgressFile;
    auto progress = parseProgress(readFile(dir / progressFile));
    job.progressPercent = progress.percent;
    job.etaLabel = progress.eta;

    if (auto output = readFile(dir / kOutputFile)) {
        job.outputArtifact = chomp(*output);
    }
    if (auto externalId = readFile(dir / kExternalIdFile)) {
        job.externalId = chomp(*externalId);
    }
    job.log = readFile(dir / kLogFile).value_or("");
    return job;
}

std::optional<Job> JobStore::get(JobId id) const noexcept {
    if (!isOpen()) {
        return std::nullopt;
    }
    try {
        return readJob(jobDir(id));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read job " + std::to_string(id) + ": " + e.what());
        return std::nullopt;
    }
}

std::vector<Job> JobStore::listMatching(bool (*match)(const Job&, const void*), const void* arg) const noexcept {
    std::vector<Job> jobs;
    if (!isOpen()) {
        return jobs;
    }
    try {
        for (const auto& entry : std::filesystem::directory_iterator(workspace_ / "jobs")) {
            if (!entry.is_directory()) {
                continue;
            }
            try {
                auto job = readJob(entry.path());
                if (job && (!match || match(*job, arg))) {
                    jobs.push_back(std::move(*job));
                }
            } catch (const std::exception& e) {
                LOG_WARN("Skipping unreadable job record " + entry.path().string() + ": " + e.what());
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to list jobs: " + std::string(e.what()));
    }
    std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) { return a.id < b.id; });
    return jobs;
}

std::vector<Job> JobStore::listAll() const noexcept {
    return listMatching(nullptr, nullptr);
}

std::vector<Job> JobStore::listReadyForUpload() const noexcept {
    return listMatching([](const Job& job, const void*) {
        return job.renderStatus == RenderStatus::Success
            && job.uploadStatus == UploadStatus::WaitingSchedule;
    }, nullptr);
}

std::vector<Job> JobStore::listByRenderStatus(RenderStatus status) const noexcept {
    return listMatching([](const Job& job, const void* arg) {
        return job.renderStatus == *static_cast<const RenderStatus*>(arg);
    }, &status);
}

std::vector<Job> JobStore::listByUploadStatus(UploadStatus status) const noexcept {
    return listMatching([](const Job& job, const void* arg) {
        return job.uploadStatus == *static_cast<const UploadStatus*>(arg);
    }, &status);
}

StoreResult JobStore::precheck(JobId id) const {
    if (!isOpen()) {
        return {false, StoreError::Closed, "store closed"};
    }
    if (!std::filesystem::exists(jobDir(id) / kJobFile)) {
        return {false, StoreError::NotFound, "job " + std::to_string(id) + " not found"};
    }
    return {true, StoreError::None, ""};
}

StoreResult JobStore::updateRenderStatus(JobId id, RenderStatus status) noexcept {
    try {
        WorkspaceLock lock(workspace_);
        if (!lock.held()) {
            return {false, StoreError::IoError, "cannot lock workspace"};
        }
        auto check = precheck(id);
        if (!check) {
            return check;
        }

        auto dir = jobDir(id);
        auto current = parseRenderStatus(chomp(readFile(dir / kRenderFile).value_or("")))
            .value_or(RenderStatus::Pending);
        if (!canTransition(current, status)) {
            return {false, StoreError::IllegalTransition,
                std::string("render ") + toString(current) + " -> " + toString(status)};
        }
        if (!writeFileAtomic(dir / kRenderFile, toString(status))) {
            return {false, StoreError::IoError, "failed to write render status"};
        }
        LOG_DEBUG("Job " + std::to_string(id) + " render: " + toString(current) + " -> " + toString(status));
        return {true, StoreError::None, ""};
    } catch (const std::exception& e) {
        return {false, StoreError::IoError, e.what()};
    }
}

StoreResult JobStore::updateUploadStatus(JobId id, UploadStatus status) noexcept {
    try {
        WorkspaceLock lock(workspace_);
        if (!lock.held()) {
            return {false, StoreError::IoError, "cannot lock workspace"};
        }
        auto check = precheck(id);
        if (!check) {
            return check;
        }

        auto dir = jobDir(id);
        auto render = parseRenderStatus(chomp(readFile(dir / kRenderFile).value_or("")))
            .value_or(RenderStatus::Pending);
        auto current = parseUploadStatus(chomp(readFile(dir / kUploadFile).value_or("")))
            .value_or(UploadStatus::Idle);
        if (!canTransition(current, status, render)) {
            return {false, StoreError::IllegalTransition,
                std::string("upload ") + toString(current) + " -> " + toString(status) +
                " (render " + toString(render) + ")"};
        }
        if (status == UploadStatus::Uploading
            && !writeFileAtomic(dir / kUploadProgressFile, "0\nstarting\n")) {
            return {false, StoreError::IoError, "failed to reset upload progress"};
        }
        if (!writeFileAtomic(dir / kUploadFile, toString(status))) {
            return {false, StoreError::IoError, "failed to write upload status"};
        }
        LOG_DEBUG("Job " + std::to_string(id) + " upload: " + toString(current) + " -> " + toString(status));
        return {true, StoreError::None, ""};
    } catch (const std::exception& e) {
        return {false, StoreError::IoError, e.what()};
    }
}

StoreResult JobStore::setOnce(JobId id, const char* field, const std::string& value) noexcept {
    try {
        if (value.empty()) {
            return {false, StoreError::InvalidValue, std::string(field) + " must not be empty"};
        }
        WorkspaceLock lock(workspace_);
        if (!lock.held()) {
            return {false, StoreError::IoError, "cannot lock workspace"};
        }
        auto check = precheck(id);
        if (!check) {
            return check;
        }
        auto path = jobDir(id) / field;
        if (std::filesystem::exists(path)) {
            return {false, StoreError::AlreadySet, std::string(field) + " already set"};
        }
        if (!writeFileAtomic(path, value)) {
            return {false, StoreError::IoError, std::string("failed to write ") + field};
        }
        return {true, StoreError::None, ""};
    } catch (const std::exception& e) {
        return {false, StoreError::IoError, e.what()};
    }
}

StoreResult JobStore::setOutputArtifact(JobId id, const std::string& artifact) noexcept {
    return setOnce(id, kOutputFile, artifact);
}

StoreResult JobStore::setExternalId(JobId id, const std::string& externalId) noexcept {
    return setOnce(id, kExternalIdFile, externalId);
}

StoreResult JobStore::completeRender(JobId id, const std::string& artifact) noexcept {
    try {
        if (artifact.empty()) {
            return {false, StoreError::InvalidValue, std::string(kOutputFile) + " must not be empty"};
        }
        WorkspaceLock lock(workspace_);
        if (!lock.held()) {
            return {false, StoreError::IoError, "cannot lock workspace"};
        }
        auto check = precheck(id);
        if (!check) {
            return check;
        }

        auto dir = jobDir(id);
        auto current = parseRenderStatus(chomp(readFile(dir / kRenderFile).value_or("")))
            .value_or(RenderStatus::Pending);
        if (!canTransition(current, RenderStatus::Success)) {
            return {false, StoreError::IllegalTransition,
                std::string("render ") + toString(current) + " -> " + toString(RenderStatus::Success)};
        }
        if (std::filesystem::exists(dir / kOutputFile)) {
            return {false, StoreError::AlreadySet, std::string(kOutputFile) + " already set"};
        }
        if (!writeFileAtomic(dir / kOutputFile, artifact)) {
            return {false, StoreError::IoError, std::string("failed to write ") + kOutputFile};
        }
        if (!writeFileAtomic(dir / kRenderFile, toString(RenderStatus::Success))) {
            std::error_code ec;
            std::filesystem::remove(dir / kOutputFile, ec);
            return {false, StoreError::IoError, "failed to write render status"};
        }
        LOG_DEBUG("Job " + std::to_string(id) + " render: " + toString(current) + " -> " +
                  toString(RenderStatus::Success) + ", output " + artifact);
        return {true, StoreError::None, ""};
    } catch (const std::exception& e) {
        return {false, StoreError::IoError, e.what()};
    }
}

StoreResult JobStore::updateProgress(JobId id, int percent, const std::string& etaLabel) noexcept {
    try {
        if (etaLabel.find('\n') != std::string::npos) {
            return {false, StoreError::InvalidValue, "eta label must be a single line"};
        }
        percent = std::clamp(percent, 0, 100);

        WorkspaceLock lock(workspace_);
        if (!lock.held()) {
            return {false, StoreError::IoError, "cannot lock workspace"};
        }
        auto check = precheck(id);
        if (!check) {
            return check;
        }

        auto dir = jobDir(id);
        auto upload = parseUploadStatus(chomp(readFile(dir / kUploadFile).value_or("")))
            .value_or(UploadStatus::Idle);

        auto path = dir / kRenderProgressFile;
        if (uploadPhaseActive(upload)) {
            path = dir / kUploadProgressFile;
        } else {
            percent = std::max(percent, parseProgress(readFile(path)).percent);
        }

        if (!writeFileAtomic(path, std::to_string(percent) + "\n" + etaLabel + "\n")) {
            return {false, StoreError::IoError, "failed to write progress"};
        }
        return {true, StoreError::None, ""};
    } catch (const std::exception& e) {
        return {false, StoreError::IoError, e.what()};
    }
}

StoreResult JobStore::appendLog(JobId id, const std::string& message) noexcept {
    try {
        WorkspaceLock lock(workspace_);
        if (!lock.held()) {
            return {false, StoreError::IoError, "cannot lock workspace"};
        }
        auto check = precheck(id);
        if (!check) {
            return check;
        }

        auto path = jobDir(id) / kLogFile;
        std::string log = readFile(path).value_or("");
        log += logStamp() + message;
        if (log.empty() || log.back() != '\n') {
            log += '\n';
        }
        if (!writeFileAtomic(path, log)) {
            return {false, StoreError::IoError, "failed to append log"};
        }
        return {true, StoreError::None, ""};
    } catch (const std::exception& e) {
        return {false, StoreError::IoError, e.what()};
    }
}

}
