#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "loopcast/config.hpp"
#include "loopcast/credentials.hpp"
#include "loopcast/lifecycle.hpp"
#include "loopcast/logger.hpp"
#include "loopcast/platform.hpp"
#include "loopcast/scheduler.hpp"
#include "loopcast/server.hpp"
#include "loopcast/store.hpp"
#include "loopcast/work.hpp"

using namespace loopcast;

namespace {
std::filesystem::path makeWorkspace() {
    std::string pattern = (std::filesystem::temp_directory_path() / "loopcast_sched_XXXXXX").string();
    char* dir = mkdtemp(&pattern[0]);
    assert(dir);
    return std::filesystem::path(dir);
}

void touch(const std::filesystem::path& path, const std::string& content = "x") {
    std::ofstream out(path);
    out << content;
}

JobSpec specAt(TimePoint when, const std::string& title = "scheduled") {
    JobSpec spec;
    spec.videoSource = "/media/rain.mp4";
    spec.audioSource = "/media/brown.mp3";
    spec.title = title;
    spec.scheduledAt = when;
    return spec;
}

// Job that finished rendering and is waiting for its publish time.
JobId readyJob(JobStore& store, TimePoint when, const std::string& title = "scheduled") {
    JobId id = store.create(specAt(when, title)).id;
    assert(store.updateRenderStatus(id, RenderStatus::Rendering));
    assert(store.setOutputArtifact(id, "/out/" + title + ".mp4"));
    assert(store.updateRenderStatus(id, RenderStatus::Success));
    assert(store.updateUploadStatus(id, UploadStatus::WaitingSchedule));
    return id;
}

// Ready job whose artifact exists on disk, so an upload can really run.
JobId renderedJob(JobStore& store, TimePoint when, const std::string& title) {
    JobId id = store.create(specAt(when, title)).id;
    auto artifact = store.outputDir() / (title + ".mp4");
    touch(artifact, "rendered-media");
    assert(store.updateRenderStatus(id, RenderStatus::Rendering));
    assert(store.completeRender(id, artifact.string()));
    assert(store.updateUploadStatus(id, UploadStatus::WaitingSchedule));
    return id;
}

std::filesystem::path writeEncoder(const std::filesystem::path& dir, int sleepSeconds) {
    auto encoder = dir / "fake-ffmpeg";
    std::ofstream script(encoder);
    script << "#!/bin/sh\n"
           << "for last; do :; done\n"
           << "sleep " << sleepSeconds << "\n"
           << "printf 'frame=1 time=00:30:00.00 bitrate=1\\rframe=2 time=00:59:59.00 bitrate=1\\n' >&2\n"
           << "printf 'rendered-media' > \"$last\"\n"
           << "exit 0\n";
    script.close();
    std::filesystem::permissions(encoder, std::filesystem::perms::owner_all);
    return encoder;
}

class Recorder {
public:
    void operator()(JobId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        ids_.push_back(id);
    }
    std::vector<JobId> ids() {
        std::lock_guard<std::mutex> lock(mutex_);
        return ids_;
    }

private:
    std::mutex mutex_;
    std::vector<JobId> ids_;
};

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return pred();
}

class AlwaysSession final : public SessionProvider {
public:
    SessionResult acquire() noexcept override {
        return {true, {"token", Clock::now() + std::chrono::hours(1)}, ""};
    }
};

class OneShotHost final : public VideoHost {
public:
    UploadSession startUpload(const Session&, const VideoMetadata&, std::uint64_t) override {
        ++uploads;
        return {true, "https://upload.example/s", ""};
    }
    ChunkStatus sendChunk(const Session&, const std::string&, const std::string& data,
                          std::uint64_t offset, std::uint64_t total) override {
        ChunkStatus status;
        status.ok = true;
        status.committed = offset + data.size();
        if (status.committed >= total) {
            status.complete = true;
            status.videoId = "yt-" + std::to_string(uploads.load());
        }
        return status;
    }
    std::atomic<int> uploads{0};
};

// Each chunk takes a second to be acknowledged.
class SlowHost final : public VideoHost {
public:
    UploadSession startUpload(const Session&, const VideoMetadata&, std::uint64_t) override {
        ++uploads;
        return {true, "https://upload.example/slow", ""};
    }
    ChunkStatus sendChunk(const Session&, const std::string&, const std::string& data,
                          std::uint64_t offset, std::uint64_t total) override {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        ChunkStatus status;
        status.ok = true;
        status.committed = offset + data.size();
        if (status.committed >= total) {
            status.complete = true;
            status.videoId = "slow-" + std::to_string(uploads.load());
        }
        return status;
    }
    std::atomic<int> uploads{0};
};
}

void test_due_jobs_dispatch_once() {
    auto ws = makeWorkspace();
    JobStore store(ws);
    assert(store.open());
    auto now = Clock::now();
    JobId due = readyJob(store, now - std::chrono::minutes(1), "due");
    JobId future = readyJob(store, now + std::chrono::hours(1), "future");

    Recorder recorder;
    UploadScheduler scheduler(store, std::ref(recorder));
    assert(scheduler.tick(now) == 1);
    assert(scheduler.tick(now) == 0);
    assert(scheduler.tick(now + std::chrono::seconds(20)) == 0);
    assert((recorder.ids() == std::vector<JobId>{due}));

    auto job = store.get(due);
    assert(job->uploadStatus == UploadStatus::Uploading);
    assert(job->log.find("Schedule reached. Uploading...") != std::string::npos);
    assert(store.get(future)->uploadStatus == UploadStatus::WaitingSchedule);

    // Once its time arrives the future job goes too, and only once
    assert(scheduler.tick(now + std::chrono::hours(2)) == 1);
    assert(scheduler.tick(now + std::chrono::hours(3)) == 0);
    assert((recorder.ids() == std::vector<JobId>{due, future}));

    std::filesystem::remove_all(ws);
    printf("PASS: test_due_jobs_dispatch_once\n");
}

void test_unrendered_jobs_never_dispatched() {
    auto ws = makeWorkspace();
    JobStore store(ws);
    assert(store.open());
    auto past = Clock::now() - std::chrono::hours(1);
    JobId pending = store.create(specAt(past)).id;
    JobId failed = store.create(specAt(past)).id;
    assert(store.updateRenderStatus(failed, RenderStatus::Rendering));
    assert(store.updateRenderStatus(failed, RenderStatus::Failed));

    Recorder recorder;
    UploadScheduler scheduler(store, std::ref(recorder));
    assert(scheduler.tick(Clock::now()) == 0);
    assert(recorder.ids().empty());
    assert(store.get(pending)->uploadStatus == UploadStatus::Idle);
    assert(store.get(failed)->uploadStatus == UploadStatus::Idle);

    std::filesystem::remove_all(ws);
    printf("PASS: test_unrendered_jobs_never_dispatched\n");
}

void test_dispatch_error_does_not_stop_tick() {
    auto ws = makeWorkspace();
    JobStore store(ws);
    assert(store.open());
    auto past = Clock::now() - std::chrono::minutes(5);
    JobId broken = readyJob(store, past, "broken");
    JobId healthy = readyJob(store, past, "healthy");

    std::vector<JobId> dispatched;
    UploadScheduler scheduler(store, [&](JobId id) {
        if (id == broken) {
            throw std::runtime_error("dispatch exploded");
        }
        dispatched.push_back(id);
    });
    assert(scheduler.tick(Clock::now()) == 1);
    assert((dispatched == std::vector<JobId>{healthy}));

    auto job = store.get(broken);
    assert(job->uploadStatus == UploadStatus::Failed);
    assert(job->log.find("dispatch exploded") != std::string::npos);

    // Next tick runs normally and has nothing left to do
    assert(scheduler.tick(Clock::now()) == 0);

    std::filesystem::remove_all(ws);
    printf("PASS: test_dispatch_error_does_not_stop_tick\n");
}

void test_run_wakes_on_notify_and_stops() {
    auto ws = makeWorkspace();
    JobStore store(ws);
    assert(store.open());

    Recorder recorder;
    UploadScheduler scheduler(store, std::ref(recorder), std::chrono::seconds(60));
    std::thread loop([&scheduler] { scheduler.run(); });

    assert(waitFor([&] { return scheduler.ticks() >= 1; }, std::chrono::milliseconds(2000)));
    JobId id = readyJob(store, Clock::now() - std::chrono::seconds(1));
    scheduler.notify();
    assert(waitFor([&] { return recorder.ids().size() == 1; }, std::chrono::milliseconds(3000)));
    assert(recorder.ids()[0] == id);

    auto stopAsked = std::chrono::steady_clock::now();
    scheduler.stop();
    loop.join();
    assert(std::chrono::steady_clock::now() - stopAsked < std::chrono::seconds(5));

    std::filesystem::remove_all(ws);
    printf("PASS: test_run_wakes_on_notify_and_stops\n");
}

void test_submission_validation() {
    auto ws = makeWorkspace();
    JobStore store(ws);
    assert(store.open());
    touch(ws / "rain.mp4");
    touch(ws / "brown.mp3");
    touch(ws / "notes.txt");
    Work work(store);

    JobSpec spec = specAt(Clock::now(), "Valid");
    spec.videoSource = (ws / "rain.mp4").string();
    spec.audioSource = (ws / "brown.mp3").string();
    SubmitResult ok = work.submit(spec);
    assert(ok && ok.id > 0);
    assert(store.get(ok.id)->renderStatus == RenderStatus::Pending);

    JobSpec bad = spec;
    bad.videoSource = (ws / "missing.mp4").string();
    assert(work.submit(bad).error == SubmissionError::InvalidSource);
    bad = spec;
    bad.audioSource = (ws / "notes.txt").string();
    assert(work.submit(bad).error == SubmissionError::InvalidSource);
    bad = spec;
    bad.targetDurationHours = 0.05;
    assert(work.submit(bad).error == SubmissionError::InvalidDuration);
    bad.targetDurationHours = 24.5;
    assert(work.submit(bad).error == SubmissionError::InvalidDuration);
    bad = spec;
    bad.title.clear();
    assert(work.submit(bad).error == SubmissionError::InvalidMetadata);
    bad = spec;
    bad.scheduledAt = TimePoint{};
    assert(work.submit(bad).error == SubmissionError::InvalidSchedule);

    spec.targetDurationHours = 24.0;
    assert(work.submit(spec));
    spec.targetDurationHours = 0.1;
    assert(work.submit(spec));
    assert(store.listAll().size() == 3);

    std::filesystem::remove_all(ws);
    printf("PASS: test_submission_validation\n");
}

void test_daemon_marks_interrupted_jobs_failed() {
    auto ws = makeWorkspace();
    JobStore store(ws);
    assert(store.open());
    JobId rendering = store.create(specAt(Clock::now())).id;
    assert(store.updateRenderStatus(rendering, RenderStatus::Rendering));
    JobId uploading = readyJob(store, Clock::now());
    assert(store.updateUploadStatus(uploading, UploadStatus::Uploading));

    Config config = Config::fromEnv(ws);
    config.encoderPath = (ws / "no-encoder").string();
    config.accelProbe = "false";
    config.scanInterval = std::chrono::seconds(1);
    AlwaysSession sessions;
    OneShotHost host;
    {
        Server server(config, store, sessions, host);
        assert(server.start());
        server.shutdown();
    }

    auto r = store.get(rendering);
    assert(r->renderStatus == RenderStatus::Failed);
    assert(r->log.find("interrupted") != std::string::npos);
    auto u = store.get(uploading);
    assert(u->uploadStatus == UploadStatus::Failed);
    assert(u->log.find("interrupted") != std::string::npos);
    assert(host.uploads == 0);

    std::filesystem::remove_all(ws);
    printf("PASS: test_daemon_marks_interrupted_jobs_failed\n");
}

void test_submit_render_publish_end_to_end() {
    auto ws = makeWorkspace();
    JobStore store(ws);
    assert(store.open());
    touch(ws / "rain.mp4");
    touch(ws / "brown.mp3");

    auto encoder = writeEncoder(ws, 0);

    Config config = Config::fromEnv(ws);
    config.encoderPath = encoder.string();
    config.accelProbe = "false";
    config.scanInterval = std::chrono::seconds(1);
    config.pollInterval = std::chrono::seconds(20);
    AlwaysSession sessions;
    OneShotHost host;
    Server server(config, store, sessions, host);
    assert(server.start());

    JobSpec spec;
    spec.videoSource = (ws / "rain.mp4").string();
    spec.audioSource = (ws / "brown.mp3").string();
    spec.targetDurationHours = 1.0;
    spec.muteOriginal = true;
    spec.watermarkMode = WatermarkMode::CropOnly;
    spec.title = "One hour of rain";
    spec.tags = splitTags("rain, sleep");
    spec.scheduledAt = Clock::now() - std::chrono::minutes(1);
    SubmitResult submitted = server.submit(spec);
    assert(submitted);

    // Well inside one poll period: the render success wakes the scheduler
    bool published = waitFor([&] {
        auto job = store.get(submitted.id);
        return job && isTerminal(job->uploadStatus);
    }, std::chrono::milliseconds(15000));
    server.shutdown();
    assert(published);

    auto job = store.get(submitted.id);
    assert(job->renderStatus == RenderStatus::Success);
    assert(job->uploadStatus == UploadStatus::Success);
    assert(job->progressPercent == 100);
    assert(job->outputArtifact && std::filesystem::exists(*job->outputArtifact));
    assert(job->externalId && *job->externalId == "yt-1");
    assert(job->log.find("Render finished") < job->log.find("Schedule reached"));
    assert(job->log.find("Schedule reached") < job->log.find("Upload success! ID: yt-1"));
    assert(host.uploads == 1);

    std::filesystem::remove_all(ws);
    printf("PASS: test_submit_render_publish_end_to_end\n");
}

void test_second_daemon_refused_while_first_runs() {
    auto ws = makeWorkspace();
    JobStore store(ws);
    assert(store.open());
    touch(ws / "rain.mp4");
    touch(ws / "brown.mp3");

    Config config = Config::fromEnv(ws);
    config.encoderPath = writeEncoder(ws, 2).string();
    config.accelProbe = "false";
    config.scanInterval = std::chrono::seconds(1);
    AlwaysSession sessions;
    OneShotHost host;
    Server first(config, store, sessions, host);
    assert(first.start());

    JobSpec spec = specAt(Clock::now() + std::chrono::hours(1), "slow render");
    spec.videoSource = (ws / "rain.mp4").string();
    spec.audioSource = (ws / "brown.mp3").string();
    SubmitResult submitted = first.submit(spec);
    assert(submitted);
    assert(waitFor([&] {
        return store.get(submitted.id)->renderStatus == RenderStatus::Rendering;
    }, std::chrono::milliseconds(5000)));

    JobStore otherStore(ws);
    assert(otherStore.open());
    {
        Server second(config, otherStore, sessions, host);
        assert(!second.start());
    }
    assert(store.get(submitted.id)->renderStatus == RenderStatus::Rendering);

    assert(waitFor([&] {
        return store.get(submitted.id)->renderStatus == RenderStatus::Success;
    }, std::chrono::milliseconds(10000)));
    auto job = store.get(submitted.id);
    assert(job->outputArtifact && std::filesystem::exists(*job->outputArtifact));
    assert(job->uploadStatus == UploadStatus::WaitingSchedule);
    assert(job->log.find("interrupted") == std::string::npos);

    // Once the first daemon is gone the workspace can be served again
    first.shutdown();
    {
        Server second(config, otherStore, sessions, host);
        assert(second.start());
        second.shutdown();
    }
    assert(store.get(submitted.id)->renderStatus == RenderStatus::Success);

    std::filesystem::remove_all(ws);
    printf("PASS: test_second_daemon_refused_while_first_runs\n");
}

void test_shutdown_fails_queued_uploads() {
    auto ws = makeWorkspace();
    JobStore store(ws);
    assert(store.open());
    auto past = Clock::now() - std::chrono::minutes(1);
    JobId a = renderedJob(store, past, "first");
    JobId b = renderedJob(store, past, "second");

    Config config = Config::fromEnv(ws);
    config.encoderPath = (ws / "no-encoder").string();
    config.accelProbe = "false";
    config.scanInterval = std::chrono::seconds(1);
    config.uploadWorkers = 1;
    AlwaysSession sessions;
    SlowHost host;
    {
        Server server(config, store, sessions, host);
        assert(server.start());
        assert(waitFor([&] { return host.uploads.load() == 1; }, std::chrono::milliseconds(3000)));
        server.shutdown();
    }
    assert(host.uploads == 1);
    assert(store.listByUploadStatus(UploadStatus::Uploading).empty());

    auto jobA = store.get(a);
    auto jobB = store.get(b);
    bool aFirst = jobA->uploadStatus == UploadStatus::Success;
    const Job& published = aFirst ? *jobA : *jobB;
    const Job& queued = aFirst ? *jobB : *jobA;
    assert(published.uploadStatus == UploadStatus::Success);
    assert(published.externalId && *published.externalId == "slow-1");
    assert(queued.uploadStatus == UploadStatus::Failed);
    assert(!queued.externalId);
    assert(queued.log.find("before the upload started") != std::string::npos);
    assert(queued.log.find("interrupted") == std::string::npos);
    assert(queued.outputArtifact && std::filesystem::exists(*queued.outputArtifact));

    std::filesystem::remove_all(ws);
    printf("PASS: test_shutdown_fails_queued_uploads\n");
}

int main() {
    Logger::setLevel(LogLevel::ERROR);
    test_due_jobs_dispatch_once();
    test_unrendered_jobs_never_dispatched();
    test_dispatch_error_does_not_stop_tick();
    test_run_wakes_on_notify_and_stops();
    test_submission_validation();
    test_daemon_marks_interrupted_jobs_failed();
    test_submit_render_publish_end_to_end();
    test_second_daemon_refused_while_first_runs();
    test_shutdown_fails_queued_uploads();
    printf("All scheduler tests passed.\n");
    return 0;
}
