#include <cassert>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "loopcast/logger.hpp"
#include "loopcast/render.hpp"
#include "loopcast/store.hpp"

using namespace loopcast;

namespace {
std::filesystem::path makeWorkspace() {
    std::string pattern = (std::filesystem::temp_directory_path() / "loopcast_render_XXXXXX").string();
    char* dir = mkdtemp(&pattern[0]);
    assert(dir);
    return std::filesystem::path(dir);
}

// Stand-in encoder: records its argv, prints a diagnostic stream to stderr,
// creates the output file (last argument) and exits with `exitCode`.
std::string writeFakeEncoder(const std::filesystem::path& dir, const std::string& name,
                             const std::string& stderrText, int exitCode) {
    auto path = dir / name;
    std::ofstream script(path);
    script << "#!/bin/sh\n"
           << "for last; do :; done\n"
           << "echo \"$@\" > \"" << (dir / (name + ".args")).string() << "\"\n"
           << "printf '" << stderrText << "' >&2\n";
    if (exitCode == 0) {
        script << ": > \"$last\"\n";
    }
    script << "exit " << exitCode << "\n";
    script.close();
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    return path.string();
}

std::string readText(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

JobSpec spec(double hours, WatermarkMode mode, bool mute) {
    JobSpec s;
    s.videoSource = "/media/rain.mp4";
    s.audioSource = "/media/brown.mp3";
    s.targetDurationHours = hours;
    s.watermarkMode = mode;
    s.muteOriginal = mute;
    s.title = "render test";
    s.scheduledAt = Clock::now();
    return s;
}

RenderOptions options(const std::string& encoder) {
    RenderOptions o;
    o.encoder = encoder;
    o.accelProbe = "false";
    return o;
}
}

void test_successful_render_waits_for_schedule() {
    auto ws = makeWorkspace();
    JobStore store(ws);
    assert(store.open());
    auto encoder = writeFakeEncoder(ws, "ffmpeg-ok",
        "Input #0, mov from rain.mp4\\nframe=1 time=N/A\\rframe=10 time=00:00:10.00 bitrate=1\\r"
        "frame=20 time=00:00:20.00 bitrate=1\\rframe=36 time=00:00:36.00 bitrate=1\\n", 0);

    JobId id = store.create(spec(0.01, WatermarkMode::CropOnly, true)).id;

    JobId hooked = 0;
    RenderWorker worker(store, options(encoder));
    worker.setSuccessHook([&hooked](JobId done) { hooked = done; });
    RenderResult result = worker.run(id);
    assert(result);
    assert(result.error == RenderError::None);
    assert(hooked == id);

    auto job = store.get(id);
    assert(job->renderStatus == RenderStatus::Success);
    assert(job->uploadStatus == UploadStatus::WaitingSchedule);
    assert(job->progressPercent == 100);
    assert(job->outputArtifact);
    assert(*job->outputArtifact == result.outputPath);
    assert(std::filesystem::exists(*job->outputArtifact));
    auto name = std::filesystem::path(*job->outputArtifact).filename().string();
    assert(name.find("loop_" + std::to_string(id) + "_") == 0);
    assert(std::filesystem::path(*job->outputArtifact).parent_path() == store.outputDir());

    assert(job->log.find("libx264") != std::string::npos);
    assert(job->log.find("crop only") != std::string::npos);
    assert(job->log.find("Render finished") != std::string::npos);
    assert(job->log.find("Waiting for schedule time.") != std::string::npos);

    std::string args = readText(ws / "ffmpeg-ok.args");
    assert(args.find("-t 36 ") != std::string::npos);
    assert(args.find("crop=in_w:in_h-86:0:0") != std::string::npos);
    assert(args.find("-map 1:a:0") != std::string::npos);
    assert(args.find("amix") == std::string::npos);

    // The job is no longer pending; a second run cannot claim it
    RenderResult again = worker.run(id);
    assert(!again && again.error == RenderError::StoreError);
    assert(store.get(id)->renderStatus == RenderStatus::Success);

    std::filesystem::remove_all(ws);
    printf("PASS: test_successful_render_waits_for_schedule\n");
}

void test_missing_encoder_fails_immediately() {
    auto ws = makeWorkspace();
    JobStore store(ws);
    assert(store.open());
    JobId id = store.create(spec(1.0, WatermarkMode::None, true)).id;

    RenderWorker worker(store, options((ws / "no-such-ffmpeg").string()));
    bool hooked = false;
    worker.setSuccessHook([&hooked](JobId) { hooked = true; });
    RenderResult result = worker.run(id);
    assert(!result);
    assert(result.error == RenderError::ToolUnavailable);
    assert(!hooked);

    auto job = store.get(id);
    assert(job->renderStatus == RenderStatus::Failed);
    assert(job->uploadStatus == UploadStatus::Idle);
    assert(!job->outputArtifact);
    assert(job->log.find("Rendering failed") != std::string::npos);
    assert(std::filesystem::is_empty(store.outputDir()));
    assert(store.listReadyForUpload().empty());

    std::filesystem::remove_all(ws);
    printf("PASS: test_missing_encoder_fails_immediately\n");
}

void test_nonzero_exit_keeps_diagnostic_tail() {
    auto ws = makeWorkspace();
    JobStore store(ws);
    assert(store.open());
    auto encoder = writeFakeEncoder(ws, "ffmpeg-bad",
        "frame=10 time=00:00:10.00 bitrate=1\\r/media/rain.mp4: Invalid data found when processing input\\n", 1);
    JobId id = store.create(spec(0.01, WatermarkMode::Blur, true)).id;

    RenderWorker worker(store, options(encoder));
    RenderResult result = worker.run(id);
    assert(!result);
    assert(result.error == RenderError::EncodeFailure);

    auto job = store.get(id);
    assert(job->renderStatus == RenderStatus::Failed);
    assert(job->uploadStatus == UploadStatus::Idle);
    assert(job->progressPercent < 100);
    assert(!job->outputArtifact);
    assert(job->log.find("Rendering failed") != std::string::npos);
    assert(job->log.find("Invalid data found when processing input") != std::string::npos);

    std::filesystem::remove_all(ws);
    printf("PASS: test_nonzero_exit_keeps_diagnostic_tail\n");
}

void test_unmuted_render_mixes_audio() {
    auto ws = makeWorkspace();
    JobStore store(ws);
    assert(store.open());
    auto encoder = writeFakeEncoder(ws, "ffmpeg-mix", "frame=1 time=00:00:01.00\\n", 0);
    JobId id = store.create(spec(0.5, WatermarkMode::ZoomTopLeft, false)).id;

    RenderWorker worker(store, options(encoder));
    assert(worker.run(id));

    std::string args = readText(ws / "ffmpeg-mix.args");
    assert(args.find("[0:a][1:a]amix=inputs=2:duration=shortest[aout]") != std::string::npos);
    assert(args.find("scale=1920:1080:flags=lanczos") != std::string::npos);
    assert(args.find("-map [aout]") != std::string::npos);
    assert(args.find("1:a:0") == std::string::npos);
    assert(args.find("-t 1800 ") != std::string::npos);

    auto job = store.get(id);
    assert(job->log.find("mixed with external track") != std::string::npos);

    std::filesystem::remove_all(ws);
    printf("PASS: test_unmuted_render_mixes_audio\n");
}

void test_job_settled_elsewhere_gets_no_artifact() {
    auto ws = makeWorkspace();
    JobStore store(ws);
    assert(store.open());
    auto encoder = ws / "ffmpeg-slow";
    {
        std::ofstream script(encoder);
        script << "#!/bin/sh\n"
               << "for last; do :; done\n"
               << "sleep 1\n"
               << "printf 'frame=1 time=00:00:36.00 bitrate=1\\n' >&2\n"
               << ": > \"$last\"\n"
               << "exit 0\n";
    }
    std::filesystem::permissions(encoder, std::filesystem::perms::owner_all);
    JobId id = store.create(spec(0.01, WatermarkMode::None, true)).id;

    RenderWorker worker(store, options(encoder.string()));
    bool hooked = false;
    worker.setSuccessHook([&hooked](JobId) { hooked = true; });
    RenderResult result;
    std::thread render([&] { result = worker.run(id); });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (store.get(id)->renderStatus != RenderStatus::Rendering
           && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    // Another daemon's restart recovery fails the job while the encoder runs
    assert(store.updateRenderStatus(id, RenderStatus::Failed));
    render.join();

    assert(!result);
    assert(result.error == RenderError::StoreError);
    assert(!hooked);
    auto job = store.get(id);
    assert(job->renderStatus == RenderStatus::Failed);
    assert(job->uploadStatus == UploadStatus::Idle);
    assert(!job->outputArtifact);
    assert(job->progressPercent < 100);
    assert(store.listReadyForUpload().empty());

    std::filesystem::remove_all(ws);
    printf("PASS: test_job_settled_elsewhere_gets_no_artifact\n");
}

int main() {
    Logger::setLevel(LogLevel::ERROR);
    test_successful_render_waits_for_schedule();
    test_missing_encoder_fails_immediately();
    test_nonzero_exit_keeps_diagnostic_tail();
    test_unmuted_render_mixes_audio();
    test_job_settled_elsewhere_gets_no_artifact();
    printf("All render tests passed.\n");
    return 0;
}
