#include <algorithm>
#include <cassert>
#include <cstdio>
#include <string>
#include <vector>

#include "loopcast/encoder.hpp"

using namespace loopcast;

namespace {
EncodeRequest baseRequest() {
    EncodeRequest req;
    req.encoder = "ffmpeg";
    req.videoSource = "/in/rain.mp4";
    req.audioSource = "/in/brown.mp3";
    req.targetDurationHours = 1.0;
    req.codec = selectCodec(false);
    req.outputPath = "/out/loop_1.mp4";
    return req;
}

// Value following the first occurrence of flag, or "" when absent.
std::string argAfter(const std::vector<std::string>& argv, const std::string& flag) {
    auto it = std::find(argv.begin(), argv.end(), flag);
    if (it == argv.end() || it + 1 == argv.end()) {
        return "";
    }
    return *(it + 1);
}

bool contains(const std::vector<std::string>& argv, const std::string& value) {
    return std::find(argv.begin(), argv.end(), value) != argv.end();
}
}

void test_filters_per_watermark_mode() {
    assert(videoFilter(WatermarkMode::None).empty());
    assert(videoFilter(WatermarkMode::CropOnly) == "crop=in_w:in_h-86:0:0");
    assert(videoFilter(WatermarkMode::Blur) == "delogo=x=0:y=h-86:w=w:h=86");
    assert(videoFilter(WatermarkMode::ZoomTopLeft) ==
           "crop=in_w-150:in_h-86:0:0,scale=1920:1080:flags=lanczos");
    // Same input, same chain
    assert(videoFilter(WatermarkMode::Blur) == videoFilter(WatermarkMode::Blur));
    printf("PASS: test_filters_per_watermark_mode\n");
}

void test_inputs_loop_and_output_is_cut() {
    auto argv = buildEncodeCommand(baseRequest());
    assert(argv.front() == "ffmpeg");
    assert(argv.back() == "/out/loop_1.mp4");
    assert(std::count(argv.begin(), argv.end(), "-stream_loop") == 2);
    assert(argAfter(argv, "-t") == "3600");
    assert(argAfter(argv, "-c:a") == "aac");
    assert(argAfter(argv, "-b:a") == "192k");

    EncodeRequest tenth = baseRequest();
    tenth.targetDurationHours = 0.1;
    assert(argAfter(buildEncodeCommand(tenth), "-t") == "360");

    EncodeRequest odd = baseRequest();
    odd.targetDurationHours = 0.00025;
    assert(argAfter(buildEncodeCommand(odd), "-t") == "0.900");
    printf("PASS: test_inputs_loop_and_output_is_cut\n");
}

void test_muted_routes_external_audio_only() {
    EncodeRequest req = baseRequest();
    req.muteOriginal = true;
    req.watermarkMode = WatermarkMode::CropOnly;
    auto argv = buildEncodeCommand(req);
    assert(argAfter(argv, "-vf") == "crop=in_w:in_h-86:0:0");
    assert(contains(argv, "1:a:0"));
    assert(!contains(argv, "-filter_complex"));

    req.watermarkMode = WatermarkMode::None;
    argv = buildEncodeCommand(req);
    assert(!contains(argv, "-vf"));
    assert(argAfter(argv, "-map") == "0:v:0");
    printf("PASS: test_muted_routes_external_audio_only\n");
}

void test_unmuted_mixes_to_shortest() {
    EncodeRequest req = baseRequest();
    req.muteOriginal = false;
    req.watermarkMode = WatermarkMode::ZoomTopLeft;
    auto argv = buildEncodeCommand(req);
    std::string graph = argAfter(argv, "-filter_complex");
    assert(graph.find("[0:v]crop=in_w-150:in_h-86:0:0,scale=1920:1080:flags=lanczos[vout]") == 0);
    assert(graph.find("[0:a][1:a]amix=inputs=2:duration=shortest[aout]") != std::string::npos);
    assert(contains(argv, "[vout]"));
    assert(contains(argv, "[aout]"));
    assert(!contains(argv, "1:a:0"));

    req.watermarkMode = WatermarkMode::None;
    argv = buildEncodeCommand(req);
    assert(argAfter(argv, "-filter_complex") == "[0:a][1:a]amix=inputs=2:duration=shortest[aout]");
    assert(argAfter(argv, "-map") == "0:v:0");
    printf("PASS: test_unmuted_mixes_to_shortest\n");
}

void test_codec_selection() {
    CodecChoice hw = selectCodec(true);
    assert(hw.videoCodec == "h264_nvenc" && hw.preset == "p1" && hw.accelerated);
    CodecChoice sw = selectCodec(false);
    assert(sw.videoCodec == "libx264" && sw.preset == "ultrafast" && !sw.accelerated);

    EncodeRequest req = baseRequest();
    req.codec = hw;
    auto argv = buildEncodeCommand(req);
    assert(argAfter(argv, "-c:v") == "h264_nvenc");
    assert(argAfter(argv, "-preset") == "p1");
    printf("PASS: test_codec_selection\n");
}

void test_accelerator_probe() {
    assert(probeAccelerator("true"));
    assert(!probeAccelerator("false"));
    assert(!probeAccelerator("/nonexistent/loopcast-probe"));
    assert(!probeAccelerator(""));
    printf("PASS: test_accelerator_probe\n");
}

int main() {
    test_filters_per_watermark_mode();
    test_inputs_loop_and_output_is_cut();
    test_muted_routes_external_audio_only();
    test_unmuted_mixes_to_shortest();
    test_codec_selection();
    test_accelerator_probe();
    printf("All encoder tests passed.\n");
    return 0;
}
