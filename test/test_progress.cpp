#include <cassert>
#include <cmath>
#include <cstdio>
#include <string>

#include "loopcast/progress.hpp"

using namespace loopcast;

void test_parse_encoder_time() {
    auto t = parseEncodedTime("frame= 3000 fps=250 q=28.0 size=   10240kB time=00:02:00.50 bitrate=699.1kbits/s speed=2.0x");
    assert(t);
    assert(std::fabs(*t - 120.5) < 1e-9);

    auto hours = parseEncodedTime("size=N/A time=01:05:09.04 bitrate=N/A");
    assert(hours);
    assert(std::fabs(*hours - (3600.0 + 300.0 + 9.04)) < 1e-6);

    auto long_run = parseEncodedTime("time=100:00:00.00");
    assert(long_run);
    assert(std::fabs(*long_run - 360000.0) < 1e-9);
    printf("PASS: test_parse_encoder_time\n");
}

void test_lines_without_time_are_ignored() {
    assert(!parseEncodedTime("Input #0, mov,mp4,m4a,3gp,3g2,mj2, from 'rain.mp4':"));
    assert(!parseEncodedTime("frame=    0 fps=0.0 q=0.0 size=       0kB time=N/A bitrate=N/A"));
    assert(!parseEncodedTime("time=00:00"));
    assert(!parseEncodedTime(""));
    printf("PASS: test_lines_without_time_are_ignored\n");
}

void test_eta_arithmetic() {
    TimePoint now = Clock::now();
    Estimate est = estimate(120.0, 3600.0, 60.0, now);
    assert(est.percent == 3);
    assert(est.speed && std::fabs(*est.speed - 2.0) < 1e-9);
    assert(est.remainingSeconds && std::fabs(*est.remainingSeconds - 1740.0) < 1e-9);
    assert(est.eta);
    auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(*est.eta - now).count();
    assert(delta == 1740000);
    assert(est.label.find("ETA ") == 0);
    assert(est.label.find("29m 00s left") != std::string::npos);
    assert(est.label.find("2.0x") != std::string::npos);
    printf("PASS: test_eta_arithmetic\n");
}

void test_percent_capped_below_hundred() {
    TimePoint now = Clock::now();
    assert(estimate(3599.9, 3600.0, 100.0, now).percent == 99);
    assert(estimate(3600.0, 3600.0, 100.0, now).percent == kMaxRunningPercent);
    assert(estimate(7200.0, 3600.0, 100.0, now).percent == kMaxRunningPercent);
    printf("PASS: test_percent_capped_below_hundred\n");
}

void test_estimating_before_first_frame() {
    Estimate est = estimate(0.0, 3600.0, 5.0, Clock::now());
    assert(est.percent == 0);
    assert(!est.speed);
    assert(!est.eta);
    assert(est.label == "estimating");
    printf("PASS: test_estimating_before_first_frame\n");
}

void test_format_remaining() {
    assert(formatRemaining(3900.0) == "1h 05m");
    assert(formatRemaining(1740.0) == "29m 00s");
    assert(formatRemaining(42.0) == "42s");
    assert(formatRemaining(-3.0) == "0s");
    printf("PASS: test_format_remaining\n");
}

void test_upload_fraction() {
    assert(fractionToPercent(0.0) == 0);
    assert(fractionToPercent(0.256) == 25);
    assert(fractionToPercent(1.0) == 100);
    assert(fractionToPercent(1.7) == 100);
    assert(fractionToPercent(-0.5) == 0);
    printf("PASS: test_upload_fraction\n");
}

int main() {
    test_parse_encoder_time();
    test_lines_without_time_are_ignored();
    test_eta_arithmetic();
    test_percent_capped_below_hundred();
    test_estimating_before_first_frame();
    test_format_remaining();
    test_upload_fraction();
    printf("All progress tests passed.\n");
    return 0;
}
