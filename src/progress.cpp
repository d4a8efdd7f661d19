/*
 * loopcast - Loop Render & Publish Scheduler
 * Copyright (c) 2025 The loopcast contributors
 * SPDX-License-Identifier: MIT
 */

#include "loopcast/progress.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace loopcast {

namespace {
bool readDigits(const std::string& s, std::size_t& pos, std::size_t count, int& out) {
    out = 0;
    for (std::size_t i = 0; i < count; ++i, ++pos) {
        if (pos >= s.size() || !std::isdigit(static_cast<unsigned char>(s[pos]))) {
            return false;
        }
        out = out * 10 + (s[pos] - '0');
    }
    return true;
}
}

std::optional<double> parseEncodedTime(const std::string& line) noexcept {
    // The encoder prints "time=N/A" before the first frame; keep scanning.
    std::size_t search = 0;
    while ((search = line.find("time=", search)) != std::string::npos) {
        std::size_t pos = search + 5;
        search = pos;

        int hours = 0, minutes = 0, seconds = 0;
        if (!readDigits(line, pos, 2, hours)) continue;
        // More than 99 hours is printed with extra digits.
        while (pos < line.size() && std::isdigit(static_cast<unsigned char>(line[pos]))) {
            hours = hours * 10 + (line[pos++] - '0');
        }
        if (pos >= line.size() || line[pos++] != ':') continue;
        if (!readDigits(line, pos, 2, minutes)) continue;
        if (pos >= line.size() || line[pos++] != ':') continue;
        if (!readDigits(line, pos, 2, seconds)) continue;
        if (pos >= line.size() || line[pos++] != '.') continue;

        double fraction = 0.0;
        double scale = 0.1;
        std::size_t digits = 0;
        while (pos < line.size() && std::isdigit(static_cast<unsigned char>(line[pos]))) {
            fraction += (line[pos++] - '0') * scale;
            scale /= 10.0;
            ++digits;
        }
        if (digits == 0) continue;

        return hours * 3600.0 + minutes * 60.0 + seconds + fraction;
    }
    return std::nullopt;
}

Estimate estimate(double encodedSeconds, double targetSeconds, double elapsedSeconds, TimePoint now) {
    Estimate result;
    if (targetSeconds <= 0.0) {
        result.label = "estimating";
        return result;
    }

    double cur = std::max(0.0, encodedSeconds);
    int percent = static_cast<int>(std::floor(100.0 * cur / targetSeconds));
    result.percent = std::clamp(percent, 0, kMaxRunningPercent);

    if (cur > 0.0 && elapsedSeconds > 0.0) {
        double speed = cur / elapsedSeconds;
        double remaining = std::max(0.0, (targetSeconds - cur) / speed);
        result.speed = speed;
        result.remainingSeconds = remaining;
        result.eta = now + std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(remaining));

        char speedText[32];
        std::snprintf(speedText, sizeof(speedText), "%.1fx", speed);
        result.label = "ETA " + formatTime(*result.eta) + " (" + formatRemaining(remaining) +
                       " left, " + speedText + ")";
    } else {
        result.label = "estimating";
    }
    return result;
}

std::string formatRemaining(double seconds) {
    auto total = static_cast<long long>(std::llround(std::max(0.0, seconds)));
    long long hours = total / 3600;
    long long minutes = (total % 3600) / 60;
    long long secs = total % 60;

    char buf[48];
    if (hours > 0) {
        std::snprintf(buf, sizeof(buf), "%lldh %02lldm", hours, minutes);
    } else if (minutes > 0) {
        std::snprintf(buf, sizeof(buf), "%lldm %02llds", minutes, secs);
    } else {
        std::snprintf(buf, sizeof(buf), "%llds", secs);
    }
    return buf;
}

int fractionToPercent(double fraction) noexcept {
    if (!(fraction > 0.0)) {
        return 0;
    }
    return std::clamp(static_cast<int>(std::floor(fraction * 100.0)), 0, 100);
}

}
