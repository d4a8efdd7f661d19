#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace loopcast {

// Monotonically increasing, assigned by the store at creation.
using JobId = std::uint64_t;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class RenderStatus : std::uint8_t { Pending, Rendering, Success, Failed };

enum class UploadStatus : std::uint8_t { Idle, WaitingSchedule, Uploading, Success, Failed };

enum class WatermarkMode : std::uint8_t { None, CropOnly, Blur, ZoomTopLeft };

// Immutable submission fields.
struct JobSpec {
    std::string videoSource;
    std::string audioSource;
    double targetDurationHours = 1.0;
    WatermarkMode watermarkMode = WatermarkMode::None;
    bool muteOriginal = true;
    std::string title;
    std::string description;
    std::vector<std::string> tags;
    TimePoint scheduledAt{};
};

struct Job {
    JobId id = 0;
    JobSpec spec;
    TimePoint createdAt{};
    RenderStatus renderStatus = RenderStatus::Pending;
    UploadStatus uploadStatus = UploadStatus::Idle;
    int progressPercent = 0;
    std::string etaLabel;
    std::optional<std::string> outputArtifact;
    std::optional<std::string> externalId;
    std::string log;
};

[[nodiscard]] const char* toString(RenderStatus status) noexcept;
[[nodiscard]] const char* toString(UploadStatus status) noexcept;
[[nodiscard]] const char* toString(WatermarkMode mode) noexcept;

[[nodiscard]] std::optional<RenderStatus> parseRenderStatus(const std::string& text) noexcept;
[[nodiscard]] std::optional<UploadStatus> parseUploadStatus(const std::string& text) noexcept;
// Accepts "zoom_tl" as an alias of "zoom_top_left".
[[nodiscard]] std::optional<WatermarkMode> parseWatermarkMode(const std::string& text) noexcept;

// Decimal digits only, no sign or trailing text; 0 and overflow are rejected.
[[nodiscard]] std::optional<JobId> parseJobId(const std::string& text) noexcept;

// "a, b ,,c" -> {"a","b","c"}
[[nodiscard]] std::vector<std::string> splitTags(const std::string& csv);

// Local wall-clock "YYYY-MM-DD HH:MM:SS".
[[nodiscard]] std::string formatTime(TimePoint tp);
// Accepts "YYYY-MM-DD HH:MM[:SS]" or "YYYY-MM-DDTHH:MM[:SS]" in local time.
[[nodiscard]] std::optional<TimePoint> parseTime(const std::string& text);

} // namespace loopcast
