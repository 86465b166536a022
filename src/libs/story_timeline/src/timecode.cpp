#include <story_timeline/timecode.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace story_timeline {

namespace {

// Frame counts up to this value still fit in std::int64_t.
constexpr double max_frames = 9.2e18;

double clamp_seconds(double seconds, int fps) {
    if (!std::isfinite(seconds) || seconds < 0.0) return 0.0;
    return std::min(seconds, max_frames / fps);
}

} // namespace

std::string format_timecode(double seconds, int fps) {
    if (fps <= 0) throw std::invalid_argument("fps must be > 0, got " + std::to_string(fps));
    seconds = clamp_seconds(seconds, fps);

    const auto total_frames = static_cast<std::int64_t>(std::floor(seconds * fps));
    const std::int64_t frames = total_frames % fps;
    const auto total_seconds = static_cast<std::int64_t>(std::floor(seconds));
    const std::int64_t secs = total_seconds % 60;
    const std::int64_t total_minutes = total_seconds / 60;
    const std::int64_t mins = total_minutes % 60;
    const std::int64_t hours = total_minutes / 60;

    return fmt::format("{:02}:{:02}:{:02}:{:02}", hours, mins, secs, frames);
}

std::string format_time_simple(double seconds) {
    seconds = clamp_seconds(seconds, 1);
    const auto mins = static_cast<std::int64_t>(std::floor(seconds / 60.0));
    const auto secs = static_cast<std::int64_t>(std::floor(std::fmod(seconds, 60.0)));
    return fmt::format("{}:{:02}", mins, secs);
}

} // namespace story_timeline
