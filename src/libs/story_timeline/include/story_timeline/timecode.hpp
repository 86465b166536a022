#pragma once

#include <string>

namespace story_timeline {

// "HH:MM:SS:FF" using floor-based decomposition. Negative or non-finite
// input formats as zero; input whose frame count would overflow int64
// saturates. Throws std::invalid_argument if fps <= 0.
std::string format_timecode(double seconds, int fps = 24);

// "M:SS" using floor-based seconds.
std::string format_time_simple(double seconds);

} // namespace story_timeline
