#pragma once

namespace story_render {

// Timeline track view metrics in screen pixels.

namespace timeline_style {

constexpr float header_width = 48.0f;
constexpr float ruler_height = 22.0f;
constexpr float row_height = 34.0f;
constexpr float row_gap = 2.0f;
constexpr float clip_inset = 3.0f;
constexpr float default_pixels_per_second = 40.0f;
constexpr float min_pixels_per_second = 4.0f;
constexpr float max_pixels_per_second = 400.0f;
// Ruler labels every N seconds; minor ticks every second.
constexpr int ruler_label_every = 5;

inline constexpr float content_height(int rows) {
    return ruler_height + static_cast<float>(rows) * (row_height + row_gap);
}

} // namespace timeline_style
} // namespace story_render
