#pragma once

namespace story_layout {

// Shared layout constants for the elastic column layout and the drop-zone
// resolver. All values in world units.

namespace layout {

constexpr double base_node_width = 300.0;
constexpr double node_height = 100.0;
constexpr double node_gap = 100.0;
constexpr double canvas_padding = 50.0;

// Drop-zone hit boxes are the node rect grown by this margin on every side.
constexpr double hit_padding = 20.0;
// Cursor past this fraction of the width selects the append zone (right 30%).
constexpr double append_zone_start = 0.7;
// Cursor above this fraction of the height selects the stack zone (top 50%).
constexpr double stack_zone_end = 0.5;
// Cursor before this fraction of the width selects the prepend zone (left 20%).
constexpr double prepend_zone_end = 0.2;

// Ghost previews are always one base node, whatever media is being inserted.
constexpr double ghost_width = base_node_width;

// Vertical distance between two stacked lanes.
inline constexpr double lane_pitch() {
    return node_height + node_gap;
}

} // namespace layout
} // namespace story_layout
