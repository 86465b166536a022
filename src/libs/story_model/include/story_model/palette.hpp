#pragma once

#include <story_model/types.hpp>
#include <cstdint>

namespace story_model {

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    bool operator==(const Color& other) const = default;
};

struct NodeColors {
    Color fill;
    Color border;

    bool operator==(const NodeColors& other) const = default;
};

// Spine purple, satellite cyan, container gray.
NodeColors node_colors(NodeType type);

// Timeline clips are colored by lane: lane 0 uses the spine colors, every
// other lane the satellite colors.
NodeColors lane_colors(int lane);

} // namespace story_model
