#include <story_model/palette.hpp>

namespace story_model {

namespace {

constexpr NodeColors spine_colors{ { 0xA8, 0x55, 0xF7 }, { 0x7C, 0x3A, 0xED } };
constexpr NodeColors satellite_colors{ { 0x06, 0xB6, 0xD4 }, { 0x08, 0x91, 0xB2 } };
constexpr NodeColors container_colors{ { 0x6B, 0x72, 0x80 }, { 0x4B, 0x55, 0x63 } };

} // namespace

NodeColors node_colors(NodeType type) {
    switch (type) {
    case NodeType::Spine: return spine_colors;
    case NodeType::Satellite: return satellite_colors;
    case NodeType::Container: return container_colors;
    }
    return spine_colors;
}

NodeColors lane_colors(int lane) {
    return lane == 0 ? spine_colors : satellite_colors;
}

} // namespace story_model
