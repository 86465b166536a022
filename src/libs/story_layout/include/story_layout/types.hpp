#pragma once

#include <story_model/node_index.hpp>
#include <story_model/palette.hpp>
#include <story_model/types.hpp>
#include <string>
#include <utility>
#include <vector>

namespace story_layout {

struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    double right() const { return x + width; }
    double bottom() const { return y + height; }

    bool operator==(const Rect& other) const = default;
};

struct RenderNode {
    std::string node_id;
    story_model::NodeType type = story_model::NodeType::Spine;
    std::string label;
    Rect rect;
    story_model::NodeColors colors;
    std::string lane_label; // "V1", "V2", ...
    bool is_origin = false;

    bool operator==(const RenderNode& other) const = default;
};

enum class ConnectionKind {
    Append,  // horizontal curve, parent right-mid -> child left-mid
    Stack,   // right-angled connector, parent top-mid -> child bottom-mid
    Prepend  // straight segment, child right-mid -> parent left-mid
};

const char* to_string(ConnectionKind kind);

struct ConnectionLine {
    std::string parent_id;
    std::string child_id;
    ConnectionKind kind = ConnectionKind::Append;
    // Append: 4 cubic Bezier control points. Stack: orthogonal polyline.
    // Prepend: 2-point segment. World coordinates.
    std::vector<std::pair<double, double>> points;

    bool operator==(const ConnectionLine& other) const = default;
};

struct GraphLayout {
    std::vector<RenderNode> nodes;       // emission order = traversal order
    std::vector<ConnectionLine> connections;
    double total_width = 0;
    double total_height = 0;
    std::vector<story_model::IntegrityIssue> issues;

    bool operator==(const GraphLayout& other) const = default;
};

} // namespace story_layout
