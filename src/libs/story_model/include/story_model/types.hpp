#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace story_model {

enum class NodeType { Spine, Satellite, Container };

// Topological relation of a node to its parent. Drives both the spatial
// offset rule and the temporal offset rule.
enum class AnchorType { Origin, Append, Prepend, Top };

struct Node {
    std::string id;
    std::string canvas_id;
    NodeType type = NodeType::Spine;
    std::optional<std::string> parent_id;
    std::optional<AnchorType> anchor_type;
    std::optional<int> lane;        // 0 = spine (V1), 1 = V2, ...
    std::int64_t drift = 0;         // milliseconds
    std::optional<double> media_in_point;
    std::optional<double> media_out_point;
    double playback_rate = 1.0;
    std::string asset_id;
    std::string label;
};

struct CanvasSnapshot {
    std::string id;
    std::string name;
    int fps = 24;
    std::vector<Node> nodes;
};

const char* to_string(NodeType type);
const char* to_string(AnchorType anchor);

std::optional<NodeType> node_type_from_string(std::string_view s);
std::optional<AnchorType> anchor_type_from_string(std::string_view s);

} // namespace story_model
