#include <story_loaders/debug_canvas.hpp>
#include <cstdint>
#include <string>
#include <utility>

namespace story_loaders {

story_model::CanvasSnapshot generate_debug_canvas() {
    story_model::CanvasSnapshot out;
    out.id = "debug";
    out.name = "Interview cut (debug)";
    out.fps = 24;

    using story_model::AnchorType;
    using story_model::NodeType;

    auto add_node = [&](const char* id, NodeType type, const char* parent, AnchorType anchor,
                        int lane, double out_point, const char* label, std::int64_t drift = 0) {
        story_model::Node n;
        n.id = id;
        n.canvas_id = out.id;
        n.type = type;
        if (parent) n.parent_id = parent;
        n.anchor_type = anchor;
        n.lane = lane;
        n.drift = drift;
        n.media_in_point = 0.0;
        n.media_out_point = out_point;
        n.asset_id = std::string("media-") + id;
        n.label = label;
        out.nodes.push_back(std::move(n));
    };

    add_node("node-000001", NodeType::Spine, nullptr, AnchorType::Origin, 0, 12.0, "Opening line");
    add_node("node-000002", NodeType::Spine, "node-000001", AnchorType::Append, 0, 8.5, "Answer 1");
    add_node("node-000003", NodeType::Satellite, "node-000001", AnchorType::Top, 1, 4.0, "City B-roll", 1500);
    add_node("node-000004", NodeType::Satellite, "node-000003", AnchorType::Top, 2, 2.0, "Title card");
    add_node("node-000005", NodeType::Spine, "node-000002", AnchorType::Append, 0, 10.0, "Answer 2", 250);
    add_node("node-000006", NodeType::Satellite, "node-000005", AnchorType::Top, 1, 6.0, "Archive photo");
    add_node("node-000007", NodeType::Spine, "node-000001", AnchorType::Prepend, 0, 3.0, "Cold open");

    return out;
}

} // namespace story_loaders
