#pragma once

#include <story_model/types.hpp>
#include <optional>
#include <string>

namespace story_test {

inline story_model::Node origin_node(const std::string& id, double out_point = 0.0) {
    story_model::Node n;
    n.id = id;
    n.canvas_id = "c1";
    n.type = story_model::NodeType::Spine;
    n.anchor_type = story_model::AnchorType::Origin;
    n.lane = 0;
    n.media_in_point = 0.0;
    n.media_out_point = out_point;
    return n;
}

inline story_model::Node child_node(const std::string& id, const std::string& parent,
    story_model::AnchorType anchor, double out_point = 0.0, int lane = 0)
{
    story_model::Node n;
    n.id = id;
    n.canvas_id = "c1";
    n.type = anchor == story_model::AnchorType::Top ? story_model::NodeType::Satellite
                                                    : story_model::NodeType::Spine;
    n.parent_id = parent;
    n.anchor_type = anchor;
    n.lane = lane;
    n.media_in_point = 0.0;
    n.media_out_point = out_point;
    return n;
}

} // namespace story_test
