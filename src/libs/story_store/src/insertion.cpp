#include <story_store/insertion.hpp>
#include <algorithm>

namespace story_store {

std::optional<NodeDraft> plan_insertion(const story_layout::DropZone& zone,
    const std::string& canvas_id,
    const std::vector<story_model::Node>& nodes,
    const MediaClip& media)
{
    NodeDraft draft;
    draft.canvas_id = canvas_id;
    draft.asset_id = media.asset_id;
    draft.label = media.label;
    draft.media_in_point = 0.0;
    draft.media_out_point = media.duration_sec;
    draft.playback_rate = 1.0;
    draft.drift = 0;

    if (zone.genesis) {
        const bool has_origin = std::any_of(nodes.begin(), nodes.end(),
            [&](const story_model::Node& n) {
                return n.canvas_id == canvas_id && n.anchor_type == story_model::AnchorType::Origin;
            });
        if (has_origin) return std::nullopt;
        draft.type = story_model::NodeType::Spine;
        draft.anchor_type = story_model::AnchorType::Origin;
        draft.lane = 0;
        return draft;
    }

    auto target = std::find_if(nodes.begin(), nodes.end(),
        [&](const story_model::Node& n) { return n.id == zone.target_node_id; });
    if (target == nodes.end()) return std::nullopt;

    const int parent_lane = target->lane.value_or(0);
    draft.parent_id = target->id;
    switch (zone.kind) {
    case story_layout::DropZoneKind::Stack:
        draft.type = story_model::NodeType::Satellite;
        draft.anchor_type = story_model::AnchorType::Top;
        draft.lane = parent_lane + 1;
        break;
    case story_layout::DropZoneKind::Prepend:
        draft.type = story_model::NodeType::Spine;
        draft.anchor_type = story_model::AnchorType::Prepend;
        draft.lane = parent_lane;
        break;
    case story_layout::DropZoneKind::Append:
        draft.type = story_model::NodeType::Spine;
        draft.anchor_type = story_model::AnchorType::Append;
        draft.lane = parent_lane;
        break;
    }
    return draft;
}

} // namespace story_store
