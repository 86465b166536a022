#pragma once

#include <story_layout/drop_zone.hpp>
#include <story_model/types.hpp>
#include <story_store/node_store.hpp>
#include <optional>
#include <string>
#include <vector>

namespace story_store {

struct MediaClip {
    std::string asset_id;
    std::string label;
    double duration_sec = 0.0;
};

// Turns a resolved drop zone into the node to create:
//   genesis  -> SPINE, ORIGIN, lane 0
//   stack    -> SATELLITE, TOP, parent lane + 1
//   append   -> SPINE, APPEND, parent lane
//   prepend  -> SPINE, PREPEND, parent lane
// The clip covers the whole media (in 0, out = duration, rate 1, no drift).
// nullopt when the target is not in `nodes`, or genesis is requested on a
// canvas that already has an ORIGIN node.
std::optional<NodeDraft> plan_insertion(const story_layout::DropZone& zone,
    const std::string& canvas_id,
    const std::vector<story_model::Node>& nodes,
    const MediaClip& media);

} // namespace story_store
