#pragma once

#include <story_layout/types.hpp>
#include <story_model/types.hpp>
#include <string>
#include <vector>

namespace story_layout {

// Elastic Column layout. Positions every node reachable from the ORIGIN node
// by the anchor rules (APPEND right of the parent, TOP above it, PREPEND to
// its left). SPINE nodes widen to enclose their stacked (TOP) children.
// Empty input, or input without an ORIGIN node, yields an empty layout.
// Pure: identical input always yields identical output, regardless of the
// order of `nodes`.
GraphLayout compute_graph_layout(const std::vector<story_model::Node>& nodes);

// "V{n}" label for a lane at world y (y = 0 is V1, one lane pitch up is V2).
std::string lane_label_for_y(double y);

} // namespace story_layout
