#pragma once

#include <story_layout/types.hpp>
#include <optional>
#include <string>

namespace story_layout {

enum class DropZoneKind { Append, Stack, Prepend };

const char* to_string(DropZoneKind kind);

// Proposed insertion under the cursor. `ghost` is where the new node would
// be drawn. An empty `target_node_id` with `genesis` set means the canvas is
// empty and the insertion creates the ORIGIN node.
struct DropZone {
    std::string target_node_id;
    DropZoneKind kind = DropZoneKind::Append;
    Rect ghost;
    bool genesis = false;

    bool operator==(const DropZone& other) const = default;
};

// Resolves the cursor (world coordinates) against the layout. Nodes are
// tested in emission order with their rect grown by layout::hit_padding;
// the first hit wins. Within a hit node: right 30% -> append, else top 50%
// -> stack, else left 20% -> prepend, else append. A miss falls back to
// appending after the node with the greatest right edge.
std::optional<DropZone> detect_drop_zone(double x, double y, const GraphLayout& layout);

} // namespace story_layout
