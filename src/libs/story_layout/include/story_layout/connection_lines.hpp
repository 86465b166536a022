#pragma once

#include <story_layout/types.hpp>

namespace story_layout {

// Route for the edge between a placed parent and a placed child.
ConnectionLine route_connection(const RenderNode& parent, const RenderNode& child,
    ConnectionKind kind);

ConnectionKind connection_kind_for(story_model::AnchorType anchor);

} // namespace story_layout
