#include <story_layout/drop_zone.hpp>
#include <story_layout/layout_constants.hpp>

namespace story_layout {

namespace {

DropZone zone_for(const RenderNode& rn, DropZoneKind kind) {
    DropZone zone;
    zone.target_node_id = rn.node_id;
    zone.kind = kind;
    zone.ghost.width = layout::ghost_width;
    zone.ghost.height = layout::node_height;
    switch (kind) {
    case DropZoneKind::Append:
        zone.ghost.x = rn.rect.right() + layout::node_gap;
        zone.ghost.y = rn.rect.y;
        break;
    case DropZoneKind::Stack:
        zone.ghost.x = rn.rect.x;
        zone.ghost.y = rn.rect.y - layout::node_height - layout::node_gap;
        break;
    case DropZoneKind::Prepend:
        zone.ghost.x = rn.rect.x - layout::ghost_width - layout::node_gap;
        zone.ghost.y = rn.rect.y;
        break;
    }
    return zone;
}

bool hit(const Rect& r, double x, double y) {
    const double m = layout::hit_padding;
    return x >= r.x - m && x <= r.right() + m && y >= r.y - m && y <= r.bottom() + m;
}

} // namespace

const char* to_string(DropZoneKind kind) {
    switch (kind) {
    case DropZoneKind::Append: return "append";
    case DropZoneKind::Stack: return "stack";
    case DropZoneKind::Prepend: return "prepend";
    }
    return "append";
}

std::optional<DropZone> detect_drop_zone(double x, double y, const GraphLayout& layout) {
    if (layout.nodes.empty()) {
        DropZone genesis;
        genesis.kind = DropZoneKind::Append;
        genesis.genesis = true;
        genesis.ghost = { layout::canvas_padding, 0.0, layout::ghost_width, layout::node_height };
        return genesis;
    }

    for (const auto& rn : layout.nodes) {
        if (!hit(rn.rect, x, y)) continue;

        const double rel_x = x - rn.rect.x;
        const double rel_y = y - rn.rect.y;
        if (rel_x > rn.rect.width * layout::append_zone_start)
            return zone_for(rn, DropZoneKind::Append);
        if (rel_y < rn.rect.height * layout::stack_zone_end)
            return zone_for(rn, DropZoneKind::Stack);
        if (rel_x < rn.rect.width * layout::prepend_zone_end)
            return zone_for(rn, DropZoneKind::Prepend);
        return zone_for(rn, DropZoneKind::Append);
    }

    // Smart append: attach after the rightmost element. Ties keep the
    // earliest emitted node.
    const RenderNode* rightmost = &layout.nodes.front();
    for (const auto& rn : layout.nodes) {
        if (rn.rect.right() > rightmost->rect.right()) rightmost = &rn;
    }
    return zone_for(*rightmost, DropZoneKind::Append);
}

} // namespace story_layout
