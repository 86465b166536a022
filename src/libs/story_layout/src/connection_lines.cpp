#include <story_layout/connection_lines.hpp>
#include <cmath>

namespace story_layout {

namespace {

struct Anchor {
    double x, y;
};

Anchor left_mid(const Rect& r) { return { r.x, r.y + r.height * 0.5 }; }
Anchor right_mid(const Rect& r) { return { r.right(), r.y + r.height * 0.5 }; }
Anchor top_mid(const Rect& r) { return { r.x + r.width * 0.5, r.y }; }
Anchor bottom_mid(const Rect& r) { return { r.x + r.width * 0.5, r.bottom() }; }

} // namespace

const char* to_string(ConnectionKind kind) {
    switch (kind) {
    case ConnectionKind::Append: return "append";
    case ConnectionKind::Stack: return "stack";
    case ConnectionKind::Prepend: return "prepend";
    }
    return "append";
}

ConnectionKind connection_kind_for(story_model::AnchorType anchor) {
    switch (anchor) {
    case story_model::AnchorType::Top: return ConnectionKind::Stack;
    case story_model::AnchorType::Prepend: return ConnectionKind::Prepend;
    case story_model::AnchorType::Append:
    case story_model::AnchorType::Origin: return ConnectionKind::Append;
    }
    return ConnectionKind::Append;
}

ConnectionLine route_connection(const RenderNode& parent, const RenderNode& child,
    ConnectionKind kind)
{
    ConnectionLine line;
    line.parent_id = parent.node_id;
    line.child_id = child.node_id;
    line.kind = kind;

    switch (kind) {
    case ConnectionKind::Append: {
        // Cubic curve with horizontal tangents at both ends.
        const Anchor a = right_mid(parent.rect);
        const Anchor b = left_mid(child.rect);
        const double handle = (b.x - a.x) * 0.5;
        line.points = { { a.x, a.y }, { a.x + handle, a.y }, { b.x - handle, b.y }, { b.x, b.y } };
        break;
    }
    case ConnectionKind::Stack: {
        const Anchor a = top_mid(parent.rect);
        const Anchor b = bottom_mid(child.rect);
        line.points.push_back({ a.x, a.y });
        // Parent and child centers differ when the parent column is wider:
        // bend at mid height.
        if (std::abs(b.x - a.x) > 0.5) {
            const double mid_y = (a.y + b.y) * 0.5;
            line.points.push_back({ a.x, mid_y });
            line.points.push_back({ b.x, mid_y });
        }
        line.points.push_back({ b.x, b.y });
        break;
    }
    case ConnectionKind::Prepend: {
        const Anchor a = right_mid(child.rect);
        const Anchor b = left_mid(parent.rect);
        line.points = { { a.x, a.y }, { b.x, b.y } };
        break;
    }
    }
    return line;
}

} // namespace story_layout
