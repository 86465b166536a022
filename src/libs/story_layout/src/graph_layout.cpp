#include <story_layout/graph_layout.hpp>
#include <story_layout/connection_lines.hpp>
#include <story_layout/layout_constants.hpp>
#include <story_model/node_index.hpp>
#include <story_model/palette.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace story_layout {

namespace {

using story_model::AnchorType;
using story_model::Node;
using story_model::NodeType;

class ElasticColumnLayout {
public:
    explicit ElasticColumnLayout(const story_model::NodeIndex& index)
        : index_(index)
    {
    }

    GraphLayout run(const Node& origin) {
        const double rightmost = place(origin, layout::canvas_padding, 0.0,
            rendered_width(origin), std::nullopt);

        out_.total_width = rightmost + layout::canvas_padding;
        out_.total_height = std::abs(min_y_) + layout::node_height + layout::canvas_padding;
        out_.issues = index_.issues();
        auto unreachable = index_.unreachable_issues(visited_);
        out_.issues.insert(out_.issues.end(), unreachable.begin(), unreachable.end());
        return std::move(out_);
    }

private:
    // Width of the column a node needs to cover its stacked children.
    // Only TOP children contribute.
    double elastic_width(const Node& node) {
        auto it = elastic_.find(node.id);
        if (it != elastic_.end()) return it->second;

        double width = layout::base_node_width;
        for (const Node* child : index_.children(node).top)
            width = std::max(width, elastic_width(*child));
        elastic_[node.id] = width;
        return width;
    }

    double rendered_width(const Node& node) {
        return node.type == NodeType::Spine ? elastic_width(node) : layout::base_node_width;
    }

    // Emits `node` at (x, y) plus the edge from its parent, then places its
    // children: APPEND chained left to right, TOP stacked above (all at the
    // same spot), PREPEND to the left. Returns the rightmost x of the subtree.
    double place(const Node& node, double x, double y, double width,
        std::optional<std::size_t> parent_slot)
    {
        if (!visited_.insert(node.id).second) return x;

        const std::size_t slot = out_.nodes.size();
        RenderNode rn;
        rn.node_id = node.id;
        rn.type = node.type;
        rn.label = node.label.empty() ? node.asset_id : node.label;
        rn.rect = { x, y, width, layout::node_height };
        rn.colors = story_model::node_colors(node.type);
        rn.lane_label = lane_label_for_y(y);
        rn.is_origin = node.anchor_type == AnchorType::Origin;
        out_.nodes.push_back(std::move(rn));
        min_y_ = std::min(min_y_, y);

        if (parent_slot && node.anchor_type) {
            out_.connections.push_back(route_connection(out_.nodes[*parent_slot],
                out_.nodes[slot], connection_kind_for(*node.anchor_type)));
        }

        // Copy: recursion grows out_.nodes.
        const Rect self = out_.nodes[slot].rect;
        double rightmost = self.right();
        const story_model::ChildGroups& groups = index_.children(node);

        double anchor_right = self.right();
        for (const Node* child : groups.append) {
            const double child_width = rendered_width(*child);
            const double child_x = anchor_right + layout::node_gap;
            rightmost = std::max(rightmost, place(*child, child_x, self.y, child_width, slot));
            anchor_right = child_x + child_width;
        }

        // Several TOP children land on the same spot and overlap.
        const double stacked_y = self.y - layout::node_height - layout::node_gap;
        for (const Node* child : groups.top) {
            rightmost = std::max(rightmost,
                place(*child, self.x, stacked_y, rendered_width(*child), slot));
        }

        for (const Node* child : groups.prepend) {
            const double child_width = rendered_width(*child);
            const double child_x = self.x - child_width - layout::node_gap;
            rightmost = std::max(rightmost, place(*child, child_x, self.y, child_width, slot));
        }

        return rightmost;
    }

    const story_model::NodeIndex& index_;
    GraphLayout out_;
    std::unordered_map<std::string, double> elastic_;
    std::unordered_set<std::string> visited_;
    double min_y_ = 0.0;
};

} // namespace

std::string lane_label_for_y(double y) {
    const long lane = std::lround(std::abs(y) / layout::lane_pitch()) + 1;
    return "V" + std::to_string(lane);
}

GraphLayout compute_graph_layout(const std::vector<story_model::Node>& nodes) {
    if (nodes.empty()) return {};

    story_model::NodeIndex index(nodes);
    if (!index.origin()) return {};

    ElasticColumnLayout builder(index);
    return builder.run(*index.origin());
}

} // namespace story_layout
