#pragma once

#include <story_model/types.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace story_store {

// Everything needed to create a node; the store assigns the id.
struct NodeDraft {
    std::string canvas_id;
    story_model::NodeType type = story_model::NodeType::Spine;
    std::optional<std::string> parent_id;
    std::optional<story_model::AnchorType> anchor_type;
    std::optional<int> lane;
    std::int64_t drift = 0;
    double media_in_point = 0.0;
    std::optional<double> media_out_point;
    double playback_rate = 1.0;
    std::string asset_id;
    std::string label;
};

// Partial update; only engaged fields are written.
struct NodeUpdate {
    std::optional<std::int64_t> drift;
    std::optional<double> media_in_point;
    std::optional<double> media_out_point;
    std::optional<double> playback_rate;
    std::optional<int> lane;
    std::optional<std::string> parent_id;
    std::optional<story_model::AnchorType> anchor_type;
};

// In-memory node collection for one or more canvases. Stands in for the
// persistence layer: the projections only ever see snapshot() copies.
// Ids are issued in creation order ("node-000001", "node-000002", ...), so
// sorting siblings by id keeps them in creation order.
class NodeStore {
public:
    // Replaces every node of snapshot.id with the snapshot's nodes.
    void load(const story_model::CanvasSnapshot& snapshot);

    std::vector<story_model::Node> snapshot(const std::string& canvas_id) const;
    std::optional<story_model::Node> find(const std::string& id) const;

    story_model::Node create_node(const NodeDraft& draft);

    // False if the node does not exist or a value is invalid (rate <= 0,
    // negative lane, parent missing from the canvas or equal to the node).
    bool update_node(const std::string& id, const NodeUpdate& update);

    // Children of a removed node keep their parent_id and become dangling.
    bool remove_node(const std::string& id);

    // A SPINE node with no APPEND child (lowest id first), if any.
    std::optional<story_model::Node> spine_tail(const std::string& canvas_id) const;

    std::size_t size() const { return nodes_.size(); }

private:
    std::string next_id();
    story_model::Node* find_mutable(const std::string& id);

    std::vector<story_model::Node> nodes_;
    std::uint64_t next_seq_ = 1;
};

} // namespace story_store
