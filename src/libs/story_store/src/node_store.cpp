#include <story_store/node_store.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <utility>

namespace story_store {

namespace {

const char* const id_prefix = "node-";

// Numeric suffix of a store-issued id, 0 for foreign ids.
std::uint64_t id_sequence(const std::string& id) {
    const std::string prefix = id_prefix;
    if (id.size() <= prefix.size() || id.compare(0, prefix.size(), prefix) != 0) return 0;
    std::uint64_t seq = 0;
    for (std::size_t i = prefix.size(); i < id.size(); ++i) {
        if (id[i] < '0' || id[i] > '9') return 0;
        seq = seq * 10 + static_cast<std::uint64_t>(id[i] - '0');
    }
    return seq;
}

} // namespace

void NodeStore::load(const story_model::CanvasSnapshot& snapshot) {
    nodes_.erase(std::remove_if(nodes_.begin(), nodes_.end(),
                     [&](const story_model::Node& n) { return n.canvas_id == snapshot.id; }),
        nodes_.end());
    for (auto node : snapshot.nodes) {
        node.canvas_id = snapshot.id;
        next_seq_ = std::max(next_seq_, id_sequence(node.id) + 1);
        nodes_.push_back(std::move(node));
    }
}

std::vector<story_model::Node> NodeStore::snapshot(const std::string& canvas_id) const {
    std::vector<story_model::Node> out;
    for (const auto& n : nodes_) {
        if (n.canvas_id == canvas_id) out.push_back(n);
    }
    return out;
}

std::optional<story_model::Node> NodeStore::find(const std::string& id) const {
    for (const auto& n : nodes_) {
        if (n.id == id) return n;
    }
    return std::nullopt;
}

story_model::Node* NodeStore::find_mutable(const std::string& id) {
    for (auto& n : nodes_) {
        if (n.id == id) return &n;
    }
    return nullptr;
}

std::string NodeStore::next_id() {
    std::string id;
    do {
        id = fmt::format("{}{:06}", id_prefix, next_seq_++);
    } while (find_mutable(id));
    return id;
}

story_model::Node NodeStore::create_node(const NodeDraft& draft) {
    story_model::Node node;
    node.id = next_id();
    node.canvas_id = draft.canvas_id;
    node.type = draft.type;
    node.parent_id = draft.parent_id;
    node.anchor_type = draft.anchor_type;
    node.lane = draft.lane;
    node.drift = draft.drift;
    node.media_in_point = draft.media_in_point;
    node.media_out_point = draft.media_out_point;
    node.playback_rate = draft.playback_rate;
    node.asset_id = draft.asset_id;
    node.label = draft.label;
    nodes_.push_back(node);
    return node;
}

bool NodeStore::update_node(const std::string& id, const NodeUpdate& update) {
    story_model::Node* node = find_mutable(id);
    if (!node) return false;

    if (update.playback_rate
        && (!std::isfinite(*update.playback_rate) || *update.playback_rate <= 0.0))
        return false;
    if (update.lane && *update.lane < 0) return false;
    if (update.parent_id) {
        if (*update.parent_id == id) return false;
        const story_model::Node* parent = find_mutable(*update.parent_id);
        if (!parent || parent->canvas_id != node->canvas_id) return false;
    }

    if (update.drift) node->drift = *update.drift;
    if (update.media_in_point) node->media_in_point = *update.media_in_point;
    if (update.media_out_point) node->media_out_point = *update.media_out_point;
    if (update.playback_rate) node->playback_rate = *update.playback_rate;
    if (update.lane) node->lane = *update.lane;
    if (update.parent_id) node->parent_id = *update.parent_id;
    if (update.anchor_type) node->anchor_type = *update.anchor_type;
    return true;
}

bool NodeStore::remove_node(const std::string& id) {
    auto it = std::find_if(nodes_.begin(), nodes_.end(),
        [&](const story_model::Node& n) { return n.id == id; });
    if (it == nodes_.end()) return false;
    nodes_.erase(it);
    return true;
}

std::optional<story_model::Node> NodeStore::spine_tail(const std::string& canvas_id) const {
    const story_model::Node* best = nullptr;
    for (const auto& n : nodes_) {
        if (n.canvas_id != canvas_id || n.type != story_model::NodeType::Spine) continue;
        const bool has_append_child = std::any_of(nodes_.begin(), nodes_.end(),
            [&](const story_model::Node& c) {
                return c.parent_id == n.id && c.anchor_type == story_model::AnchorType::Append;
            });
        if (has_append_child) continue;
        if (!best || n.id < best->id) best = &n;
    }
    if (!best) return std::nullopt;
    return *best;
}

} // namespace story_store
