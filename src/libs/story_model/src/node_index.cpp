#include <story_model/node_index.hpp>
#include <algorithm>
#include <tuple>

namespace story_model {

namespace {

const ChildGroups empty_groups;

bool by_id(const Node* a, const Node* b) {
    return a->id < b->id;
}

} // namespace

const char* to_string(IssueKind kind) {
    switch (kind) {
    case IssueKind::DanglingParent: return "dangling_parent";
    case IssueKind::DuplicateId: return "duplicate_id";
    case IssueKind::DuplicateOrigin: return "duplicate_origin";
    case IssueKind::Unreachable: return "unreachable";
    case IssueKind::InvalidPlaybackRate: return "invalid_playback_rate";
    case IssueKind::InvalidLane: return "invalid_lane";
    }
    return "unknown";
}

NodeIndex::NodeIndex(const std::vector<Node>& nodes) {
    ordered_.reserve(nodes.size());
    for (const auto& n : nodes) {
        if (!by_id_.emplace(n.id, &n).second) {
            issues_.push_back({ IssueKind::DuplicateId, n.id, "id already used by another node" });
            continue;
        }
        ordered_.push_back(&n);
    }
    std::sort(ordered_.begin(), ordered_.end(), by_id);

    // ORIGIN candidates: a null parent wins over a set one, then the lowest id.
    std::vector<const Node*> origins;
    for (const Node* n : ordered_) {
        if (n->anchor_type == AnchorType::Origin) origins.push_back(n);
    }
    std::stable_sort(origins.begin(), origins.end(), [](const Node* a, const Node* b) {
        return std::make_tuple(a->parent_id.has_value(), a->id)
            < std::make_tuple(b->parent_id.has_value(), b->id);
    });
    if (!origins.empty()) {
        origin_ = origins.front();
        for (std::size_t i = 1; i < origins.size(); ++i) {
            issues_.push_back({ IssueKind::DuplicateOrigin, origins[i]->id,
                "canvas already has origin " + origin_->id });
            flagged_.insert(origins[i]->id);
        }
    }

    // ordered_ is sorted, so every group is filled in id order.
    for (const Node* n : ordered_) {
        if (!n->parent_id) continue;
        if (by_id_.find(*n->parent_id) == by_id_.end()) {
            issues_.push_back({ IssueKind::DanglingParent, n->id,
                "parent " + *n->parent_id + " not found" });
            flagged_.insert(n->id);
            continue;
        }
        if (!n->anchor_type) continue;
        ChildGroups& groups = children_[*n->parent_id];
        switch (*n->anchor_type) {
        case AnchorType::Append: groups.append.push_back(n); break;
        case AnchorType::Top: groups.top.push_back(n); break;
        case AnchorType::Prepend: groups.prepend.push_back(n); break;
        case AnchorType::Origin: break;
        }
    }
}

const Node* NodeIndex::find(const std::string& id) const {
    auto it = by_id_.find(id);
    return it == by_id_.end() ? nullptr : it->second;
}

const ChildGroups& NodeIndex::children(const Node& parent) const {
    auto it = children_.find(parent.id);
    return it == children_.end() ? empty_groups : it->second;
}

std::vector<IntegrityIssue> NodeIndex::unreachable_issues(
    const std::unordered_set<std::string>& visited,
    const std::unordered_set<std::string>& excluded) const
{
    std::vector<IntegrityIssue> out;
    for (const Node* n : ordered_) {
        if (visited.count(n->id) || excluded.count(n->id) || flagged_.count(n->id)) continue;
        out.push_back({ IssueKind::Unreachable, n->id, "not reachable from origin" });
    }
    return out;
}

} // namespace story_model
