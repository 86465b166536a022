#pragma once

#include <story_model/types.hpp>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace story_model {

enum class IssueKind {
    DanglingParent,      // parent_id does not resolve inside the snapshot
    DuplicateId,         // a later node reuses an id; the first one is kept
    DuplicateOrigin,     // more than one ORIGIN candidate; the extra ones are ignored
    Unreachable,         // not reachable from ORIGIN through anchored edges
    InvalidPlaybackRate, // rate is not a finite value > 0
    InvalidLane          // negative lane index
};

const char* to_string(IssueKind kind);

// Non-fatal data problem found while projecting a snapshot. The offending
// node is excluded; the rest of the graph is still projected.
struct IntegrityIssue {
    IssueKind kind = IssueKind::Unreachable;
    std::string node_id;
    std::string detail;

    bool operator==(const IntegrityIssue& other) const = default;
};

// Children of one parent, split by anchor kind. Each group is ordered by
// node id so traversal never depends on the order of the input vector.
struct ChildGroups {
    std::vector<const Node*> append;
    std::vector<const Node*> top;
    std::vector<const Node*> prepend;
};

// Arena view over a flat node list: id lookup plus a parent -> children
// adjacency map. Built once per projection call and never cached across
// calls. Holds pointers into `nodes`, which must outlive the index.
class NodeIndex {
public:
    explicit NodeIndex(const std::vector<Node>& nodes);

    const Node* origin() const { return origin_; }
    const Node* find(const std::string& id) const;
    const ChildGroups& children(const Node& parent) const;

    std::size_t size() const { return by_id_.size(); }
    const std::vector<IntegrityIssue>& issues() const { return issues_; }

    // Reports every indexed node that is neither in `visited` nor in
    // `excluded` (already reported) and has no earlier issue of its own.
    std::vector<IntegrityIssue> unreachable_issues(
        const std::unordered_set<std::string>& visited,
        const std::unordered_set<std::string>& excluded = {}) const;

private:
    std::vector<const Node*> ordered_;
    std::unordered_map<std::string, const Node*> by_id_;
    std::unordered_map<std::string, ChildGroups> children_;
    std::unordered_set<std::string> flagged_;
    std::vector<IntegrityIssue> issues_;
    const Node* origin_ = nullptr;
};

} // namespace story_model
