#pragma once

#include <story_model/node_index.hpp>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace canvas {

// Logs integrity issues once when they appear and once when they clear,
// instead of every frame the projections are recomputed.
class IssueTracker {
public:
    explicit IssueTracker(std::string source);

    void update(const std::vector<story_model::IntegrityIssue>& issues,
        const std::shared_ptr<spdlog::logger>& logger);

    std::size_t active_count() const { return active_.size(); }

private:
    std::string source_;
    std::unordered_set<std::string> active_;
};

} // namespace canvas
