#include <canvas/issue_tracker.hpp>
#include <utility>

namespace canvas {

namespace {

std::string issue_key(const story_model::IntegrityIssue& issue) {
    return std::string(story_model::to_string(issue.kind)) + "|" + issue.node_id;
}

} // namespace

IssueTracker::IssueTracker(std::string source)
    : source_(std::move(source))
{
}

void IssueTracker::update(const std::vector<story_model::IntegrityIssue>& issues,
    const std::shared_ptr<spdlog::logger>& logger)
{
    std::unordered_set<std::string> current;
    for (const auto& issue : issues) {
        const std::string key = issue_key(issue);
        if (!current.insert(key).second) continue;
        if (active_.find(key) == active_.end()) {
            logger->warn("integrity_issue source={} kind={} node={} detail=\"{}\"",
                source_, story_model::to_string(issue.kind), issue.node_id, issue.detail);
        }
    }
    for (const auto& key : active_) {
        if (current.find(key) == current.end())
            logger->info("integrity_resolved source={} issue={}", source_, key);
    }
    active_ = std::move(current);
}

} // namespace canvas
