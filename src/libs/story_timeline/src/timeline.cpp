#include <story_timeline/timeline.hpp>
#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <unordered_set>
#include <utility>

namespace story_timeline {

namespace {

using story_model::IntegrityIssue;
using story_model::IssueKind;
using story_model::Node;

constexpr int min_video_lanes = 3;
// Highest lane index (V100) a clip may occupy; rows are built for every
// lane up to the highest one in use.
constexpr int max_lane = 99;

std::string rate_message(const std::string& node_id, double rate) {
    return "node " + node_id + ": playback rate " + std::to_string(rate) + " must be > 0";
}

class TimelineProjector {
public:
    explicit TimelineProjector(const story_model::NodeIndex& index)
        : index_(index)
    {
    }

    TimelineState run(const Node& origin) {
        visit(origin, 0.0);

        TimelineState state;
        for (auto& [lane, clips] : clips_by_lane_) {
            std::stable_sort(clips.begin(), clips.end(),
                [](const TimelineClip& a, const TimelineClip& b) {
                    if (a.start != b.start) return a.start < b.start;
                    return a.node_id < b.node_id;
                });
        }
        state.rows = build_rows();
        state.total_duration = std::max(total_duration_, 0.0);
        state.issues = index_.issues();
        state.issues.insert(state.issues.end(), issues_.begin(), issues_.end());
        auto unreachable = index_.unreachable_issues(visited_, excluded_);
        state.issues.insert(state.issues.end(), unreachable.begin(), unreachable.end());
        return state;
    }

private:
    std::vector<TimelineRow> build_rows() {
        int max_lane = min_video_lanes - 1;
        if (!clips_by_lane_.empty())
            max_lane = std::max(max_lane, clips_by_lane_.rbegin()->first);

        std::vector<TimelineRow> rows;
        rows.reserve(static_cast<std::size_t>(max_lane) + 2);
        for (int lane = max_lane; lane >= 0; --lane) {
            TimelineRow row;
            row.lane_id = lane;
            row.label = "V" + std::to_string(lane + 1);
            row.kind = TrackKind::Video;
            auto it = clips_by_lane_.find(lane);
            if (it != clips_by_lane_.end()) row.clips = std::move(it->second);
            rows.push_back(std::move(row));
        }
        rows.push_back({ -1, "A1", TrackKind::Audio, {} });
        return rows;
    }

    // Records the clip for `node` starting at `start` and projects its
    // children. Returns the clip's end time, or nullopt if the node was
    // excluded (its subtree then stays unvisited).
    std::optional<double> visit(const Node& node, double start) {
        if (!visited_.insert(node.id).second) return std::nullopt;

        double duration = 0.0;
        try {
            duration = clip_duration(node);
        } catch (const InvalidPlaybackRate& e) {
            visited_.erase(node.id);
            excluded_.insert(node.id);
            issues_.push_back({ IssueKind::InvalidPlaybackRate, node.id, e.what() });
            return std::nullopt;
        }
        const double end = start + duration;

        const int lane = node.lane.value_or(0);
        if (lane < 0 || lane > max_lane) {
            issues_.push_back({ IssueKind::InvalidLane, node.id,
                "lane " + std::to_string(lane) + " is outside 0.." + std::to_string(max_lane)
                    + "; clip omitted" });
        } else {
            TimelineClip clip;
            clip.clip_id = "clip-" + node.id;
            clip.node_id = node.id;
            clip.asset_id = node.asset_id;
            clip.start = start;
            clip.end = end;
            clip.lane = lane;
            clip.duration = duration;
            if (!node.label.empty())
                clip.label = node.label;
            else
                clip.label = lane == 0 ? "SPINE" : "SATELLITE";
            clip.colors = story_model::lane_colors(lane);
            clips_by_lane_[lane].push_back(std::move(clip));
            total_duration_ = std::max(total_duration_, end);
        }

        const story_model::ChildGroups& groups = index_.children(node);

        // Satellites overlap their parent and never move its end.
        for (const Node* child : groups.top)
            visit(*child, start + drift_seconds(*child));

        double chain = end;
        for (const Node* child : groups.append) {
            if (auto child_end = visit(*child, chain + drift_seconds(*child)))
                chain = *child_end;
        }

        for (const Node* child : groups.prepend)
            visit(*child, start);

        return end;
    }

    static double drift_seconds(const Node& node) {
        return static_cast<double>(node.drift) / 1000.0;
    }

    const story_model::NodeIndex& index_;
    std::map<int, std::vector<TimelineClip>> clips_by_lane_;
    std::unordered_set<std::string> visited_;
    std::unordered_set<std::string> excluded_;
    std::vector<IntegrityIssue> issues_;
    double total_duration_ = 0.0;
};

} // namespace

InvalidPlaybackRate::InvalidPlaybackRate(const std::string& node_id, double rate)
    : std::invalid_argument(rate_message(node_id, rate))
    , node_id_(node_id)
    , rate_(rate)
{
}

double clip_duration(const Node& node) {
    const double rate = node.playback_rate;
    if (!std::isfinite(rate) || rate <= 0.0) throw InvalidPlaybackRate(node.id, rate);

    const double in_point = node.media_in_point.value_or(0.0);
    const double out_point = node.media_out_point.value_or(in_point);
    return (out_point - in_point) / rate;
}

std::vector<TimelineRow> empty_timeline_rows() {
    std::vector<TimelineRow> rows;
    for (int lane = min_video_lanes - 1; lane >= 0; --lane)
        rows.push_back({ lane, "V" + std::to_string(lane + 1), TrackKind::Video, {} });
    rows.push_back({ -1, "A1", TrackKind::Audio, {} });
    return rows;
}

TimelineState derive_timeline(const std::vector<Node>& nodes) {
    TimelineState empty;
    empty.rows = empty_timeline_rows();
    if (nodes.empty()) return empty;

    story_model::NodeIndex index(nodes);
    if (!index.origin()) return empty;

    TimelineProjector projector(index);
    return projector.run(*index.origin());
}

} // namespace story_timeline
