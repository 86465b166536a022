#pragma once

#include <story_model/node_index.hpp>
#include <story_model/palette.hpp>
#include <story_model/types.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace story_timeline {

struct TimelineClip {
    std::string clip_id;
    std::string node_id;
    std::string asset_id;
    double start = 0;    // seconds on the timeline
    double end = 0;
    int lane = 0;        // 0 = V1, 1 = V2, ...
    double duration = 0; // (out - in) / rate
    std::string label;
    story_model::NodeColors colors;

    bool operator==(const TimelineClip& other) const = default;
};

enum class TrackKind { Video, Audio };

struct TimelineRow {
    int lane_id = 0; // -1 for the audio row
    std::string label;
    TrackKind kind = TrackKind::Video;
    std::vector<TimelineClip> clips; // ordered by start time

    bool operator==(const TimelineRow& other) const = default;
};

struct TimelineState {
    std::vector<TimelineRow> rows; // highest video lane first, A1 last
    double total_duration = 0;
    std::vector<story_model::IntegrityIssue> issues;

    bool operator==(const TimelineState& other) const = default;
};

class InvalidPlaybackRate : public std::invalid_argument {
public:
    InvalidPlaybackRate(const std::string& node_id, double rate);

    const std::string& node_id() const { return node_id_; }
    double rate() const { return rate_; }

private:
    std::string node_id_;
    double rate_;
};

// (out - in) / rate, with in defaulting to 0 and out to in.
// Throws InvalidPlaybackRate unless the rate is finite and > 0.
double clip_duration(const story_model::Node& node);

// Linear projection of the node tree. ORIGIN starts at 0; TOP children start
// at parent start + drift; APPEND children chain after the parent (each
// sibling after the previous one) + drift; PREPEND children share the
// parent's start. Lanes come from Node::lane unchanged.
TimelineState derive_timeline(const std::vector<story_model::Node>& nodes);

// Rows V1..V3 (more if higher lanes hold clips) plus an empty A1 row.
std::vector<TimelineRow> empty_timeline_rows();

} // namespace story_timeline
