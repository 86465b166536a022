#pragma once

#include <canvas/issue_tracker.hpp>
#include <story_store/node_store.hpp>
#include <story_timeline/timeline.hpp>
#include <string>

namespace canvas {

// Scrub/track view of the same node snapshot the canvas draws, projected
// linearly every frame.
class TimelinePanel {
public:
    TimelinePanel();

    void set_store(story_store::NodeStore* store, const std::string& canvas_id);
    void set_fps(int fps) { fps_ = fps > 0 ? fps : 24; }
    int fps() const { return fps_; }

    double playhead() const { return playhead_; }
    void set_playhead(double seconds);
    const story_timeline::TimelineState& state() const { return state_; }

    bool update_and_draw(float region_width, float region_height);

private:
    story_store::NodeStore* store_ = nullptr;
    std::string canvas_id_;
    story_timeline::TimelineState state_;
    IssueTracker issues_{ "timeline" };
    int fps_ = 24;
    double playhead_ = 0.0;
    double scroll_seconds_ = 0.0;
    float pixels_per_second_;
    bool scrubbing_ = false;

    void handle_input(float origin_x, float origin_y, float region_width, float region_height);
};

} // namespace canvas
