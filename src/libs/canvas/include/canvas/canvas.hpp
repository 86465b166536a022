#pragma once

#include <canvas/issue_tracker.hpp>
#include <story_layout/drop_zone.hpp>
#include <story_layout/types.hpp>
#include <story_store/insertion.hpp>
#include <story_store/node_store.hpp>
#include <optional>
#include <string>

struct ImVec2;

namespace canvas {

// Infinite editing surface. Every frame the node snapshot is re-read from
// the store and laid out again; nothing geometric survives a frame except
// for drawing and hit testing inside it.
class StoryCanvas {
public:
    StoryCanvas();
    ~StoryCanvas();

    void set_store(story_store::NodeStore* store, const std::string& canvas_id);
    const std::string& canvas_id() const { return canvas_id_; }

    // While armed, hovering shows the drop ghost and a left click creates
    // the node through the store.
    void arm_insertion(const story_store::MediaClip& media);
    void cancel_insertion();
    bool insertion_armed() const { return pending_media_.has_value(); }

    const std::string& selected_node_id() const { return selected_node_id_; }
    void select_node(const std::string& node_id) { selected_node_id_ = node_id; }
    void focus_on_node(const std::string& node_id);

    void set_grid_step(float step) { grid_step_ = step; }
    float grid_step() const { return grid_step_; }

    void pan(float dx, float dy);
    void zoom_at(float screen_x, float screen_y, float zoom_delta);

    void screen_to_world(float screen_x, float screen_y, double& world_x, double& world_y) const;
    void world_to_screen(double world_x, double world_y, float& screen_x, float& screen_y) const;

    float offset_x() const { return offset_x_; }
    float offset_y() const { return offset_y_; }
    float zoom() const { return zoom_; }
    const story_layout::GraphLayout& layout() const { return layout_; }

    bool update_and_draw(float region_width, float region_height);

private:
    story_store::NodeStore* store_ = nullptr;
    std::string canvas_id_;
    story_layout::GraphLayout layout_;
    std::optional<story_store::MediaClip> pending_media_;
    std::optional<story_layout::DropZone> hover_zone_;
    std::string hovered_node_id_;
    std::string selected_node_id_;
    IssueTracker issues_{ "layout" };
    float offset_x_ = 0;
    float offset_y_ = 0;
    float zoom_ = 0.6f;
    float grid_step_ = 50.0f;
    float last_region_width_ = 0;
    float last_region_height_ = 0;
    bool centered_ = false;
    bool dragging_ = false;
    float drag_start_x_ = 0;
    float drag_start_y_ = 0;
    float drag_start_offset_x_ = 0;
    float drag_start_offset_y_ = 0;

    void draw_grid(ImVec2 region_min, ImVec2 region_max);
    void handle_input(float region_width, float region_height);
    void commit_insertion(const story_layout::DropZone& zone);
};

} // namespace canvas
