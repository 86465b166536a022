#include <canvas/canvas.hpp>
#include <canvas/log.hpp>
#include <story_layout/graph_layout.hpp>
#include <story_render/renderer.hpp>
#include "imgui.h"
#include <cmath>

namespace {

bool pick_node_at(const story_layout::GraphLayout& layout, double wx, double wy, std::string& out_id) {
    for (auto it = layout.nodes.rbegin(); it != layout.nodes.rend(); ++it) {
        const auto& r = it->rect;
        if (wx >= r.x && wx <= r.right() && wy >= r.y && wy <= r.bottom()) {
            out_id = it->node_id;
            return true;
        }
    }
    return false;
}

} // namespace

namespace canvas {

StoryCanvas::StoryCanvas() = default;

StoryCanvas::~StoryCanvas() = default;

void StoryCanvas::set_store(story_store::NodeStore* store, const std::string& canvas_id) {
    store_ = store;
    canvas_id_ = canvas_id;
    layout_ = {};
    hover_zone_.reset();
    hovered_node_id_.clear();
    selected_node_id_.clear();
    centered_ = false;
}

void StoryCanvas::arm_insertion(const story_store::MediaClip& media) {
    pending_media_ = media;
    canvas_logger()->info("insertion_armed asset={} duration={}", media.asset_id, media.duration_sec);
}

void StoryCanvas::cancel_insertion() {
    pending_media_.reset();
    hover_zone_.reset();
}

void StoryCanvas::pan(float dx, float dy) {
    offset_x_ += dx;
    offset_y_ += dy;
}

void StoryCanvas::zoom_at(float screen_x, float screen_y, float zoom_delta) {
    float new_zoom = zoom_ * zoom_delta;
    if (new_zoom < 0.1f) new_zoom = 0.1f;
    if (new_zoom > 4.0f) new_zoom = 4.0f;
    float factor = new_zoom / zoom_;
    offset_x_ = screen_x - (screen_x - offset_x_) * factor;
    offset_y_ = screen_y - (screen_y - offset_y_) * factor;
    zoom_ = new_zoom;
}

void StoryCanvas::screen_to_world(float screen_x, float screen_y, double& world_x, double& world_y) const {
    world_x = (screen_x - offset_x_) / zoom_;
    world_y = (screen_y - offset_y_) / zoom_;
}

void StoryCanvas::world_to_screen(double world_x, double world_y, float& screen_x, float& screen_y) const {
    screen_x = static_cast<float>(world_x) * zoom_ + offset_x_;
    screen_y = static_cast<float>(world_y) * zoom_ + offset_y_;
}

void StoryCanvas::focus_on_node(const std::string& node_id) {
    for (const auto& rn : layout_.nodes) {
        if (rn.node_id == node_id) {
            double cx = rn.rect.x + rn.rect.width * 0.5;
            double cy = rn.rect.y + rn.rect.height * 0.5;
            ImVec2 win = ImGui::GetWindowPos();
            offset_x_ = win.x + last_region_width_ * 0.5f - static_cast<float>(cx) * zoom_;
            offset_y_ = win.y + last_region_height_ * 0.5f - static_cast<float>(cy) * zoom_;
            return;
        }
    }
}

void StoryCanvas::draw_grid(ImVec2 region_min, ImVec2 region_max) {
    ImDrawList* dl = ImGui::GetWindowDrawList();
    if (!dl) return;

    const unsigned int grid_color = IM_COL32(45, 45, 50, 255);
    const unsigned int floor_color = IM_COL32(90, 70, 120, 255);

    double left_world, top_world, right_world, bottom_world;
    screen_to_world(region_min.x, region_min.y, left_world, top_world);
    screen_to_world(region_max.x, region_max.y, right_world, bottom_world);

    double start_x = std::floor(left_world / grid_step_) * grid_step_;
    double start_y = std::floor(top_world / grid_step_) * grid_step_;

    for (double wx = start_x; wx <= right_world + grid_step_; wx += grid_step_) {
        float sx, sy;
        world_to_screen(wx, 0.0, sx, sy);
        dl->AddLine(ImVec2(sx, region_min.y), ImVec2(sx, region_max.y), grid_color, 1.0f);
    }
    for (double wy = start_y; wy <= bottom_world + grid_step_; wy += grid_step_) {
        float sx, sy;
        world_to_screen(0.0, wy, sx, sy);
        dl->AddLine(ImVec2(region_min.x, sy), ImVec2(region_max.x, sy), grid_color, 1.0f);
    }

    // The spine floor sits under lane V1.
    float fx, fy;
    world_to_screen(0.0, 100.0, fx, fy);
    dl->AddLine(ImVec2(region_min.x, fy), ImVec2(region_max.x, fy), floor_color, 2.0f);
}

void StoryCanvas::commit_insertion(const story_layout::DropZone& zone) {
    auto logger = canvas_logger();
    if (!store_ || !pending_media_) return;

    const auto nodes = store_->snapshot(canvas_id_);
    auto draft = story_store::plan_insertion(zone, canvas_id_, nodes, *pending_media_);
    if (!draft) {
        logger->warn("insertion_rejected canvas={} target={} zone={} genesis={}",
            canvas_id_, zone.target_node_id, story_layout::to_string(zone.kind), zone.genesis);
        return;
    }

    const story_model::Node created = store_->create_node(*draft);
    logger->info("node_created canvas={} node={} type={} anchor={} parent={} lane=V{}",
        canvas_id_, created.id, story_model::to_string(created.type),
        created.anchor_type ? story_model::to_string(*created.anchor_type) : "none",
        created.parent_id.value_or("-"), created.lane.value_or(0) + 1);
    selected_node_id_ = created.id;
    pending_media_.reset();
    hover_zone_.reset();
}

void StoryCanvas::handle_input(float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    ImVec2 mouse = io.MousePos;
    ImVec2 win_min = ImGui::GetWindowPos();
    ImVec2 win_max = ImVec2(win_min.x + region_width, win_min.y + region_height);

    bool in_region = mouse.x >= win_min.x && mouse.x <= win_max.x &&
                     mouse.y >= win_min.y && mouse.y <= win_max.y;
    bool hovered = ImGui::IsWindowHovered();

    double wx = 0.0;
    double wy = 0.0;
    screen_to_world(mouse.x, mouse.y, wx, wy);

    hovered_node_id_.clear();
    if (in_region) pick_node_at(layout_, wx, wy, hovered_node_id_);

    hover_zone_.reset();
    if (pending_media_ && in_region && hovered)
        hover_zone_ = story_layout::detect_drop_zone(wx, wy, layout_);

    if (pending_media_ && ImGui::IsKeyPressed(ImGuiKey_Escape)) {
        cancel_insertion();
        return;
    }

    if (ImGui::IsMouseClicked(0) && in_region && hovered) {
        if (pending_media_ && hover_zone_) {
            commit_insertion(*hover_zone_);
            return;
        }
        if (!hovered_node_id_.empty()) {
            selected_node_id_ = hovered_node_id_;
        } else {
            dragging_ = true;
            drag_start_x_ = mouse.x;
            drag_start_y_ = mouse.y;
            drag_start_offset_x_ = offset_x_;
            drag_start_offset_y_ = offset_y_;
        }
    }
    if (ImGui::IsMouseClicked(2) && in_region && hovered) {
        dragging_ = true;
        drag_start_x_ = mouse.x;
        drag_start_y_ = mouse.y;
        drag_start_offset_x_ = offset_x_;
        drag_start_offset_y_ = offset_y_;
    }

    if (ImGui::IsMouseReleased(0) || ImGui::IsMouseReleased(2)) dragging_ = false;

    if (dragging_) {
        offset_x_ = drag_start_offset_x_ + (mouse.x - drag_start_x_);
        offset_y_ = drag_start_offset_y_ + (mouse.y - drag_start_y_);
    }

    if (in_region && hovered && io.MouseWheel != 0.0f) {
        float factor = io.MouseWheel > 0 ? 1.2f : 1.0f / 1.2f;
        zoom_at(mouse.x, mouse.y, factor);
    }
}

bool StoryCanvas::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    last_region_width_ = region_width;
    last_region_height_ = region_height;

    ImVec2 region_min = ImGui::GetCursorScreenPos();
    ImVec2 region_max = ImVec2(region_min.x + region_width, region_min.y + region_height);

    if (!centered_) {
        // Floor below the middle so stacked lanes have room above.
        offset_x_ = region_min.x + 20.0f;
        offset_y_ = region_min.y + region_height * 0.6f;
        centered_ = true;
    }

    // Recomputed live from the current snapshot: no geometry is carried over.
    if (store_) {
        layout_ = story_layout::compute_graph_layout(store_->snapshot(canvas_id_));
        issues_.update(layout_.issues, canvas_logger());
    } else {
        layout_ = {};
    }

    handle_input(region_width, region_height);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    draw_list->PushClipRect(region_min, region_max, true);
    draw_grid(region_min, region_max);
    const std::string& highlight = hovered_node_id_.empty() ? selected_node_id_ : hovered_node_id_;
    story_render::render_graph(draw_list, layout_, offset_x_, offset_y_, zoom_, highlight);
    if (hover_zone_)
        story_render::render_drop_ghost(draw_list, *hover_zone_, offset_x_, offset_y_, zoom_);
    draw_list->PopClipRect();

    return true;
}

} // namespace canvas
