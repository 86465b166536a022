#include <canvas/timeline_panel.hpp>
#include <canvas/log.hpp>
#include <story_render/renderer.hpp>
#include <story_render/timeline_style.hpp>
#include <story_timeline/timecode.hpp>
#include "imgui.h"
#include <algorithm>

namespace canvas {

namespace ts = story_render::timeline_style;

TimelinePanel::TimelinePanel()
    : pixels_per_second_(ts::default_pixels_per_second)
{
}

void TimelinePanel::set_store(story_store::NodeStore* store, const std::string& canvas_id) {
    store_ = store;
    canvas_id_ = canvas_id;
    state_ = {};
    playhead_ = 0.0;
    scroll_seconds_ = 0.0;
}

void TimelinePanel::set_playhead(double seconds) {
    playhead_ = std::clamp(seconds, 0.0, std::max(state_.total_duration, 0.0));
}

void TimelinePanel::handle_input(float origin_x, float origin_y, float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    ImVec2 mouse = io.MousePos;
    const bool in_region = mouse.x >= origin_x && mouse.x <= origin_x + region_width &&
                           mouse.y >= origin_y && mouse.y <= origin_y + region_height;
    const bool hovered = in_region && ImGui::IsWindowHovered();
    const float clip_left = origin_x + ts::header_width;

    auto x_to_time = [&](float x) {
        return scroll_seconds_ + static_cast<double>(x - clip_left) / pixels_per_second_;
    };

    if (hovered && ImGui::IsMouseClicked(0) && mouse.x >= clip_left) scrubbing_ = true;
    if (ImGui::IsMouseReleased(0)) scrubbing_ = false;
    if (scrubbing_) set_playhead(x_to_time(mouse.x));

    if (hovered && io.MouseWheel != 0.0f) {
        if (io.KeyCtrl) {
            // Zoom around the cursor time.
            const double anchor = x_to_time(mouse.x);
            const float factor = io.MouseWheel > 0 ? 1.25f : 1.0f / 1.25f;
            pixels_per_second_ = std::clamp(pixels_per_second_ * factor,
                ts::min_pixels_per_second, ts::max_pixels_per_second);
            scroll_seconds_ = anchor - static_cast<double>(mouse.x - clip_left) / pixels_per_second_;
        } else {
            scroll_seconds_ -= io.MouseWheel * 40.0 / pixels_per_second_;
        }
        scroll_seconds_ = std::max(0.0, scroll_seconds_);
    }

    if (ImGui::IsWindowFocused()) {
        const double frame = 1.0 / fps_;
        if (ImGui::IsKeyPressed(ImGuiKey_RightArrow)) set_playhead(playhead_ + frame);
        if (ImGui::IsKeyPressed(ImGuiKey_LeftArrow)) set_playhead(playhead_ - frame);
        if (ImGui::IsKeyPressed(ImGuiKey_Home)) set_playhead(0.0);
        if (ImGui::IsKeyPressed(ImGuiKey_End)) set_playhead(state_.total_duration);
    }
}

bool TimelinePanel::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    if (store_) {
        state_ = story_timeline::derive_timeline(store_->snapshot(canvas_id_));
        issues_.update(state_.issues, canvas_logger());
    } else {
        state_ = {};
        state_.rows = story_timeline::empty_timeline_rows();
    }
    playhead_ = std::clamp(playhead_, 0.0, std::max(state_.total_duration, 0.0));

    const std::string tc = story_timeline::format_timecode(playhead_, fps_);
    const std::string total = story_timeline::format_time_simple(state_.total_duration);
    ImGui::Text("%s  /  %s   (%d fps)", tc.c_str(), total.c_str(), fps_);

    ImVec2 origin = ImGui::GetCursorScreenPos();
    const float avail_height = region_height - ImGui::GetFrameHeightWithSpacing();
    handle_input(origin.x, origin.y, region_width, avail_height);

    story_render::TimelineViewport view;
    view.origin_x = origin.x;
    view.origin_y = origin.y;
    view.width = region_width;
    view.pixels_per_second = pixels_per_second_;
    view.scroll_seconds = scroll_seconds_;
    view.playhead = playhead_;
    view.fps = fps_;
    story_render::render_timeline(ImGui::GetWindowDrawList(), state_, view);

    ImGui::Dummy(ImVec2(region_width,
        std::max(avail_height, ts::content_height(static_cast<int>(state_.rows.size())))));
    return true;
}

} // namespace canvas
