#pragma once

#include <story_layout/drop_zone.hpp>
#include <story_layout/types.hpp>
#include <story_model/palette.hpp>
#include <story_timeline/timeline.hpp>
#include <string>

struct ImDrawList;

namespace story_render {

unsigned int to_im_color(const story_model::Color& c, int alpha = 255);

void render_graph(ImDrawList* draw_list,
    const story_layout::GraphLayout& layout,
    float offset_x, float offset_y, float zoom,
    const std::string& hovered_node_id = {});

// Translucent preview of the node an insertion would create.
void render_drop_ghost(ImDrawList* draw_list,
    const story_layout::DropZone& zone,
    float offset_x, float offset_y, float zoom);

struct TimelineViewport {
    float origin_x = 0; // screen position of the top-left corner
    float origin_y = 0;
    float width = 0;
    float pixels_per_second = 40.0f;
    double scroll_seconds = 0; // time at the left edge of the clip area
    double playhead = 0;
    int fps = 24;
};

void render_timeline(ImDrawList* draw_list,
    const story_timeline::TimelineState& state,
    const TimelineViewport& view);

} // namespace story_render
