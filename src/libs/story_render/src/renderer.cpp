#include <story_render/renderer.hpp>
#include <story_render/timeline_style.hpp>
#include <story_timeline/timecode.hpp>
#include "imgui.h"
#include <algorithm>
#include <cmath>

namespace story_render {

namespace {

ImVec2 world_to_screen(double wx, double wy, float offset_x, float offset_y, float zoom) {
    return ImVec2(static_cast<float>(wx) * zoom + offset_x, static_cast<float>(wy) * zoom + offset_y);
}

const unsigned int text_color = IM_COL32(240, 240, 245, 255);
const unsigned int muted_text_color = IM_COL32(170, 170, 180, 255);
const unsigned int connection_color = IM_COL32(150, 150, 160, 255);
const unsigned int hover_border_color = IM_COL32(250, 250, 250, 255);

void draw_connection(ImDrawList* dl, const story_layout::ConnectionLine& line,
    float offset_x, float offset_y, float zoom)
{
    const float thickness = 2.0f;
    if (line.points.size() < 2) return;

    if (line.kind == story_layout::ConnectionKind::Append && line.points.size() == 4) {
        ImVec2 p[4];
        for (int i = 0; i < 4; ++i)
            p[i] = world_to_screen(line.points[i].first, line.points[i].second, offset_x, offset_y, zoom);
        dl->AddBezierCubic(p[0], p[1], p[2], p[3], connection_color, thickness);
        return;
    }

    for (std::size_t i = 0; i + 1 < line.points.size(); ++i) {
        ImVec2 a = world_to_screen(line.points[i].first, line.points[i].second, offset_x, offset_y, zoom);
        ImVec2 b = world_to_screen(line.points[i + 1].first, line.points[i + 1].second, offset_x, offset_y, zoom);
        dl->AddLine(a, b, connection_color, thickness);
    }
}

} // namespace

unsigned int to_im_color(const story_model::Color& c, int alpha) {
    return IM_COL32(c.r, c.g, c.b, alpha);
}

void render_graph(ImDrawList* draw_list,
    const story_layout::GraphLayout& layout,
    float offset_x, float offset_y, float zoom,
    const std::string& hovered_node_id)
{
    if (!draw_list) return;

    for (const auto& line : layout.connections)
        draw_connection(draw_list, line, offset_x, offset_y, zoom);

    const float rounding = 6.0f * zoom;
    for (const auto& rn : layout.nodes) {
        ImVec2 min_pt = world_to_screen(rn.rect.x, rn.rect.y, offset_x, offset_y, zoom);
        ImVec2 max_pt = world_to_screen(rn.rect.right(), rn.rect.bottom(), offset_x, offset_y, zoom);

        draw_list->AddRectFilled(min_pt, max_pt, to_im_color(rn.colors.fill), rounding);
        const bool hovered = rn.node_id == hovered_node_id;
        draw_list->AddRect(min_pt, max_pt,
            hovered ? hover_border_color : to_im_color(rn.colors.border),
            rounding, 0, rn.is_origin || hovered ? 3.0f : 2.0f);

        const ImVec2 pad(8.0f, 6.0f);
        draw_list->AddText(ImVec2(min_pt.x + pad.x, min_pt.y + pad.y), muted_text_color,
            rn.lane_label.c_str());
        if (rn.is_origin) {
            const char* badge = "ORIGIN";
            ImVec2 badge_size = ImGui::CalcTextSize(badge);
            draw_list->AddText(ImVec2(max_pt.x - pad.x - badge_size.x, min_pt.y + pad.y),
                text_color, badge);
        }
        if (!rn.label.empty()) {
            ImVec2 text_size = ImGui::CalcTextSize(rn.label.c_str());
            float tx = min_pt.x + (max_pt.x - min_pt.x - text_size.x) * 0.5f;
            float ty = min_pt.y + (max_pt.y - min_pt.y - text_size.y) * 0.5f;
            draw_list->PushClipRect(min_pt, max_pt, true);
            draw_list->AddText(ImVec2(tx, ty), text_color, rn.label.c_str());
            draw_list->PopClipRect();
        }
    }
}

void render_drop_ghost(ImDrawList* draw_list,
    const story_layout::DropZone& zone,
    float offset_x, float offset_y, float zoom)
{
    if (!draw_list) return;

    ImVec2 min_pt = world_to_screen(zone.ghost.x, zone.ghost.y, offset_x, offset_y, zoom);
    ImVec2 max_pt = world_to_screen(zone.ghost.right(), zone.ghost.bottom(), offset_x, offset_y, zoom);
    draw_list->AddRectFilled(min_pt, max_pt, IM_COL32(255, 255, 255, 40), 6.0f * zoom);
    draw_list->AddRect(min_pt, max_pt, IM_COL32(255, 255, 255, 160), 6.0f * zoom, 0, 2.0f);

    const char* caption = zone.genesis ? "origin" : story_layout::to_string(zone.kind);
    ImVec2 text_size = ImGui::CalcTextSize(caption);
    draw_list->AddText(ImVec2(min_pt.x + (max_pt.x - min_pt.x - text_size.x) * 0.5f,
                           min_pt.y + (max_pt.y - min_pt.y - text_size.y) * 0.5f),
        IM_COL32(255, 255, 255, 200), caption);
}

void render_timeline(ImDrawList* draw_list,
    const story_timeline::TimelineState& state,
    const TimelineViewport& view)
{
    namespace ts = timeline_style;
    if (!draw_list || view.pixels_per_second <= 0.0f) return;

    const float clip_left = view.origin_x + ts::header_width;
    const float clip_right = view.origin_x + view.width;
    const float rows_top = view.origin_y + ts::ruler_height;
    const float rows_bottom = view.origin_y + ts::content_height(static_cast<int>(state.rows.size()));
    auto time_to_x = [&](double t) {
        return clip_left + static_cast<float>((t - view.scroll_seconds) * view.pixels_per_second);
    };

    // Ruler.
    draw_list->AddRectFilled(ImVec2(view.origin_x, view.origin_y), ImVec2(clip_right, rows_top),
        IM_COL32(30, 30, 34, 255));
    draw_list->PushClipRect(ImVec2(clip_left, view.origin_y), ImVec2(clip_right, rows_bottom), true);
    const int first_second = std::max(0, static_cast<int>(std::floor(view.scroll_seconds)));
    const double visible_seconds = (clip_right - clip_left) / view.pixels_per_second;
    const int last_second = static_cast<int>(std::ceil(view.scroll_seconds + visible_seconds));
    for (int s = first_second; s <= last_second; ++s) {
        const float x = time_to_x(s);
        const bool major = s % ts::ruler_label_every == 0;
        draw_list->AddLine(ImVec2(x, rows_top - (major ? 10.0f : 5.0f)), ImVec2(x, rows_top),
            muted_text_color, 1.0f);
        if (major) {
            const std::string label = story_timeline::format_time_simple(s);
            draw_list->AddText(ImVec2(x + 3.0f, view.origin_y + 2.0f), muted_text_color, label.c_str());
        }
    }
    draw_list->PopClipRect();

    // Rows and clips.
    float row_y = rows_top;
    for (const auto& row : state.rows) {
        const float row_bottom = row_y + ts::row_height;
        const bool audio = row.kind == story_timeline::TrackKind::Audio;
        draw_list->AddRectFilled(ImVec2(view.origin_x, row_y), ImVec2(clip_right, row_bottom),
            audio ? IM_COL32(34, 40, 36, 255) : IM_COL32(38, 38, 44, 255));
        draw_list->AddText(ImVec2(view.origin_x + 8.0f, row_y + (ts::row_height - ImGui::GetFontSize()) * 0.5f),
            text_color, row.label.c_str());

        draw_list->PushClipRect(ImVec2(clip_left, row_y), ImVec2(clip_right, row_bottom), true);
        for (const auto& clip : row.clips) {
            ImVec2 min_pt(time_to_x(clip.start), row_y + ts::clip_inset);
            ImVec2 max_pt(std::max(time_to_x(clip.end), min_pt.x + 2.0f), row_bottom - ts::clip_inset);
            draw_list->AddRectFilled(min_pt, max_pt, to_im_color(clip.colors.fill, 220), 3.0f);
            draw_list->AddRect(min_pt, max_pt, to_im_color(clip.colors.border), 3.0f, 0, 1.0f);
            draw_list->PushClipRect(min_pt, max_pt, true);
            draw_list->AddText(ImVec2(min_pt.x + 4.0f, min_pt.y + 4.0f), text_color, clip.label.c_str());
            draw_list->PopClipRect();
        }
        draw_list->PopClipRect();
        row_y = row_bottom + ts::row_gap;
    }

    // Playhead.
    const float px = time_to_x(view.playhead);
    if (px >= clip_left && px <= clip_right) {
        draw_list->AddLine(ImVec2(px, view.origin_y), ImVec2(px, rows_bottom), IM_COL32(239, 68, 68, 255), 2.0f);
        const std::string tc = story_timeline::format_timecode(view.playhead, view.fps);
        draw_list->AddText(ImVec2(px + 4.0f, rows_bottom - ImGui::GetFontSize()), IM_COL32(239, 68, 68, 255), tc.c_str());
    }
}

} // namespace story_render
