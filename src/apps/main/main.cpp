// Story canvas viewer: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <canvas/canvas.hpp>
#include <canvas/log.hpp>
#include <canvas/timeline_panel.hpp>
#include <story_layout/graph_layout.hpp>
#include <story_loaders/debug_canvas.hpp>
#include <story_loaders/json_loader.hpp>
#include <story_store/insertion.hpp>
#include <story_store/node_store.hpp>
#include <story_timeline/timecode.hpp>
#include <story_timeline/timeline.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Options {
    std::string canvas_path;
    std::optional<int> fps;
    bool dump_projections = false;
};

Options parse_options(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--dump-projections") {
            opts.dump_projections = true;
        } else if (arg == "--canvas" && i + 1 < argc) {
            opts.canvas_path = argv[++i];
        } else if (arg == "--fps" && i + 1 < argc) {
            const int fps = std::atoi(argv[++i]);
            if (fps > 0) opts.fps = fps;
        }
    }
    return opts;
}

std::optional<story_model::CanvasSnapshot> load_snapshot(const Options& opts, std::string& loaded_from) {
    auto logger = canvas::canvas_logger();
    if (!opts.canvas_path.empty()) {
        auto loaded = story_loaders::load_canvas_from_json_file(opts.canvas_path);
        if (!loaded) {
            logger->error("canvas_load_failed path={}", opts.canvas_path);
            return std::nullopt;
        }
        loaded_from = opts.canvas_path;
        return loaded;
    }

    const char* canvas_paths[] = { "data/example_canvas.json", "example_canvas.json" };
    for (const char* path : canvas_paths) {
        auto loaded = story_loaders::load_canvas_from_json_file(path);
        if (loaded) {
            loaded_from = path;
            return loaded;
        }
    }
    loaded_from = "story_canvas.json";
    return story_loaders::generate_debug_canvas();
}

int dump_projections(const story_model::CanvasSnapshot& snapshot, int fps) {
    auto layout = story_layout::compute_graph_layout(snapshot.nodes);
    spdlog::info("layout canvas={} nodes={} connections={} size={}x{}",
        snapshot.id, layout.nodes.size(), layout.connections.size(),
        layout.total_width, layout.total_height);
    for (const auto& rn : layout.nodes) {
        spdlog::info("  node {} {} x={} y={} w={} {}{}", rn.node_id, story_model::to_string(rn.type),
            rn.rect.x, rn.rect.y, rn.rect.width, rn.lane_label, rn.is_origin ? " origin" : "");
    }

    auto timeline = story_timeline::derive_timeline(snapshot.nodes);
    spdlog::info("timeline total={} ({})", story_timeline::format_timecode(timeline.total_duration, fps),
        story_timeline::format_time_simple(timeline.total_duration));
    for (const auto& row : timeline.rows) {
        spdlog::info("  {} clips={}", row.label, row.clips.size());
        for (const auto& clip : row.clips) {
            spdlog::info("    {} [{} - {}) {}", clip.node_id,
                story_timeline::format_timecode(clip.start, fps),
                story_timeline::format_timecode(clip.end, fps), clip.label);
        }
    }

    for (const auto& issue : timeline.issues) {
        spdlog::warn("issue kind={} node={} detail=\"{}\"",
            story_model::to_string(issue.kind), issue.node_id, issue.detail);
    }
    return 0;
}

void draw_media_bin(canvas::StoryCanvas& story_canvas, const std::vector<story_store::MediaClip>& media) {
    ImGui::TextUnformatted(story_canvas.insertion_armed()
            ? "Click the canvas to place the clip (Esc cancels)"
            : "Pick a clip, then click the canvas");
    ImGui::Separator();
    for (const auto& clip : media) {
        const std::string label = clip.label + "  " + story_timeline::format_time_simple(clip.duration_sec);
        if (ImGui::Selectable(label.c_str(), false))
            story_canvas.arm_insertion(clip);
    }
}

void draw_inspector(canvas::StoryCanvas& story_canvas, story_store::NodeStore& store) {
    const std::string& id = story_canvas.selected_node_id();
    auto node = id.empty() ? std::nullopt : store.find(id);
    if (!node) {
        ImGui::TextUnformatted("No node selected");
        return;
    }

    ImGui::Text("%s  (%s)", node->id.c_str(), story_model::to_string(node->type));
    ImGui::Text("anchor: %s  parent: %s",
        node->anchor_type ? story_model::to_string(*node->anchor_type) : "none",
        node->parent_id.value_or("-").c_str());
    ImGui::Text("lane: V%d", node->lane.value_or(0) + 1);

    auto logger = canvas::canvas_logger();
    story_store::NodeUpdate update;
    bool changed = false;

    int drift = static_cast<int>(node->drift);
    if (ImGui::InputInt("drift (ms)", &drift, 100, 1000)) {
        update.drift = drift;
        changed = true;
    }
    double in_point = node->media_in_point.value_or(0.0);
    if (ImGui::InputDouble("in (s)", &in_point, 0.1, 1.0, "%.3f")) {
        update.media_in_point = in_point;
        changed = true;
    }
    double out_point = node->media_out_point.value_or(in_point);
    if (ImGui::InputDouble("out (s)", &out_point, 0.1, 1.0, "%.3f")) {
        update.media_out_point = out_point;
        changed = true;
    }
    double rate = node->playback_rate;
    if (ImGui::InputDouble("rate", &rate, 0.05, 0.25, "%.2f")) {
        update.playback_rate = rate;
        changed = true;
    }

    if (changed) {
        if (store.update_node(node->id, update))
            logger->info("node_updated node={}", node->id);
        else
            logger->warn("node_update_rejected node={}", node->id);
    }

    if (ImGui::Button("Focus")) story_canvas.focus_on_node(node->id);
}

} // namespace

int main(int argc, char* argv[])
{
    const Options opts = parse_options(argc, argv);
    auto logger = canvas::canvas_logger();

    std::string canvas_path;
    auto snapshot = load_snapshot(opts, canvas_path);
    if (!snapshot) return 1;
    int fps = opts.fps.value_or(snapshot->fps > 0 ? snapshot->fps : 24);
    logger->info("canvas_loaded id={} name=\"{}\" nodes={} source={}",
        snapshot->id, snapshot->name, snapshot->nodes.size(), canvas_path);

    if (opts.dump_projections) return dump_projections(*snapshot, fps);

    story_store::NodeStore store;
    store.load(*snapshot);

    SDL_SetMainReady();
    // SDL3: SDL_Init returns true on success, false on failure
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        (void)fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    int window_width = 1280;
    int window_height = 720;
    {
        SDL_Rect bounds{};
        if (SDL_GetDisplayUsableBounds(SDL_GetPrimaryDisplay(), &bounds)) {
            window_width = bounds.w * 2 / 3;
            window_height = bounds.h * 2 / 3;
        }
    }
    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    SDL_Window* window = SDL_CreateWindow("Story Canvas", window_width, window_height, window_flags);
    if (!window) {
        (void)fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        (void)fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ImGui::StyleColorsDark();

    ImFontConfig font_cfg;
    font_cfg.OversampleH = 2;
    font_cfg.OversampleV = 2;
    font_cfg.PixelSnapH = true;
    const char* font_paths[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
    };
    for (const char* path : font_paths) {
        if (io.Fonts->AddFontFromFileTTF(path, 17.0f, &font_cfg) != nullptr)
            break;
    }

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    canvas::StoryCanvas story_canvas;
    story_canvas.set_store(&store, snapshot->id);
    canvas::TimelinePanel timeline_panel;
    timeline_panel.set_store(&store, snapshot->id);
    timeline_panel.set_fps(fps);

    const std::vector<story_store::MediaClip> media_bin = {
        { "media-interview-a", "Interview A", 14.0 },
        { "media-interview-b", "Interview B", 9.5 },
        { "media-broll-street", "Street B-roll", 6.0 },
        { "media-broll-drone", "Drone shot", 4.5 },
        { "media-title", "Title card", 3.0 },
    };

    bool running = true;
    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT)
                running = false;
            if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED &&
                event.window.windowID == SDL_GetWindowID(window))
                running = false;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        const float side_width = 280.0f;
        const float timeline_height = io.DisplaySize.y * 0.32f;
        const float canvas_height = io.DisplaySize.y - timeline_height;
        const ImGuiWindowFlags fixed = ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoCollapse;

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(ImVec2(io.DisplaySize.x - side_width, canvas_height));
        ImGui::Begin("Canvas", nullptr, fixed | ImGuiWindowFlags_NoTitleBar
            | ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_NoScrollbar);
        ImVec2 canvas_size = ImGui::GetContentRegionAvail();
        if (canvas_size.x > 0 && canvas_size.y > 0) {
            ImGui::BeginChild("canvas", canvas_size, false, ImGuiWindowFlags_NoScrollbar);
            story_canvas.update_and_draw(canvas_size.x, canvas_size.y);
            ImGui::EndChild();
        }
        ImGui::End();

        ImGui::SetNextWindowPos(ImVec2(io.DisplaySize.x - side_width, 0));
        ImGui::SetNextWindowSize(ImVec2(side_width, canvas_height));
        ImGui::Begin("Media & Inspector", nullptr, fixed);
        draw_media_bin(story_canvas, media_bin);
        ImGui::Separator();
        draw_inspector(story_canvas, store);
        ImGui::Separator();
        if (ImGui::Button("Save")) {
            story_model::CanvasSnapshot out = *snapshot;
            out.fps = fps;
            out.nodes = store.snapshot(snapshot->id);
            if (story_loaders::save_canvas_to_json_file(out, canvas_path))
                logger->info("canvas_saved path={} nodes={}", canvas_path, out.nodes.size());
            else
                logger->error("canvas_save_failed path={}", canvas_path);
        }
        ImGui::End();

        ImGui::SetNextWindowPos(ImVec2(0, canvas_height));
        ImGui::SetNextWindowSize(ImVec2(io.DisplaySize.x, timeline_height));
        ImGui::Begin("Timeline", nullptr, fixed);
        ImVec2 timeline_size = ImGui::GetContentRegionAvail();
        timeline_panel.update_and_draw(timeline_size.x, timeline_size.y);
        ImGui::End();

        ImGui::Render();
        SDL_GL_MakeCurrent(window, gl_context);
        const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
        const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
        glViewport(0, 0, fb_w, fb_h);
        glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
