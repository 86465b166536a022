#include <gtest/gtest.h>
#include <story_loaders/debug_canvas.hpp>
#include <story_loaders/json_loader.hpp>
#include <story_timeline/timeline.hpp>
#include <sstream>

using story_loaders::load_canvas_from_json;
using story_model::AnchorType;

TEST(JsonLoader, ParsesCanvas) {
    std::istringstream in(R"({
        "id": "c1", "name": "Cut", "fps": 25,
        "nodes": [
            { "id": "a", "type": "SPINE", "anchor_type": "ORIGIN", "lane": 0,
              "media_in_point": 0, "media_out_point": 10, "asset_id": "m1" },
            { "id": "b", "type": "SATELLITE", "parent_id": "a", "anchor_type": "TOP",
              "ui_track_lane": 1, "drift": 1500, "media_out_point": 4, "playback_rate": 2 }
        ]
    })");
    auto canvas = load_canvas_from_json(in);
    ASSERT_TRUE(canvas.has_value());
    EXPECT_EQ(canvas->id, "c1");
    EXPECT_EQ(canvas->fps, 25);
    ASSERT_EQ(canvas->nodes.size(), 2u);

    const auto& a = canvas->nodes[0];
    EXPECT_EQ(a.anchor_type, AnchorType::Origin);
    EXPECT_FALSE(a.parent_id.has_value());
    EXPECT_EQ(a.canvas_id, "c1");

    const auto& b = canvas->nodes[1];
    EXPECT_EQ(b.type, story_model::NodeType::Satellite);
    EXPECT_EQ(b.parent_id, "a");
    EXPECT_EQ(b.lane, 1);
    EXPECT_EQ(b.drift, 1500);
    EXPECT_FALSE(b.media_in_point.has_value());
    EXPECT_DOUBLE_EQ(b.playback_rate, 2.0);
}

TEST(JsonLoader, UnknownAnchorLeavesAnchorUnset) {
    std::istringstream in(R"({ "nodes": [ { "id": "a", "anchor_type": "SIDEWAYS", "type": "??" } ] })");
    auto canvas = load_canvas_from_json(in);
    ASSERT_TRUE(canvas.has_value());
    EXPECT_FALSE(canvas->nodes[0].anchor_type.has_value());
    EXPECT_EQ(canvas->nodes[0].type, story_model::NodeType::Spine);
    EXPECT_DOUBLE_EQ(canvas->nodes[0].playback_rate, 1.0);
}

TEST(JsonLoader, OutOfRangeLaneIsLeftUnset) {
    std::istringstream in(R"({ "nodes": [
        { "id": "a", "lane": 4294967296 },
        { "id": "b", "lane": 4294967295 },
        { "id": "c", "ui_track_lane": -4294967296 },
        { "id": "d", "lane": 18446744073709551615 },
        { "id": "e", "lane": 2147483647 }
    ] })");
    auto canvas = load_canvas_from_json(in);
    ASSERT_TRUE(canvas.has_value());
    ASSERT_EQ(canvas->nodes.size(), 5u);
    EXPECT_FALSE(canvas->nodes[0].lane.has_value());
    EXPECT_FALSE(canvas->nodes[1].lane.has_value());
    EXPECT_FALSE(canvas->nodes[2].lane.has_value());
    EXPECT_FALSE(canvas->nodes[3].lane.has_value());
    EXPECT_EQ(canvas->nodes[4].lane, 2147483647);
}

TEST(JsonLoader, RejectsMalformedInput) {
    std::istringstream not_json("{ nodes: ");
    EXPECT_FALSE(load_canvas_from_json(not_json).has_value());

    std::istringstream no_nodes(R"({ "id": "c1" })");
    EXPECT_FALSE(load_canvas_from_json(no_nodes).has_value());

    std::istringstream node_without_id(R"({ "nodes": [ { "type": "SPINE" } ] })");
    EXPECT_FALSE(load_canvas_from_json(node_without_id).has_value());
}

TEST(JsonLoader, MissingFileFails) {
    EXPECT_FALSE(story_loaders::load_canvas_from_json_file("/nonexistent/canvas.json").has_value());
}

TEST(JsonLoader, SavedCanvasLoadsBack) {
    auto canvas = story_loaders::generate_debug_canvas();
    std::stringstream buffer;
    ASSERT_TRUE(story_loaders::save_canvas_to_json(canvas, buffer));

    auto loaded = load_canvas_from_json(buffer);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->id, canvas.id);
    EXPECT_EQ(loaded->name, canvas.name);
    ASSERT_EQ(loaded->nodes.size(), canvas.nodes.size());
    EXPECT_EQ(story_timeline::derive_timeline(loaded->nodes), story_timeline::derive_timeline(canvas.nodes));
}

TEST(DebugCanvas, ProjectsWithoutIssues) {
    auto canvas = story_loaders::generate_debug_canvas();
    auto state = story_timeline::derive_timeline(canvas.nodes);
    EXPECT_TRUE(state.issues.empty());
    // Opening 12 s, answer 1 8.5 s, answer 2 10 s after a 250 ms drift.
    EXPECT_DOUBLE_EQ(state.total_duration, 12.0 + 8.5 + 0.25 + 10.0);
}
