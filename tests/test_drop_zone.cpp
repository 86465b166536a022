#include <gtest/gtest.h>
#include <story_layout/drop_zone.hpp>
#include <story_layout/graph_layout.hpp>
#include <story_layout/layout_constants.hpp>
#include "test_nodes.hpp"

using story_layout::detect_drop_zone;
using story_layout::DropZoneKind;
using story_layout::GraphLayout;
using story_layout::RenderNode;
namespace layout = story_layout::layout;

namespace {

GraphLayout single_node_layout(double x, double y) {
    GraphLayout g;
    RenderNode rn;
    rn.node_id = "n1";
    rn.rect = { x, y, 300.0, 100.0 };
    g.nodes.push_back(rn);
    return g;
}

} // namespace

TEST(DropZone, RightBandAppends) {
    auto zone = detect_drop_zone(270.0, 50.0, single_node_layout(0.0, 0.0));
    ASSERT_TRUE(zone.has_value());
    EXPECT_EQ(zone->kind, DropZoneKind::Append);
    EXPECT_EQ(zone->target_node_id, "n1");
    EXPECT_FALSE(zone->genesis);
    EXPECT_DOUBLE_EQ(zone->ghost.x, 300.0 + layout::node_gap);
    EXPECT_DOUBLE_EQ(zone->ghost.y, 0.0);
    EXPECT_DOUBLE_EQ(zone->ghost.width, layout::base_node_width);
}

TEST(DropZone, TopHalfStacks) {
    auto zone = detect_drop_zone(150.0, 20.0, single_node_layout(0.0, 0.0));
    ASSERT_TRUE(zone.has_value());
    EXPECT_EQ(zone->kind, DropZoneKind::Stack);
    EXPECT_DOUBLE_EQ(zone->ghost.x, 0.0);
    EXPECT_DOUBLE_EQ(zone->ghost.y, -200.0);
}

TEST(DropZone, LowerLeftPrepends) {
    auto zone = detect_drop_zone(30.0, 80.0, single_node_layout(0.0, 0.0));
    ASSERT_TRUE(zone.has_value());
    EXPECT_EQ(zone->kind, DropZoneKind::Prepend);
    EXPECT_DOUBLE_EQ(zone->ghost.x, -400.0);
    EXPECT_DOUBLE_EQ(zone->ghost.y, 0.0);
}

TEST(DropZone, LowerMiddleDefaultsToAppend) {
    auto zone = detect_drop_zone(150.0, 80.0, single_node_layout(0.0, 0.0));
    ASSERT_TRUE(zone.has_value());
    EXPECT_EQ(zone->kind, DropZoneKind::Append);
    EXPECT_EQ(zone->target_node_id, "n1");
}

TEST(DropZone, RightBandWinsOverTopHalf) {
    auto zone = detect_drop_zone(280.0, 10.0, single_node_layout(0.0, 0.0));
    ASSERT_TRUE(zone.has_value());
    EXPECT_EQ(zone->kind, DropZoneKind::Append);
}

TEST(DropZone, HitMarginExtendsBox) {
    // 15 units left of the node still hits it: prepend band, lower half.
    auto zone = detect_drop_zone(-15.0, 90.0, single_node_layout(0.0, 0.0));
    ASSERT_TRUE(zone.has_value());
    EXPECT_EQ(zone->kind, DropZoneKind::Prepend);
}

TEST(DropZone, EmptyLayoutIsGenesis) {
    auto zone = detect_drop_zone(999.0, -999.0, GraphLayout{});
    ASSERT_TRUE(zone.has_value());
    EXPECT_TRUE(zone->genesis);
    EXPECT_EQ(zone->kind, DropZoneKind::Append);
    EXPECT_TRUE(zone->target_node_id.empty());
    EXPECT_DOUBLE_EQ(zone->ghost.x, layout::canvas_padding);
    EXPECT_DOUBLE_EQ(zone->ghost.y, 0.0);
}

TEST(DropZone, MissFallsBackToRightmostNode) {
    std::vector<story_model::Node> nodes = {
        story_test::origin_node("n1"),
        story_test::child_node("n2", "n1", story_model::AnchorType::Append),
        story_test::child_node("n3", "n1", story_model::AnchorType::Prepend),
    };
    GraphLayout g = story_layout::compute_graph_layout(nodes);
    auto zone = detect_drop_zone(5000.0, 5000.0, g);
    ASSERT_TRUE(zone.has_value());
    EXPECT_EQ(zone->kind, DropZoneKind::Append);
    EXPECT_EQ(zone->target_node_id, "n2");
    EXPECT_DOUBLE_EQ(zone->ghost.x, 750.0 + layout::node_gap);
}

TEST(DropZone, AgreesWithLayoutGeometry) {
    std::vector<story_model::Node> nodes = {
        story_test::origin_node("n1"),
        story_test::child_node("n2", "n1", story_model::AnchorType::Top, 0.0, 1),
    };
    GraphLayout g = story_layout::compute_graph_layout(nodes);

    // Stacking onto the origin previews exactly where its TOP child sits.
    auto zone = detect_drop_zone(100.0, 10.0, g);
    ASSERT_TRUE(zone.has_value());
    EXPECT_EQ(zone->kind, DropZoneKind::Stack);
    EXPECT_EQ(zone->target_node_id, "n1");
    EXPECT_EQ(zone->ghost, g.nodes[1].rect);
}
