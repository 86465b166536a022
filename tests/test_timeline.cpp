#include <gtest/gtest.h>
#include <story_timeline/timeline.hpp>
#include "test_nodes.hpp"
#include <cmath>
#include <limits>

using story_model::AnchorType;
using story_model::IssueKind;
using story_test::child_node;
using story_test::origin_node;
using story_timeline::derive_timeline;
using story_timeline::TimelineClip;
using story_timeline::TimelineState;

namespace {

const TimelineClip* find_clip(const TimelineState& state, const std::string& node_id) {
    for (const auto& row : state.rows) {
        for (const auto& clip : row.clips) {
            if (clip.node_id == node_id) return &clip;
        }
    }
    return nullptr;
}

std::vector<std::string> row_labels(const TimelineState& state) {
    std::vector<std::string> labels;
    for (const auto& row : state.rows) labels.push_back(row.label);
    return labels;
}

bool has_issue(const TimelineState& state, IssueKind kind, const std::string& node_id) {
    for (const auto& issue : state.issues) {
        if (issue.kind == kind && issue.node_id == node_id) return true;
    }
    return false;
}

} // namespace

TEST(Timeline, NoOriginYieldsEmptyRows) {
    TimelineState state = derive_timeline({ child_node("n2", "n1", AnchorType::Append, 4.0) });
    EXPECT_EQ(row_labels(state), (std::vector<std::string>{ "V3", "V2", "V1", "A1" }));
    for (const auto& row : state.rows) EXPECT_TRUE(row.clips.empty());
    EXPECT_EQ(state.total_duration, 0.0);
    EXPECT_EQ(state.rows.back().kind, story_timeline::TrackKind::Audio);
    EXPECT_EQ(state.rows.back().lane_id, -1);
}

TEST(Timeline, EmptyInputMatchesEmptyRows) {
    EXPECT_EQ(derive_timeline({}).rows, story_timeline::empty_timeline_rows());
}

TEST(Timeline, OriginAlone) {
    TimelineState state = derive_timeline({ origin_node("n1", 10.0) });
    ASSERT_EQ(state.rows.size(), 4u);
    const auto& v1 = state.rows[2];
    EXPECT_EQ(v1.label, "V1");
    ASSERT_EQ(v1.clips.size(), 1u);
    EXPECT_EQ(v1.clips[0].lane, 0);
    EXPECT_DOUBLE_EQ(v1.clips[0].start, 0.0);
    EXPECT_DOUBLE_EQ(v1.clips[0].end, 10.0);
    EXPECT_DOUBLE_EQ(v1.clips[0].duration, 10.0);
    EXPECT_DOUBLE_EQ(state.total_duration, 10.0);
    EXPECT_TRUE(state.issues.empty());
}

TEST(Timeline, AppendChainRunsSequentially) {
    std::vector<story_model::Node> nodes = {
        origin_node("n1"),
        child_node("n2", "n1", AnchorType::Append, 5.0),
        child_node("n3", "n2", AnchorType::Append, 3.0),
    };
    TimelineState state = derive_timeline(nodes);
    const TimelineClip* a = find_clip(state, "n2");
    const TimelineClip* b = find_clip(state, "n3");
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_DOUBLE_EQ(a->start, 0.0);
    EXPECT_DOUBLE_EQ(a->end, 5.0);
    EXPECT_DOUBLE_EQ(b->start, 5.0);
    EXPECT_DOUBLE_EQ(b->end, 8.0);
    EXPECT_EQ(a->lane, 0);
    EXPECT_EQ(b->lane, 0);
    EXPECT_DOUBLE_EQ(state.total_duration, 8.0);
}

TEST(Timeline, AppendSiblingsChainOffPreviousSibling) {
    auto second = child_node("n3", "n1", AnchorType::Append, 3.0);
    second.drift = 500;
    std::vector<story_model::Node> nodes = {
        origin_node("n1", 10.0),
        child_node("n2", "n1", AnchorType::Append, 4.0),
        second,
    };
    TimelineState state = derive_timeline(nodes);
    EXPECT_DOUBLE_EQ(find_clip(state, "n2")->start, 10.0);
    EXPECT_DOUBLE_EQ(find_clip(state, "n3")->start, 14.5);
    EXPECT_DOUBLE_EQ(state.total_duration, 17.5);
}

TEST(Timeline, TopChildStartsWithParent) {
    std::vector<story_model::Node> nodes = {
        origin_node("n1", 10.0),
        child_node("n2", "n1", AnchorType::Top, 4.0, 1),
    };
    TimelineState state = derive_timeline(nodes);
    const TimelineClip* top = find_clip(state, "n2");
    ASSERT_NE(top, nullptr);
    EXPECT_DOUBLE_EQ(top->start, 0.0);
    EXPECT_EQ(top->lane, 1);
    EXPECT_EQ(state.rows[1].label, "V2");
    ASSERT_EQ(state.rows[1].clips.size(), 1u);
    EXPECT_DOUBLE_EQ(state.total_duration, 10.0);
}

TEST(Timeline, TopDriftOffsetsStartOnly) {
    auto top = child_node("n2", "n1", AnchorType::Top, 4.0, 1);
    top.drift = 1500;
    std::vector<story_model::Node> nodes = {
        origin_node("n1", 10.0),
        top,
        child_node("n3", "n1", AnchorType::Append, 2.0),
    };
    TimelineState state = derive_timeline(nodes);
    EXPECT_DOUBLE_EQ(find_clip(state, "n2")->start, 1.5);
    EXPECT_DOUBLE_EQ(find_clip(state, "n2")->end, 5.5);
    // A satellite never pushes the spine.
    EXPECT_DOUBLE_EQ(find_clip(state, "n3")->start, 10.0);
}

TEST(Timeline, PrependSharesParentStart) {
    std::vector<story_model::Node> nodes = {
        origin_node("n1", 10.0),
        child_node("n2", "n1", AnchorType::Append, 5.0),
        child_node("n3", "n2", AnchorType::Prepend, 3.0),
    };
    TimelineState state = derive_timeline(nodes);
    EXPECT_DOUBLE_EQ(find_clip(state, "n3")->start, 10.0);
    EXPECT_DOUBLE_EQ(find_clip(state, "n3")->end, 13.0);
    EXPECT_DOUBLE_EQ(find_clip(state, "n2")->start, 10.0);
}

TEST(Timeline, RateScalesDuration) {
    auto n = origin_node("n1", 10.0);
    n.playback_rate = 2.0;
    n.media_in_point = 2.0;
    TimelineState state = derive_timeline({ n });
    EXPECT_DOUBLE_EQ(find_clip(state, "n1")->duration, 4.0);
}

TEST(Timeline, MissingOutPointIsZeroLength) {
    auto n = origin_node("n1");
    n.media_in_point = 3.0;
    n.media_out_point.reset();
    EXPECT_DOUBLE_EQ(story_timeline::clip_duration(n), 0.0);
}

TEST(Timeline, ClipDurationRejectsBadRates) {
    auto n = origin_node("n1", 10.0);
    n.playback_rate = 0.0;
    EXPECT_THROW(story_timeline::clip_duration(n), story_timeline::InvalidPlaybackRate);
    n.playback_rate = -1.0;
    EXPECT_THROW(story_timeline::clip_duration(n), story_timeline::InvalidPlaybackRate);
    n.playback_rate = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(story_timeline::clip_duration(n), story_timeline::InvalidPlaybackRate);

    try {
        n.playback_rate = -2.0;
        story_timeline::clip_duration(n);
        FAIL() << "expected InvalidPlaybackRate";
    } catch (const story_timeline::InvalidPlaybackRate& e) {
        EXPECT_EQ(e.node_id(), "n1");
        EXPECT_DOUBLE_EQ(e.rate(), -2.0);
    }
}

TEST(Timeline, InvalidRateExcludesSubtreeOnly) {
    auto bad = child_node("n2", "n1", AnchorType::Append, 5.0);
    bad.playback_rate = 0.0;
    std::vector<story_model::Node> nodes = {
        origin_node("n1", 10.0),
        bad,
        child_node("n3", "n1", AnchorType::Append, 3.0),
        child_node("n4", "n2", AnchorType::Top, 2.0, 1),
    };
    TimelineState state = derive_timeline(nodes);

    EXPECT_EQ(find_clip(state, "n2"), nullptr);
    EXPECT_EQ(find_clip(state, "n4"), nullptr);
    ASSERT_NE(find_clip(state, "n3"), nullptr);
    // The excluded sibling leaves the chain where it was.
    EXPECT_DOUBLE_EQ(find_clip(state, "n3")->start, 10.0);
    EXPECT_DOUBLE_EQ(state.total_duration, 13.0);

    EXPECT_TRUE(has_issue(state, IssueKind::InvalidPlaybackRate, "n2"));
    EXPECT_TRUE(has_issue(state, IssueKind::Unreachable, "n4"));
    EXPECT_FALSE(has_issue(state, IssueKind::Unreachable, "n2"));
}

TEST(Timeline, NegativeLaneOmitsClipButKeepsChildren) {
    auto bad = child_node("n2", "n1", AnchorType::Append, 5.0, -1);
    std::vector<story_model::Node> nodes = {
        origin_node("n1", 10.0),
        bad,
        child_node("n3", "n2", AnchorType::Append, 2.0),
    };
    TimelineState state = derive_timeline(nodes);
    EXPECT_EQ(find_clip(state, "n2"), nullptr);
    ASSERT_NE(find_clip(state, "n3"), nullptr);
    EXPECT_DOUBLE_EQ(find_clip(state, "n3")->start, 15.0);
    EXPECT_TRUE(has_issue(state, IssueKind::InvalidLane, "n2"));
}

TEST(Timeline, HugeLaneIsIsolated) {
    auto far = child_node("n2", "n1", AnchorType::Top, 5.0, 2000000000);
    std::vector<story_model::Node> nodes = {
        origin_node("n1", 10.0),
        far,
        child_node("n3", "n2", AnchorType::Top, 2.0, 1),
    };
    TimelineState state = derive_timeline(nodes);
    EXPECT_EQ(find_clip(state, "n2"), nullptr);
    EXPECT_TRUE(has_issue(state, IssueKind::InvalidLane, "n2"));
    EXPECT_EQ(row_labels(state), (std::vector<std::string>{ "V3", "V2", "V1", "A1" }));
    ASSERT_NE(find_clip(state, "n3"), nullptr);
    EXPECT_DOUBLE_EQ(state.total_duration, 10.0);
}

TEST(Timeline, LaneLimitIsInclusive) {
    std::vector<story_model::Node> nodes = {
        origin_node("n1", 10.0),
        child_node("n2", "n1", AnchorType::Top, 4.0, 99),
        child_node("n3", "n1", AnchorType::Top, 4.0, 100),
    };
    TimelineState state = derive_timeline(nodes);
    ASSERT_EQ(state.rows.size(), 101u);
    EXPECT_EQ(state.rows.front().label, "V100");
    ASSERT_NE(find_clip(state, "n2"), nullptr);
    EXPECT_EQ(find_clip(state, "n3"), nullptr);
    EXPECT_TRUE(has_issue(state, IssueKind::InvalidLane, "n3"));
}

TEST(Timeline, HighLanesAddRows) {
    std::vector<story_model::Node> nodes = {
        origin_node("n1", 10.0),
        child_node("n2", "n1", AnchorType::Top, 4.0, 4),
    };
    TimelineState state = derive_timeline(nodes);
    EXPECT_EQ(row_labels(state), (std::vector<std::string>{ "V5", "V4", "V3", "V2", "V1", "A1" }));
    ASSERT_EQ(state.rows[0].clips.size(), 1u);
    EXPECT_EQ(state.rows[0].clips[0].node_id, "n2");
}

TEST(Timeline, DanglingParentIsReported) {
    std::vector<story_model::Node> nodes = {
        origin_node("n1", 10.0),
        child_node("n2", "gone", AnchorType::Append, 5.0),
    };
    TimelineState state = derive_timeline(nodes);
    EXPECT_EQ(find_clip(state, "n2"), nullptr);
    EXPECT_TRUE(has_issue(state, IssueKind::DanglingParent, "n2"));
    EXPECT_DOUBLE_EQ(state.total_duration, 10.0);
}

TEST(Timeline, ClipsAreOrderedByStart) {
    auto late = child_node("n2", "n1", AnchorType::Top, 1.0, 1);
    late.drift = 3000;
    auto early = child_node("n3", "n1", AnchorType::Top, 1.0, 1);
    std::vector<story_model::Node> nodes = { origin_node("n1", 10.0), late, early };
    TimelineState state = derive_timeline(nodes);
    const auto& v2 = state.rows[1].clips;
    ASSERT_EQ(v2.size(), 2u);
    EXPECT_EQ(v2[0].node_id, "n3");
    EXPECT_EQ(v2[1].node_id, "n2");
}

TEST(Timeline, DefaultLabelsFollowLane) {
    std::vector<story_model::Node> nodes = {
        origin_node("n1", 10.0),
        child_node("n2", "n1", AnchorType::Top, 4.0, 1),
    };
    TimelineState state = derive_timeline(nodes);
    EXPECT_EQ(find_clip(state, "n1")->label, "SPINE");
    EXPECT_EQ(find_clip(state, "n2")->label, "SATELLITE");
    EXPECT_EQ(find_clip(state, "n2")->colors, story_model::lane_colors(1));
}

TEST(Timeline, IsIdempotent) {
    std::vector<story_model::Node> nodes = {
        origin_node("n1", 10.0),
        child_node("n2", "n1", AnchorType::Append, 5.0),
        child_node("n3", "n1", AnchorType::Top, 4.0, 1),
    };
    EXPECT_EQ(derive_timeline(nodes), derive_timeline(nodes));
}
