#include <gtest/gtest.h>
#include <psgraph/errors.hpp>
#include <psgraph/layout.hpp>
#include <psgraph/scale.hpp>
#include <string>
#include <vector>

using namespace psgraph;

// --- compute_categorical_scale ---

TEST(CategoricalScale, OneSlotPerLabel)
{
    auto rs = compute_categorical_scale("x_axis", {"First bar", "Second bar", "Third bar"}, 67.0);
    EXPECT_TRUE(rs.categorical);
    EXPECT_DOUBLE_EQ(rs.low, 0.0);
    EXPECT_DOUBLE_EQ(rs.high, 3.0);
    EXPECT_EQ(rs.factors, (std::vector<int>{3}));
    EXPECT_EQ(rs.spreads, (std::vector<double>{1.0}));
    EXPECT_DOUBLE_EQ(rs.mark_gap, 67.0 / 3.0);
    EXPECT_EQ(rs.label_depth, 0);
    EXPECT_EQ(rs.labels_required, 3);
    EXPECT_EQ(rs.total_marks(), 3);
}

TEST(CategoricalScale, FencepostLabelIsEmpty)
{
    auto rs = compute_categorical_scale("x_axis", {"a", "b"}, 10.0);
    ASSERT_EQ(rs.labels.size(), 3u);
    EXPECT_EQ(std::get<std::string>(rs.labels[0]), "a");
    EXPECT_EQ(std::get<std::string>(rs.labels[1]), "b");
    EXPECT_EQ(std::get<std::string>(rs.labels[2]), "");
}

TEST(CategoricalScale, SingleLabel)
{
    auto rs = compute_categorical_scale("x_axis", {"only"}, 40.0);
    EXPECT_DOUBLE_EQ(rs.high, 1.0);
    EXPECT_DOUBLE_EQ(rs.mark_gap, 40.0);
    EXPECT_EQ(rs.labels.size(), 2u);
}

TEST(CategoricalScale, EmptyLabelsThrow)
{
    EXPECT_THROW(compute_categorical_scale("x_axis", {}, 40.0), ConfigurationError);
}

TEST(CategoricalScale, NonPositiveExtentThrows)
{
    EXPECT_THROW(compute_categorical_scale("x_axis", {"a"}, 0.0), ConfigurationError);
}

// --- Categorical axes in a layout ---

namespace
{

const Box kPage{36.0, 36.0, 559.0, 806.0};

PaperOptions labelled(std::vector<std::string> labels)
{
    PaperOptions po;
    po.x_axis.labels = std::move(labels);
    return po;
}

}   // namespace

TEST(CategoricalAxis, XLabelsRotateAndCenter)
{
    Layout l(labelled({"a", "b", "c", "d"}), kPage);
    EXPECT_TRUE(l.x_axis().categorical());
    EXPECT_TRUE(l.x_axis().rotate);
    EXPECT_TRUE(l.x_axis().center);
    EXPECT_EQ(l.x_axis().flags(), 3);
    EXPECT_DOUBLE_EQ(l.x_axis().mark_multiplier, 0.0);
}

TEST(CategoricalAxis, RotatedHeightFollowsLongestLabel)
{
    Layout l(labelled({"a", "Second bar"}), kPage);
    // mark_max + (1 + 10 chars * 0.8) * font size
    EXPECT_DOUBLE_EQ(l.x_axis().height, 8.0 + 9.0 * 10.0);
}

TEST(CategoricalAxis, UnrotatedXKeepsNumericHeight)
{
    PaperOptions po  = labelled({"alpha", "beta"});
    po.x_axis.rotate = false;
    Layout l(po, kPage);
    EXPECT_DOUBLE_EQ(l.x_axis().height, 8.0 + 25.0);
    EXPECT_EQ(l.x_axis().flags(), 2);
}

TEST(CategoricalAxis, YLabelsWidenTheStrip)
{
    PaperOptions po;
    po.y_axis.labels = std::vector<std::string>{"low", "medium", "high"};
    Layout l(po, kPage);
    EXPECT_FALSE(l.y_axis().rotate);
    EXPECT_TRUE(l.y_axis().center);
    // mark_max + 6 chars * 0.8 * font size
    EXPECT_DOUBLE_EQ(l.y_axis().width, 8.0 + 6.0 * 0.8 * 10.0);
    EXPECT_DOUBLE_EQ(l.y_axis().mark_gap(), l.graph_area().height() / 3.0);
}

TEST(CategoricalAxis, SlotsTileTheGraphWidth)
{
    Layout l(labelled({"a", "b", "c"}), kPage);
    Box    g = l.graph_area();
    for (int i = 0; i < 3; ++i)
    {
        Box slot = l.vertical_bar_area(i);
        EXPECT_NEAR(slot.left, g.left + i * g.width() / 3.0, 1e-9);
        EXPECT_NEAR(slot.width(), g.width() / 3.0, 1e-9);
        EXPECT_DOUBLE_EQ(slot.bottom, g.bottom);
        EXPECT_NEAR(slot.top, g.top, 1e-9);
    }
}

TEST(CategoricalAxis, LowAndHighOptionsAreIgnored)
{
    PaperOptions po = labelled({"a", "b"});
    po.x_axis.low   = 50.0;
    po.x_axis.high  = 10.0;
    Layout l(po, kPage);
    EXPECT_DOUBLE_EQ(l.x_axis().low(), 0.0);
    EXPECT_DOUBLE_EQ(l.x_axis().high(), 2.0);
}
