#include <gtest/gtest.h>
#include <trellis/labeller.hpp>
#include <trellis/layout_table.hpp>

#include "facet/strips.hpp"
#include "util/fake_collaborators.hpp"

using namespace trellis;
using trellis::test::cell_label;
using trellis::test::FakeGraphics;
using trellis::test::make_cars;

namespace
{

const FacetTheme THEME{};

}   // namespace

TEST(BuildStrip, TopStripOneBandPerVariable)
{
    FakeGraphics gfx;
    std::vector<ValueTuple> labels = {{4}, {6}, {8}};
    auto strip = build_strip(StripSide::Top, labels, {"cyl"}, labellers::value(), gfx, THEME, 3);

    EXPECT_EQ(strip.name(), "strip-t");
    ASSERT_EQ(strip.rows(), 1u);
    ASSERT_EQ(strip.cols(), 5u);
    EXPECT_EQ(strip.heights()[0], SizeUnit::absolute(FakeGraphics::LINE_HEIGHT));
    EXPECT_EQ(strip.widths()[0], SizeUnit::relative(1.0f));
    EXPECT_EQ(strip.widths()[1], SizeUnit::absolute(THEME.panel_margin));

    EXPECT_EQ(cell_label(strip, 0, 0), "4");
    EXPECT_EQ(cell_label(strip, 0, 2), "6");
    EXPECT_EQ(cell_label(strip, 0, 4), "8");
    EXPECT_TRUE(strip.find("strip-t-2-cyl").has_value());
}

TEST(BuildStrip, StackedBandsForSeveralVariables)
{
    FakeGraphics            gfx;
    std::vector<ValueTuple> labels = {{0, 0}, {1, 1}};
    auto strip = build_strip(StripSide::Top, labels, {"vs", "am"}, labellers::both(), gfx, THEME, 2);

    ASSERT_EQ(strip.rows(), 2u);
    ASSERT_EQ(strip.cols(), 3u);
    EXPECT_EQ(cell_label(strip, 0, 0), "vs: 0");
    EXPECT_EQ(cell_label(strip, 1, 0), "am: 0");
    EXPECT_EQ(cell_label(strip, 1, 2), "am: 1");
}

TEST(BuildStrip, RightStripBandWidthFromLabels)
{
    FakeGraphics            gfx;
    std::vector<ValueTuple> labels = {{"a"}, {"b"}};
    auto strip = build_strip(StripSide::Right, labels, {"g"}, labellers::value(), gfx, THEME, 2);

    EXPECT_EQ(strip.name(), "strip-r");
    ASSERT_EQ(strip.rows(), 3u);
    ASSERT_EQ(strip.cols(), 1u);
    EXPECT_EQ(strip.widths()[0], SizeUnit::absolute(FakeGraphics::LINE_HEIGHT));
    EXPECT_EQ(strip.heights()[1], SizeUnit::absolute(THEME.panel_margin));
    EXPECT_EQ(cell_label(strip, 2, 0), "b");
}

TEST(BuildStrip, LeftStripMirrorsBands)
{
    FakeGraphics            gfx;
    std::vector<ValueTuple> labels = {{0, 1}};
    auto strip = build_strip(StripSide::Left, labels, {"vs", "am"}, labellers::value(), gfx, THEME, 1);

    ASSERT_EQ(strip.cols(), 2u);
    // First variable sits next to the panels, i.e. rightmost.
    EXPECT_EQ(cell_label(strip, 0, 1), "0");
    EXPECT_EQ(cell_label(strip, 0, 0), "1");
}

TEST(BuildStrip, NoVariablesGivesPlaceholder)
{
    FakeGraphics gfx;

    auto top = build_strip(StripSide::Top, {}, {}, labellers::value(), gfx, THEME, 3);
    EXPECT_EQ(top.rows(), 0u);
    ASSERT_EQ(top.cols(), 5u);
    EXPECT_EQ(top.widths()[0], SizeUnit::relative(0.0f));
    EXPECT_EQ(top.widths()[1], SizeUnit::absolute(THEME.panel_margin));

    auto side = build_strip(StripSide::Right, {}, {}, labellers::value(), gfx, THEME, 2);
    EXPECT_EQ(side.rows(), 3u);
    EXPECT_EQ(side.cols(), 0u);
}

TEST(BuildStrips, FromLayout)
{
    FakeGraphics gfx;
    FacetOptions opts;
    opts.margins = true;
    FacetSpec spec({"vs"}, {"cyl"}, opts);
    auto      layout = build_layout(make_cars(), spec);

    auto strips = build_strips(layout, spec, gfx, THEME);
    ASSERT_EQ(strips.top.cols(), 7u);   // 4 columns + 3 spacers
    EXPECT_EQ(cell_label(strips.top, 0, 6), "(all)");
    ASSERT_EQ(strips.rows.rows(), 5u);   // 3 rows + 2 spacers
    EXPECT_EQ(strips.rows.name(), "strip-r");
    EXPECT_EQ(cell_label(strips.rows, 4, 0), "(all)");
}

TEST(BuildStrips, LeftSideFromTheme)
{
    FakeGraphics gfx;
    FacetTheme   theme;
    theme.row_strip = StripSide::Left;
    FacetSpec spec({"vs"}, {});
    auto      layout = build_layout(make_cars(), spec);

    auto strips = build_strips(layout, spec, gfx, theme);
    EXPECT_EQ(strips.rows.name(), "strip-l");
    EXPECT_EQ(strips.top.rows(), 0u);
    EXPECT_EQ(strips.top.cols(), 1u);
}
