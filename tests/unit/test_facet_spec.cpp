#include <gtest/gtest.h>
#include <trellis/error.hpp>
#include <trellis/facet_spec.hpp>
#include <trellis/labeller.hpp>

using namespace trellis;

// ─── Scales / space ─────────────────────────────────────────────────────────

TEST(ScaleMode, ParsesAllowedValues)
{
    EXPECT_EQ(parse_scale_mode("fixed"), ScaleMode::Fixed);
    EXPECT_EQ(parse_scale_mode("free_x"), ScaleMode::FreeX);
    EXPECT_EQ(parse_scale_mode("free_y"), ScaleMode::FreeY);
    EXPECT_EQ(parse_scale_mode("free"), ScaleMode::Free);
}

TEST(ScaleMode, RejectsUnknownAndNamesAllowedSet)
{
    try
    {
        parse_scale_mode("loose");
        FAIL() << "expected ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        std::string msg = e.what();
        EXPECT_NE(msg.find("free_x"), std::string::npos);
        EXPECT_NE(msg.find("loose"), std::string::npos);
    }
}

TEST(SpaceMode, ParsesAndRejects)
{
    EXPECT_EQ(parse_space_mode("fixed"), SpaceMode::Fixed);
    EXPECT_EQ(parse_space_mode("free"), SpaceMode::Free);
    EXPECT_THROW(parse_space_mode("free_x"), ConfigurationError);
}

TEST(ScaleMode, RoundTripsThroughName)
{
    for (auto m : {ScaleMode::Fixed, ScaleMode::FreeX, ScaleMode::FreeY, ScaleMode::Free})
        EXPECT_EQ(parse_scale_mode(to_string(m)), m);
}

TEST(FreeScales, PerMode)
{
    EXPECT_FALSE(free_scales(ScaleMode::Fixed).x);
    EXPECT_FALSE(free_scales(ScaleMode::Fixed).y);
    EXPECT_TRUE(free_scales(ScaleMode::FreeX).x);
    EXPECT_FALSE(free_scales(ScaleMode::FreeX).y);
    EXPECT_FALSE(free_scales(ScaleMode::FreeY).x);
    EXPECT_TRUE(free_scales(ScaleMode::FreeY).y);
    EXPECT_TRUE(free_scales(ScaleMode::Free).x);
    EXPECT_TRUE(free_scales(ScaleMode::Free).y);
}

// ─── Formula ────────────────────────────────────────────────────────────────

TEST(FacetFormula, DotMeansNoVariable)
{
    auto f = parse_facet_formula(". ~ cut");
    EXPECT_TRUE(f.rows.empty());
    ASSERT_EQ(f.cols.size(), 1u);
    EXPECT_EQ(f.cols[0], "cut");

    auto g = parse_facet_formula("cut ~ .");
    ASSERT_EQ(g.rows.size(), 1u);
    EXPECT_TRUE(g.cols.empty());
}

TEST(FacetFormula, SeveralVariablesPerSide)
{
    auto f = parse_facet_formula("vs + am ~ gear+carb");
    ASSERT_EQ(f.rows.size(), 2u);
    EXPECT_EQ(f.rows[0], "vs");
    EXPECT_EQ(f.rows[1], "am");
    ASSERT_EQ(f.cols.size(), 2u);
    EXPECT_EQ(f.cols[1], "carb");
}

TEST(FacetFormula, EmptySideIsNoVariable)
{
    auto f = parse_facet_formula("~ cyl");
    EXPECT_TRUE(f.rows.empty());
    EXPECT_EQ(f.cols.size(), 1u);
}

TEST(FacetFormula, Malformed)
{
    EXPECT_THROW(parse_facet_formula("cyl"), ConfigurationError);
    EXPECT_THROW(parse_facet_formula("a ~ b ~ c"), ConfigurationError);
    EXPECT_THROW(parse_facet_formula("a + ~ b"), ConfigurationError);
    EXPECT_THROW(parse_facet_formula("a * b ~ c"), ConfigurationError);
}

// ─── FacetSpec ──────────────────────────────────────────────────────────────

TEST(FacetSpec, RequiresAtLeastOneVariable)
{
    EXPECT_THROW(FacetSpec({}, {}), ConfigurationError);
    EXPECT_THROW(FacetSpec::from_formula(". ~ ."), ConfigurationError);
}

TEST(FacetSpec, CarriesOptions)
{
    FacetOptions opts;
    opts.margins  = true;
    opts.scales   = ScaleMode::FreeY;
    opts.space    = SpaceMode::Free;
    opts.as_table = false;

    FacetSpec spec({"vs"}, {"am"}, opts);
    EXPECT_TRUE(spec.margins());
    EXPECT_FALSE(spec.free().x);
    EXPECT_TRUE(spec.free().y);
    EXPECT_TRUE(spec.space_free());
    EXPECT_FALSE(spec.as_table());
    EXPECT_EQ(spec.scales(), ScaleMode::FreeY);
}

TEST(FacetSpec, EmptyLabellerRejected)
{
    FacetOptions opts;
    opts.labeller = nullptr;
    EXPECT_THROW(FacetSpec({"a"}, {}, opts), ConfigurationError);
}

TEST(FacetSpec, FromFormula)
{
    auto spec = FacetSpec::from_formula("cyl ~ vs + am");
    ASSERT_EQ(spec.rows().size(), 1u);
    ASSERT_EQ(spec.cols().size(), 2u);
    EXPECT_EQ(spec.cols()[0], "vs");
}

// ─── Labellers ──────────────────────────────────────────────────────────────

TEST(Labeller, Value)
{
    auto l = labellers::value();
    EXPECT_EQ(l("cyl", Value(4)), "4");
    EXPECT_EQ(l("cyl", Value::margin()), "(all)");
}

TEST(Labeller, Both)
{
    auto l = labellers::both();
    EXPECT_EQ(l("cyl", Value(4)), "cyl: 4");
}

TEST(Labeller, ByName)
{
    EXPECT_EQ(labeller_by_name("label_both")("am", Value(1)), "am: 1");
    EXPECT_EQ(labeller_by_name("label_value")("am", Value(1)), "1");
    EXPECT_THROW(labeller_by_name("label_parsed"), ConfigurationError);
}
