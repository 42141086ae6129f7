#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>
#include <trellis/data_frame.hpp>
#include <trellis/value.hpp>

using namespace trellis;

// ─── Value ──────────────────────────────────────────────────────────────────

TEST(Value, NumbersDisplayWithoutTrailingZeros)
{
    EXPECT_EQ(Value(4).to_string(), "4");
    EXPECT_EQ(Value(2.5).to_string(), "2.5");
    EXPECT_EQ(Value(-0.125).to_string(), "-0.125");
}

TEST(Value, StringsAndMargin)
{
    EXPECT_EQ(Value("Ideal").to_string(), "Ideal");
    EXPECT_TRUE(Value::margin().is_margin());
    EXPECT_EQ(Value::margin().to_string(), "(all)");
}

TEST(Value, EqualityIsTypeAware)
{
    EXPECT_EQ(Value(1), Value(1.0));
    EXPECT_NE(Value(1), Value("1"));
    EXPECT_EQ(Value::margin(), Value::margin());
    EXPECT_NE(Value::margin(), Value("(all)"));
}

TEST(Value, OrderingNumbersThenStringsThenMargin)
{
    std::vector<Value> v = {Value::margin(), "b", 10, "a", 2};
    std::sort(v.begin(), v.end());
    ASSERT_EQ(v.size(), 5u);
    EXPECT_EQ(v[0], Value(2));
    EXPECT_EQ(v[1], Value(10));
    EXPECT_EQ(v[2], Value("a"));
    EXPECT_EQ(v[3], Value("b"));
    EXPECT_TRUE(v[4].is_margin());
}

TEST(Value, NaNIsItsOwnLevel)
{
    const Value nan(std::nan(""));
    EXPECT_EQ(nan, Value(std::nan("")));
    EXPECT_NE(nan, Value(4));
    EXPECT_EQ(nan.to_string(), "NaN");

    // Irreflexive, and after every other number but before strings.
    EXPECT_FALSE(nan < nan);
    EXPECT_TRUE(Value(1e300) < nan);
    EXPECT_FALSE(nan < Value(-1.0));
    EXPECT_TRUE(nan < Value("a"));

    std::vector<Value> v = {4, std::nan(""), 6, -std::nan("")};
    std::sort(v.begin(), v.end());
    EXPECT_EQ(v[0], Value(4));
    EXPECT_EQ(v[1], Value(6));
    EXPECT_EQ(v[2], nan);
    EXPECT_EQ(v[3], nan);
}

TEST(Value, HashAgreesWithEquality)
{
    EXPECT_EQ(Value(3).hash(), Value(3.0).hash());
    EXPECT_EQ(Value("x").hash(), Value(std::string("x")).hash());
    EXPECT_EQ(Value(std::nan("")).hash(), Value(-std::nan("1")).hash());
}

TEST(Value, TupleToString)
{
    ValueTuple t = {4, "manual"};
    EXPECT_EQ(to_string(t), "(4, manual)");
    EXPECT_EQ(to_string(ValueTuple{}), "()");
}

// ─── DataFrame ──────────────────────────────────────────────────────────────

TEST(DataFrame, AddColumns)
{
    DataFrame df;
    df.add_column("x", {1, 2, 3}).add_column("g", {"a", "b", "a"});
    EXPECT_EQ(df.rows(), 3u);
    EXPECT_TRUE(df.has_column("g"));
    EXPECT_FALSE(df.has_column("h"));
    EXPECT_EQ(df.at(1, "g"), Value("b"));
    ASSERT_EQ(df.column_names().size(), 2u);
    EXPECT_EQ(df.column_names()[0], "x");
}

TEST(DataFrame, LengthMismatchThrows)
{
    DataFrame df;
    df.add_column("x", {1, 2, 3});
    EXPECT_THROW(df.add_column("y", {1, 2}), std::invalid_argument);
}

TEST(DataFrame, ReplacingSoleColumnMayChangeLength)
{
    DataFrame df;
    df.add_column("x", {1, 2, 3});
    df.add_column("x", {1});
    EXPECT_EQ(df.rows(), 1u);
}

TEST(DataFrame, UnknownColumnThrows)
{
    DataFrame df;
    EXPECT_THROW(df.column("nope"), std::out_of_range);
}

TEST(DataFrame, DeclaredLevels)
{
    DataFrame df;
    df.add_column("cut", {"Fair", "Ideal"});
    EXPECT_EQ(df.levels("cut"), nullptr);
    df.set_levels("cut", {"Ideal", "Fair"});
    ASSERT_NE(df.levels("cut"), nullptr);
    EXPECT_EQ((*df.levels("cut"))[0], Value("Ideal"));
}
