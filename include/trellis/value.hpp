#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace trellis
{

// A single grouping-variable value: a number, a string, or the "(all)" level
// that stands in for every value of a variable in margin panels.
//
// Values are totally ordered: numbers < strings < margin. Numbers compare
// numerically, strings lexicographically. NaN is a level of its own: equal
// to any other NaN and placed after every other number.
class Value
{
   public:
    Value() = default;
    Value(double v) : data_(v) {}
    Value(int v) : data_(static_cast<double>(v)) {}
    Value(std::string v) : data_(std::move(v)) {}
    Value(const char* v) : data_(std::string(v)) {}

    static Value margin();

    bool is_number() const { return data_.index() == 0; }
    bool is_string() const { return data_.index() == 1; }
    bool is_margin() const { return data_.index() == 2; }

    double             as_number() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }

    // Display form. Numbers drop trailing zeros ("4", "2.5"); NaN is "NaN";
    // margin is "(all)".
    std::string to_string() const;

    size_t hash() const;

    friend bool operator==(const Value& a, const Value& b);
    friend bool operator<(const Value& a, const Value& b);

   private:
    struct MarginLevel
    {
    };

    std::variant<double, std::string, MarginLevel> data_{0.0};
};

inline bool operator!=(const Value& a, const Value& b)
{
    return !(a == b);
}

// Display label of the margin level.
inline constexpr const char* MARGIN_LABEL = "(all)";

// Display label of a NaN number.
inline constexpr const char* NAN_LABEL = "NaN";

// An ordered tuple of values, one per facet variable on one side of the grid.
using ValueTuple = std::vector<Value>;

std::string to_string(const ValueTuple& tuple);

}   // namespace trellis
