#include <cmath>
#include <functional>
#include <iomanip>
#include <sstream>
#include <trellis/value.hpp>

namespace trellis
{

Value Value::margin()
{
    Value v;
    v.data_ = MarginLevel{};
    return v;
}

std::string Value::to_string() const
{
    if (is_margin())
        return MARGIN_LABEL;
    if (is_string())
        return as_string();
    if (std::isnan(as_number()))
        return NAN_LABEL;

    std::ostringstream os;
    os << std::setprecision(15) << as_number();
    return os.str();
}

size_t Value::hash() const
{
    switch (data_.index())
    {
        case 0:
            // Every NaN payload is the same level.
            if (std::isnan(as_number()))
                return 0x7ff8000000000000ULL;
            return std::hash<double>{}(as_number());
        case 1:
            return std::hash<std::string>{}(as_string()) ^ 0x9e3779b97f4a7c15ULL;
        default:
            return 0x51ed270b27af3c2dULL;
    }
}

bool operator==(const Value& a, const Value& b)
{
    if (a.data_.index() != b.data_.index())
        return false;
    if (a.is_number())
    {
        const double x = a.as_number();
        const double y = b.as_number();
        return x == y || (std::isnan(x) && std::isnan(y));
    }
    if (a.is_string())
        return a.as_string() == b.as_string();
    return true;
}

bool operator<(const Value& a, const Value& b)
{
    if (a.data_.index() != b.data_.index())
        return a.data_.index() < b.data_.index();
    if (a.is_number())
    {
        const double x = a.as_number();
        const double y = b.as_number();
        if (std::isnan(x))
            return false;
        return std::isnan(y) || x < y;
    }
    if (a.is_string())
        return a.as_string() < b.as_string();
    return false;
}

std::string to_string(const ValueTuple& tuple)
{
    std::string out = "(";
    for (size_t i = 0; i < tuple.size(); ++i)
    {
        if (i > 0)
            out += ", ";
        out += tuple[i].to_string();
    }
    out += ")";
    return out;
}

}   // namespace trellis
