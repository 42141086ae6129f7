#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <trellis/value.hpp>
#include <vector>

namespace trellis
{

// Produces the strip text for one value of one facet variable.
using Labeller = std::function<std::string(const std::string& variable, const Value& value)>;

namespace labellers
{

// "value"
Labeller value();

// "variable: value"
Labeller both();

}   // namespace labellers

// Resolves "label_value" / "label_both". Throws ConfigurationError naming the
// known strategies for anything else.
Labeller labeller_by_name(std::string_view name);

const std::vector<std::string>& labeller_names();

}   // namespace trellis
