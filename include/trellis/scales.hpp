#pragma once

#include <optional>
#include <span>
#include <string>
#include <trellis/coord.hpp>
#include <trellis/data_frame.hpp>
#include <trellis/layout_table.hpp>
#include <vector>

namespace trellis
{

// Names of the columns mapped to the position axes.
struct PositionAes
{
    std::string x = "x";
    std::string y = "y";
};

// User-set coordinate limits. A set limit replaces the trained range of every
// scale group on that axis.
struct ScaleLimits
{
    std::optional<AxisRange> x;
    std::optional<AxisRange> y;
};

// Trains one range per scale group from the position columns of every layer.
// Numeric columns give [min, max]; string columns are discrete and give
// [0.4, n + 0.6] for n distinct values. Groups without data get [0, 1].
// Throws ConfigurationError if a group mixes numeric and string values.
ScaleRanges train_scale_ranges(const LayoutTable&         layout,
                               std::span<const DataFrame> layers,
                               const PositionAes&         aes    = {},
                               const ScaleLimits&         limits = {});

// Range of every panel (index = panel id - 1) from its scale groups.
std::vector<PanelRange> panel_ranges_for(const LayoutTable& layout, const ScaleRanges& scales);

}   // namespace trellis
