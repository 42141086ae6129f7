#pragma once

#include <optional>
#include <trellis/coord.hpp>
#include <trellis/drawable.hpp>
#include <trellis/layout_table.hpp>
#include <trellis/theme.hpp>

namespace trellis
{

// Smallest span a free-space track may have.
inline constexpr float MIN_PANEL_SPAN = 1e-6f;

struct PanelSizes
{
    SizeVector widths;    // One per grid column
    SizeVector heights;   // One per grid row
    bool       respect = false;
};

// Theme aspect ratio first; otherwise the coordinate system's preference,
// consulted only when neither axis is free.
std::optional<float> resolve_aspect_ratio(const FacetTheme&    theme,
                                          FreeScales           free,
                                          std::optional<float> coord_aspect);

// Fixed space: every column Relative(1), every row Relative(aspect or 1).
// Free space: each track proportional to the span of its scale group.
PanelSizes allocate_panel_sizes(const LayoutTable&   layout,
                                const ScaleRanges&   scales,
                                bool                 space_free,
                                std::optional<float> aspect_ratio);

}   // namespace trellis
