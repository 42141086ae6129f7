#pragma once

#include <trellis/coord.hpp>
#include <trellis/layout_grid.hpp>
#include <trellis/layout_table.hpp>
#include <trellis/theme.hpp>
#include <vector>

namespace trellis
{

struct FacetAxes
{
    LayoutGrid bottom;   // 1 x ncol, one horizontal axis per grid column
    LayoutGrid left;     // nrow x 1, one vertical axis per grid row
};

// Axes are rendered from the panels of grid row 1 (bottom) and grid column 1
// (left); all panels of a column share their x range and all panels of a row
// their y range. Spacing matches the panel grid.
FacetAxes build_axes(const LayoutTable&             layout,
                     const std::vector<PanelRange>& ranges,
                     const Coord&                   coord,
                     const Graphics&                graphics,
                     const FacetTheme&              theme);

}   // namespace trellis
