#include "axes.hpp"

#include <algorithm>

namespace trellis
{

FacetAxes build_axes(const LayoutTable&             layout,
                     const std::vector<PanelRange>& ranges,
                     const Coord&                   coord,
                     const Graphics&                graphics,
                     const FacetTheme&              theme)
{
    const auto     ncol    = static_cast<size_t>(layout.ncol());
    const auto     nrow    = static_cast<size_t>(layout.nrow());
    const SizeUnit spacing = SizeUnit::absolute(theme.panel_margin);

    std::vector<LayoutGrid::Cell> bottom_cells;
    bottom_cells.reserve(ncol);
    float axis_height = 0.0f;
    for (int c = 1; c <= layout.ncol(); ++c)
    {
        const int panel = layout.col_panel(c).panel;
        auto      axis  = coord.render_axis_h(ranges.at(static_cast<size_t>(panel - 1)), theme);
        if (axis)
            axis_height = std::max(axis_height, graphics.measure(*axis).height);
        bottom_cells.push_back({std::move(axis), "axis-b-" + std::to_string(c)});
    }

    std::vector<LayoutGrid::Cell> left_cells;
    left_cells.reserve(nrow);
    float axis_width = 0.0f;
    for (int r = 1; r <= layout.nrow(); ++r)
    {
        const int panel = layout.row_panel(r).panel;
        auto      axis  = coord.render_axis_v(ranges.at(static_cast<size_t>(panel - 1)), theme);
        if (axis)
            axis_width = std::max(axis_width, graphics.measure(*axis).width);
        left_cells.push_back({std::move(axis), "axis-l-" + std::to_string(r)});
    }

    auto bottom = LayoutGrid::matrix("axis-b",
                                     std::move(bottom_cells),
                                     SizeVector(ncol, SizeUnit::relative(1.0f)),
                                     {SizeUnit::absolute(axis_height)});
    auto left   = LayoutGrid::matrix("axis-l",
                                   std::move(left_cells),
                                   {SizeUnit::absolute(axis_width)},
                                   SizeVector(nrow, SizeUnit::relative(1.0f)));
    bottom.add_col_space(spacing);
    left.add_row_space(spacing);

    return {.bottom = std::move(bottom), .left = std::move(left)};
}

}   // namespace trellis
