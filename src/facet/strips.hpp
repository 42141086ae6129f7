#pragma once

#include <string>
#include <trellis/coord.hpp>
#include <trellis/facet_spec.hpp>
#include <trellis/labeller.hpp>
#include <trellis/layout_grid.hpp>
#include <trellis/layout_table.hpp>
#include <trellis/theme.hpp>
#include <vector>

namespace trellis
{

// Builds the label strip for one side of the panel grid.
//
// `labels` holds one tuple per grid track (columns for Top, rows otherwise),
// in grid order. Each variable gets its own band: a row of the top strip or
// a column of a side strip, as thick as its largest label. Along the panel
// axis tracks are Relative(1) and separated by the theme's panel margin.
//
// With no variables the result is a zero-size placeholder: 0 x tracks for
// Top, tracks x 0 for the sides, still spaced like the panel grid.
LayoutGrid build_strip(StripSide                       side,
                       const std::vector<ValueTuple>&  labels,
                       const std::vector<std::string>& vars,
                       const Labeller&                 labeller,
                       const Graphics&                 graphics,
                       const FacetTheme&               theme,
                       size_t                          tracks);

struct FacetStrips
{
    LayoutGrid top;
    LayoutGrid rows;   // Right or left of the panels, per theme.row_strip
};

FacetStrips build_strips(const LayoutTable& layout,
                         const FacetSpec&   spec,
                         const Graphics&    graphics,
                         const FacetTheme&  theme);

const char* strip_name(StripSide side);

}   // namespace trellis
