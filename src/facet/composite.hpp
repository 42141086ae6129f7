#pragma once

#include <trellis/layout_grid.hpp>
#include <trellis/theme.hpp>

#include "axes.hpp"
#include "strips.hpp"

namespace trellis
{

// Stitches strips and axes around the panel block:
//
//           strip-t
//   axis-l  panel    strip-r
//           axis-b
//
// (strip-l goes outside axis-l when row strips are on the left). Tracks
// shared with the panel block take the panel sizes so grid lines line up.
LayoutGrid compose_facet_grid(LayoutGrid        panels,
                              FacetAxes         axes,
                              FacetStrips       strips,
                              const FacetTheme& theme);

}   // namespace trellis
