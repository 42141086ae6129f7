#pragma once

#include <trellis/coord.hpp>
#include <trellis/drawable.hpp>
#include <trellis/layout_grid.hpp>
#include <trellis/layout_table.hpp>
#include <trellis/theme.hpp>
#include <vector>

#include "sizes.hpp"

namespace trellis
{

// Stacks [background, content layers..., foreground] for every panel and
// places the stacks on the grid with the allocated sizes. The panel margin
// separates adjacent rows and columns but not the outer border.
//
// Every content layer must hold exactly one slot per panel; anything else is
// a programming error (std::logic_error).
LayoutGrid assemble_panels(const LayoutTable&             layout,
                           const std::vector<PanelRange>& ranges,
                           const Coord&                   coord,
                           ContentLayers                  content,
                           const PanelSizes&              sizes,
                           const FacetTheme&              theme);

}   // namespace trellis
