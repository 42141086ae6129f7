#include <stdexcept>
#include <trellis/error.hpp>
#include <trellis/facet.hpp>
#include <trellis/logger.hpp>
#include <trellis/scales.hpp>

#include "axes.hpp"
#include "composite.hpp"
#include "panels.hpp"
#include "sizes.hpp"
#include "strips.hpp"

namespace trellis
{

LayoutTable FacetGrid::train_layout(std::span<const DataFrame> layers) const
{
    return build_layout(layers, spec_);
}

PanelAssignment FacetGrid::map_layout(const DataFrame& data, const LayoutTable& layout) const
{
    return locate_rows(data, layout);
}

LayoutGrid FacetGrid::render(const LayoutTable& layout,
                             const ScaleRanges& scales,
                             const Coord&       coord,
                             const Graphics&    graphics,
                             const FacetTheme&  theme,
                             ContentLayers      content) const
{
    if (theme.row_strip == StripSide::Top)
        throw ConfigurationError("row strips must be placed on the right or the left");
    if (layout.row_vars() != spec_.rows() || layout.col_vars() != spec_.cols())
        throw std::logic_error("FacetGrid::render: layout was trained for another facet");

    auto ranges = panel_ranges_for(layout, scales);

    std::optional<float> coord_aspect;
    if (!ranges.empty())
        coord_aspect = coord.aspect(ranges.front());
    auto aspect = resolve_aspect_ratio(theme, spec_.free(), coord_aspect);
    auto sizes  = allocate_panel_sizes(layout, scales, spec_.space_free(), aspect);

    auto axes   = build_axes(layout, ranges, coord, graphics, theme);
    auto strips = build_strips(layout, spec_, graphics, theme);
    auto panels = assemble_panels(layout, ranges, coord, std::move(content), sizes, theme);

    auto complete =
        compose_facet_grid(std::move(panels), std::move(axes), std::move(strips), theme);

    TRELLIS_LOG_DEBUG("facet",
                      "rendered facet grid: {} panels in {} x {} tracks (respect={})",
                      layout.panel_count(),
                      complete.rows(),
                      complete.cols(),
                      complete.respect());
    return complete;
}

}   // namespace trellis
