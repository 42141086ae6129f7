#include "sizes.hpp"

#include <cmath>
#include <trellis/logger.hpp>

namespace trellis
{

namespace
{

float track_span(const AxisRange& range)
{
    float span = range.span();
    if (!std::isfinite(span) || span < MIN_PANEL_SPAN)
    {
        TRELLIS_LOG_DEBUG("facet", "degenerate scale span {}, clamping", span);
        return MIN_PANEL_SPAN;
    }
    return span;
}

}   // namespace

std::optional<float> resolve_aspect_ratio(const FacetTheme&    theme,
                                          FreeScales           free,
                                          std::optional<float> coord_aspect)
{
    if (theme.aspect_ratio)
        return theme.aspect_ratio;
    if (!free.x && !free.y)
        return coord_aspect;
    return std::nullopt;
}

PanelSizes allocate_panel_sizes(const LayoutTable&   layout,
                                const ScaleRanges&   scales,
                                bool                 space_free,
                                std::optional<float> aspect_ratio)
{
    PanelSizes sizes;
    sizes.respect = aspect_ratio.has_value();

    const auto ncol = static_cast<size_t>(layout.ncol());
    const auto nrow = static_cast<size_t>(layout.nrow());
    sizes.widths.reserve(ncol);
    sizes.heights.reserve(nrow);

    if (!space_free)
    {
        const float aspect = aspect_ratio.value_or(1.0f);
        sizes.widths.assign(ncol, SizeUnit::relative(1.0f));
        sizes.heights.assign(nrow, SizeUnit::relative(aspect));
        return sizes;
    }

    // Every panel of a column shares its x group, every panel of a row its y group.
    for (int c = 1; c <= layout.ncol(); ++c)
    {
        const auto& entry = layout.col_panel(c);
        sizes.widths.push_back(
            SizeUnit::relative(track_span(scales.x.at(static_cast<size_t>(entry.scale_x - 1)))));
    }
    for (int r = 1; r <= layout.nrow(); ++r)
    {
        const auto& entry = layout.row_panel(r);
        sizes.heights.push_back(
            SizeUnit::relative(track_span(scales.y.at(static_cast<size_t>(entry.scale_y - 1)))));
    }
    return sizes;
}

}   // namespace trellis
