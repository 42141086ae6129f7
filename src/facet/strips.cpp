#include "strips.hpp"

#include <algorithm>
#include <cassert>
#include <stdexcept>

namespace trellis
{

const char* strip_name(StripSide side)
{
    switch (side)
    {
        case StripSide::Top:
            return "strip-t";
        case StripSide::Right:
            return "strip-r";
        case StripSide::Left:
            return "strip-l";
    }
    return "strip";
}

LayoutGrid build_strip(StripSide                       side,
                       const std::vector<ValueTuple>&  labels,
                       const std::vector<std::string>& vars,
                       const Labeller&                 labeller,
                       const Graphics&                 graphics,
                       const FacetTheme&               theme,
                       size_t                          tracks)
{
    const bool        horizontal = side == StripSide::Top;
    const std::string name       = strip_name(side);
    const SizeUnit    spacing    = SizeUnit::absolute(theme.panel_margin);

    if (vars.empty())
    {
        if (horizontal)
        {
            LayoutGrid empty(name, 0, tracks);
            empty.set_widths(SizeVector(tracks, SizeUnit::relative(0.0f)));
            return std::move(empty.add_col_space(spacing));
        }
        LayoutGrid empty(name, tracks, 0);
        empty.set_heights(SizeVector(tracks, SizeUnit::relative(0.0f)));
        return std::move(empty.add_row_space(spacing));
    }

    assert(labels.size() == tracks);
    if (labels.size() != tracks)
        throw std::logic_error("build_strip: label count does not match the panel grid");

    const size_t bands = vars.size();
    const size_t nrow  = horizontal ? bands : tracks;
    const size_t ncol  = horizontal ? tracks : bands;

    std::vector<LayoutGrid::Cell> cells(nrow * ncol);
    std::vector<float>            thickness(bands, 0.0f);

    for (size_t t = 0; t < tracks; ++t)
    {
        for (size_t v = 0; v < bands; ++v)
        {
            // Side strips keep the first variable next to the panels.
            const size_t band  = side == StripSide::Left ? bands - 1 - v : v;
            auto         label = labeller(vars[v], labels[t][v]);
            auto         strip = graphics.render_strip(label, horizontal, theme);

            if (strip)
            {
                Size2D size     = graphics.measure(*strip);
                thickness[band] = std::max(thickness[band], horizontal ? size.height : size.width);
            }

            const size_t r = horizontal ? band : t;
            const size_t c = horizontal ? t : band;
            cells[r * ncol + c] = {std::move(strip),
                                   name + "-" + std::to_string(t + 1) + "-" + vars[v]};
        }
    }

    SizeVector band_sizes;
    band_sizes.reserve(bands);
    for (float t : thickness)
        band_sizes.push_back(SizeUnit::absolute(t));
    SizeVector track_sizes(tracks, SizeUnit::relative(1.0f));

    if (horizontal)
    {
        auto grid = LayoutGrid::matrix(name, std::move(cells), track_sizes, band_sizes);
        return std::move(grid.add_col_space(spacing));
    }
    auto grid = LayoutGrid::matrix(name, std::move(cells), band_sizes, track_sizes);
    return std::move(grid.add_row_space(spacing));
}

FacetStrips build_strips(const LayoutTable& layout,
                         const FacetSpec&   spec,
                         const Graphics&    graphics,
                         const FacetTheme&  theme)
{
    std::vector<ValueTuple> col_labels;
    std::vector<ValueTuple> row_labels;
    for (int c = 1; c <= layout.ncol(); ++c)
        col_labels.push_back(layout.col_labels(c));
    for (int r = 1; r <= layout.nrow(); ++r)
        row_labels.push_back(layout.row_labels(r));

    return {.top  = build_strip(StripSide::Top,
                               col_labels,
                               layout.col_vars(),
                               spec.labeller(),
                               graphics,
                               theme,
                               static_cast<size_t>(layout.ncol())),
            .rows = build_strip(theme.row_strip,
                                row_labels,
                                layout.row_vars(),
                                spec.labeller(),
                                graphics,
                                theme,
                                static_cast<size_t>(layout.nrow()))};
}

}   // namespace trellis
