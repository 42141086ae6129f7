#include "layout.hpp"

#include <algorithm>

namespace trellis
{

namespace
{

struct TrackTotals
{
    float absolute = 0.0f;
    float relative = 0.0f;
};

TrackTotals totals(const SizeVector& tracks)
{
    TrackTotals t;
    for (const auto& u : tracks)
    {
        if (u.is_absolute())
            t.absolute += u.value;
        else
            t.relative += u.value;
    }
    return t;
}

float relative_scale(const SizeVector& tracks, float available)
{
    auto  t    = totals(tracks);
    float free = std::max(0.0f, available - t.absolute);
    return t.relative > 0.0f ? free / t.relative : 0.0f;
}

}   // namespace

TrackLayout resolve_tracks(const SizeVector&    tracks,
                           float                available,
                           float                origin,
                           std::optional<float> scale)
{
    TrackLayout layout;
    layout.scale = scale.value_or(relative_scale(tracks, available));
    layout.offsets.reserve(tracks.size());
    layout.sizes.reserve(tracks.size());

    float cursor = origin;
    for (const auto& u : tracks)
    {
        float size = u.is_absolute() ? u.value : u.value * layout.scale;
        // Clamp to non-negative dimensions
        if (size < 0.0f)
            size = 0.0f;
        layout.offsets.push_back(cursor);
        layout.sizes.push_back(size);
        cursor += size;
    }
    return layout;
}

std::vector<Rect> compute_cell_rects(const LayoutGrid& grid,
                                     float             figure_width,
                                     float             figure_height,
                                     float             origin_x,
                                     float             origin_y)
{
    std::optional<float> scale;
    if (grid.respect())
    {
        float sx = relative_scale(grid.widths(), figure_width);
        float sy = relative_scale(grid.heights(), figure_height);
        scale    = std::min(sx, sy);

        // Centre the grid in the space the locked scale leaves unused.
        auto tw = totals(grid.widths());
        auto th = totals(grid.heights());
        origin_x += std::max(0.0f, figure_width - tw.absolute - tw.relative * *scale) * 0.5f;
        origin_y += std::max(0.0f, figure_height - th.absolute - th.relative * *scale) * 0.5f;
    }

    auto cols = resolve_tracks(grid.widths(), figure_width, origin_x, scale);
    auto rows = resolve_tracks(grid.heights(), figure_height, origin_y, scale);

    std::vector<Rect> rects;
    rects.reserve(grid.rows() * grid.cols());

    // Row 0 at top: y increases downward in screen coords
    for (size_t r = 0; r < grid.rows(); ++r)
    {
        for (size_t c = 0; c < grid.cols(); ++c)
        {
            Rect cell;
            cell.x = cols.offsets[c];
            cell.y = rows.offsets[r];
            cell.w = cols.sizes[c];
            cell.h = rows.sizes[r];
            rects.push_back(cell);
        }
    }

    return rects;
}

Rect block_rect(const LayoutGrid& grid, const std::vector<Rect>& cells, const GridBlock& block)
{
    if (block.rows == 0 || block.cols == 0)
        return {};

    const auto& first = cells[block.top * grid.cols() + block.left];
    const auto& last  = cells[(block.top + block.rows - 1) * grid.cols() + block.left + block.cols - 1];

    Rect out;
    out.x = first.x;
    out.y = first.y;
    out.w = last.x + last.w - first.x;
    out.h = last.y + last.h - first.y;
    return out;
}

}   // namespace trellis
