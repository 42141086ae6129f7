#pragma once

#include <optional>
#include <trellis/layout_grid.hpp>
#include <vector>

namespace trellis
{

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;
};

// Offset and size of every track along one axis.
struct TrackLayout
{
    std::vector<float> offsets;
    std::vector<float> sizes;
    float              scale = 0.0f;   // Points per relative unit
};

// Absolute tracks take their size; relative tracks share what is left in
// proportion to their values. `scale` forces the points-per-unit factor.
TrackLayout resolve_tracks(const SizeVector&    tracks,
                           float                available,
                           float                origin = 0.0f,
                           std::optional<float> scale  = std::nullopt);

// Computes the rectangle of every cell of `grid` placed in a
// figure_width x figure_height region at (origin_x, origin_y). Returns one
// Rect per cell, row-major (row 0 at the top). When the grid respects its
// proportions, relative units get the same scale on both axes and the
// grid is centred in the leftover space.
std::vector<Rect> compute_cell_rects(const LayoutGrid& grid,
                                     float             figure_width,
                                     float             figure_height,
                                     float             origin_x = 0.0f,
                                     float             origin_y = 0.0f);

// Bounding rectangle of a named block, given the output of compute_cell_rects.
Rect block_rect(const LayoutGrid& grid, const std::vector<Rect>& cells, const GridBlock& block);

}   // namespace trellis
