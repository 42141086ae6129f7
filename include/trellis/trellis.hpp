#pragma once

#include <trellis/coord.hpp>
#include <trellis/data_frame.hpp>
#include <trellis/drawable.hpp>
#include <trellis/error.hpp>
#include <trellis/facet.hpp>
#include <trellis/facet_config.hpp>
#include <trellis/facet_spec.hpp>
#include <trellis/labeller.hpp>
#include <trellis/layout_grid.hpp>
#include <trellis/layout_table.hpp>
#include <trellis/logger.hpp>
#include <trellis/scales.hpp>
#include <trellis/theme.hpp>
#include <trellis/value.hpp>

// ─── Typical use ─────────────────────────────────────────────────────────────
//
//   trellis::FacetGrid facet = trellis::FacetGrid::from_formula("vs ~ am",
//       {.scales = trellis::ScaleMode::Free});
//   auto layout = facet.train_layout(layers);
//   auto panels = facet.map_layout(layers[0], layout);
//   auto scales = trellis::train_scale_ranges(layout, layers);
//   auto tree   = facet.render(layout, scales, coord, graphics, theme, std::move(content));
