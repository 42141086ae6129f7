#pragma once

#include <optional>

namespace trellis
{

enum class StripSide
{
    Top,
    Right,
    Left,
};

// Facet-related theme settings. Passed explicitly to every builder.
struct FacetTheme
{
    float                panel_margin = 5.5f;   // Points between adjacent panels
    std::optional<float> aspect_ratio;          // Panel height / width; locks proportions
    StripSide            row_strip    = StripSide::Right;   // Right or Left
};

}   // namespace trellis
