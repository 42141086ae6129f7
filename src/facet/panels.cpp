#include "panels.hpp"

#include <cassert>
#include <stdexcept>
#include <string>

namespace trellis
{

LayoutGrid assemble_panels(const LayoutTable&             layout,
                           const std::vector<PanelRange>& ranges,
                           const Coord&                   coord,
                           ContentLayers                  content,
                           const PanelSizes&              sizes,
                           const FacetTheme&              theme)
{
    const size_t n = layout.panel_count();
    assert(ranges.size() == n);
    if (ranges.size() != n)
        throw std::logic_error("assemble_panels: one range per panel required");
    for (const auto& layer : content)
    {
        assert(layer.size() == n);
        if (layer.size() != n)
            throw std::logic_error("assemble_panels: content layer does not cover every panel");
    }

    const auto nrow = static_cast<size_t>(layout.nrow());
    const auto ncol = static_cast<size_t>(layout.ncol());
    std::vector<LayoutGrid::Cell> cells(nrow * ncol);

    for (const auto& entry : layout.entries())
    {
        const auto  idx   = static_cast<size_t>(entry.panel - 1);
        const auto& range = ranges[idx];
        const auto  name  = "panel-" + std::to_string(entry.row) + "-" + std::to_string(entry.col);

        auto stack = std::make_unique<DrawableGroup>(name);
        stack->add(coord.render_bg(range, theme));
        for (auto& layer : content)
            stack->add(std::move(layer[idx]));
        stack->add(coord.render_fg(range, theme));

        const auto r = static_cast<size_t>(entry.row - 1);
        const auto c = static_cast<size_t>(entry.col - 1);
        cells[r * ncol + c] = {std::move(stack), name};
    }

    auto grid = LayoutGrid::matrix("panel", std::move(cells), sizes.widths, sizes.heights);
    grid.set_respect(sizes.respect);
    grid.add_col_space(SizeUnit::absolute(theme.panel_margin));
    grid.add_row_space(SizeUnit::absolute(theme.panel_margin));
    return grid;
}

}   // namespace trellis
