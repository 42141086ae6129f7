#include "composite.hpp"

namespace trellis
{

LayoutGrid compose_facet_grid(LayoutGrid        panels,
                              FacetAxes         axes,
                              FacetStrips       strips,
                              const FacetTheme& theme)
{
    axes.bottom.set_widths(panels.widths());
    strips.top.set_widths(panels.widths());
    axes.left.set_heights(panels.heights());
    strips.rows.set_heights(panels.heights());

    const bool       respect      = panels.respect();
    const SizeVector strip_widths = strips.rows.widths();
    const SizeVector axis_widths  = axes.left.widths();

    LayoutGrid top    = std::move(strips.top);
    LayoutGrid bottom = std::move(axes.bottom);

    if (theme.row_strip == StripSide::Left)
    {
        top.add_cols(axis_widths, 0).add_cols(strip_widths, 0);
        bottom.add_cols(axis_widths, 0).add_cols(strip_widths, 0);

        LayoutGrid centre = std::move(strips.rows);
        centre.cbind(std::move(axes.left)).cbind(std::move(panels));
        centre.rbind(std::move(top), 0).rbind(std::move(bottom));
        centre.set_respect(respect);
        centre.set_name("layout");
        return centre;
    }

    top.add_cols(strip_widths).add_cols(axis_widths, 0);
    bottom.add_cols(strip_widths).add_cols(axis_widths, 0);

    LayoutGrid centre = std::move(axes.left);
    centre.cbind(std::move(panels)).cbind(std::move(strips.rows));
    centre.rbind(std::move(top), 0).rbind(std::move(bottom));
    centre.set_respect(respect);
    centre.set_name("layout");
    return centre;
}

}   // namespace trellis
