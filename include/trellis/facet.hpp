#pragma once

#include <span>
#include <string>
#include <string_view>
#include <trellis/coord.hpp>
#include <trellis/data_frame.hpp>
#include <trellis/drawable.hpp>
#include <trellis/facet_spec.hpp>
#include <trellis/layout_grid.hpp>
#include <trellis/layout_table.hpp>
#include <trellis/theme.hpp>
#include <vector>

namespace trellis
{

// A faceting strategy. The plot driver trains the layout once per render,
// maps every layer onto it, then asks for the composite drawable tree.
class Facet
{
   public:
    virtual ~Facet() = default;

    virtual LayoutTable train_layout(std::span<const DataFrame> layers) const = 0;

    virtual PanelAssignment map_layout(const DataFrame& data, const LayoutTable& layout) const = 0;

    virtual LayoutGrid render(const LayoutTable& layout,
                              const ScaleRanges& scales,
                              const Coord&       coord,
                              const Graphics&    graphics,
                              const FacetTheme&  theme,
                              ContentLayers      content) const = 0;
};

// Panels in a grid: rows and columns each split by zero or more variables.
class FacetGrid final : public Facet
{
   public:
    explicit FacetGrid(FacetSpec spec) : spec_(std::move(spec)) {}

    FacetGrid(std::vector<std::string> rows,
              std::vector<std::string> cols,
              const FacetOptions&      options = {})
        : spec_(std::move(rows), std::move(cols), options)
    {
    }

    // "rows ~ cols", e.g. "cyl ~ vs + am" or ". ~ cut".
    static FacetGrid from_formula(std::string_view formula, const FacetOptions& options = {})
    {
        return FacetGrid(FacetSpec::from_formula(formula, options));
    }

    const FacetSpec& spec() const { return spec_; }

    LayoutTable train_layout(std::span<const DataFrame> layers) const override;

    PanelAssignment map_layout(const DataFrame& data, const LayoutTable& layout) const override;

    // Composite layout named "layout" with blocks "strip-t", "strip-r" (or
    // "strip-l"), "panel", "axis-b" and "axis-l". Throws ConfigurationError if
    // the theme asks for row strips on top.
    LayoutGrid render(const LayoutTable& layout,
                      const ScaleRanges& scales,
                      const Coord&       coord,
                      const Graphics&    graphics,
                      const FacetTheme&  theme,
                      ContentLayers      content) const override;

   private:
    FacetSpec spec_;
};

}   // namespace trellis
