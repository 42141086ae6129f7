#pragma once

#include <memory>
#include <optional>
#include <string>
#include <trellis/drawable.hpp>
#include <trellis/theme.hpp>
#include <vector>

namespace trellis
{

struct AxisRange
{
    float min = 0.0f;
    float max = 1.0f;

    float span() const { return max - min; }
};

// Value range of one panel on both position axes.
struct PanelRange
{
    AxisRange x;
    AxisRange y;
};

// Trained range of every scale group, indexed by scale group id - 1.
struct ScaleRanges
{
    std::vector<AxisRange> x;
    std::vector<AxisRange> y;
};

// Coordinate system collaborator: renders the per-panel guides.
class Coord
{
   public:
    virtual ~Coord() = default;

    virtual std::unique_ptr<Drawable> render_axis_h(const PanelRange& range,
                                                    const FacetTheme& theme) const = 0;
    virtual std::unique_ptr<Drawable> render_axis_v(const PanelRange& range,
                                                    const FacetTheme& theme) const = 0;
    virtual std::unique_ptr<Drawable> render_bg(const PanelRange& range,
                                                const FacetTheme& theme) const     = 0;
    virtual std::unique_ptr<Drawable> render_fg(const PanelRange& range,
                                                const FacetTheme& theme) const     = 0;

    // Preferred panel aspect ratio (height / width), if the coordinate system
    // has one (e.g. equal-scaled cartesian).
    virtual std::optional<float> aspect(const PanelRange& /*range*/) const { return std::nullopt; }
};

// Graphics collaborator: strip label rendering and content metrics.
class Graphics
{
   public:
    virtual ~Graphics() = default;

    virtual std::unique_ptr<Drawable> render_strip(const std::string& label,
                                                   bool               horizontal,
                                                   const FacetTheme&  theme) const = 0;

    // Natural size of a drawable in points.
    virtual Size2D measure(const Drawable& drawable) const = 0;
};

}   // namespace trellis
