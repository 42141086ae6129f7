#include <cstdio>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <trellis/trellis.hpp>
#include <vector>

#include "core/layout.hpp"

using namespace trellis;

// Text-only collaborators: every drawable is a label with a nominal size.
class Label : public Drawable
{
   public:
    Label(std::string text, Size2D size) : text_(std::move(text)), size_(size) {}

    std::string_view kind() const override { return "label"; }

    const std::string& text() const { return text_; }
    Size2D             size() const { return size_; }

   private:
    std::string text_;
    Size2D      size_;
};

class TextCoord : public Coord
{
   public:
    std::unique_ptr<Drawable> render_axis_h(const PanelRange& r, const FacetTheme&) const override
    {
        return std::make_unique<Label>(range_text(r.x), Size2D{60.0f, 18.0f});
    }

    std::unique_ptr<Drawable> render_axis_v(const PanelRange& r, const FacetTheme&) const override
    {
        return std::make_unique<Label>(range_text(r.y), Size2D{28.0f, 60.0f});
    }

    std::unique_ptr<Drawable> render_bg(const PanelRange&, const FacetTheme&) const override
    {
        return std::make_unique<Label>("background", Size2D{});
    }

    std::unique_ptr<Drawable> render_fg(const PanelRange&, const FacetTheme&) const override
    {
        return nullptr;
    }

   private:
    static std::string range_text(const AxisRange& r)
    {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.2f..%.2f", r.min, r.max);
        return buf;
    }
};

class TextGraphics : public Graphics
{
   public:
    std::unique_ptr<Drawable> render_strip(const std::string& label,
                                           bool               horizontal,
                                           const FacetTheme&) const override
    {
        float along = 6.5f * static_cast<float>(label.size());
        return std::make_unique<Label>(label,
                                       horizontal ? Size2D{along, 16.0f} : Size2D{16.0f, along});
    }

    Size2D measure(const Drawable& d) const override
    {
        if (const auto* label = dynamic_cast<const Label*>(&d))
            return label->size();
        return {};
    }
};

static DataFrame make_diamonds()
{
    DataFrame df;
    df.add_column("carat", {0.23, 0.31, 0.70, 1.01, 0.90, 1.52, 0.30, 2.01, 0.51});
    df.add_column("price", {326, 335, 2757, 4676, 3945, 9271, 506, 15403, 1628});
    df.add_column("cut", {"Ideal", "Good", "Ideal", "Fair", "Good", "Ideal", "Fair", "Good", "Ideal"});
    df.add_column("color", {"E", "E", "J", "J", "E", "J", "E", "J", "E"});
    df.set_levels("cut", {"Fair", "Good", "Ideal"});
    return df;
}

int main(int argc, char** argv)
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    const std::string formula = argc > 1 ? argv[1] : "color ~ cut";
    if (argc > 2)
    {
        try
        {
            Logger::instance().add_sink(sinks::file_sink(argv[2]));
        }
        catch (const std::runtime_error& e)
        {
            TRELLIS_LOG_WARN("demo", "{}", e.what());
        }
    }

    FacetConfig config;
    if (!config.load(FacetConfig::default_path()))
    {
        TRELLIS_LOG_INFO("demo", "using default facet settings");
        config.margins = true;
        config.scales  = ScaleMode::FreeX;
    }

    try
    {
        auto facet = FacetGrid::from_formula(formula, config.to_options());

        std::vector<DataFrame> layers = {make_diamonds()};
        auto                   layout = facet.train_layout(layers);
        auto                   scales = train_scale_ranges(layout, layers, {.x = "carat", .y = "price"});

        // One content slot per panel: the record count it received.
        auto          split = split_by_panel(facet.map_layout(layers[0], layout), layout);
        ContentLayers content(1);
        for (const auto& records : split)
        {
            content[0].push_back(
                std::make_unique<Label>(std::to_string(records.size()) + " points", Size2D{}));
        }

        TextCoord    coord;
        TextGraphics graphics;
        auto grid = facet.render(layout, scales, coord, graphics, config.theme, std::move(content));

        std::printf("%s: %zu panels, %zu x %zu tracks\n",
                    formula.c_str(),
                    layout.panel_count(),
                    grid.rows(),
                    grid.cols());

        for (const auto& e : layout.entries())
        {
            std::printf("  panel %d at (%d, %d): rows=%s cols=%s x-group=%d y-group=%d\n",
                        e.panel,
                        e.row,
                        e.col,
                        to_string(e.row_values).c_str(),
                        to_string(e.col_values).c_str(),
                        e.scale_x,
                        e.scale_y);
        }

        auto rects = compute_cell_rects(grid, 800.0f, 600.0f);
        for (const auto& block : grid.blocks())
        {
            auto r = block_rect(grid, rects, block);
            std::printf("  %-8s x=%7.1f y=%7.1f w=%7.1f h=%7.1f\n",
                        block.name.c_str(),
                        r.x,
                        r.y,
                        r.w,
                        r.h);
        }
    }
    catch (const ConfigurationError& e)
    {
        TRELLIS_LOG_ERROR("demo", "invalid facet: {}", e.what());
        return 1;
    }

    return 0;
}
