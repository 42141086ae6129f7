#include <algorithm>
#include <cmath>
#include <set>
#include <trellis/error.hpp>
#include <trellis/logger.hpp>
#include <trellis/scales.hpp>

namespace trellis
{

namespace
{

constexpr float DISCRETE_PAD = 0.6f;

struct GroupTrainer
{
    bool            has_continuous = false;
    float           min            = 0.0f;
    float           max            = 0.0f;
    std::set<Value> discrete;

    void train(const Value& v, const char* axis, int group)
    {
        if (v.is_margin() || (v.is_number() && std::isnan(v.as_number())))
            return;
        if (v.is_number() ? !discrete.empty() : has_continuous)
        {
            throw ConfigurationError(std::string("scale group ") + std::to_string(group) + " on "
                                     + axis + " mixes continuous and discrete values");
        }
        if (v.is_string())
        {
            discrete.insert(v);
            return;
        }

        auto f = static_cast<float>(v.as_number());
        if (!has_continuous)
        {
            min = max      = f;
            has_continuous = true;
        }
        else
        {
            min = std::min(min, f);
            max = std::max(max, f);
        }
    }

    AxisRange range() const
    {
        if (has_continuous)
            return {min, max};
        if (!discrete.empty())
            return {1.0f - DISCRETE_PAD, static_cast<float>(discrete.size()) + DISCRETE_PAD};
        return {};
    }
};

}   // namespace

ScaleRanges train_scale_ranges(const LayoutTable&         layout,
                               std::span<const DataFrame> layers,
                               const PositionAes&         aes,
                               const ScaleLimits&         limits)
{
    std::vector<GroupTrainer> x_groups(static_cast<size_t>(layout.scale_x_count()));
    std::vector<GroupTrainer> y_groups(static_cast<size_t>(layout.scale_y_count()));

    for (const auto& layer : layers)
    {
        const bool has_x = layer.has_column(aes.x);
        const bool has_y = layer.has_column(aes.y);
        if (!has_x && !has_y)
            continue;

        auto assignment = locate_rows(layer, layout);
        for (size_t i = 0; i < assignment.size(); ++i)
        {
            for (int p : assignment[i])
            {
                const auto& entry = layout.panel(p);
                if (has_x && !limits.x)
                {
                    x_groups[static_cast<size_t>(entry.scale_x - 1)].train(
                        layer.column(aes.x)[i], "x", entry.scale_x);
                }
                if (has_y && !limits.y)
                {
                    y_groups[static_cast<size_t>(entry.scale_y - 1)].train(
                        layer.column(aes.y)[i], "y", entry.scale_y);
                }
            }
        }
    }

    ScaleRanges ranges;
    ranges.x.reserve(x_groups.size());
    ranges.y.reserve(y_groups.size());
    for (const auto& g : x_groups)
        ranges.x.push_back(limits.x ? *limits.x : g.range());
    for (const auto& g : y_groups)
        ranges.y.push_back(limits.y ? *limits.y : g.range());

    TRELLIS_LOG_DEBUG("facet",
                      "trained {} x scale(s), {} y scale(s)",
                      ranges.x.size(),
                      ranges.y.size());
    return ranges;
}

std::vector<PanelRange> panel_ranges_for(const LayoutTable& layout, const ScaleRanges& scales)
{
    std::vector<PanelRange> out;
    out.reserve(layout.panel_count());
    for (const auto& e : layout.entries())
    {
        out.push_back({.x = scales.x.at(static_cast<size_t>(e.scale_x - 1)),
                       .y = scales.y.at(static_cast<size_t>(e.scale_y - 1))});
    }
    return out;
}

}   // namespace trellis
