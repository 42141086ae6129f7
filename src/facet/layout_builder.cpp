#include <algorithm>
#include <set>
#include <stdexcept>
#include <trellis/error.hpp>
#include <trellis/layout_table.hpp>
#include <trellis/logger.hpp>

namespace trellis
{

namespace
{

bool has_all(const DataFrame& data, const std::vector<std::string>& vars)
{
    return std::all_of(
        vars.begin(), vars.end(), [&](const std::string& v) { return data.has_column(v); });
}

std::string join(const std::vector<std::string>& vars)
{
    std::string out;
    for (const auto& v : vars)
    {
        if (!out.empty())
            out += ", ";
        out += v;
    }
    return out;
}

// Declared level order of one variable, taken from the first layer declaring it.
class LevelOrder
{
   public:
    LevelOrder(std::span<const DataFrame> layers, const std::string& var)
    {
        for (const auto& layer : layers)
        {
            if (const auto* levels = layer.levels(var))
            {
                declared_ = levels;
                break;
            }
        }
    }

    size_t rank(const Value& v) const
    {
        if (!declared_)
            return 0;
        auto it = std::find(declared_->begin(), declared_->end(), v);
        return static_cast<size_t>(it - declared_->begin());
    }

   private:
    const std::vector<Value>* declared_ = nullptr;
};

std::vector<ValueTuple> distinct_tuples(std::span<const DataFrame>      layers,
                                        const std::vector<std::string>& vars,
                                        const char*                     side)
{
    if (vars.empty())
        return {ValueTuple{}};

    bool                 found = false;
    std::set<ValueTuple> seen;
    for (const auto& layer : layers)
    {
        if (!has_all(layer, vars))
            continue;
        found = true;

        std::vector<const std::vector<Value>*> columns;
        columns.reserve(vars.size());
        for (const auto& v : vars)
            columns.push_back(&layer.column(v));

        for (size_t i = 0; i < layer.rows(); ++i)
        {
            ValueTuple tuple;
            tuple.reserve(vars.size());
            for (const auto* col : columns)
                tuple.push_back((*col)[i]);
            seen.insert(std::move(tuple));
        }
    }

    if (!found)
    {
        throw ConfigurationError(std::string("At least one layer must contain all ") + side
                                 + " facet variables: " + join(vars));
    }

    std::vector<LevelOrder> orders;
    orders.reserve(vars.size());
    for (const auto& v : vars)
        orders.emplace_back(layers, v);

    std::vector<ValueTuple> tuples(seen.begin(), seen.end());
    std::stable_sort(tuples.begin(),
                     tuples.end(),
                     [&](const ValueTuple& a, const ValueTuple& b)
                     {
                         for (size_t i = 0; i < a.size(); ++i)
                         {
                             size_t ra = orders[i].rank(a[i]);
                             size_t rb = orders[i].rank(b[i]);
                             if (ra != rb)
                                 return ra < rb;
                             if (a[i] != b[i])
                                 return a[i] < b[i];
                         }
                         return false;
                     });
    return tuples;
}

}   // namespace

ScaleGroups resolve_scale_groups(int row, int col, FreeScales free)
{
    return {.x = free.x ? col : 1, .y = free.y ? row : 1};
}

LayoutTable build_layout(std::span<const DataFrame> layers, const FacetSpec& spec)
{
    LayoutTable layout;
    layout.row_vars_   = spec.rows();
    layout.col_vars_   = spec.cols();
    layout.row_tuples_ = distinct_tuples(layers, spec.rows(), "row");
    layout.col_tuples_ = distinct_tuples(layers, spec.cols(), "column");

    // No observed values on one side means no panel anywhere.
    if (layout.row_tuples_.empty() || layout.col_tuples_.empty())
    {
        layout.row_tuples_.clear();
        layout.col_tuples_.clear();
    }
    else if (spec.margins())
    {
        if (!spec.rows().empty())
        {
            layout.row_tuples_.emplace_back(spec.rows().size(), Value::margin());
            layout.row_margin_ = true;
        }
        if (!spec.cols().empty())
        {
            layout.col_tuples_.emplace_back(spec.cols().size(), Value::margin());
            layout.col_margin_ = true;
        }
    }

    const int nrow = static_cast<int>(layout.row_tuples_.size());
    const int ncol = static_cast<int>(layout.col_tuples_.size());
    layout.nrow_   = nrow;
    layout.ncol_   = ncol;
    layout.grid_.assign(static_cast<size_t>(nrow) * static_cast<size_t>(ncol), 0);
    layout.entries_.reserve(layout.grid_.size());

    int panel = 1;
    for (int i = 0; i < nrow; ++i)
    {
        for (int j = 0; j < ncol; ++j)
        {
            LayoutRow entry;
            entry.panel      = panel;
            entry.row        = spec.as_table() ? i + 1 : nrow - i;
            entry.col        = j + 1;
            entry.row_values = layout.row_tuples_[static_cast<size_t>(i)];
            entry.col_values = layout.col_tuples_[static_cast<size_t>(j)];

            auto groups   = resolve_scale_groups(entry.row, entry.col, spec.free());
            entry.scale_x = groups.x;
            entry.scale_y = groups.y;

            layout.grid_[static_cast<size_t>((entry.row - 1) * ncol + (entry.col - 1))] = panel;
            layout.entries_.push_back(std::move(entry));
            ++panel;
        }
    }

    if (layout.entries_.empty())
    {
        TRELLIS_LOG_WARN("layout", "facet layout is empty: no observed facet values");
    }
    TRELLIS_LOG_DEBUG("layout",
                      "facet layout: {} x {} grid, {} panels (margins={}, as_table={})",
                      nrow,
                      ncol,
                      layout.entries_.size(),
                      spec.margins(),
                      spec.as_table());
    return layout;
}

LayoutTable build_layout(const DataFrame& data, const FacetSpec& spec)
{
    return build_layout(std::span<const DataFrame>(&data, 1), spec);
}

// ─── LayoutTable accessors ──────────────────────────────────────────────────

const LayoutRow& LayoutTable::panel(int id) const
{
    if (id < 1 || static_cast<size_t>(id) > entries_.size())
        throw std::out_of_range("panel id " + std::to_string(id) + " is not in the layout");
    return entries_[static_cast<size_t>(id - 1)];
}

std::optional<int> LayoutTable::panel_at(int row, int col) const
{
    if (row < 1 || row > nrow_ || col < 1 || col > ncol_)
        return std::nullopt;
    int id = grid_[static_cast<size_t>((row - 1) * ncol_ + (col - 1))];
    if (id == 0)
        return std::nullopt;
    return id;
}

const LayoutRow& LayoutTable::row_panel(int row) const
{
    auto id = panel_at(row, 1);
    if (!id)
        throw std::out_of_range("grid row " + std::to_string(row) + " is not in the layout");
    return panel(*id);
}

const LayoutRow& LayoutTable::col_panel(int col) const
{
    auto id = panel_at(1, col);
    if (!id)
        throw std::out_of_range("grid column " + std::to_string(col) + " is not in the layout");
    return panel(*id);
}

const ValueTuple& LayoutTable::row_labels(int row) const
{
    return row_panel(row).row_values;
}

const ValueTuple& LayoutTable::col_labels(int col) const
{
    return col_panel(col).col_values;
}

int LayoutTable::scale_x_count() const
{
    int n = 0;
    for (const auto& e : entries_)
        n = std::max(n, e.scale_x);
    return n;
}

int LayoutTable::scale_y_count() const
{
    int n = 0;
    for (const auto& e : entries_)
        n = std::max(n, e.scale_y);
    return n;
}

}   // namespace trellis
