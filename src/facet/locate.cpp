#include <algorithm>
#include <cassert>
#include <map>
#include <stdexcept>
#include <trellis/layout_table.hpp>
#include <trellis/logger.hpp>

namespace trellis
{

namespace
{

// Matches records against the tuples of one side of the grid. Variables the
// data frame lacks match any value.
class SideMatcher
{
   public:
    SideMatcher(const DataFrame&                data,
                const std::vector<std::string>& vars,
                const std::vector<ValueTuple>&  tuples,
                bool                            margin)
        : tuples_(tuples), margin_(margin)
    {
        real_count_ = tuples.size() - (margin ? 1 : 0);
        for (size_t v = 0; v < vars.size(); ++v)
        {
            if (data.has_column(vars[v]))
            {
                present_.push_back(v);
                columns_.push_back(&data.column(vars[v]));
            }
        }
        complete_ = present_.size() == vars.size();
        if (complete_)
        {
            for (size_t t = 0; t < real_count_; ++t)
                index_.emplace(tuples[t], t);
        }
    }

    std::vector<size_t> candidates(size_t record) const
    {
        std::vector<size_t> out;
        if (tuples_.empty())
            return out;

        if (complete_)
        {
            ValueTuple key;
            key.reserve(columns_.size());
            for (const auto* col : columns_)
                key.push_back((*col)[record]);
            auto it = index_.find(key);
            if (it != index_.end())
                out.push_back(it->second);
        }
        else
        {
            for (size_t t = 0; t < real_count_; ++t)
            {
                bool match = true;
                for (size_t k = 0; k < present_.size() && match; ++k)
                    match = tuples_[t][present_[k]] == (*columns_[k])[record];
                if (match)
                    out.push_back(t);
            }
        }

        if (margin_ && !out.empty())
            out.push_back(tuples_.size() - 1);
        return out;
    }

    bool wildcard() const { return !complete_; }

   private:
    const std::vector<ValueTuple>&   tuples_;
    bool                             margin_     = false;
    size_t                           real_count_ = 0;
    bool                             complete_   = true;
    std::vector<size_t>              present_;
    std::vector<const std::vector<Value>*> columns_;
    std::map<ValueTuple, size_t>     index_;
};

}   // namespace

PanelAssignment locate_rows(const DataFrame& data, const LayoutTable& layout)
{
    SideMatcher rows(data, layout.row_vars(), layout.row_tuples(), layout.has_row_margin());
    SideMatcher cols(data, layout.col_vars(), layout.col_tuples(), layout.has_col_margin());

    if (rows.wildcard() || cols.wildcard())
    {
        TRELLIS_LOG_DEBUG("facet", "data lacks some facet variables; repeating it across panels");
    }

    const size_t    ncol_tuples = layout.col_tuples().size();
    PanelAssignment assignment(data.rows());
    size_t          dropped = 0;

    for (size_t i = 0; i < data.rows(); ++i)
    {
        auto row_idx = rows.candidates(i);
        auto col_idx = cols.candidates(i);

        auto& panels = assignment[i];
        panels.reserve(row_idx.size() * col_idx.size());
        for (size_t r : row_idx)
        {
            for (size_t c : col_idx)
                panels.push_back(static_cast<int>(r * ncol_tuples + c + 1));
        }
        std::sort(panels.begin(), panels.end());

        if (panels.empty())
            ++dropped;
    }

    if (dropped > 0)
    {
        TRELLIS_LOG_DEBUG("facet", "{} of {} records match no panel", dropped, data.rows());
    }
    return assignment;
}

std::vector<std::vector<size_t>> split_by_panel(const PanelAssignment& assignment,
                                                const LayoutTable&     layout)
{
    std::vector<std::vector<size_t>> out(layout.panel_count());
    for (size_t i = 0; i < assignment.size(); ++i)
    {
        for (int p : assignment[i])
        {
            assert(p >= 1 && static_cast<size_t>(p) <= out.size());
            out.at(static_cast<size_t>(p - 1)).push_back(i);
        }
    }
    return out;
}

}   // namespace trellis
