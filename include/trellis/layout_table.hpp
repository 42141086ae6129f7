#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <trellis/data_frame.hpp>
#include <trellis/facet_spec.hpp>
#include <trellis/value.hpp>
#include <vector>

namespace trellis
{

// One panel of the grid. Grid positions and panel ids are 1-based.
struct LayoutRow
{
    int        panel = 0;
    int        row   = 0;
    int        col   = 0;
    ValueTuple row_values;   // One value per row variable
    ValueTuple col_values;   // One value per column variable
    int        scale_x = 1;
    int        scale_y = 1;
};

// Panel layout of a grid facet. Entries are ordered by panel id, ids are
// dense (1..N) and every (row, col) grid cell holds exactly one panel.
// Only build_layout() creates tables; they cannot be modified afterwards.
class LayoutTable
{
   public:
    const std::vector<LayoutRow>& entries() const { return entries_; }
    size_t                        panel_count() const { return entries_.size(); }

    int nrow() const { return nrow_; }
    int ncol() const { return ncol_; }

    // Throws std::out_of_range for ids outside 1..N.
    const LayoutRow& panel(int id) const;

    std::optional<int> panel_at(int row, int col) const;

    // Panel heading a grid row / column. Throws std::out_of_range when the
    // track holds no panel.
    const LayoutRow& row_panel(int row) const;
    const LayoutRow& col_panel(int col) const;

    const std::vector<std::string>& row_vars() const { return row_vars_; }
    const std::vector<std::string>& col_vars() const { return col_vars_; }

    // Distinct combinations in level order, margin tuple last.
    const std::vector<ValueTuple>& row_tuples() const { return row_tuples_; }
    const std::vector<ValueTuple>& col_tuples() const { return col_tuples_; }

    // Values shown at a grid row / column.
    const ValueTuple& row_labels(int row) const;
    const ValueTuple& col_labels(int col) const;

    bool has_row_margin() const { return row_margin_; }
    bool has_col_margin() const { return col_margin_; }

    int scale_x_count() const;
    int scale_y_count() const;

   private:
    friend LayoutTable build_layout(std::span<const DataFrame> layers, const FacetSpec& spec);

    LayoutTable() = default;

    std::vector<LayoutRow>   entries_;
    std::vector<int>         grid_;   // Row-major panel ids, nrow x ncol
    int                      nrow_ = 0;
    int                      ncol_ = 0;
    std::vector<std::string> row_vars_;
    std::vector<std::string> col_vars_;
    std::vector<ValueTuple>  row_tuples_;
    std::vector<ValueTuple>  col_tuples_;
    bool                     row_margin_ = false;
    bool                     col_margin_ = false;
};

struct ScaleGroups
{
    int x = 1;
    int y = 1;
};

// x varies across columns, y across rows.
ScaleGroups resolve_scale_groups(int row, int col, FreeScales free);

// Enumerates every combination of the observed row and column tuples, plus
// margins when requested. Throws ConfigurationError if a side's variables
// are not all present in at least one layer.
LayoutTable build_layout(std::span<const DataFrame> layers, const FacetSpec& spec);
LayoutTable build_layout(const DataFrame& data, const FacetSpec& spec);

// Panel ids of every record, ascending. Records whose values are not in the
// layout get an empty list. Facet variables absent from `data` match every
// value.
using PanelAssignment = std::vector<std::vector<int>>;

PanelAssignment locate_rows(const DataFrame& data, const LayoutTable& layout);

// Record indices per panel; element i belongs to panel i + 1.
std::vector<std::vector<size_t>> split_by_panel(const PanelAssignment& assignment,
                                                const LayoutTable&     layout);

}   // namespace trellis
