#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <trellis/drawable.hpp>
#include <vector>

namespace trellis
{

// A named rectangular region of a LayoutGrid, in track indices.
struct GridBlock
{
    std::string name;
    size_t      top  = 0;
    size_t      left = 0;
    size_t      rows = 0;
    size_t      cols = 0;
};

// Matrix of drawables with explicit column widths and row heights.
//
// Cells are stored row-major in one flat arena; every cell always holds a
// drawable (NullDrawable when empty). Grids are combined with cbind/rbind,
// which flatten the operands into one grid and keep each operand's blocks
// addressable by name.
class LayoutGrid : public Drawable
{
   public:
    struct Cell
    {
        std::unique_ptr<Drawable> drawable;
        std::string               name;
    };

    // Empty grid of the given shape; tracks default to Relative(1).
    LayoutGrid(std::string name, size_t rows, size_t cols);

    // Builds a grid from row-major cells. Null drawables become NullDrawable.
    // Throws std::logic_error if the cell count or track counts mismatch.
    static LayoutGrid matrix(std::string       name,
                             std::vector<Cell> cells,
                             SizeVector        widths,
                             SizeVector        heights);

    LayoutGrid(LayoutGrid&&)            = default;
    LayoutGrid& operator=(LayoutGrid&&) = default;

    std::string_view kind() const override { return "grid"; }

    const std::string& name() const { return name_; }
    void               set_name(std::string name) { name_ = std::move(name); }

    size_t rows() const { return heights_.size(); }
    size_t cols() const { return widths_.size(); }

    const SizeVector& widths() const { return widths_; }
    const SizeVector& heights() const { return heights_; }

    // Track counts must not change.
    void set_widths(SizeVector widths);
    void set_heights(SizeVector heights);

    bool respect() const { return respect_; }
    void set_respect(bool respect) { respect_ = respect; }

    const Cell& cell(size_t row, size_t col) const;
    void        set_cell(size_t row, size_t col, std::unique_ptr<Drawable> drawable, std::string name);

    // Position of the first cell with the given name.
    std::optional<std::pair<size_t, size_t>> find(const std::string& cell_name) const;

    const std::vector<GridBlock>& blocks() const { return blocks_; }
    std::optional<GridBlock>      block(const std::string& name) const;

    // Inserts empty columns/rows before track `pos` (append when absent).
    LayoutGrid& add_cols(const SizeVector& widths, std::optional<size_t> pos = std::nullopt);
    LayoutGrid& add_rows(const SizeVector& heights, std::optional<size_t> pos = std::nullopt);

    // Inserts an empty track between every pair of adjacent tracks.
    LayoutGrid& add_col_space(SizeUnit width);
    LayoutGrid& add_row_space(SizeUnit height);

    // Appends `other` to the right (cbind) or below (rbind; prepends when
    // pos == 0). Shared tracks merge element-wise: absolute beats relative,
    // otherwise the larger value wins. Track counts must match.
    LayoutGrid& cbind(LayoutGrid&& other);
    LayoutGrid& rbind(LayoutGrid&& other, std::optional<size_t> pos = std::nullopt);

   private:
    size_t index(size_t row, size_t col) const { return row * widths_.size() + col; }

    static SizeUnit merge_track(const SizeUnit& a, const SizeUnit& b);

    std::string            name_;
    SizeVector             widths_;
    SizeVector             heights_;
    std::vector<Cell>      cells_;
    std::vector<GridBlock> blocks_;
    bool                   respect_ = false;
};

}   // namespace trellis
