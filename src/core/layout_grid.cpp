#include <algorithm>
#include <cassert>
#include <stdexcept>
#include <trellis/layout_grid.hpp>

namespace trellis
{

namespace
{

LayoutGrid::Cell null_cell()
{
    return {std::make_unique<NullDrawable>(), std::string()};
}

void require(bool condition, const char* message)
{
    assert(condition && message);
    if (!condition)
        throw std::logic_error(message);
}

// Index of old track `i` after a spacer has been inserted between every pair.
size_t spaced_index(size_t i)
{
    return i * 2;
}

size_t spaced_count(size_t n)
{
    return n == 0 ? 0 : n * 2 - 1;
}

}   // namespace

LayoutGrid::LayoutGrid(std::string name, size_t rows, size_t cols)
    : name_(std::move(name)),
      widths_(cols, SizeUnit::relative(1.0f)),
      heights_(rows, SizeUnit::relative(1.0f))
{
    cells_.reserve(rows * cols);
    for (size_t i = 0; i < rows * cols; ++i)
        cells_.push_back(null_cell());
    blocks_.push_back({name_, 0, 0, rows, cols});
}

LayoutGrid LayoutGrid::matrix(std::string       name,
                              std::vector<Cell> cells,
                              SizeVector        widths,
                              SizeVector        heights)
{
    require(cells.size() == widths.size() * heights.size(),
            "LayoutGrid::matrix: cell count does not match track counts");

    LayoutGrid grid(std::move(name), 0, 0);
    grid.widths_  = std::move(widths);
    grid.heights_ = std::move(heights);
    grid.cells_   = std::move(cells);
    for (auto& c : grid.cells_)
    {
        if (!c.drawable)
            c.drawable = std::make_unique<NullDrawable>();
    }
    grid.blocks_ = {{grid.name_, 0, 0, grid.heights_.size(), grid.widths_.size()}};
    return grid;
}

void LayoutGrid::set_widths(SizeVector widths)
{
    require(widths.size() == widths_.size(), "LayoutGrid::set_widths: column count changed");
    widths_ = std::move(widths);
}

void LayoutGrid::set_heights(SizeVector heights)
{
    require(heights.size() == heights_.size(), "LayoutGrid::set_heights: row count changed");
    heights_ = std::move(heights);
}

const LayoutGrid::Cell& LayoutGrid::cell(size_t row, size_t col) const
{
    require(row < rows() && col < cols(), "LayoutGrid::cell: index out of range");
    return cells_[index(row, col)];
}

void LayoutGrid::set_cell(size_t                    row,
                          size_t                    col,
                          std::unique_ptr<Drawable> drawable,
                          std::string               name)
{
    require(row < rows() && col < cols(), "LayoutGrid::set_cell: index out of range");
    auto& c    = cells_[index(row, col)];
    c.drawable = drawable ? std::move(drawable) : std::make_unique<NullDrawable>();
    c.name     = std::move(name);
}

std::optional<std::pair<size_t, size_t>> LayoutGrid::find(const std::string& cell_name) const
{
    for (size_t r = 0; r < rows(); ++r)
    {
        for (size_t c = 0; c < cols(); ++c)
        {
            if (cells_[index(r, c)].name == cell_name)
                return std::make_pair(r, c);
        }
    }
    return std::nullopt;
}

std::optional<GridBlock> LayoutGrid::block(const std::string& name) const
{
    auto it = std::find_if(blocks_.begin(),
                           blocks_.end(),
                           [&](const GridBlock& b) { return b.name == name; });
    if (it == blocks_.end())
        return std::nullopt;
    return *it;
}

// ─── Track insertion ────────────────────────────────────────────────────────

LayoutGrid& LayoutGrid::add_cols(const SizeVector& widths, std::optional<size_t> pos)
{
    const size_t p = pos.value_or(cols());
    const size_t k = widths.size();
    require(p <= cols(), "LayoutGrid::add_cols: position out of range");
    if (k == 0)
        return *this;

    const size_t      old_cols = cols();
    std::vector<Cell> cells;
    cells.reserve(rows() * (old_cols + k));
    for (size_t r = 0; r < rows(); ++r)
    {
        for (size_t c = 0; c <= old_cols; ++c)
        {
            if (c == p)
            {
                for (size_t i = 0; i < k; ++i)
                    cells.push_back(null_cell());
            }
            if (c < old_cols)
                cells.push_back(std::move(cells_[r * old_cols + c]));
        }
    }
    cells_ = std::move(cells);
    widths_.insert(widths_.begin() + static_cast<std::ptrdiff_t>(p), widths.begin(), widths.end());

    for (auto& b : blocks_)
    {
        if (b.left >= p)
            b.left += k;
        else if (p < b.left + b.cols)
            b.cols += k;
    }
    return *this;
}

LayoutGrid& LayoutGrid::add_rows(const SizeVector& heights, std::optional<size_t> pos)
{
    const size_t p = pos.value_or(rows());
    const size_t k = heights.size();
    require(p <= rows(), "LayoutGrid::add_rows: position out of range");
    if (k == 0)
        return *this;

    std::vector<Cell> inserted;
    inserted.reserve(k * cols());
    for (size_t i = 0; i < k * cols(); ++i)
        inserted.push_back(null_cell());
    cells_.insert(cells_.begin() + static_cast<std::ptrdiff_t>(p * cols()),
                  std::make_move_iterator(inserted.begin()),
                  std::make_move_iterator(inserted.end()));
    heights_.insert(
        heights_.begin() + static_cast<std::ptrdiff_t>(p), heights.begin(), heights.end());

    for (auto& b : blocks_)
    {
        if (b.top >= p)
            b.top += k;
        else if (p < b.top + b.rows)
            b.rows += k;
    }
    return *this;
}

LayoutGrid& LayoutGrid::add_col_space(SizeUnit width)
{
    const size_t old_cols = cols();
    if (old_cols < 2)
        return *this;

    const size_t new_cols = spaced_count(old_cols);
    std::vector<Cell> cells;
    cells.reserve(rows() * new_cols);
    for (size_t r = 0; r < rows(); ++r)
    {
        for (size_t c = 0; c < old_cols; ++c)
        {
            if (c > 0)
                cells.push_back(null_cell());
            cells.push_back(std::move(cells_[r * old_cols + c]));
        }
    }
    cells_ = std::move(cells);

    SizeVector widths;
    widths.reserve(new_cols);
    for (size_t c = 0; c < old_cols; ++c)
    {
        if (c > 0)
            widths.push_back(width);
        widths.push_back(widths_[c]);
    }
    widths_ = std::move(widths);

    for (auto& b : blocks_)
    {
        b.left = spaced_index(b.left);
        b.cols = spaced_count(b.cols);
    }
    return *this;
}

LayoutGrid& LayoutGrid::add_row_space(SizeUnit height)
{
    const size_t old_rows = rows();
    if (old_rows < 2)
        return *this;

    const size_t      n = cols();
    std::vector<Cell> cells;
    cells.reserve(spaced_count(old_rows) * n);
    for (size_t r = 0; r < old_rows; ++r)
    {
        if (r > 0)
        {
            for (size_t c = 0; c < n; ++c)
                cells.push_back(null_cell());
        }
        for (size_t c = 0; c < n; ++c)
            cells.push_back(std::move(cells_[r * n + c]));
    }
    cells_ = std::move(cells);

    SizeVector heights;
    heights.reserve(spaced_count(old_rows));
    for (size_t r = 0; r < old_rows; ++r)
    {
        if (r > 0)
            heights.push_back(height);
        heights.push_back(heights_[r]);
    }
    heights_ = std::move(heights);

    for (auto& b : blocks_)
    {
        b.top  = spaced_index(b.top);
        b.rows = spaced_count(b.rows);
    }
    return *this;
}

// ─── Binding ────────────────────────────────────────────────────────────────

SizeUnit LayoutGrid::merge_track(const SizeUnit& a, const SizeUnit& b)
{
    if (a.kind != b.kind)
        return a.is_absolute() ? a : b;
    return a.value >= b.value ? a : b;
}

LayoutGrid& LayoutGrid::cbind(LayoutGrid&& other)
{
    require(rows() == other.rows(), "LayoutGrid::cbind: row counts differ");

    const size_t      a = cols();
    const size_t      b = other.cols();
    std::vector<Cell> cells;
    cells.reserve(rows() * (a + b));
    for (size_t r = 0; r < rows(); ++r)
    {
        for (size_t c = 0; c < a; ++c)
            cells.push_back(std::move(cells_[r * a + c]));
        for (size_t c = 0; c < b; ++c)
            cells.push_back(std::move(other.cells_[r * b + c]));
    }
    cells_ = std::move(cells);

    widths_.insert(widths_.end(), other.widths_.begin(), other.widths_.end());
    for (size_t r = 0; r < heights_.size(); ++r)
        heights_[r] = merge_track(heights_[r], other.heights_[r]);

    for (auto blk : other.blocks_)
    {
        blk.left += a;
        blocks_.push_back(std::move(blk));
    }
    respect_ = respect_ || other.respect_;
    return *this;
}

LayoutGrid& LayoutGrid::rbind(LayoutGrid&& other, std::optional<size_t> pos)
{
    require(cols() == other.cols(), "LayoutGrid::rbind: column counts differ");

    const bool prepend = pos.has_value() && *pos == 0;
    for (size_t c = 0; c < widths_.size(); ++c)
        widths_[c] = merge_track(widths_[c], other.widths_[c]);

    if (prepend)
    {
        const size_t shift = other.rows();
        for (auto& blk : blocks_)
            blk.top += shift;
        other.cells_.insert(other.cells_.end(),
                            std::make_move_iterator(cells_.begin()),
                            std::make_move_iterator(cells_.end()));
        cells_ = std::move(other.cells_);
        other.heights_.insert(other.heights_.end(), heights_.begin(), heights_.end());
        heights_ = std::move(other.heights_);
        blocks_.insert(blocks_.begin(), other.blocks_.begin(), other.blocks_.end());
    }
    else
    {
        const size_t shift = rows();
        cells_.insert(cells_.end(),
                      std::make_move_iterator(other.cells_.begin()),
                      std::make_move_iterator(other.cells_.end()));
        heights_.insert(heights_.end(), other.heights_.begin(), other.heights_.end());
        for (auto blk : other.blocks_)
        {
            blk.top += shift;
            blocks_.push_back(std::move(blk));
        }
    }
    respect_ = respect_ || other.respect_;
    return *this;
}

}   // namespace trellis
