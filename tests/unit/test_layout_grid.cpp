#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <trellis/layout_grid.hpp>

#include "util/fake_collaborators.hpp"

using namespace trellis;
using trellis::test::cell_label;
using trellis::test::FakeDrawable;

namespace
{

std::unique_ptr<Drawable> fake(const std::string& label)
{
    return std::make_unique<FakeDrawable>(label, Size2D{});
}

// rows x cols grid whose cells are labelled "<prefix><r><c>".
LayoutGrid labelled(const std::string& name, size_t rows, size_t cols, const std::string& prefix)
{
    LayoutGrid grid(name, rows, cols);
    for (size_t r = 0; r < rows; ++r)
        for (size_t c = 0; c < cols; ++c)
            grid.set_cell(r, c, fake(prefix + std::to_string(r) + std::to_string(c)), "");
    return grid;
}

}   // namespace

// ─── Construction ───────────────────────────────────────────────────────────

TEST(LayoutGrid, EmptyGridHoldsNullCells)
{
    LayoutGrid grid("g", 2, 3);
    EXPECT_EQ(grid.rows(), 2u);
    EXPECT_EQ(grid.cols(), 3u);
    EXPECT_EQ(grid.cell(1, 2).drawable->kind(), "null");
    EXPECT_EQ(grid.widths()[0], SizeUnit::relative(1.0f));
    ASSERT_EQ(grid.blocks().size(), 1u);
    EXPECT_EQ(grid.blocks()[0].name, "g");
}

TEST(LayoutGrid, MatrixFillsMissingDrawables)
{
    std::vector<LayoutGrid::Cell> cells;
    cells.push_back({fake("a"), "a"});
    cells.push_back({nullptr, "b"});
    auto grid = LayoutGrid::matrix("m",
                                   std::move(cells),
                                   {SizeUnit::relative(1.0f), SizeUnit::absolute(10.0f)},
                                   {SizeUnit::relative(2.0f)});

    EXPECT_EQ(cell_label(grid, 0, 0), "a");
    EXPECT_EQ(grid.cell(0, 1).drawable->kind(), "null");
    auto pos = grid.find("b");
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos->second, 1u);
}

TEST(LayoutGrid, MatrixRejectsWrongCellCount)
{
    auto build = []
    {
        std::vector<LayoutGrid::Cell> cells(3);
        return LayoutGrid::matrix(
            "m", std::move(cells), {SizeUnit{}, SizeUnit{}}, {SizeUnit{}, SizeUnit{}});
    };
#ifdef NDEBUG
    EXPECT_THROW(build(), std::logic_error);
#else
    EXPECT_DEATH_IF_SUPPORTED(build(), "");
#endif
}

TEST(LayoutGrid, SetTracksMustKeepCount)
{
    LayoutGrid grid("g", 1, 2);
    grid.set_widths({SizeUnit::absolute(5.0f), SizeUnit::relative(3.0f)});
    EXPECT_EQ(grid.widths()[0], SizeUnit::absolute(5.0f));
}

// ─── Spacing ────────────────────────────────────────────────────────────────

TEST(LayoutGrid, ColSpaceInterleavesSpacers)
{
    auto grid = labelled("g", 1, 3, "c");
    grid.add_col_space(SizeUnit::absolute(4.0f));

    ASSERT_EQ(grid.cols(), 5u);
    EXPECT_EQ(cell_label(grid, 0, 0), "c00");
    EXPECT_EQ(grid.cell(0, 1).drawable->kind(), "null");
    EXPECT_EQ(cell_label(grid, 0, 2), "c01");
    EXPECT_EQ(cell_label(grid, 0, 4), "c02");
    EXPECT_EQ(grid.widths()[1], SizeUnit::absolute(4.0f));
    EXPECT_EQ(grid.widths()[2], SizeUnit::relative(1.0f));
    EXPECT_EQ(grid.blocks()[0].cols, 5u);
}

TEST(LayoutGrid, RowSpaceInterleavesSpacers)
{
    auto grid = labelled("g", 2, 2, "c");
    grid.add_row_space(SizeUnit::absolute(4.0f));

    ASSERT_EQ(grid.rows(), 3u);
    EXPECT_EQ(cell_label(grid, 2, 1), "c11");
    EXPECT_EQ(grid.cell(1, 0).drawable->kind(), "null");
    EXPECT_EQ(grid.heights()[1], SizeUnit::absolute(4.0f));
}

TEST(LayoutGrid, SpacingSingleTrackIsNoop)
{
    LayoutGrid grid("g", 1, 1);
    grid.add_col_space(SizeUnit::absolute(4.0f)).add_row_space(SizeUnit::absolute(4.0f));
    EXPECT_EQ(grid.rows(), 1u);
    EXPECT_EQ(grid.cols(), 1u);
}

// ─── Track insertion ────────────────────────────────────────────────────────

TEST(LayoutGrid, AddColsAtFrontShiftsBlocks)
{
    auto grid = labelled("g", 2, 2, "c");
    grid.add_cols({SizeUnit::absolute(10.0f)}, 0);

    ASSERT_EQ(grid.cols(), 3u);
    EXPECT_EQ(cell_label(grid, 1, 1), "c10");
    EXPECT_EQ(grid.widths()[0], SizeUnit::absolute(10.0f));
    EXPECT_EQ(grid.block("g")->left, 1u);
}

TEST(LayoutGrid, AddRowsAppends)
{
    auto grid = labelled("g", 1, 2, "c");
    grid.add_rows({SizeUnit::absolute(3.0f), SizeUnit::absolute(4.0f)});

    ASSERT_EQ(grid.rows(), 3u);
    EXPECT_EQ(cell_label(grid, 0, 1), "c01");
    EXPECT_EQ(grid.heights()[2], SizeUnit::absolute(4.0f));
    EXPECT_EQ(grid.block("g")->rows, 1u);
}

// ─── Binding ────────────────────────────────────────────────────────────────

TEST(LayoutGrid, CbindKeepsBothBlocks)
{
    auto left  = labelled("left", 2, 1, "l");
    auto right = labelled("right", 2, 2, "r");
    left.cbind(std::move(right));

    ASSERT_EQ(left.cols(), 3u);
    EXPECT_EQ(cell_label(left, 1, 0), "l10");
    EXPECT_EQ(cell_label(left, 1, 2), "r11");
    auto blk = left.block("right");
    ASSERT_TRUE(blk.has_value());
    EXPECT_EQ(blk->left, 1u);
    EXPECT_EQ(blk->cols, 2u);
}

TEST(LayoutGrid, CbindMergesHeights)
{
    LayoutGrid a("a", 2, 1);
    LayoutGrid b("b", 2, 1);
    a.set_heights({SizeUnit::relative(2.0f), SizeUnit::relative(1.0f)});
    b.set_heights({SizeUnit::relative(1.0f), SizeUnit::absolute(12.0f)});
    a.cbind(std::move(b));

    EXPECT_EQ(a.heights()[0], SizeUnit::relative(2.0f));
    EXPECT_EQ(a.heights()[1], SizeUnit::absolute(12.0f));
}

TEST(LayoutGrid, RbindPrependAndAppend)
{
    auto centre = labelled("centre", 1, 2, "c");
    centre.rbind(labelled("top", 1, 2, "t"), 0).rbind(labelled("bottom", 1, 2, "b"));

    ASSERT_EQ(centre.rows(), 3u);
    EXPECT_EQ(cell_label(centre, 0, 0), "t00");
    EXPECT_EQ(cell_label(centre, 1, 0), "c00");
    EXPECT_EQ(cell_label(centre, 2, 1), "b01");
    EXPECT_EQ(centre.block("top")->top, 0u);
    EXPECT_EQ(centre.block("centre")->top, 1u);
    EXPECT_EQ(centre.block("bottom")->top, 2u);
}

TEST(LayoutGrid, BindPropagatesRespect)
{
    LayoutGrid a("a", 1, 1);
    LayoutGrid b("b", 1, 1);
    b.set_respect(true);
    a.cbind(std::move(b));
    EXPECT_TRUE(a.respect());
}

TEST(LayoutGrid, BindShapeMismatchThrows)
{
    LayoutGrid a("a", 1, 1);
#ifdef NDEBUG
    EXPECT_THROW(a.cbind(LayoutGrid("b", 2, 1)), std::logic_error);
    EXPECT_THROW(a.rbind(LayoutGrid("c", 1, 3)), std::logic_error);
#else
    EXPECT_DEATH_IF_SUPPORTED(a.cbind(LayoutGrid("b", 2, 1)), "");
#endif
}
