#include <benchmark/benchmark.h>
#include <memory>
#include <string>
#include <trellis/facet.hpp>
#include <trellis/scales.hpp>
#include <vector>

#include "core/layout.hpp"
#include "util/fake_collaborators.hpp"

using namespace trellis;

// --- Helpers ---

// n records spread over `levels` values of "r" and of "c".
static DataFrame make_grid_data(std::size_t n, int levels)
{
    std::vector<Value> r, c, x, y;
    r.reserve(n);
    c.reserve(n);
    x.reserve(n);
    y.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        r.emplace_back("r" + std::to_string(static_cast<int>(i) % levels));
        c.emplace_back(static_cast<int>((i / 7) % static_cast<std::size_t>(levels)));
        x.emplace_back(static_cast<double>(i) * 0.01);
        y.emplace_back(static_cast<double>(i % 1000));
    }

    DataFrame df;
    df.add_column("r", std::move(r));
    df.add_column("c", std::move(c));
    df.add_column("x", std::move(x));
    df.add_column("y", std::move(y));
    return df;
}

static FacetOptions margins_free()
{
    FacetOptions opts;
    opts.margins = true;
    opts.scales  = ScaleMode::Free;
    opts.space   = SpaceMode::Free;
    return opts;
}

// --- Layout training ---

static void BM_BuildLayout(benchmark::State& state)
{
    const auto n    = static_cast<std::size_t>(state.range(0));
    auto       data = make_grid_data(n, 8);
    FacetSpec  spec({"r"}, {"c"}, margins_free());
    for (auto _ : state)
    {
        auto layout = build_layout(data, spec);
        benchmark::DoNotOptimize(layout);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_BuildLayout)->Arg(1'000)->Arg(100'000);

// --- Record mapping ---

static void BM_LocateRows(benchmark::State& state)
{
    const auto n      = static_cast<std::size_t>(state.range(0));
    auto       data   = make_grid_data(n, 8);
    auto       layout = build_layout(data, FacetSpec({"r"}, {"c"}, margins_free()));
    for (auto _ : state)
    {
        auto where = locate_rows(data, layout);
        benchmark::DoNotOptimize(where);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_LocateRows)->Arg(1'000)->Arg(100'000);

static void BM_TrainScales(benchmark::State& state)
{
    std::vector<DataFrame> layers = {make_grid_data(100'000, 8)};
    auto layout = build_layout(layers, FacetSpec({"r"}, {"c"}, margins_free()));
    for (auto _ : state)
    {
        auto ranges = train_scale_ranges(layout, layers);
        benchmark::DoNotOptimize(ranges);
    }
}
BENCHMARK(BM_TrainScales);

// --- Rendering ---

static void BM_RenderGrid(benchmark::State& state)
{
    const int              levels = static_cast<int>(state.range(0));
    std::vector<DataFrame> layers = {make_grid_data(10'000, levels)};
    FacetGrid              facet({"r"}, {"c"}, margins_free());
    auto                   layout = facet.train_layout(layers);
    auto                   scales = train_scale_ranges(layout, layers);
    test::FakeCoord        coord;
    test::FakeGraphics     gfx;
    FacetTheme             theme;

    for (auto _ : state)
    {
        auto grid  = facet.render(layout, scales, coord, gfx, theme, {});
        auto rects = compute_cell_rects(grid, 1920.0f, 1080.0f);
        benchmark::DoNotOptimize(rects);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(layout.panel_count()));
}
BENCHMARK(BM_RenderGrid)->Arg(2)->Arg(8)->Arg(24);

BENCHMARK_MAIN();
