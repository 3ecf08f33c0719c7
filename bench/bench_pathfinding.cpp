#include <benchmark/benchmark.h>

#include "maze/generation/IterativeBacktracker.hpp"
#include "maze/generation/RecursiveBacktracker.hpp"
#include "maze/pathfinding/AStar.hpp"
#include "maze/pathfinding/Bfs.hpp"
#include "maze/pathfinding/DeadEndFiller.hpp"

#include <spdlog/spdlog.h>

using namespace maze;

static Grid make_maze(int side, rng::Seed seed = 1337) {
    gen::IterativeBacktracker g(seed);
    return g.generate(side, side, {1, 1}, {side - 2, side - 2});
}

template <class Solver>
static void bench_solve(benchmark::State& st) {
    const int side = static_cast<int>(st.range(0));
    const Grid grid = make_maze(side);
    Solver solver;
    for (auto _ : st) {
        auto path = solver.find_path(grid, {1, 1}, {side - 2, side - 2});
        benchmark::DoNotOptimize(path);
    }
}
BENCHMARK_TEMPLATE(bench_solve, pf::BfsPathfinder)->Arg(51)->Arg(101)->Arg(199);
BENCHMARK_TEMPLATE(bench_solve, pf::AStarPathfinder)->Arg(51)->Arg(101)->Arg(199);
BENCHMARK_TEMPLATE(bench_solve, pf::DijkstraPathfinder)->Arg(51)->Arg(101)->Arg(199);
BENCHMARK_TEMPLATE(bench_solve, pf::DeadEndFillerPathfinder)->Arg(51)->Arg(101)->Arg(199);

static void bench_generate_iterative(benchmark::State& st) {
    const int side = static_cast<int>(st.range(0));
    gen::IterativeBacktracker g(rng::Seed{7});
    for (auto _ : st) {
        Grid grid = g.generate(side, side, {1, 1}, {side - 2, side - 2});
        benchmark::DoNotOptimize(grid);
    }
}
BENCHMARK(bench_generate_iterative)->Arg(51)->Arg(101)->Arg(199);

static void bench_generate_recursive(benchmark::State& st) {
    const int side = static_cast<int>(st.range(0));
    gen::RecursiveBacktracker g(rng::Seed{7});
    for (auto _ : st) {
        Grid grid = g.generate(side, side, {1, 1}, {side - 2, side - 2});
        benchmark::DoNotOptimize(grid);
    }
}
BENCHMARK(bench_generate_recursive)->Arg(51)->Arg(101);

int main(int argc, char** argv) {
    // Generation/solve summaries are debug; keep warn noise out of timings.
    spdlog::set_level(spdlog::level::err);
    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv))
        return 1;
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
    return 0;
}
