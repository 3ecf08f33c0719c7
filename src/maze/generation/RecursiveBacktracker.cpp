#include "maze/generation/RecursiveBacktracker.hpp"

#include "CarveOps.h"
#include "maze/core/Errors.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <utility>

namespace maze::gen {

RecursiveBacktracker::RecursiveBacktracker(int max_depth)
    : _rng(detail::random_seed()), _maxDepth(max_depth) {}

RecursiveBacktracker::RecursiveBacktracker(rng::Seed seed, int max_depth)
    : _rng(seed), _maxDepth(max_depth) {}

Grid RecursiveBacktracker::generate(int width, int height, Position start, Position end)
{
    detail::check_inputs(width, height, start, end);

    const long long reachable = static_cast<long long>(width / 2) * static_cast<long long>(height / 2);
    if (reachable > _maxDepth)
    {
        spdlog::warn("recursive backtracker: {}x{} has {} cells but depth is capped at {}; "
                     "generation may fail, prefer the iterative generator",
                     width, height, reachable, _maxDepth);
    }

    Grid grid = detail::make_walled_grid(width, height, start, end);
    std::vector<u8> visited(grid.size(), 0);
    visited[to_id(start.x, start.y, width)] = 1;

    carve(grid, visited, start, 0);

    detail::open_exit(grid, end, _rng);

    spdlog::debug("recursive backtracker carved {}x{} ({} open cells)",
                  width, height, grid.size() - grid.count(CellKind::Wall));
    return grid;
}

void RecursiveBacktracker::carve(Grid& grid, std::vector<u8>& visited, Position at, int depth)
{
    if (depth > _maxDepth)
    {
        spdlog::error("recursive backtracker exceeded depth cap {}", _maxDepth);
        throw MazeGenerationError(fmt::format(
            "recursion depth cap {} exceeded while carving {}x{}; use the iterative generator",
            _maxDepth, grid.width(), grid.height()));
    }

    // Fisher-Yates over the four stride-2 directions
    std::array<int, 4> order{ 0, 1, 2, 3 };
    for (u32 i = 3; i > 0; --i)
        std::swap(order[i], order[_rng.next_bounded(i + 1)]);

    for (const int dir : order)
    {
        const Position next{ at.x + detail::kStrideX[dir], at.y + detail::kStrideY[dir] };
        if (!detail::in_carve_area(next.x, next.y, grid.width(), grid.height())) continue;

        const NodeId id = to_id(next.x, next.y, grid.width());
        if (visited[id]) continue; // may have been reached by a deeper call

        visited[id] = 1;
        detail::carve_passage(grid, at, next);
        carve(grid, visited, next, depth + 1);
    }
}

} // namespace maze::gen
