#include "CarveOps.h"

#include "maze/core/Errors.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <random>

namespace maze::gen::detail {

void check_inputs(int width, int height, Position start, Position end)
{
    if (width < 3 || height < 3)
    {
        spdlog::error("generate: {}x{} is below the 3x3 minimum", width, height);
        throw MazeGenerationError(fmt::format("maze must be at least 3x3 (got {}x{})", width, height));
    }

    if (!in_bounds(start.x, start.y, width, height) || !in_bounds(end.x, end.y, width, height))
    {
        spdlog::error("generate: terminals ({}, {}) / ({}, {}) outside {}x{}",
                      start.x, start.y, end.x, end.y, width, height);
        throw MazeGenerationError(fmt::format("start ({}, {}) or end ({}, {}) outside {}x{} grid",
                                              start.x, start.y, end.x, end.y, width, height));
    }
}

Grid make_walled_grid(int width, int height, Position start, Position end)
{
    Grid grid(width, height, CellKind::Wall);
    grid.set(start, CellKind::Start);
    grid.set(end, CellKind::End);
    return grid;
}

void carve_passage(Grid& grid, Position from, Position to)
{
    const Position wall{ (from.x + to.x) / 2, (from.y + to.y) / 2 };

    if (!is_terminal(grid.at(wall)))
        grid.set(wall, CellKind::Empty);
    if (!is_terminal(grid.at(to)))
        grid.set(to, CellKind::Empty);
}

void open_exit(Grid& grid, Position end, rng::Pcg32& rng)
{
    const bool left = rng.next_bounded(2) == 0;
    const Position target = left ? Position{ end.x - 1, end.y } : Position{ end.x, end.y - 1 };

    // The outer ring stays closed; only the 3x3 case ever lands on it.
    const bool interior = target.x > 0 && target.y > 0
                       && target.x < grid.width() - 1 && target.y < grid.height() - 1;

    if (interior && grid.at(target) == CellKind::Wall)
        grid.set(target, CellKind::Empty);
}

rng::Seed random_seed()
{
    std::random_device rd;
    return (static_cast<rng::Seed>(rd()) << 32) ^ static_cast<rng::Seed>(rd());
}

} // namespace maze::gen::detail
