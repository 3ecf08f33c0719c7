#include "maze/generation/IterativeBacktracker.hpp"

#include "CarveOps.h"

#include <spdlog/spdlog.h>

#include <array>
#include <vector>

namespace maze::gen {

IterativeBacktracker::IterativeBacktracker() : _rng(detail::random_seed()) {}

IterativeBacktracker::IterativeBacktracker(rng::Seed seed) : _rng(seed) {}

Grid IterativeBacktracker::generate(int width, int height, Position start, Position end)
{
    detail::check_inputs(width, height, start, end);

    Grid grid = detail::make_walled_grid(width, height, start, end);

    std::vector<u8> visited(grid.size(), 0);
    std::vector<Position> stack;
    stack.reserve(static_cast<size_t>((width / 2) * (height / 2)) + 1);

    visited[to_id(start.x, start.y, width)] = 1;
    stack.push_back(start);

    std::array<Position, 4> candidates{};

    while (!stack.empty())
    {
        const Position current = stack.back(); // peek

        int n = 0;
        for (int dir = 0; dir < 4; ++dir)
        {
            const int nx = current.x + detail::kStrideX[dir];
            const int ny = current.y + detail::kStrideY[dir];
            if (!detail::in_carve_area(nx, ny, width, height)) continue;
            if (visited[to_id(nx, ny, width)]) continue;
            candidates[static_cast<size_t>(n++)] = { nx, ny };
        }

        if (n == 0)
        {
            stack.pop_back(); // backtrack
            continue;
        }

        const Position next = candidates[_rng.next_bounded(static_cast<u32>(n))];
        detail::carve_passage(grid, current, next);
        visited[to_id(next.x, next.y, width)] = 1;
        stack.push_back(next);
    }

    detail::open_exit(grid, end, _rng);

    spdlog::debug("iterative backtracker carved {}x{} ({} open cells)",
                  width, height, grid.size() - grid.count(CellKind::Wall));
    return grid;
}

} // namespace maze::gen
