#include "maze/pathfinding/DeadEndFiller.hpp"

#include "maze/pathfinding/Bfs.hpp"

#include <spdlog/spdlog.h>

#include <deque>
#include <vector>

namespace maze::pf {

namespace {

// Survivors must be one chain hanging between the terminals: no junctions,
// terminals with at most one exit, every survivor reachable from start.
bool is_single_corridor(const Grid& g, Position start, Position end)
{
    size_t corridor = 0;
    for (int y = 0; y < g.height(); ++y)
    {
        for (int x = 0; x < g.width(); ++x)
        {
            const CellKind k = g.at(x, y);
            if (!is_passable(k)) continue;

            const int degree = g.passable_neighbor_count(x, y);
            const bool terminal = Position{ x, y } == start || Position{ x, y } == end;
            if (terminal ? degree > 1 : degree > 2)
                return false;
            if (!terminal)
                ++corridor;
        }
    }

    if (!g.passable(start))
        return corridor == 0;

    std::vector<u8> seen(g.size(), 0);
    std::deque<Position> q{ start };
    seen[to_id(start.x, start.y, g.width())] = 1;
    size_t reached = 0;

    while (!q.empty())
    {
        const Position p = q.front();
        q.pop_front();
        if (p != start && p != end) ++reached;

        for (int dir = 0; dir < 4; ++dir)
        {
            const int nx = p.x + kDirX[dir], ny = p.y + kDirY[dir];
            if (!g.passable(nx, ny)) continue;
            const NodeId id = to_id(nx, ny, g.width());
            if (seen[id]) continue;
            seen[id] = 1;
            q.push_back({ nx, ny });
        }
    }
    return reached == corridor;
}

} // namespace

FillResult fill_dead_ends(const Grid& grid, Position start, Position end)
{
    FillResult out;
    out.simplified = grid; // private working copy

    Grid& g = out.simplified;
    if (g.empty())
        return out;

    bool changed = true;
    while (changed)
    {
        changed = false;
        ++out.passes;

        for (int y = 0; y < g.height(); ++y)
        {
            for (int x = 0; x < g.width(); ++x)
            {
                const CellKind k = g.at(x, y);
                if (k != CellKind::Empty && k != CellKind::Path) continue;

                const Position p{ x, y };
                if (p == start || p == end) continue;

                if (g.passable_neighbor_count(x, y) <= 1)
                {
                    g.set(x, y, CellKind::Wall);
                    ++out.filled;
                    changed = true;
                }
            }
        }
    }

    for (int y = 0; y < g.height(); ++y)
        for (int x = 0; x < g.width(); ++x)
            if (g.at(x, y) == CellKind::Empty && Position{ x, y } != start && Position{ x, y } != end)
                g.set(x, y, CellKind::Path);

    out.tree_corridor = is_single_corridor(g, start, end);
    if (!out.tree_corridor)
    {
        spdlog::warn("dead-end filling left a corridor with loops or detached parts "
                     "({}x{}); input is not a perfect maze", g.width(), g.height());
    }

    spdlog::debug("dead-end filling: {} cells filled in {} passes", out.filled, out.passes);
    return out;
}

std::optional<Path> DeadEndFillerPathfinder::find_path(const Grid& grid, Position start, Position end) const
{
    std::optional<Path> early;
    if (detail::trivial_result(grid, start, end, early))
        return early;

    const FillResult filled = fill_dead_ends(grid, start, end);
    return BfsPathfinder{}.find_path(filled.simplified, start, end);
}

} // namespace maze::pf
