#include "maze/pathfinding/Pathfinder.hpp"

#include "maze/pathfinding/AStar.hpp"
#include "maze/pathfinding/Bfs.hpp"
#include "maze/pathfinding/DeadEndFiller.hpp"

namespace maze::pf {

std::string_view pathfinder_kind_name(PathfinderKind k) noexcept
{
    switch (k) {
    case PathfinderKind::Bfs:           return "bfs";
    case PathfinderKind::AStar:         return "astar";
    case PathfinderKind::Dijkstra:      return "dijkstra";
    case PathfinderKind::DeadEndFiller: return "deadend";
    }
    return "bfs";
}

std::optional<PathfinderKind> parse_pathfinder_kind(std::string_view name) noexcept
{
    if (name == "bfs")      return PathfinderKind::Bfs;
    if (name == "astar")    return PathfinderKind::AStar;
    if (name == "dijkstra") return PathfinderKind::Dijkstra;
    if (name == "deadend")  return PathfinderKind::DeadEndFiller;
    return std::nullopt;
}

std::unique_ptr<IPathfinder> make_pathfinder(PathfinderKind kind)
{
    switch (kind) {
    case PathfinderKind::AStar:         return std::make_unique<AStarPathfinder>();
    case PathfinderKind::Dijkstra:      return std::make_unique<DijkstraPathfinder>();
    case PathfinderKind::DeadEndFiller: return std::make_unique<DeadEndFillerPathfinder>();
    case PathfinderKind::Bfs:
    default:                            return std::make_unique<BfsPathfinder>();
    }
}

namespace detail {

bool trivial_result(const Grid& grid, Position start, Position end, std::optional<Path>& out)
{
    out.reset();

    if (grid.empty())
        return true;
    if (!grid.contains(start) || !grid.contains(end))
        return true;

    if (start == end)
    {
        out = Path{ { start } };
        return true;
    }

    return !grid.passable(start) || !grid.passable(end);
}

} // namespace detail

} // namespace maze::pf
