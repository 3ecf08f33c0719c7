#pragma once
#include "Pathfinder.hpp"

namespace maze::pf {

struct SearchStats {
    u32 expanded = 0;  // nodes closed
    u32 pushed   = 0;  // open-list insertions, stale ones included
    u32 reopened = 0;  // nodes whose g improved while still open
};

// Best-first search ordered by g + h(n, goal). Equal f values pop in insertion
// order. h == 0 turns it into Dijkstra.
using HeuristicFn = int (*)(Position, Position);

std::optional<Path> best_first_search(const Grid& grid, Position start, Position end,
                                      HeuristicFn h, SearchStats* stats = nullptr);

// A* with the Manhattan heuristic.
class AStarPathfinder final : public IPathfinder {
public:
    [[nodiscard]] std::optional<Path> find_path(const Grid& grid, Position start, Position end) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "astar"; }
};

// Same search as A* with h = 0; path length must match A* on any maze.
class DijkstraPathfinder final : public IPathfinder {
public:
    [[nodiscard]] std::optional<Path> find_path(const Grid& grid, Position start, Position end) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "dijkstra"; }
};

} // namespace maze::pf
