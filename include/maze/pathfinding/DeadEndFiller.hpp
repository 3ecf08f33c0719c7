#pragma once
#include "Pathfinder.hpp"

namespace maze::pf {

struct FillResult {
    Grid simplified;           // dead ends walled, surviving corridor marked Path
    int  filled = 0;           // cells converted to Wall
    int  passes = 0;           // full scans until the fixed point
    bool tree_corridor = true; // false: survivors do not form a single chain
};

// Repeatedly walls every non-terminal passable cell with at most one passable
// neighbour until a scan changes nothing. On a perfect maze only the
// start..end corridor survives. Works on a copy; `grid` is never touched.
//
// Defined for perfect (tree) mazes. Other inputs are reported through
// `tree_corridor` and a warning log; the result is still usable for search.
[[nodiscard]] FillResult fill_dead_ends(const Grid& grid, Position start, Position end);

// Fills dead ends, then runs BFS over the pruned copy.
class DeadEndFillerPathfinder final : public IPathfinder {
public:
    [[nodiscard]] std::optional<Path> find_path(const Grid& grid, Position start, Position end) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "deadend"; }
};

} // namespace maze::pf
