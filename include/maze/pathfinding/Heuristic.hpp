#pragma once
#include "maze/grid/GridTypes.hpp"
#include <cstdlib>

namespace maze::pf {

// Manhattan distance: admissible/consistent for 4-dir unit-cost grids
[[nodiscard]] inline int manhattan(Position a, Position b) noexcept {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

[[nodiscard]] inline int zero_heuristic(Position, Position) noexcept { return 0; }

} // namespace maze::pf
