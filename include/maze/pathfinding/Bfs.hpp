#pragma once
#include "Pathfinder.hpp"

namespace maze::pf {

// Level-order search; each frontier entry carries its own path prefix.
// Shortest on unit-cost grids.
class BfsPathfinder final : public IPathfinder {
public:
    [[nodiscard]] std::optional<Path> find_path(const Grid& grid, Position start, Position end) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "bfs"; }
};

} // namespace maze::pf
