#pragma once
#include "Path.hpp"
#include <memory>
#include <optional>
#include <string_view>

namespace maze::pf {

// Stateless search over a grid's passable cells (4-connected, unit cost).
//
// Contract shared by every implementation:
//   - empty grid, or start/end outside it or on a wall -> std::nullopt
//   - start == end                                   -> { start }
//   - end unreachable                                -> std::nullopt
class IPathfinder {
public:
    virtual ~IPathfinder() = default;

    [[nodiscard]] virtual std::optional<Path> find_path(const Grid& grid, Position start, Position end) const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

enum class PathfinderKind : u8 {
    Bfs,
    AStar,
    Dijkstra,
    DeadEndFiller,
};

[[nodiscard]] std::string_view pathfinder_kind_name(PathfinderKind k) noexcept;
[[nodiscard]] std::optional<PathfinderKind> parse_pathfinder_kind(std::string_view name) noexcept;

[[nodiscard]] std::unique_ptr<IPathfinder> make_pathfinder(PathfinderKind kind);

namespace detail {

// Early-outs common to all strategies. Returns true when `out` holds the answer.
bool trivial_result(const Grid& grid, Position start, Position end, std::optional<Path>& out);

} // namespace detail

} // namespace maze::pf
