#pragma once
#include "maze/grid/Grid.hpp"
#include <algorithm>
#include <cstdlib>
#include <vector>

namespace maze::pf {

// Ordered start..end inclusive. "No path" is std::nullopt, never an empty Path.
struct Path {
    std::vector<Position> points;

    [[nodiscard]] bool   empty()  const noexcept { return points.empty(); }
    [[nodiscard]] size_t length() const noexcept { return points.size(); }
    [[nodiscard]] Position front() const { return points.front(); }
    [[nodiscard]] Position back()  const { return points.back(); }

    bool operator==(const Path&) const = default;
};

// Every step is one unit along one axis and every point is passable.
[[nodiscard]] inline bool is_valid_path(const Grid& grid, const Path& path) {
    if (path.empty()) return false;
    for (size_t i = 0; i < path.points.size(); ++i) {
        const Position p = path.points[i];
        if (!grid.passable(p)) return false;
        if (i == 0) continue;
        const Position q = path.points[i - 1];
        if (std::abs(p.x - q.x) + std::abs(p.y - q.y) != 1) return false;
    }
    return true;
}

// Walks parent links back from goal. parent[start] must be kInvalid.
inline Path reconstruct(NodeId goal, NodeId start, int w, const std::vector<NodeId>& parent) {
    Path out;
    if (goal == kInvalid) return out;
    NodeId cur = goal;
    while (cur != kInvalid) {
        out.points.push_back(from_id(cur, w));
        if (cur == start) break;
        cur = parent[cur];
    }
    std::reverse(out.points.begin(), out.points.end());
    return out;
}

} // namespace maze::pf
