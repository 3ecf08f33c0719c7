#pragma once
#include "GridTypes.hpp"
#include <algorithm>
#include <span>
#include <vector>

namespace maze {

// Rectangular cell grid stored row-major, indexed y*width+x.
// Callers bounds-check before at()/set(); passable() is the checked query.
class Grid {
public:
    Grid() = default;
    Grid(int w, int h, CellKind fill = CellKind::Wall)
        : _w(w > 0 && h > 0 ? w : 0),
          _h(w > 0 && h > 0 ? h : 0),
          _cells(static_cast<size_t>(_w) * static_cast<size_t>(_h), fill) {}

    [[nodiscard]] int  width()  const noexcept { return _w; }
    [[nodiscard]] int  height() const noexcept { return _h; }
    [[nodiscard]] bool empty()  const noexcept { return _cells.empty(); }
    [[nodiscard]] size_t size() const noexcept { return _cells.size(); }

    [[nodiscard]] bool contains(int x, int y) const noexcept { return in_bounds(x, y, _w, _h); }
    [[nodiscard]] bool contains(Position p) const noexcept { return contains(p.x, p.y); }

    [[nodiscard]] CellKind at(int x, int y) const { return _cells[to_id(x, y, _w)]; }
    [[nodiscard]] CellKind at(Position p) const { return at(p.x, p.y); }
    void set(int x, int y, CellKind k) { _cells[to_id(x, y, _w)] = k; }
    void set(Position p, CellKind k) { set(p.x, p.y, k); }

    [[nodiscard]] Cell cell(int x, int y) const { return { Position{x, y}, at(x, y) }; }

    [[nodiscard]] bool passable(int x, int y) const {
        return contains(x, y) && is_passable(_cells[to_id(x, y, _w)]);
    }
    [[nodiscard]] bool passable(Position p) const { return passable(p.x, p.y); }

    // Read-only row view for renderers and exporters.
    [[nodiscard]] std::span<const CellKind> row(int y) const {
        return { _cells.data() + static_cast<size_t>(y) * static_cast<size_t>(_w), static_cast<size_t>(_w) };
    }

    [[nodiscard]] const std::vector<CellKind>& cells() const noexcept { return _cells; }

    [[nodiscard]] size_t count(CellKind k) const {
        return static_cast<size_t>(std::count(_cells.begin(), _cells.end(), k));
    }

    [[nodiscard]] int passable_neighbor_count(int x, int y) const {
        int n = 0;
        for (int dir = 0; dir < 4; ++dir)
            if (passable(x + kDirX[dir], y + kDirY[dir])) ++n;
        return n;
    }

    bool operator==(const Grid&) const = default;

private:
    int _w = 0;
    int _h = 0;
    std::vector<CellKind> _cells;
};

} // namespace maze
