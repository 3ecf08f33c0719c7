#include "maze/pathfinding/AStar.hpp"

#include "maze/pathfinding/Heuristic.hpp"

#include <limits>
#include <queue>
#include <vector>

namespace maze::pf {

std::optional<Path> best_first_search(const Grid& grid, Position start, Position end,
                                      HeuristicFn h, SearchStats* stats)
{
    SearchStats local;
    SearchStats& st = stats ? *stats : local;
    st = {};

    std::optional<Path> early;
    if (detail::trivial_result(grid, start, end, early))
        return early;

    const int w = grid.width();
    const NodeId sid = to_id(start.x, start.y, w);
    const NodeId gid = to_id(end.x, end.y, w);

    constexpr int kUnseen = std::numeric_limits<int>::max();
    std::vector<int>    g(grid.size(), kUnseen);
    std::vector<NodeId> parent(grid.size(), kInvalid);
    std::vector<u8>     state(grid.size(), 0); // 0=unseen,1=open,2=closed

    // Lower f first; on equal f the earlier insertion wins.
    struct QN {
        int f; u32 order; NodeId id;
        bool operator<(const QN& o) const { return f != o.f ? f > o.f : order > o.order; }
    };
    std::priority_queue<QN> open;
    u32 counter = 0;

    g[sid] = 0;
    open.push({ h(start, end), counter++, sid });
    state[sid] = 1;
    ++st.pushed;

    while (!open.empty()) {
        const QN top = open.top(); open.pop();
        const NodeId cur = top.id;
        if (state[cur] == 2) continue; // skip stale
        state[cur] = 2;
        ++st.expanded;
        if (cur == gid) return reconstruct(gid, sid, w, parent);

        const auto C = from_id(cur, w);

        for (int dir = 0; dir < 4; ++dir) {
            const int nx = C.x + kDirX[dir], ny = C.y + kDirY[dir];
            if (!grid.passable(nx, ny)) continue;

            const NodeId nid = to_id(nx, ny, w);
            if (state[nid] == 2) continue;

            const int g_new = g[cur] + 1;

            if (state[nid] != 1 || g_new < g[nid]) {
                if (state[nid] == 1) ++st.reopened;
                g[nid] = g_new;
                parent[nid] = cur;
                open.push({ g_new + h(Position{ nx, ny }, end), counter++, nid });
                state[nid] = 1;
                ++st.pushed;
            }
        }
    }
    return std::nullopt; // no path
}

std::optional<Path> AStarPathfinder::find_path(const Grid& grid, Position start, Position end) const
{
    return best_first_search(grid, start, end, &manhattan);
}

std::optional<Path> DijkstraPathfinder::find_path(const Grid& grid, Position start, Position end) const
{
    return best_first_search(grid, start, end, &zero_heuristic);
}

} // namespace maze::pf
