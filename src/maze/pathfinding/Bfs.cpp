#include "maze/pathfinding/Bfs.hpp"

#include <algorithm>
#include <deque>
#include <vector>

namespace maze::pf {

namespace {

// One link of a path prefix. Frontier entries point at the last link of their
// own prefix; prefixes that share a head share the links.
struct TrailLink {
    NodeId node;
    u32    prev;
};

constexpr u32 kNoLink = kInvalid;

Path unwind(const std::vector<TrailLink>& trail, u32 link, int w)
{
    Path out;
    for (u32 cur = link; cur != kNoLink; cur = trail[cur].prev)
        out.points.push_back(from_id(trail[cur].node, w));
    std::reverse(out.points.begin(), out.points.end());
    return out;
}

} // namespace

std::optional<Path> BfsPathfinder::find_path(const Grid& grid, Position start, Position end) const
{
    std::optional<Path> early;
    if (detail::trivial_result(grid, start, end, early))
        return early;

    const int w = grid.width();
    const NodeId sid = to_id(start.x, start.y, w);
    const NodeId gid = to_id(end.x, end.y, w);

    std::vector<u8> visited(grid.size(), 0);
    std::vector<TrailLink> trail;
    trail.reserve(grid.size() / 2);

    struct Entry { NodeId node; u32 link; };
    std::deque<Entry> queue;

    trail.push_back({ sid, kNoLink });
    queue.push_back({ sid, 0 });
    visited[sid] = 1;

    while (!queue.empty())
    {
        const Entry cur = queue.front();
        queue.pop_front();

        if (cur.node == gid)
            return unwind(trail, cur.link, w);

        const Position C = from_id(cur.node, w);
        for (int dir = 0; dir < 4; ++dir)
        {
            const int nx = C.x + kDirX[dir], ny = C.y + kDirY[dir];
            if (!grid.passable(nx, ny)) continue;

            const NodeId nid = to_id(nx, ny, w);
            if (visited[nid]) continue;

            visited[nid] = 1;
            trail.push_back({ nid, cur.link });
            queue.push_back({ nid, static_cast<u32>(trail.size() - 1) });
        }
    }
    return std::nullopt; // exhausted without reaching end
}

} // namespace maze::pf
