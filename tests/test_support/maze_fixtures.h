// tests/test_support/maze_fixtures.h
//
// Small helpers shared by the maze test suites.
#pragma once

#include "maze/grid/Grid.hpp"

#include <chrono>
#include <filesystem>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace maze::test {

namespace fs = std::filesystem;

// Fresh directory under the system temp dir (falls back to ".").
inline fs::path make_unique_temp_dir(std::string_view prefix)
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    static int counter = 0;
    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / (std::string(prefix) + "_" + std::to_string(stamp) + "_" + std::to_string(++counter));
    fs::create_directories(dir, ec);
    if (ec)
        return base;

    return dir;
}

// Rows use the export alphabet: '#', ' ', 'S', 'E', '.'.
inline Grid grid_from_rows(std::initializer_list<std::string_view> rows)
{
    const int h = static_cast<int>(rows.size());
    const int w = h > 0 ? static_cast<int>(rows.begin()->size()) : 0;
    Grid g(w, h, CellKind::Wall);

    int y = 0;
    for (std::string_view row : rows)
    {
        if (static_cast<int>(row.size()) != w)
            throw std::invalid_argument("grid_from_rows: ragged rows");
        for (int x = 0; x < w; ++x)
        {
            const auto k = cell_kind_from_char(row[static_cast<size_t>(x)]);
            if (!k)
                throw std::invalid_argument("grid_from_rows: unknown cell character");
            g.set(x, y, *k);
        }
        ++y;
    }
    return g;
}

inline size_t count_passable(const Grid& g)
{
    return g.size() - g.count(CellKind::Wall);
}

// Undirected passable-passable adjacencies.
inline size_t count_edges(const Grid& g)
{
    size_t edges = 0;
    for (int y = 0; y < g.height(); ++y)
        for (int x = 0; x < g.width(); ++x)
        {
            if (!g.passable(x, y)) continue;
            if (g.passable(x + 1, y)) ++edges;
            if (g.passable(x, y + 1)) ++edges;
        }
    return edges;
}

} // namespace maze::test
