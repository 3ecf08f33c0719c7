#include "MazeExport.h"

#include "AtomicFile.h"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

namespace maze::io {

namespace {

// Per-cell overlay of the solution; terminals keep their own glyph.
std::vector<u8> SolutionMask(const Grid& grid, const std::optional<pf::Path>& path)
{
    std::vector<u8> mask(grid.size(), 0);
    if (!path)
        return mask;
    for (const Position& p : path->points)
    {
        if (!grid.contains(p) || is_terminal(grid.at(p)))
            continue;
        mask[to_id(p.x, p.y, grid.width())] = 1;
    }
    return mask;
}

bool HasJsonExtension(const std::filesystem::path& file)
{
    std::string ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".json";
}

} // namespace

std::string FormatMazeText(const Maze& maze, bool include_solution)
{
    const Grid& g = maze.grid();
    std::string out = fmt::format("Maze {}x{}\nStart: ({}, {})\nEnd: ({}, {})\n\n",
                                  maze.width(), maze.height(),
                                  maze.start().x, maze.start().y,
                                  maze.end().x, maze.end().y);

    const std::vector<u8> mask =
        SolutionMask(g, include_solution ? maze.solution_path() : std::optional<pf::Path>{});

    out.reserve(out.size() + g.size() + static_cast<size_t>(g.height()));
    for (int y = 0; y < g.height(); ++y)
    {
        for (int x = 0; x < g.width(); ++x)
            out.push_back(mask[to_id(x, y, g.width())] ? cell_kind_char(CellKind::Path)
                                                       : cell_kind_char(g.at(x, y)));
        out.push_back('\n');
    }
    return out;
}

nlohmann::json MazeToJson(const Maze& maze)
{
    const Grid& g = maze.grid();

    nlohmann::json rows = nlohmann::json::array();
    for (int y = 0; y < g.height(); ++y)
    {
        nlohmann::json row = nlohmann::json::array();
        for (CellKind k : g.row(y))
            row.push_back(std::string(1, cell_kind_char(k)));
        rows.push_back(std::move(row));
    }

    nlohmann::json j;
    j["width"] = maze.width();
    j["height"] = maze.height();
    j["start_position"] = { {"x", maze.start().x}, {"y", maze.start().y} };
    j["end_position"] = { {"x", maze.end().x}, {"y", maze.end().y} };
    j["grid"] = std::move(rows);

    if (const auto& path = maze.solution_path())
    {
        nlohmann::json pts = nlohmann::json::array();
        for (const Position& p : path->points)
            pts.push_back({ {"x", p.x}, {"y", p.y} });
        j["solution_path"] = std::move(pts);
    }
    else
    {
        j["solution_path"] = nullptr;
    }
    return j;
}

bool ExportMazeText(const Maze& maze, const std::filesystem::path& file, bool include_solution)
{
    std::string err;
    if (!write_atomic(file, FormatMazeText(maze, include_solution), &err))
    {
        spdlog::error("ExportMazeText: {}", err);
        return false;
    }
    spdlog::info("Maze exported to {}", file.string());
    return true;
}

bool ExportMazeJson(const Maze& maze, const std::filesystem::path& file)
{
    std::string payload = MazeToJson(maze).dump(2);
    payload.push_back('\n');

    std::string err;
    if (!write_atomic(file, payload, &err))
    {
        spdlog::error("ExportMazeJson: {}", err);
        return false;
    }
    spdlog::info("Maze exported to {}", file.string());
    return true;
}

bool ExportMaze(const Maze& maze, const std::filesystem::path& file, bool include_solution)
{
    if (HasJsonExtension(file))
        return ExportMazeJson(maze, file);
    return ExportMazeText(maze, file, include_solution);
}

std::string RenderForTerminal(const Grid& grid, const std::optional<pf::Path>& path, bool use_unicode)
{
    const char* wall   = use_unicode ? "██" : "##";
    const char* marker = use_unicode ? "● " : ". ";

    const std::vector<u8> mask = SolutionMask(grid, path);

    std::string out;
    for (int y = 0; y < grid.height(); ++y)
    {
        for (int x = 0; x < grid.width(); ++x)
        {
            if (mask[to_id(x, y, grid.width())])
            {
                out += marker;
                continue;
            }
            switch (grid.at(x, y))
            {
            case CellKind::Wall:  out += wall; break;
            case CellKind::Start: out += "S "; break;
            case CellKind::End:   out += "E "; break;
            case CellKind::Path:  out += marker; break;
            case CellKind::Empty: out += "  "; break;
            }
        }
        out.push_back('\n');
    }
    return out;
}

} // namespace maze::io
