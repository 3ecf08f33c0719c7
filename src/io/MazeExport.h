// src/io/MazeExport.h
//
// Text/JSON snapshots of a Maze and the terminal view used by maze_cli.
#pragma once

#include "maze/Maze.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace maze::io {

// "Maze WxH", "Start: (x, y)", "End: (x, y)", blank line, then the grid.
// Solution cells other than the terminals are drawn as '.' when requested.
std::string FormatMazeText(const Maze& maze, bool include_solution);

// solution_path is null when the maze has no cached solution.
nlohmann::json MazeToJson(const Maze& maze);

bool ExportMazeText(const Maze& maze, const std::filesystem::path& file, bool include_solution);
bool ExportMazeJson(const Maze& maze, const std::filesystem::path& file);

// ".json" (any case) selects JSON; everything else is text.
bool ExportMaze(const Maze& maze, const std::filesystem::path& file, bool include_solution);

// Two columns per cell so the maze keeps its aspect ratio in a terminal.
std::string RenderForTerminal(const Grid& grid, const std::optional<pf::Path>& path, bool use_unicode);

} // namespace maze::io
