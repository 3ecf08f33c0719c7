#include "maze/Maze.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace maze {

Maze::Maze(int width, int height,
           std::unique_ptr<gen::IMazeGenerator> generator,
           std::unique_ptr<pf::IPathfinder> pathfinder)
    : _width(normalize_dimension(width)),
      _height(normalize_dimension(height)),
      _start{ 1, 1 },
      _end{ _width - 2, _height - 2 },
      _generator(std::move(generator)),
      _pathfinder(std::move(pathfinder))
{
    if (!_generator || !_pathfinder)
        throw std::invalid_argument("Maze requires a generator and a pathfinder");

    generate();
}

void Maze::generate()
{
    try
    {
        _grid = _generator->generate(_width, _height, _start, _end);
    }
    catch (const MazeError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        spdlog::error("{} generator failed on {}x{}: {}", _generator->name(), _width, _height, e.what());
        throw MazeGenerationError(fmt::format("Failed to generate maze: {}", e.what()));
    }

    _solution.reset();
    _state = MazeState::Unsolved;
    ++_generation;

    spdlog::debug("generated {}x{} maze with {} generator (generation {})",
                  _width, _height, _generator->name(), _generation);
}

const std::optional<pf::Path>& Maze::solve()
{
    try
    {
        _solution = _pathfinder->find_path(_grid, _start, _end);
    }
    catch (const MazeError&)
    {
        _solution.reset();
        _state = MazeState::Unsolved;
        throw;
    }
    catch (const std::exception& e)
    {
        _solution.reset();
        _state = MazeState::Unsolved;
        spdlog::error("{} pathfinder failed on {}x{}: {}", _pathfinder->name(), _width, _height, e.what());
        throw PathfindingError(fmt::format("Failed to solve maze: {}", e.what()));
    }

    _state = _solution ? MazeState::Solved : MazeState::Unsolved;

    if (_solution)
        spdlog::debug("{} found a {}-cell path", _pathfinder->name(), _solution->length());
    else
        spdlog::info("{} found no path from ({}, {}) to ({}, {})",
                     _pathfinder->name(), _start.x, _start.y, _end.x, _end.y);

    return _solution;
}

void Maze::regenerate()
{
    generate();
}

void Maze::set_pathfinder(std::unique_ptr<pf::IPathfinder> pathfinder)
{
    if (!pathfinder)
        throw std::invalid_argument("set_pathfinder: null pathfinder");

    _pathfinder = std::move(pathfinder);
    _solution.reset();
    _state = MazeState::Unsolved;
}

Cell Maze::cell(int x, int y) const
{
    if (!is_valid_position(x, y))
        throw std::out_of_range(fmt::format("Invalid position: ({}, {})", x, y));
    return _grid.cell(x, y);
}

std::vector<Position> Maze::neighbors(Position pos, int distance) const
{
    std::vector<Position> out;
    out.reserve(4);
    for (int dir = 0; dir < 4; ++dir)
    {
        const int nx = pos.x + kDirX[dir] * distance;
        const int ny = pos.y + kDirY[dir] * distance;
        if (is_valid_position(nx, ny))
            out.push_back({ nx, ny });
    }
    return out;
}

MazeStats compute_stats(const Maze& maze)
{
    MazeStats s;
    const Grid& g = maze.grid();

    s.total = g.size();
    s.walls = g.count(CellKind::Wall);
    s.open  = g.count(CellKind::Empty) + g.count(CellKind::Start) + g.count(CellKind::End);

    if (s.total > 0)
    {
        s.wall_percent = 100.0 * static_cast<double>(s.walls) / static_cast<double>(s.total);
        s.open_percent = 100.0 * static_cast<double>(s.open) / static_cast<double>(s.total);
    }

    if (const auto& path = maze.solution_path(); path && s.open > 0)
    {
        s.solution_length = path->length();
        s.path_efficiency = 100.0 * static_cast<double>(s.solution_length) / static_cast<double>(s.open);
    }
    return s;
}

} // namespace maze
