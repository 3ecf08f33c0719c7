#pragma once
#include "maze/core/Errors.hpp"
#include "maze/generation/MazeGenerator.hpp"
#include "maze/pathfinding/Pathfinder.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace maze {

enum class MazeState : u8 {
    Unsolved, // fresh grid, no cached path
    Solved,   // cached path is valid for the current grid
};

// Forces an odd dimension so stride-2 carving leaves a closed outer ring.
[[nodiscard]] constexpr int normalize_dimension(int v) noexcept { return (v % 2 == 0) ? v + 1 : v; }

// Owns one grid and at most one cached solution.
//
// The constructor normalizes the dimensions, places the terminals at (1,1) and
// (width-2, height-2), and generates. solve() runs the pathfinder on demand.
// regenerate() replaces the grid and drops the cached path.
//
// MazeGenerationError / PathfindingError are raised only when a strategy itself
// throws; an unsolvable grid is reported as an empty optional.
class Maze {
public:
    Maze(int width, int height,
         std::unique_ptr<gen::IMazeGenerator> generator,
         std::unique_ptr<pf::IPathfinder> pathfinder);

    Maze(const Maze&) = delete;
    Maze& operator=(const Maze&) = delete;
    Maze(Maze&&) noexcept = default;
    Maze& operator=(Maze&&) noexcept = default;

    const std::optional<pf::Path>& solve();
    void regenerate();

    // Swapping the strategy invalidates the cached path.
    void set_pathfinder(std::unique_ptr<pf::IPathfinder> pathfinder);

    [[nodiscard]] const std::optional<pf::Path>& solution_path() const noexcept { return _solution; }
    [[nodiscard]] MazeState state() const noexcept { return _state; }
    [[nodiscard]] unsigned  generation() const noexcept { return _generation; }

    [[nodiscard]] int      width()  const noexcept { return _width; }
    [[nodiscard]] int      height() const noexcept { return _height; }
    [[nodiscard]] Position start()  const noexcept { return _start; }
    [[nodiscard]] Position end()    const noexcept { return _end; }
    [[nodiscard]] const Grid& grid() const noexcept { return _grid; }

    [[nodiscard]] const gen::IMazeGenerator& generator()  const noexcept { return *_generator; }
    [[nodiscard]] const pf::IPathfinder&     pathfinder() const noexcept { return *_pathfinder; }

    // Throws std::out_of_range outside the grid.
    [[nodiscard]] Cell cell(int x, int y) const;
    [[nodiscard]] bool is_valid_position(int x, int y) const noexcept { return in_bounds(x, y, _width, _height); }

    // In-bounds positions `distance` steps away along each axis.
    [[nodiscard]] std::vector<Position> neighbors(Position pos, int distance = 1) const;

private:
    void generate();

    int _width;
    int _height;
    Position _start;
    Position _end;
    std::unique_ptr<gen::IMazeGenerator> _generator;
    std::unique_ptr<pf::IPathfinder> _pathfinder;
    Grid _grid;
    std::optional<pf::Path> _solution;
    MazeState _state = MazeState::Unsolved;
    unsigned _generation = 0;
};

struct MazeStats {
    size_t total = 0;
    size_t walls = 0;
    size_t open  = 0;            // Empty + Start + End
    size_t solution_length = 0;  // 0 when unsolved
    double wall_percent = 0.0;
    double open_percent = 0.0;
    double path_efficiency = 0.0; // solution cells / open cells, in percent
};

[[nodiscard]] MazeStats compute_stats(const Maze& maze);

} // namespace maze
