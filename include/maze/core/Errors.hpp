#pragma once
#include <stdexcept>
#include <string>

namespace maze {

// -------- Error types --------------------------------------------------------
//
// "No path" is never an error: pathfinders return an empty optional for it.
// These are raised only when a strategy could not run at all.

class MazeError : public std::runtime_error {
public:
    explicit MazeError(const std::string& what) : std::runtime_error(what) {}
};

class MazeGenerationError : public MazeError {
public:
    explicit MazeGenerationError(const std::string& what) : MazeError(what) {}
};

class PathfindingError : public MazeError {
public:
    explicit PathfindingError(const std::string& what) : MazeError(what) {}
};

} // namespace maze
