#pragma once

#include "maze/core/Errors.hpp"

#include <span>
#include <string>
#include <string_view>

namespace maze::app {

// User-facing input problem (bad size, unknown algorithm, ...).
class ValidationError : public MazeError {
public:
    explicit ValidationError(const std::string& what) : MazeError(what) {}
};

inline constexpr int kMinMazeSide = 3;
inline constexpr int kMaxMazeSide = 200;
inline constexpr int kMaxMazeArea = 40000;
inline constexpr int kLargeMazeArea = 10000;

struct MazeSize {
    int width = 0;
    int height = 0;
    bool operator==(const MazeSize&) const = default;
};

inline constexpr std::string_view kGeneratorNames[] = { "iterative", "recursive" };
inline constexpr std::string_view kPathfinderNames[] = { "bfs", "astar", "dijkstra", "deadend" };

// Throws ValidationError outside 3..200 per side or above `max_area` cells.
MazeSize ValidateMazeSize(int width, int height, int max_area = kMaxMazeArea);

// Accepts a preset name ("xs".."xl") or "W H" / "WxH"; validated.
MazeSize ParseMazeSize(std::string_view text, int max_area = kMaxMazeArea);

// xs 9x9, s 11x11, m 21x11, l 31x21, xl 41x31. Throws on anything else.
MazeSize PresetSize(std::string_view name);

// Case-insensitive exact match, else a unique prefix. Returns the candidate
// as spelled in `candidates`.
std::string MatchAlgorithm(std::string_view input, std::span<const std::string_view> candidates);

// Logs a warning and returns true above `warn_area` cells.
bool WarnIfLargeMaze(MazeSize size, int warn_area = kLargeMazeArea);

} // namespace maze::app
