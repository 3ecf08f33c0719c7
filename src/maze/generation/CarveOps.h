// Shared carving steps for the backtracking generators.
#pragma once
#include "maze/core/Rng.hpp"
#include "maze/grid/Grid.hpp"

namespace maze::gen::detail {

// Stride-2 moves: right, down, left, up.
inline constexpr int kStrideX[4] = { 2, 0, -2,  0 };
inline constexpr int kStrideY[4] = { 0, 2,  0, -2 };

// Carve targets stay off the outer ring, so even sizes keep a closed border.
[[nodiscard]] constexpr bool in_carve_area(int x, int y, int width, int height) noexcept {
    return x > 0 && y > 0 && x < width - 1 && y < height - 1;
}

// Throws MazeGenerationError when the grid cannot hold both terminals.
void check_inputs(int width, int height, Position start, Position end);

// All walls, with the terminals marked. end wins if it coincides with start.
[[nodiscard]] Grid make_walled_grid(int width, int height, Position start, Position end);

// Opens the wall halfway between `from` and `to`, then `to` itself.
// Terminal cells keep their kind.
void carve_passage(Grid& grid, Position from, Position to);

// Unconditional exit step: one draw picks the left or top neighbour of `end`
// and clears it if it is an interior wall.
void open_exit(Grid& grid, Position end, rng::Pcg32& rng);

[[nodiscard]] rng::Seed random_seed();

} // namespace maze::gen::detail
