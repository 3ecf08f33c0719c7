#pragma once
#include "MazeGenerator.hpp"

namespace maze::gen {

// Randomized depth-first carving on the native call stack.
//
// Depth is bounded by `max_depth`; a maze whose carving would go deeper raises
// MazeGenerationError instead of returning a truncated grid. The deepest
// possible walk visits every odd/odd cell once, so mazes with more than
// max_depth such cells are at risk. Prefer IterativeBacktracker for those.
class RecursiveBacktracker final : public IMazeGenerator {
public:
    explicit RecursiveBacktracker(int max_depth = kDefaultMaxRecursionDepth);
    RecursiveBacktracker(rng::Seed seed, int max_depth = kDefaultMaxRecursionDepth);

    [[nodiscard]] Grid generate(int width, int height, Position start, Position end) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "recursive"; }
    void reseed(rng::Seed seed) override { _rng.seed(seed); }

    [[nodiscard]] int max_depth() const noexcept { return _maxDepth; }

private:
    void carve(Grid& grid, std::vector<u8>& visited, Position at, int depth);

    rng::Pcg32 _rng;
    int _maxDepth;
};

} // namespace maze::gen
