#pragma once
#include "MazeGenerator.hpp"

namespace maze::gen {

// Randomized depth-first carving driven by an explicit frontier stack.
// Memory grows with the maze, never with the call stack, so any size works.
class IterativeBacktracker final : public IMazeGenerator {
public:
    IterativeBacktracker();
    explicit IterativeBacktracker(rng::Seed seed);

    [[nodiscard]] Grid generate(int width, int height, Position start, Position end) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "iterative"; }
    void reseed(rng::Seed seed) override { _rng.seed(seed); }

private:
    rng::Pcg32 _rng;
};

} // namespace maze::gen
