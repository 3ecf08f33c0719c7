#pragma once
#include "maze/core/Rng.hpp"
#include "maze/grid/Grid.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace maze::gen {

// Default cap on call-stack depth for the recursive backtracker.
inline constexpr int kDefaultMaxRecursionDepth = 10000;

// Produces a fully carved grid. Width/height are expected to be odd already and
// start/end computed by the caller. Implementations own their RNG; they never
// keep a reference to a grid between calls.
class IMazeGenerator {
public:
    virtual ~IMazeGenerator() = default;

    // Throws MazeGenerationError if no grid can be produced.
    [[nodiscard]] virtual Grid generate(int width, int height, Position start, Position end) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    virtual void reseed(rng::Seed seed) = 0;
};

enum class GeneratorKind : u8 {
    Iterative,
    Recursive,
};

[[nodiscard]] std::string_view generator_kind_name(GeneratorKind k) noexcept;
[[nodiscard]] std::optional<GeneratorKind> parse_generator_kind(std::string_view name) noexcept;

// No seed -> seeded from std::random_device.
[[nodiscard]] std::unique_ptr<IMazeGenerator> make_generator(
    GeneratorKind kind,
    std::optional<rng::Seed> seed = std::nullopt,
    int max_recursion_depth = kDefaultMaxRecursionDepth);

} // namespace maze::gen
