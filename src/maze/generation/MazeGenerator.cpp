#include "maze/generation/MazeGenerator.hpp"

#include "maze/generation/IterativeBacktracker.hpp"
#include "maze/generation/RecursiveBacktracker.hpp"

namespace maze::gen {

std::string_view generator_kind_name(GeneratorKind k) noexcept
{
    switch (k) {
    case GeneratorKind::Iterative: return "iterative";
    case GeneratorKind::Recursive: return "recursive";
    }
    return "iterative";
}

std::optional<GeneratorKind> parse_generator_kind(std::string_view name) noexcept
{
    if (name == "iterative") return GeneratorKind::Iterative;
    if (name == "recursive") return GeneratorKind::Recursive;
    return std::nullopt;
}

std::unique_ptr<IMazeGenerator> make_generator(GeneratorKind kind,
                                               std::optional<rng::Seed> seed,
                                               int max_recursion_depth)
{
    switch (kind) {
    case GeneratorKind::Recursive:
        if (seed)
            return std::make_unique<RecursiveBacktracker>(*seed, max_recursion_depth);
        return std::make_unique<RecursiveBacktracker>(max_recursion_depth);
    case GeneratorKind::Iterative:
    default:
        if (seed)
            return std::make_unique<IterativeBacktracker>(*seed);
        return std::make_unique<IterativeBacktracker>();
    }
}

} // namespace maze::gen
