#pragma once

#include "app/CommandLineArgs.h"
#include "app/InputValidation.h"
#include "core/Config.h"

#include "maze/core/Rng.hpp"
#include "maze/generation/MazeGenerator.hpp"
#include "maze/pathfinding/Pathfinder.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>

namespace maze::app {

// Process exit codes for maze_cli.
enum ExitCode : int {
    kExitOk = 0,
    kExitUsage = 2,      // unknown options / validation failure
    kExitGeneration = 3,
    kExitPathfinding = 4,
    kExitExport = 5,
};

// Everything one generate/solve/export cycle needs, after merging the
// command line over the loaded configuration.
struct RunPlan {
    MazeSize size;
    gen::GeneratorKind generator = gen::GeneratorKind::Iterative;
    pf::PathfinderKind pathfinder = pf::PathfinderKind::Bfs;
    std::optional<rng::Seed> seed;
    int maxRecursionDepth = 10000;

    bool solve = true;
    bool unicode = false;
    bool stats = false;

    std::optional<std::filesystem::path> exportPath;
    bool includeSolution = true;
};

// Size precedence: --preset, then --size, then --width/--height, then the
// configured default. Throws ValidationError.
RunPlan ResolveRunPlan(const CommandLineArgs& args, const core::Config& cfg);

// Runs one cycle, printing the maze to `out`. Owns logging setup/teardown.
int RunApp(const CommandLineArgs& args, std::ostream& out);

} // namespace maze::app
