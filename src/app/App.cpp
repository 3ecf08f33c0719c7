#include "app/App.h"

#include "core/Log.h"
#include "io/MazeExport.h"
#include "maze/Maze.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <ostream>
#include <string>
#include <vector>

namespace maze::app {

namespace {

std::filesystem::path ResolveExportPath(const std::string& raw, const core::Config& cfg)
{
    std::filesystem::path p(raw);
    if (!p.has_extension())
        p.replace_extension(cfg.exporting.defaultFormat == "json" ? ".json" : ".txt");
    if (!p.has_parent_path() && !cfg.exporting.defaultDirectory.empty())
        p = std::filesystem::path(cfg.exporting.defaultDirectory) / p;
    return p;
}

void PrintStats(const Maze& maze, std::ostream& out)
{
    const MazeStats s = compute_stats(maze);
    out << fmt::format("Size:          {}x{} ({} cells)\n", maze.width(), maze.height(), s.total);
    out << fmt::format("Walls:         {} ({:.1f}%)\n", s.walls, s.wall_percent);
    out << fmt::format("Open:          {} ({:.1f}%)\n", s.open, s.open_percent);
    out << fmt::format("Generator:     {}\n", maze.generator().name());
    out << fmt::format("Pathfinder:    {}\n", maze.pathfinder().name());
    if (maze.state() == MazeState::Solved)
    {
        out << fmt::format("Solution:      {} cells\n", s.solution_length);
        out << fmt::format("Efficiency:    {:.1f}%\n", s.path_efficiency);
    }
}

core::Config LoadAndValidateConfig(const CommandLineArgs& args)
{
    core::Config cfg;
    const std::filesystem::path file = args.configPath ? std::filesystem::path(*args.configPath)
                                                       : std::filesystem::path(core::kDefaultConfigFile);
    if (!core::LoadConfig(cfg, file) && args.configPath)
        spdlog::warn("Config {} could not be loaded; using defaults", file.string());

    std::vector<std::string> errors;
    if (!core::ValidateConfig(cfg, errors))
    {
        spdlog::warn("Configuration has {} problem(s); using defaults", errors.size());
        cfg = core::Config{};
    }
    return cfg;
}

int Run(const CommandLineArgs& args, std::ostream& out)
{
    const core::Config cfg = LoadAndValidateConfig(args);

    RunPlan plan;
    try
    {
        plan = ResolveRunPlan(args, cfg);
    }
    catch (const ValidationError& e)
    {
        spdlog::error("Validation error: {}", e.what());
        out << "Validation Error: " << e.what() << '\n';
        return kExitUsage;
    }

    WarnIfLargeMaze(plan.size, cfg.performance.warnLargeMaze);

    out << fmt::format("Generating {}x{} maze ({})...\n", plan.size.width, plan.size.height,
                       gen::generator_kind_name(plan.generator));

    std::optional<Maze> maze;
    try
    {
        maze.emplace(plan.size.width, plan.size.height,
                     gen::make_generator(plan.generator, plan.seed, plan.maxRecursionDepth),
                     pf::make_pathfinder(plan.pathfinder));
    }
    catch (const MazeGenerationError& e)
    {
        out << "Generation Error: " << e.what() << '\n';
        return kExitGeneration;
    }

    if (plan.solve)
    {
        try
        {
            maze->solve();
        }
        catch (const PathfindingError& e)
        {
            out << "Pathfinding Error: " << e.what() << '\n';
            return kExitPathfinding;
        }
    }

    out << io::RenderForTerminal(maze->grid(), maze->solution_path(), plan.unicode);

    if (plan.solve)
    {
        if (const auto& path = maze->solution_path())
            out << fmt::format("Solution found: {} cells ({})\n", path->length(), maze->pathfinder().name());
        else
            out << "No solution found!\n";
    }

    if (plan.stats)
        PrintStats(*maze, out);

    if (plan.exportPath)
    {
        if (!io::ExportMaze(*maze, *plan.exportPath, plan.includeSolution))
        {
            out << "Export failed: " << plan.exportPath->string() << '\n';
            return kExitExport;
        }
        out << "Exported to " << plan.exportPath->string() << '\n';
    }

    return kExitOk;
}

} // namespace

RunPlan ResolveRunPlan(const CommandLineArgs& args, const core::Config& cfg)
{
    RunPlan plan;

    const int maxArea = cfg.performance.maxMazeArea;
    if (args.preset)
        plan.size = PresetSize(*args.preset);
    else if (args.size)
        plan.size = ParseMazeSize(*args.size, maxArea);
    else
        plan.size = ValidateMazeSize(args.width.value_or(cfg.generation.defaultWidth),
                                     args.height.value_or(cfg.generation.defaultHeight), maxArea);

    const std::string generator = MatchAlgorithm(args.generator.value_or(cfg.generation.defaultAlgorithm),
                                                 kGeneratorNames);
    const std::string pathfinder = MatchAlgorithm(args.pathfinder.value_or(cfg.pathfinding.defaultAlgorithm),
                                                  kPathfinderNames);

    // Candidates come from the same tables the parsers use.
    plan.generator = gen::parse_generator_kind(generator).value_or(gen::GeneratorKind::Iterative);
    plan.pathfinder = pf::parse_pathfinder_kind(pathfinder).value_or(pf::PathfinderKind::Bfs);

    plan.seed = args.seed;
    plan.maxRecursionDepth = cfg.generation.maxRecursionDepth;
    plan.solve = !args.noSolve;
    plan.unicode = args.unicode || cfg.visualization.useUnicode;
    plan.stats = args.stats || (plan.solve && cfg.pathfinding.showStatistics);

    if (args.exportPath)
        plan.exportPath = ResolveExportPath(*args.exportPath, cfg);
    plan.includeSolution = plan.solve && cfg.exporting.includeSolution;

    return plan;
}

int RunApp(const CommandLineArgs& args, std::ostream& out)
{
    if (args.showHelp)
    {
        out << BuildCommandLineHelpText();
        return kExitOk;
    }

    if (!args.unknown.empty())
    {
        for (const std::string& u : args.unknown)
            out << "Unknown or malformed option: " << u << '\n';
        out << '\n' << BuildCommandLineHelpText();
        return kExitUsage;
    }

    logsys::LogOptions logOptions;
    logOptions.level = args.verbose ? spdlog::level::debug : spdlog::level::info;
    logOptions.file = std::filesystem::path(args.logFile ? *args.logFile : logsys::kDefaultLogFile);
    logsys::Init(logOptions);

    const int rc = Run(args, out);

    logsys::Shutdown();
    return rc;
}

} // namespace maze::app
