// tests/test_core_config.cpp
//
// Regression/robustness tests for src/core/Config.{h,cpp}.
//
// Goals:
//   - Saving creates the directory and writes JSON
//   - Loading round-trips values
//   - Wrong types and garbage do not throw; defaults survive

#include <doctest/doctest.h>

#include "core/Config.h"
#include "io/AtomicFile.h"
#include "test_support/maze_fixtures.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using maze::core::Config;

TEST_CASE("core::SaveConfig writes JSON and core::LoadConfig round-trips values")
{
    const fs::path file = maze::test::make_unique_temp_dir("maze_config_tests") / "nested" / "maze_config.json";

    Config cfg;
    cfg.generation.defaultAlgorithm = "recursive";
    cfg.generation.maxRecursionDepth = 5000;
    cfg.generation.defaultWidth = 31;
    cfg.generation.defaultHeight = 15;
    cfg.pathfinding.defaultAlgorithm = "astar";
    cfg.pathfinding.showStatistics = false;
    cfg.exporting.defaultFormat = "json";
    cfg.exporting.includeSolution = false;
    cfg.exporting.defaultDirectory = "out";
    cfg.visualization.useUnicode = true;
    cfg.performance.warnLargeMaze = 900;
    cfg.performance.maxMazeArea = 1000;

    REQUIRE(maze::core::SaveConfig(cfg, file));
    CHECK(fs::exists(file));

    Config loaded;
    REQUIRE(maze::core::LoadConfig(loaded, file));

    CHECK(loaded.generation.defaultAlgorithm == "recursive");
    CHECK(loaded.generation.maxRecursionDepth == 5000);
    CHECK(loaded.generation.defaultWidth == 31);
    CHECK(loaded.generation.defaultHeight == 15);
    CHECK(loaded.pathfinding.defaultAlgorithm == "astar");
    CHECK_FALSE(loaded.pathfinding.showStatistics);
    CHECK(loaded.exporting.defaultFormat == "json");
    CHECK_FALSE(loaded.exporting.includeSolution);
    CHECK(loaded.exporting.defaultDirectory == "out");
    CHECK(loaded.visualization.useUnicode);
    CHECK(loaded.performance.warnLargeMaze == 900);
    CHECK(loaded.performance.maxMazeArea == 1000);
}

TEST_CASE("core::SaveConfig uses the documented key layout")
{
    const fs::path file = maze::test::make_unique_temp_dir("maze_config_tests") / "maze_config.json";
    REQUIRE(maze::core::SaveConfig(Config{}, file));

    std::string text;
    REQUIRE(maze::io::read_all(file, text));
    const auto j = nlohmann::json::parse(text);

    CHECK(j.at("generation").at("default_algorithm") == "iterative");
    CHECK(j.at("generation").at("max_recursion_depth") == 10000);
    CHECK(j.at("generation").at("default_size") == nlohmann::json::array({ 21, 21 }));
    CHECK(j.at("pathfinding").at("default_algorithm") == "bfs");
    CHECK(j.at("export").at("default_format") == "txt");
    CHECK(j.at("visualization").at("use_unicode") == false);
    CHECK(j.at("performance").at("max_maze_area") == 40000);
}

TEST_CASE("core::LoadConfig returns false for a missing file and keeps values")
{
    const fs::path file = maze::test::make_unique_temp_dir("maze_config_tests") / "missing.json";

    Config cfg;
    cfg.generation.defaultWidth = 13;
    CHECK_FALSE(maze::core::LoadConfig(cfg, file));
    CHECK(cfg.generation.defaultWidth == 13);
}

TEST_CASE("core::LoadConfig does not throw on garbage")
{
    const fs::path file = maze::test::make_unique_temp_dir("maze_config_tests") / "garbage.json";
    REQUIRE(maze::io::write_atomic(file, "{ this is not json"));

    Config cfg;
    bool ok = true;
    CHECK_NOTHROW(ok = maze::core::LoadConfig(cfg, file));
    CHECK_FALSE(ok);
    CHECK(cfg.generation.defaultAlgorithm == "iterative");
}

TEST_CASE("core::LoadConfig skips wrongly typed keys and accepts comments")
{
    const fs::path file = maze::test::make_unique_temp_dir("maze_config_tests") / "partial.json";
    REQUIRE(maze::io::write_atomic(file, R"({
        // hand-edited
        "generation": { "max_recursion_depth": "deep", "default_size": [41] , "default_algorithm": "recursive" },
        "pathfinding": { "show_statistics": 1 },
        "performance": { "warn_large_maze": 2000 }
    })"));

    Config cfg;
    REQUIRE(maze::core::LoadConfig(cfg, file));
    CHECK(cfg.generation.defaultAlgorithm == "recursive");
    CHECK(cfg.generation.maxRecursionDepth == 10000);
    CHECK(cfg.generation.defaultWidth == 21);
    CHECK(cfg.pathfinding.showStatistics);
    CHECK(cfg.performance.warnLargeMaze == 2000);
}

TEST_CASE("core::LoadConfig skips integers that do not fit in an int")
{
    const fs::path file = maze::test::make_unique_temp_dir("maze_config_tests") / "huge.json";
    REQUIRE(maze::io::write_atomic(file, R"({
        "generation": { "max_recursion_depth": 4294977296, "default_size": [31, 18446744073709551615] },
        "performance": { "warn_large_maze": -9223372036854775808, "max_maze_area": 30000 }
    })"));

    Config cfg;
    REQUIRE(maze::core::LoadConfig(cfg, file));
    CHECK(cfg.generation.maxRecursionDepth == 10000);
    CHECK(cfg.generation.defaultWidth == 21);
    CHECK(cfg.generation.defaultHeight == 21);
    CHECK(cfg.performance.warnLargeMaze == Config{}.performance.warnLargeMaze);
    CHECK(cfg.performance.maxMazeArea == 30000);
}

TEST_CASE("core::ValidateConfig accepts defaults and reports every problem")
{
    std::vector<std::string> errors;
    CHECK(maze::core::ValidateConfig(Config{}, errors));
    CHECK(errors.empty());

    Config bad;
    bad.generation.defaultAlgorithm = "kruskal";
    bad.generation.maxRecursionDepth = 10;
    bad.generation.defaultWidth = 2;
    bad.pathfinding.defaultAlgorithm = "jps";
    bad.exporting.defaultFormat = "png";
    bad.performance.warnLargeMaze = 50000;

    CHECK_FALSE(maze::core::ValidateConfig(bad, errors));
    CHECK(errors.size() == 6u);
}
