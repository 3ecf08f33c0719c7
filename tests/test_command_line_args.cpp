// tests/test_command_line_args.cpp
//
// Regression coverage for src/app/CommandLineArgs.{h,cpp}.
//
// Goals:
//   - Option names are case-insensitive, values keep their case
//   - Both "--opt value" and "--opt=value" are supported
//   - --size takes "W H" or "WxH"
//   - Unknown options and bad values are reported in a predictable order

#include <doctest/doctest.h>

#include "app/CommandLineArgs.h"

#include <initializer_list>
#include <string>
#include <vector>

namespace {

[[nodiscard]] maze::app::CommandLineArgs Parse(std::initializer_list<const char*> argv)
{
    std::vector<const char*> v(argv);
    return maze::app::ParseCommandLineArgs(static_cast<int>(v.size()), v.data());
}

} // namespace

TEST_CASE("CommandLineArgs parses basic flags (case-insensitive)")
{
    const auto args = Parse({ "maze_cli", "--NO-SOLVE", "--Unicode", "--STATS", "-v" });

    CHECK(args.noSolve);
    CHECK(args.unicode);
    CHECK(args.stats);
    CHECK(args.verbose);
    CHECK_FALSE(args.showHelp);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs: help aliases")
{
    CHECK(Parse({ "maze_cli", "--help" }).showHelp);
    CHECK(Parse({ "maze_cli", "-H" }).showHelp);
}

TEST_CASE("CommandLineArgs supports --opt value and --opt=value")
{
    const auto args = Parse({
        "maze_cli",
        "--width", "31",
        "--HEIGHT=15",
        "--generator", "Recursive",
        "--pathfinder=astar",
        "--seed", "12345678901",
        "--export", "Out/Maze.JSON",
        "--config=Custom.json",
        "--log-file", "logs/run.log",
    });

    REQUIRE(args.width.has_value());
    REQUIRE(args.height.has_value());
    CHECK(*args.width == 31);
    CHECK(*args.height == 15);
    CHECK(args.generator == std::optional<std::string>("Recursive"));
    CHECK(args.pathfinder == std::optional<std::string>("astar"));
    REQUIRE(args.seed.has_value());
    CHECK(*args.seed == 12345678901ull);
    CHECK(args.exportPath == std::optional<std::string>("Out/Maze.JSON"));
    CHECK(args.configPath == std::optional<std::string>("Custom.json"));
    CHECK(args.logFile == std::optional<std::string>("logs/run.log"));
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs: --size forms")
{
    CHECK(Parse({ "maze_cli", "--size", "21", "11" }).size == std::optional<std::string>("21 11"));
    CHECK(Parse({ "maze_cli", "--size", "21x11" }).size == std::optional<std::string>("21x11"));
    CHECK(Parse({ "maze_cli", "--size=41x31" }).size == std::optional<std::string>("41x31"));

    // A following option is not swallowed as the height.
    const auto args = Parse({ "maze_cli", "--size", "21", "--stats" });
    CHECK(args.size == std::optional<std::string>("21"));
    CHECK(args.stats);
}

TEST_CASE("CommandLineArgs: preset is passed through")
{
    const auto args = Parse({ "maze_cli", "--preset", "XL" });
    CHECK(args.preset == std::optional<std::string>("XL"));
}

TEST_CASE("CommandLineArgs collects unknown options and bad values in order")
{
    const auto args = Parse({
        "maze_cli",
        "--wat",
        "--width", "abc",
        "--seed=-5",
        "--export",
    });

    REQUIRE(args.unknown.size() == 4u);
    CHECK(args.unknown[0] == "--wat");
    CHECK(args.unknown[1] == "--width");
    CHECK(args.unknown[2] == "--seed=-5");
    CHECK(args.unknown[3] == "--export");
    CHECK_FALSE(args.width.has_value());
    CHECK_FALSE(args.seed.has_value());
}

TEST_CASE("CommandLineArgs: flags reject inline values")
{
    const auto args = Parse({ "maze_cli", "--stats=yes" });
    CHECK_FALSE(args.stats);
    REQUIRE(args.unknown.size() == 1u);
    CHECK(args.unknown[0] == "--stats=yes");
}

TEST_CASE("CommandLineArgs help text mentions every option")
{
    const std::string help = maze::app::BuildCommandLineHelpText();
    for (const char* opt : { "--size", "--width", "--height", "--preset", "--generator", "--pathfinder",
                             "--seed", "--export", "--no-solve", "--config", "--unicode", "--stats",
                             "--log-file", "--verbose", "--help" })
    {
        CAPTURE(opt);
        CHECK(help.find(opt) != std::string::npos);
    }
}

TEST_CASE("CommandLineArgs: --seed accepts the full 64-bit range")
{
    const auto above = Parse({ "maze_cli", "--seed", "9223372036854775809" });
    REQUIRE(above.seed.has_value());
    CHECK(*above.seed == 9223372036854775809ull);
    CHECK(above.unknown.empty());

    const auto top = Parse({ "maze_cli", "--seed=18446744073709551615" });
    REQUIRE(top.seed.has_value());
    CHECK(*top.seed == 18446744073709551615ull);

    const auto over = Parse({ "maze_cli", "--seed", "18446744073709551616" });
    CHECK_FALSE(over.seed.has_value());
    REQUIRE(over.unknown.size() == 1u);
    CHECK(over.unknown[0] == "--seed");
}

TEST_CASE("CommandLineArgs: oversized ints are rejected, not wrapped")
{
    const auto args = Parse({ "maze_cli", "--width", "99999999999999999999" });
    CHECK_FALSE(args.width.has_value());
    REQUIRE(args.unknown.size() == 1u);
    CHECK(args.unknown[0] == "--width");
}
