#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace maze::app {

// Parsed command-line arguments for maze_cli.
//
// Notes:
//   - Option names are case-insensitive; values (file names) keep their case.
//   - Both "--flag=value" and "--flag value" forms are supported.
//   - Nothing here is validated beyond "is it an integer"; ranges and names
//     are checked by InputValidation.
struct CommandLineArgs
{
    bool showHelp = false;   // --help / -h
    bool noSolve = false;    // --no-solve
    bool unicode = false;    // --unicode
    bool stats = false;      // --stats
    bool verbose = false;    // --verbose / -v

    std::optional<std::string> size;   // --size W H | --size=WxH (raw, parsed later)
    std::optional<int> width;          // --width <cells>
    std::optional<int> height;         // --height <cells>
    std::optional<std::string> preset; // --preset xs|s|m|l|xl

    std::optional<std::string> generator;  // --generator <name|prefix>
    std::optional<std::string> pathfinder; // --pathfinder <name|prefix>
    std::optional<std::uint64_t> seed;     // --seed <n>

    std::optional<std::string> exportPath; // --export <file>
    std::optional<std::string> configPath; // --config <file>
    std::optional<std::string> logFile;    // --log-file <file>

    // Unknown or malformed args, verbatim (so we can show a useful error).
    std::vector<std::string> unknown;
};

// `args` excludes the program name.
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(const std::vector<std::string>& args);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace maze::app
