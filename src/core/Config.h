#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace maze::core {

// Defaults used when maze_config.json is missing or a key is absent/invalid.
struct Config {
    struct Generation {
        std::string defaultAlgorithm = "iterative";
        int maxRecursionDepth = 10000;
        int defaultWidth  = 21;
        int defaultHeight = 21;
    } generation;

    struct Pathfinding {
        std::string defaultAlgorithm = "bfs";
        bool showStatistics = true;
    } pathfinding;

    struct Export {
        std::string defaultFormat = "txt"; // "txt" | "json"
        bool includeSolution = true;
        std::string defaultDirectory = "exports";
    } exporting;

    struct Visualization {
        bool useUnicode = false;
    } visualization;

    struct Performance {
        int warnLargeMaze = 10000; // cells
        int maxMazeArea   = 40000; // cells
    } performance;
};

inline constexpr const char* kDefaultConfigFile = "maze_config.json";

// Missing or unparsable file: returns false and leaves `cfg` untouched.
// Individual keys with the wrong type are skipped; the rest still apply.
bool LoadConfig(Config& cfg, const std::filesystem::path& file);
bool SaveConfig(const Config& cfg, const std::filesystem::path& file);

// Appends one message per problem. Returns errors.empty() for this call.
bool ValidateConfig(const Config& cfg, std::vector<std::string>& errors);

} // namespace maze::core
