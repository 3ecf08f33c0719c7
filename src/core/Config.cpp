#include "Config.h"

#include "io/AtomicFile.h"
#include "maze/generation/MazeGenerator.hpp"
#include "maze/pathfinding/Pathfinder.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <system_error>

namespace maze::core {

namespace {

constexpr int kConfigSchemaVersion = 1;

const nlohmann::json* FindObject(const nlohmann::json& j, const char* key)
{
    if (auto it = j.find(key); it != j.end() && it->is_object())
        return &*it;
    return nullptr;
}

// Integers outside int's range are skipped like wrongly typed values.
std::optional<int> AsInt(const nlohmann::json& v)
{
    if (v.is_number_unsigned())
    {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            return std::nullopt;
        return static_cast<int>(u);
    }
    if (!v.is_number_integer())
        return std::nullopt;
    const auto i = v.get<std::int64_t>();
    if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max())
        return std::nullopt;
    return static_cast<int>(i);
}

void ReadInt(const nlohmann::json& section, const char* key, int& dst)
{
    auto it = section.find(key);
    if (it == section.end())
        return;
    if (const auto v = AsInt(*it))
        dst = *v;
    else if (it->is_number_integer())
        spdlog::warn("config: {} = {} is out of range; ignored", key, it->dump());
}

void ReadBool(const nlohmann::json& section, const char* key, bool& dst)
{
    if (auto it = section.find(key); it != section.end() && it->is_boolean())
        dst = it->get<bool>();
}

void ReadString(const nlohmann::json& section, const char* key, std::string& dst)
{
    if (auto it = section.find(key); it != section.end() && it->is_string())
        dst = it->get<std::string>();
}

// [width, height]
void ReadSize(const nlohmann::json& section, const char* key, int& w, int& h)
{
    auto it = section.find(key);
    if (it == section.end() || !it->is_array() || it->size() != 2)
        return;
    const auto pw = AsInt((*it)[0]);
    const auto ph = AsInt((*it)[1]);
    if (!pw || !ph)
        return;
    w = *pw;
    h = *ph;
}

} // namespace

bool LoadConfig(Config& cfg, const std::filesystem::path& file)
{
    std::string text;
    std::string err;
    if (!io::read_all(file, text, &err))
    {
        // Missing config is normal on first run; don't spam logs.
        std::error_code ec;
        if (std::filesystem::exists(file, ec))
            spdlog::warn("LoadConfig: failed to read {} ({})", file.string(), err);
        return false;
    }

    // Allow // comments and avoid exceptions.
    const nlohmann::json j = nlohmann::json::parse(text, nullptr, false, /*ignore_comments*/ true);
    if (j.is_discarded() || !j.is_object())
    {
        spdlog::warn("LoadConfig: {} is not a JSON object; using defaults", file.string());
        return false;
    }

    Config tmp = cfg;

    if (const auto* s = FindObject(j, "generation"))
    {
        ReadString(*s, "default_algorithm", tmp.generation.defaultAlgorithm);
        ReadInt(*s, "max_recursion_depth", tmp.generation.maxRecursionDepth);
        ReadSize(*s, "default_size", tmp.generation.defaultWidth, tmp.generation.defaultHeight);
    }

    if (const auto* s = FindObject(j, "pathfinding"))
    {
        ReadString(*s, "default_algorithm", tmp.pathfinding.defaultAlgorithm);
        ReadBool(*s, "show_statistics", tmp.pathfinding.showStatistics);
    }

    if (const auto* s = FindObject(j, "export"))
    {
        ReadString(*s, "default_format", tmp.exporting.defaultFormat);
        ReadBool(*s, "include_solution", tmp.exporting.includeSolution);
        ReadString(*s, "default_directory", tmp.exporting.defaultDirectory);
    }

    if (const auto* s = FindObject(j, "visualization"))
        ReadBool(*s, "use_unicode", tmp.visualization.useUnicode);

    if (const auto* s = FindObject(j, "performance"))
    {
        ReadInt(*s, "warn_large_maze", tmp.performance.warnLargeMaze);
        ReadInt(*s, "max_maze_area", tmp.performance.maxMazeArea);
    }

    cfg = tmp;
    spdlog::info("Configuration loaded from {}", file.string());
    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& file)
{
    nlohmann::json j;
    j["version"] = kConfigSchemaVersion;
    j["generation"] = {
        {"default_algorithm", cfg.generation.defaultAlgorithm},
        {"max_recursion_depth", cfg.generation.maxRecursionDepth},
        {"default_size", {cfg.generation.defaultWidth, cfg.generation.defaultHeight}},
    };
    j["pathfinding"] = {
        {"default_algorithm", cfg.pathfinding.defaultAlgorithm},
        {"show_statistics", cfg.pathfinding.showStatistics},
    };
    j["export"] = {
        {"default_format", cfg.exporting.defaultFormat},
        {"include_solution", cfg.exporting.includeSolution},
        {"default_directory", cfg.exporting.defaultDirectory},
    };
    j["visualization"] = {
        {"use_unicode", cfg.visualization.useUnicode},
    };
    j["performance"] = {
        {"warn_large_maze", cfg.performance.warnLargeMaze},
        {"max_maze_area", cfg.performance.maxMazeArea},
    };

    std::string payload = j.dump(2);
    payload.push_back('\n');

    std::string err;
    if (!io::write_atomic(file, payload, &err))
    {
        spdlog::error("SaveConfig: {}", err);
        return false;
    }
    return true;
}

bool ValidateConfig(const Config& cfg, std::vector<std::string>& errors)
{
    const size_t before = errors.size();

    if (!gen::parse_generator_kind(cfg.generation.defaultAlgorithm))
        errors.push_back("Invalid generation.default_algorithm: " + cfg.generation.defaultAlgorithm);

    if (cfg.generation.maxRecursionDepth < 1000)
        errors.push_back("Invalid max_recursion_depth: " + std::to_string(cfg.generation.maxRecursionDepth));

    if (cfg.generation.defaultWidth < 3 || cfg.generation.defaultHeight < 3)
        errors.push_back("Invalid default_size: " + std::to_string(cfg.generation.defaultWidth) + "x" +
                         std::to_string(cfg.generation.defaultHeight));

    if (!pf::parse_pathfinder_kind(cfg.pathfinding.defaultAlgorithm))
        errors.push_back("Invalid pathfinding.default_algorithm: " + cfg.pathfinding.defaultAlgorithm);

    if (cfg.exporting.defaultFormat != "txt" && cfg.exporting.defaultFormat != "json")
        errors.push_back("Invalid export.default_format: " + cfg.exporting.defaultFormat);

    if (cfg.performance.warnLargeMaze >= cfg.performance.maxMazeArea)
        errors.push_back("warn_large_maze should be less than max_maze_area");

    for (size_t i = before; i < errors.size(); ++i)
        spdlog::warn("config: {}", errors[i]);

    return errors.size() == before;
}

} // namespace maze::core
