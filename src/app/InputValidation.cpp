#include "app/InputValidation.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>
#include <optional>
#include <vector>

namespace maze::app {

namespace {

struct Preset {
    std::string_view name;
    MazeSize size;
};

constexpr Preset kPresets[] = {
    { "xs", { 9, 9 } },
    { "s",  { 11, 11 } },
    { "m",  { 21, 11 } },
    { "l",  { 31, 21 } },
    { "xl", { 41, 31 } },
};

std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

std::string_view Trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
    return s;
}

std::optional<int> ToInt(std::string_view s)
{
    int v = 0;
    const auto* first = s.data();
    const auto* last = s.data() + s.size();
    if (!s.empty() && *first == '+')
        ++first;
    const auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{} || ptr != last || first == last)
        return std::nullopt;
    return v;
}

// Splits on runs of whitespace or a single 'x'.
std::vector<std::string_view> SplitDimensions(std::string_view s)
{
    std::vector<std::string_view> parts;
    std::size_t i = 0;
    while (i < s.size())
    {
        while (i < s.size() && (std::isspace(static_cast<unsigned char>(s[i])) || s[i] == 'x'))
            ++i;
        const std::size_t begin = i;
        while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i])) && s[i] != 'x')
            ++i;
        if (i > begin)
            parts.push_back(s.substr(begin, i - begin));
    }
    return parts;
}

} // namespace

MazeSize ValidateMazeSize(int width, int height, int max_area)
{
    if (width < kMinMazeSide || height < kMinMazeSide)
        throw ValidationError(fmt::format("Maze dimensions must be at least {}x{}", kMinMazeSide, kMinMazeSide));

    if (width > kMaxMazeSide || height > kMaxMazeSide)
        throw ValidationError(fmt::format("Maze dimensions cannot exceed {}x{}", kMaxMazeSide, kMaxMazeSide));

    const long long area = static_cast<long long>(width) * height;
    if (area > max_area)
        throw ValidationError(fmt::format("Maze area cannot exceed {} cells (current: {})", max_area, area));

    return { width, height };
}

MazeSize PresetSize(std::string_view name)
{
    const std::string key = ToLower(Trim(name));
    for (const Preset& p : kPresets)
        if (p.name == key)
            return p.size;
    throw ValidationError(fmt::format("Unknown preset '{}'. Available: xs, s, m, l, xl", key));
}

MazeSize ParseMazeSize(std::string_view text, int max_area)
{
    const std::string lowered = ToLower(Trim(text));
    if (lowered.empty())
        throw ValidationError("Input cannot be empty");

    for (const Preset& p : kPresets)
        if (p.name == lowered)
            return p.size;

    const std::vector<std::string_view> parts = SplitDimensions(lowered);
    if (parts.size() != 2)
        throw ValidationError("Custom dimensions must be in format 'width height' (e.g., '21 11')");

    const auto w = ToInt(parts[0]);
    const auto h = ToInt(parts[1]);
    if (!w || !h)
        throw ValidationError("Width and height must be integers");

    return ValidateMazeSize(*w, *h, max_area);
}

std::string MatchAlgorithm(std::string_view input, std::span<const std::string_view> candidates)
{
    const std::string key = ToLower(Trim(input));
    if (key.empty())
        throw ValidationError("Algorithm choice cannot be empty");

    for (std::string_view c : candidates)
        if (ToLower(c) == key)
            return std::string(c);

    std::vector<std::string_view> matches;
    for (std::string_view c : candidates)
        if (ToLower(c).starts_with(key))
            matches.push_back(c);

    if (matches.size() == 1)
        return std::string(matches.front());

    if (matches.size() > 1)
        throw ValidationError(fmt::format("Ambiguous choice '{}'. Could be: {}", key, fmt::join(matches, ", ")));

    throw ValidationError(fmt::format("Unknown algorithm '{}'. Available: {}", key, fmt::join(candidates, ", ")));
}

bool WarnIfLargeMaze(MazeSize size, int warn_area)
{
    const long long area = static_cast<long long>(size.width) * size.height;
    if (area <= warn_area)
        return false;
    spdlog::warn("Large maze ({}x{}, {} cells); generation and solving may be slow",
                 size.width, size.height, area);
    return true;
}

} // namespace maze::app
