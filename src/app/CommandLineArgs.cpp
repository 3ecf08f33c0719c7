#include "app/CommandLineArgs.h"

#include <cctype>
#include <charconv>
#include <limits>
#include <string_view>
#include <system_error>
#include <utility>

namespace maze::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

// Splits "--opt=value" into name and value; the name is lowered.
struct SplitArg
{
    std::string name;
    std::optional<std::string_view> value;
};

[[nodiscard]] SplitArg Split(std::string_view raw)
{
    SplitArg out;
    const std::size_t eq = raw.find('=');
    if (raw.size() > 2 && raw.substr(0, 2) == "--" && eq != std::string_view::npos)
    {
        out.name = ToLower(raw.substr(0, eq));
        out.value = raw.substr(eq + 1);
    }
    else
    {
        out.name = ToLower(raw);
    }
    return out;
}

[[nodiscard]] std::optional<long long> ParseDigits(std::string_view s, long long limit)
{
    if (s.empty())
        return std::nullopt;

    int sign = 1;
    std::size_t i = 0;
    if (s[0] == '+') {
        i = 1;
    } else if (s[0] == '-') {
        sign = -1;
        i = 1;
    }
    if (i == s.size())
        return std::nullopt;

    long long v = 0;
    for (; i < s.size(); ++i)
    {
        const char c = s[i];
        if (c < '0' || c > '9')
            return std::nullopt;
        const long long digit = c - '0';
        if (v > (limit - digit) / 10)
            return std::nullopt; // absurd
        v = v * 10 + digit;
    }
    return v * sign;
}

[[nodiscard]] std::optional<int> ParseInt(std::string_view s)
{
    const auto v = ParseDigits(s, 1'000'000'000LL);
    if (!v || *v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max())
        return std::nullopt;
    return static_cast<int>(*v);
}

[[nodiscard]] std::optional<std::uint64_t> ParseSeed(std::string_view s)
{
    // Full uint64 range; no sign accepted.
    if (s.empty())
        return std::nullopt;
    std::uint64_t v = 0;
    const char* first = s.data();
    const char* last = first + s.size();
    const auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{} || ptr != last)
        return std::nullopt;
    return v;
}

} // namespace

CommandLineArgs ParseCommandLineArgs(const std::vector<std::string>& args)
{
    CommandLineArgs out;
    const std::size_t argc = args.size();

    for (std::size_t i = 0; i < argc; ++i)
    {
        const std::string_view raw(args[i]);
        if (raw.empty())
            continue;

        const SplitArg split = Split(raw);
        const std::string_view arg(split.name);

        auto addUnknown = [&] { out.unknown.emplace_back(raw); };

        // Flags never take "=value".
        if (!split.value)
        {
            if (arg == "--help" || arg == "-h" || arg == "-?") { out.showHelp = true; continue; }
            if (arg == "--no-solve" || arg == "--nosolve") { out.noSolve = true; continue; }
            if (arg == "--unicode") { out.unicode = true; continue; }
            if (arg == "--stats") { out.stats = true; continue; }
            if (arg == "--verbose" || arg == "-v") { out.verbose = true; continue; }
        }

        // Value for the current option: inline "=value" or the next arg.
        const auto takeValue = [&]() -> std::optional<std::string_view> {
            if (split.value)
                return split.value;
            if (i + 1 >= argc)
                return std::nullopt;
            ++i;
            return std::string_view(args[i]);
        };

        const auto takeInt = [&](std::optional<int>& dst) {
            const auto v = takeValue();
            const auto parsed = v ? ParseInt(*v) : std::nullopt;
            if (!parsed) {
                addUnknown();
                return;
            }
            dst = *parsed;
        };

        const auto takeString = [&](std::optional<std::string>& dst) {
            const auto v = takeValue();
            if (!v || v->empty()) {
                addUnknown();
                return;
            }
            dst = std::string(*v);
        };

        if (arg == "--width" || arg == "-w") { takeInt(out.width); continue; }
        if (arg == "--height") { takeInt(out.height); continue; }

        if (arg == "--size" || arg == "-s")
        {
            // --size 21 11 takes two args; --size 21x11 / --size=21x11 take one.
            const auto first = takeValue();
            if (!first || first->empty()) {
                addUnknown();
                continue;
            }
            std::string text(*first);
            if (!split.value && ParseInt(text) && i + 1 < argc && ParseInt(args[i + 1]))
            {
                text += ' ';
                text += args[++i];
            }
            out.size = std::move(text);
            continue;
        }

        if (arg == "--preset") { takeString(out.preset); continue; }
        if (arg == "--generator" || arg == "-g") { takeString(out.generator); continue; }
        if (arg == "--pathfinder" || arg == "-p") { takeString(out.pathfinder); continue; }
        if (arg == "--export" || arg == "-o") { takeString(out.exportPath); continue; }
        if (arg == "--config" || arg == "-c") { takeString(out.configPath); continue; }
        if (arg == "--log-file") { takeString(out.logFile); continue; }

        if (arg == "--seed")
        {
            const auto v = takeValue();
            const auto parsed = v ? ParseSeed(*v) : std::nullopt;
            if (!parsed)
                addUnknown();
            else
                out.seed = *parsed;
            continue;
        }

        // Anything else is unknown.
        addUnknown();
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv)
{
    std::vector<std::string> args;
    if (argc > 1)
        args.reserve(static_cast<std::size_t>(argc - 1));
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i] ? argv[i] : "");
    return ParseCommandLineArgs(args);
}

std::string BuildCommandLineHelpText()
{
    return
        "Usage: maze_cli [options]\n"
        "\n"
        "Maze size:\n"
        "  --size W H | --size WxH    Maze dimensions (3..200 per side, area <= 40000)\n"
        "  --width N / --height N     Set one dimension\n"
        "  --preset xs|s|m|l|xl       9x9, 11x11, 21x11, 31x21, 41x31\n"
        "\n"
        "Algorithms (a unique prefix is enough):\n"
        "  --generator NAME           iterative | recursive\n"
        "  --pathfinder NAME          bfs | astar | dijkstra | deadend\n"
        "  --seed N                   Deterministic generation\n"
        "\n"
        "Output:\n"
        "  --no-solve                 Generate only\n"
        "  --export FILE              Write .txt or .json (by extension)\n"
        "  --unicode                  Block characters for walls and path\n"
        "  --stats                    Print maze statistics\n"
        "\n"
        "Misc:\n"
        "  --config FILE              Settings file (default maze_config.json)\n"
        "  --log-file FILE            Also log to FILE\n"
        "  --verbose, -v              Debug logging\n"
        "  --help, -h                 Show this help\n";
}

} // namespace maze::app
