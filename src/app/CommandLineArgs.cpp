#include "app/CommandLineArgs.h"

#include <cctype>
#include <charconv>
#include <initializer_list>
#include <cmath>
#include <limits>
#include <sstream>
#include <system_error>
#include <type_traits>

namespace veggiechain::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// Matches "--opt=value" and hands back the value part.
[[nodiscard]] bool ConsumeValue(std::string_view arg,
                                std::string_view prefix,
                                std::string_view& outValue)
{
    if (!StartsWith(arg, prefix))
        return false;

    const std::size_t n = prefix.size();
    if (arg.size() == n || arg[n] != '=')
        return false;

    outValue = arg.substr(n + 1);
    return true;
}

[[nodiscard]] std::optional<int> ParseInt(std::string_view s)
{
    if (!s.empty() && s.front() == '+')
        s.remove_prefix(1);
    if (s.empty())
        return std::nullopt;

    long long v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return std::nullopt;

    return static_cast<int>(v);
}

[[nodiscard]] std::optional<double> ParseReal(std::string_view s)
{
    if (!s.empty() && s.front() == '+')
        s.remove_prefix(1);
    if (s.empty())
        return std::nullopt;

    double v = 0.0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size() || !std::isfinite(v))
        return std::nullopt;

    return v;
}

template <typename T>
[[nodiscard]] std::optional<T> ParseAs(std::string_view s);

template <>
std::optional<int> ParseAs<int>(std::string_view s) { return ParseInt(s); }

template <>
std::optional<double> ParseAs<double>(std::string_view s) { return ParseReal(s); }

template <>
std::optional<std::string> ParseAs<std::string>(std::string_view s)
{
    if (s.empty())
        return std::nullopt;
    return std::string(s);
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;

    const std::size_t argc = argv.size();

    auto addUnknown = [&](std::string_view raw) {
        out.unknown.emplace_back(raw);
    };

    for (std::size_t i = 1; i < argc; ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        // Option names are case-insensitive, values keep their case (file paths).
        const std::size_t eq = raw.find('=');
        std::string lowered = ToLower(raw.substr(0, eq));
        if (eq != std::string_view::npos)
            lowered.append(raw.substr(eq));
        const std::string_view arg(lowered);

        // Help
        if (arg == "--help" || arg == "-h" || arg == "-?") {
            out.showHelp = true;
            continue;
        }

        // Simple flags
        if (arg == "--quiet" || arg == "-q") { out.quiet = true; continue; }

        // Options with values: "--opt value" or "--opt=value".
        auto option = [&](std::initializer_list<std::string_view> names, auto& dst) -> bool {
            using T = typename std::decay_t<decltype(dst)>::value_type;

            for (std::string_view name : names)
            {
                if (arg == name)
                {
                    if (i + 1 >= argc) {
                        addUnknown(raw);
                        return true;
                    }
                    // The value is consumed even when it does not parse.
                    const auto parsed = ParseAs<T>(argv[++i]);
                    if (!parsed)
                        addUnknown(raw);
                    else
                        dst = *parsed;
                    return true;
                }

                std::string_view value;
                if (ConsumeValue(arg, name, value))
                {
                    const auto parsed = ParseAs<T>(value);
                    if (!parsed)
                        addUnknown(raw);
                    else
                        dst = *parsed;
                    return true;
                }
            }
            return false;
        };

        if (option({"--config", "-c"}, out.configFile)) continue;
        if (option({"--scenario", "-s"}, out.scenarioFile)) continue;
        if (option({"--json"}, out.jsonOut)) continue;
        if (option({"--csv"}, out.csvOut)) continue;
        if (option({"--days", "-d"}, out.days)) continue;
        if (option({"--plant"}, out.plant)) continue;
        if (option({"--ship"}, out.ship)) continue;
        if (option({"--price"}, out.price)) continue;
        if (option({"--demand"}, out.demand)) continue;
        if (option({"--cash"}, out.cash)) continue;
        if (option({"--log-level"}, out.logLevel)) continue;
        if (option({"--log-file"}, out.logFile)) continue;

        // Anything else is unknown.
        addUnknown(raw);
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv)
{
    std::vector<std::string_view> v;
    v.reserve(static_cast<std::size_t>(argc > 0 ? argc : 0));
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i] ? argv[i] : "");
    return ParseCommandLineArgsFromArgv(v);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "VeggieChain - farm-to-market supply chain simulation\n\n";
    oss << "Usage: veggiechain_cli [options]\n\n";

    oss << "Inputs\n";
    oss << "  --config <file.ini>          Simulation parameters (key=value)\n";
    oss << "  --scenario <file.json>       Scripted run: params + one decision per day\n";
    oss << "  --days <N>                   Days to run without a scenario (default 10)\n";
    oss << "  --cash <x>                   Starting cash override\n\n";

    oss << "Daily decision (unscripted runs)\n";
    oss << "  --plant <units>              Crop to plant each day (default 50)\n";
    oss << "  --ship <units>               Units to ship each day (default 80)\n";
    oss << "  --price <x>                  Price per unit (default 3)\n";
    oss << "  --demand <units>             Market demand (default 100)\n\n";

    oss << "Outputs\n";
    oss << "  --json <file>                Write the run log as JSON\n";
    oss << "  --csv <file>                 Write the run log as CSV\n";
    oss << "  --quiet, -q                  Print only the summary\n";
    oss << "  --log-level <level>          trace|debug|info|warn|error|off (default info)\n";
    oss << "  --log-file <file>            Also log to a rotating file\n\n";

    oss << "Misc\n";
    oss << "  --help, -h                   Show this help\n\n";

    oss << "Examples\n";
    oss << "  veggiechain_cli --days 30 --plant 80 --ship 120 --price 2.5\n";
    oss << "  veggiechain_cli --config data/veggiechain.ini --scenario data/scenarios/default.json --csv run.csv\n";
    return oss.str();
}

} // namespace veggiechain::app
