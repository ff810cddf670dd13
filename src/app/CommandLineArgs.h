#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace veggiechain::app {

// Parsed command-line arguments for veggiechain_cli.
//
// Notes:
//   - All option names are case-insensitive (values are not).
//   - Both "--opt=value" and "--opt value" forms are supported.
struct CommandLineArgs
{
    bool showHelp = false;          // --help / -h / -?
    bool quiet = false;             // --quiet / -q (no per-day table)

    std::optional<std::string> configFile;   // --config <file.ini>
    std::optional<std::string> scenarioFile; // --scenario <file.json>
    std::optional<std::string> jsonOut;      // --json <file>
    std::optional<std::string> csvOut;       // --csv <file>

    std::optional<int> days;        // --days <N> (ignored when a scenario supplies days)

    // Decision overrides for unscripted runs.
    std::optional<double> plant;    // --plant <units>
    std::optional<double> ship;     // --ship <units>
    std::optional<double> price;    // --price <per unit>
    std::optional<double> demand;   // --demand <units>
    std::optional<double> cash;     // --cash <starting cash>

    std::optional<std::string> logLevel; // --log-level <trace|debug|info|warn|error|off>
    std::optional<std::string> logFile;  // --log-file <file>

    // Any unknown/unsupported args are collected here (so we can show a useful error).
    std::vector<std::string> unknown;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace veggiechain::app
