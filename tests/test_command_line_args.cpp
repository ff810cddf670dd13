// tests/test_command_line_args.cpp
//
// Regression coverage for src/app/CommandLineArgs.{h,cpp}.
//
// Goals:
//   - Option names are case-insensitive, values keep their case
//   - Both "--opt value" and "--opt=value" are supported
//   - Unknown options and bad values are reported in a predictable order

#include <doctest/doctest.h>

#include "app/CommandLineArgs.h"

#include <initializer_list>
#include <string_view>
#include <vector>

namespace {

[[nodiscard]] veggiechain::app::CommandLineArgs Parse(std::initializer_list<std::string_view> argv)
{
    std::vector<std::string_view> v;
    v.reserve(argv.size());
    for (const auto& a : argv)
        v.push_back(a);
    return veggiechain::app::ParseCommandLineArgsFromArgv(v);
}

} // namespace

TEST_CASE("CommandLineArgs parses basic flags (case-insensitive)")
{
    const auto args = Parse({"veggiechain_cli", "--QUIET", "-H"});

    CHECK(args.quiet);
    CHECK(args.showHelp);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs supports separate and '=' values")
{
    const auto args = Parse({
        "veggiechain_cli",
        "--days", "30",
        "--plant=80",
        "--Ship", "120.5",
        "--price=+2.5",
        "--demand", "0",
        "--cash=-25",
    });

    REQUIRE(args.days.has_value());
    CHECK(*args.days == 30);
    REQUIRE(args.plant.has_value());
    CHECK(*args.plant == 80.0);
    REQUIRE(args.ship.has_value());
    CHECK(*args.ship == 120.5);
    REQUIRE(args.price.has_value());
    CHECK(*args.price == 2.5);
    REQUIRE(args.demand.has_value());
    CHECK(*args.demand == 0.0);
    REQUIRE(args.cash.has_value());
    CHECK(*args.cash == -25.0);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs keeps the case of path values")
{
    const auto args = Parse({
        "veggiechain_cli",
        "--CONFIG=Data/VeggieChain.ini",
        "-s", "Scenarios/Glut.json",
        "--json", "Out/Run.JSON",
        "--csv=Out/Run.csv",
        "--Log-Level", "DEBUG",
        "--log-file=Logs/Sim.log",
    });

    REQUIRE(args.configFile.has_value());
    CHECK(*args.configFile == "Data/VeggieChain.ini");
    REQUIRE(args.scenarioFile.has_value());
    CHECK(*args.scenarioFile == "Scenarios/Glut.json");
    REQUIRE(args.jsonOut.has_value());
    CHECK(*args.jsonOut == "Out/Run.JSON");
    REQUIRE(args.csvOut.has_value());
    CHECK(*args.csvOut == "Out/Run.csv");
    REQUIRE(args.logLevel.has_value());
    CHECK(*args.logLevel == "DEBUG");
    REQUIRE(args.logFile.has_value());
    CHECK(*args.logFile == "Logs/Sim.log");
}

TEST_CASE("CommandLineArgs reports unknown options and bad values in order")
{
    const auto args = Parse({
        "veggiechain_cli",
        "--bogus",
        "--days", "ten",
        "--price=abc",
        "--plant",          // missing value
    });

    REQUIRE(args.unknown.size() == 4);
    CHECK(args.unknown[0] == "--bogus");
    CHECK(args.unknown[1] == "--days");
    CHECK(args.unknown[2] == "--price=abc");
    CHECK(args.unknown[3] == "--plant");

    CHECK_FALSE(args.days.has_value());
    CHECK_FALSE(args.price.has_value());
    CHECK_FALSE(args.plant.has_value());
}

TEST_CASE("CommandLineArgs rejects non-finite and out-of-range numbers")
{
    const auto args = Parse({
        "veggiechain_cli",
        "--ship=inf",
        "--days=99999999999",
    });

    CHECK_FALSE(args.ship.has_value());
    CHECK_FALSE(args.days.has_value());
    REQUIRE(args.unknown.size() == 2);
}

TEST_CASE("CommandLineArgs help text mentions every option")
{
    const std::string help = veggiechain::app::BuildCommandLineHelpText();
    for (const char* opt : {"--config", "--scenario", "--days", "--cash", "--plant", "--ship",
                            "--price", "--demand", "--json", "--csv", "--quiet",
                            "--log-level", "--log-file", "--help"})
    {
        CAPTURE(opt);
        CHECK(help.find(opt) != std::string::npos);
    }
}
