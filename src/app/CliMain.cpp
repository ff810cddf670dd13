// src/app/CliMain.cpp
//
// veggiechain_cli: headless driver. Feeds a scripted (or repeated) decision into a
// GameSession day by day, prints the day reports and optionally exports the run log.

#include "app/CommandLineArgs.h"
#include "core/Config.h"
#include "logging/Log.h"
#include "sim/ScenarioLoader.hpp"

#include "veggiechain/save/RunLog.hpp"
#include "veggiechain/sim/GameSession.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using veggiechain::app::CommandLineArgs;
using veggiechain::sim::DayReport;
using veggiechain::sim::Decision;
using veggiechain::sim::GameSession;
using veggiechain::sim::SimParams;

constexpr int kDefaultDays = 10;
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void PrintHeader()
{
    fmt::print("{:>5} {:>9} {:>9} {:>9} {:>9} {:>9} {:>10} {:>11} {:>9} {:>9} {:>9}\n",
               "day", "harvest", "shipped", "spoil-F", "spoil-M", "sold",
               "profit", "cash", "farm", "market", "pending");
}

void PrintDay(const DayReport& r)
{
    fmt::print("{:>5} {:>9.1f} {:>9.1f} {:>9.1f} {:>9.1f} {:>9.1f} {:>10.2f} {:>11.2f} {:>9.1f} {:>9.1f} {:>9.1f}\n",
               r.day, r.harvested, r.shipped, r.spoiledAtFarm, r.spoiledAtMarket, r.unitsSold,
               r.dailyProfit, r.cashAfter, r.farmInventoryAfter, r.marketInventoryAfter,
               r.pendingHarvestAfter);
}

void PrintSummary(const GameSession& session)
{
    const auto& s = session.State();
    double sold = 0.0, spoiled = 0.0, revenue = 0.0, costs = 0.0;
    for (const DayReport& r : s.history)
    {
        sold    += r.unitsSold;
        spoiled += r.spoiledAtFarm + r.spoiledAtMarket;
        revenue += r.revenue;
        costs   += r.costs;
    }

    fmt::print("\nDays played:       {}\n", s.day);
    fmt::print("Units sold:        {:.1f}\n", sold);
    fmt::print("Units spoiled:     {:.1f}\n", spoiled);
    fmt::print("Revenue / costs:   {:.2f} / {:.2f}\n", revenue, costs);
    fmt::print("Profit (total):    {:.2f}\n", s.cumulativeProfit);
    fmt::print("Cash:              {:.2f}{}\n", s.cash, session.IsInsolvent() ? "  (insolvent)" : "");
    fmt::print("Farm / market:     {:.1f} / {:.1f}  (pending {:.1f})\n",
               s.farmInventory, s.marketInventory, s.PendingHarvest());
}

int Run(const CommandLineArgs& args)
{
    SimParams params;

    if (args.configFile)
    {
        if (!veggiechain::core::LoadConfigFile(params, *args.configFile))
        {
            spdlog::error("Cannot read config file {}", *args.configFile);
            return kExitFailure;
        }
        spdlog::info("Loaded parameters from {}", *args.configFile);
    }

    std::vector<Decision> script;
    if (args.scenarioFile)
    {
        veggiechain::sim::Scenario scenario;
        scenario.params = params; // scenario params override the INI file
        std::string err;
        if (!veggiechain::sim::LoadScenarioFile(*args.scenarioFile, scenario, &err))
        {
            spdlog::error("Scenario: {}", err);
            return kExitFailure;
        }
        params = scenario.params;
        script = std::move(scenario.days);
        spdlog::info("Scenario '{}': {} days", scenario.name, script.size());
    }
    else
    {
        Decision d;
        if (args.plant)  d.plantAmount  = *args.plant;
        if (args.ship)   d.shipAmount   = *args.ship;
        if (args.price)  d.pricePerUnit = *args.price;
        if (args.demand) d.marketDemand = *args.demand;

        const int days = args.days.value_or(kDefaultDays);
        if (days < 0)
        {
            spdlog::error("--days must be >= 0 (got {})", days);
            return kExitUsage;
        }
        script.assign(static_cast<std::size_t>(days), d);
    }

    if (args.cash)
        params.initialCash = *args.cash;

    std::string err;
    if (!veggiechain::sim::ValidateParams(params, &err))
    {
        spdlog::error("Invalid parameters: {}", err);
        return kExitFailure;
    }

    GameSession session(params);
    spdlog::info("Starting run: cash={:.2f} capacity={:.1f}/day spoilage farm={:.0f}% market={:.0f}%",
                 params.initialCash, params.ShippingCapacity(),
                 params.farmSpoilRate * 100.0, params.marketSpoilRate * 100.0);

    if (!args.quiet)
        PrintHeader();

    for (const Decision& d : script)
    {
        const DayReport r = session.AdvanceDay(d);
        if (!args.quiet)
            PrintDay(r);
    }

    PrintSummary(session);

    int rc = kExitOk;
    const auto log = veggiechain::save::MakeRunLog(params, session.State());

    if (args.jsonOut && !veggiechain::save::WriteRunLogJson(*args.jsonOut, log, &err))
    {
        spdlog::error("JSON export failed: {}", err);
        rc = kExitFailure;
    }
    if (args.csvOut && !veggiechain::save::WriteRunLogCsv(*args.csvOut, log.days, &err))
    {
        spdlog::error("CSV export failed: {}", err);
        rc = kExitFailure;
    }

    return rc;
}

} // namespace

int main(int argc, char** argv)
{
    const CommandLineArgs args = veggiechain::app::ParseCommandLineArgs(argc, argv);

    if (args.showHelp)
    {
        std::fputs(veggiechain::app::BuildCommandLineHelpText().c_str(), stdout);
        return kExitOk;
    }

    logsys::Options logOpts;
    if (args.logLevel && !logsys::parse_level(*args.logLevel, logOpts.level))
    {
        std::fprintf(stderr, "Unknown log level '%s'\n", args.logLevel->c_str());
        return kExitUsage;
    }
    if (args.logFile)
        logOpts.file = *args.logFile;
    logsys::init(logOpts);

    if (!args.unknown.empty())
    {
        for (const std::string& u : args.unknown)
            spdlog::error("Unknown or malformed option: {}", u);
        std::fputs(veggiechain::app::BuildCommandLineHelpText().c_str(), stderr);
        return kExitUsage;
    }

    try
    {
        return Run(args);
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Unhandled exception: {}", e.what());
        return kExitFailure;
    }
}
