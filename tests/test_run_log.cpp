// tests/test_run_log.cpp
//
// Run log export: JSON document shape, version gating on read, CSV layout.

#include <doctest/doctest.h>

#include "veggiechain/save/RunLog.hpp"
#include "veggiechain/sim/TurnEngine.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using nlohmann::json;
using namespace veggiechain;

namespace {

fs::path make_unique_temp_dir(const char* tag)
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    fs::path dir = base / (std::string("veggiechain_runlog_") + tag + "_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    return dir;
}

std::string read_all(const fs::path& p)
{
    std::ifstream f(p, std::ios::binary);
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

save::RunLog PlayThreeDays(sim::SimParams& params)
{
    params.harvestDelayDays = 2;
    const sim::TurnEngine engine(params);
    sim::SimulationState s = sim::CreateInitialState(params);

    sim::Decision d;
    d.plantAmount = 40;
    d.shipAmount = 25;
    d.pricePerUnit = 2.5;
    d.marketDemand = 30;
    for (int i = 0; i < 3; ++i)
        engine.Advance(s, d);

    return save::MakeRunLog(params, s);
}

} // namespace

TEST_CASE("MakeRunLog captures params, history and closing stocks")
{
    sim::SimParams p;
    const save::RunLog log = PlayThreeDays(p);

    CHECK(log.version == save::kRunLogVersion);
    CHECK(log.params == p);
    REQUIRE(log.days.size() == 3);
    CHECK(log.summary.day == 3);
    CHECK(log.summary.startingCash == p.initialCash);
    CHECK(log.summary.cash == log.days.back().cashAfter);
    CHECK(log.summary.pendingHarvest == log.days.back().pendingHarvestAfter);
}

TEST_CASE("Run log JSON carries format tag and reads back")
{
    const fs::path dir = make_unique_temp_dir("json");
    const fs::path file = dir / "nested" / "run.json";

    sim::SimParams p;
    const save::RunLog log = PlayThreeDays(p);

    std::string err;
    REQUIRE(save::WriteRunLogJson(file, log, &err));
    CHECK_FALSE(fs::exists(fs::path(file).concat(".tmp")));

    const json doc = json::parse(read_all(file));
    CHECK(doc["format"] == save::kRunLogFormat);
    CHECK(doc["version"] == save::kRunLogVersion);
    CHECK(doc.contains("exportedUtc"));
    CHECK(doc["days"].size() == 3);
    CHECK(doc["days"][0]["decision"]["plant"] == 40.0);
    CHECK(doc["params"]["harvestDelayDays"] == 2);

    save::RunLog back;
    REQUIRE(save::ReadRunLogJson(file, back, &err));
    CHECK(back.params == log.params);
    CHECK(back.days == log.days);
    CHECK(back.summary.cash == log.summary.cash);
    CHECK(back.summary.cumulativeProfit == log.summary.cumulativeProfit);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("ReadRunLogJson rejects foreign formats and newer versions")
{
    const fs::path dir = make_unique_temp_dir("reject");
    std::string err;
    save::RunLog out;

    const auto write = [&](const char* name, const std::string& text) {
        const fs::path f = dir / name;
        std::ofstream(f, std::ios::binary) << text;
        return f;
    };

    CHECK_FALSE(save::ReadRunLogJson(write("foreign.json", R"({"format":"farm_ledger","version":1})"), out, &err));
    CHECK(err.find("format") != std::string::npos);

    CHECK_FALSE(save::ReadRunLogJson(write("future.json", R"({"format":"veggiechain_run_log","version":99})"), out, &err));
    CHECK(err.find("99") != std::string::npos);

    CHECK_FALSE(save::ReadRunLogJson(write("broken.json", "{ nope"), out, &err));
    CHECK_FALSE(save::ReadRunLogJson(dir / "absent.json", out, &err));

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("Run log CSV has one header row and one row per day")
{
    const fs::path dir = make_unique_temp_dir("csv");
    const fs::path file = dir / "run.csv";

    sim::SimParams p;
    const save::RunLog log = PlayThreeDays(p);

    std::string err;
    REQUIRE(save::WriteRunLogCsv(file, log.days, &err));

    std::istringstream in(read_all(file));
    std::string line;
    std::vector<std::string> lines;
    while (std::getline(in, line))
        lines.push_back(line);

    REQUIRE(lines.size() == 4);
    CHECK(lines[0].rfind("day,plant,ship_requested,price,demand,", 0) == 0);
    CHECK(lines[1].rfind("1,40,25,2.5,30,", 0) == 0);
    CHECK(lines[3].rfind("3,", 0) == 0);

    std::error_code ec;
    fs::remove_all(dir, ec);
}
