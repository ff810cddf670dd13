// tests/test_core_config.cpp
//
// Regression/robustness tests for src/core/Config.{h,cpp}.
//
// Goals:
//   - Saving creates the directory + writes veggiechain.ini
//   - Loading round-trips values
//   - Corrupt values do not throw and leave the previous value in place

#include <doctest/doctest.h>

#include "core/Config.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using veggiechain::sim::SimParams;

namespace {

fs::path make_unique_temp_dir()
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("veggiechain_config_tests_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    if (ec)
        return base;

    return dir;
}

void write_ini(const fs::path& dir, const std::string& text)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    std::ofstream f(dir / veggiechain::core::kConfigFileName, std::ios::binary | std::ios::trunc);
    REQUIRE(f.good());
    f << text;
}

} // namespace

TEST_CASE("core::SaveConfig creates veggiechain.ini and core::LoadConfig round-trips values")
{
    const fs::path dir = make_unique_temp_dir() / "roundtrip";

    SimParams p;
    p.truckCapacity = 75.5;
    p.numTrucks = 3;
    p.farmSpoilRate = 0.125;
    p.marketSpoilRate = 0.1;
    p.plantingCostPerUnit = 0.7;
    p.shippingCostPerUnit = 0.35;
    p.initialCash = 1234.5;
    p.initialFarmInventory = 10;
    p.initialMarketInventory = 20;
    p.harvestDelayDays = 2;

    CHECK(veggiechain::core::SaveConfig(p, dir));
    CHECK(fs::exists(dir / veggiechain::core::kConfigFileName));

    SimParams loaded;
    CHECK(veggiechain::core::LoadConfig(loaded, dir));
    CHECK(loaded.truckCapacity == p.truckCapacity);
    CHECK(loaded.numTrucks == p.numTrucks);
    CHECK(loaded.farmSpoilRate == p.farmSpoilRate);
    CHECK(loaded.marketSpoilRate == p.marketSpoilRate);
    CHECK(loaded.plantingCostPerUnit == p.plantingCostPerUnit);
    CHECK(loaded.shippingCostPerUnit == p.shippingCostPerUnit);
    CHECK(loaded.initialCash == p.initialCash);
    CHECK(loaded.initialFarmInventory == p.initialFarmInventory);
    CHECK(loaded.initialMarketInventory == p.initialMarketInventory);
    CHECK(loaded.harvestDelayDays == 2);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig returns false for missing file (first run)")
{
    const fs::path dir = make_unique_temp_dir() / "missing";
    std::error_code ec;
    fs::create_directories(dir, ec);

    SimParams p; // defaults
    CHECK_FALSE(veggiechain::core::LoadConfig(p, dir));
    CHECK(p.farmSpoilRate == SimParams{}.farmSpoilRate);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig tolerates corrupt values (does not throw)")
{
    const fs::path dir = make_unique_temp_dir() / "corrupt";
    write_ini(dir,
        "numTrucks=lots\n"
        "farmSpoilRate=0.3\n"
        "harvestDelayDays=1.5\n"
        "marketSpoilRate=\n");

    SimParams p;
    p.numTrucks = 4;           // should remain unchanged (invalid)
    p.farmSpoilRate = 0.0;     // should update
    p.harvestDelayDays = 2;    // should remain unchanged (not an integer)
    p.marketSpoilRate = 0.02;  // should remain unchanged (empty)

    CHECK(veggiechain::core::LoadConfig(p, dir));
    CHECK(p.numTrucks == 4);
    CHECK(p.farmSpoilRate == 0.3);
    CHECK(p.harvestDelayDays == 2);
    CHECK(p.marketSpoilRate == 0.02);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig ignores unknown keys and section headers")
{
    const fs::path dir = make_unique_temp_dir() / "unknown_keys";
    write_ini(dir,
        "[market]\n"
        "windowWidth=800\n"
        "marketSpoilRate=0.2\n");

    SimParams p;
    CHECK(veggiechain::core::LoadConfig(p, dir));
    CHECK(p.marketSpoilRate == 0.2);
    CHECK(p.truckCapacity == SimParams{}.truckCapacity);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig skips a UTF-8 BOM")
{
    const fs::path dir = make_unique_temp_dir() / "utf8_bom";
    std::string text;
    text.push_back(static_cast<char>(0xEF));
    text.push_back(static_cast<char>(0xBB));
    text.push_back(static_cast<char>(0xBF));
    text += "truckCapacity=42\n";
    write_ini(dir, text);

    SimParams p;
    CHECK(veggiechain::core::LoadConfig(p, dir));
    CHECK(p.truckCapacity == 42.0);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig supports inline comments after values")
{
    const fs::path dir = make_unique_temp_dir() / "inline_comments";
    write_ini(dir,
        "truckCapacity=120 # units\n"
        "numTrucks=3 ; fleet\n"
        "initialCash=+250 // dollars\n"
        "; whole line comment\n"
        "# whole line comment\n");

    SimParams p;
    CHECK(veggiechain::core::LoadConfig(p, dir));
    CHECK(p.truckCapacity == 120.0);
    CHECK(p.numTrucks == 3.0);
    CHECK(p.initialCash == 250.0);
    CHECK(p.ShippingCapacity() == 360.0);

    std::error_code dec;
    fs::remove_all(dir, dec);
}
