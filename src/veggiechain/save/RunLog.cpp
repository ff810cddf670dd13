// src/veggiechain/save/RunLog.cpp
#include "veggiechain/save/RunLog.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace veggiechain::sim {

// ---------- SimParams ----------
void to_json(nlohmann::json& j, const SimParams& v) {
    j = nlohmann::json::object({
        {"truckCapacity",          v.truckCapacity},
        {"numTrucks",              v.numTrucks},
        {"farmSpoilRate",          v.farmSpoilRate},
        {"marketSpoilRate",        v.marketSpoilRate},
        {"plantingCostPerUnit",    v.plantingCostPerUnit},
        {"shippingCostPerUnit",    v.shippingCostPerUnit},
        {"initialCash",            v.initialCash},
        {"initialFarmInventory",   v.initialFarmInventory},
        {"initialMarketInventory", v.initialMarketInventory},
        {"harvestDelayDays",       v.harvestDelayDays}
    });
}
void from_json(const nlohmann::json& j, SimParams& v) {
    const SimParams d{};
    v.truckCapacity          = j.value("truckCapacity",          d.truckCapacity);
    v.numTrucks              = j.value("numTrucks",              d.numTrucks);
    v.farmSpoilRate          = j.value("farmSpoilRate",          d.farmSpoilRate);
    v.marketSpoilRate        = j.value("marketSpoilRate",        d.marketSpoilRate);
    v.plantingCostPerUnit    = j.value("plantingCostPerUnit",    d.plantingCostPerUnit);
    v.shippingCostPerUnit    = j.value("shippingCostPerUnit",    d.shippingCostPerUnit);
    v.initialCash            = j.value("initialCash",            d.initialCash);
    v.initialFarmInventory   = j.value("initialFarmInventory",   d.initialFarmInventory);
    v.initialMarketInventory = j.value("initialMarketInventory", d.initialMarketInventory);
    v.harvestDelayDays       = j.value("harvestDelayDays",       d.harvestDelayDays);
}

// ---------- Decision ----------
void to_json(nlohmann::json& j, const Decision& v) {
    j = nlohmann::json::object({
        {"plant",  v.plantAmount},
        {"ship",   v.shipAmount},
        {"price",  v.pricePerUnit},
        {"demand", v.marketDemand}
    });
}
void from_json(const nlohmann::json& j, Decision& v) {
    const Decision d{};
    v.plantAmount  = j.value("plant",  d.plantAmount);
    v.shipAmount   = j.value("ship",   d.shipAmount);
    v.pricePerUnit = j.value("price",  d.pricePerUnit);
    v.marketDemand = j.value("demand", d.marketDemand);
}

// ---------- DayReport ----------
void to_json(nlohmann::json& j, const DayReport& v) {
    j = nlohmann::json::object({
        {"day",             v.day},
        {"decision",        v.decision},
        {"harvested",       v.harvested},
        {"planted",         v.planted},
        {"shipped",         v.shipped},
        {"spoiledAtFarm",   v.spoiledAtFarm},
        {"spoiledAtMarket", v.spoiledAtMarket},
        {"unitsSold",       v.unitsSold},
        {"revenue",         v.revenue},
        {"plantingCost",    v.plantingCost},
        {"shippingCost",    v.shippingCost},
        {"costs",           v.costs},
        {"dailyProfit",     v.dailyProfit},
        {"cashAfter",             v.cashAfter},
        {"cumulativeProfitAfter", v.cumulativeProfitAfter},
        {"farmInventoryAfter",    v.farmInventoryAfter},
        {"marketInventoryAfter",  v.marketInventoryAfter},
        {"pendingHarvestAfter",   v.pendingHarvestAfter}
    });
}
void from_json(const nlohmann::json& j, DayReport& v) {
    v.day             = j.value("day", 0);
    v.decision        = j.value("decision", Decision{});
    v.harvested       = j.value("harvested", 0.0);
    v.planted         = j.value("planted", 0.0);
    v.shipped         = j.value("shipped", 0.0);
    v.spoiledAtFarm   = j.value("spoiledAtFarm", 0.0);
    v.spoiledAtMarket = j.value("spoiledAtMarket", 0.0);
    v.unitsSold       = j.value("unitsSold", 0.0);
    v.revenue         = j.value("revenue", 0.0);
    v.plantingCost    = j.value("plantingCost", 0.0);
    v.shippingCost    = j.value("shippingCost", 0.0);
    v.costs           = j.value("costs", 0.0);
    v.dailyProfit     = j.value("dailyProfit", 0.0);
    v.cashAfter             = j.value("cashAfter", 0.0);
    v.cumulativeProfitAfter = j.value("cumulativeProfitAfter", 0.0);
    v.farmInventoryAfter    = j.value("farmInventoryAfter", 0.0);
    v.marketInventoryAfter  = j.value("marketInventoryAfter", 0.0);
    v.pendingHarvestAfter   = j.value("pendingHarvestAfter", 0.0);
}

} // namespace veggiechain::sim

namespace veggiechain::save {

namespace {

std::string NowUtcIso8601()
{
    using clock = std::chrono::system_clock;
    auto t = clock::now();
    std::time_t tt = clock::to_time_t(t);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Writes <file>.tmp and renames it over `file`, so readers never see half a log.
bool WriteFileReplacing(const std::filesystem::path& file, const std::string& data, std::string* outError)
{
    std::error_code ec;
    if (file.has_parent_path())
    {
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec)
        {
            if (outError) *outError = "Cannot create directory " + file.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::filesystem::path tmp = file;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            if (outError) *outError = "Cannot open file for writing: " + tmp.string();
            return false;
        }
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        ofs.flush();
        if (!ofs)
        {
            if (outError) *outError = "Write failed: " + tmp.string();
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    std::filesystem::rename(tmp, file, ec);
    if (ec)
    {
        if (outError) *outError = "Cannot replace " + file.string() + ": " + ec.message();
        std::error_code rm;
        std::filesystem::remove(tmp, rm);
        return false;
    }
    return true;
}

} // namespace

RunSummary Summarize(const sim::SimulationState& s) noexcept
{
    RunSummary out;
    out.day              = s.day;
    out.startingCash     = s.startingCash;
    out.cash             = s.cash;
    out.cumulativeProfit = s.cumulativeProfit;
    out.farmInventory    = s.farmInventory;
    out.marketInventory  = s.marketInventory;
    out.pendingHarvest   = s.PendingHarvest();
    return out;
}

// ---------- RunSummary ----------
void to_json(json& j, const RunSummary& v) {
    j = json::object({
        {"day",              v.day},
        {"startingCash",     v.startingCash},
        {"cash",             v.cash},
        {"cumulativeProfit", v.cumulativeProfit},
        {"farmInventory",    v.farmInventory},
        {"marketInventory",  v.marketInventory},
        {"pendingHarvest",   v.pendingHarvest}
    });
}
void from_json(const json& j, RunSummary& v) {
    v.day              = j.value("day", 0);
    v.startingCash     = j.value("startingCash", 0.0);
    v.cash             = j.value("cash", 0.0);
    v.cumulativeProfit = j.value("cumulativeProfit", 0.0);
    v.farmInventory    = j.value("farmInventory", 0.0);
    v.marketInventory  = j.value("marketInventory", 0.0);
    v.pendingHarvest   = j.value("pendingHarvest", 0.0);
}

// ---------- RunLog ----------
void to_json(json& j, const RunLog& v) {
    j = json::object({
        {"format",  kRunLogFormat},
        {"version", v.version},
        {"params",  v.params},
        {"final",   v.summary},
        {"days",    v.days}
    });
}
void from_json(const json& j, RunLog& v) {
    v.version = j.value("version", kRunLogVersion);
    v.params  = j.value("params", sim::SimParams{});
    v.summary = j.value("final", RunSummary{});
    v.days    = j.value("days", std::vector<sim::DayReport>{});
}

RunLog MakeRunLog(const sim::SimParams& params, const sim::SimulationState& state)
{
    RunLog log;
    log.params  = params;
    log.summary = Summarize(state);
    log.days    = state.history;
    return log;
}

// ---------- I/O ----------

bool WriteRunLogJson(const std::filesystem::path& file, const RunLog& log, std::string* outError)
{
    json j = log;
    j["exportedUtc"] = NowUtcIso8601();

    std::string text;
    try {
        text = j.dump(2);
    } catch (const json::type_error& e) {
        // dump() throws on invalid UTF-8; none of our strings should trigger it.
        if (outError) *outError = e.what();
        return false;
    }
    text.push_back('\n');

    if (!WriteFileReplacing(file, text, outError))
        return false;

    spdlog::info("Run log written: {} ({} days)", file.string(), log.days.size());
    return true;
}

bool ReadRunLogJson(const std::filesystem::path& file, RunLog& outLog, std::string* outError)
{
    outLog = {};

    std::ifstream ifs(file, std::ios::binary);
    if (!ifs)
    {
        if (outError) *outError = "Cannot open file: " + file.string();
        return false;
    }

    json doc = json::parse(ifs, nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
    {
        if (outError) *outError = "Run log JSON parse failed.";
        return false;
    }

    if (doc.value("format", std::string{}) != kRunLogFormat)
    {
        if (outError) *outError = "Unsupported run log format.";
        return false;
    }

    try {
        const int version = doc.value("version", 0);
        if (version < 1 || version > kRunLogVersion)
        {
            if (outError) *outError = "Unsupported run log version " + std::to_string(version) + ".";
            return false;
        }

        outLog = doc.get<RunLog>();
    } catch (const json::exception& e) {
        if (outError) *outError = e.what();
        outLog = {};
        return false;
    }
    return true;
}

bool WriteRunLogCsv(const std::filesystem::path& file,
                    const std::vector<sim::DayReport>& days,
                    std::string* outError)
{
    std::string text =
        "day,plant,ship_requested,price,demand,harvested,shipped,spoiled_farm,spoiled_market,"
        "sold,revenue,planting_cost,shipping_cost,costs,profit,cash,cumulative_profit,"
        "farm_inventory,market_inventory,pending_harvest\n";

    for (const sim::DayReport& r : days)
    {
        text += fmt::format("{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{}\n",
                            r.day,
                            r.decision.plantAmount, r.decision.shipAmount,
                            r.decision.pricePerUnit, r.decision.marketDemand,
                            r.harvested, r.shipped, r.spoiledAtFarm, r.spoiledAtMarket,
                            r.unitsSold, r.revenue, r.plantingCost, r.shippingCost, r.costs,
                            r.dailyProfit, r.cashAfter, r.cumulativeProfitAfter,
                            r.farmInventoryAfter, r.marketInventoryAfter, r.pendingHarvestAfter);
    }

    if (!WriteFileReplacing(file, text, outError))
        return false;

    spdlog::info("Run log CSV written: {} ({} days)", file.string(), days.size());
    return true;
}

} // namespace veggiechain::save
