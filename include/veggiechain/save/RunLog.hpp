#pragma once
// include/veggiechain/save/RunLog.hpp
//
// Exported history of a session: JSON for tooling, CSV for spreadsheets/charts.
// Uses nlohmann::json for (de)serialization.

#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

#include "veggiechain/sim/Decision.hpp"
#include "veggiechain/sim/SimParams.hpp"
#include "veggiechain/sim/SimulationState.hpp"

namespace veggiechain::sim {

// Found by ADL from nlohmann::json. Readers are tolerant: missing keys keep the
// struct defaults, wrong value types throw nlohmann::json::type_error.
void to_json(nlohmann::json& j, const SimParams& v);
void from_json(const nlohmann::json& j, SimParams& v);

// Keys: plant, ship, price, demand.
void to_json(nlohmann::json& j, const Decision& v);
void from_json(const nlohmann::json& j, Decision& v);

void to_json(nlohmann::json& j, const DayReport& v);
void from_json(const nlohmann::json& j, DayReport& v);

} // namespace veggiechain::sim

namespace veggiechain::save {

using json = nlohmann::json;

inline constexpr const char* kRunLogFormat = "veggiechain_run_log";
inline constexpr int kRunLogVersion = 1;

// Closing stocks of the run.
struct RunSummary {
    int    day              = 0;
    double startingCash     = 0.0;
    double cash             = 0.0;
    double cumulativeProfit = 0.0;
    double farmInventory    = 0.0;
    double marketInventory  = 0.0;
    double pendingHarvest   = 0.0;
};

struct RunLog {
    int version = kRunLogVersion;
    sim::SimParams params;
    RunSummary summary;
    std::vector<sim::DayReport> days;
};

[[nodiscard]] RunSummary Summarize(const sim::SimulationState& state) noexcept;

void to_json(json& j, const RunSummary& v);
void from_json(const json& j, RunSummary& v);

void to_json(json& j, const RunLog& v);
void from_json(const json& j, RunLog& v);

[[nodiscard]] RunLog MakeRunLog(const sim::SimParams& params, const sim::SimulationState& state);

// ---------- I/O API ----------
[[nodiscard]] bool WriteRunLogJson(const std::filesystem::path& file,
                                   const RunLog& log,
                                   std::string* outError = nullptr);

// Rejects documents with another "format" or a newer "version".
[[nodiscard]] bool ReadRunLogJson(const std::filesystem::path& file,
                                  RunLog& outLog,
                                  std::string* outError = nullptr);

// One header row, one row per day.
[[nodiscard]] bool WriteRunLogCsv(const std::filesystem::path& file,
                                  const std::vector<sim::DayReport>& days,
                                  std::string* outError = nullptr);

} // namespace veggiechain::save
