#pragma once
// include/veggiechain/sim/SimParams.hpp
//
// Fixed configuration consumed by the turn engine. Values are injected (INI file,
// scenario JSON or code); nothing in the engine derives them.

#include <string>

namespace veggiechain::sim {

struct SimParams {
    // Logistics
    double truckCapacity = 100.0; // units per truck per day
    double numTrucks     = 2.0;

    // Perishability, fraction lost per day. Must be in [0, 1).
    double farmSpoilRate   = 0.10;
    double marketSpoilRate = 0.05;

    // Cost model
    double plantingCostPerUnit = 1.0;
    double shippingCostPerUnit = 0.2;

    // Session start
    double initialCash            = 100.0;
    double initialFarmInventory   = 0.0;
    double initialMarketInventory = 0.0;

    // Days between planting and the crop showing up as farm inventory.
    // Must be in [1, kMaxHarvestDelayDays].
    int harvestDelayDays = 1;

    // Maximum units moved farm -> market in a single day.
    [[nodiscard]] double ShippingCapacity() const noexcept { return truckCapacity * numTrucks; }

    bool operator==(const SimParams&) const = default;
};

inline constexpr int kMaxHarvestDelayDays = 365;

// Checks ranges the engine relies on. On failure returns false and, when
// `outError` is set, a message naming the first offending key.
[[nodiscard]] bool ValidateParams(const SimParams& params, std::string* outError = nullptr);

} // namespace veggiechain::sim
