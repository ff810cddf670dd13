#pragma once
// include/veggiechain/sim/Decision.hpp
//
// Per-day player input and the immutable report the engine produces for it.

namespace veggiechain::sim {

struct Decision {
    double plantAmount  = 50.0;
    double shipAmount   = 80.0;
    double pricePerUnit = 3.0;

    // Exogenous signal. The engine takes it as given.
    double marketDemand = 100.0;

    bool operator==(const Decision&) const = default;
};

// Returns `d` with every field forced to a finite, non-negative value.
// Negative and NaN inputs become 0. +inf becomes the largest finite double for
// shipAmount and marketDemand (bounded later by stock, capacity and demand) and
// 0 for plantAmount and pricePerUnit.
[[nodiscard]] Decision ClampDecision(const Decision& d) noexcept;

struct DayReport {
    int day = 0; // 1-based: the first processed day reports day 1

    // Inputs as applied (after clamping).
    Decision decision{};

    // Flows
    double harvested       = 0.0; // matured into farm inventory this day
    double planted         = 0.0; // entered the harvest pipeline this day
    double shipped         = 0.0;
    double spoiledAtFarm   = 0.0;
    double spoiledAtMarket = 0.0;
    double unitsSold       = 0.0;

    // Money
    double revenue      = 0.0;
    double plantingCost = 0.0;
    double shippingCost = 0.0;
    double costs        = 0.0;
    double dailyProfit  = 0.0;

    // Stocks after the day closed
    double cashAfter             = 0.0;
    double cumulativeProfitAfter = 0.0;
    double farmInventoryAfter    = 0.0;
    double marketInventoryAfter  = 0.0;
    double pendingHarvestAfter   = 0.0;

    bool operator==(const DayReport&) const = default;
};

} // namespace veggiechain::sim
