#pragma once
// include/veggiechain/sim/SimulationState.hpp
//
// Authoritative snapshot of one run. Owned by the caller, mutated only by
// TurnEngine (one whole day at a time).

#include "veggiechain/sim/Decision.hpp"
#include "veggiechain/sim/SimParams.hpp"

#include <cstddef>
#include <deque>
#include <vector>

namespace veggiechain::sim {

// Crop that has been planted but has not matured yet.
//
// Fixed-length FIFO: slot 0 matures on the next day, the last slot was planted
// most recently. With a delay of one day there is exactly one slot, i.e. the
// classic "planted yesterday" scalar.
class HarvestPipeline {
public:
    explicit HarvestPipeline(int delayDays = 1);

    // Removes and returns the oldest slot, shifting an empty slot in at the back.
    double Mature();

    // Puts `amount` into the newest slot (which Mature() has just emptied).
    void Plant(double amount);

    // Changes the delay without losing crop. Growing adds empty slots at the
    // newest end; shrinking folds the newest slots into the new last one.
    void Resize(int delayDays);

    [[nodiscard]] double Total() const noexcept;
    [[nodiscard]] int DelayDays() const noexcept { return static_cast<int>(m_slots.size()); }
    [[nodiscard]] const std::deque<double>& Slots() const noexcept { return m_slots; }

    bool operator==(const HarvestPipeline&) const = default;

private:
    std::deque<double> m_slots;
};

struct SimulationState {
    int day = 0;

    double cash             = 0.0; // may go negative
    double startingCash     = 0.0;
    double cumulativeProfit = 0.0;

    double farmInventory   = 0.0;
    double marketInventory = 0.0;

    HarvestPipeline pending{1};

    // One entry per processed day, in day order. Append-only.
    std::vector<DayReport> history;

    // Total crop planted but not yet harvested.
    [[nodiscard]] double PendingHarvest() const noexcept { return pending.Total(); }

    [[nodiscard]] const DayReport* LastReport() const noexcept
    {
        return history.empty() ? nullptr : &history.back();
    }

    bool operator==(const SimulationState&) const = default;
};

// Day 0, empty inventories, nothing pending, empty history.
[[nodiscard]] SimulationState CreateInitialState(double startingCash);

// As above, but seeded from the session parameters (initial cash and stocks,
// harvest delay). `params` is expected to have passed ValidateParams().
[[nodiscard]] SimulationState CreateInitialState(const SimParams& params);

} // namespace veggiechain::sim
