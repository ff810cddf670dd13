#pragma once
// include/veggiechain/sim/TurnEngine.hpp
//
// The day transition. Stateless apart from its configuration: the same state
// and decision always produce the same report.
//
// Order of a day (later steps read what earlier ones wrote):
//   1. matured crop moves from the harvest pipeline into farm inventory
//   2. today's planting enters the pipeline
//   3. farm spoilage on the full pre-shipment stock
//   4. shipping, bounded by farm stock and shipping capacity
//   5. market spoilage, after the shipment arrived
//   6. sales, bounded by market stock and demand
//   7. revenue, costs, cash
//   8. day counter and history

#include "veggiechain/sim/Decision.hpp"
#include "veggiechain/sim/SimParams.hpp"
#include "veggiechain/sim/SimulationState.hpp"

namespace veggiechain::sim {

struct TurnResult {
    SimulationState state;
    DayReport report;
};

class TurnEngine {
public:
    // Throws std::invalid_argument if `params` fails ValidateParams().
    explicit TurnEngine(const SimParams& params);

    // Runs one day on `state` in place and returns the report that was appended
    // to its history. Never throws on bad decision values; they are clamped.
    DayReport Advance(SimulationState& state, const Decision& decision) const;

    // Copying variant: `state` is left untouched.
    [[nodiscard]] TurnResult Step(const SimulationState& state, const Decision& decision) const;

    [[nodiscard]] const SimParams& Params() const noexcept { return m_params; }

private:
    SimParams m_params;
};

} // namespace veggiechain::sim
