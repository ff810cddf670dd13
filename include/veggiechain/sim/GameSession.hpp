#pragma once
// include/veggiechain/sim/GameSession.hpp
//
// One game: its parameters, the engine, the state and the decision that will be
// applied on the next day. This is what an input/display layer talks to.

#include "veggiechain/sim/Decision.hpp"
#include "veggiechain/sim/SimParams.hpp"
#include "veggiechain/sim/SimulationState.hpp"
#include "veggiechain/sim/TurnEngine.hpp"

#include <optional>
#include <vector>

namespace veggiechain::sim {

class GameSession {
public:
    // Throws std::invalid_argument if `params` fails ValidateParams().
    explicit GameSession(const SimParams& params = SimParams{});

    // Back to day 0 with the configured starting cash/stocks and default decisions.
    void Reset();

    void SetDecision(const Decision& d) noexcept { m_decision = d; }
    [[nodiscard]] const Decision& CurrentDecision() const noexcept { return m_decision; }

    // Runs one day with the current decision.
    DayReport AdvanceDay();
    DayReport AdvanceDay(const Decision& d);

    [[nodiscard]] const SimParams& Params() const noexcept { return m_engine.Params(); }
    [[nodiscard]] const SimulationState& State() const noexcept { return m_state; }
    [[nodiscard]] const std::vector<DayReport>& History() const noexcept { return m_state.history; }
    [[nodiscard]] std::optional<DayReport> LastReport() const;

    [[nodiscard]] int Day() const noexcept { return m_state.day; }
    [[nodiscard]] bool IsInsolvent() const noexcept { return m_state.cash < 0.0; }

private:
    TurnEngine      m_engine;
    SimulationState m_state;
    Decision        m_decision{};
    bool            m_reportedInsolvency = false;
};

} // namespace veggiechain::sim
