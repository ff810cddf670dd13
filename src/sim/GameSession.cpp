#include "veggiechain/sim/GameSession.hpp"

#include <spdlog/spdlog.h>

namespace veggiechain::sim {

GameSession::GameSession(const SimParams& params)
    : m_engine(params)
    , m_state(CreateInitialState(params))
{
    spdlog::debug("GameSession: created (cash={:.2f}, capacity={:.1f}, delay={}d)",
                  params.initialCash, params.ShippingCapacity(), params.harvestDelayDays);
}

void GameSession::Reset()
{
    m_state    = CreateInitialState(m_engine.Params());
    m_decision = Decision{};
    m_reportedInsolvency = false;
    spdlog::info("GameSession: reset to day 0 (cash={:.2f})", m_state.cash);
}

DayReport GameSession::AdvanceDay()
{
    const DayReport r = m_engine.Advance(m_state, m_decision);

    spdlog::debug("Day {}: harvested={:.1f} shipped={:.1f} spoiled(farm={:.1f}, market={:.1f}) "
                  "sold={:.1f} profit={:.2f} cash={:.2f}",
                  r.day, r.harvested, r.shipped, r.spoiledAtFarm, r.spoiledAtMarket,
                  r.unitsSold, r.dailyProfit, r.cashAfter);

    if (IsInsolvent())
    {
        if (!m_reportedInsolvency)
        {
            spdlog::warn("Day {}: cash went negative ({:.2f})", r.day, r.cashAfter);
            m_reportedInsolvency = true;
        }
    }
    else
    {
        m_reportedInsolvency = false;
    }

    return r;
}

DayReport GameSession::AdvanceDay(const Decision& d)
{
    SetDecision(d);
    return AdvanceDay();
}

std::optional<DayReport> GameSession::LastReport() const
{
    if (const DayReport* r = m_state.LastReport())
        return *r;
    return std::nullopt;
}

} // namespace veggiechain::sim
