#include "veggiechain/sim/SimulationState.hpp"

#include <algorithm>
#include <numeric>

namespace veggiechain::sim {

HarvestPipeline::HarvestPipeline(int delayDays)
    : m_slots(static_cast<std::size_t>(std::clamp(delayDays, 1, kMaxHarvestDelayDays)), 0.0)
{
}

double HarvestPipeline::Mature()
{
    // A moved-from pipeline has no slots.
    if (m_slots.empty())
    {
        m_slots.push_back(0.0);
        return 0.0;
    }

    const double ripe = m_slots.front();
    m_slots.pop_front();
    m_slots.push_back(0.0);
    return ripe;
}

void HarvestPipeline::Plant(double amount)
{
    if (m_slots.empty())
        m_slots.push_back(0.0);
    m_slots.back() = amount;
}

void HarvestPipeline::Resize(int delayDays)
{
    const std::size_t n = static_cast<std::size_t>(std::clamp(delayDays, 1, kMaxHarvestDelayDays));
    if (m_slots.size() > n)
    {
        double folded = 0.0;
        while (m_slots.size() >= n)
        {
            folded += m_slots.back();
            m_slots.pop_back();
        }
        m_slots.push_back(folded);
    }
    m_slots.resize(n, 0.0);
}

double HarvestPipeline::Total() const noexcept
{
    return std::accumulate(m_slots.begin(), m_slots.end(), 0.0);
}

SimulationState CreateInitialState(double startingCash)
{
    SimulationState s;
    s.cash         = startingCash;
    s.startingCash = startingCash;
    return s;
}

SimulationState CreateInitialState(const SimParams& params)
{
    SimulationState s = CreateInitialState(params.initialCash);
    s.farmInventory   = params.initialFarmInventory;
    s.marketInventory = params.initialMarketInventory;
    s.pending         = HarvestPipeline(params.harvestDelayDays);
    return s;
}

} // namespace veggiechain::sim
