#include "veggiechain/sim/TurnEngine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace veggiechain::sim {

namespace {

[[nodiscard]] double NonNegative(double v) noexcept
{
    // Negative, NaN and infinite inputs all become 0.
    return (std::isfinite(v) && v > 0.0) ? v : 0.0;
}

// As NonNegative, but +inf means "as much as possible": it becomes the largest
// finite double and is bounded later by stock, capacity or demand.
[[nodiscard]] double NonNegativeUnbounded(double v) noexcept
{
    if (v == std::numeric_limits<double>::infinity())
        return std::numeric_limits<double>::max();
    return NonNegative(v);
}

// Loses `rate` of `stock`; returns the amount lost. `stock` never goes below 0.
double ApplySpoilage(double& stock, double rate) noexcept
{
    if (!(stock > 0.0))
    {
        stock = 0.0;
        return 0.0;
    }

    const double lost = std::clamp(stock * rate, 0.0, stock);
    stock = std::max(0.0, stock - lost);
    return lost;
}

} // namespace

Decision ClampDecision(const Decision& d) noexcept
{
    Decision out;
    out.plantAmount  = NonNegative(d.plantAmount);
    out.shipAmount   = NonNegativeUnbounded(d.shipAmount);
    out.pricePerUnit = NonNegative(d.pricePerUnit);
    out.marketDemand = NonNegativeUnbounded(d.marketDemand);
    return out;
}

TurnEngine::TurnEngine(const SimParams& params)
    : m_params(params)
{
    std::string err;
    if (!ValidateParams(m_params, &err))
        throw std::invalid_argument("TurnEngine: invalid parameters: " + err);
}

DayReport TurnEngine::Advance(SimulationState& s, const Decision& requested) const
{
    const Decision d = ClampDecision(requested);

    DayReport r;
    r.decision = d;

    // The configured delay wins over whatever pipeline the state was built with.
    if (s.pending.DelayDays() != m_params.harvestDelayDays)
        s.pending.Resize(m_params.harvestDelayDays);

    // 1. Yesterday's planting (or the oldest slot, for longer delays) is ready.
    r.harvested = s.pending.Mature();
    s.farmInventory += r.harvested;

    // 2. Today's planting is not usable until it matures.
    s.pending.Plant(d.plantAmount);
    r.planted = d.plantAmount;

    // 3. Spoilage is charged on the whole stock before anything leaves the farm.
    r.spoiledAtFarm = ApplySpoilage(s.farmInventory, m_params.farmSpoilRate);

    // 4. Ship what was asked for, limited by stock and trucks.
    r.shipped = std::min({d.shipAmount, s.farmInventory, m_params.ShippingCapacity()});
    r.shipped = std::max(0.0, r.shipped);
    s.farmInventory   = std::max(0.0, s.farmInventory - r.shipped);
    s.marketInventory += r.shipped;

    // 5. Market spoilage includes today's arrivals.
    r.spoiledAtMarket = ApplySpoilage(s.marketInventory, m_params.marketSpoilRate);

    // 6. Sell into demand.
    r.unitsSold = std::min(s.marketInventory, d.marketDemand);
    s.marketInventory = std::max(0.0, s.marketInventory - r.unitsSold);

    // 7. Money.
    r.revenue      = r.unitsSold * d.pricePerUnit;
    r.plantingCost = m_params.plantingCostPerUnit * d.plantAmount;
    r.shippingCost = m_params.shippingCostPerUnit * r.shipped;
    r.costs        = r.plantingCost + r.shippingCost;
    r.dailyProfit  = r.revenue - r.costs;

    s.cash             += r.dailyProfit;
    s.cumulativeProfit += r.dailyProfit;

    // 8. Close the day.
    s.day += 1;
    r.day                   = s.day;
    r.cashAfter             = s.cash;
    r.cumulativeProfitAfter = s.cumulativeProfit;
    r.farmInventoryAfter    = s.farmInventory;
    r.marketInventoryAfter  = s.marketInventory;
    r.pendingHarvestAfter   = s.PendingHarvest();

    s.history.push_back(r);
    return r;
}

TurnResult TurnEngine::Step(const SimulationState& state, const Decision& decision) const
{
    TurnResult out{state, DayReport{}};
    out.report = Advance(out.state, decision);
    return out;
}

} // namespace veggiechain::sim
