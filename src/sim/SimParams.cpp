#include "veggiechain/sim/SimParams.hpp"

#include <cmath>
#include <string>
#include <string_view>

namespace veggiechain::sim {

namespace {

[[nodiscard]] bool Fail(std::string* outError, std::string_view key, std::string_view why)
{
    if (outError)
    {
        *outError = std::string(key);
        *outError += ": ";
        *outError += why;
    }
    return false;
}

[[nodiscard]] bool IsRate(double v) noexcept
{
    return std::isfinite(v) && v >= 0.0 && v < 1.0;
}

[[nodiscard]] bool IsNonNegative(double v) noexcept
{
    return std::isfinite(v) && v >= 0.0;
}

} // namespace

bool ValidateParams(const SimParams& p, std::string* outError)
{
    if (!IsNonNegative(p.truckCapacity))
        return Fail(outError, "truckCapacity", "must be a finite value >= 0");
    if (!IsNonNegative(p.numTrucks))
        return Fail(outError, "numTrucks", "must be a finite value >= 0");

    if (!IsRate(p.farmSpoilRate))
        return Fail(outError, "farmSpoilRate", "must be in [0, 1)");
    if (!IsRate(p.marketSpoilRate))
        return Fail(outError, "marketSpoilRate", "must be in [0, 1)");

    if (!IsNonNegative(p.plantingCostPerUnit))
        return Fail(outError, "plantingCostPerUnit", "must be a finite value >= 0");
    if (!IsNonNegative(p.shippingCostPerUnit))
        return Fail(outError, "shippingCostPerUnit", "must be a finite value >= 0");

    // Cash may be negative (a run can start in debt), but it has to be a number.
    if (!std::isfinite(p.initialCash))
        return Fail(outError, "initialCash", "must be finite");
    if (!IsNonNegative(p.initialFarmInventory))
        return Fail(outError, "initialFarmInventory", "must be a finite value >= 0");
    if (!IsNonNegative(p.initialMarketInventory))
        return Fail(outError, "initialMarketInventory", "must be a finite value >= 0");

    if (p.harvestDelayDays < 1 || p.harvestDelayDays > kMaxHarvestDelayDays)
        return Fail(outError, "harvestDelayDays",
                    "must be between 1 and " + std::to_string(kMaxHarvestDelayDays));

    return true;
}

} // namespace veggiechain::sim
