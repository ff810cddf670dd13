#pragma once
#include "veggiechain/sim/Decision.hpp"
#include "veggiechain/sim/SimParams.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace veggiechain::sim
{
    // A scripted run: parameters plus the decision for every day, in order.
    //
    //   {
    //     "name": "glut",
    //     "params": { "farmSpoilRate": 0.2, "numTrucks": 1 },
    //     "startingCash": 250,
    //     "repeat": 3,
    //     "days": [ { "plant": 50, "ship": 0, "price": 2, "demand": 10 }, ... ]
    //   }
    //
    // Missing "params" keys keep the values already in `out.params` (the defaults
    // for a fresh Scenario, or e.g. an INI file loaded beforehand). Missing decision
    // fields use Decision defaults. "repeat" replays the "days" list that many times.
    struct Scenario
    {
        std::string name;
        SimParams params;
        std::vector<Decision> days;
    };

    // Both return false with a message on malformed JSON, wrong value types or
    // parameters that fail ValidateParams(). `out` is only replaced on success.
    [[nodiscard]] bool ParseScenario(std::string_view text, Scenario& out, std::string* outError = nullptr);
    [[nodiscard]] bool LoadScenarioFile(const std::filesystem::path& jsonPath, Scenario& out,
                                        std::string* outError = nullptr);
}
