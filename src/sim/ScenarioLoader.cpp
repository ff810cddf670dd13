#include "sim/ScenarioLoader.hpp"

#include "veggiechain/save/RunLog.hpp" // SimParams / Decision JSON converters

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace veggiechain::sim
{
    namespace
    {
        // Replaying a short script is cheap; a huge repeat count is almost certainly a typo.
        constexpr int kMaxRepeat = 100000;

        bool Fail(std::string* outError, std::string msg)
        {
            if (outError) *outError = std::move(msg);
            return false;
        }
    }

    bool ParseScenario(std::string_view text, Scenario& out, std::string* outError)
    {
        using json = nlohmann::json;
        const SimParams base = out.params;

        json J = json::parse(text.begin(), text.end(), nullptr, false);
        if (J.is_discarded())
            return Fail(outError, "Scenario JSON parse failed.");
        if (!J.is_object())
            return Fail(outError, "Scenario root must be an object.");

        Scenario S;
        S.params = base;
        try
        {
            S.name = J.value("name", std::string{});

            if (J.contains("params"))
            {
                if (!J["params"].is_object())
                    return Fail(outError, "\"params\" must be an object.");
                json merged = base;
                merged.update(J["params"]);
                S.params = merged.get<SimParams>();
            }

            if (J.contains("startingCash"))
                S.params.initialCash = J["startingCash"].get<double>();

            const int repeat = J.value("repeat", 1);
            if (repeat < 1 || repeat > kMaxRepeat)
                return Fail(outError, "\"repeat\" must be between 1 and " + std::to_string(kMaxRepeat) + ".");

            std::vector<Decision> script;
            if (J.contains("days"))
            {
                if (!J["days"].is_array())
                    return Fail(outError, "\"days\" must be an array.");
                for (auto& d : J["days"])
                {
                    if (!d.is_object())
                        return Fail(outError, "Each entry of \"days\" must be an object.");
                    script.push_back(d.get<Decision>());
                }
            }

            S.days.reserve(script.size() * static_cast<std::size_t>(repeat));
            for (int r = 0; r < repeat; ++r)
                S.days.insert(S.days.end(), script.begin(), script.end());
        }
        catch (const json::exception& e)
        {
            return Fail(outError, std::string("Scenario JSON: ") + e.what());
        }

        std::string err;
        if (!ValidateParams(S.params, &err))
            return Fail(outError, "Scenario params: " + err);

        out = std::move(S);
        return true;
    }

    bool LoadScenarioFile(const std::filesystem::path& jsonPath, Scenario& out, std::string* outError)
    {
        std::ifstream f(jsonPath, std::ios::binary);
        if (!f.is_open())
            return Fail(outError, "Could not open " + jsonPath.string());

        std::ostringstream oss;
        oss << f.rdbuf();
        if (!ParseScenario(oss.str(), out, outError))
        {
            if (outError) *outError = jsonPath.string() + ": " + *outError;
            return false;
        }

        if (out.name.empty())
            out.name = jsonPath.stem().string();
        return true;
    }
}
