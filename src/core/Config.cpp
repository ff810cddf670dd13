#include "Config.h"

#include <spdlog/spdlog.h>

#include <array>
#include <charconv>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace veggiechain::core {

namespace {

struct RealKey {
    const char* name;
    double sim::SimParams::*field;
};

// Written in this order by SaveConfigFile.
constexpr std::array<RealKey, 9> kRealKeys{{
    {"truckCapacity",          &sim::SimParams::truckCapacity},
    {"numTrucks",              &sim::SimParams::numTrucks},
    {"farmSpoilRate",          &sim::SimParams::farmSpoilRate},
    {"marketSpoilRate",        &sim::SimParams::marketSpoilRate},
    {"plantingCostPerUnit",    &sim::SimParams::plantingCostPerUnit},
    {"shippingCostPerUnit",    &sim::SimParams::shippingCostPerUnit},
    {"initialCash",            &sim::SimParams::initialCash},
    {"initialFarmInventory",   &sim::SimParams::initialFarmInventory},
    {"initialMarketInventory", &sim::SimParams::initialMarketInventory},
}};

constexpr const char* kDelayKey = "harvestDelayDays";

inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

template <typename T>
bool ParseNumber(std::string_view sv, T& out) noexcept
{
    if (!sv.empty() && sv.front() == '+')
        sv.remove_prefix(1);

    T v{};
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end || begin == end)
        return false;

    out = v;
    return true;
}

void StripUtf8Bom(std::string& text)
{
    if (text.size() >= 3 &&
        static_cast<unsigned char>(text[0]) == 0xEFu &&
        static_cast<unsigned char>(text[1]) == 0xBBu &&
        static_cast<unsigned char>(text[2]) == 0xBFu)
    {
        text.erase(0, 3);
    }
}

void StripInlineComment(std::string& v)
{
    //   farmSpoilRate=0.1   # per day
    //   numTrucks=2         ; fleet
    //   initialCash=100     // dollars
    const std::size_t hashPos  = v.find('#');
    const std::size_t semiPos  = v.find(';');
    const std::size_t slashPos = v.find("//");

    std::size_t cut = std::string::npos;
    auto consider = [&](std::size_t p)
    {
        if (p == std::string::npos) return;
        if (cut == std::string::npos || p < cut) cut = p;
    };

    consider(hashPos);
    consider(semiPos);
    consider(slashPos);

    if (cut != std::string::npos)
    {
        v.erase(cut);
        TrimInPlace(v);
    }
}

std::string FormatReal(double v)
{
    std::array<char, 64> buf{};
    const auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), v);
    if (ec != std::errc{})
        return "0";
    return std::string(buf.data(), ptr);
}

} // namespace

bool LoadConfigFile(sim::SimParams& params, const std::filesystem::path& path)
{
    std::ifstream f(path, std::ios::binary);
    if (!f) return false;
    std::ostringstream oss;
    oss << f.rdbuf();
    std::string text = oss.str();

    StripUtf8Bom(text);

    std::istringstream iss(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(iss, line))
    {
        ++lineNo;

        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';') continue;
        if (tmp[0] == '[') continue; // section headers carry no meaning here

        const auto pos = tmp.find('=');
        if (pos == std::string::npos) continue;

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);
        StripInlineComment(v);

        if (k.empty()) continue;

        bool known = false;
        bool parsed = false;

        for (const RealKey& key : kRealKeys)
        {
            if (k != key.name) continue;
            known = true;
            double value = params.*key.field;
            parsed = ParseNumber(v, value);
            if (parsed)
                params.*key.field = value;
            break;
        }

        if (!known && k == kDelayKey)
        {
            known = true;
            int value = params.harvestDelayDays;
            parsed = ParseNumber(v, value);
            if (parsed)
                params.harvestDelayDays = value;
        }

        if (!known)
            spdlog::debug("LoadConfig: {}:{}: ignoring unknown key '{}'", path.string(), lineNo, k);
        else if (!parsed)
            spdlog::warn("LoadConfig: {}:{}: bad value '{}' for {} (keeping previous)",
                         path.string(), lineNo, v, k);
    }

    return true;
}

bool SaveConfigFile(const sim::SimParams& params, const std::filesystem::path& path)
{
    std::ostringstream oss;
    oss << "# VeggieChain simulation parameters\n";
    for (const RealKey& key : kRealKeys)
        oss << key.name << "=" << FormatReal(params.*key.field) << "\n";
    oss << kDelayKey << "=" << params.harvestDelayDays << "\n";
    const std::string text = oss.str();

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        spdlog::error("SaveConfig: cannot open {} for writing", path.string());
        return false;
    }
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(f);
}

bool LoadConfig(sim::SimParams& params, const std::filesystem::path& dir)
{
    return LoadConfigFile(params, dir / kConfigFileName);
}

bool SaveConfig(const sim::SimParams& params, const std::filesystem::path& dir)
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        spdlog::error("SaveConfig: create_directories failed for {} ({}: {})",
                      dir.string(), ec.value(), ec.message());
        return false;
    }

    return SaveConfigFile(params, dir / kConfigFileName);
}

} // namespace veggiechain::core
