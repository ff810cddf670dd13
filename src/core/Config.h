#pragma once
#include <filesystem>
#include <string>

#include "veggiechain/sim/SimParams.hpp"

namespace veggiechain::core {

// Default parameter file name inside a config directory.
inline constexpr const char* kConfigFileName = "veggiechain.ini";

// key=value INI with one line per SimParams field. Keys that are missing or fail to
// parse keep their current value. Returns false if the file cannot be read.
bool LoadConfigFile(sim::SimParams& params, const std::filesystem::path& file);
bool SaveConfigFile(const sim::SimParams& params, const std::filesystem::path& file);

// Same as above for <dir>/veggiechain.ini; SaveConfig creates `dir`.
bool LoadConfig(sim::SimParams& params, const std::filesystem::path& dir);
bool SaveConfig(const sim::SimParams& params, const std::filesystem::path& dir);

} // namespace veggiechain::core
