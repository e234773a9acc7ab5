#pragma once

#include "IndicatorRequest.hpp"

#include <filesystem>
#include <string>

namespace tdcore {

// JSON persistence for the enabled indicators and their parameters.
//
// {
//   "version": 1,
//   "indicators": [
//     { "kind": "TD SEQUENTIAL", "name": "TD", "setup_lookback": 4, ... },
//     { "kind": "BOLLINGER BANDS", "period": 20, "multipliers": [1, 2], ... }
//   ]
// }
//
// Fields missing from an indicator object keep their default values.

inline constexpr int kParameterStoreVersion = 1;

std::string ConfigToJsonString(const PipelineConfig& config);

bool ConfigFromJsonString(const std::string& json,
                          PipelineConfig* config,
                          std::string* error);

bool WriteConfigFile(const PipelineConfig& config,
                     const std::filesystem::path& file_path,
                     std::string* error);

bool ReadConfigFile(const std::filesystem::path& file_path,
                    PipelineConfig* config,
                    std::string* error);

}  // namespace tdcore
