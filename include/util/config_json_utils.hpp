#pragma once

#include "util/config_parser.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace repack::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillSettingsFromJson(const nlohmann::json& j, PipelineSettings& cfg, std::string& err);

} // namespace repack::config::detail
