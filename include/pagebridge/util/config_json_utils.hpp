#pragma once

#include "pagebridge/util/config_parser.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace pagebridge::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, BridgeConfig& cfg, std::string& err);

} // namespace pagebridge::config::detail
