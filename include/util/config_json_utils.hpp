#pragma once

#include "util/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace corpus::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, HarnessConfig& cfg, std::string& err);

} // namespace corpus::config::detail
