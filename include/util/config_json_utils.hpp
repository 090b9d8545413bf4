#pragma once

#include "util/tool_config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace mdeploy::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, ToolConfig& cfg, std::string& err);

} // namespace mdeploy::config::detail
