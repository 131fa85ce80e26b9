#pragma once

#include "util/settings.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace tzupdater::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillSettingsFromJson(const nlohmann::json& j, Settings& cfg, std::string& err);

} // namespace tzupdater::config::detail
