#include "util/settings.hpp"

#include "util/config_json_utils.hpp"

#include <cstdlib>
#include <filesystem>

namespace tzupdater {

Settings::Settings() : target_folder(DefaultTargetFolder()) {}

std::string Settings::DefaultTargetFolder() {
    const char* tmp = std::getenv("TMPDIR");
    const std::filesystem::path base = (tmp && *tmp) ? std::filesystem::path(tmp)
                                                     : std::filesystem::path("/tmp");
    return (base / "tzupdater" / "data" / "IANA_release").string();
}

Result Settings::LoadFromFile(const std::string& path, Settings& out) {
    nlohmann::json json;
    std::string err;
    if (!config::detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::ConfigError, err);
    }

    // Parse into a copy so a rejected file leaves `out` as it was.
    Settings parsed = out;
    if (!config::detail::FillSettingsFromJson(json, parsed, err)) {
        return Result::Fail(ErrorKind::ConfigError, err + " in " + path);
    }

    out = std::move(parsed);
    return Result::Ok();
}

} // namespace tzupdater
