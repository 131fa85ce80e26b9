#include "util/config_json_utils.hpp"

#include <fstream>

namespace tzupdater::config::detail {

namespace {

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer()) || it->get<long long>() < 0) {
        err = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    out = static_cast<std::uint64_t>(it->get<long long>());
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillSettingsFromJson(const nlohmann::json& j, Settings& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "TargetFolder", cfg.target_folder, err) ||
        !GetStringIfPresent(j, "ZicPath", cfg.zic_path, err) ||
        !GetStringIfPresent(j, "DownloadBaseUrl", cfg.download_base_url, err) ||
        !GetStringIfPresent(j, "IanaWebsiteUrl", cfg.iana_website_url, err)) {
        return false;
    }

    if (!GetBoolIfPresent(j, "ShowZicLog", cfg.show_zic_log, err) ||
        !GetBoolIfPresent(j, "ErrStop", cfg.err_stop, err) ||
        !GetBoolIfPresent(j, "Activate", cfg.activate, err) ||
        !GetBoolIfPresent(j, "Verbose", cfg.verbose, err) ||
        !GetBoolIfPresent(j, "FailIfZicMissing", cfg.fail_if_zic_missing, err)) {
        return false;
    }

    if (!GetU64IfPresent(j, "ConnectTimeoutSec", cfg.connect_timeout_sec, err) ||
        !GetU64IfPresent(j, "ReadTimeoutSec", cfg.read_timeout_sec, err)) {
        return false;
    }

    {
        std::string level;
        if (!GetStringIfPresent(j, "LogLevel", level, err))
            return false;
        if (!level.empty()) {
            LogLevel parsed{};
            if (!ParseLogLevel(level, parsed)) {
                err = "unknown LogLevel: " + level;
                return false;
            }
            cfg.log_level = parsed;
        }
    }

    if (auto it = j.find("Checksums"); it != j.end()) {
        if (!it->is_object()) {
            err = "'Checksums' must be an object";
            return false;
        }
        for (const auto& [release, digest] : it->items()) {
            if (!digest.is_string()) {
                err = "checksum for " + release + " must be a string";
                return false;
            }
            cfg.checksums[release] = digest.get<std::string>();
        }
    }

    if (cfg.download_base_url.empty() || cfg.iana_website_url.empty()) {
        err = "DownloadBaseUrl and IanaWebsiteUrl must not be empty";
        return false;
    }

    return true;
}

} // namespace tzupdater::config::detail
