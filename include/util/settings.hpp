#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace tzupdater {

inline constexpr const char kDefaultDownloadBaseUrl[] = "https://data.iana.org/time-zones/releases";
inline constexpr const char kDefaultIanaWebsiteUrl[] = "https://www.iana.org/time-zones";
inline constexpr const char kDefaultConfigPath[] = "/etc/tzupdater/tzupdater.json";
inline constexpr const char kConfigPathEnv[] = "TZUPDATER_CONFIG_PATH";

struct Settings {
    std::string target_folder;
    std::string zic_path;
    std::string download_base_url = kDefaultDownloadBaseUrl;
    std::string iana_website_url = kDefaultIanaWebsiteUrl;

    bool show_zic_log = false;
    bool err_stop = true;
    bool activate = true;
    bool verbose = true;
    bool fail_if_zic_missing = false;

    std::uint64_t connect_timeout_sec = 10;
    std::uint64_t read_timeout_sec = 60;

    std::optional<LogLevel> log_level;

    // release -> expected sha256 of tzdata<release>.tar.gz
    std::map<std::string, std::string> checksums;

    Settings();

    // Overlays the values found in `path` on top of `out`. Keys absent from
    // the file leave the current value untouched.
    static Result LoadFromFile(const std::string& path, Settings& out);

    // $TMPDIR/tzupdater/data/IANA_release, /tmp when TMPDIR is unset.
    static std::string DefaultTargetFolder();
};

} // namespace tzupdater
