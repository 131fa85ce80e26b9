#pragma once

#include "util/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace tzupdater {

// Returned when the latest published release cannot be determined.
inline constexpr const char kUnknownRelease[] = "Unknown";
// Returned when no dataset was activated in the session.
inline constexpr const char kNoActiveRelease[] = "-----";
inline constexpr const char kVersionMarkerName[] = "+VERSION";

// tzdata<release>.tar.gz
std::string ArchiveFileName(std::string_view release);

// First four characters must parse as a year, e.g. "2024a".
bool IsPlausibleReleaseToken(std::string_view token);

// Rejects identifiers that cannot safely name a file or directory.
Result ValidateReleaseId(std::string_view release);

struct ReleaseLayout {
    std::filesystem::path root;
    std::filesystem::path archive;         // {root}/tzdata{release}.tar.gz
    std::filesystem::path source_dir;      // {root}/{release}
    std::filesystem::path compiled_dir;    // {root}/{release}/compiled
    std::filesystem::path version_marker;  // {root}/{release}/compiled/+VERSION

    static ReleaseLayout For(const std::filesystem::path& root, std::string_view release);
};

} // namespace tzupdater
