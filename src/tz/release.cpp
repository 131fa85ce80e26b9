#include "tz/release.hpp"

#include <charconv>

namespace tzupdater {

std::string ArchiveFileName(std::string_view release) {
    return "tzdata" + std::string(release) + ".tar.gz";
}

bool IsPlausibleReleaseToken(std::string_view token) {
    if (token.size() < 4)
        return false;
    int year = 0;
    const char* first = token.data();
    const char* last = token.data() + 4;
    const auto [ptr, ec] = std::from_chars(first, last, year);
    return ec == std::errc() && ptr == last && year > 0;
}

Result ValidateReleaseId(std::string_view release) {
    if (release.empty())
        return Result::Fail(ErrorKind::InvalidArgument, "release identifier is empty");
    if (release == "." || release == ".." || release.find('/') != std::string_view::npos ||
        release.find('\\') != std::string_view::npos) {
        return Result::Fail(ErrorKind::InvalidArgument,
                            "invalid release identifier: " + std::string(release));
    }
    for (const char c : release) {
        if (static_cast<unsigned char>(c) < 0x20 || c == ' ')
            return Result::Fail(ErrorKind::InvalidArgument,
                                "invalid release identifier: " + std::string(release));
    }
    return Result::Ok();
}

ReleaseLayout ReleaseLayout::For(const std::filesystem::path& root, std::string_view release) {
    ReleaseLayout l;
    l.root = root;
    l.archive = root / ArchiveFileName(release);
    l.source_dir = root / std::string(release);
    l.compiled_dir = l.source_dir / "compiled";
    l.version_marker = l.compiled_dir / kVersionMarkerName;
    return l;
}

} // namespace tzupdater
