#include "tz/version_resolver.hpp"

#include "tz/release.hpp"
#include "util/logger.hpp"

#include <string_view>

namespace tzupdater {

namespace {

constexpr std::string_view kVersionMarker = "<span id=\"version\">";

std::string_view Trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r' || s.front() == '\n'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n'))
        s.remove_suffix(1);
    return s;
}

} // namespace

VersionResolver::VersionResolver(IHttpTransport& transport, std::string page_url)
    : transport_(transport), page_url_(std::move(page_url)) {}

std::expected<std::string, std::string> VersionResolver::ParseVersionPage(const std::string& html) {
    const auto marker = html.find(kVersionMarker);
    if (marker == std::string::npos) {
        return std::unexpected("version marker not found");
    }

    const auto begin = marker + kVersionMarker.size();
    auto end = html.find('<', begin);
    const auto eol = html.find('\n', begin);
    if (end == std::string::npos || (eol != std::string::npos && eol < end))
        end = eol;

    const std::string_view raw = (end == std::string::npos)
                                     ? std::string_view(html).substr(begin)
                                     : std::string_view(html).substr(begin, end - begin);
    const std::string token(Trim(raw));

    if (!IsPlausibleReleaseToken(token)) {
        return std::unexpected("unexpected version token '" + token + "'");
    }
    return token;
}

std::string VersionResolver::ResolveLatest(SessionContext& ctx) {
    if (ctx.latest_release) {
        return *ctx.latest_release;
    }

    ctx.latest_release = Fetch();
    return *ctx.latest_release;
}

std::string VersionResolver::Fetch() {
    std::string html;
    const FetchOutcome outcome = transport_.GetText(page_url_, html);
    if (!outcome.is_ok()) {
        LogWarn("Error when retrieving the name of the latest tz database at %s: %s",
                page_url_.c_str(), outcome.message.c_str());
        LogWarn("This might be a temporary problem.");
        return kUnknownRelease;
    }

    auto parsed = ParseVersionPage(html);
    if (!parsed) {
        LogWarn("Cannot retrieve latest tz database name from the IANA (%s). "
                "The html structure might have changed.",
                parsed.error().c_str());
        return kUnknownRelease;
    }

    LogDebug("Latest published tz database: %s", parsed->c_str());
    return *parsed;
}

} // namespace tzupdater
