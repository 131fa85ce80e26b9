#pragma once

#include "tz/http_transport.hpp"
#include "tz/session_context.hpp"

#include <expected>
#include <string>

namespace tzupdater {

class VersionResolver {
  public:
    VersionResolver(IHttpTransport& transport, std::string page_url);

    // Latest release published on the IANA page, or kUnknownRelease. The
    // first answer, Unknown included, is memoized in `ctx`.
    std::string ResolveLatest(SessionContext& ctx);

    // Extracts the token following <span id="version"> and checks it looks
    // like a release (four-digit year prefix).
    static std::expected<std::string, std::string> ParseVersionPage(const std::string& html);

    const std::string& PageUrl() const { return page_url_; }

  private:
    std::string Fetch();

    IHttpTransport& transport_;
    std::string page_url_;
};

} // namespace tzupdater
