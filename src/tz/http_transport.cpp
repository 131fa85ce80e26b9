#include "tz/http_transport.hpp"

#include "util/logger.hpp"

#include <httplib.h>

#include <span>
#include <string_view>

namespace tzupdater {

namespace {

FetchOutcome FromError(httplib::Error err) {
    const std::string what = httplib::to_string(err);
    switch (err) {
        case httplib::Error::Connection:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::SSLConnection:
        case httplib::Error::BindIPAddress:
            return FetchOutcome::Fail(FetchStatus::Unreachable, 0, "host unreachable: " + what);
        default:
            return FetchOutcome::Fail(FetchStatus::Failed, 0, what);
    }
}

FetchOutcome FromStatus(int status) {
    if (status >= 200 && status < 300)
        return FetchOutcome::Ok(status);
    if (status == 404)
        return FetchOutcome::Fail(FetchStatus::NotFound, status, "404 not found");
    return FetchOutcome::Fail(FetchStatus::Failed, status, "HTTP status " + std::to_string(status));
}

void Configure(httplib::Client& cli, const HttplibTransport::Options& opt) {
    cli.set_follow_location(true);
    cli.set_connection_timeout(static_cast<time_t>(opt.connect_timeout_sec), 0);
    cli.set_read_timeout(static_cast<time_t>(opt.read_timeout_sec), 0);
}

} // namespace

Result SplitUrl(const std::string& url, std::string& origin, std::string& path) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return Result::Fail(ErrorKind::InvalidArgument, "URL without scheme: " + url);
    }
    const std::string_view scheme(url.data(), scheme_end);
    if (scheme != "http" && scheme != "https") {
        return Result::Fail(ErrorKind::InvalidArgument, "unsupported URL scheme: " + url);
    }

    const auto host_begin = scheme_end + 3;
    const auto path_begin = url.find('/', host_begin);
    if (path_begin == host_begin) {
        return Result::Fail(ErrorKind::InvalidArgument, "URL without host: " + url);
    }

    if (path_begin == std::string::npos) {
        origin = url;
        path = "/";
    } else {
        origin = url.substr(0, path_begin);
        path = url.substr(path_begin);
    }
    if (origin.size() == host_begin) {
        return Result::Fail(ErrorKind::InvalidArgument, "URL without host: " + url);
    }
    return Result::Ok();
}

FetchOutcome HttplibTransport::GetText(const std::string& url, std::string& body) {
    std::string origin, path;
    auto split = SplitUrl(url, origin, path);
    if (!split.is_ok())
        return FetchOutcome::Fail(FetchStatus::Failed, 0, split.message());

    httplib::Client cli(origin);
    Configure(cli, opt_);

    LogDebug("GET %s", url.c_str());
    auto res = cli.Get(path);
    if (!res)
        return FromError(res.error());

    auto outcome = FromStatus(res->status);
    if (outcome.is_ok())
        body = res->body;
    return outcome;
}

FetchOutcome HttplibTransport::Download(const std::string& url, IWriter& sink, IProgress* progress) {
    std::string origin, path;
    auto split = SplitUrl(url, origin, path);
    if (!split.is_ok())
        return FetchOutcome::Fail(FetchStatus::Failed, 0, split.message());

    httplib::Client cli(origin);
    Configure(cli, opt_);

    // Only the body of the final 2xx response is written to the sink.
    int current_status = 0;
    Result write_result = Result::Ok();
    const std::string label = path.substr(path.rfind('/') + 1);

    LogDebug("GET %s (download)", url.c_str());
    auto res = cli.Get(
        path,
        [&](const httplib::Response& response) {
            current_status = response.status;
            return true;
        },
        [&](const char* data, size_t len) {
            if (current_status < 200 || current_status >= 300)
                return true;
            write_result = sink.WriteAll(std::span<const std::uint8_t>(
                reinterpret_cast<const std::uint8_t*>(data), len));
            return write_result.is_ok();
        },
        [&](std::uint64_t current, std::uint64_t total) {
            if (progress && current_status >= 200 && current_status < 300) {
                ProgressEvent e{};
                e.label = label;
                e.done = current;
                e.total = total;
                progress->OnProgress(e);
            }
            return true;
        });

    if (!write_result.is_ok())
        return FetchOutcome::Fail(FetchStatus::Failed, current_status,
                                  "writing download failed: " + write_result.message());
    if (!res)
        return FromError(res.error());
    return FromStatus(res->status);
}

} // namespace tzupdater
