#pragma once

#include "io/io.hpp"
#include "tz/progress.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace tzupdater {

enum class FetchStatus {
    Ok,
    NotFound,     // HTTP 404
    Unreachable,  // DNS, connect, TLS handshake or connect timeout
    Failed,       // anything else
};

struct FetchOutcome {
    FetchStatus status = FetchStatus::Ok;
    int http_status = 0;
    std::string message;

    bool is_ok() const { return status == FetchStatus::Ok; }

    static FetchOutcome Ok(int http_status) { return {FetchStatus::Ok, http_status, {}}; }
    static FetchOutcome Fail(FetchStatus s, int http_status, std::string m) {
        return {s, http_status, std::move(m)};
    }
};

class IHttpTransport {
  public:
    virtual ~IHttpTransport() = default;

    // GET `url` into `body`.
    virtual FetchOutcome GetText(const std::string& url, std::string& body) = 0;

    // GET `url` streaming the payload into `sink`. `progress` may be null.
    virtual FetchOutcome Download(const std::string& url, IWriter& sink, IProgress* progress) = 0;
};

// "https://host:port/a/b" -> origin "https://host:port", path "/a/b".
Result SplitUrl(const std::string& url, std::string& origin, std::string& path);

class HttplibTransport final : public IHttpTransport {
  public:
    struct Options {
        std::uint64_t connect_timeout_sec = 10;
        std::uint64_t read_timeout_sec = 60;
    };

    HttplibTransport() = default;
    explicit HttplibTransport(const Options& opt) : opt_(opt) {}

    FetchOutcome GetText(const std::string& url, std::string& body) override;
    FetchOutcome Download(const std::string& url, IWriter& sink, IProgress* progress) override;

  private:
    Options opt_{};
};

} // namespace tzupdater
