#include <gtest/gtest.h>

#include "tz/http_transport.hpp"

namespace tzupdater {

TEST(HttpTransportTest, SplitsUrlIntoOriginAndPath) {
    std::string origin, path;
    ASSERT_TRUE(SplitUrl("https://data.iana.org/time-zones/releases/tzdata2024a.tar.gz", origin, path).is_ok());
    EXPECT_EQ(origin, "https://data.iana.org");
    EXPECT_EQ(path, "/time-zones/releases/tzdata2024a.tar.gz");
}

TEST(HttpTransportTest, KeepsPortInOrigin) {
    std::string origin, path;
    ASSERT_TRUE(SplitUrl("http://127.0.0.1:8080/tz", origin, path).is_ok());
    EXPECT_EQ(origin, "http://127.0.0.1:8080");
    EXPECT_EQ(path, "/tz");
}

TEST(HttpTransportTest, BareHostGetsRootPath) {
    std::string origin, path;
    ASSERT_TRUE(SplitUrl("https://www.iana.org", origin, path).is_ok());
    EXPECT_EQ(origin, "https://www.iana.org");
    EXPECT_EQ(path, "/");
}

TEST(HttpTransportTest, RejectsMalformedUrls) {
    std::string origin, path;
    EXPECT_FALSE(SplitUrl("www.iana.org/time-zones", origin, path).is_ok());
    EXPECT_FALSE(SplitUrl("ftp://ftp.iana.org/tz", origin, path).is_ok());
    EXPECT_FALSE(SplitUrl("https:///path", origin, path).is_ok());
    EXPECT_FALSE(SplitUrl("https://", origin, path).is_ok());
}

TEST(HttpTransportTest, UnreachableHostIsClassified) {
    HttplibTransport::Options opt;
    opt.connect_timeout_sec = 1;
    opt.read_timeout_sec = 1;
    HttplibTransport transport(opt);

    // Port 1 on loopback refuses connections.
    std::string body;
    const FetchOutcome outcome = transport.GetText("http://127.0.0.1:1/time-zones", body);
    EXPECT_EQ(outcome.status, FetchStatus::Unreachable);
    EXPECT_TRUE(body.empty());
}

} // namespace tzupdater
