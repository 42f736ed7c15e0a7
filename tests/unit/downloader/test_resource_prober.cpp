#include <gtest/gtest.h>
#include <parafetch/downloader/downloader.hpp>

#include "support/fake_http_transport.hpp"

#include <string>

using namespace parafetch::downloader;
using parafetch::test_support::FakeHttpTransport;
using parafetch::test_support::make_payload;

TEST(RedirectResolution, AbsoluteLocationPassesThrough) {
    EXPECT_EQ(resolveRedirect("http://a.example/x/y.bin", "https://cdn.example/z.bin"),
              "https://cdn.example/z.bin");
}

TEST(RedirectResolution, RootedPathKeepsSchemeAndAuthority) {
    EXPECT_EQ(resolveRedirect("https://a.example:8443/x/y.bin?q=1", "/mirror/y.bin"),
              "https://a.example:8443/mirror/y.bin");
}

TEST(RedirectResolution, RelativePathResolvesAgainstDirectory) {
    EXPECT_EQ(resolveRedirect("http://a.example/dir/sub/file.bin", "other.bin"),
              "http://a.example/dir/sub/other.bin");
    EXPECT_EQ(resolveRedirect("http://a.example", "file.bin"), "http://a.example/file.bin");
}

TEST(ResourceProber, HeadReportsSizeRangesAndValidators) {
    FakeHttpTransport http;
    http.payload = make_payload(12345);
    http.etag = "\"v1\"";
    http.lastModified = "Tue, 19 Aug 2025 09:00:00 GMT";

    auto r = probeResource(http, "http://a.example/file.bin", TransferOptions{}, 3);
    ASSERT_TRUE(r.ok()) << r.error().message;
    const auto& res = r.value();
    EXPECT_EQ(res.finalUrl, "http://a.example/file.bin");
    ASSERT_TRUE(res.sizeBytes.has_value());
    EXPECT_EQ(*res.sizeBytes, 12345u);
    EXPECT_TRUE(res.acceptsRanges);
    EXPECT_EQ(res.etag.value_or(""), "\"v1\"");
    EXPECT_EQ(res.lastModified.value_or(""), "Tue, 19 Aug 2025 09:00:00 GMT");

    EXPECT_EQ(http.count("HEAD"), 1u);
    EXPECT_EQ(http.count("GET"), 0u);
}

TEST(ResourceProber, FollowsRedirectChainToFinalUrl) {
    FakeHttpTransport http;
    http.payload = make_payload(64);
    http.redirects["http://a.example/start"] = {301, std::string("https://b.example/dl/v1")};
    http.redirects["https://b.example/dl/v1"] = {302, std::string("/files/data.bin")};
    http.redirects["https://b.example/files/data.bin"] = {307, std::string("final.bin")};

    auto r = probeResource(http, "http://a.example/start", TransferOptions{}, 3);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value().finalUrl, "https://b.example/files/final.bin");
    EXPECT_EQ(r.value().sizeBytes.value_or(0), 64u);
    EXPECT_EQ(http.count("HEAD"), 4u);
}

TEST(ResourceProber, RedirectBoundStopsAtLastResponse) {
    FakeHttpTransport http;
    http.payload = make_payload(64);
    http.redirects["http://a.example/0"] = {302, std::string("/1")};
    http.redirects["http://a.example/1"] = {302, std::string("/2")};
    http.redirects["http://a.example/2"] = {302, std::string("/3")};

    auto r = probeResource(http, "http://a.example/0", TransferOptions{}, 1);
    ASSERT_TRUE(r.ok()) << r.error().message;
    // One hop followed; the second redirect response is final
    EXPECT_EQ(r.value().finalUrl, "http://a.example/1");
    EXPECT_EQ(http.count("HEAD"), 2u);
}

TEST(ResourceProber, RedirectWithoutLocationIsFinal) {
    FakeHttpTransport http;
    http.payload = make_payload(64);
    http.redirects["http://a.example/x"] = {302, std::nullopt};

    auto r = probeResource(http, "http://a.example/x", TransferOptions{}, 3);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value().finalUrl, "http://a.example/x");
    EXPECT_EQ(http.count("HEAD"), 1u);
}

TEST(ResourceProber, HeadRejected_FallsBackToSingleByteGet) {
    FakeHttpTransport http;
    http.payload = make_payload(5000);
    http.headStatus = 405;
    http.etag = "\"abc\"";

    auto r = probeResource(http, "http://a.example/file.bin", TransferOptions{}, 3);
    ASSERT_TRUE(r.ok()) << r.error().message;
    // Size comes from Content-Range, not the 1-byte Content-Length
    EXPECT_EQ(r.value().sizeBytes.value_or(0), 5000u);
    EXPECT_TRUE(r.value().acceptsRanges);
    EXPECT_EQ(r.value().etag.value_or(""), "\"abc\"");

    auto reqs = http.requests();
    ASSERT_EQ(reqs.size(), 2u);
    EXPECT_EQ(reqs[1].method, "GET");
    ASSERT_TRUE(reqs[1].range.has_value());
    EXPECT_EQ(reqs[1].range->first, 0u);
    EXPECT_EQ(reqs[1].range->second, 0u);
}

TEST(ResourceProber, HeadWithoutSizeOrRanges_MergesHeadersFromGet) {
    FakeHttpTransport http;
    http.payload = make_payload(300);
    http.acceptRanges = false;
    http.advertiseLength = false;
    http.lastModified = "Wed, 20 Aug 2025 00:00:00 GMT";

    auto r = probeResource(http, "http://a.example/stream", TransferOptions{}, 3);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(http.count("GET"), 1u);
    EXPECT_FALSE(r.value().acceptsRanges);
    EXPECT_FALSE(r.value().sizeBytes.has_value());
    EXPECT_EQ(r.value().lastModified.value_or(""), "Wed, 20 Aug 2025 00:00:00 GMT");
}

TEST(ResourceProber, NetworkFailureIsFatalAndNotRetried) {
    FakeHttpTransport http;
    http.headError = Error{ErrorCode::NetworkError, "HEAD http://a.example/x: Couldn't connect"};

    auto r = probeResource(http, "http://a.example/x", TransferOptions{}, 3);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::ProbeFailed);
    EXPECT_NE(r.error().message.find("Couldn't connect"), std::string::npos);
    EXPECT_EQ(http.requests().size(), 1u);
}

TEST(ResourceProber, EmptyUrlRejected) {
    FakeHttpTransport http;
    auto r = probeResource(http, "", TransferOptions{}, 3);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(http.requests().empty());
}
