#include <gtest/gtest.h>
#include <parafetch/downloader/downloader.hpp>

#include <string>
#include <vector>

using namespace parafetch::downloader;

TEST(HttpHeaderParsing, StatusLine_Http11WithReason) {
    long status = 0;
    std::string reason;
    ASSERT_TRUE(parseStatusLine("HTTP/1.1 206 Partial Content\r\n", status, reason));
    EXPECT_EQ(status, 206);
    EXPECT_EQ(reason, "Partial Content");
}

TEST(HttpHeaderParsing, StatusLine_Http2WithoutReason) {
    long status = 0;
    std::string reason = "stale";
    ASSERT_TRUE(parseStatusLine("HTTP/2 200\r\n", status, reason));
    EXPECT_EQ(status, 200);
    EXPECT_TRUE(reason.empty());
}

TEST(HttpHeaderParsing, StatusLine_RejectsHeaderLines) {
    long status = 0;
    std::string reason;
    EXPECT_FALSE(parseStatusLine("Content-Length: 12\r\n", status, reason));
    EXPECT_FALSE(parseStatusLine("HTTP/1.1 abc\r\n", status, reason));
    EXPECT_FALSE(parseStatusLine("\r\n", status, reason));
    EXPECT_EQ(status, 0);
}

TEST(HttpHeaderParsing, HeaderLine_LowercasesNameAndTrimsValue) {
    auto h = parseHeaderLine("ETag:   \"abc123-xyz\"  \r\n");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->name, "etag");
    EXPECT_EQ(h->value, "\"abc123-xyz\"");

    auto lm = parseHeaderLine("LAST-MODIFIED: Tue, 19 Aug 2025 09:00:00 GMT\r\n");
    ASSERT_TRUE(lm.has_value());
    EXPECT_EQ(lm->name, "last-modified");
    // Only the first colon separates name and value
    EXPECT_EQ(lm->value, "Tue, 19 Aug 2025 09:00:00 GMT");
}

TEST(HttpHeaderParsing, HeaderLine_IgnoresLinesWithoutName) {
    EXPECT_FALSE(parseHeaderLine("\r\n").has_value());
    EXPECT_FALSE(parseHeaderLine("no colon here").has_value());
    EXPECT_FALSE(parseHeaderLine(": empty name").has_value());
}

TEST(HttpHeaderParsing, ResponseHeaderLookup_FirstOccurrenceWins) {
    HttpResponse r;
    r.headers = {{"accept-ranges", "bytes"}, {"etag", "\"one\""}, {"etag", "\"two\""}};
    EXPECT_EQ(r.header("etag").value_or(""), "\"one\"");
    EXPECT_EQ(r.header("accept-ranges").value_or(""), "bytes");
    EXPECT_FALSE(r.header("content-length").has_value());
}

TEST(HttpHeaderParsing, DefaultRequestHeaders_CarryUserAgentAndAccept) {
    TransferOptions opts;
    auto headers = defaultRequestHeaders(opts);
    ASSERT_EQ(headers.size(), 2u);
    EXPECT_EQ(headers[0].name, "User-Agent");
    EXPECT_EQ(headers[0].value, "parafetch/1.1 (+libcurl)");
    EXPECT_EQ(headers[1].name, "Accept");
    EXPECT_EQ(headers[1].value, "*/*");

    opts.userAgent = "custom/2.0";
    EXPECT_EQ(defaultRequestHeaders(opts)[0].value, "custom/2.0");
}

TEST(HttpHeaderParsing, RedirectStatuses) {
    for (long s : {301L, 302L, 303L, 307L, 308L})
        EXPECT_TRUE(isRedirectStatus(s)) << s;
    for (long s : {200L, 204L, 206L, 300L, 304L, 404L})
        EXPECT_FALSE(isRedirectStatus(s)) << s;
}
