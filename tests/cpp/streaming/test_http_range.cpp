#include "streaming/http_range.h"

#include <gtest/gtest.h>

using streaming::RangeKind;

TEST(HttpRange, NoHeaderMeansFullBody) {
    EXPECT_EQ(streaming::parseRangeHeader("", 1000).kind, RangeKind::None);
}

TEST(HttpRange, ClosedAndOpenRanges) {
    auto closed = streaming::parseRangeHeader("bytes=0-99", 1000);
    ASSERT_EQ(closed.kind, RangeKind::Satisfiable);
    EXPECT_EQ(closed.range.start, 0u);
    EXPECT_EQ(closed.range.end, 99u);
    EXPECT_EQ(closed.range.length(), 100u);

    auto open = streaming::parseRangeHeader("bytes=900-", 1000);
    ASSERT_EQ(open.kind, RangeKind::Satisfiable);
    EXPECT_EQ(open.range.start, 900u);
    EXPECT_EQ(open.range.end, 999u);

    // End past EOF is clamped
    auto clamped = streaming::parseRangeHeader("bytes=500-5000", 1000);
    ASSERT_EQ(clamped.kind, RangeKind::Satisfiable);
    EXPECT_EQ(clamped.range.end, 999u);
}

TEST(HttpRange, SuffixRange) {
    auto suffix = streaming::parseRangeHeader("bytes=-100", 1000);
    ASSERT_EQ(suffix.kind, RangeKind::Satisfiable);
    EXPECT_EQ(suffix.range.start, 900u);
    EXPECT_EQ(suffix.range.end, 999u);

    auto whole = streaming::parseRangeHeader("bytes=-5000", 1000);
    ASSERT_EQ(whole.kind, RangeKind::Satisfiable);
    EXPECT_EQ(whole.range.start, 0u);

    EXPECT_EQ(streaming::parseRangeHeader("bytes=-0", 1000).kind, RangeKind::Unsatisfiable);
}

TEST(HttpRange, StartPastEndOfFileIsUnsatisfiable) {
    EXPECT_EQ(streaming::parseRangeHeader("bytes=1000-", 1000).kind, RangeKind::Unsatisfiable);
    EXPECT_EQ(streaming::parseRangeHeader("bytes=0-", 0).kind, RangeKind::Unsatisfiable);
}

TEST(HttpRange, UnusableHeadersAreIgnored) {
    EXPECT_EQ(streaming::parseRangeHeader("items=0-5", 1000).kind, RangeKind::Ignored);
    EXPECT_EQ(streaming::parseRangeHeader("bytes=0-5,10-20", 1000).kind, RangeKind::Ignored);
    EXPECT_EQ(streaming::parseRangeHeader("bytes=50-10", 1000).kind, RangeKind::Ignored);
    EXPECT_EQ(streaming::parseRangeHeader("bytes=abc", 1000).kind, RangeKind::Ignored);
    EXPECT_EQ(streaming::parseRangeHeader("bytes=x-1", 1000).kind, RangeKind::Ignored);
}

TEST(HttpRequestHead, ParsesRequestLineAndHeaders) {
    auto head = streaming::parseRequestHead(
        "GET /stream/abc/a.mp4 HTTP/1.1\r\nHost: 10.0.0.1:9000\r\nRange: bytes=0-\r\n");
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(head->method, "GET");
    EXPECT_EQ(head->target, "/stream/abc/a.mp4");
    EXPECT_EQ(head->header("range"), "bytes=0-");
    EXPECT_EQ(head->header("host"), "10.0.0.1:9000");

    EXPECT_FALSE(streaming::parseRequestHead("GET\r\n").has_value());
    EXPECT_FALSE(streaming::parseRequestHead("GET relative HTTP/1.1\r\n").has_value());
    EXPECT_FALSE(streaming::parseRequestHead("GET / SPDY/3\r\n").has_value());
}

TEST(HttpRequestHead, SessionIdFromStreamPath) {
    EXPECT_EQ(streaming::sessionIdFromTarget("/stream/abc-123/clip.mp4").value_or(""), "abc-123");
    EXPECT_EQ(streaming::sessionIdFromTarget("/stream/abc-123/clip.mp4?t=1").value_or(""),
              "abc-123");
    EXPECT_FALSE(streaming::sessionIdFromTarget("/files/clip.mp4").has_value());
    EXPECT_FALSE(streaming::sessionIdFromTarget("/stream/").has_value());
    EXPECT_FALSE(streaming::sessionIdFromTarget("/stream/../etc/passwd").has_value());
}

TEST(HttpRequestHead, ContentTypes) {
    EXPECT_EQ(streaming::contentTypeForPath("/srv/a.MP4"), "video/mp4");
    EXPECT_EQ(streaming::contentTypeForPath("/srv/a.mkv"), "video/x-matroska");
    EXPECT_EQ(streaming::contentTypeForPath("/srv.d/noext"), "application/octet-stream");
}

TEST(HttpRequestHead, HttpDate) {
    EXPECT_EQ(streaming::formatHttpDate(784111777), "Sun, 06 Nov 1994 08:49:37 GMT");
}
