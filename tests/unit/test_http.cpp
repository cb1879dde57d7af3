#include <gtest/gtest.h>
#include "shortener/http.hpp"

using namespace shortener;

namespace {

int parse_error_status(std::string input) {
    try {
        HttpCodec::parse(input);
    } catch (const ProtocolError& e) {
        return e.status();
    }
    return 0;
}

} // namespace

// Parsing

TEST(HttpCodecTest, ParseSimpleGet) {
    std::string buffer = "GET /abc123 HTTP/1.1\r\nHost: localhost\r\n\r\n";
    auto request = HttpCodec::parse(buffer);
    ASSERT_TRUE(request);
    EXPECT_EQ(request->method, "GET");
    EXPECT_EQ(request->target, "/abc123");
    EXPECT_EQ(request->version, "HTTP/1.1");
    EXPECT_EQ(request->header("Host"), "localhost");
    EXPECT_TRUE(request->body.empty());
    EXPECT_TRUE(buffer.empty());
}

TEST(HttpCodecTest, ParsePostWithBody) {
    std::string buffer =
        "POST /put HTTP/1.1\r\n"
        "Content-Length: 29\r\n"
        "\r\n"
        "https://example.com/long/path";
    auto request = HttpCodec::parse(buffer);
    ASSERT_TRUE(request);
    EXPECT_EQ(request->method, "POST");
    EXPECT_EQ(request->body, "https://example.com/long/path");
    EXPECT_TRUE(buffer.empty());
}

TEST(HttpCodecTest, IncompleteHeadLeavesBufferUntouched) {
    std::string buffer = "GET /abc HTTP/1.1\r\nHost: loc";
    EXPECT_EQ(HttpCodec::parse(buffer), std::nullopt);
    EXPECT_EQ(buffer, "GET /abc HTTP/1.1\r\nHost: loc");
}

TEST(HttpCodecTest, IncompleteBodyWaitsForMore) {
    std::string buffer = "POST /put HTTP/1.1\r\nContent-Length: 10\r\n\r\nhttps";
    EXPECT_EQ(HttpCodec::parse(buffer), std::nullopt);

    buffer += "://a.b";
    auto request = HttpCodec::parse(buffer);
    ASSERT_TRUE(request);
    EXPECT_EQ(request->body, "https://a.");
    EXPECT_EQ(buffer, "b");
}

TEST(HttpCodecTest, PipelinedRequestsParsedOneAtATime) {
    std::string buffer =
        "GET /first HTTP/1.1\r\n\r\n"
        "GET /second HTTP/1.1\r\n\r\n";

    auto first = HttpCodec::parse(buffer);
    ASSERT_TRUE(first);
    EXPECT_EQ(first->target, "/first");

    auto second = HttpCodec::parse(buffer);
    ASSERT_TRUE(second);
    EXPECT_EQ(second->target, "/second");

    EXPECT_EQ(HttpCodec::parse(buffer), std::nullopt);
}

TEST(HttpCodecTest, BareLineFeedsAccepted) {
    std::string buffer = "POST /put HTTP/1.1\nContent-Length: 3\n\nabc";
    auto request = HttpCodec::parse(buffer);
    ASSERT_TRUE(request);
    EXPECT_EQ(request->body, "abc");
}

TEST(HttpCodecTest, LeadingBlankLinesSkipped) {
    std::string buffer = "\r\n\r\nGET / HTTP/1.1\r\n\r\n";
    auto request = HttpCodec::parse(buffer);
    ASSERT_TRUE(request);
    EXPECT_EQ(request->target, "/");
}

TEST(HttpCodecTest, HeaderNamesAreCaseInsensitive) {
    std::string buffer = "POST /put HTTP/1.1\r\ncontent-LENGTH: 2\r\nX-Thing:   spaced  \r\n\r\nok";
    auto request = HttpCodec::parse(buffer);
    ASSERT_TRUE(request);
    EXPECT_EQ(request->body, "ok");
    EXPECT_EQ(request->header("x-thing"), "spaced");
    EXPECT_EQ(request->header("missing"), std::nullopt);
}

TEST(HttpCodecTest, PathDropsQueryAndFragment) {
    HttpRequest request{.method = "GET", .target = "/abc?utm=1#top", .version = "HTTP/1.1"};
    EXPECT_EQ(request.path(), "/abc");
}

TEST(HttpCodecTest, KeepAliveRules) {
    HttpRequest http11{.method = "GET", .target = "/", .version = "HTTP/1.1"};
    EXPECT_TRUE(http11.keep_alive());

    http11.headers.emplace_back("Connection", "close");
    EXPECT_FALSE(http11.keep_alive());

    HttpRequest http10{.method = "GET", .target = "/", .version = "HTTP/1.0"};
    EXPECT_FALSE(http10.keep_alive());

    http10.headers.emplace_back("Connection", "Keep-Alive");
    EXPECT_TRUE(http10.keep_alive());
}

// Rejections

TEST(HttpCodecTest, RejectMalformedRequestLine) {
    EXPECT_EQ(parse_error_status("GET\r\n\r\n"), 400);
    EXPECT_EQ(parse_error_status("GET /\r\n\r\n"), 400);
    EXPECT_EQ(parse_error_status("get / HTTP/1.1\r\n\r\n"), 400);
    EXPECT_EQ(parse_error_status("GET /a b HTTP/1.1\r\n\r\n"), 400);
    EXPECT_EQ(parse_error_status("GET / FTP/1.1\r\n\r\n"), 400);
}

TEST(HttpCodecTest, RejectAbsoluteTarget) {
    EXPECT_EQ(parse_error_status("GET http://example.com/ HTTP/1.1\r\n\r\n"), 400);
}

TEST(HttpCodecTest, RejectUnsupportedVersion) {
    EXPECT_EQ(parse_error_status("GET / HTTP/2.0\r\n\r\n"), 505);
}

TEST(HttpCodecTest, RejectMalformedHeader) {
    EXPECT_EQ(parse_error_status("GET / HTTP/1.1\r\nNoColon\r\n\r\n"), 400);
    EXPECT_EQ(parse_error_status("GET / HTTP/1.1\r\n: empty\r\n\r\n"), 400);
    EXPECT_EQ(parse_error_status("GET / HTTP/1.1\r\nBad Name: x\r\n\r\n"), 400);
}

TEST(HttpCodecTest, RejectInvalidContentLength) {
    EXPECT_EQ(parse_error_status("POST /put HTTP/1.1\r\nContent-Length: abc\r\n\r\n"), 400);
    EXPECT_EQ(parse_error_status("POST /put HTTP/1.1\r\nContent-Length: -1\r\n\r\n"), 400);
    EXPECT_EQ(parse_error_status("POST /put HTTP/1.1\r\nContent-Length: \r\n\r\n"), 400);
}

TEST(HttpCodecTest, RejectChunkedBody) {
    EXPECT_EQ(parse_error_status("POST /put HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"), 501);
}

TEST(HttpCodecTest, RejectOversizedBody) {
    std::string input = "POST /put HTTP/1.1\r\nContent-Length: " +
                        std::to_string(HttpCodec::MAX_BODY_SIZE + 1) + "\r\n\r\n";
    EXPECT_EQ(parse_error_status(input), 413);
}

TEST(HttpCodecTest, RejectOversizedHead) {
    std::string unterminated = "GET / HTTP/1.1\r\nX: " + std::string(HttpCodec::MAX_HEADER_SIZE, 'a');
    EXPECT_EQ(parse_error_status(unterminated), 431);
}

// Formatting

TEST(HttpCodecTest, FormatJsonResponse) {
    HttpResponse response{.status = 201, .body = R"({"ok":true,"msg":"abc1234"})"};
    response.set_header("Content-Type", "application/json");

    EXPECT_EQ(HttpCodec::format(response, true),
              "HTTP/1.1 201 Created\r\n"
              "Content-Type: application/json\r\n"
              "Content-Length: 27\r\n"
              "Connection: keep-alive\r\n"
              "\r\n"
              R"({"ok":true,"msg":"abc1234"})");
}

TEST(HttpCodecTest, FormatRedirectClosingConnection) {
    HttpResponse response{.status = 308};
    response.set_header("Location", "https://example.com/long/path");

    EXPECT_EQ(HttpCodec::format(response, false),
              "HTTP/1.1 308 Permanent Redirect\r\n"
              "Location: https://example.com/long/path\r\n"
              "Content-Length: 0\r\n"
              "Connection: close\r\n"
              "\r\n");
}

TEST(HttpCodecTest, SetHeaderReplacesExisting) {
    HttpResponse response;
    response.set_header("Content-Type", "text/plain");
    response.set_header("content-type", "text/html");
    ASSERT_EQ(response.headers.size(), 1);
    EXPECT_EQ(response.header("Content-Type"), "text/html");
}

TEST(HttpCodecTest, ReasonPhrases) {
    EXPECT_EQ(HttpCodec::reason_phrase(200), "OK");
    EXPECT_EQ(HttpCodec::reason_phrase(404), "Not Found");
    EXPECT_EQ(HttpCodec::reason_phrase(500), "Internal Server Error");
    EXPECT_EQ(HttpCodec::reason_phrase(799), "Unknown");
}
