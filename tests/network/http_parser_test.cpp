#include "tus/network/http_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace tus::network;

namespace {

tus::Result<bool> feed(HttpResponseParser& parser, const std::string& data) {
    return parser.parse(data.data(), data.size());
}

} // namespace

TEST(HttpResponseParser, ParsesContentLengthBody) {
    HttpResponseParser parser;
    auto result = feed(parser,
                       "HTTP/1.1 400 Bad Request\r\n"
                       "Content-Type: text/plain\r\n"
                       "Content-Length: 5\r\n"
                       "\r\n"
                       "oops!");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());

    auto response = parser.get_response();
    EXPECT_EQ(response.status_code, 400);
    EXPECT_EQ(response.reason_phrase, "Bad Request");
    EXPECT_EQ(response.body_as_string(), "oops!");
    EXPECT_EQ(response.find_header("content-type").value_or(""), "text/plain");
}

TEST(HttpResponseParser, AcceptsDataInSmallSlices) {
    const std::string raw =
        "HTTP/1.1 204 No Content\r\n"
        "Tus-Resumable: 1.0.0\r\n"
        "Upload-Offset:   128  \r\n"
        "\r\n";

    HttpResponseParser parser;
    for (std::size_t i = 0; i < raw.size(); ++i) {
        auto result = parser.parse(raw.data() + i, 1);
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value(), i + 1 == raw.size());
    }

    auto response = parser.get_response();
    EXPECT_EQ(response.status_code, 204);
    EXPECT_EQ(response.find_header("Upload-Offset").value_or(""), "128");
}

TEST(HttpResponseParser, DecodesChunkedBody) {
    HttpResponseParser parser;
    auto result = feed(parser,
                       "HTTP/1.1 200 OK\r\n"
                       "Transfer-Encoding: chunked\r\n"
                       "\r\n"
                       "4\r\nWiki\r\n"
                       "6;ext=1\r\npedia \r\n"
                       "0\r\n"
                       "\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.get_response().body_as_string(), "Wikipedia ");
}

TEST(HttpResponseParser, HeadResponseHasNoBody) {
    HttpResponseParser parser(true);
    auto result = feed(parser,
                       "HTTP/1.1 200 OK\r\n"
                       "Upload-Offset: 10\r\n"
                       "Upload-Length: 100\r\n"
                       "Content-Length: 100\r\n"
                       "\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_TRUE(parser.get_response().body.empty());
}

TEST(HttpResponseParser, BodyUntilCloseCompletesOnFinish) {
    HttpResponseParser parser;
    auto result = feed(parser, "HTTP/1.0 500 Internal Server Error\r\n\r\nserver exploded");
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value());

    auto finished = parser.finish();
    ASSERT_TRUE(finished.is_ok());
    EXPECT_TRUE(parser.is_complete());
    EXPECT_EQ(parser.get_response().body_as_string(), "server exploded");
}

TEST(HttpResponseParser, TruncatedResponseFailsOnFinish) {
    HttpResponseParser parser;
    auto result = feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc");
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value());

    auto finished = parser.finish();
    ASSERT_TRUE(finished.is_error());
    EXPECT_EQ(finished.error().kind, tus::ErrorKind::Transport);
}

TEST(HttpResponseParser, RejectsGarbage) {
    HttpResponseParser parser;
    auto result = feed(parser, "SMTP 220 ready\r\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, tus::ErrorKind::Transport);

    parser.reset();
    result = feed(parser, "HTTP/1.1 2x0 OK\r\n");
    EXPECT_TRUE(result.is_error());

    parser.reset();
    result = feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: ten\r\n\r\n");
    EXPECT_TRUE(result.is_error());
}

TEST(HttpResponseParser, RejectsSignedOrOverflowingContentLength) {
    for (const char* length : {"-1", "+5", "99999999999999999999", "0x10", "5 5"}) {
        HttpResponseParser parser;
        auto result = feed(parser, std::string("HTTP/1.1 400 Bad Request\r\nContent-Length: ") + length +
                                       "\r\n\r\nx");
        ASSERT_TRUE(result.is_error()) << length;
        EXPECT_EQ(result.error().kind, tus::ErrorKind::Transport) << length;
    }
}

TEST(HttpResponseParser, RejectsMalformedChunkSize) {
    for (const char* size : {"-1", "+4", "fffffffffffffffffffff", "4g"}) {
        HttpResponseParser parser;
        auto result = feed(parser, std::string("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n") + size +
                                       "\r\nWiki\r\n");
        ASSERT_TRUE(result.is_error()) << size;
        EXPECT_EQ(result.error().kind, tus::ErrorKind::Transport) << size;
    }
}

TEST(HttpResponseParser, LargeDeclaredLengthWaitsForData) {
    HttpResponseParser parser;
    auto result = feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 4000000000\r\n\r\nabc");
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value());
    EXPECT_EQ(parser.get_response().body_as_string(), "abc");
}

TEST(HttpResponseParser, CombinesRepeatedHeaders) {
    HttpResponseParser parser;
    auto result = feed(parser,
                       "HTTP/1.1 204 No Content\r\n"
                       "Tus-Version: 1.0.0\r\n"
                       "Tus-Extension: creation,termination\r\n"
                       "tus-extension: checksum\r\n"
                       "\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());

    auto response = parser.get_response();
    EXPECT_EQ(response.find_header("Tus-Extension").value_or(""), "creation,termination, checksum");
    EXPECT_EQ(response.find_header("Tus-Version").value_or(""), "1.0.0");
}
