/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#include "ktrest/internal/http_parser.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstring>
#include <string>

#include "fake_key_server.hpp"
#include "ktrest/internal/http_io.hpp"
#include "ktrest/internal/utils.hpp"

using namespace ktrest;
using namespace ktrest::internal;

namespace {

// Feeds a fixed byte string to recv_http_request in chunks of at most `step`.
struct ScriptedReader {
    std::string data;
    std::size_t step = 7;
    std::size_t off = 0;

    long operator()(char* buf, std::size_t len) {
        if (off >= data.size()) return 0;
        std::size_t n = std::min({len, step, data.size() - off});
        std::memcpy(buf, data.data() + off, n);
        off += n;
        return static_cast<long>(n);
    }
};

} // namespace

TEST(HttpParserTest, RequestLine) {
    HttpRequest R;
    ASSERT_TRUE(parse_request_line("GET /v2/users/bob?epoch=3&app_id=pgp HTTP/1.1", R));
    EXPECT_EQ(R.method, "GET");
    EXPECT_EQ(R.path, "/v2/users/bob");
    EXPECT_EQ(R.query, "epoch=3&app_id=pgp");
    EXPECT_EQ(R.httpver, "HTTP/1.1");

    ASSERT_TRUE(parse_request_line("PUT /v2/users/bob HTTP/1.0", R));
    EXPECT_EQ(R.query, "");
}

TEST(HttpParserTest, RejectsMalformedRequestLine) {
    HttpRequest R;
    EXPECT_FALSE(parse_request_line("", R));
    EXPECT_FALSE(parse_request_line("GET", R));
    EXPECT_FALSE(parse_request_line("GET /x", R));
    EXPECT_FALSE(parse_request_line("GET  /x HTTP/1.1", R));
    EXPECT_FALSE(parse_request_line("GET x HTTP/1.1", R));
    EXPECT_FALSE(parse_request_line("GET /x FTP/1.1", R));
    EXPECT_FALSE(parse_request_line("GET /x HTTP/1.1 extra", R));
}

TEST(HttpParserTest, HeadersAreTrimmedAndCaseInsensitive) {
    HttpRequest R;
    ASSERT_TRUE(parse_request_head(
        "PUT /v2/users/bob HTTP/1.1\r\ncontent-length:  12 \r\nX-Thing: a:b\r\nbogus line", R));
    EXPECT_EQ(hdr_ci(R, "Content-Length"), "12");
    EXPECT_EQ(hdr_ci(R, "x-thing"), "a:b");
    EXPECT_EQ(hdr_ci(R, "Missing"), "");
}

TEST(HttpParserTest, QueryDecoding) {
    auto q = parse_query("search=bob%40example.com&options=a+b&flag&epoch=1&epoch=2&=x");
    EXPECT_EQ(q.at("search"), "bob@example.com");
    EXPECT_EQ(q.at("options"), "a b");
    EXPECT_EQ(q.at("flag"), "");
    EXPECT_EQ(q.at("epoch"), "1");
    EXPECT_TRUE(parse_query("").empty());
}

TEST(HttpParserTest, PercentDecodeKeepsPlus) {
    EXPECT_EQ(percent_decode("a+b%20c"), "a+b c");
    EXPECT_EQ(percent_decode("100%"), "100%");
    EXPECT_EQ(percent_decode("%zz"), "%zz");
}

TEST(HttpParserTest, ContentLength) {
    HttpRequest R;
    std::size_t n = 99;
    EXPECT_TRUE(content_length(R, 10, n));
    EXPECT_EQ(n, 0u);

    R.headers["Content-Length"] = "10";
    EXPECT_TRUE(content_length(R, 10, n));
    EXPECT_EQ(n, 10u);

    R.headers["Content-Length"] = "11";
    EXPECT_FALSE(content_length(R, 10, n));
    R.headers["Content-Length"] = "-1";
    EXPECT_FALSE(content_length(R, 10, n));
    R.headers["Content-Length"] = "4x";
    EXPECT_FALSE(content_length(R, 10, n));
}

TEST(HttpParserTest, KeepAlive) {
    HttpRequest R;
    R.httpver = "HTTP/1.1";
    EXPECT_TRUE(should_keep_alive(R));
    R.headers["Connection"] = "Close";
    EXPECT_FALSE(should_keep_alive(R));

    HttpRequest old;
    old.httpver = "HTTP/1.0";
    EXPECT_FALSE(should_keep_alive(old));
    old.headers["connection"] = "keep-alive";
    EXPECT_TRUE(should_keep_alive(old));
}

TEST(HttpParserTest, SerializeResponse) {
    ServerConfig cfg;
    HttpResponse resp;
    resp.status_code = 404;
    resp.status_text = "Not Found";
    resp.body = "{}";

    const std::string closed = serialize_response(resp, cfg, false);
    EXPECT_EQ(closed.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
    EXPECT_NE(closed.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(closed.find("Content-Length: 2\r\n"), std::string::npos);
    EXPECT_NE(closed.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(closed.substr(closed.size() - 6), "\r\n\r\n{}");

    const std::string ka = serialize_response(resp, cfg, true);
    EXPECT_NE(ka.find("Keep-Alive: timeout=5, max=100\r\n"), std::string::npos);
}

TEST(HttpIoTest, ReadsPipelinedRequests) {
    ServerConfig cfg;
    ScriptedReader rd;
    rd.data = "PUT /v2/users/bob HTTP/1.1\r\nContent-Length: 4\r\n\r\n{\"a\"GET /v2/seh HTTP/1.1\r\n\r\n";

    std::string carry;
    HttpRequest first;
    ASSERT_TRUE(recv_http_request(rd, cfg, carry, first));
    EXPECT_EQ(first.method, "PUT");
    EXPECT_EQ(first.body, "{\"a\"");

    HttpRequest second;
    ASSERT_TRUE(recv_http_request(rd, cfg, carry, second));
    EXPECT_EQ(second.method, "GET");
    EXPECT_EQ(second.path, "/v2/seh");
    EXPECT_EQ(second.body, "");

    HttpRequest none;
    EXPECT_FALSE(recv_http_request(rd, cfg, carry, none));
}

TEST(HttpIoTest, RejectsOversizedAndTruncatedBodies) {
    ServerConfig cfg;
    cfg.max_body = 3;
    std::string carry;

    ScriptedReader big;
    big.data = "PUT /x HTTP/1.1\r\nContent-Length: 4\r\n\r\nabcd";
    HttpRequest R;
    EXPECT_FALSE(recv_http_request(big, cfg, carry, R));

    cfg.max_body = 100;
    carry.clear();
    ScriptedReader cut;
    cut.data = "PUT /x HTTP/1.1\r\nContent-Length: 10\r\n\r\nabc";
    EXPECT_FALSE(recv_http_request(cut, cfg, carry, R));
}

TEST(HttpIoTest, HealthBypassesRoutes) {
    test_support::FakeKeyServer fake;
    RestServer rest(fake);
    HttpRequest R;
    ASSERT_TRUE(parse_request_line("GET /health HTTP/1.1", R));
    HttpResponse resp = dispatch_request(rest, R, "127.0.0.1");
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.body, "{\"status\":\"OK\"}");
    EXPECT_EQ(fake.calls, 0);
}

TEST(UtilsTest, JsonEscape) {
    EXPECT_EQ(json_escape("plain"), "plain");
    EXPECT_EQ(json_escape("a\"b\\c\nd"), "a\\\"b\\\\c\\nd");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\\u0001");
}

TEST(UtilsTest, Sha256) {
    const std::string d = sha256_bin("abc");
    ASSERT_EQ(d.size(), 32u);
    EXPECT_EQ(bytes_to_hex(reinterpret_cast<const unsigned char*>(d.data()), d.size()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
