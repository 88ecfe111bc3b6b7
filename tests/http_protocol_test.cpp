#include "network/http_protocol.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace segedit::network;

namespace {

HttpRequest expect_request(std::string_view head) {
    auto r = parse_request_head(head);
    if (auto* err = std::get_if<HttpError>(&r)) {
        ADD_FAILURE() << "unexpected " << err->status << ": " << err->message;
        return {};
    }
    return std::get<HttpRequest>(r);
}

unsigned expect_error(std::string_view head) {
    auto r = parse_request_head(head);
    if (!std::holds_alternative<HttpError>(r)) {
        ADD_FAILURE() << "expected an error for: " << head;
        return 0;
    }
    return std::get<HttpError>(r).status;
}

} // namespace

// ── Request line ──────────────────────────────────────────────────────────────

TEST(ParseRequestHead, BasicGet) {
    auto req = expect_request("GET /api/projects HTTP/1.1\r\nHost: localhost\r\n\r\n");
    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.path, "/api/projects");
    EXPECT_EQ(req.version_minor, 1);
    EXPECT_EQ(req.header("host"), "localhost");
    EXPECT_EQ(req.header("HOST"), "localhost");
    EXPECT_TRUE(req.query.empty());
}

TEST(ParseRequestHead, DecodesPathAndQuery) {
    auto req = expect_request(
        "GET /api/My%20Show/segments?chunk_id=3&note=a+b%21 HTTP/1.1\r\n\r\n");
    EXPECT_EQ(req.target, "/api/My%20Show/segments?chunk_id=3&note=a+b%21");
    EXPECT_EQ(req.path, "/api/My Show/segments");
    EXPECT_EQ(req.query.at("chunk_id"), "3");
    EXPECT_EQ(req.query.at("note"), "a b!");
}

TEST(ParseRequestHead, PlusInPathIsLiteral) {
    EXPECT_EQ(expect_request("GET /a+b HTTP/1.1\r\n\r\n").path, "/a+b");
}

TEST(ParseRequestHead, AcceptsBareLf) {
    auto req = expect_request("PUT /x HTTP/1.0\nContent-Length: 5\n\n");
    EXPECT_EQ(req.method, "PUT");
    EXPECT_EQ(req.version_minor, 0);
    EXPECT_EQ(req.content_length(), 5u);
}

TEST(ParseRequestHead, RepeatedHeadersAreJoined) {
    auto req = expect_request("GET / HTTP/1.1\r\nX-A: 1\r\nx-a: 2\r\n\r\n");
    EXPECT_EQ(req.header("x-a"), "1, 2");
}

TEST(ParseRequestHead, Errors) {
    EXPECT_EQ(expect_error("\r\n\r\n"), 400u);
    EXPECT_EQ(expect_error("GET\r\n\r\n"), 400u);
    EXPECT_EQ(expect_error("GET /x\r\n\r\n"), 400u);
    EXPECT_EQ(expect_error("G(T /x HTTP/1.1\r\n\r\n"), 400u);
    EXPECT_EQ(expect_error("GET x HTTP/1.1\r\n\r\n"), 400u);
    EXPECT_EQ(expect_error("GET /x HTTP/2.0\r\n\r\n"), 505u);
    EXPECT_EQ(expect_error("GET /%zz HTTP/1.1\r\n\r\n"), 400u);
    EXPECT_EQ(expect_error("GET /x?a=%2 HTTP/1.1\r\n\r\n"), 400u);
    EXPECT_EQ(expect_error("GET /x HTTP/1.1\r\nno colon here\r\n\r\n"), 400u);
    EXPECT_EQ(expect_error("GET /x HTTP/1.1\r\n: empty\r\n\r\n"), 400u);
    EXPECT_EQ(expect_error("PUT /x HTTP/1.1\r\nContent-Length: ten\r\n\r\n"), 400u);
    EXPECT_EQ(expect_error("PUT /x HTTP/1.1\r\nContent-Length: 99999999\r\n\r\n"), 413u);
    EXPECT_EQ(expect_error("PUT /x HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"), 501u);
}

TEST(ParseRequestHead, OversizedHead) {
    std::string head = "GET / HTTP/1.1\r\nX-Big: " + std::string(kMaxHeadBytes, 'a') + "\r\n\r\n";
    EXPECT_EQ(expect_error(head), 431u);
}

// ── Keep-alive ───────────────────────────────────────────────────────────────

TEST(HttpRequest, KeepAliveDefaults) {
    EXPECT_TRUE(expect_request("GET / HTTP/1.1\r\n\r\n").keep_alive());
    EXPECT_FALSE(expect_request("GET / HTTP/1.0\r\n\r\n").keep_alive());
    EXPECT_FALSE(expect_request("GET / HTTP/1.1\r\nConnection: Close\r\n\r\n").keep_alive());
    EXPECT_TRUE(expect_request("GET / HTTP/1.0\r\nConnection: keep-alive\r\n\r\n").keep_alive());
}

// ── Responses ─────────────────────────────────────────────────────────────────

TEST(HttpResponse, SetHeaderReplacesCaseInsensitively) {
    HttpResponse resp;
    resp.set_header("Content-Type", "text/plain");
    resp.set_header("content-type", "application/json");
    ASSERT_EQ(resp.headers.size(), 1u);
    EXPECT_EQ(resp.header("CONTENT-TYPE"), "application/json");
}

TEST(SerializeResponse, AddsLengthAndConnection) {
    HttpResponse resp;
    resp.status = 404;
    resp.set_header("Content-Type", "application/json");
    resp.body = R"({"detail":"x"})";
    EXPECT_EQ(serialize_response(resp, true),
              "HTTP/1.1 404 Not Found\r\n"
              "Content-Type: application/json\r\n"
              "Content-Length: 14\r\n"
              "Connection: keep-alive\r\n"
              "\r\n"
              R"({"detail":"x"})");
}

TEST(SerializeResponse, KeepsExplicitContentLength) {
    HttpResponse resp;
    resp.status = 206;
    resp.set_header("Content-Length", "100");
    auto head = serialize_response_head(resp, 100, false);
    EXPECT_EQ(head,
              "HTTP/1.1 206 Partial Content\r\n"
              "Content-Length: 100\r\n"
              "Connection: close\r\n"
              "\r\n");
}

TEST(SerializeResponse, ReasonPhrases) {
    EXPECT_EQ(reason_phrase(416), "Range Not Satisfiable");
    EXPECT_EQ(reason_phrase(299), "Unknown");
}

// ── Helpers ───────────────────────────────────────────────────────────────────

TEST(PercentDecode, Basics) {
    EXPECT_EQ(percent_decode("a%2Fb", false), "a/b");
    EXPECT_EQ(percent_decode("a+b", true), "a b");
    EXPECT_EQ(percent_decode("a+b", false), "a+b");
    EXPECT_FALSE(percent_decode("%4", false).has_value());
    EXPECT_FALSE(percent_decode("%g0", false).has_value());
}

TEST(ToLower, AsciiOnly) {
    EXPECT_EQ(to_lower("Content-Type"), "content-type");
}
