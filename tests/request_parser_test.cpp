#include <gtest/gtest.h>

#include <string>

#include "core/Errors.hpp"
#include "http/HeaderValue.hpp"
#include "http/Request.hpp"
#include "http/RequestParser.hpp"

using namespace dropzone;
using namespace dropzone::http;

TEST(RequestParser, ParsesRequestLineAndHeaders) {
    RequestHead head = RequestParser::parse(
        "POST /upload?x=1 HTTP/1.1\r\n"
        "Host: 192.168.1.5:8080\r\n"
        "Content-Type: multipart/form-data; boundary=abc\r\n"
        "Content-Length: 42\r\n");

    EXPECT_EQ(head.methodText, "POST");
    ASSERT_TRUE(head.method.has_value());
    EXPECT_EQ(*head.method, HttpRequest::POST);
    EXPECT_EQ(head.target, "/upload?x=1");
    EXPECT_EQ(head.path, "/upload");
    EXPECT_EQ(head.mediaType, "multipart/form-data");
    EXPECT_TRUE(head.hasContentLength);
    EXPECT_EQ(head.contentLength, 42u);
    EXPECT_TRUE(head.keepAlive);
    EXPECT_EQ(head.header("host"), "192.168.1.5:8080");
    EXPECT_EQ(head.header("content-type"), "multipart/form-data; boundary=abc");
}

TEST(RequestParser, UnknownMethodParsesWithoutEnumValue) {
    RequestHead head = RequestParser::parse("DELETE /upload HTTP/1.1\r\n");
    EXPECT_EQ(head.methodText, "DELETE");
    EXPECT_FALSE(head.method.has_value());
}

TEST(RequestParser, ConnectionSemantics) {
    EXPECT_FALSE(RequestParser::parse("GET / HTTP/1.0\r\n").keepAlive);
    EXPECT_TRUE(RequestParser::parse("GET / HTTP/1.0\r\nConnection: keep-alive\r\n").keepAlive);
    EXPECT_FALSE(RequestParser::parse("GET / HTTP/1.1\r\nConnection: Close\r\n").keepAlive);
}

TEST(RequestParser, RejectsMalformedRequestLines) {
    EXPECT_THROW(RequestParser::parse("GET /\r\n"), MalformedRequestError);
    EXPECT_THROW(RequestParser::parse("GET / HTTP/2.0\r\n"), MalformedRequestError);
    EXPECT_THROW(RequestParser::parse("GET relative HTTP/1.1\r\n"), MalformedRequestError);
    EXPECT_THROW(RequestParser::parse("GET / HTTP/1.1 extra\r\n"), MalformedRequestError);
    EXPECT_THROW(RequestParser::parse(""), MalformedRequestError);
}

TEST(RequestParser, RejectsMalformedHeaders) {
    EXPECT_THROW(RequestParser::parse("GET / HTTP/1.1\r\nNoColon\r\n"), MalformedRequestError);
    EXPECT_THROW(RequestParser::parse("GET / HTTP/1.1\r\n: empty-name\r\n"), MalformedRequestError);
    EXPECT_THROW(RequestParser::parse("GET / HTTP/1.1\r\nBad Name: x\r\n"), MalformedRequestError);
    EXPECT_THROW(RequestParser::parse("GET / HTTP/1.1\r\nA: b\r\n folded\r\n"), MalformedRequestError);
}

TEST(RequestParser, ContentLengthValidation) {
    EXPECT_THROW(RequestParser::parse("POST / HTTP/1.1\r\nContent-Length: -1\r\n"), MalformedRequestError);
    EXPECT_THROW(RequestParser::parse("POST / HTTP/1.1\r\nContent-Length: 12abc\r\n"), MalformedRequestError);
    EXPECT_THROW(RequestParser::parse("POST / HTTP/1.1\r\nContent-Length: 99999999999999999999999\r\n"),
                 MalformedRequestError);
    EXPECT_THROW(RequestParser::parse("POST / HTTP/1.1\r\nContent-Length: 5\r\nContent-Length: 6\r\n"),
                 MalformedRequestError);

    RequestHead same = RequestParser::parse("POST / HTTP/1.1\r\nContent-Length: 5\r\nContent-Length: 5\r\n");
    EXPECT_EQ(same.contentLength, 5u);
}

TEST(RequestParser, ExpectContinue) {
    EXPECT_TRUE(RequestParser::parse("POST / HTTP/1.1\r\nExpect: 100-Continue\r\n").expectContinue);
    EXPECT_FALSE(RequestParser::parse("POST / HTTP/1.1\r\nExpect: something-else\r\n").expectContinue);
    EXPECT_FALSE(RequestParser::parse("POST / HTTP/1.1\r\n").expectContinue);
}

TEST(RequestParser, ChunkedTransferEncodingNeedsLength) {
    try {
        RequestParser::parse("POST /upload HTTP/1.1\r\nTransfer-Encoding: chunked\r\n");
        FAIL() << "expected LengthRequiredError";
    } catch (const LengthRequiredError& e) {
        EXPECT_EQ(e.status(), 411);
    }
    EXPECT_NO_THROW(RequestParser::parse("POST /upload HTTP/1.1\r\nTransfer-Encoding: identity\r\n"));
}

TEST(HeaderValue, Parameters) {
    auto params = HeaderValue::parameters("form-data; name=\"file\"; FILENAME=\"a b.txt\"; x=plain");
    EXPECT_EQ(params["name"], "file");
    EXPECT_EQ(params["filename"], "a b.txt");
    EXPECT_EQ(params["x"], "plain");
}

TEST(HeaderValue, MediaType) {
    EXPECT_EQ(HeaderValue::mediaType("Text/Plain; charset=UTF-8"), "text/plain");
    EXPECT_EQ(HeaderValue::mediaType("  application/json  "), "application/json");
}

TEST(HeaderValue, PercentDecode) {
    std::string out;
    EXPECT_TRUE(HeaderValue::percentDecode("a%20b%2Fc", out));
    EXPECT_EQ(out, "a b/c");
    EXPECT_FALSE(HeaderValue::percentDecode("bad%2", out));
    EXPECT_FALSE(HeaderValue::percentDecode("bad%zz", out));
}

TEST(HeaderValue, Utf8Validation) {
    EXPECT_TRUE(isValidUtf8("plain ascii"));
    EXPECT_TRUE(isValidUtf8("h\xC3\xA9llo \xF0\x9F\x98\x80"));
    EXPECT_FALSE(isValidUtf8("\xC3"));
    EXPECT_FALSE(isValidUtf8("\xC0\xAF"));          // overlong '/'
    EXPECT_FALSE(isValidUtf8("\xED\xA0\x80"));      // surrogate
    EXPECT_FALSE(isValidUtf8("\xF4\x90\x80\x80"));  // past U+10FFFF
    EXPECT_FALSE(isValidUtf8("\xFF"));
}

TEST(Response, SerializeAddsCorsAndLength) {
    Response res = Response::ok({{"status", "ok"}});
    std::string wire = res.serialize(true);

    EXPECT_EQ(wire.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(wire.find("Access-Control-Allow-Origin: *\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Content-Length: " + std::to_string(res.body.size()) + "\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Connection: keep-alive\r\n"), std::string::npos);
    EXPECT_EQ(wire.substr(wire.size() - res.body.size()), res.body);
}

TEST(Response, ErrorBodyIsJson) {
    Response res = Response::error(413, "Too big");
    auto body = nlohmann::json::parse(res.body);
    EXPECT_EQ(body["status"].get<std::string>(), "error");
    EXPECT_EQ(body["message"].get<std::string>(), "Too big");
    EXPECT_NE(res.serialize(false).find("Connection: close\r\n"), std::string::npos);
    EXPECT_STREQ(statusText(413), "Payload Too Large");
}
