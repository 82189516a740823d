#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "core/Errors.hpp"
#include "core/Log.hpp"
#include "http/RequestParser.hpp"
#include "server/RequestDispatcher.hpp"

using namespace dropzone;
using dropzone::test::HttpResult;
using dropzone::test::ScriptedConnection;

namespace {

// Responses written back to back on one connection
std::vector<HttpResult> splitResponses(const std::string& output) {
    std::vector<HttpResult> out;
    size_t pos = 0;
    while (pos < output.size()) {
        size_t headEnd = output.find("\r\n\r\n", pos);
        if (headEnd == std::string::npos) break;
        HttpResult res = test::parseResponse(output.substr(pos));
        size_t length = std::stoul(res.headers["content-length"]);
        out.push_back(res);
        pos = headEnd + 4 + length;
    }
    return out;
}

class RequestDispatcherTest : public ::testing::Test {
protected:
    RequestDispatcherTest()
        : tmp("dispatcher"),
          storage(tmp.path()),
          relay(console),
          uploads(storage, std::nullopt),
          messages(relay, 1024),
          dispatcher(uploads, messages) {}

    void SetUp() override { Log::setColorEnabled(false); }

    Route classify(const std::string& requestLine) {
        return dispatcher.classify(http::RequestParser::parse(requestLine + "\r\n"));
    }

    std::vector<HttpResult> serve(const std::string& input, size_t chunk = 4096) {
        ScriptedConnection conn(input, chunk);
        dispatcher.serve(conn);
        return splitResponses(conn.output());
    }

    test::TempDir tmp;
    FileStorage storage;
    std::ostringstream console;
    MessageRelay relay;
    UploadHandler uploads;
    MessageHandler messages;
    RequestDispatcher dispatcher;
};

std::string messageRequest(const std::string& text, bool close = false) {
    return "POST /message HTTP/1.1\r\nContent-Type: text/plain\r\nContent-Length: " +
           std::to_string(text.size()) + "\r\n" + (close ? "Connection: close\r\n" : "") + "\r\n" + text;
}

} // namespace

TEST_F(RequestDispatcherTest, ClassifiesKnownRoutes) {
    EXPECT_EQ(classify("GET / HTTP/1.1").kind, RequestKind::StaticAsset);
    EXPECT_EQ(classify("GET /index.html HTTP/1.1").kind, RequestKind::StaticAsset);
    EXPECT_EQ(classify("GET /favicon.svg HTTP/1.1").kind, RequestKind::StaticAsset);
    EXPECT_EQ(classify("POST /upload HTTP/1.1").kind, RequestKind::Upload);
    EXPECT_EQ(classify("POST /message?from=phone HTTP/1.1").kind, RequestKind::Message);
    EXPECT_EQ(classify("OPTIONS /upload HTTP/1.1").kind, RequestKind::Preflight);
}

TEST_F(RequestDispatcherTest, ClassifiesRejections) {
    Route unknownPath = classify("GET /etc/passwd HTTP/1.1");
    EXPECT_EQ(unknownPath.kind, RequestKind::Unrecognized);
    EXPECT_EQ(unknownPath.rejectStatus, 404);

    Route wrongMethod = classify("GET /upload HTTP/1.1");
    EXPECT_EQ(wrongMethod.kind, RequestKind::Unrecognized);
    EXPECT_EQ(wrongMethod.rejectStatus, 405);

    Route unknownMethod = classify("DELETE /message HTTP/1.1");
    EXPECT_EQ(unknownMethod.rejectStatus, 405);

    EXPECT_EQ(classify("OPTIONS /missing HTTP/1.1").rejectStatus, 404);
}

TEST_F(RequestDispatcherTest, KeepAliveServesPipelinedRequests) {
    std::string input = "GET / HTTP/1.1\r\nHost: x\r\n\r\n" + messageRequest("hello", true);

    auto responses = serve(input, 5);

    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0].status, 200);
    EXPECT_EQ(responses[0].headers["content-type"].rfind("text/html", 0), 0u);
    EXPECT_EQ(responses[0].headers["connection"], "keep-alive");
    EXPECT_NE(responses[0].body.find("<html"), std::string::npos);

    EXPECT_EQ(responses[1].status, 200);
    EXPECT_EQ(responses[1].headers["connection"], "close");
    EXPECT_NE(console.str().find("  hello\n"), std::string::npos);
}

TEST_F(RequestDispatcherTest, Http10ClosesByDefault) {
    auto responses = serve("GET /favicon.svg HTTP/1.0\r\n\r\nGET / HTTP/1.0\r\n\r\n");
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].headers["content-type"], "image/svg+xml");
    EXPECT_EQ(responses[0].headers["connection"], "close");
}

TEST_F(RequestDispatcherTest, EveryResponseAllowsAnyOrigin) {
    auto responses = serve("GET /nope HTTP/1.1\r\n\r\nGET / HTTP/1.1\r\nConnection: close\r\n\r\n");
    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0].status, 404);
    for (auto& res : responses) {
        EXPECT_EQ(res.headers["access-control-allow-origin"], "*");
    }
}

TEST_F(RequestDispatcherTest, PreflightAnswersNoContent) {
    auto responses = serve("OPTIONS /upload HTTP/1.1\r\nConnection: close\r\n\r\n");
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].status, 204);
    EXPECT_EQ(responses[0].headers["access-control-allow-methods"], "GET, POST, OPTIONS");
    EXPECT_TRUE(responses[0].body.empty());
}

TEST_F(RequestDispatcherTest, WrongMethodListsAllowed) {
    auto responses = serve("PUT /upload HTTP/1.1\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].status, 405);
    EXPECT_EQ(responses[0].headers["allow"], "POST, OPTIONS");
}

TEST_F(RequestDispatcherTest, MalformedHeadClosesWith400) {
    auto responses = serve("BROKEN\r\n\r\nGET / HTTP/1.1\r\n\r\n");
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].status, 400);
    EXPECT_EQ(responses[0].headers["connection"], "close");
}

TEST_F(RequestDispatcherTest, OversizedHeadIsRejected) {
    std::string input = "GET / HTTP/1.1\r\nX-Big: " + std::string(20000, 'a') + "\r\n\r\n";
    auto responses = serve(input);
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].status, 431);
}

TEST_F(RequestDispatcherTest, ChunkedBodyNeedsLength) {
    auto responses = serve("POST /upload HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhello\r\n0\r\n\r\n");
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].status, 411);
    EXPECT_EQ(responses[0].headers["connection"], "close");
}

TEST_F(RequestDispatcherTest, PostWithoutLengthNeedsLength) {
    auto responses = serve("POST /message HTTP/1.1\r\nContent-Type: text/plain\r\nConnection: close\r\n\r\n");
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].status, 411);
}

TEST_F(RequestDispatcherTest, RejectedSmallBodyIsDrainedAndConnectionKept) {
    std::string body = "not multipart";
    std::string input = "POST /upload HTTP/1.1\r\nContent-Type: text/plain\r\nContent-Length: " +
                        std::to_string(body.size()) + "\r\n\r\n" + body + messageRequest("after", true);

    auto responses = serve(input);
    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0].status, 415);
    EXPECT_EQ(responses[0].headers["connection"], "keep-alive");
    EXPECT_EQ(responses[1].status, 200);
}

TEST_F(RequestDispatcherTest, UploadStoresFilesAndReportsThem) {
    std::string body = test::multipartBody("zz", {
        {"file", std::string("one.txt"), "first", "text/plain"},
        {"file", std::string(""), "", "application/octet-stream"},
        {"file", std::string("../two.txt"), "second", "text/plain"},
    });
    auto responses = serve(test::uploadRequest("zz", body), 1000);

    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].status, 200);
    auto json = nlohmann::json::parse(responses[0].body);
    EXPECT_EQ(json["status"].get<std::string>(), "ok");
    ASSERT_EQ(json["files"].size(), 2u);
    EXPECT_EQ(json["files"][0]["name"].get<std::string>(), "one.txt");
    EXPECT_EQ(json["files"][1]["name"].get<std::string>(), "two.txt");
    EXPECT_EQ(json["files"][1]["size"].get<uint64_t>(), 6u);

    EXPECT_EQ(test::listNames(tmp.path()), (std::vector<std::string>{"one.txt", "two.txt"}));
}

TEST_F(RequestDispatcherTest, UploadBodyLimit) {
    UploadHandler limited(storage, 16);
    RequestDispatcher small(limited, messages);

    std::string body = test::multipartBody("zz", {{"file", std::string("big.bin"), std::string(1024, 'x'), ""}});
    ScriptedConnection conn(test::uploadRequest("zz", body));
    small.serve(conn);

    auto responses = splitResponses(conn.output());
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].status, 413);
    EXPECT_TRUE(test::listNames(tmp.path()).empty());
}

TEST_F(RequestDispatcherTest, TruncatedUploadLeavesNothingBehind) {
    std::string body = test::multipartBody("zz", {{"file", std::string("cut.bin"), std::string(50000, 'c'), ""}});
    std::string request = test::uploadRequest("zz", body);
    request.resize(request.size() - 20000);

    ScriptedConnection conn(request, 4096, true);
    EXPECT_THROW(dispatcher.serve(conn), ConnectionError);
    EXPECT_TRUE(conn.output().empty());
    EXPECT_TRUE(test::listNames(tmp.path()).empty());
}

TEST_F(RequestDispatcherTest, CleanEofMidUploadAlsoAborts) {
    std::string body = test::multipartBody("zz", {{"file", std::string("cut.bin"), std::string(50000, 'c'), ""}});
    std::string request = test::uploadRequest("zz", body);
    request.resize(request.size() - 100);

    ScriptedConnection conn(request);
    EXPECT_THROW(dispatcher.serve(conn), ConnectionError);
    EXPECT_TRUE(test::listNames(tmp.path()).empty());
}

TEST_F(RequestDispatcherTest, MalformedMultipartIsRejected) {
    std::string body = "--zz\r\nContent-Disposition: form-data; name=\"file\"; filename=\"x\"\r\n\r\nno end";
    auto responses = serve(test::uploadRequest("zz", body, false) + messageRequest("after", true));
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].status, 400);
    EXPECT_EQ(responses[0].headers["connection"], "close");
    EXPECT_TRUE(test::listNames(tmp.path()).empty());
    EXPECT_EQ(console.str().find("after"), std::string::npos);
}

TEST_F(RequestDispatcherTest, MissingBoundaryClosesConnection) {
    std::string input = "POST /upload HTTP/1.1\r\nContent-Type: multipart/form-data\r\nContent-Length: 1\r\n\r\nx" +
                        messageRequest("smuggled", true);

    auto responses = serve(input);
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].status, 400);
    EXPECT_EQ(responses[0].headers["connection"], "close");
    EXPECT_EQ(console.str().find("smuggled"), std::string::npos);
}

TEST_F(RequestDispatcherTest, BadEncodingClosesConnection) {
    auto responses = serve(messageRequest("caf\xE9") + messageRequest("after", true));
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].status, 400);
    EXPECT_EQ(responses[0].headers["connection"], "close");
    EXPECT_EQ(console.str().find("after"), std::string::npos);
}

TEST_F(RequestDispatcherTest, ExpectContinueGetsInterimResponse) {
    std::string input = "POST /message HTTP/1.1\r\nContent-Type: text/plain\r\nExpect: 100-Continue\r\n"
                        "Content-Length: 5\r\nConnection: close\r\n\r\nhello";
    ScriptedConnection conn(input);
    dispatcher.serve(conn);

    const std::string interim = "HTTP/1.1 100 Continue\r\n\r\n";
    ASSERT_EQ(conn.output().rfind(interim, 0), 0u) << conn.output();
    auto responses = splitResponses(conn.output().substr(interim.size()));
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].status, 200);
    EXPECT_NE(console.str().find("  hello\n"), std::string::npos);
}

TEST_F(RequestDispatcherTest, ExpectContinueIgnoredWithoutBodyRoute) {
    ScriptedConnection conn("GET / HTTP/1.1\r\nExpect: 100-continue\r\nConnection: close\r\n\r\n");
    dispatcher.serve(conn);
    EXPECT_EQ(conn.output().find("100 Continue"), std::string::npos);

    ScriptedConnection old("POST /message HTTP/1.0\r\nExpect: 100-continue\r\nContent-Type: text/plain\r\n"
                           "Content-Length: 2\r\n\r\nhi");
    dispatcher.serve(old);
    EXPECT_EQ(old.output().find("100 Continue"), std::string::npos);
    auto responses = splitResponses(old.output());
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].status, 200);
}

TEST_F(RequestDispatcherTest, BlankMessageIsAccepted) {
    auto responses = serve(messageRequest("   ", true));
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].status, 200);
    EXPECT_FALSE(nlohmann::json::parse(responses[0].body)["delivered"].get<bool>());
}
