#include "http_request.h"
#include <gtest/gtest.h>

namespace {

bool parseAll(HttpRequest* req, const std::string& raw){
    Buffer buf;
    buf.append(raw);
    return req->parse(&buf);
}

} // namespace

TEST(HttpRequestTest, SimpleGet){
    HttpRequest req;
    ASSERT_TRUE(parseAll(&req, "GET /a/b.txt?x=1&y=2 HTTP/1.1\r\nHost: example.com\r\n\r\n"));
    ASSERT_TRUE(req.gotAll());
    EXPECT_EQ(HttpRequest::GET, req.getMethod());
    EXPECT_EQ("GET", req.getMethodString());
    EXPECT_EQ("/a/b.txt?x=1&y=2", req.getTarget());
    EXPECT_EQ("/a/b.txt", req.pathWithoutQuery().value());
    EXPECT_EQ("x=1&y=2", req.getQuery());
    EXPECT_EQ("HTTP/1.1", req.getVersion());
    EXPECT_EQ("example.com", req.getHeader("host"));
    EXPECT_EQ("example.com", req.getHeader("HOST"));
}

TEST(HttpRequestTest, TargetIsNotDecoded){
    HttpRequest req;
    ASSERT_TRUE(parseAll(&req, "GET /%2e%2e/x HTTP/1.1\r\n\r\n"));
    EXPECT_EQ("/%2e%2e/x", req.pathWithoutQuery().value());
}

TEST(HttpRequestTest, NonOriginFormHasNoPath){
    HttpRequest req;
    ASSERT_TRUE(parseAll(&req, "OPTIONS * HTTP/1.1\r\n\r\n"));
    ASSERT_TRUE(req.gotAll());
    EXPECT_EQ(HttpRequest::OTHER, req.getMethod());
    EXPECT_EQ("OPTIONS", req.getMethodString());
    EXPECT_FALSE(req.pathWithoutQuery().has_value());
}

TEST(HttpRequestTest, IncrementalParse){
    HttpRequest req;
    Buffer buf;
    buf.append("HEAD /index.html HT");
    ASSERT_TRUE(req.parse(&buf));
    EXPECT_FALSE(req.gotAll());
    buf.append("TP/1.0\r\nConnection: keep-alive\r\n");
    ASSERT_TRUE(req.parse(&buf));
    EXPECT_FALSE(req.gotAll());
    buf.append("\r\n");
    ASSERT_TRUE(req.parse(&buf));
    ASSERT_TRUE(req.gotAll());
    EXPECT_EQ(HttpRequest::HEAD, req.getMethod());
    EXPECT_TRUE(req.keepAlive());
}

TEST(HttpRequestTest, BodyWithContentLength){
    HttpRequest req;
    Buffer buf;
    buf.append("POST /upload HTTP/1.1\r\nContent-Length: 5\r\n\r\nhel");
    ASSERT_TRUE(req.parse(&buf));
    EXPECT_FALSE(req.gotAll());
    buf.append("lo");
    ASSERT_TRUE(req.parse(&buf));
    ASSERT_TRUE(req.gotAll());
    EXPECT_EQ("hello", req.getBody());
}

TEST(HttpRequestTest, PipelinedRequestsStayInBuffer){
    HttpRequest req;
    Buffer buf;
    buf.append("GET /one HTTP/1.1\r\n\r\nGET /two HTTP/1.1\r\n\r\n");
    ASSERT_TRUE(req.parse(&buf));
    ASSERT_TRUE(req.gotAll());
    EXPECT_EQ("/one", req.getTarget());
    req.reset();
    ASSERT_TRUE(req.parse(&buf));
    ASSERT_TRUE(req.gotAll());
    EXPECT_EQ("/two", req.getTarget());
    EXPECT_EQ(0u, buf.readableBytes());
}

TEST(HttpRequestTest, KeepAliveRules){
    HttpRequest req;
    ASSERT_TRUE(parseAll(&req, "GET / HTTP/1.1\r\n\r\n"));
    EXPECT_TRUE(req.keepAlive());

    req.reset();
    ASSERT_TRUE(parseAll(&req, "GET / HTTP/1.1\r\nConnection: Close\r\n\r\n"));
    EXPECT_FALSE(req.keepAlive());

    req.reset();
    ASSERT_TRUE(parseAll(&req, "GET / HTTP/1.0\r\n\r\n"));
    EXPECT_FALSE(req.keepAlive());
}

TEST(HttpRequestTest, MalformedRequests){
    const char* bad[] = {
        "GET\r\n\r\n",
        "GET /\r\n\r\n",
        "G(T / HTTP/1.1\r\n\r\n",
        "GET / HTTP/2.0\r\n\r\n",
        "GET / HTTP/1.1\r\nNoColon\r\n\r\n",
        "GET / HTTP/1.1\r\nBad Name: x\r\n\r\n",
        "POST / HTTP/1.1\r\nContent-Length: -1\r\n\r\n",
        "POST / HTTP/1.1\r\nContent-Length: 999999999999\r\n\r\n",
    };
    for(const char* raw : bad){
        HttpRequest req;
        EXPECT_FALSE(parseAll(&req, raw)) << raw;
    }
}

TEST(HttpRequestTest, ParseMethod){
    EXPECT_EQ(HttpRequest::GET, HttpRequest::parseMethod("GET"));
    EXPECT_EQ(HttpRequest::DELETE, HttpRequest::parseMethod("DELETE"));
    EXPECT_EQ(HttpRequest::OTHER, HttpRequest::parseMethod("PATCH"));
    // 方法名区分大小写
    EXPECT_EQ(HttpRequest::OTHER, HttpRequest::parseMethod("get"));
    EXPECT_EQ(HttpRequest::INVALID, HttpRequest::parseMethod(""));
    EXPECT_EQ(HttpRequest::INVALID, HttpRequest::parseMethod("GE T"));
}

TEST(HttpRequestTest, OverlongRequestLineWithoutCrlf){
    HttpRequest req;
    Buffer buf;
    buf.append("GET /" + std::string(HttpRequest::kMaxHeaderBytes - 5, 'A'));
    // 恰好在上限内，继续等待
    EXPECT_TRUE(req.parse(&buf));
    EXPECT_FALSE(req.gotAll());
    buf.append("A");
    EXPECT_FALSE(req.parse(&buf));
}

TEST(HttpRequestTest, OverlongHeaderWithoutCrlf){
    HttpRequest req;
    Buffer buf;
    buf.append("GET / HTTP/1.1\r\nX-Filler: ");
    EXPECT_TRUE(req.parse(&buf));
    buf.append(std::string(HttpRequest::kMaxHeaderBytes, 'B'));
    EXPECT_FALSE(req.parse(&buf));
}

TEST(HttpRequestTest, LongHeadersSplitIntoLinesAreAccepted){
    HttpRequest req;
    Buffer buf;
    buf.append("GET / HTTP/1.1\r\n");
    for(int i = 0; i < 4; ++i){
        buf.append("X-Filler-" + std::to_string(i) + ": " + std::string(HttpRequest::kMaxHeaderBytes / 2, 'C') + "\r\n");
    }
    buf.append("\r\n");
    ASSERT_TRUE(req.parse(&buf));
    EXPECT_TRUE(req.gotAll());
}
