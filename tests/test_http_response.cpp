#include "http_response.h"
#include <gtest/gtest.h>

TEST(HttpResponseTest, SerializesStatusHeadersAndBody){
    HttpResponse resp;
    resp.addHeader("Server", "filegate");
    resp.setKeepAlive(false);
    resp.setPlainText(HttpResponse::k400BadRequest, "bad\n");

    EXPECT_TRUE(resp.hasHeader("Server"));
    EXPECT_TRUE(resp.hasHeader("Content-Length"));
    EXPECT_FALSE(resp.hasHeader("Keep-Alive"));

    Buffer buf;
    resp.appendToBuffer(&buf);
    EXPECT_EQ("HTTP/1.1 400 Bad Request\r\n"
              "Connection: close\r\n"
              "Content-Length: 4\r\n"
              "Content-Type: text/plain; charset=utf-8\r\n"
              "Server: filegate\r\n"
              "\r\n"
              "bad\n", buf.retrieveAllAsString());
}

TEST(HttpResponseTest, BareStatusLine){
    HttpResponse resp;
    resp.setStatusCode(HttpResponse::k404NotFound);
    Buffer buf;
    resp.appendToBuffer(&buf);
    EXPECT_EQ("HTTP/1.1 404 Not Found\r\n\r\n", buf.retrieveAllAsString());
    EXPECT_STREQ("Unknown", HttpResponse::reasonPhrase(HttpResponse::kUnknown));
}
