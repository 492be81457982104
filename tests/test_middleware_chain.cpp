#include "http/middleware.h"
#include "http/static_files_handler.h"
#include "test_util.h"
#include <gtest/gtest.h>

namespace {

HttpRequest makeRequest(HttpRequest::Method method, const std::string& target){
    HttpRequest req;
    req.setMethod(method);
    req.setTarget(target);
    req.setVersion("HTTP/1.1");
    return req;
}

} // namespace

class MiddlewareChainTest : public ::testing::Test{
protected:
    void SetUp() override {
        first_.writeFile("index.html", "<h1>first</h1>");
        first_.writeFile("shared.txt", "from first");
        second_.writeFile("only-second.css", "body{}");
        second_.writeFile("shared.txt", "from second");

        chain_.use(std::make_shared<StaticFilesHandler>(first_.dirPath()));
        chain_.use(std::make_shared<StaticFilesHandler>(second_.dirPath()));
    }

    HttpResponse handle(HttpRequest::Method method, const std::string& target) const {
        HttpResponse resp;
        chain_.handle(makeRequest(method, target), &resp);
        return resp;
    }

    test::ScopedTempDir first_;
    test::ScopedTempDir second_;
    MiddlewareChain chain_;
};

TEST_F(MiddlewareChainTest, GetServesFileWithMimeType){
    HttpResponse resp = handle(HttpRequest::GET, "/");
    EXPECT_EQ(HttpResponse::k200Ok, resp.getStatusCode());
    EXPECT_EQ("<h1>first</h1>", resp.getBody());
    EXPECT_EQ("text/html; charset=utf-8", resp.getHeader("Content-Type"));
    EXPECT_EQ("14", resp.getHeader("Content-Length"));
}

TEST_F(MiddlewareChainTest, HeadHasLengthButNoBody){
    HttpResponse resp = handle(HttpRequest::HEAD, "/shared.txt");
    EXPECT_EQ(HttpResponse::k200Ok, resp.getStatusCode());
    EXPECT_TRUE(resp.getBody().empty());
    EXPECT_EQ("10", resp.getHeader("Content-Length"));
    EXPECT_EQ("text/plain; charset=utf-8", resp.getHeader("Content-Type"));
}

TEST_F(MiddlewareChainTest, FirstRootWins){
    EXPECT_EQ("from first", handle(HttpRequest::GET, "/shared.txt").getBody());
}

TEST_F(MiddlewareChainTest, MissFallsThroughToNextRoot){
    HttpResponse resp = handle(HttpRequest::GET, "/only-second.css");
    EXPECT_EQ(HttpResponse::k200Ok, resp.getStatusCode());
    EXPECT_EQ("body{}", resp.getBody());
    EXPECT_EQ("text/css; charset=utf-8", resp.getHeader("Content-Type"));
}

TEST_F(MiddlewareChainTest, NotFoundWhenNobodyAnswers){
    HttpResponse resp = handle(HttpRequest::GET, "/nope.txt");
    EXPECT_EQ(HttpResponse::k404NotFound, resp.getStatusCode());
    EXPECT_EQ(HttpResponse::k404NotFound, handle(HttpRequest::POST, "/index.html").getStatusCode());
}

TEST_F(MiddlewareChainTest, HeadNotFoundHasNoBody){
    HttpResponse resp = handle(HttpRequest::HEAD, "/nope.txt");
    EXPECT_EQ(HttpResponse::k404NotFound, resp.getStatusCode());
    EXPECT_TRUE(resp.getBody().empty());
}

TEST_F(MiddlewareChainTest, RejectStopsTheChain){
    bool reached = false;
    chain_.use([&reached](const HttpRequest&, ResponsePipeline* pipeline){
        reached = true;
        pipeline->passToNext();
    });

    HttpResponse resp = handle(HttpRequest::GET, "/%2e%2e/etc/passwd");
    EXPECT_EQ(HttpResponse::k400BadRequest, resp.getStatusCode());
    EXPECT_EQ("text/plain; charset=utf-8", resp.getHeader("Content-Type"));
    EXPECT_EQ("400 Bad Request\nThe path '../etc/passwd' was denied access.\n", resp.getBody());
    EXPECT_FALSE(reached);
}

TEST_F(MiddlewareChainTest, FunctionMiddlewareAfterStaticFiles){
    chain_.use([](const HttpRequest& req, ResponsePipeline* pipeline){
        if(req.getMethod() == HttpRequest::POST){
            pipeline->error(HttpResponse::k403Forbidden, "read only");
        }else{
            pipeline->passToNext();
        }
    });
    EXPECT_EQ(3u, chain_.size());

    HttpResponse resp = handle(HttpRequest::POST, "/index.html");
    EXPECT_EQ(HttpResponse::k403Forbidden, resp.getStatusCode());
    EXPECT_EQ("403 Forbidden\nread only\n", resp.getBody());

    EXPECT_EQ(HttpResponse::k404NotFound, handle(HttpRequest::GET, "/nope").getStatusCode());
}

TEST(MiddlewareChainEmptyTest, EmptyChainIs404){
    MiddlewareChain chain;
    HttpResponse resp;
    chain.handle(makeRequest(HttpRequest::GET, "/"), &resp);
    EXPECT_EQ(HttpResponse::k404NotFound, resp.getStatusCode());
}

TEST(HttpResponsePipelineTest, UnreadableFileIs500){
    HttpRequest req = makeRequest(HttpRequest::GET, "/gone.txt");
    HttpResponse resp;
    HttpResponsePipeline pipeline(req, &resp);
    pipeline.serveFile("/nonexistent/filegate/gone.txt");
    EXPECT_TRUE(pipeline.responded());
    EXPECT_EQ(HttpResponse::k500InternalServerError, resp.getStatusCode());
}

TEST(HttpResponsePipelineTest, PassToNextDoesNotRespond){
    HttpRequest req = makeRequest(HttpRequest::GET, "/");
    HttpResponse resp;
    HttpResponsePipeline pipeline(req, &resp);
    pipeline.passToNext();
    EXPECT_FALSE(pipeline.responded());
    EXPECT_EQ(HttpResponse::kUnknown, resp.getStatusCode());
}
