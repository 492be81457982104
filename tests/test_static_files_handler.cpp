#include "http/static_files_handler.h"
#include "test_util.h"
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

// 记录中间件对pipeline的调用
class RecordingPipeline : public ResponsePipeline{
public:
    void serveFile(const std::filesystem::path& path) override {
        ++calls;
        served = path;
    }
    void error(HttpResponse::HttpStatusCode code, const std::string& message) override {
        ++calls;
        error_code = code;
        error_message = message;
    }
    void passToNext() override {
        ++calls;
        passed = true;
    }

    int calls = 0;
    std::filesystem::path served;
    HttpResponse::HttpStatusCode error_code = HttpResponse::kUnknown;
    std::string error_message;
    bool passed = false;
};

HttpRequest makeRequest(HttpRequest::Method method, const std::string& target){
    HttpRequest req;
    req.setMethod(method);
    req.setTarget(target);
    req.setVersion("HTTP/1.1");
    return req;
}

} // namespace

class StaticFilesHandlerTest : public ::testing::Test{
protected:
    void SetUp() override {
        tmp_dir_.writeFile("index.html", "<h1>home</h1>");
        tmp_dir_.writeFile("a/b.txt", "bee");
        tmp_dir_.writeFile("hello world.txt", "spaced");
        std::filesystem::create_directories(tmp_dir_.dirPath() / "sub");
    }

    StaticFilesHandler::Resolution resolve(HttpRequest::Method method, const std::string& target) const {
        return handler_.resolve(makeRequest(method, target));
    }

    test::ScopedTempDir tmp_dir_;
    StaticFilesHandler handler_{tmp_dir_.dirPath()};
};

TEST_F(StaticFilesHandlerTest, ExtractRootAsIndex){
    auto path = handler_.extractPath(makeRequest(HttpRequest::GET, "/"));
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ("index.html", *path);
}

TEST_F(StaticFilesHandlerTest, ExtractDropsExactlyOneLeadingChar){
    EXPECT_EQ("a/b.txt", handler_.extractPath(makeRequest(HttpRequest::GET, "/a/b.txt")).value());
    EXPECT_EQ("/etc/passwd", handler_.extractPath(makeRequest(HttpRequest::GET, "//etc/passwd")).value());
    EXPECT_EQ("a/b.txt", handler_.extractPath(makeRequest(HttpRequest::HEAD, "/a/b.txt?v=3")).value());
}

TEST_F(StaticFilesHandlerTest, ExtractIgnoresOtherMethods){
    for(HttpRequest::Method method : {HttpRequest::POST, HttpRequest::PUT, HttpRequest::DELETE, HttpRequest::OTHER}){
        EXPECT_FALSE(handler_.extractPath(makeRequest(method, "/index.html")).has_value());
    }
}

TEST_F(StaticFilesHandlerTest, ExtractNeedsOriginForm){
    EXPECT_FALSE(handler_.extractPath(makeRequest(HttpRequest::GET, "*")).has_value());
    EXPECT_FALSE(handler_.extractPath(makeRequest(HttpRequest::GET, "http://example.com/index.html")).has_value());
}

TEST_F(StaticFilesHandlerTest, ServesRegularFile){
    auto r = resolve(HttpRequest::GET, "/a/b.txt");
    ASSERT_EQ(StaticFilesHandler::Resolution::kServe, r.kind);
    EXPECT_EQ((tmp_dir_.dirPath() / "a/b.txt").string(), r.file.string());
}

TEST_F(StaticFilesHandlerTest, ServesIndexForRoot){
    auto r = resolve(HttpRequest::HEAD, "/");
    ASSERT_EQ(StaticFilesHandler::Resolution::kServe, r.kind);
    EXPECT_EQ((tmp_dir_.dirPath() / "index.html").string(), r.file.string());
}

TEST_F(StaticFilesHandlerTest, DecodesBeforeLookup){
    auto r = resolve(HttpRequest::GET, "/hello%20world.txt");
    ASSERT_EQ(StaticFilesHandler::Resolution::kServe, r.kind);
    EXPECT_EQ((tmp_dir_.dirPath() / "hello world.txt").string(), r.file.string());
}

TEST_F(StaticFilesHandlerTest, CurDirSegmentsAllowed){
    auto r = resolve(HttpRequest::GET, "/./a/./b.txt");
    EXPECT_EQ(StaticFilesHandler::Resolution::kServe, r.kind);
}

TEST_F(StaticFilesHandlerTest, MissingFilePassesThrough){
    EXPECT_EQ(StaticFilesHandler::Resolution::kPassThrough, resolve(HttpRequest::GET, "/a/missing.txt").kind);
    EXPECT_EQ(StaticFilesHandler::Resolution::kPassThrough, resolve(HttpRequest::GET, "/nowhere/x").kind);
}

TEST_F(StaticFilesHandlerTest, DirectoryPassesThrough){
    EXPECT_EQ(StaticFilesHandler::Resolution::kPassThrough, resolve(HttpRequest::GET, "/sub").kind);
    EXPECT_EQ(StaticFilesHandler::Resolution::kPassThrough, resolve(HttpRequest::GET, "/sub/").kind);
}

TEST_F(StaticFilesHandlerTest, FileUsedAsDirectoryPassesThrough){
    // stat返回ENOTDIR
    EXPECT_EQ(StaticFilesHandler::Resolution::kPassThrough, resolve(HttpRequest::GET, "/a/b.txt/c").kind);
}

TEST_F(StaticFilesHandlerTest, NulBytePassesThrough){
    EXPECT_EQ(StaticFilesHandler::Resolution::kPassThrough, resolve(HttpRequest::GET, "/index.html%00.png").kind);
}

TEST_F(StaticFilesHandlerTest, OtherMethodsPassThrough){
    EXPECT_EQ(StaticFilesHandler::Resolution::kPassThrough, resolve(HttpRequest::POST, "/index.html").kind);
    // 非法路径也不检查
    EXPECT_EQ(StaticFilesHandler::Resolution::kPassThrough, resolve(HttpRequest::PUT, "/%zz").kind);
}

TEST_F(StaticFilesHandlerTest, EncodedTraversalRejected){
    auto r = resolve(HttpRequest::GET, "/%2e%2e/secret.txt");
    ASSERT_EQ(StaticFilesHandler::Resolution::kReject, r.kind);
    EXPECT_EQ(HttpResponse::k400BadRequest, r.status);
    EXPECT_EQ("The path '../secret.txt' was denied access.", r.reason);
}

TEST_F(StaticFilesHandlerTest, PlainTraversalRejected){
    auto r = resolve(HttpRequest::GET, "/a/../index.html");
    ASSERT_EQ(StaticFilesHandler::Resolution::kReject, r.kind);
    EXPECT_EQ("The path 'a/../index.html' was denied access.", r.reason);
}

TEST_F(StaticFilesHandlerTest, AbsolutePathRejected){
    auto r = resolve(HttpRequest::GET, "//etc/passwd");
    ASSERT_EQ(StaticFilesHandler::Resolution::kReject, r.kind);
    EXPECT_EQ("The path '/etc/passwd' was denied access.", r.reason);
}

TEST_F(StaticFilesHandlerTest, MalformedEscapeRejected){
    auto r = resolve(HttpRequest::GET, "/%zz");
    ASSERT_EQ(StaticFilesHandler::Resolution::kReject, r.kind);
    EXPECT_EQ(HttpResponse::k400BadRequest, r.status);
    EXPECT_EQ("malformed percent-escape at index 0", r.reason);
}

TEST_F(StaticFilesHandlerTest, InvalidUtf8Rejected){
    auto r = resolve(HttpRequest::GET, "/%FF.txt");
    ASSERT_EQ(StaticFilesHandler::Resolution::kReject, r.kind);
    EXPECT_EQ("invalid utf-8 sequence of 1 bytes from index 0", r.reason);
}

TEST_F(StaticFilesHandlerTest, UnreadableDirectoryPassesThrough){
    if(::geteuid() == 0){
        GTEST_SKIP() << "root ignores directory permissions";
    }
    tmp_dir_.writeFile("locked/file.txt", "x");
    std::filesystem::path locked = tmp_dir_.dirPath() / "locked";
    std::filesystem::permissions(locked, std::filesystem::perms::none, std::filesystem::perm_options::replace);
    auto r = resolve(HttpRequest::GET, "/locked/file.txt");
    std::filesystem::permissions(locked, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace);
    EXPECT_EQ(StaticFilesHandler::Resolution::kPassThrough, r.kind);
}

TEST_F(StaticFilesHandlerTest, SymlinkLoopPassesThrough){
    // stat失败且原因不是"不存在"(ELOOP)，与用户身份无关
    std::filesystem::create_symlink("loop", tmp_dir_.dirPath() / "loop");
    EXPECT_EQ(StaticFilesHandler::Resolution::kPassThrough, resolve(HttpRequest::GET, "/loop").kind);
    EXPECT_EQ(StaticFilesHandler::Resolution::kPassThrough, resolve(HttpRequest::HEAD, "/loop/index.html").kind);
}

TEST_F(StaticFilesHandlerTest, RootPathIsKept){
    EXPECT_EQ(tmp_dir_.dirPath().string(), handler_.rootPath().string());
}

TEST_F(StaticFilesHandlerTest, MissingRootPassesThrough){
    StaticFilesHandler handler(tmp_dir_.dirPath() / "no-such-root");
    EXPECT_EQ(StaticFilesHandler::Resolution::kPassThrough,
              handler.resolve(makeRequest(HttpRequest::GET, "/index.html")).kind);
}

TEST_F(StaticFilesHandlerTest, InvokeCallsPipelineExactlyOnce){
    {
        RecordingPipeline pipeline;
        handler_.invoke(makeRequest(HttpRequest::GET, "/a/b.txt"), &pipeline);
        EXPECT_EQ(1, pipeline.calls);
        EXPECT_EQ((tmp_dir_.dirPath() / "a/b.txt").string(), pipeline.served.string());
    }
    {
        RecordingPipeline pipeline;
        handler_.invoke(makeRequest(HttpRequest::GET, "/../x"), &pipeline);
        EXPECT_EQ(1, pipeline.calls);
        EXPECT_EQ(HttpResponse::k400BadRequest, pipeline.error_code);
        EXPECT_EQ("The path '../x' was denied access.", pipeline.error_message);
    }
    {
        RecordingPipeline pipeline;
        handler_.invoke(makeRequest(HttpRequest::GET, "/missing"), &pipeline);
        EXPECT_EQ(1, pipeline.calls);
        EXPECT_TRUE(pipeline.passed);
    }
}
