#pragma once
#include "http_request.h"
#include "http_response.h"
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// 中间件对一个请求的三种答复，每次invoke恰好调用其中一个
class ResponsePipeline{
public:
    virtual ~ResponsePipeline() = default;

    // 以文件内容作答
    virtual void serveFile(const std::filesystem::path& path) = 0;
    // 以错误状态作答，message说明原因
    virtual void error(HttpResponse::HttpStatusCode code, const std::string& message) = 0;
    // 不作答，交给链中的下一个中间件
    virtual void passToNext() = 0;
};

// 请求处理链中的一环
// invoke可能在多个I/O线程中并发调用，实现必须只读自身状态
class Middleware{
public:
    virtual ~Middleware() = default;
    virtual void invoke(const HttpRequest& req, ResponsePipeline* pipeline) const = 0;
};

using MiddlewareFunc = std::function<void(const HttpRequest&, ResponsePipeline*)>;

// 把ResponsePipeline的三种答复写进HttpResponse
class HttpResponsePipeline : public ResponsePipeline{
public:
    HttpResponsePipeline(const HttpRequest& req, HttpResponse* resp);

    void serveFile(const std::filesystem::path& path) override;
    void error(HttpResponse::HttpStatusCode code, const std::string& message) override;
    void passToNext() override;

    // 已经有中间件作答
    bool responded() const { return responded_; }

private:
    void serveInternalError(const std::filesystem::path& path, const std::string& what);

    const HttpRequest& req_;
    HttpResponse* resp_;
    bool responded_;
};

// 按注册顺序调用中间件，直到有一个作答；全部放行时返回404
// 所有中间件在服务器启动前注册，之后只读，可被多个I/O线程共享
class MiddlewareChain{
public:
    void use(std::shared_ptr<const Middleware> middleware);
    void use(MiddlewareFunc func);

    size_t size() const { return middlewares_.size(); }

    void handle(const HttpRequest& req, HttpResponse* resp) const;

private:
    void handleNotFound(const HttpRequest& req, HttpResponse* resp) const;

    std::vector<std::shared_ptr<const Middleware>> middlewares_;
};
