#include "http/middleware.h"
#include "mime_types.h"
#include "utils/logger.h"
#include <fstream>
#include <sstream>
#include <system_error>

namespace {

// 用std::function包装的中间件
class FunctionMiddleware : public Middleware{
public:
    explicit FunctionMiddleware(MiddlewareFunc func) : func_(std::move(func)) {}
    void invoke(const HttpRequest& req, ResponsePipeline* pipeline) const override {
        func_(req, pipeline);
    }
private:
    MiddlewareFunc func_;
};

} // namespace

HttpResponsePipeline::HttpResponsePipeline(const HttpRequest& req, HttpResponse* resp)
    : req_(req), resp_(resp), responded_(false) {}

void HttpResponsePipeline::serveFile(const std::filesystem::path& path){
    responded_ = true;
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if(!file){
        serveInternalError(path, "cannot open file");
        return;
    }

    resp_->setStatusCode(HttpResponse::k200Ok);
    resp_->setContentType(MimeTypes::getMimeType(path.extension().string()));

    if(req_.getMethod() == HttpRequest::HEAD){
        // HEAD: 头部与GET相同，但不带正文
        std::error_code ec;
        std::uintmax_t size = std::filesystem::file_size(path, ec);
        if(ec){
            serveInternalError(path, ec.message());
            return;
        }
        resp_->setContentLength(static_cast<size_t>(size));
        return;
    }

    std::ostringstream content;
    content << file.rdbuf();
    if(file.bad()){
        serveInternalError(path, "read error");
        return;
    }
    resp_->setBody(content.str());
    resp_->setContentLength(resp_->getBody().size());
}

void HttpResponsePipeline::serveInternalError(const std::filesystem::path& path, const std::string& what){
    // 文件在解析时存在，读取时失败(被删除、权限变化等)
    LOG_ERROR << "Failed to serve " << path << ": " << what;
    resp_->setHtml(HttpResponse::k500InternalServerError,
                   "<html><body><h1>500 Internal Server Error</h1></body></html>");
}

void HttpResponsePipeline::error(HttpResponse::HttpStatusCode code, const std::string& message){
    responded_ = true;
    std::string body = std::to_string(static_cast<int>(code)) + " " + HttpResponse::reasonPhrase(code);
    if(!message.empty()){
        body += "\n" + message;
    }
    body += "\n";
    resp_->setPlainText(code, body);
}

void HttpResponsePipeline::passToNext(){
    responded_ = false;
}

void MiddlewareChain::use(std::shared_ptr<const Middleware> middleware){
    middlewares_.push_back(std::move(middleware));
}

void MiddlewareChain::use(MiddlewareFunc func){
    middlewares_.push_back(std::make_shared<FunctionMiddleware>(std::move(func)));
}

void MiddlewareChain::handle(const HttpRequest& req, HttpResponse* resp) const {
    HttpResponsePipeline pipeline(req, resp);
    for(const auto& middleware : middlewares_){
        middleware->invoke(req, &pipeline);
        if(pipeline.responded()){
            break;
        }
    }
    if(!pipeline.responded()){
        handleNotFound(req, resp);
    }
    // HEAD的答复保留Content-Length，去掉正文
    if(req.getMethod() == HttpRequest::HEAD){
        resp->setBody(std::string());
    }
}

void MiddlewareChain::handleNotFound(const HttpRequest& req, HttpResponse* resp) const {
    LOG_WARN << "No middleware answered " << req.getMethodString() << " " << req.getTarget();
    resp->setHtml(HttpResponse::k404NotFound, "<html><body><h1>404 Not Found</h1></body></html>");
}
