#pragma once
#include "buffer.h"
#include <map>
#include <string>
#include <utility>

class HttpResponse{
public:
    enum HttpStatusCode{
        kUnknown,
        k200Ok = 200,
        k400BadRequest = 400,
        k403Forbidden = 403,
        k404NotFound = 404,
        k500InternalServerError = 500,
    };

    HttpResponse();

    void setStatusCode(HttpStatusCode code) { status_code_ = code; }
    void setContentType(const std::string& content_type) { addHeader("Content-Type", content_type); }
    void addHeader(const std::string& key, const std::string& value) { headers_[key] = value; }
    void setBody(std::string body) { body_ = std::move(body); }
    void setContentLength(size_t len) { addHeader("Content-Length", std::to_string(len)); }
    void setKeepAlive(bool on) { addHeader("Connection", on ? "Keep-Alive" : "close"); }

    // 设置状态码、text/plain正文和Content-Length
    void setPlainText(HttpStatusCode code, const std::string& text);
    // 设置状态码、HTML正文和Content-Length
    void setHtml(HttpStatusCode code, const std::string& html);

    HttpStatusCode getStatusCode() const { return status_code_; }
    const std::string& getBody() const { return body_; }
    // 不存在时返回空串
    std::string getHeader(const std::string& key) const;
    bool hasHeader(const std::string& key) const { return headers_.count(key) > 0; }

    static const char* reasonPhrase(HttpStatusCode code);

    // 状态行\r\n 头部: 值\r\n ... \r\n 正文
    void appendToBuffer(Buffer* buffer) const;
private:
    HttpStatusCode status_code_;
    std::map<std::string, std::string> headers_;
    std::string body_;
};
