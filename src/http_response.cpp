#include "http_response.h"
#include <cstdio>
#include <cstring>

HttpResponse::HttpResponse() : status_code_(kUnknown) {}

const char* HttpResponse::reasonPhrase(HttpStatusCode code){
    switch(code){
        case k200Ok: return "OK";
        case k400BadRequest: return "Bad Request";
        case k403Forbidden: return "Forbidden";
        case k404NotFound: return "Not Found";
        case k500InternalServerError: return "Internal Server Error";
        default: return "Unknown";
    }
}

void HttpResponse::setPlainText(HttpStatusCode code, const std::string& text){
    setStatusCode(code);
    setContentType("text/plain; charset=utf-8");
    setBody(text);
    setContentLength(body_.size());
}

void HttpResponse::setHtml(HttpStatusCode code, const std::string& html){
    setStatusCode(code);
    setContentType("text/html; charset=utf-8");
    setBody(html);
    setContentLength(body_.size());
}

std::string HttpResponse::getHeader(const std::string& key) const {
    auto it = headers_.find(key);
    return it == headers_.end() ? "" : it->second;
}

void HttpResponse::appendToBuffer(Buffer* buffer) const{
    char buf[128];
    snprintf(buf, sizeof(buf), "HTTP/1.1 %d %s\r\n", static_cast<int>(status_code_), reasonPhrase(status_code_));
    buffer->append(buf, strlen(buf));

    for(const auto& header : headers_){
        buffer->append(header.first);
        buffer->append(": ", 2);
        buffer->append(header.second);
        buffer->append("\r\n", 2);
    }
    buffer->append("\r\n", 2);

    if(!body_.empty()){
        buffer->append(body_);
    }
}
