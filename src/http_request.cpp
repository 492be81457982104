#include "http_request.h"
#include <algorithm>
#include <cctype>

namespace {

std::string toLower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(::tolower(c)); });
    return s;
}

// RFC 7230 token字符
bool isTokenChar(unsigned char c){
    if(::isalnum(c)) return true;
    switch(c){
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

bool isToken(const std::string& s){
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](char c) { return isTokenChar(static_cast<unsigned char>(c)); });
}

} // namespace

HttpRequest::HttpRequest(){
    reset();
}

void HttpRequest::reset(){
    state_ = kExpectRequestLine;
    method_ = INVALID;
    method_string_.clear();
    target_.clear();
    has_path_ = false;
    path_.clear();
    query_.clear();
    version_.clear();
    headers_.clear();
    content_length_ = 0;
    body_.clear();
}

const char* HttpRequest::methodName(Method method){
    switch(method){
        case GET: return "GET";
        case HEAD: return "HEAD";
        case POST: return "POST";
        case PUT: return "PUT";
        case DELETE: return "DELETE";
        case OTHER: return "OTHER";
        default: return "INVALID";
    }
}

HttpRequest::Method HttpRequest::parseMethod(const std::string& token){
    if(token == "GET") return GET;
    if(token == "HEAD") return HEAD;
    if(token == "POST") return POST;
    if(token == "PUT") return PUT;
    if(token == "DELETE") return DELETE;
    return isToken(token) ? OTHER : INVALID;
}

void HttpRequest::setMethod(Method method){
    method_ = method;
    method_string_ = methodName(method);
}

void HttpRequest::setTarget(const std::string& target){
    target_ = target;
    query_.clear();
    path_.clear();
    has_path_ = !target.empty() && target[0] == '/';
    if(!has_path_){
        return;
    }
    size_t query_pos = target.find('?');
    if(query_pos != std::string::npos){
        path_ = target.substr(0, query_pos);
        query_ = target.substr(query_pos + 1);
    }else{
        path_ = target;
    }
}

std::optional<std::string> HttpRequest::pathWithoutQuery() const {
    if(!has_path_){
        return std::nullopt;
    }
    return path_;
}

void HttpRequest::addHeader(const std::string& key, const std::string& value){
    headers_[toLower(key)] = value;
}

bool HttpRequest::parse(Buffer* buffer){
    while(true){
        if(state_ == kExpectRequestLine){
            const char* crlf = buffer->findCRLF();
            if(!crlf){
                return buffer->readableBytes() <= kMaxHeaderBytes;
            }
            if(!parseRequestLine(buffer->peek(), crlf)){
                return false;
            }
            buffer->retrieveUntil(crlf + 2);
            state_ = kExpectHeaders;
        }else if(state_ == kExpectHeaders){
            const char* crlf = buffer->findCRLF();
            if(!crlf){
                return buffer->readableBytes() <= kMaxHeaderBytes;
            }
            if(buffer->peek() == crlf){
                // 空行，头部结束
                buffer->retrieveUntil(crlf + 2);
                if(!onHeadersComplete()){
                    return false;
                }
                if(state_ == kGotAll){
                    return true;
                }
            }else{
                if(!parseHeader(buffer->peek(), crlf)){
                    return false;
                }
                buffer->retrieveUntil(crlf + 2);
            }
        }else if(state_ == kExpectBody){
            if(buffer->readableBytes() < content_length_){
                return true; // 等待剩余的body
            }
            body_ = buffer->retrieveAsString(content_length_);
            state_ = kGotAll;
            return true;
        }else{
            return true;
        }
    }
}

bool HttpRequest::onHeadersComplete(){
    std::string length_str = getHeader("Content-Length");
    if(length_str.empty()){
        state_ = kGotAll;
        return true;
    }
    if(!std::all_of(length_str.begin(), length_str.end(),
                    [](char c) { return ::isdigit(static_cast<unsigned char>(c)); })
       || length_str.size() > 12){
        return false;
    }
    content_length_ = std::stoull(length_str);
    if(content_length_ > kMaxBodySize){
        return false;
    }
    state_ = content_length_ > 0 ? kExpectBody : kGotAll;
    return true;
}

bool HttpRequest::parseRequestLine(const char* begin, const char* end){
    std::string line(begin, end);
    size_t method_end = line.find(' ');
    size_t version_start = line.rfind(' ');
    if(method_end == std::string::npos || method_end == version_start){
        return false;
    }

    method_string_ = line.substr(0, method_end);
    method_ = parseMethod(method_string_);
    if(method_ == INVALID){
        return false;
    }

    std::string target = line.substr(method_end + 1, version_start - method_end - 1);
    if(target.empty() || target.find(' ') != std::string::npos){
        return false;
    }
    setTarget(target);

    version_ = line.substr(version_start + 1);
    return version_ == "HTTP/1.1" || version_ == "HTTP/1.0";
}

bool HttpRequest::parseHeader(const char* begin, const char* end){
    const char* colon = std::find(begin, end, ':');
    if(colon == end){
        return false;
    }
    std::string key(begin, colon);
    if(!isToken(key)){
        return false; // 名称为空或在冒号前有空白
    }

    // 去掉值两端的空白
    const char* value_start = colon + 1;
    while(value_start < end && (*value_start == ' ' || *value_start == '\t')){
        ++value_start;
    }
    const char* value_end = end;
    while(value_end > value_start && (value_end[-1] == ' ' || value_end[-1] == '\t')){
        --value_end;
    }

    headers_[toLower(key)] = std::string(value_start, value_end);
    return true;
}

std::string HttpRequest::getHeader(const std::string& key) const{
    auto it = headers_.find(toLower(key));
    return it == headers_.end() ? "" : it->second;
}

bool HttpRequest::keepAlive() const {
    std::string connection = toLower(getHeader("Connection"));
    if(connection == "close"){
        return false;
    }
    if(version_ == "HTTP/1.0"){
        return connection == "keep-alive";
    }
    return true;
}
