#pragma once
#include "buffer.h"
#include <optional>
#include <string>
#include <unordered_map>

class HttpRequest{
public:
    // OTHER: 语法合法但本服务器不区分的方法(OPTIONS、PATCH等)，交给中间件链处理
    enum Method { GET, HEAD, POST, PUT, DELETE, OTHER, INVALID };
    enum ParseState{
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    // 请求体上限，超过时按解析错误处理
    static constexpr size_t kMaxBodySize = 64 * 1024 * 1024;
    // 请求行或单个头部行的上限，超过仍未见到"\r\n"时按解析错误处理
    static constexpr size_t kMaxHeaderBytes = 8 * 1024;

    HttpRequest();

    // 增量解析: 数据不完整时返回true并等待更多数据，格式错误时返回false
    bool parse(Buffer* buffer);
    bool gotAll() const { return state_ == kGotAll; }

    Method getMethod() const { return method_; }
    const std::string& getMethodString() const { return method_string_; }
    static const char* methodName(Method method);

    // 请求行中的原始目标，未做任何解码
    const std::string& getTarget() const { return target_; }
    // origin-form("/a/b?x=1")时返回"?"之前的部分；"*"或绝对URI时没有路径
    std::optional<std::string> pathWithoutQuery() const;
    const std::string& getQuery() const { return query_; }
    const std::string& getVersion() const { return version_; }

    // 头部名称不区分大小写，不存在时返回空串
    std::string getHeader(const std::string& key) const;
    const std::string& getBody() const { return body_; }

    void reset();
    bool keepAlive() const;

    // 供中间件和测试直接构造请求
    void setMethod(Method method);
    void setTarget(const std::string& target);
    void setVersion(const std::string& version) { version_ = version; }
    void addHeader(const std::string& key, const std::string& value);

    static Method parseMethod(const std::string& token);

private:
    bool parseRequestLine(const char* begin, const char* end);
    bool parseHeader(const char* begin, const char* end);
    bool onHeadersComplete();

    ParseState state_;
    Method method_;
    std::string method_string_;
    std::string target_;
    bool has_path_;
    std::string path_;
    std::string query_;
    std::string version_;
    std::unordered_map<std::string, std::string> headers_; // key已转为小写
    size_t content_length_;
    std::string body_;
};
