#pragma once
#include "utils/noncopyable.h"
#include <openssl/ssl.h>
#include <string>

// 服务端TLS上下文，证书或私钥加载失败时构造函数抛出std::runtime_error
class SslContext : NonCopyable{
public:
    SslContext(const std::string& cert_path, const std::string& key_path);
    ~SslContext();

    SSL_CTX* get() const { return ctx_; }

    // 取出OpenSSL错误队列中的全部错误，拼成一行
    static std::string lastErrors();
private:
    SSL_CTX* ctx_;
};
