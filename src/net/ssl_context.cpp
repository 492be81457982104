#include "net/ssl_context.h"
#include <openssl/err.h>
#include <memory>
#include <stdexcept>

namespace {

const unsigned char kSessionIdContext[] = "filegate";

} // namespace

SslContext::SslContext(const std::string& cert_path, const std::string& key_path)
    : ctx_(SSL_CTX_new(TLS_server_method())){
    if(!ctx_){
        throw std::runtime_error("SSL_CTX_new failed: " + lastErrors());
    }
    // 出错时由unique_ptr释放ctx_，构造函数抛出后析构函数不会被调用
    std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> guard(ctx_, &SSL_CTX_free);

    SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
    // Session Resumption需要设置session id context
    SSL_CTX_set_session_id_context(ctx_, kSessionIdContext, sizeof(kSessionIdContext) - 1);

    if(SSL_CTX_use_certificate_chain_file(ctx_, cert_path.c_str()) <= 0){
        throw std::runtime_error("cannot load certificate '" + cert_path + "': " + lastErrors());
    }
    if(SSL_CTX_use_PrivateKey_file(ctx_, key_path.c_str(), SSL_FILETYPE_PEM) <= 0){
        throw std::runtime_error("cannot load private key '" + key_path + "': " + lastErrors());
    }
    if(!SSL_CTX_check_private_key(ctx_)){
        throw std::runtime_error("private key does not match the certificate: " + lastErrors());
    }
    guard.release();
}

SslContext::~SslContext(){
    SSL_CTX_free(ctx_);
}

std::string SslContext::lastErrors(){
    std::string result;
    unsigned long err = 0;
    char buf[256];
    while((err = ERR_get_error()) != 0){
        ERR_error_string_n(err, buf, sizeof(buf));
        if(!result.empty()){
            result += "; ";
        }
        result += buf;
    }
    return result.empty() ? "unknown error" : result;
}
