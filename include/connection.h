#pragma once
#include "buffer.h"
#include "http_request.h"
#include "net/timer.h"
#include "socket.h"
#include "utils/timestamp.h"
#include <functional>
#include <memory>
#include <netinet/in.h>
#include <openssl/ssl.h>
#include <string>

class Channel;
class EventLoop;

// 一个已建立的TCP连接(可选TLS)，由shared_ptr管理
// 除send/shutdown/forceClose外，所有成员函数只能在所属EventLoop的线程中调用
class Connection : NonCopyable, public std::enable_shared_from_this<Connection>{
public:
    enum StateE { kConnecting, kConnected, kDisconnecting, kDisconnected };

    using ConnectionPtr = std::shared_ptr<Connection>;
    using ConnectionCallback = std::function<void(const ConnectionPtr&)>;
    using MessageCallback = std::function<void(const ConnectionPtr&, Buffer*)>;
    using CloseCallback = std::function<void(const ConnectionPtr&)>;

    // ssl为nullptr时是普通HTTP连接，否则接管ssl的所有权
    Connection(EventLoop* loop, int sockfd, const struct sockaddr_in& peer_addr, SSL* ssl);
    ~Connection();

    // 线程安全
    void send(const std::string& msg);
    void send(Buffer* buf);
    // 发完输出缓冲区后关闭写端
    void shutdown();
    // 立即关闭，丢弃未发送的数据
    void forceClose();

    void setConnectionCallback(ConnectionCallback cb) { connection_callback_ = std::move(cb); }
    void setMessageCallback(MessageCallback cb) { message_callback_ = std::move(cb); }
    void setCloseCallback(CloseCallback cb) { close_callback_ = std::move(cb); }

    // 空闲超时: 超过idle_timeout秒没有新请求则强制关闭，<=0表示不限
    void setIdleTimeout(double seconds) { idle_timeout_ = seconds; }
    void touchIdleTimer();
    void cancelIdleTimer();

    // 由Server在连接建立后调用一次
    void connectEstablished();
    // 由Server在连接移除后调用一次，之后连接对象随最后一个shared_ptr析构
    void connectDestroyed();

    std::string getPeerAddrStr() const;
    int getFd() const { return socket_->getFd(); }
    EventLoop* getLoop() const { return loop_; }
    bool connected() const { return state_ == kConnected; }
    bool isSecure() const { return ssl_ != nullptr; }
    Timestamp getLastActiveTime() const { return last_active_time_; }

    // 当前正在解析的HTTP请求，跨多次读事件保留
    HttpRequest& getRequest() { return request_; }

private:
    void handleRead();
    void handleWrite();
    void handleClose();
    void handleError();
    void handleHandshake();

    // 握手完成(或非TLS连接建立)后切换到普通的读写回调
    void setupHttpCallbacks();

    void sendInLoop(const std::string& msg);
    void shutdownInLoop();
    void forceCloseInLoop();
    void closeWriteSide();

    // 写出尽可能多的数据，返回写出的字节数；遇到不可恢复的错误时fault置为true
    size_t writeSome(const char* data, size_t len, bool* fault);
    // 读到input_buffer_，返回false表示对端已关闭或出错
    bool readPlain();
    bool readSsl();

    EventLoop* loop_;
    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;
    Buffer input_buffer_;
    Buffer output_buffer_;

    ConnectionCallback connection_callback_;
    MessageCallback message_callback_;
    CloseCallback close_callback_;

    const struct sockaddr_in peer_addr_;
    StateE state_;
    double idle_timeout_;
    TimerId timer_id_;
    Timestamp last_active_time_;

    std::unique_ptr<SSL, decltype(&SSL_free)> ssl_;
    bool handshaking_;

    HttpRequest request_;
};
