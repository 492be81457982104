#pragma once
#include "connection.h"
#include "socket.h"
#include <functional>
#include <map>
#include <memory>
#include <string>

class Channel;
class EventLoop;
class EventLoopThreadPool;
class SslContext;

// 监听一个端口的TCP服务器: base loop负责accept，已建立的连接轮询分配给I/O线程
class Server : NonCopyable{
public:
    using ConnectionPtr = Connection::ConnectionPtr;
    using ConnectionCallback = Connection::ConnectionCallback;
    using MessageCallback = Connection::MessageCallback;

    // 构造时完成socket/bind，端口被占用等错误抛出std::runtime_error
    Server(EventLoop* loop, uint16_t port, const std::string& name,
           double idle_timeout_sec, int num_threads = 0);
    ~Server();

    // 必须在start()之前调用，证书加载失败时抛出std::runtime_error
    void enableSsl(const std::string& cert_path, const std::string& key_path);

    // 启动I/O线程并开始监听
    void start();

    void setConnectionCallback(ConnectionCallback cb) { connection_callback_ = std::move(cb); }
    void setMessageCallback(MessageCallback cb) { message_callback_ = std::move(cb); }

    const std::string& name() const { return name_; }
    uint16_t port() const { return port_; }
    bool isSecure() const { return ssl_context_ != nullptr; }
private:
    // 监听socket可读时循环accept
    void handleConnection();
    // 为新连接创建SSL对象，失败时返回false
    bool createSsl(int connfd, SSL** ssl);
    // 连接关闭时由I/O线程调用
    void removeConnection(const ConnectionPtr& conn);
    // 在base loop中从connections_移除，避免跨线程修改map
    void removeConnectionInLoop(const ConnectionPtr& conn);
    void defaultConnectionCallback(const ConnectionPtr& conn);

    EventLoop* loop_;
    const uint16_t port_;
    const std::string name_;
    const double idle_timeout_;
    bool started_;

    std::unique_ptr<Socket> listen_socket_;
    std::unique_ptr<Channel> accept_channel_;
    std::unique_ptr<SslContext> ssl_context_;
    std::unique_ptr<EventLoopThreadPool> thread_pool_;

    ConnectionCallback connection_callback_;
    MessageCallback message_callback_;

    // 所有存活的连接，key是sockfd，只在base loop中访问
    std::map<int, ConnectionPtr> connections_;
};
