#pragma once
#include "utils/noncopyable.h"
#include <cstdint>
#include <netinet/in.h>
#include <sys/socket.h>

// 拥有一个socket fd，析构时关闭
class Socket : NonCopyable{
public:
    explicit Socket(int fd);
    ~Socket();

    // 创建非阻塞、close-on-exec的IPv4监听socket，失败时抛出std::runtime_error
    static int createNonblockingOrDie();

    int getFd() const { return fd_; }

    void setReuseAddr(bool on);
    void setTcpNoDelay(bool on);

    // bind/listen 失败时抛出std::runtime_error
    void bindAddress(uint16_t port);
    void listen();

    // 返回新连接的fd(已设置非阻塞)，没有新连接时返回-1，errno保持不变
    int accept(struct sockaddr_in* peer_addr);

    // 关闭写半边，对端会收到FIN
    void shutdownWrite();
private:
    const int fd_;
};
