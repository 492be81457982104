#include "socket.h"
#include "utils/logger.h"
#include <cerrno>
#include <cstring>
#include <netinet/tcp.h>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace {

std::string sysError(const char* what) {
    return std::string(what) + ": " + strerror(errno);
}

} // namespace

Socket::Socket(int fd) : fd_(fd){
}

Socket::~Socket(){
    if(fd_ >= 0){
        ::close(fd_);
    }
}

int Socket::createNonblockingOrDie(){
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if(fd < 0){
        throw std::runtime_error(sysError("socket()"));
    }
    return fd;
}

void Socket::setReuseAddr(bool on){
    int optval = on ? 1 : 0;
    if(::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) < 0){
        // 非致命，记录即可
        LOG_WARN << "setsockopt(SO_REUSEADDR) failed on fd=" << fd_ << ": " << strerror(errno);
    }
}

void Socket::setTcpNoDelay(bool on){
    int optval = on ? 1 : 0;
    if(::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &optval, sizeof(optval)) < 0){
        LOG_WARN << "setsockopt(TCP_NODELAY) failed on fd=" << fd_ << ": " << strerror(errno);
    }
}

void Socket::bindAddress(uint16_t port){
    struct sockaddr_in serv_addr;
    memset(&serv_addr, 0, sizeof(serv_addr));
    serv_addr.sin_family = AF_INET;
    serv_addr.sin_addr.s_addr = htonl(INADDR_ANY); // 监听所有网络接口
    serv_addr.sin_port = htons(port); // 主机序转网络序

    if(::bind(fd_, reinterpret_cast<struct sockaddr*>(&serv_addr), sizeof(serv_addr)) < 0){
        throw std::runtime_error(sysError(("bind() port " + std::to_string(port)).c_str()));
    }
}

void Socket::listen(){
    if(::listen(fd_, SOMAXCONN) < 0){
        throw std::runtime_error(sysError("listen()"));
    }
}

int Socket::accept(struct sockaddr_in* peer_addr){
    socklen_t addr_len = sizeof(*peer_addr);
    memset(peer_addr, 0, sizeof(*peer_addr));
    return ::accept4(fd_, reinterpret_cast<struct sockaddr*>(peer_addr), &addr_len,
                     SOCK_NONBLOCK | SOCK_CLOEXEC);
}

void Socket::shutdownWrite(){
    if(::shutdown(fd_, SHUT_WR) < 0){
        LOG_ERROR << "Socket::shutdownWrite fd=" << fd_ << ": " << strerror(errno);
    }
}
