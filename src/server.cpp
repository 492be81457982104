#include "server.h"
#include "net/channel.h"
#include "net/event_loop.h"
#include "net/event_loop_thread_pool.h"
#include "net/ssl_context.h"
#include "utils/logger.h"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unistd.h>

Server::Server(EventLoop* loop, uint16_t port, const std::string& name,
               double idle_timeout_sec, int num_threads)
  : loop_(loop),
    port_(port),
    name_(name),
    idle_timeout_(idle_timeout_sec),
    started_(false),
    listen_socket_(std::make_unique<Socket>(Socket::createNonblockingOrDie())),
    accept_channel_(std::make_unique<Channel>(loop, listen_socket_->getFd())),
    thread_pool_(std::make_unique<EventLoopThreadPool>(loop, name, num_threads)),
    connection_callback_(std::bind(&Server::defaultConnectionCallback, this, std::placeholders::_1)){
    listen_socket_->setReuseAddr(true);
    listen_socket_->bindAddress(port_);
    accept_channel_->setReadCallback(std::bind(&Server::handleConnection, this));
}

Server::~Server(){
    loop_->assertInLoopThread();
    LOG_INFO << name_ << " stop listening on port " << port_;

    if(started_){
        accept_channel_->disableAll();
    }
    accept_channel_->remove();

    for(auto& item : connections_){
        ConnectionPtr conn(item.second);
        item.second.reset();
        conn->getLoop()->runInLoop(std::bind(&Connection::connectDestroyed, conn));
    }
}

void Server::enableSsl(const std::string& cert_path, const std::string& key_path){
    if(started_){
        throw std::logic_error("Server::enableSsl must be called before start()");
    }
    ssl_context_ = std::make_unique<SslContext>(cert_path, key_path);
}

void Server::start(){
    loop_->assertInLoopThread();
    if(started_){
        return;
    }
    started_ = true;
    thread_pool_->start();
    listen_socket_->listen();
    accept_channel_->enableReading();
    LOG_INFO << name_ << " listening on port " << port_ << (ssl_context_ ? " (TLS)" : "")
             << ", io threads=" << thread_pool_->numThreads();
}

bool Server::createSsl(int connfd, SSL** ssl){
    SSL* s = SSL_new(ssl_context_->get());
    if(!s){
        LOG_ERROR << "SSL_new failed: " << SslContext::lastErrors();
        return false;
    }
    if(SSL_set_fd(s, connfd) == 0){
        LOG_ERROR << "SSL_set_fd failed: " << SslContext::lastErrors();
        SSL_free(s);
        return false;
    }
    // 非阻塞写可能只写出一部分，下一次以不同地址重试
    SSL_set_mode(s, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
    SSL_set_accept_state(s);
    *ssl = s;
    return true;
}

void Server::handleConnection(){
    loop_->assertInLoopThread();
    // 一次可读事件可能对应多个已完成的连接
    while(true){
        struct sockaddr_in peer_addr;
        int connfd = listen_socket_->accept(&peer_addr);
        if(connfd < 0){
            int saved_errno = errno;
            if(saved_errno == EAGAIN || saved_errno == EWOULDBLOCK || saved_errno == EINTR){
                break;
            }
            // EMFILE等，下一次可读事件再试
            LOG_ERROR << name_ << " accept: " << strerror(saved_errno);
            break;
        }

        SSL* ssl = nullptr;
        if(ssl_context_ && !createSsl(connfd, &ssl)){
            ::close(connfd);
            continue;
        }

        EventLoop* io_loop = thread_pool_->getNextLoop();
        ConnectionPtr conn = std::make_shared<Connection>(io_loop, connfd, peer_addr, ssl);
        connections_[connfd] = conn;

        conn->setIdleTimeout(idle_timeout_);
        conn->setConnectionCallback(connection_callback_);
        conn->setMessageCallback(message_callback_);
        conn->setCloseCallback(std::bind(&Server::removeConnection, this, std::placeholders::_1));
        io_loop->runInLoop(std::bind(&Connection::connectEstablished, conn));
    }
}

void Server::defaultConnectionCallback(const ConnectionPtr& conn){
    LOG_DEBUG << name_ << " connection " << conn->getPeerAddrStr() << " fd=" << conn->getFd()
              << (conn->connected() ? " up" : " down");
}

void Server::removeConnection(const ConnectionPtr& conn){
    loop_->runInLoop(std::bind(&Server::removeConnectionInLoop, this, conn));
}

void Server::removeConnectionInLoop(const ConnectionPtr& conn){
    loop_->assertInLoopThread();
    LOG_DEBUG << name_ << " remove connection " << conn->getPeerAddrStr() << " fd=" << conn->getFd();
    connections_.erase(conn->getFd());
    // 最后一个引用在connectDestroyed执行完后释放
    conn->getLoop()->queueInLoop(std::bind(&Connection::connectDestroyed, conn));
}
