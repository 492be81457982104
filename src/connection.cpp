#include "connection.h"
#include "net/channel.h"
#include "net/event_loop.h"
#include "net/ssl_context.h"
#include "utils/logger.h"
#include <arpa/inet.h>
#include <cassert>
#include <cerrno>
#include <cstring>
#include <unistd.h>

Connection::Connection(EventLoop* loop, int sockfd, const struct sockaddr_in& peer_addr, SSL* ssl)
  : loop_(loop),
    socket_(std::make_unique<Socket>(sockfd)),
    channel_(std::make_unique<Channel>(loop, sockfd)),
    peer_addr_(peer_addr),
    state_(kConnecting),
    idle_timeout_(0),
    last_active_time_(Timestamp::now()),
    ssl_(ssl, &SSL_free),
    handshaking_(ssl != nullptr){
    socket_->setTcpNoDelay(true);
}

Connection::~Connection(){
    LOG_DEBUG << "Connection fd=" << socket_->getFd() << " destroyed, state=" << state_;
}

std::string Connection::getPeerAddrStr() const {
    char ip_str[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &peer_addr_.sin_addr, ip_str, sizeof(ip_str));
    return std::string(ip_str) + ":" + std::to_string(ntohs(peer_addr_.sin_port));
}

void Connection::connectEstablished(){
    loop_->assertInLoopThread();
    assert(state_ == kConnecting);

    channel_->tie(shared_from_this());
    // 连接一建立就开始计时，握手期间也受空闲超时约束
    touchIdleTimer();

    if(ssl_){
        std::weak_ptr<Connection> weak_self = shared_from_this();
        auto handshake_cb = [weak_self]() {
            if (auto ptr = weak_self.lock()) ptr->handleHandshake();
        };
        channel_->setReadCallback(handshake_cb);
        channel_->setWriteCallback(handshake_cb);
        channel_->setCloseCallback([weak_self]() {
            if (auto ptr = weak_self.lock()) ptr->handleClose();
        });
        channel_->setErrorCallback([weak_self]() {
            if (auto ptr = weak_self.lock()) ptr->handleError();
        });
        channel_->enableReading();
        handleHandshake(); // 客户端的ClientHello可能已经到达
    }else{
        setupHttpCallbacks();
        channel_->enableReading();
    }
}

void Connection::setupHttpCallbacks(){
    state_ = kConnected;
    std::weak_ptr<Connection> weak_self = shared_from_this();
    channel_->setReadCallback([weak_self]() {
        if (auto ptr = weak_self.lock()) ptr->handleRead();
    });
    channel_->setWriteCallback([weak_self]() {
        if (auto ptr = weak_self.lock()) ptr->handleWrite();
    });
    channel_->setCloseCallback([weak_self]() {
        if (auto ptr = weak_self.lock()) ptr->handleClose();
    });
    channel_->setErrorCallback([weak_self]() {
        if (auto ptr = weak_self.lock()) ptr->handleError();
    });
    if(connection_callback_){
        connection_callback_(shared_from_this());
    }
}

void Connection::handleHandshake(){
    loop_->assertInLoopThread();
    if(!handshaking_){
        return;
    }
    int ret = SSL_do_handshake(ssl_.get());
    if(ret == 1){
        handshaking_ = false;
        setupHttpCallbacks();
        if(channel_->isWriting()){
            channel_->disableWriting();
        }
        if(!channel_->isReading()){
            channel_->enableReading();
        }
        LOG_DEBUG << "TLS handshake done with " << getPeerAddrStr() << " fd=" << getFd();
        // 请求数据可能和握手的最后一个包一起到达，已经在SSL的缓冲区里
        if(SSL_pending(ssl_.get()) > 0){
            handleRead();
        }
        return;
    }

    int err = SSL_get_error(ssl_.get(), ret);
    if(err == SSL_ERROR_WANT_READ){
        if(!channel_->isReading()) channel_->enableReading();
        if(channel_->isWriting()) channel_->disableWriting();
    }else if(err == SSL_ERROR_WANT_WRITE){
        if(!channel_->isWriting()) channel_->enableWriting();
        if(channel_->isReading()) channel_->disableReading();
    }else{
        LOG_WARN << "TLS handshake with " << getPeerAddrStr() << " failed, fd=" << getFd()
                 << ", SSL err=" << err << ": " << SslContext::lastErrors();
        handleError();
    }
}

void Connection::send(const std::string& msg){
    if(loop_->isInLoopThread()){
        sendInLoop(msg);
    }else{
        loop_->runInLoop(std::bind(&Connection::sendInLoop, shared_from_this(), msg));
    }
}

void Connection::send(Buffer* buf){
    send(buf->retrieveAllAsString());
}

size_t Connection::writeSome(const char* data, size_t len, bool* fault){
    if(len == 0){
        return 0;
    }
    if(ssl_){
        int n = SSL_write(ssl_.get(), data, static_cast<int>(len));
        if(n > 0){
            return static_cast<size_t>(n);
        }
        int err = SSL_get_error(ssl_.get(), n);
        if(err != SSL_ERROR_WANT_WRITE && err != SSL_ERROR_WANT_READ){
            LOG_ERROR << "SSL_write fd=" << getFd() << " err=" << err << ": " << SslContext::lastErrors();
            *fault = true;
        }
        return 0;
    }
    ssize_t n = ::write(socket_->getFd(), data, len);
    if(n >= 0){
        return static_cast<size_t>(n);
    }
    if(errno != EWOULDBLOCK && errno != EAGAIN){
        if(errno != EPIPE && errno != ECONNRESET){
            LOG_ERROR << "write fd=" << getFd() << ": " << strerror(errno);
        }
        *fault = true;
    }
    return 0;
}

void Connection::sendInLoop(const std::string& msg){
    loop_->assertInLoopThread();
    if(state_ == kDisconnected){
        LOG_WARN << "fd=" << getFd() << " disconnected, give up writing";
        return;
    }
    size_t nwrote = 0;
    bool fault = false;

    // 输出缓冲区为空时先尝试直接写
    if(!channel_->isWriting() && output_buffer_.readableBytes() == 0){
        nwrote = writeSome(msg.data(), msg.size(), &fault);
        if(nwrote > 0){
            last_active_time_ = Timestamp::now();
        }
    }
    if(fault){
        handleError();
        return;
    }
    if(nwrote < msg.size()){
        output_buffer_.append(msg.data() + nwrote, msg.size() - nwrote);
        if(!channel_->isWriting()){
            channel_->enableWriting();
        }
    }
}

bool Connection::readPlain(){
    int saved_errno = 0;
    while(true){
        ssize_t n = input_buffer_.readFd(socket_->getFd(), &saved_errno);
        if(n > 0){
            continue;
        }
        if(n == 0){
            return false; // 对端关闭
        }
        if(saved_errno == EAGAIN || saved_errno == EWOULDBLOCK){
            return true;
        }
        if(saved_errno == EINTR){
            continue;
        }
        if(saved_errno != ECONNRESET){
            LOG_ERROR << "read fd=" << getFd() << ": " << strerror(saved_errno);
        }
        return false;
    }
}

bool Connection::readSsl(){
    char buf[16384];
    while(true){
        int n = SSL_read(ssl_.get(), buf, sizeof(buf));
        if(n > 0){
            input_buffer_.append(buf, static_cast<size_t>(n));
            continue;
        }
        int err = SSL_get_error(ssl_.get(), n);
        if(err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE){
            return true;
        }
        if(err == SSL_ERROR_ZERO_RETURN){
            return false; // 收到close_notify
        }
        if(err == SSL_ERROR_SYSCALL && errno == 0){
            // 对端没有发close_notify就断开了TCP，浏览器关闭标签页时很常见
            LOG_DEBUG << "SSL_read unexpected EOF, fd=" << getFd();
        }else{
            LOG_WARN << "SSL_read fd=" << getFd() << " err=" << err << ": " << SslContext::lastErrors();
        }
        return false;
    }
}

void Connection::handleRead(){
    loop_->assertInLoopThread();
    if(state_ != kConnected && state_ != kDisconnecting){
        return;
    }
    bool alive = ssl_ ? readSsl() : readPlain();

    // 正在关闭的连接不再处理新请求
    if(state_ == kConnected && input_buffer_.readableBytes() > 0){
        last_active_time_ = Timestamp::now();
        message_callback_(shared_from_this(), &input_buffer_);
    }
    if(!alive){
        handleClose();
    }
}

void Connection::handleWrite(){
    loop_->assertInLoopThread();
    if(!channel_->isWriting()){
        LOG_TRACE << "fd=" << getFd() << " is down, no more writing";
        return;
    }
    while(output_buffer_.readableBytes() > 0){
        bool fault = false;
        size_t n = writeSome(output_buffer_.peek(), output_buffer_.readableBytes(), &fault);
        if(fault){
            handleError();
            return;
        }
        if(n == 0){
            return; // 内核缓冲区已满，等待下一次可写通知
        }
        last_active_time_ = Timestamp::now();
        output_buffer_.retrieve(n);
    }
    // 数据发完必须停止关注可写事件，否则会busy loop
    channel_->disableWriting();
    if(state_ == kDisconnecting){
        closeWriteSide();
    }
}

void Connection::handleClose(){
    loop_->assertInLoopThread();
    if(state_ == kDisconnected){
        return;
    }
    bool was_established = (state_ != kConnecting);
    state_ = kDisconnected;
    channel_->disableAll();
    cancelIdleTimer();

    ConnectionPtr guard_this(shared_from_this());
    if(was_established && connection_callback_){
        connection_callback_(guard_this);
    }
    if(close_callback_){
        close_callback_(guard_this);
    }
}

void Connection::handleError(){
    int optval = 0;
    socklen_t optlen = sizeof(optval);
    if(::getsockopt(socket_->getFd(), SOL_SOCKET, SO_ERROR, &optval, &optlen) == 0 && optval != 0){
        LOG_DEBUG << "Connection::handleError fd=" << getFd() << " SO_ERROR=" << optval << " " << strerror(optval);
    }
    handleClose();
}

void Connection::shutdown(){
    if(loop_->isInLoopThread()){
        shutdownInLoop();
    }else{
        loop_->runInLoop(std::bind(&Connection::shutdownInLoop, shared_from_this()));
    }
}

void Connection::shutdownInLoop(){
    loop_->assertInLoopThread();
    if(state_ != kConnected){
        return;
    }
    state_ = kDisconnecting;
    // 还有数据没发完时，由handleWrite在发完后关闭
    if(!channel_->isWriting()){
        closeWriteSide();
    }
}

void Connection::closeWriteSide(){
    if(ssl_){
        // 只发送自己的close_notify，不等待对端的
        int ret = SSL_shutdown(ssl_.get());
        if(ret < 0){
            int err = SSL_get_error(ssl_.get(), ret);
            if(err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ){
                channel_->enableWriting(); // 稍后在handleWrite中重试
                return;
            }
            LOG_DEBUG << "SSL_shutdown fd=" << getFd() << " err=" << err << ": " << SslContext::lastErrors();
            handleError();
            return;
        }
    }
    socket_->shutdownWrite();
}

void Connection::forceClose(){
    if(loop_->isInLoopThread()){
        forceCloseInLoop();
    }else{
        loop_->queueInLoop(std::bind(&Connection::forceCloseInLoop, shared_from_this()));
    }
}

void Connection::forceCloseInLoop(){
    loop_->assertInLoopThread();
    if(state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting){
        handleClose();
    }
}

void Connection::touchIdleTimer(){
    loop_->assertInLoopThread();
    cancelIdleTimer();
    if(idle_timeout_ <= 0){
        return;
    }
    std::weak_ptr<Connection> weak_self = shared_from_this();
    timer_id_ = loop_->runAfter(idle_timeout_, [weak_self](){
        if(auto conn = weak_self.lock()){
            LOG_INFO << "Connection from [" << conn->getPeerAddrStr() << "] idle timeout, fd=" << conn->getFd();
            conn->forceClose();
        }
    });
}

void Connection::cancelIdleTimer(){
    if(!timer_id_.expired()){
        loop_->cancel(timer_id_);
    }
    timer_id_.reset();
}

void Connection::connectDestroyed(){
    loop_->assertInLoopThread();
    if(state_ != kDisconnected){
        // Server主动移除(如析构时)，此前没有经过handleClose
        state_ = kDisconnected;
        channel_->disableAll();
        cancelIdleTimer();
    }
    channel_->remove();
}
