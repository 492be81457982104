#include "net/channel.h"
#include "net/event_loop.h"
#include <cassert>
#include <sys/epoll.h>

const uint32_t Channel::kNoneEvent = 0;
const uint32_t Channel::kReadEvent = EPOLLIN | EPOLLPRI;
const uint32_t Channel::kWriteEvent = EPOLLOUT;

Channel::Channel(EventLoop* loop, int fd)
    : loop_(loop), fd_(fd), events_(0), revents_(0), tied_(false), event_handling_(false) {}

Channel::~Channel(){
    assert(!event_handling_);
}

void Channel::handleEvent(){
    if(tied_){
        std::shared_ptr<void> guard = tie_.lock();
        if(guard){
            handleEventWithGuard();
        }
        // 所有者已经析构，丢弃事件
    }else{
        handleEventWithGuard();
    }
}

void Channel::handleEventWithGuard(){
    event_handling_ = true;
    if((revents_ & EPOLLHUP) && !(revents_ & EPOLLIN)){
        if(close_callback_) close_callback_();
    }
    if(revents_ & EPOLLERR){
        if(error_callback_) error_callback_();
    }
    if(revents_ & (EPOLLIN | EPOLLPRI | EPOLLRDHUP)){
        if(read_callback_) read_callback_();
    }
    if(revents_ & EPOLLOUT){
        if(write_callback_) write_callback_();
    }
    event_handling_ = false;
}

void Channel::update(){
    loop_->updateChannel(this);
}

void Channel::remove(){
    assert(isNoneEvent());
    loop_->removeChannel(this);
}

void Channel::tie(const std::shared_ptr<void>& obj){
    tie_ = obj;
    tied_ = true;
}
