#include "net/poller.h"
#include "net/channel.h"
#include "net/event_loop.h"
#include "utils/logger.h"
#include <cassert>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unistd.h>

Poller::Poller(EventLoop* loop)
    : owner_loop_(loop),
      epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      events_(kInitEventListSize){
    if(epollfd_ < 0){
        throw std::runtime_error(std::string("epoll_create1: ") + strerror(errno));
    }
}

Poller::~Poller(){
    ::close(epollfd_);
}

void Poller::poll(int timeout_ms, ChannelList* active_channels){
    owner_loop_->assertInLoopThread();
    int num_events = ::epoll_wait(epollfd_, events_.data(), static_cast<int>(events_.size()), timeout_ms);
    int saved_errno = errno;

    if(num_events > 0){
        for(int i = 0; i < num_events; i++){
            // 注册时把Channel指针放进了data.ptr
            Channel* channel = static_cast<Channel*>(events_[i].data.ptr);
            channel->setRevents(events_[i].events);
            active_channels->push_back(channel);
        }
        if(num_events == static_cast<int>(events_.size())){
            events_.resize(events_.size() * 2);
        }
    }else if(num_events < 0 && saved_errno != EINTR){
        LOG_ERROR << "epoll_wait: " << strerror(saved_errno);
    }
}

void Poller::updateChannel(Channel* channel){
    owner_loop_->assertInLoopThread();
    const int fd = channel->getFd();
    auto it = channels_.find(fd);
    if(it == channels_.end()){
        channels_[fd] = channel;
        update(EPOLL_CTL_ADD, channel);
    }else{
        assert(it->second == channel);
        update(EPOLL_CTL_MOD, channel);
    }
}

void Poller::removeChannel(Channel* channel){
    owner_loop_->assertInLoopThread();
    const int fd = channel->getFd();
    auto it = channels_.find(fd);
    if(it == channels_.end()){
        return;
    }
    assert(it->second == channel);
    channels_.erase(it);
    update(EPOLL_CTL_DEL, channel);
}

bool Poller::hasChannel(Channel* channel) const {
    auto it = channels_.find(channel->getFd());
    return it != channels_.end() && it->second == channel;
}

void Poller::update(int operation, Channel* channel){
    struct epoll_event event;
    memset(&event, 0, sizeof(event));
    event.events = channel->getEvents();
    event.data.ptr = channel;
    int fd = channel->getFd();

    if(::epoll_ctl(epollfd_, operation, fd, &event) < 0){
        if(operation == EPOLL_CTL_DEL){
            LOG_ERROR << "epoll_ctl DEL fd=" << fd << ": " << strerror(errno);
        }else{
            LOG_FATAL << "epoll_ctl op=" << operation << " fd=" << fd << ": " << strerror(errno);
        }
    }
}
