#pragma once
#include "utils/noncopyable.h"
#include <map>
#include <sys/epoll.h>
#include <vector>

class Channel;
class EventLoop;

// epoll的封装，属于某个EventLoop，只能在其线程中使用
class Poller : NonCopyable{
public:
    using ChannelList = std::vector<Channel*>;

    explicit Poller(EventLoop* loop);
    ~Poller();

    // epoll_wait，把活跃的Channel追加到active_channels
    void poll(int timeout_ms, ChannelList* active_channels);

    void updateChannel(Channel* channel);
    void removeChannel(Channel* channel);

    bool hasChannel(Channel* channel) const;

private:
    static const int kInitEventListSize = 16;

    void update(int operation, Channel* channel);

    using ChannelMap = std::map<int, Channel*>;

    EventLoop* owner_loop_;
    ChannelMap channels_;
    int epollfd_;
    std::vector<struct epoll_event> events_;
};
