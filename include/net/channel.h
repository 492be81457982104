#pragma once
#include "utils/noncopyable.h"
#include <cstdint>
#include <functional>
#include <memory>

class EventLoop;

// 一个fd的事件分发器，不拥有fd，生命周期由Connection/Server管理
class Channel : NonCopyable{
public:
    using EventCallback = std::function<void()>;

    Channel(EventLoop* loop, int fd);
    ~Channel();

    // 由EventLoop在poll返回后调用
    void handleEvent();

    // 绑定所有者，所有者已销毁时不再分发事件
    void tie(const std::shared_ptr<void>& obj);

    void setReadCallback(EventCallback cb) { read_callback_ = std::move(cb); }
    void setWriteCallback(EventCallback cb) { write_callback_ = std::move(cb); }
    void setCloseCallback(EventCallback cb) { close_callback_ = std::move(cb); }
    void setErrorCallback(EventCallback cb) { error_callback_ = std::move(cb); }

    int getFd() const { return fd_; }
    uint32_t getEvents() const { return events_; }
    void setRevents(uint32_t revt) { revents_ = revt; } // 由Poller调用

    bool isNoneEvent() const { return events_ == kNoneEvent; }
    bool isWriting() const { return events_ & kWriteEvent; }
    bool isReading() const { return events_ & kReadEvent; }

    void enableReading() { events_ |= kReadEvent; update(); }
    void disableReading() { events_ &= ~kReadEvent; update(); }
    void enableWriting() { events_ |= kWriteEvent; update(); }
    void disableWriting() { events_ &= ~kWriteEvent; update(); }
    void disableAll() { events_ = kNoneEvent; update(); }

    // 从所属EventLoop的Poller中注销
    void remove();

    EventLoop* ownerLoop() const { return loop_; }

private:
    void update();
    void handleEventWithGuard();

    static const uint32_t kNoneEvent;
    static const uint32_t kReadEvent;
    static const uint32_t kWriteEvent;

    EventLoop* loop_;
    const int fd_;
    uint32_t events_;
    uint32_t revents_;
    std::weak_ptr<void> tie_;
    bool tied_;
    bool event_handling_;

    EventCallback read_callback_;
    EventCallback write_callback_;
    EventCallback close_callback_;
    EventCallback error_callback_;
};
