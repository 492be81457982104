#pragma once
#include "utils/timestamp.h"
#include <functional>
#include <memory>
#include <set>
#include <utility>

class EventLoop;

class Timer{
public:
    using TimerCallback = std::function<void()>;
    Timer(TimerCallback cb, Timestamp when) : callback_(std::move(cb)), expiration_(when) {}
    void run() const { callback_(); }
    Timestamp expiration() const { return expiration_; }
private:
    const TimerCallback callback_;
    const Timestamp expiration_;
};

// 调用方只持有weak_ptr，定时器触发或取消后自动失效
using TimerId = std::weak_ptr<Timer>;

// 一次性定时器队列，只在所属EventLoop的线程中修改
class TimerQueue{
public:
    using TimerCallback = std::function<void()>;

    explicit TimerQueue(EventLoop* loop);
    ~TimerQueue();

    // 线程安全，可在任意线程调用
    TimerId addTimer(TimerCallback cb, Timestamp when);
    void cancel(TimerId timer_id);

    void handleExpiredTimers();

    // 队列为空时返回无效时间戳
    Timestamp earliestExpiration() const;

private:
    using TimerPtr = std::shared_ptr<Timer>;
    using Entry = std::pair<Timestamp, TimerPtr>;
    using TimerList = std::set<Entry>;

    void cancelInLoop(const TimerId& timer_id);

    EventLoop* loop_;
    TimerList timers_; // 按到期时间排序
};
