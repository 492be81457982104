#include "net/timer.h"
#include "net/event_loop.h"
#include <algorithm>
#include <iterator>
#include <vector>

TimerQueue::TimerQueue(EventLoop* loop) : loop_(loop) {}
TimerQueue::~TimerQueue() = default;

TimerId TimerQueue::addTimer(TimerCallback cb, Timestamp when){
    TimerPtr timer = std::make_shared<Timer>(std::move(cb), when);
    loop_->runInLoop([this, timer](){
        timers_.insert({timer->expiration(), timer});
    });
    return timer;
}

void TimerQueue::cancel(TimerId timer_id){
    loop_->runInLoop([this, timer_id](){
        cancelInLoop(timer_id);
    });
}

void TimerQueue::cancelInLoop(const TimerId& timer_id){
    loop_->assertInLoopThread();
    TimerPtr timer = timer_id.lock();
    if(!timer){
        return; // 已经触发或已取消
    }
    timers_.erase({timer->expiration(), timer});
}

Timestamp TimerQueue::earliestExpiration() const {
    if(timers_.empty()){
        return Timestamp::invalid();
    }
    return timers_.begin()->first;
}

void TimerQueue::handleExpiredTimers(){
    loop_->assertInLoopThread();
    Timestamp now = Timestamp::now();

    // 先整体摘下再执行，回调里可以安全地添加或取消定时器
    std::vector<Entry> expired;
    auto end = timers_.upper_bound(Entry(now, TimerPtr()));
    while(end != timers_.end() && end->first == now){
        ++end;
    }
    std::copy(timers_.begin(), end, std::back_inserter(expired));
    timers_.erase(timers_.begin(), end);

    for(const Entry& entry : expired){
        entry.second->run();
    }
}
