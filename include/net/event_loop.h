#pragma once
#include "net/timer.h"
#include "utils/noncopyable.h"
#include "utils/timestamp.h"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

class Channel;
class Poller;

// one loop per thread: 每个线程最多一个EventLoop
class EventLoop : NonCopyable{
public:
    using Functor = std::function<void()>;

    EventLoop();
    ~EventLoop();

    // 阻塞直到quit()被调用，只能在创建它的线程中调用
    void loop();
    // 可在任意线程调用
    void quit();

    void updateChannel(Channel* channel);
    void removeChannel(Channel* channel);

    void assertInLoopThread(){
        if(!isInLoopThread()){
            abortNotInLoopThread();
        }
    }
    bool isInLoopThread() const { return thread_id_ == std::this_thread::get_id(); }

    // 在本loop线程中执行cb: 已在本线程则立即执行，否则排队并唤醒
    void runInLoop(Functor cb);
    void queueInLoop(Functor cb);

    TimerId runAt(Timestamp time, std::function<void()> cb);
    TimerId runAfter(double delay_seconds, std::function<void()> cb);
    void cancel(TimerId timer_id);

    // 当前线程的EventLoop，没有时返回nullptr
    static EventLoop* getEventLoopOfCurrentThread();

private:
    void abortNotInLoopThread();
    void handleWakeup();
    void wakeup();
    void doPendingFunctors();
    int pollTimeoutMs() const;

    using ChannelList = std::vector<Channel*>;

    bool looping_;
    std::atomic<bool> quit_;
    bool calling_pending_functors_;
    const std::thread::id thread_id_;

    std::unique_ptr<Poller> poller_;
    std::unique_ptr<TimerQueue> timer_queue_;
    int wakeup_fd_; // eventfd，跨线程唤醒epoll_wait
    std::unique_ptr<Channel> wakeup_channel_;
    ChannelList active_channels_;

    std::mutex mutex_;
    std::vector<Functor> pending_functors_; // 受mutex_保护
};
