#pragma once
#include "utils/noncopyable.h"
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

class EventLoop;

// 在新线程中运行一个EventLoop
class EventLoopThread : NonCopyable{
public:
    explicit EventLoopThread(const std::string& name = std::string());
    ~EventLoopThread();

    // 启动线程，阻塞到新线程中的EventLoop构造完成
    EventLoop* startLoop();

    const std::string& name() const { return name_; }
private:
    void threadFunc();

    EventLoop* loop_; // 受mutex_保护
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
    const std::string name_;
};
