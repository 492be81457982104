#pragma once
#include "utils/noncopyable.h"
#include <memory>
#include <string>
#include <vector>

class EventLoop;
class EventLoopThread;

// 主Reactor负责accept，从Reactor(I/O线程)负责已建立连接的读写
class EventLoopThreadPool : NonCopyable{
public:
    EventLoopThreadPool(EventLoop* base_loop, const std::string& name, int num_threads);
    ~EventLoopThreadPool();

    void start();

    // 轮询选择下一个I/O loop；线程数为0时所有连接都在base_loop上
    EventLoop* getNextLoop();

    int numThreads() const { return num_threads_; }
private:
    EventLoop* base_loop_;
    const std::string name_;
    const int num_threads_;
    size_t next_;
    std::vector<std::unique_ptr<EventLoopThread>> threads_;
    std::vector<EventLoop*> loops_;
};
