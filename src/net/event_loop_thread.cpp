#include "net/event_loop_thread.h"
#include "net/event_loop.h"
#include "utils/logger.h"

EventLoopThread::EventLoopThread(const std::string& name)
    : loop_(nullptr), name_(name) {}

EventLoopThread::~EventLoopThread(){
    EventLoop* loop = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop = loop_;
    }
    // loop_为空说明线程已经退出(或从未启动)
    if(loop != nullptr){
        loop->quit();
    }
    if(thread_.joinable()){
        thread_.join();
    }
}

EventLoop* EventLoopThread::startLoop(){
    thread_ = std::thread(&EventLoopThread::threadFunc, this);

    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this] { return loop_ != nullptr; });
    return loop_;
}

void EventLoopThread::threadFunc(){
    EventLoop loop; // 生命周期与线程相同

    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_ = &loop;
        cond_.notify_one();
    }
    LOG_DEBUG << "I/O thread " << name_ << " started";

    loop.loop();

    std::lock_guard<std::mutex> lock(mutex_);
    loop_ = nullptr;
}
