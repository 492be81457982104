#include "net/event_loop.h"
#include "net/channel.h"
#include "net/poller.h"
#include "utils/logger.h"
#include <cassert>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <sys/eventfd.h>
#include <unistd.h>

namespace {

thread_local EventLoop* t_loop_in_this_thread = nullptr;

// 没有定时器时最多阻塞这么久
const int kPollTimeMs = 10000;

int createEventfd(){
    int fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if(fd < 0){
        throw std::runtime_error(std::string("eventfd: ") + strerror(errno));
    }
    return fd;
}

} // namespace

EventLoop::EventLoop()
    : looping_(false),
      quit_(false),
      calling_pending_functors_(false),
      thread_id_(std::this_thread::get_id()),
      poller_(new Poller(this)),
      timer_queue_(new TimerQueue(this)),
      wakeup_fd_(createEventfd()),
      wakeup_channel_(new Channel(this, wakeup_fd_)){
    if(t_loop_in_this_thread){
        LOG_FATAL << "Another EventLoop " << static_cast<void*>(t_loop_in_this_thread)
                  << " exists in this thread";
    }
    t_loop_in_this_thread = this;
    wakeup_channel_->setReadCallback(std::bind(&EventLoop::handleWakeup, this));
    wakeup_channel_->enableReading();
}

EventLoop::~EventLoop(){
    assert(!looping_);
    wakeup_channel_->disableAll();
    wakeup_channel_->remove();
    ::close(wakeup_fd_);
    t_loop_in_this_thread = nullptr;
}

EventLoop* EventLoop::getEventLoopOfCurrentThread(){
    return t_loop_in_this_thread;
}

int EventLoop::pollTimeoutMs() const {
    Timestamp earliest = timer_queue_->earliestExpiration();
    if(!earliest.valid()){
        return kPollTimeMs;
    }
    int64_t diff = earliest.microSecondsSinceEpoch() - Timestamp::now().microSecondsSinceEpoch();
    if(diff <= 0){
        return 0;
    }
    // 向上取整，避免定时器提前1ms醒来后空转
    int64_t ms = (diff + 999) / 1000;
    return ms > kPollTimeMs ? kPollTimeMs : static_cast<int>(ms);
}

void EventLoop::loop(){
    assert(!looping_);
    assertInLoopThread();
    looping_ = true;
    quit_ = false;
    LOG_TRACE << "EventLoop " << static_cast<void*>(this) << " start looping";

    while(!quit_){
        active_channels_.clear();
        poller_->poll(pollTimeoutMs(), &active_channels_);
        for(Channel* channel : active_channels_){
            channel->handleEvent();
        }
        timer_queue_->handleExpiredTimers();
        doPendingFunctors();
    }

    LOG_TRACE << "EventLoop " << static_cast<void*>(this) << " stop looping";
    looping_ = false;
}

void EventLoop::quit(){
    quit_ = true;
    if(!isInLoopThread()){
        wakeup();
    }
}

void EventLoop::updateChannel(Channel* channel){
    assert(channel->ownerLoop() == this);
    assertInLoopThread();
    poller_->updateChannel(channel);
}

void EventLoop::removeChannel(Channel* channel){
    assert(channel->ownerLoop() == this);
    assertInLoopThread();
    poller_->removeChannel(channel);
}

void EventLoop::runInLoop(Functor cb){
    if(isInLoopThread()){
        cb();
    }else{
        queueInLoop(std::move(cb));
    }
}

void EventLoop::queueInLoop(Functor cb){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_functors_.push_back(std::move(cb));
    }
    // 正在执行pending functors时新加入的任务要等下一轮，也需要唤醒
    if(!isInLoopThread() || calling_pending_functors_){
        wakeup();
    }
}

void EventLoop::wakeup(){
    uint64_t one = 1;
    ssize_t n = ::write(wakeup_fd_, &one, sizeof(one));
    if(n != sizeof(one)){
        LOG_ERROR << "EventLoop::wakeup() writes " << static_cast<long>(n) << " bytes instead of 8";
    }
}

void EventLoop::handleWakeup(){
    uint64_t one = 1;
    ssize_t n = ::read(wakeup_fd_, &one, sizeof(one));
    if(n != sizeof(one)){
        LOG_ERROR << "EventLoop::handleWakeup() reads " << static_cast<long>(n) << " bytes instead of 8";
    }
}

void EventLoop::doPendingFunctors(){
    std::vector<Functor> functors;
    calling_pending_functors_ = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        functors.swap(pending_functors_);
    }
    for(const Functor& functor : functors){
        functor();
    }
    calling_pending_functors_ = false;
}

void EventLoop::abortNotInLoopThread(){
    LOG_FATAL << "EventLoop::abortNotInLoopThread - EventLoop " << static_cast<void*>(this)
              << " was created in thread " << thread_id_
              << ", current thread is " << std::this_thread::get_id();
}

TimerId EventLoop::runAt(Timestamp time, std::function<void()> cb){
    return timer_queue_->addTimer(std::move(cb), time);
}

TimerId EventLoop::runAfter(double delay_seconds, std::function<void()> cb){
    return runAt(addTime(Timestamp::now(), delay_seconds), std::move(cb));
}

void EventLoop::cancel(TimerId timer_id){
    timer_queue_->cancel(std::move(timer_id));
}
