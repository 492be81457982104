#pragma once
#include "utils/log_stream.h"
#include "utils/noncopyable.h"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

class LogFile;

// 双缓冲异步日志: 前端线程只做内存拷贝，后台线程定期把写满的缓冲区刷进LogFile
class AsyncLogging : NonCopyable {
public:
    AsyncLogging(const std::string& basename, off_t roll_size, int flush_interval = 3);
    ~AsyncLogging();

    void append(const char* logline, int len);

    // 打开日志文件并启动后台线程，文件打不开时抛出std::runtime_error
    void start();
    void stop();
private:
    void threadFunc();

    using Buffer = FixedBuffer<kLargeBuffer>;
    using BufferPtr = std::unique_ptr<Buffer>;
    using BufferVector = std::vector<BufferPtr>;

    const int flush_interval_;
    std::atomic<bool> running_;
    const std::string basename_;
    const off_t roll_size_;
    std::unique_ptr<LogFile> output_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
    BufferPtr current_buffer_;
    BufferPtr next_buffer_;
    BufferVector buffers_;
};
