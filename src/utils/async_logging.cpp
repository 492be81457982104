#include "utils/async_logging.h"
#include "utils/logfile.h"
#include <chrono>
#include <cstdio>
#include <cstring>

AsyncLogging::AsyncLogging(const std::string& basename, off_t roll_size, int flush_interval)
    : flush_interval_(flush_interval),
      running_(false),
      basename_(basename),
      roll_size_(roll_size),
      current_buffer_(new Buffer),
      next_buffer_(new Buffer) {
    current_buffer_->bzero();
    next_buffer_->bzero();
    buffers_.reserve(16);
}

AsyncLogging::~AsyncLogging() {
    if (running_) {
        stop();
    }
}

void AsyncLogging::append(const char* logline, int len) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_buffer_->avail() > static_cast<size_t>(len)) {
        current_buffer_->append(logline, len);
        return;
    }
    buffers_.push_back(std::move(current_buffer_));
    if (next_buffer_) {
        current_buffer_ = std::move(next_buffer_);
    } else {
        current_buffer_.reset(new Buffer); // 前端写得太快，很少发生
    }
    current_buffer_->append(logline, len);
    cond_.notify_one();
}

void AsyncLogging::start() {
    output_.reset(new LogFile(basename_, roll_size_, flush_interval_));
    running_ = true;
    thread_ = std::thread(&AsyncLogging::threadFunc, this);
}

void AsyncLogging::stop() {
    running_ = false;
    cond_.notify_one();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void AsyncLogging::threadFunc() {
    BufferPtr new_buffer1(new Buffer);
    BufferPtr new_buffer2(new Buffer);
    new_buffer1->bzero();
    new_buffer2->bzero();

    BufferVector buffers_to_write;
    buffers_to_write.reserve(16);

    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (buffers_.empty()) {
                cond_.wait_for(lock, std::chrono::seconds(flush_interval_));
            }
            buffers_.push_back(std::move(current_buffer_));
            current_buffer_ = std::move(new_buffer1);
            buffers_to_write.swap(buffers_);
            if (!next_buffer_) {
                next_buffer_ = std::move(new_buffer2);
            }
        }

        // 堆积过多说明磁盘跟不上，只保留前两块并留下记录
        if (buffers_to_write.size() > 25) {
            char buf[256];
            snprintf(buf, sizeof(buf), "Dropped log messages, %zu larger buffers\n",
                     buffers_to_write.size() - 2);
            fputs(buf, stderr);
            output_->append(buf, static_cast<int>(strlen(buf)));
            buffers_to_write.erase(buffers_to_write.begin() + 2, buffers_to_write.end());
        }

        for (const auto& buffer : buffers_to_write) {
            output_->append(buffer->data(), buffer->length());
        }

        if (buffers_to_write.size() > 2) {
            buffers_to_write.resize(2);
        }
        if (!new_buffer1) {
            new_buffer1 = std::move(buffers_to_write.back());
            buffers_to_write.pop_back();
            new_buffer1->reset();
        }
        if (!new_buffer2) {
            new_buffer2 = std::move(buffers_to_write.back());
            buffers_to_write.pop_back();
            new_buffer2->reset();
        }

        buffers_to_write.clear();
        output_->flush();
    }

    // 退出前把前端残留的日志也写进去
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& buffer : buffers_) {
        output_->append(buffer->data(), buffer->length());
    }
    if (current_buffer_ && current_buffer_->length() > 0) {
        output_->append(current_buffer_->data(), current_buffer_->length());
    }
    output_->flush();
}
