#pragma once
#include "utils/noncopyable.h"
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>
#include <sys/types.h>

// 日志文件: 超过roll_size字节或跨天时换一个新文件
// 文件名格式: basename.20250131-120000.host.pid.log
class LogFile : NonCopyable {
public:
    // 第一次打开文件失败时抛出std::runtime_error
    LogFile(const std::string& basename,
            off_t roll_size,
            int flush_interval = 3,
            int check_every_n = 1024);
    ~LogFile();

    void append(const char* logline, int len);
    void flush();

    const std::string& currentFileName() const { return filename_; }

private:
    void appendUnlocked(const char* logline, int len);
    bool rollFile();

    static std::string getLogFileName(const std::string& basename, time_t* now);

    const std::string basename_;
    const off_t roll_size_;
    const int flush_interval_;
    const int check_every_n_;

    int count_;
    off_t written_bytes_;

    std::mutex mutex_;
    time_t start_of_period_;
    time_t last_roll_;
    time_t last_flush_;
    FILE* file_;
    std::string filename_;

    static const int kRollPerSeconds = 60 * 60 * 24;
};
