#include "utils/logger.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>

Logger::LogLevel g_logLevel = Logger::INFO;

namespace {

const char* const kLevelNames[Logger::NUM_LOG_LEVELS] = {
    "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"
};

void defaultOutput(const char* msg, int len) {
    fwrite(msg, 1, len, stdout);
}

void defaultFlush() {
    fflush(stdout);
}

Logger::OutputFunc g_output = defaultOutput;
Logger::FlushFunc g_flush = defaultFlush;

// 只保留文件名部分，日志里不需要完整的编译路径
const char* stripDirectory(const char* file) {
    const char* slash = strrchr(file, '/');
    return slash ? slash + 1 : file;
}

} // namespace

Logger::Impl::Impl(LogLevel level, const char* file, int line)
    : time_(Timestamp::now()),
      stream_(),
      level_(level),
      line_(line),
      basename_(stripDirectory(file)) {
    stream_ << time_.toString() << ' ';
    stream_ << std::this_thread::get_id() << ' ';
    char level_buf[8];
    snprintf(level_buf, sizeof(level_buf), "%-5s ", kLevelNames[level]);
    stream_ << level_buf;
}

void Logger::Impl::finish() {
    stream_ << " - " << basename_ << ':' << line_ << '\n';
}

Logger::Logger(const char* file, int line, LogLevel level)
    : impl_(level, file, line) {
}

Logger::~Logger() {
    impl_.finish();
    const LogStream::Buffer& buf(stream().buffer());
    g_output(buf.data(), buf.length());
    if (impl_.level_ == FATAL) {
        g_flush(); // 确保FATAL信息落盘后再退出
        abort();
    }
}

void Logger::setOutput(OutputFunc out) {
    g_output = std::move(out);
}

void Logger::setFlush(FlushFunc flush) {
    g_flush = std::move(flush);
}

void Logger::setLogLevel(LogLevel level) {
    g_logLevel = level;
}

const char* Logger::levelName(LogLevel level) {
    if (level < TRACE || level >= NUM_LOG_LEVELS) {
        return "UNKNOWN";
    }
    return kLevelNames[level];
}

Logger::LogLevel Logger::parseLevel(const std::string& name, LogLevel fallback) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(::toupper(c)); });
    for (int i = 0; i < NUM_LOG_LEVELS; ++i) {
        if (upper == kLevelNames[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return fallback;
}
