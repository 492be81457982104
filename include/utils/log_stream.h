#pragma once
#include <cstring>
#include <filesystem>
#include <string>
#include <thread>

const int kSmallBuffer = 4000;
const int kLargeBuffer = 4000 * 1000;

// 定长缓冲区，空间不足时丢弃新数据而不是扩容
template<int SIZE>
class FixedBuffer{
public:
    FixedBuffer() : cur_(data_) {}

    void append(const char* buf, size_t len){
        if(avail() > len){
            memcpy(cur_, buf, len);
            cur_ += len;
        }
    }
    const char* data() const { return data_; }
    int length() const { return static_cast<int>(cur_ - data_); }
    char* current() { return cur_; }
    size_t avail() const { return static_cast<size_t>(end() - cur_); }
    void add(size_t len) { cur_ += len; }
    void reset() { cur_ = data_; }
    void bzero() { memset(data_, 0, sizeof(data_)); }
    std::string toString() const { return std::string(data_, length()); }
private:
    const char* end() const { return data_ + sizeof(data_); }
    char data_[SIZE];
    char* cur_;
};

// 仿照std::ostream的接口，把各种类型格式化进FixedBuffer
class LogStream{
public:
    using Buffer = FixedBuffer<kSmallBuffer>;

    LogStream& operator<<(bool v) {
        buffer_.append(v ? "1" : "0", 1);
        return *this;
    }
    LogStream& operator<<(short);
    LogStream& operator<<(unsigned short);
    LogStream& operator<<(int);
    LogStream& operator<<(unsigned int);
    LogStream& operator<<(long);
    LogStream& operator<<(unsigned long);
    LogStream& operator<<(long long);
    LogStream& operator<<(unsigned long long);
    LogStream& operator<<(const void*);
    LogStream& operator<<(double);
    LogStream& operator<<(float v) {
        *this << static_cast<double>(v);
        return *this;
    }
    LogStream& operator<<(char v) {
        buffer_.append(&v, 1);
        return *this;
    }
    LogStream& operator<<(const char* str) {
        if(str){
            buffer_.append(str, strlen(str));
        }else{
            buffer_.append("(null)", 6);
        }
        return *this;
    }
    LogStream& operator<<(const std::string& v) {
        buffer_.append(v.data(), v.size());
        return *this;
    }
    // 路径按原样输出，带双引号，便于在日志里看出首尾空白
    LogStream& operator<<(const std::filesystem::path& p);
    LogStream& operator<<(const std::thread::id& tid);

    void append(const char* data, int len) { buffer_.append(data, len); }
    const Buffer& buffer() const { return buffer_; }
    void resetBuffer() { buffer_.reset(); }
private:
    template<typename T> void formatInteger(T);

    Buffer buffer_;
    static const int kMaxNumericSize = 48;
};
