#include "utils/log_stream.h"
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <sstream>

namespace {

const char digits[] = "9876543210123456789";
const char* zero = digits + 9;

// 整数转十进制字符串，负数也能正确处理(zero指向表的中间)
template<typename T>
size_t convert(char buf[], T value) {
    T i = value;
    char* p = buf;
    do {
        int lsd = static_cast<int>(i % 10);
        i /= 10;
        *p++ = zero[lsd];
    } while (i != 0);
    if (value < 0) {
        *p++ = '-';
    }
    *p = '\0';
    std::reverse(buf, p);
    return p - buf;
}

const char digitsHex[] = "0123456789abcdef";

size_t convertHex(char buf[], uintptr_t value) {
    uintptr_t i = value;
    char* p = buf;
    do {
        int lsd = static_cast<int>(i % 16);
        i /= 16;
        *p++ = digitsHex[lsd];
    } while (i != 0);
    *p = '\0';
    std::reverse(buf, p);
    return p - buf;
}

} // namespace

template<typename T>
void LogStream::formatInteger(T v) {
    if (buffer_.avail() >= kMaxNumericSize) {
        size_t len = convert(buffer_.current(), v);
        buffer_.add(len);
    }
}

LogStream& LogStream::operator<<(short v) {
    *this << static_cast<int>(v);
    return *this;
}
LogStream& LogStream::operator<<(unsigned short v) {
    *this << static_cast<unsigned int>(v);
    return *this;
}
LogStream& LogStream::operator<<(int v) {
    formatInteger(v);
    return *this;
}
LogStream& LogStream::operator<<(unsigned int v) {
    formatInteger(v);
    return *this;
}
LogStream& LogStream::operator<<(long v) {
    formatInteger(v);
    return *this;
}
LogStream& LogStream::operator<<(unsigned long v) {
    formatInteger(v);
    return *this;
}
LogStream& LogStream::operator<<(long long v) {
    formatInteger(v);
    return *this;
}
LogStream& LogStream::operator<<(unsigned long long v) {
    formatInteger(v);
    return *this;
}

LogStream& LogStream::operator<<(const void* p) {
    uintptr_t v = reinterpret_cast<uintptr_t>(p);
    if (buffer_.avail() >= kMaxNumericSize) {
        char* buf = buffer_.current();
        buf[0] = '0';
        buf[1] = 'x';
        size_t len = convertHex(buf + 2, v);
        buffer_.add(len + 2);
    }
    return *this;
}

LogStream& LogStream::operator<<(double v) {
    if (buffer_.avail() >= kMaxNumericSize) {
        int len = snprintf(buffer_.current(), kMaxNumericSize, "%.12g", v);
        buffer_.add(len);
    }
    return *this;
}

LogStream& LogStream::operator<<(const std::filesystem::path& p) {
    const std::string& s = p.native();
    buffer_.append("\"", 1);
    buffer_.append(s.data(), s.size());
    buffer_.append("\"", 1);
    return *this;
}

LogStream& LogStream::operator<<(const std::thread::id& tid) {
    std::ostringstream ss;
    ss << tid;
    std::string s = ss.str();
    buffer_.append(s.data(), s.size());
    return *this;
}
