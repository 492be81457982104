#pragma once

// 持有唯一资源(fd、FILE*、线程)的类继承它以禁止拷贝
class NonCopyable{
public:
    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;
protected:
    NonCopyable() = default;
    ~NonCopyable() = default;
};
