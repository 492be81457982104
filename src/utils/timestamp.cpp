#include "utils/timestamp.h"
#include <sys/time.h>
#include <cstdio>
#include <ctime>

Timestamp Timestamp::now(){
    struct timeval tv;
    gettimeofday(&tv, nullptr);
    return Timestamp(static_cast<int64_t>(tv.tv_sec) * kMicroSecondsPerSecond + tv.tv_usec);
}

std::string Timestamp::toString() const {
    char buf[64] = {0};
    time_t seconds = secondsSinceEpoch();
    int micro_seconds = static_cast<int>(micro_seconds_since_epoch_ % kMicroSecondsPerSecond);

    struct tm tm_time;
    localtime_r(&seconds, &tm_time); // 线程安全版本

    snprintf(buf, sizeof(buf), "%4d/%02d/%02d %02d:%02d:%02d.%06d",
        tm_time.tm_year + 1900, tm_time.tm_mon + 1, tm_time.tm_mday,
        tm_time.tm_hour, tm_time.tm_min, tm_time.tm_sec,
        micro_seconds);
    return buf;
}
