#pragma once
#include <cstdint>
#include <ctime>
#include <string>

// 微秒精度的时间点，日志行首和定时器队列共用
class Timestamp{
public:
    Timestamp() : micro_seconds_since_epoch_(0) {}
    explicit Timestamp(int64_t micro_seconds) : micro_seconds_since_epoch_(micro_seconds) {}

    static Timestamp now();
    static Timestamp invalid() { return Timestamp(); }

    // 格式: 2025/01/31 12:00:00.123456
    std::string toString() const;

    bool valid() const { return micro_seconds_since_epoch_ > 0; }
    int64_t microSecondsSinceEpoch() const { return micro_seconds_since_epoch_; }
    time_t secondsSinceEpoch() const {
        return static_cast<time_t>(micro_seconds_since_epoch_ / kMicroSecondsPerSecond);
    }

    static const int kMicroSecondsPerSecond = 1000 * 1000;
private:
    int64_t micro_seconds_since_epoch_;
};

inline bool operator<(Timestamp lhs, Timestamp rhs){
    return lhs.microSecondsSinceEpoch() < rhs.microSecondsSinceEpoch();
}

inline bool operator==(Timestamp lhs, Timestamp rhs){
    return lhs.microSecondsSinceEpoch() == rhs.microSecondsSinceEpoch();
}

inline Timestamp addTime(Timestamp timestamp, double seconds){
    int64_t delta = static_cast<int64_t>(seconds * Timestamp::kMicroSecondsPerSecond);
    return Timestamp(timestamp.microSecondsSinceEpoch() + delta);
}
