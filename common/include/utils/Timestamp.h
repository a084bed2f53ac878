#pragma once
#include <cstdint>
#include <string>

/*
微秒级时间戳 : 给 Logger 打时间, 给搜索统计耗时
*/
namespace pathviz{
namespace utils{

class Timestamp{
private:
    int64_t usSinceEpoch_;  // 微秒

public:
    Timestamp();
    explicit Timestamp(int64_t usSinceEpoch);

    static Timestamp now(); // 当前时间

    // 给 Logger 用 ：格式化输出
    std::string toFormattedString(bool showMs = true) const;

    int64_t usSinceEpoch() const {return usSinceEpoch_;}

    // 返回两个时间戳的时间差(毫秒)
    static double msDifference(Timestamp high, Timestamp low) {
        int64_t diff = high.usSinceEpoch() - low.usSinceEpoch();
        return static_cast<double>(diff) / 1000.0;
    }

    bool operator<(const Timestamp& rhs) const { return usSinceEpoch_ < rhs.usSinceEpoch_; }
};

}
}
