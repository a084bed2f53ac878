#pragma once
#include "model/GridTypes.h"
#include <cstdlib>


namespace pathviz{
namespace utils{

// 曼哈顿距离 : 四连通、单位代价网格上的可采纳且一致的启发式
inline int Manhattan(const model::Point& p1, const model::Point& p2) {
    return std::abs(p1.row - p2.row) + std::abs(p1.col - p2.col);
}

// 把 v 夹到 [lo, hi]
inline int Clamp(int v, int lo, int hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

}
}
