#pragma once
#include "model/GridTypes.h"
#include <cstdint>

namespace pathviz{
namespace ui{

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb& o) const { return r==o.r && g==o.g && b==o.b; }
};

namespace palette {
constexpr Rgb kRed{255, 0, 0};
constexpr Rgb kGreen{0, 255, 0};
constexpr Rgb kWhite{255, 255, 255};
constexpr Rgb kBlack{0, 0, 0};
constexpr Rgb kPurple{128, 0, 128};
constexpr Rgb kPink{255, 0, 255};
constexpr Rgb kNavy{0, 0, 128};
constexpr Rgb kGrey{128, 128, 128};
}

// 格子状态 -> 颜色 : 只在绘制边界使用
inline Rgb ColorOf(model::CellState s) {
    using model::CellState;
    switch (s) {
        case CellState::EMPTY:   return palette::kWhite;
        case CellState::START:   return palette::kPink;
        case CellState::END:     return palette::kNavy;
        case CellState::BARRIER: return palette::kBlack;
        case CellState::OPEN:    return palette::kGreen;
        case CellState::CLOSED:  return palette::kRed;
        case CellState::PATH:    return palette::kPurple;
    }
    return palette::kWhite;
}

}
}
