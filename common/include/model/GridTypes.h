#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace pathviz{
namespace model{

/*
Point 是个聚合体，用大括号 {} 聚合初始化 : Point p{row, col};
row 对应窗口 x 方向，col 对应窗口 y 方向
*/
struct Point {
    int row = 0;
    int col = 0;

    bool operator==(const Point& p) const {
        return row==p.row && col==p.col;
    }

    bool operator!=(const Point& p) const {
        return !(*this == p);
    }

    // 方便日志打印
    std::string toString() const {
        return "(" + std::to_string(row) + "," + std::to_string(col) + ")";
    }
};

// unordered_map / unordered_set 的哈希
struct PointHash {
    size_t operator()(const Point& p) const {
        uint64_t key = (static_cast<uint64_t>(static_cast<uint32_t>(p.row)) << 32) | static_cast<uint32_t>(p.col);
        return std::hash<uint64_t>()(key);
    }
};

// ================================

/*
格子状态 : 领域状态与显示颜色分离，颜色只在 Renderer 边界做映射 (见 ui/Palette.h)
*/
enum class CellState {
    EMPTY = 0,  // 空白
    START,      // 起点
    END,        // 终点
    BARRIER,    // 障碍
    OPEN,       // 已发现, 在 open set 中
    CLOSED,     // 已扩展
    PATH        // 最终路径
};

// 日志用
inline const char* CellStateName(CellState s) {
    switch(s) {
        case CellState::EMPTY:   return "EMPTY";
        case CellState::START:   return "START";
        case CellState::END:     return "END";
        case CellState::BARRIER: return "BARRIER";
        case CellState::OPEN:    return "OPEN";
        case CellState::CLOSED:  return "CLOSED";
        case CellState::PATH:    return "PATH";
    }
    return "UNKNOWN";
}

}
}
