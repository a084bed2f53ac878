#pragma once
#include <vector>
#include "model/GridTypes.h"

namespace pathviz{
namespace map{

using model::Point;
using model::CellState;

/*
单个格子 : 坐标创建后不变, 状态由输入和搜索过程改写
邻居列表只在 Grid::RecomputeNeighbors() 之后有效
*/
class Cell {
public:
    explicit Cell(Point pos) : pos_(pos) {}

    const Point& Pos() const { return pos_; }
    CellState State() const { return state_; }
    void SetState(CellState s) { state_ = s; }

    bool IsEmpty() const { return state_ == CellState::EMPTY; }
    bool IsStart() const { return state_ == CellState::START; }
    bool IsEnd() const { return state_ == CellState::END; }
    bool IsBarrier() const { return state_ == CellState::BARRIER; }
    bool IsClosed() const { return state_ == CellState::CLOSED; }

    const std::vector<Point>& Neighbors() const { return neighbors_; }

private:
    friend class Grid;

    Point pos_;
    CellState state_ = CellState::EMPTY;
    std::vector<Point> neighbors_;  // 最多 4 个, 顺序 : 下 上 右 左
};

/*
N x N 方格, 窗口宽 widthPx 像素, 每格 CellSize() 像素
一维 vector 存储, index = row * rows_ + col
*/
class Grid {
public:
    Grid(int rows, int widthPx);
    ~Grid() = default;

    int Rows() const { return rows_; }
    int WidthPx() const { return widthPx_; }
    int CellSize() const { return gap_; }

    bool Contains(int row, int col) const {
        return row >= 0 && row < rows_ && col >= 0 && col < rows_;
    }
    bool Contains(const Point& p) const { return Contains(p.row, p.col); }

    // 越界是调用方的编程错误 : 抛 std::out_of_range
    Cell& At(int row, int col);
    const Cell& At(int row, int col) const;
    Cell& At(const Point& p) { return At(p.row, p.col); }
    const Cell& At(const Point& p) const { return At(p.row, p.col); }

    // 像素坐标 -> 格子坐标 (row 沿 x 方向), 结果夹到网格内
    Point CellAtPixel(int x, int y) const;

    // 按当前障碍重建所有格子的邻居 ; 每次障碍编辑之后、每次搜索之前调用
    void RecomputeNeighbors();

    // 丢弃所有格子, 重建 N x N 个 EMPTY
    void Reset();

    int CountState(CellState s) const;

private:
    int rows_;
    int widthPx_;
    int gap_;
    std::vector<Cell> cells_;
};

}
}
