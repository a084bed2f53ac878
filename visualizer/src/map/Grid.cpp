#include "map/Grid.h"
#include "utils/Logger.h"
#include "utils/MathUtils.h"
#include <stdexcept>
#include <string>

namespace pathviz{
namespace map{

Grid::Grid(int rows, int widthPx)
    : rows_(rows), widthPx_(widthPx), gap_(rows > 0 ? widthPx / rows : 0) {
    if (rows_ <= 0 || gap_ <= 0) {
        throw std::invalid_argument("Grid: rows must be > 0 and width >= rows, got rows="
                                    + std::to_string(rows) + " width=" + std::to_string(widthPx));
    }
    Reset();
}

Cell& Grid::At(int row, int col) {
    if (!Contains(row, col)) {
        throw std::out_of_range("Grid::At " + Point{row, col}.toString() + " outside "
                                + std::to_string(rows_) + "x" + std::to_string(rows_));
    }
    return cells_[row * rows_ + col];
}

const Cell& Grid::At(int row, int col) const {
    if (!Contains(row, col)) {
        throw std::out_of_range("Grid::At " + Point{row, col}.toString() + " outside "
                                + std::to_string(rows_) + "x" + std::to_string(rows_));
    }
    return cells_[row * rows_ + col];
}

Point Grid::CellAtPixel(int x, int y) const {
    int row = utils::Clamp(x / gap_, 0, rows_ - 1);
    int col = utils::Clamp(y / gap_, 0, rows_ - 1);
    // 负坐标整除向 0 取整, Clamp 之后仍落在第 0 格
    return {row, col};
}

void Grid::RecomputeNeighbors() {
    struct Offset { int dr, dc; };
    static const Offset dirs[4] = {{1,0},{-1,0},{0,1},{0,-1}}; // 下 上 右 左

    for (auto& cell : cells_) {
        cell.neighbors_.clear();
        for (const auto& d : dirs) {
            int r = cell.pos_.row + d.dr;
            int c = cell.pos_.col + d.dc;
            if (!Contains(r, c)) continue;
            if (cells_[r * rows_ + c].IsBarrier()) continue;
            cell.neighbors_.push_back({r, c});
        }
    }
}

void Grid::Reset() {
    cells_.clear();
    cells_.reserve(static_cast<size_t>(rows_) * rows_);
    for (int r = 0; r < rows_; ++r) {
        for (int c = 0; c < rows_; ++c) {
            cells_.emplace_back(Point{r, c});
        }
    }
    LOG_DEBUG("Grid reset: %dx%d, cell %dpx", rows_, rows_, gap_);
}

int Grid::CountState(CellState s) const {
    int n = 0;
    for (const auto& cell : cells_) {
        if (cell.State() == s) ++n;
    }
    return n;
}

}
}
