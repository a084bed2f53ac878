#pragma once
#include "map/Grid.h"
#include "model/GridTypes.h"
#include "ISearchListener.h"
#include <cstdint>
#include <vector>
#include <string>


namespace pathviz{
namespace algo{
namespace planner{

using Point = model::Point;

enum class SearchOutcome {
    FOUND,      // 终点出队, 路径已回溯
    NO_PATH,    // open set 耗尽
    ABORTED     // listener 请求中止
};

const char* SearchOutcomeName(SearchOutcome o);

struct SearchResult {
    SearchOutcome outcome = SearchOutcome::NO_PATH;
    std::vector<Point> path;            // 起点..终点 (含两端), 仅 FOUND 时非空
    std::vector<Point> expansionOrder;  // 出队顺序
    int expanded = 0;                   // 出队次数, 等于 expansionOrder.size()
    double elapsedMs = 0.0;             // steady_clock 计时

    bool Found() const { return outcome == SearchOutcome::FOUND; }
    // 路径步数 = 边数
    int PathLength() const { return path.empty() ? 0 : static_cast<int>(path.size()) - 1; }
};

/*
A* : f = g + h
    g : 起点到当前格子的实际代价, 每走一步 +1
    h : 当前格子到终点的曼哈顿距离 (可采纳且一致)
open set 按 f 排小根堆, f 相同时按入队序号 (先入先出), 保证扩展顺序确定
*/
class AStarSolver {
public:
    AStarSolver() = default;
    ~AStarSolver() = default;

    // 前置条件 : start != end, 两者都在 grid 内, 邻居列表已经 RecomputeNeighbors()
    // 违反前置条件抛 std::invalid_argument
    // 搜索过程会改写格子状态 : OPEN / CLOSED / PATH, 结束时终点重新标记为 END
    SearchResult Search(map::Grid& grid, const Point& start, const Point& end,
                        ISearchListener* listener = nullptr);

    static int CalcH(const Point& cur, const Point& end);
};


// open set 中的一项 ; seq 单调递增
struct OpenEntry {
    int f;
    uint64_t seq;
    Point pos;

    // 小根堆比较器 : 返回 a 排在 b 之后
    struct Compare {
        bool operator()(const OpenEntry& a, const OpenEntry& b) const {
            if (a.f != b.f) return a.f > b.f;
            return a.seq > b.seq;
        }
    };
};

}
}
}
