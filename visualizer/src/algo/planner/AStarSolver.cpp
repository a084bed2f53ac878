#include "algo/planner/AStarSolver.h"
#include "utils/Logger.h"
#include "utils/MathUtils.h"
#include <algorithm>
#include <chrono>
#include <queue>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace pathviz{
namespace algo{
namespace planner{

using model::CellState;
using model::PointHash;

const char* SearchOutcomeName(SearchOutcome o) {
    switch (o) {
        case SearchOutcome::FOUND:   return "FOUND";
        case SearchOutcome::NO_PATH: return "NO_PATH";
        case SearchOutcome::ABORTED: return "ABORTED";
    }
    return "UNKNOWN";
}

int AStarSolver::CalcH(const Point& cur, const Point& end) {
    return utils::Manhattan(cur, end);
}

namespace {

// 稀疏的 g 值表 : 表里没有的格子视为无穷大 (尚未发现)
class ScoreMap {
public:
    bool Has(const Point& p) const { return scores_.count(p) != 0; }

    // 调用前先 Has()
    int Get(const Point& p) const { return scores_.at(p); }

    void Set(const Point& p, int v) { scores_[p] = v; }

private:
    std::unordered_map<Point, int, PointHash> scores_;
};

}

SearchResult AStarSolver::Search(map::Grid& grid, const Point& start, const Point& end,
                                 ISearchListener* listener) {
    if (!grid.Contains(start) || !grid.Contains(end)) {
        throw std::invalid_argument("AStar: start " + start.toString() + " or end "
                                    + end.toString() + " outside grid");
    }
    if (start == end) {
        throw std::invalid_argument("AStar: start equals end " + start.toString());
    }

    SearchResult result;
    // 耗时用单调时钟, 不受系统时间调整影响
    const auto begin = std::chrono::steady_clock::now();
    auto elapsedMs = [&begin]() {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - begin).count();
    };

    // 1.初始化 : 本次搜索的全部状态都是局部变量, 返回即丢弃
    std::priority_queue<OpenEntry, std::vector<OpenEntry>, OpenEntry::Compare> openSet;
    std::unordered_set<Point, PointHash> openSetMembers;  // 避免在堆里查找
    std::unordered_map<Point, Point, PointHash> cameFrom;
    ScoreMap gScore;
    ScoreMap fScore;
    uint64_t count = 0;

    gScore.Set(start, 0);
    fScore.Set(start, CalcH(start, end));
    openSet.push({fScore.Get(start), count, start});
    openSetMembers.insert(start);

    // 2.搜索循环
    while (!openSet.empty()) {
        // 每轮轮询一次外部退出信号
        if (listener && listener->ShouldAbort()) {
            result.outcome = SearchOutcome::ABORTED;
            result.elapsedMs = elapsedMs();
            LOG_INFO("AStar: aborted after %d expansions", result.expanded);
            return result;
        }

        Point current = openSet.top().pos;
        openSet.pop();
        openSetMembers.erase(current);
        result.expansionOrder.push_back(current);
        ++result.expanded;

        // 终点出队才算成功 (而不是第一次被发现)
        if (current == end) {
            // 3.回溯路径 : end -> ... -> start
            std::vector<Point> path{end};
            Point cur = end;
            auto it = cameFrom.find(cur);
            while (it != cameFrom.end()) {
                cur = it->second;
                path.push_back(cur);
                if (cur != start) {
                    grid.At(cur).SetState(CellState::PATH);
                    if (listener) listener->OnStep();
                }
                it = cameFrom.find(cur);
            }
            grid.At(end).SetState(CellState::END);

            std::reverse(path.begin(), path.end());
            result.path = std::move(path);
            result.outcome = SearchOutcome::FOUND;
            result.elapsedMs = elapsedMs();
            LOG_INFO("AStar: path %s -> %s found, length %d, %d expansions, %.2f ms",
                     start.toString().c_str(), end.toString().c_str(), result.PathLength(),
                     result.expanded, result.elapsedMs);
            return result;
        }

        const int curG = gScore.Get(current);
        for (const Point& next : grid.At(current).Neighbors()) {
            int tentativeG = curG + 1;

            // 已 CLOSED 的格子同样允许被更短的路径松弛
            if (gScore.Has(next) && tentativeG >= gScore.Get(next)) continue;

            cameFrom[next] = current;
            gScore.Set(next, tentativeG);
            fScore.Set(next, tentativeG + CalcH(next, end));

            if (openSetMembers.count(next) == 0) {
                ++count;
                openSet.push({fScore.Get(next), count, next});
                openSetMembers.insert(next);
                map::Cell& cell = grid.At(next);
                if (!cell.IsEnd() && !cell.IsStart()) cell.SetState(CellState::OPEN);
            }
        }

        if (current != start) {
            grid.At(current).SetState(CellState::CLOSED);
        }

        if (listener) listener->OnStep();
    }

    result.outcome = SearchOutcome::NO_PATH;
    result.elapsedMs = elapsedMs();
    LOG_INFO("AStar: no path %s -> %s, %d expansions, %.2f ms",
             start.toString().c_str(), end.toString().c_str(),
             result.expanded, result.elapsedMs);
    return result;
}

}
}
}
