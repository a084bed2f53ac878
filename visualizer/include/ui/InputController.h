#pragma once
#include "map/Grid.h"
#include "ui/Button.h"
#include <optional>

namespace pathviz{
namespace ui{

using model::Point;

// 应用所处阶段
enum class Phase {
    INSTRUCTIONS,   // 说明页, 等待点击 Start
    EDITING,        // 编辑起点 / 终点 / 障碍
    SEARCHING,      // 搜索进行中, 忽略编辑
    FINISHED        // 搜索结束, 显示 Restart / Quit
};

const char* PhaseName(Phase p);

enum class Key {
    SPACE,
    R,
    OTHER
};

// 交给应用层执行的命令
enum class Command {
    NONE,
    RUN_SEARCH,
    QUIT
};

/*
把鼠标 / 键盘事件翻译成网格编辑与命令
保证 : 至多一个 START、一个 END ; 障碍不会覆盖 START / END
*/
class InputController {
public:
    InputController(map::Grid& grid, const ButtonLayout& layout, bool showInstructions = true);

    // 鼠标移动或按下时调用 : 按住左键 / 右键就持续绘制
    Command OnPointer(int x, int y, bool leftHeld, bool rightHeld);
    // 左键按下 : 只用于按钮
    Command OnClick(int x, int y);
    Command OnKey(Key key);

    // ---- 编辑命令 (坐标必须已在网格内)
    bool SetStart(const Point& p);
    bool SetEnd(const Point& p);
    bool AddBarrier(const Point& p);
    void ClearCell(const Point& p);
    // 左键优先级 : 起点 > 终点 > 障碍
    void PaintLeft(const Point& p);

    // ---- 搜索生命周期
    bool CanRun() const { return phase_ == Phase::EDITING && start_ && end_; }
    // 刷新邻居并进入 SEARCHING
    void BeginRun();
    void EndRun(bool pathFound);

    // 丢弃所有格子, 清掉起点 / 终点, 回到 EDITING
    void ResetGrid();

    Phase GetPhase() const { return phase_; }
    bool PathFound() const { return pathFound_; }
    const std::optional<Point>& Start() const { return start_; }
    const std::optional<Point>& End() const { return end_; }

private:
    map::Grid& grid_;
    ButtonLayout layout_;
    Phase phase_;
    bool pathFound_ = false;

    std::optional<Point> start_;
    std::optional<Point> end_;
};

}
}
