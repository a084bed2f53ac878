// test/test_input.cpp
#include "ui/InputController.h"
#include "utils/Logger.h"
#include <iostream>
#include <string>

using namespace pathviz;
using namespace pathviz::ui;
using model::CellState;
using model::Point;

static int g_failures = 0;

static void Check(bool cond, const std::string& name) {
    if (cond) {
        std::cout << "[PASS] " << name << std::endl;
    } else {
        std::cerr << "[FAIL] " << name << std::endl;
        ++g_failures;
    }
}

// 800px 窗口, 50 x 50, 每格 16px : 格子 (r,c) 的中心像素是 (r*16+8, c*16+8)
static int Px(int cell) { return cell * 16 + 8; }

static void LeftClick(InputController& in, int r, int c) {
    in.OnPointer(Px(r), Px(c), true, false);
}

static void RightClick(InputController& in, int r, int c) {
    in.OnPointer(Px(r), Px(c), false, true);
}

static void TestInstructionsPage() {
    map::Grid grid(50, 800);
    InputController in(grid, ButtonLayout::ForWindow(800));

    Check(in.GetPhase() == Phase::INSTRUCTIONS, "starts on the instructions page");
    LeftClick(in, 3, 3);
    Check(grid.At(3, 3).IsEmpty(), "instructions page ignores painting");
    in.OnClick(100, 100);
    Check(in.GetPhase() == Phase::INSTRUCTIONS, "click outside Start keeps instructions");
    in.OnClick(400, 600);
    Check(in.GetPhase() == Phase::EDITING, "Start button enters editor");
}

static void TestPaintPriority() {
    map::Grid grid(50, 800);
    InputController in(grid, ButtonLayout::ForWindow(800), false);

    LeftClick(in, 1, 1);
    LeftClick(in, 10, 10);
    LeftClick(in, 5, 5);
    Check(grid.At(1, 1).IsStart() && in.Start() && *in.Start() == Point{1, 1}, "first left click sets start");
    Check(grid.At(10, 10).IsEnd() && in.End() && *in.End() == Point{10, 10}, "second left click sets end");
    Check(grid.At(5, 5).IsBarrier(), "third left click adds a barrier");

    LeftClick(in, 1, 1);
    LeftClick(in, 10, 10);
    Check(grid.At(1, 1).IsStart() && grid.At(10, 10).IsEnd(), "barrier never overwrites start or end");
    Check(!in.AddBarrier({10, 10}), "AddBarrier refuses the end cell");

    Check(grid.CountState(CellState::START) == 1 && grid.CountState(CellState::END) == 1,
          "exactly one start and one end");
}

static void TestClearing() {
    map::Grid grid(50, 800);
    InputController in(grid, ButtonLayout::ForWindow(800), false);
    LeftClick(in, 1, 1);
    LeftClick(in, 2, 2);
    LeftClick(in, 3, 3);

    RightClick(in, 1, 1);
    Check(grid.At(1, 1).IsEmpty() && !in.Start(), "right click clears start role");
    Check(in.End().has_value(), "end role survives");

    // 起点空缺时左键重新设置起点, 哪怕点在障碍上
    LeftClick(in, 3, 3);
    Check(grid.At(3, 3).IsStart() && *in.Start() == Point{3, 3}, "next left click refills start");

    RightClick(in, 2, 2);
    Check(!in.End() && grid.At(2, 2).IsEmpty(), "right click clears end role");
    LeftClick(in, 3, 3);
    Check(!in.End(), "end cannot be placed on the start cell");
}

static void TestRunLifecycle() {
    map::Grid grid(50, 800);
    InputController in(grid, ButtonLayout::ForWindow(800), false);

    LeftClick(in, 0, 0);
    Check(in.OnKey(Key::SPACE) == Command::NONE, "space without end is a no-op");
    LeftClick(in, 0, 2);
    LeftClick(in, 0, 1);
    Check(in.OnKey(Key::SPACE) == Command::RUN_SEARCH, "space with start and end runs");

    in.BeginRun();
    Check(in.GetPhase() == Phase::SEARCHING, "BeginRun enters SEARCHING");
    std::vector<Point> expected{{1, 0}};
    Check(grid.At(0, 0).Neighbors() == expected, "BeginRun recomputes neighbors against barriers");

    LeftClick(in, 20, 20);
    Check(grid.At(20, 20).IsEmpty(), "edits ignored while searching");
    Check(in.OnKey(Key::SPACE) == Command::NONE, "space ignored while searching");

    in.EndRun(false);
    Check(in.GetPhase() == Phase::FINISHED && !in.PathFound(), "EndRun enters FINISHED");
    LeftClick(in, 20, 20);
    Check(grid.At(20, 20).IsEmpty(), "edits ignored after a run");
    Check(in.OnKey(Key::SPACE) == Command::NONE, "space ignored after a run");

    Check(in.OnClick(500, 600) == Command::QUIT, "Quit button returns QUIT");

    in.OnClick(300, 600);
    Check(in.GetPhase() == Phase::EDITING, "Restart button returns to editor");
    Check(!in.Start() && !in.End() && grid.CountState(CellState::EMPTY) == 2500, "Restart clears the grid");
}

static void TestResetKey() {
    map::Grid grid(50, 800);
    InputController in(grid, ButtonLayout::ForWindow(800), false);
    LeftClick(in, 4, 4);
    LeftClick(in, 6, 6);
    LeftClick(in, 5, 5);

    in.OnKey(Key::R);
    Check(!in.Start() && !in.End(), "R clears start and end");
    Check(grid.CountState(CellState::EMPTY) == 2500, "R clears every cell");

    LeftClick(in, 4, 4);
    LeftClick(in, 6, 6);
    in.BeginRun();
    in.EndRun(true);
    Check(in.PathFound(), "successful run remembered");
    in.OnKey(Key::R);
    Check(in.GetPhase() == Phase::EDITING && !in.PathFound(), "R also resets after a run");
}

int main() {
    Logger::Instance().SetLevel(WARN);

    TestInstructionsPage();
    TestPaintPriority();
    TestClearing();
    TestRunLifecycle();
    TestResetKey();

    std::cout << (g_failures == 0 ? "ALL PASSED" : "FAILURES: " + std::to_string(g_failures)) << std::endl;
    return g_failures == 0 ? 0 : 1;
}
