#include "ui/InputController.h"
#include "utils/Logger.h"

namespace pathviz{
namespace ui{

using model::CellState;

const char* PhaseName(Phase p) {
    switch (p) {
        case Phase::INSTRUCTIONS: return "INSTRUCTIONS";
        case Phase::EDITING:      return "EDITING";
        case Phase::SEARCHING:    return "SEARCHING";
        case Phase::FINISHED:     return "FINISHED";
    }
    return "UNKNOWN";
}

InputController::InputController(map::Grid& grid, const ButtonLayout& layout, bool showInstructions)
    : grid_(grid),
      layout_(layout),
      phase_(showInstructions ? Phase::INSTRUCTIONS : Phase::EDITING) {}

Command InputController::OnPointer(int x, int y, bool leftHeld, bool rightHeld) {
    if (phase_ != Phase::EDITING) return Command::NONE;

    // 像素 -> 格子 (已夹到网格内)
    Point p = grid_.CellAtPixel(x, y);
    if (leftHeld) {
        PaintLeft(p);
    } else if (rightHeld) {
        ClearCell(p);
    }
    return Command::NONE;
}

Command InputController::OnClick(int x, int y) {
    switch (phase_) {
        case Phase::INSTRUCTIONS:
            if (layout_.start.Contains(x, y)) {
                phase_ = Phase::EDITING;
                LOG_INFO("Start clicked, entering editor");
            }
            break;
        case Phase::FINISHED:
            if (layout_.restart.Contains(x, y)) {
                LOG_INFO("Restart clicked");
                ResetGrid();
            } else if (layout_.quit.Contains(x, y)) {
                LOG_INFO("Quit clicked");
                return Command::QUIT;
            }
            break;
        case Phase::EDITING:
        case Phase::SEARCHING:
            break;
    }
    return Command::NONE;
}

Command InputController::OnKey(Key key) {
    switch (key) {
        case Key::SPACE:
            // 缺起点或终点 : 什么都不做
            if (CanRun()) return Command::RUN_SEARCH;
            break;
        case Key::R:
            if (phase_ == Phase::EDITING || phase_ == Phase::FINISHED) {
                LOG_INFO("Reset key pressed");
                ResetGrid();
            }
            break;
        case Key::OTHER:
            break;
    }
    return Command::NONE;
}

bool InputController::SetStart(const Point& p) {
    if (start_ || (end_ && *end_ == p)) return false;
    grid_.At(p).SetState(CellState::START);
    start_ = p;
    LOG_DEBUG("Start set at %s", p.toString().c_str());
    return true;
}

bool InputController::SetEnd(const Point& p) {
    if (end_ || (start_ && *start_ == p)) return false;
    grid_.At(p).SetState(CellState::END);
    end_ = p;
    LOG_DEBUG("End set at %s", p.toString().c_str());
    return true;
}

bool InputController::AddBarrier(const Point& p) {
    map::Cell& cell = grid_.At(p);
    // 起点 / 终点必须先清除
    if (cell.IsStart() || cell.IsEnd()) return false;
    if (!cell.IsBarrier()) {
        cell.SetState(CellState::BARRIER);
        LOG_DEBUG("Barrier added at %s", p.toString().c_str());
    }
    return true;
}

void InputController::ClearCell(const Point& p) {
    map::Cell& cell = grid_.At(p);
    if (cell.IsEmpty()) return;
    CellState was = cell.State();
    cell.SetState(CellState::EMPTY);
    if (start_ && *start_ == p) {
        start_.reset();
    } else if (end_ && *end_ == p) {
        end_.reset();
    }
    LOG_DEBUG("Cell %s cleared (was %s)", p.toString().c_str(), model::CellStateName(was));
}

void InputController::PaintLeft(const Point& p) {
    if (SetStart(p)) return;
    if (SetEnd(p)) return;
    AddBarrier(p);
}

void InputController::BeginRun() {
    grid_.RecomputeNeighbors();
    phase_ = Phase::SEARCHING;
    pathFound_ = false;
}

void InputController::EndRun(bool pathFound) {
    phase_ = Phase::FINISHED;
    pathFound_ = pathFound;
}

void InputController::ResetGrid() {
    grid_.Reset();
    start_.reset();
    end_.reset();
    pathFound_ = false;
    phase_ = Phase::EDITING;
    LOG_INFO("Grid reset (%dx%d)", grid_.Rows(), grid_.Rows());
}

}
}
