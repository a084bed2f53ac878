#pragma once
#include "algo/planner/AStarSolver.h"
#include "algo/planner/ISearchListener.h"
#include "config/AppConfig.h"
#include "map/Grid.h"
#include "ui/Button.h"
#include "ui/InputController.h"
#include "ui/Renderer.h"

union SDL_Event;

namespace pathviz{

/*
单线程主循环 : 绘制 -> 取事件 -> 交给 InputController
搜索期间自身作为 ISearchListener, 每一步重绘并轮询退出事件
*/
class VisualizerApp : public algo::planner::ISearchListener {
public:
    explicit VisualizerApp(const config::AppConfig& cfg);
    ~VisualizerApp() override = default;

    bool Init();
    // 阻塞直到用户退出
    void Run();

    // ISearchListener
    void OnStep() override;
    bool ShouldAbort() override;

private:
    void DrawFrame();
    void HandleEvent(const SDL_Event& e);
    void Execute(ui::Command cmd);
    void RunSearch();
    void ShowInstructions();

private:
    config::AppConfig cfg_;
    ui::ButtonLayout layout_;
    map::Grid grid_;
    ui::InputController input_;
    ui::Renderer renderer_;
    algo::planner::AStarSolver solver_;

    bool running_ = true;
    bool quitRequested_ = false;
    int runCount_ = 0;
};

}
