#include "VisualizerApp.h"
#include "ui/TextLayout.h"
#include "utils/Logger.h"
#include <SDL2/SDL.h>
#include <string>

namespace pathviz{

using algo::planner::SearchOutcome;
using algo::planner::SearchOutcomeName;
using algo::planner::SearchResult;

namespace {

ui::Key TranslateKey(SDL_Keycode sym) {
    switch (sym) {
        case SDLK_SPACE: return ui::Key::SPACE;
        case SDLK_r:     return ui::Key::R;
        default:         return ui::Key::OTHER;
    }
}

}

VisualizerApp::VisualizerApp(const config::AppConfig& cfg)
    : cfg_(cfg),
      layout_(ui::ButtonLayout::ForWindow(cfg.window.width)),
      grid_(cfg.grid.rows, cfg.window.width),
      input_(grid_, layout_, cfg.render.showInstructions) {}

bool VisualizerApp::Init() {
    if (!renderer_.Init(cfg_.window.title, cfg_.window.width,
                        cfg_.render.fontPath, cfg_.render.fontSize)) {
        return false;
    }
    LOG_INFO("Grid %dx%d, cell %dpx", grid_.Rows(), grid_.Rows(), grid_.CellSize());
    return true;
}

void VisualizerApp::ShowInstructions() {
    // 没有字体时这里是唯一能看到说明的地方
    LOG_INFO("%s", ui::WelcomeTitle().c_str());
    for (const auto& line : ui::InstructionLines()) {
        if (!line.empty()) LOG_INFO("%s", line.c_str());
    }
    renderer_.SetTitle(cfg_.window.title + " - click Start to begin");
}

void VisualizerApp::Run() {
    if (input_.GetPhase() == ui::Phase::INSTRUCTIONS) {
        ShowInstructions();
    }

    ui::Phase lastPhase = input_.GetPhase();
    while (running_) {
        DrawFrame();

        SDL_Event e;
        // 没有事件时最多等 16ms, 避免空转
        if (SDL_WaitEventTimeout(&e, 16)) {
            HandleEvent(e);
            while (running_ && SDL_PollEvent(&e)) {
                HandleEvent(e);
            }
        }

        if (input_.GetPhase() != lastPhase) {
            LOG_DEBUG("Phase %s -> %s", ui::PhaseName(lastPhase), ui::PhaseName(input_.GetPhase()));
            if (input_.GetPhase() == ui::Phase::EDITING) {
                renderer_.SetTitle(cfg_.window.title);
            }
            lastPhase = input_.GetPhase();
        }
    }
}

void VisualizerApp::DrawFrame() {
    renderer_.Clear(ui::palette::kWhite);

    switch (input_.GetPhase()) {
        case ui::Phase::INSTRUCTIONS:
            renderer_.DrawInstructions(layout_.start);
            break;
        case ui::Phase::FINISHED:
            renderer_.DrawGrid(grid_);
            renderer_.DrawButton(layout_.restart);
            renderer_.DrawButton(layout_.quit);
            break;
        case ui::Phase::EDITING:
        case ui::Phase::SEARCHING:
            renderer_.DrawGrid(grid_);
            break;
    }

    renderer_.Present();
}

void VisualizerApp::HandleEvent(const SDL_Event& e) {
    switch (e.type) {
        case SDL_QUIT:
            Execute(ui::Command::QUIT);
            break;
        case SDL_MOUSEBUTTONDOWN:
        case SDL_MOUSEMOTION: {
            int x = 0, y = 0;
            Uint32 buttons = SDL_GetMouseState(&x, &y);
            bool left = (buttons & SDL_BUTTON(SDL_BUTTON_LEFT)) != 0;
            bool right = (buttons & SDL_BUTTON(SDL_BUTTON_RIGHT)) != 0;
            // 先绘制再处理按钮 : 同一次点击切换阶段后不会落下格子
            Execute(input_.OnPointer(x, y, left, right));
            if (e.type == SDL_MOUSEBUTTONDOWN && e.button.button == SDL_BUTTON_LEFT) {
                Execute(input_.OnClick(e.button.x, e.button.y));
            }
            break;
        }
        case SDL_KEYDOWN:
            Execute(input_.OnKey(TranslateKey(e.key.keysym.sym)));
            break;
        default:
            break;
    }
}

void VisualizerApp::Execute(ui::Command cmd) {
    switch (cmd) {
        case ui::Command::NONE:
            break;
        case ui::Command::RUN_SEARCH:
            RunSearch();
            break;
        case ui::Command::QUIT:
            LOG_INFO("Quit requested");
            running_ = false;
            break;
    }
}

void VisualizerApp::RunSearch() {
    const model::Point start = *input_.Start();
    const model::Point end = *input_.End();

    ++runCount_;
    LOG_INFO("Run #%d: searching %s -> %s, %d barriers", runCount_,
             start.toString().c_str(), end.toString().c_str(),
             grid_.CountState(model::CellState::BARRIER));

    input_.BeginRun();
    renderer_.SetTitle(cfg_.window.title + " - searching...");
    SearchResult result = solver_.Search(grid_, start, end, this);

    if (result.outcome == SearchOutcome::ABORTED) {
        // 退出信号 : 不再做最后一次绘制
        running_ = false;
        return;
    }

    input_.EndRun(result.Found());
    if (result.Found()) {
        renderer_.SetTitle(cfg_.window.title + " - path length " + std::to_string(result.PathLength()));
    } else {
        LOG_WARN("Run #%d: %s, start is cut off from end", runCount_, SearchOutcomeName(result.outcome));
        renderer_.SetTitle(cfg_.window.title + " - no path");
    }
}

void VisualizerApp::OnStep() {
    DrawFrame();
    if (cfg_.render.stepDelayMs > 0) {
        SDL_Delay(static_cast<Uint32>(cfg_.render.stepDelayMs));
    }
}

bool VisualizerApp::ShouldAbort() {
    // 搜索期间只关心退出, 其它事件直接丢弃
    SDL_Event e;
    while (SDL_PollEvent(&e)) {
        if (e.type == SDL_QUIT) {
            quitRequested_ = true;
        }
    }
    return quitRequested_;
}

}
