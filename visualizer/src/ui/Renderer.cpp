#include "ui/Renderer.h"
#include "ui/TextLayout.h"
#include "utils/Logger.h"
#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>
#include <stdexcept>

namespace pathviz{
namespace ui{

using model::CellState;

Renderer::~Renderer() {
    if (font_) TTF_CloseFont(font_);
    if (ttfInited_) TTF_Quit();
    if (renderer_) SDL_DestroyRenderer(renderer_);
    if (window_) SDL_DestroyWindow(window_);
    if (sdlInited_) SDL_Quit();
}

bool Renderer::Init(const std::string& title, int width, const std::string& fontPath, int fontSize) {
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        LOG_ERROR("SDL_Init error: %s", SDL_GetError());
        return false;
    }
    sdlInited_ = true;

    window_ = SDL_CreateWindow(title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                               width, width, SDL_WINDOW_SHOWN);
    if (!window_) {
        LOG_ERROR("SDL_CreateWindow error: %s", SDL_GetError());
        return false;
    }

    renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer_) {
        // 没有硬件加速时退回软件渲染
        LOG_WARN("Accelerated renderer unavailable (%s), falling back to software", SDL_GetError());
        renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_SOFTWARE);
    }
    if (!renderer_) {
        LOG_ERROR("SDL_CreateRenderer error: %s", SDL_GetError());
        return false;
    }
    width_ = width;

    if (TTF_Init() != 0) {
        LOG_WARN("TTF_Init error: %s. Text will not be drawn.", TTF_GetError());
    } else {
        ttfInited_ = true;
        int size = fontSize > 0 ? fontSize : DefaultFontSize(width);
        font_ = TTF_OpenFont(fontPath.c_str(), size);
        if (!font_) {
            LOG_WARN("Failed to open font %s: %s. Set render.font_path to a .ttf file.",
                     fontPath.c_str(), TTF_GetError());
        } else {
            LOG_INFO("Font loaded: %s (%dpt)", fontPath.c_str(), size);
        }
    }

    LOG_INFO("Window created: %dx%d \"%s\"", width, width, title.c_str());
    return true;
}

void Renderer::SetTitle(const std::string& title) {
    SDL_SetWindowTitle(window_, title.c_str());
}

void Renderer::SetColor(const Rgb& c) {
    if (SDL_SetRenderDrawColor(renderer_, c.r, c.g, c.b, 255) != 0) {
        throw std::runtime_error(std::string("SDL_SetRenderDrawColor: ") + SDL_GetError());
    }
}

void Renderer::FillRect(int x, int y, int w, int h) {
    SDL_Rect r{x, y, w, h};
    if (SDL_RenderFillRect(renderer_, &r) != 0) {
        throw std::runtime_error(std::string("SDL_RenderFillRect: ") + SDL_GetError());
    }
}

void Renderer::DrawRect(int x, int y, int w, int h) {
    SDL_Rect r{x, y, w, h};
    if (SDL_RenderDrawRect(renderer_, &r) != 0) {
        throw std::runtime_error(std::string("SDL_RenderDrawRect: ") + SDL_GetError());
    }
}

void Renderer::DrawLine(int x1, int y1, int x2, int y2) {
    if (SDL_RenderDrawLine(renderer_, x1, y1, x2, y2) != 0) {
        throw std::runtime_error(std::string("SDL_RenderDrawLine: ") + SDL_GetError());
    }
}

void Renderer::Clear(const Rgb& c) {
    SetColor(c);
    if (SDL_RenderClear(renderer_) != 0) {
        throw std::runtime_error(std::string("SDL_RenderClear: ") + SDL_GetError());
    }
}

void Renderer::Present() {
    SDL_RenderPresent(renderer_);
}

void Renderer::DrawText(const std::string& text, int cx, int cy, const Rgb& color) {
    // TTF 不接受空串
    if (!font_ || text.empty()) return;

    SDL_Color fg{color.r, color.g, color.b, 255};
    SDL_Surface* surface = TTF_RenderUTF8_Blended(font_, text.c_str(), fg);
    if (!surface) {
        throw std::runtime_error(std::string("TTF_RenderUTF8_Blended: ") + TTF_GetError());
    }

    SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer_, surface);
    SDL_Rect dst{cx - surface->w / 2, cy - surface->h / 2, surface->w, surface->h};
    SDL_FreeSurface(surface);
    if (!texture) {
        throw std::runtime_error(std::string("SDL_CreateTextureFromSurface: ") + SDL_GetError());
    }

    int rc = SDL_RenderCopy(renderer_, texture, nullptr, &dst);
    SDL_DestroyTexture(texture);
    if (rc != 0) {
        throw std::runtime_error(std::string("SDL_RenderCopy: ") + SDL_GetError());
    }
}

void Renderer::DrawGrid(const map::Grid& grid) {
    const int gap = grid.CellSize();
    const int rows = grid.Rows();

    // 1.格子 : row 沿 x, col 沿 y ; 白色格子就是背景, 不用再画
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < rows; ++c) {
            CellState s = grid.At(r, c).State();
            if (s == CellState::EMPTY) continue;
            SetColor(ColorOf(s));
            FillRect(r * gap, c * gap, gap, gap);
        }
    }

    // 2.网格线
    SetColor(palette::kGrey);
    const int w = grid.WidthPx();
    for (int i = 0; i < rows; ++i) {
        DrawLine(0, i * gap, w, i * gap);
        DrawLine(i * gap, 0, i * gap, w);
    }
}

void Renderer::DrawButton(const Button& b) {
    SetColor(b.fill);
    FillRect(b.x, b.y, b.w, b.h);
    SetColor(palette::kBlack);
    DrawRect(b.x, b.y, b.w, b.h);
    DrawText(b.label, b.x + b.w / 2, b.y + b.h / 2, palette::kBlack);
}

void Renderer::DrawInstructions(const Button& start) {
    // 1.标题与说明文字
    for (const auto& line : InstructionPageText(width_)) {
        DrawText(line.text, line.cx, line.cy, palette::kBlack);
    }

    // 2.图例 : 起点 终点 障碍 open closed path, 一排小色块, 位于正文和按钮之间
    static const CellState legend[] = {
        CellState::START, CellState::END, CellState::BARRIER,
        CellState::OPEN, CellState::CLOSED, CellState::PATH
    };
    const int n = static_cast<int>(sizeof(legend) / sizeof(legend[0]));
    const int size = width_ / 32;
    const int spacing = size / 2;
    const int total = n * size + (n - 1) * spacing;
    int x = (width_ - total) / 2;
    const int y = 515 * width_ / 800;

    for (CellState s : legend) {
        SetColor(ColorOf(s));
        FillRect(x, y, size, size);
        SetColor(palette::kGrey);
        DrawRect(x, y, size, size);
        x += size + spacing;
    }

    // 3.Start 按钮
    DrawButton(start);
}

}
}
