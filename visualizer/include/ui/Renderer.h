#pragma once
#include "map/Grid.h"
#include "ui/Button.h"
#include "ui/Palette.h"
#include <string>

struct SDL_Window;
struct SDL_Renderer;
struct _TTF_Font;   // SDL_ttf 的 TTF_Font

namespace pathviz{
namespace ui{

/*
SDL2 窗口 + 渲染器 + SDL_ttf 字体 ; 析构时释放
绘制调用失败抛 std::runtime_error (渲染失败对进程是致命的)
*/
class Renderer {
public:
    Renderer() = default;
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    // 二段式初始化 : 创建 width x width 的窗口并加载字体
    // 窗口失败返回 false ; 字体打不开只告警, 之后不画文字
    bool Init(const std::string& title, int width, const std::string& fontPath, int fontSize);

    void SetTitle(const std::string& title);
    bool HasFont() const { return font_ != nullptr; }

    // 网格 + 网格线
    void DrawGrid(const map::Grid& grid);
    // 色块 + 居中的 label
    void DrawButton(const Button& b);
    // 说明页 : 标题、说明文字、状态颜色图例、Start 按钮
    void DrawInstructions(const Button& start);
    // 以 (cx, cy) 为中心画一行文字
    void DrawText(const std::string& text, int cx, int cy, const Rgb& color);

    void Clear(const Rgb& c);
    void Present();

private:
    void SetColor(const Rgb& c);
    void FillRect(int x, int y, int w, int h);
    void DrawRect(int x, int y, int w, int h);
    void DrawLine(int x1, int y1, int x2, int y2);

private:
    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    _TTF_Font* font_ = nullptr;
    bool sdlInited_ = false;
    bool ttfInited_ = false;
    int width_ = 0;
};

}
}
