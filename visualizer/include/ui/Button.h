#pragma once
#include "Palette.h"
#include <string>

namespace pathviz{
namespace ui{

// 屏幕上的矩形按钮 ; 边界含在内
struct Button {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
    Rgb fill;
    std::string label;

    bool Contains(int px, int py) const {
        return px >= x && px <= x + w && py >= y && py <= y + h;
    }
};

/*
按钮布局 : 以 800 像素窗口为基准
    Start   : 中心 (400, 600), 100 x 60
    Restart : 中心 (300, 600), 120 x 60
    Quit    : 中心 (500, 600), 120 x 60
其它窗口尺寸按 width / 800 等比缩放
*/
struct ButtonLayout {
    Button start;
    Button restart;
    Button quit;

    static ButtonLayout ForWindow(int width) {
        auto scaled = [width](int v) { return v * width / 800; };
        auto centered = [&](int cx, int cy, int w, int h, Rgb fill, const char* label) {
            Button b;
            b.w = scaled(w);
            b.h = scaled(h);
            b.x = scaled(cx) - b.w / 2;
            b.y = scaled(cy) - b.h / 2;
            b.fill = fill;
            b.label = label;
            return b;
        };

        ButtonLayout layout;
        layout.start = centered(400, 600, 100, 60, palette::kGreen, "Start");
        layout.restart = centered(300, 600, 120, 60, palette::kGreen, "Restart");
        layout.quit = centered(500, 600, 120, 60, palette::kRed, "Quit");
        return layout;
    }
};

}
}
