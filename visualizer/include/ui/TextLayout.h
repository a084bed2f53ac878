#pragma once
#include <string>
#include <vector>

namespace pathviz{
namespace ui{

// 一行居中文字 : (cx, cy) 是文字中心
struct TextLine {
    std::string text;
    int cx = 0;
    int cy = 0;
};

inline const std::string& WelcomeTitle() {
    static const std::string title = "Welcome to A* Pathfinder Algorithm";
    return title;
}

// 说明页正文, 空行保留占位
inline const std::vector<std::string>& InstructionLines() {
    static const std::vector<std::string> lines = {
        "Instructions:",
        "1. Left-click to add the start node (PINK).",
        "2. Left-click again to add the end node (BLUE).",
        "3. After adding start and end nodes, left-click to add barriers (Black).",
        "4. Right-click to remove a node.",
        "5. Press 'Space' to start the algorithm, 'R' to reset the grid.",
        "",
        "Press 'Start' to begin!",
    };
    return lines;
}

/*
说明页排版 : 以 800 像素窗口为基准
    标题中心 y = 100
    正文从 y = 200 开始, 行距 40
其它尺寸按 width / 800 缩放 ; 空行不输出
*/
inline std::vector<TextLine> InstructionPageText(int width) {
    auto scaled = [width](int v) { return v * width / 800; };

    std::vector<TextLine> out;
    out.push_back({WelcomeTitle(), width / 2, scaled(100)});

    int y = 200;
    for (const auto& line : InstructionLines()) {
        if (!line.empty()) {
            out.push_back({line, width / 2, scaled(y)});
        }
        y += 40;
    }
    return out;
}

// 默认字号 : 800 像素窗口用 18
inline int DefaultFontSize(int width) {
    int size = 18 * width / 800;
    return size < 8 ? 8 : size;
}

}
}
