#pragma once

#include <string>


namespace pathviz{
namespace config{

struct WindowConfig{
    int width = 800;    // 正方形窗口边长 (像素)
    std::string title = "A* Pathfinder Algorithm";
};

struct GridConfig{
    int rows = 50;      // N x N
};

struct RenderConfig{
    int stepDelayMs = 0;            // 每一步搜索后的额外停顿, 0 表示不停顿
    bool showInstructions = true;   // 启动时显示说明页
    std::string fontPath = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
    int fontSize = 0;               // 0 : 按窗口宽度自动选择
};

struct LogConfig{
    std::string file = "";          // 空 : 只输出到控制台
    std::string level = "INFO";
};

struct AppConfig{
    WindowConfig window;
    GridConfig grid;
    RenderConfig render;
    LogConfig log;
};

}
}
