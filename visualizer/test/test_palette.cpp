// test/test_palette.cpp
#include "ui/Button.h"
#include "ui/Palette.h"
#include "ui/TextLayout.h"
#include <iostream>
#include <string>
#include <vector>

using namespace pathviz::ui;
using pathviz::model::CellState;

static int g_failures = 0;

static void Check(bool cond, const std::string& name) {
    if (cond) {
        std::cout << "[PASS] " << name << std::endl;
    } else {
        std::cerr << "[FAIL] " << name << std::endl;
        ++g_failures;
    }
}

static void TestColors() {
    Check(ColorOf(CellState::EMPTY) == palette::kWhite, "EMPTY is white");
    Check(ColorOf(CellState::START) == palette::kPink, "START is pink");
    Check(ColorOf(CellState::END) == palette::kNavy, "END is navy");
    Check(ColorOf(CellState::BARRIER) == palette::kBlack, "BARRIER is black");
    Check(ColorOf(CellState::OPEN) == palette::kGreen, "OPEN is green");
    Check(ColorOf(CellState::CLOSED) == palette::kRed, "CLOSED is red");
    Check(ColorOf(CellState::PATH) == palette::kPurple, "PATH is purple");

    std::vector<CellState> all{CellState::EMPTY, CellState::START, CellState::END, CellState::BARRIER,
                               CellState::OPEN, CellState::CLOSED, CellState::PATH};
    bool distinct = true;
    for (size_t i = 0; i < all.size(); ++i)
        for (size_t k = i + 1; k < all.size(); ++k)
            if (ColorOf(all[i]) == ColorOf(all[k])) distinct = false;
    Check(distinct, "every state has its own color");
}

static void TestLayout800() {
    ButtonLayout l = ButtonLayout::ForWindow(800);
    Check(l.start.Contains(350, 570) && l.start.Contains(450, 630), "Start covers 350..450 x 570..630");
    Check(!l.start.Contains(349, 600) && !l.start.Contains(400, 631), "Start excludes outside pixels");
    Check(l.restart.Contains(240, 600) && l.restart.Contains(360, 600), "Restart covers 240..360");
    Check(l.quit.Contains(440, 570) && l.quit.Contains(560, 630), "Quit covers 440..560 x 570..630");
    Check(!l.restart.Contains(400, 600) && !l.quit.Contains(400, 600), "gap between Restart and Quit");
}

static void TestLayoutScaled() {
    ButtonLayout l = ButtonLayout::ForWindow(400);
    Check(l.quit.x == 220 && l.quit.w == 60 && l.quit.y == 285 && l.quit.h == 30, "Quit scaled to half size");
    Check(l.start.Contains(200, 300), "scaled Start still centred");
}

static void TestButtonLabels() {
    ButtonLayout l = ButtonLayout::ForWindow(800);
    Check(l.start.label == "Start", "Start button labelled");
    Check(l.restart.label == "Restart", "Restart button labelled");
    Check(l.quit.label == "Quit", "Quit button labelled");
}

static void TestInstructionText() {
    std::vector<TextLine> page = InstructionPageText(800);
    // 标题 + 8 行正文中的 7 行非空
    Check(page.size() == 8, "instruction page has title and 7 text lines");
    Check(page.front().text == WelcomeTitle() && page.front().cy == 100, "title centred at y=100");
    Check(page[1].text == "Instructions:" && page[1].cy == 200, "first line at y=200");
    Check(page[2].cy == 240, "lines spaced 40px apart");
    Check(page.back().text == "Press 'Start' to begin!" && page.back().cy == 480, "blank line keeps its slot");

    bool centred = true;
    for (const auto& line : page) {
        if (line.cx != 400 || line.text.empty()) centred = false;
    }
    Check(centred, "every line is non-empty and horizontally centred");

    ButtonLayout l = ButtonLayout::ForWindow(800);
    Check(page.back().cy < l.start.y, "text ends above the Start button");

    std::vector<TextLine> half = InstructionPageText(400);
    Check(half.front().cy == 50 && half.back().cy == 240 && half.back().cx == 200, "layout scales with window");

    Check(DefaultFontSize(800) == 18 && DefaultFontSize(100) == 8, "default font size scales with a floor");
}

int main() {
    TestColors();
    TestLayout800();
    TestLayoutScaled();
    TestButtonLabels();
    TestInstructionText();

    std::cout << (g_failures == 0 ? "ALL PASSED" : "FAILURES: " + std::to_string(g_failures)) << std::endl;
    return g_failures == 0 ? 0 : 1;
}
