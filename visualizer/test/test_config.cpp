// test/test_config.cpp
#include "config/ConfigLoader.h"
#include "utils/Logger.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace pathviz::config;

static int g_failures = 0;

static void Check(bool cond, const std::string& name) {
    if (cond) {
        std::cout << "[PASS] " << name << std::endl;
    } else {
        std::cerr << "[FAIL] " << name << std::endl;
        ++g_failures;
    }
}

static std::string WriteTemp(const std::string& name, const std::string& content) {
    std::filesystem::path p = std::filesystem::temp_directory_path() / name;
    std::ofstream ofs(p);
    ofs << content;
    return p.string();
}

static void TestFullFile() {
    std::string path = WriteTemp("pathviz_cfg_full.json", R"({
        "window": {"width": 600, "title": "demo"},
        "grid": {"rows": 30},
        "render": {"step_delay_ms": 5, "show_instructions": false, "font_path": "/tmp/f.ttf", "font_size": 22},
        "log": {"file": "x.log", "level": "DEBUG"}
    })");

    AppConfig cfg;
    Check(ConfigLoader::Load(path, cfg), "full config loads");
    Check(cfg.window.width == 600 && cfg.window.title == "demo", "window section read");
    Check(cfg.grid.rows == 30, "grid section read");
    Check(cfg.render.stepDelayMs == 5 && !cfg.render.showInstructions, "render section read");
    Check(cfg.render.fontPath == "/tmp/f.ttf" && cfg.render.fontSize == 22, "font settings read");
    Check(cfg.log.file == "x.log" && cfg.log.level == "DEBUG", "log section read");
    std::filesystem::remove(path);
}

static void TestPartialAndDefaults() {
    std::string path = WriteTemp("pathviz_cfg_partial.json", R"({"grid": {"rows": 25}})");
    AppConfig cfg;
    Check(ConfigLoader::Load(path, cfg), "partial config loads");
    Check(cfg.grid.rows == 25, "given key applied");
    Check(cfg.window.width == 800 && cfg.render.stepDelayMs == 0 && cfg.log.level == "INFO",
          "missing keys keep defaults");
    std::filesystem::remove(path);
}

static void TestFailures() {
    AppConfig cfg;
    cfg.grid.rows = 42;
    Check(!ConfigLoader::Load("/nonexistent/pathviz.json", cfg), "missing file returns false");
    Check(cfg.grid.rows == 42, "missing file leaves config untouched");

    std::string path = WriteTemp("pathviz_cfg_bad.json", "{ \"grid\": { \"rows\": ");
    Check(!ConfigLoader::Load(path, cfg), "malformed json returns false");
    std::filesystem::remove(path);

    std::string typed = WriteTemp("pathviz_cfg_type.json", R"({"grid": {"rows": "many"}})");
    Check(!ConfigLoader::Load(typed, cfg), "wrong value type returns false");
    Check(cfg.grid.rows == 42, "type error leaves config untouched");
    std::filesystem::remove(typed);
}

static void TestValidation() {
    AppConfig cfg;
    nlohmann::json j = {
        {"grid", {{"rows", 1}}},
        {"render", {{"step_delay_ms", -3}, {"font_size", -1}}},
        {"log", {{"level", "LOUD"}}}
    };
    Check(ConfigLoader::FromJson(j, cfg), "invalid values still load");
    Check(cfg.grid.rows == 50, "rows < 2 replaced by default");
    Check(cfg.render.stepDelayMs == 0, "negative delay replaced by 0");
    Check(cfg.render.fontSize == 0, "negative font size replaced by automatic");
    Check(cfg.log.level == "INFO", "unknown log level replaced by INFO");

    AppConfig narrow;
    nlohmann::json k = {{"window", {{"width", 20}}}, {"grid", {{"rows", 40}}}};
    ConfigLoader::FromJson(k, narrow);
    Check(narrow.window.width == 800 && narrow.grid.rows == 40, "window narrower than rows replaced");
}

static void TestLogLevelParsing() {
    LogLevel lv = INFO;
    Check(ParseLogLevel("DEBUG", lv) && lv == DEBUG, "DEBUG parsed");
    Check(ParseLogLevel("FATAL", lv) && lv == FATAL, "FATAL parsed");
    Check(!ParseLogLevel("debug", lv) && lv == FATAL, "lowercase rejected, value untouched");
}

int main() {
    Logger::Instance().SetLevel(FATAL);

    TestFullFile();
    TestPartialAndDefaults();
    TestFailures();
    TestValidation();
    TestLogLevelParsing();

    std::cout << (g_failures == 0 ? "ALL PASSED" : "FAILURES: " + std::to_string(g_failures)) << std::endl;
    return g_failures == 0 ? 0 : 1;
}
