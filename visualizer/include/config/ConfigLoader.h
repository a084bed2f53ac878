#pragma once

#include "AppConfig.h"
#include "utils/Logger.h"
#include <nlohmann/json.hpp>
#include <exception>
#include <fstream>
#include <string>


namespace pathviz {
namespace config {

using json = nlohmann::json;

class ConfigLoader{
public:
    // 所有键都是可选的 : value(key, 默认值)
    // 文件不存在或解析失败返回 false, toConfig 保持默认值
    static bool Load(const std::string& filePath, AppConfig& toConfig) {
        std::ifstream ifs(filePath);
        if(!ifs.is_open()){
            LOG_WARN("Config file not found: %s", filePath.c_str());
            return false;
        }

        try{
            json j;
            ifs >> j;
            return FromJson(j, toConfig);
        } catch (const std::exception& e){
            // parse_error / type_error 都是 std::exception 的子类, 常引用捕获保留 what()
            LOG_ERROR("JSON Parse Error in %s: %s", filePath.c_str(), e.what());
            return false;
        }
    }

    // 从已解析的 json 读取 ; 类型不匹配时抛 nlohmann::json::type_error
    static bool FromJson(const json& j, AppConfig& toConfig) {
        AppConfig cfg = toConfig;

        if(j.contains("window")) {
            auto& w = j["window"];
            cfg.window.width = w.value("width", cfg.window.width);
            cfg.window.title = w.value("title", cfg.window.title);
        }

        if(j.contains("grid")) {
            cfg.grid.rows = j["grid"].value("rows", cfg.grid.rows);
        }

        if(j.contains("render")) {
            auto& r = j["render"];
            cfg.render.stepDelayMs = r.value("step_delay_ms", cfg.render.stepDelayMs);
            cfg.render.showInstructions = r.value("show_instructions", cfg.render.showInstructions);
            cfg.render.fontPath = r.value("font_path", cfg.render.fontPath);
            cfg.render.fontSize = r.value("font_size", cfg.render.fontSize);
        }

        if(j.contains("log")) {
            auto& l = j["log"];
            cfg.log.file = l.value("file", cfg.log.file);
            cfg.log.level = l.value("level", cfg.log.level);
        }

        Validate(cfg);
        toConfig = cfg;
        return true;
    }

    // 非法值换回默认值
    static void Validate(AppConfig& cfg) {
        const AppConfig def;

        if (cfg.grid.rows < 2) {
            LOG_WARN("Config: grid.rows=%d invalid, using %d", cfg.grid.rows, def.grid.rows);
            cfg.grid.rows = def.grid.rows;
        }
        if (cfg.window.width < cfg.grid.rows) {
            LOG_WARN("Config: window.width=%d smaller than rows=%d, using %d",
                     cfg.window.width, cfg.grid.rows, def.window.width);
            cfg.window.width = def.window.width;
            if (cfg.window.width < cfg.grid.rows) cfg.grid.rows = def.grid.rows;
        }
        if (cfg.render.stepDelayMs < 0) {
            LOG_WARN("Config: render.step_delay_ms=%d invalid, using 0", cfg.render.stepDelayMs);
            cfg.render.stepDelayMs = 0;
        }
        if (cfg.render.fontSize < 0) {
            LOG_WARN("Config: render.font_size=%d invalid, using automatic size", cfg.render.fontSize);
            cfg.render.fontSize = 0;
        }
        LogLevel lv;
        if (!ParseLogLevel(cfg.log.level, lv)) {
            LOG_WARN("Config: log.level=%s invalid, using %s", cfg.log.level.c_str(), def.log.level.c_str());
            cfg.log.level = def.log.level;
        }
    }
};

}
}
