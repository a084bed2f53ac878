#include "VisualizerApp.h"
#include "config/AppConfig.h"
#include "config/ConfigLoader.h"
#include "utils/Logger.h"
#include <cstdio>
#include <exception>
#include <string>


int main(int argc, char* argv[]) {

    // ========== 命令行参数 ==========
    // 用法: ./pathviz [config_path] [log_level]
    // 示例: ./pathviz ./config.json DEBUG
    std::string configPath = "./config.json";
    if (argc > 1) {
        configPath = argv[1];
    }

    // ========== 配置文件 ==========
    pathviz::config::AppConfig cfg;
    if (!pathviz::config::ConfigLoader::Load(configPath, cfg)) {
        LOG_WARN("Failed to load config from '%s'. Using default settings.", configPath.c_str());
    }

    // 命令行的级别优先于配置文件
    std::string levelStr = argc > 2 ? argv[2] : cfg.log.level;
    LogLevel logLevel = INFO;
    if (!ParseLogLevel(levelStr, logLevel)) {
        fprintf(stderr, "Invalid log level: %s. Using INFO.\n", levelStr.c_str());
        fprintf(stderr, "Valid levels: DEBUG, INFO, WARN, ERROR, FATAL\n");
        levelStr = "INFO";
    }
    Logger::Instance().SetLevel(logLevel);

    // ========== 文件日志 (异步, 不阻塞主线程) ==========
    if (!cfg.log.file.empty()) {
        if (!Logger::Instance().Open(cfg.log.file)) {
            fprintf(stderr, "Failed to open log file %s. Logging to console only.\n", cfg.log.file.c_str());
        } else {
            LOG_INFO("Log file opened: %s", cfg.log.file.c_str());
        }
    }

    LOG_INFO("========== pathviz starting ==========");
    LOG_INFO("Log Level: %s", levelStr.c_str());

    int rc = 0;
    try {
        pathviz::VisualizerApp app(cfg);
        if (!app.Init()) {
            LOG_FATAL("Window initialisation failed");
            rc = 1;
        } else {
            app.Run();
        }
    } catch (const std::exception& e) {
        LOG_FATAL("Crashed with exception: %s", e.what());
        rc = 1;
    }

    LOG_INFO("========== pathviz shutdown ==========");
    Logger::Instance().Close();
    return rc;
}
