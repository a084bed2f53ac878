#pragma once

#include <mutex>
#include <string>
#include <memory>

// 日志级别 : 低于 level_ 的日志被过滤
enum LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    FATAL
};

// "DEBUG" / "INFO" / "WARN" / "ERROR" / "FATAL" -> LogLevel ; 不认识的字符串返回 false, out 不变
bool ParseLogLevel(const std::string& str, LogLevel& out);

class AsyncLogging;

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_; }

    // 打开日志文件 (异步落盘) ; 失败时只输出到控制台
    bool Open(const std::string& filename = "pathviz.log");

    // 停止后台写线程并刷盘 ; 进程退出前调用
    void Close();

    // 核心打印函数 : ... 必须在最后, 前面至少有一个固定参数 format
    void Log(LogLevel level, const char* file, int line, const char* format, ...);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    std::mutex mutex_;
    LogLevel level_;

    std::unique_ptr<AsyncLogging> async_logger_;
};

// ===========================================
// 宏 : 只有在预处理阶段 __FILE__ / __LINE__ 才是调用点的位置
// ##__VA_ARGS__ : 没有可变参数时吞掉前面的逗号
// ===========================================
#define LOG_DEBUG(format, ...) \
    Logger::Instance().Log(DEBUG, __FILE__, __LINE__, format, ##__VA_ARGS__)

#define LOG_INFO(format, ...) \
    Logger::Instance().Log(INFO, __FILE__, __LINE__, format, ##__VA_ARGS__)

#define LOG_WARN(format, ...) \
    Logger::Instance().Log(WARN, __FILE__, __LINE__, format, ##__VA_ARGS__)

#define LOG_ERROR(format, ...) \
    Logger::Instance().Log(ERROR, __FILE__, __LINE__, format, ##__VA_ARGS__)

#define LOG_FATAL(format, ...) \
    Logger::Instance().Log(FATAL, __FILE__, __LINE__, format, ##__VA_ARGS__)
