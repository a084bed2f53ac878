#include <utils/Logger.h>
#include <cstdarg>
#include <cstdio>
#include <utils/AsyncLogging.h>
#include <utils/Timestamp.h>
// ==========================================
// ANSI 颜色代码 (终端专用)
// \033[<前景色>m<文字>\033[0m
// ==========================================
#define ANSI_COLOR_RED      "\x1b[31m"
#define ANSI_COLOR_GREEN    "\x1b[32m"
#define ANSI_COLOR_YELLOW   "\x1b[33m"
#define ANSI_COLOR_MAGENTA  "\x1b[35m"
#define ANSI_COLOR_CYAN     "\x1b[36m"
#define ANSI_COLOR_RESET    "\x1b[0m"

bool ParseLogLevel(const std::string& str, LogLevel& out) {
    if (str == "DEBUG") out = DEBUG;
    else if (str == "INFO") out = INFO;
    else if (str == "WARN") out = WARN;
    else if (str == "ERROR") out = ERROR;
    else if (str == "FATAL") out = FATAL;
    else return false;
    return true;
}

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

// 二段式初始化 : 构造只赋初值, 可能失败的 IO 放到 Open()
Logger::Logger() : level_(INFO), async_logger_(nullptr) {}

Logger::~Logger() {
    Close();
}

bool Logger::Open (const std::string& filename) {
    // 1. 先在旁边创建新的后端, 旧的还在工作
    auto new_logger = std::make_unique<AsyncLogging>(filename);

    // 2. 启动失败 : new_logger 自动析构, 保留旧的
    if(!new_logger->start())
        return false;

    // 3. 成功后替换 ; 旧后端在锁外析构 (join 可能耗时)
    std::unique_ptr<AsyncLogging> old;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old = std::move(async_logger_);
        async_logger_ = std::move(new_logger);
    }

    return true;
}

void Logger::Close() {
    std::unique_ptr<AsyncLogging> old;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old = std::move(async_logger_);
    }
    if(old) old->stop();
}

void Logger::SetLevel(LogLevel level) {
    level_ = level;
}

void Logger::Log(LogLevel level, const char* file, int line, const char* format, ...) {
    // 级别过滤
    if (level < level_) return;

    // 1.时间字符串 : 秒级
    std::string time_str = pathviz::utils::Timestamp::now().toFormattedString(false);

    // 2.级别名称与颜色
    const char* level_str = "";
    const char* color_code = "";

    switch(level){
        case DEBUG:
            level_str = "[DEBUG]";
            color_code = ANSI_COLOR_CYAN;
            break;
        case INFO:
            level_str = "[INFO ]";
            color_code = ANSI_COLOR_GREEN;
            break;
        case WARN:
            level_str = "[WARN ]";
            color_code = ANSI_COLOR_YELLOW;
            break;
        case ERROR:
            level_str = "[ERROR]";
            color_code = ANSI_COLOR_RED;
            break;
        case FATAL:
            level_str = "[FATAL]";
            color_code = ANSI_COLOR_MAGENTA;
            break;
    }

    // 3.格式化日志内容 : va_start 与 va_end 必须配对
    char msg_buf[4096];
    va_list args;
    va_start(args, format);
    vsnprintf(msg_buf, sizeof(msg_buf), format, args);
    va_end(args);

    // 4.组装整行 ; 截断时 len 可能超过缓冲区
    char total_buf[4096 + 128];
    int len = snprintf(total_buf, sizeof(total_buf), "%s %s [%s:%d] %s\n", time_str.c_str(),level_str, file, line, msg_buf);
    if (len < 0) return;
    if (len >= static_cast<int>(sizeof(total_buf))) len = sizeof(total_buf) - 1;

    std::lock_guard<std::mutex> lock(mutex_);

    // 5.推送到异步队列
    if(async_logger_) {
        async_logger_->Append(std::string(total_buf, len));
    }

    // 6.控制台输出 (带颜色)
    fprintf(stdout, "%s %s%s%s [%s:%d] %s\n",time_str.c_str(), color_code,level_str,ANSI_COLOR_RESET, file, line, msg_buf);
}
