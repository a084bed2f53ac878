#pragma once

#include <thread>
#include <mutex>
#include <condition_variable>
#include <string>
#include <cstdio>
#include <memory>
#include <vector>

/*
异步日志后端:
    前端 (Logger) 格式化好一行日志, 丢进 current_buffer_ 立即返回;
    后端线程在缓冲区过大或超时 (3 秒) 时醒来, swap 出整批数据后再写盘。
*/
class AsyncLogging{
public:
    explicit AsyncLogging(const std::string& basename);
    ~AsyncLogging();

    // 二段式初始化 : 打开文件并启动线程, 文件打不开返回 false
    bool start();
    void stop();

    void Append(std::string log_line);

private:
    void ThreadFunc();

private:
    std::string basename_;
    FILE* fp_;

    bool stop_;
    std::unique_ptr<std::thread> thread_;

    std::mutex mutex_;
    std::condition_variable cond_;

    std::vector<std::string> current_buffer_;
};
