#include <utils/AsyncLogging.h>
#include <chrono>

AsyncLogging::AsyncLogging(const std::string& basename)
    : basename_(basename),
      fp_(nullptr),
      stop_(true),
      thread_(nullptr) {}

AsyncLogging::~AsyncLogging() {
    stop();
}

bool AsyncLogging::start() {
    if (stop_ == false) return true;  // 重复启动

    // 1.尝试打开文件 : a 模式, 不存在则创建
    fp_ = fopen(basename_.c_str(), "a");
    if(!fp_) {
        fprintf(stderr, "AsyncLogging: Failed to open log file %s\n", basename_.c_str());
        return false;
    }

    // 2.文件打开成功才启动后台线程
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = false;
    }
    thread_ = std::make_unique<std::thread> (&AsyncLogging::ThreadFunc, this);

    return true;
}

void AsyncLogging::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if(stop_) return; // 重复停止
        stop_ = true;
    }
    // 线程可能阻塞在 wait_for 上, 叫醒它
    cond_.notify_one();
    if(thread_ && thread_->joinable())
        thread_->join();

    if(fp_) {
        fclose(fp_);
        fp_ = nullptr;
    }
}

// 形参按值接收, 调用方传临时 string 时整条路径只有移动
void AsyncLogging::Append(std::string log_line){
    std::lock_guard<std::mutex> lock(mutex_);

    current_buffer_.push_back(std::move(log_line));

    if(current_buffer_.size() > 1000)
        cond_.notify_one();
}

/*
write_buffer 定义在循环外 : swap 来回传递已扩容的 vector, 前端写入时不再触发扩容
*/
void AsyncLogging::ThreadFunc() {
    std::vector<std::string> write_buffer;

    while(true){
        {
            std::unique_lock<std::mutex> lock(mutex_);

            // 1.阻塞等待 : 超时(3秒) 或被 notify (缓冲区满 / stop)
            if(current_buffer_.empty() && !stop_) {
                cond_.wait_for(lock, std::chrono::seconds(3));
            }

            // 2.退出检查 : stop 之后也要把剩余数据写完
            if(current_buffer_.empty() && stop_) break;

            // 3.交换缓冲区
            write_buffer.swap(current_buffer_);
        }

        // 4.磁盘 IO
        for(const auto& str : write_buffer)
            fwrite(str.c_str(), 1, str.size(), fp_);

        // 5.刷盘 : fwrite 只写到了 C 库缓冲区
        fflush(fp_);

        write_buffer.clear();
    }

    fflush(fp_);
}
