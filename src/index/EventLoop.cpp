#include "EventLoop.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace corridor::index {

EventLoop::EventLoop()
    : worker_(&EventLoop::run, this) {
}

EventLoop::~EventLoop() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    condition_.notify_all();
    // worker_ 在 jthread 析构时 join
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw std::runtime_error("post on stopped EventLoop");
        }
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
}

void EventLoop::run() {
    Task task;
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // 单个任务失败不能终止循环
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("事件循环任务异常: {}", e.what());
        }
        task = nullptr;
    }
}

} // namespace corridor::index
