#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

namespace corridor::index {

// 单线程事件循环：按投递顺序逐个执行任务。
// 析构时执行完队列中剩余的任务再退出
class EventLoop {
public:
    using Task = std::function<void()>;

    EventLoop();
    ~EventLoop() noexcept;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;
    EventLoop(EventLoop&&) = delete;
    EventLoop& operator=(EventLoop&&) = delete;

    // 投递任务，循环停止后投递抛出 std::runtime_error
    void post(Task task);

private:
    void run();

    std::queue<Task> tasks_;
    std::mutex mutex_;
    std::condition_variable condition_;
    bool stop_{false};
    std::jthread worker_;  // 最后构造
};

} // namespace corridor::index
