#pragma once

#include "executor.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

class ThreadPool : public Executor {
public:
    explicit ThreadPool(size_t threads);
    ~ThreadPool() override;

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void post(std::function<void()> task) override;
    void post_after(std::chrono::milliseconds delay, std::function<void()> task) override;

    // Delayed tasks that have not come due are dropped
    void shutdown();

    bool is_running() const;
    size_t thread_count() const { return workers_.size(); }

private:
    struct TimedTask {
        std::chrono::steady_clock::time_point due;
        uint64_t seq;
        std::function<void()> task;

        bool operator>(const TimedTask& other) const {
            return due != other.due ? due > other.due : seq > other.seq;
        }
    };

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::priority_queue<TimedTask, std::vector<TimedTask>, std::greater<TimedTask>> timers_;
    uint64_t timer_seq_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;

    void worker_loop();
};
