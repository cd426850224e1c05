#include "thread_pool.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

ThreadPool::ThreadPool(size_t threads) {
    if (threads == 0) {
        throw std::invalid_argument("ThreadPool needs at least one thread");
    }
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    spdlog::debug("Thread pool started with {} workers", threads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
}

bool ThreadPool::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_;
}

void ThreadPool::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("ThreadPool is shutting down");
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
}

void ThreadPool::post_after(std::chrono::milliseconds delay, std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("ThreadPool is shutting down");
        }
        timers_.push(TimedTask{std::chrono::steady_clock::now() + delay, timer_seq_++, std::move(task)});
    }
    // Wake everyone so the earliest deadline gets a waiter
    cv_.notify_all();
}

void ThreadPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            for (;;) {
                if (stopping_ && tasks_.empty()) return;

                auto now = std::chrono::steady_clock::now();
                while (!timers_.empty() && timers_.top().due <= now) {
                    tasks_.push(timers_.top().task);
                    timers_.pop();
                }

                if (!tasks_.empty()) break;

                if (timers_.empty()) {
                    cv_.wait(lock);
                } else {
                    auto due = timers_.top().due;
                    cv_.wait_until(lock, due);
                }
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Unhandled exception in pool task: {}", e.what());
        } catch (...) {
            spdlog::error("Unhandled non-standard exception in pool task");
        }
    }
}
