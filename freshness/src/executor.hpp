#pragma once

#include <chrono>
#include <functional>

// Handle for work the caller does not wait on
class Executor {
public:
    virtual ~Executor() = default;

    virtual void post(std::function<void()> task) = 0;
    virtual void post_after(std::chrono::milliseconds delay, std::function<void()> task) = 0;
};
