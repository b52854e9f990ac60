#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <utility>

// FIFO shared between a producer thread (MQTT callbacks) and a consumer
// thread (the main loop)
template<typename T>
class SafeQueue
{
public:
    SafeQueue() = default;
    ~SafeQueue() = default;

    SafeQueue(const SafeQueue &) = delete;
    SafeQueue &operator=(const SafeQueue &) = delete;

    template<typename... Args>
    void emplace(Args &&...args)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(T{std::forward<Args>(args)...});
    }

    std::optional<T> tryPop()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

private:
    std::mutex mutex_;
    std::deque<T> queue_;
};
