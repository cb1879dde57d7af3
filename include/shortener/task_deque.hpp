#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace shortener {

/*
 * Blocking FIFO handing requests from the reactor to the workers.
 */
template <typename T>
class TaskDeque {
public:
    void push_back(T task) {
        {
            std::lock_guard lock(deque_mutex_);
            deque_.push_back(std::move(task));
        }
        cv_.notify_one();
    }

    // Blocks until a task is available.
    // Returns std::nullopt once stop is requested on stop_token.
    std::optional<T> wait_and_pop_front(std::stop_token stop_token) {
        std::unique_lock lock(deque_mutex_);
        bool ready = cv_.wait(lock, stop_token, [this]() {
            return !deque_.empty();
        });

        if (!ready)
            return std::nullopt;

        T task = std::move(deque_.front());
        deque_.pop_front();
        return task;
    }

    // Drops every queued task, returns how many were dropped
    size_t clear() {
        std::lock_guard lock(deque_mutex_);
        size_t dropped = deque_.size();
        deque_.clear();
        return dropped;
    }

private:
    std::deque<T> deque_;
    std::mutex deque_mutex_;
    std::condition_variable_any cv_;
};

} // namespace shortener
