#pragma once
// Thread-safe blocking queue for handing work to a dedicated thread.
// Consumers sleep while the queue is empty; close() wakes them all and makes
// pop() return std::nullopt once the remaining items are drained.
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace docbench {

template <typename T>
class BlockingQueue {
public:
    // False when the queue has been closed; the value is dropped
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            queue_.push(std::move(value));
        }
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) return std::nullopt;

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    bool closed_ = false;
};

} // namespace docbench
