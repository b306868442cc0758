#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>

/**
 * @brief Mutex/condvar queue between the regulator and whoever drains its output.
 * @details The regulator itself is single-threaded; this queue is the one
 * place where it hands data to another thread (a host's output drainer).
 */
template <typename T>
class ThreadSafeQueue {
private:
    // Separate cache lines so the producer touching the mutex does not
    // invalidate the line a consumer is reading the container from.
    alignas(64) mutable std::mutex mutex_;
    alignas(64) std::condition_variable cv_;
    alignas(64) std::queue<T> queue_;

    bool stopped_ = false;

public:
    ThreadSafeQueue() = default;

    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push(std::move(value));
        }
        // Notify after unlocking so the woken consumer does not block on us.
        cv_.notify_one();
    }

    /**
     * @brief Non-blocking pop.
     * @return The front item, or nullopt if the queue is empty.
     */
    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return std::nullopt;

        T value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

    /**
     * @brief Blocks until data or stop, then swaps the whole backlog out.
     * @details One lock per batch instead of one per message: a settlement
     * with thousands of bids produces its lines in a burst.
     * @return false once the queue is stopped and fully drained.
     */
    bool pop_all(std::queue<T>& local_queue) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || stopped_; });

        if (queue_.empty() && stopped_) return false;

        std::swap(local_queue, queue_);
        return true;
    }

    /**
     * @brief Wakes every waiting consumer; pop_all returns false once drained.
     */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }
};
