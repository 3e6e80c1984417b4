#ifndef THREAD_SAFE_QUEUE_HPP
#define THREAD_SAFE_QUEUE_HPP

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

/**
 * @brief Unbounded multi-producer, multi-consumer FIFO.
 *
 * Used to hand invocation jobs to pool threads and to return their
 * completions to the dispatch thread. close() wakes every consumer; elements
 * still queued are handed out first, and pop() returns std::nullopt only once
 * the queue is both closed and empty.
 *
 * @tparam T Element type; must be movable.
 */
template <typename T>
class ThreadSafeQueue {
public:
    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(std::move(value));
        }
        ready_.notify_one();
    }

    /** @brief Wait for the next element; std::nullopt once closed and drained. */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return take_front();
    }

    /** @brief Next element if one is queued right now. */
    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_front();
    }

    /** @brief Stop blocking consumers once the queue runs empty. */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

private:
    // Caller holds mutex_
    std::optional<T> take_front() {
        if (items_.empty()) return std::nullopt;
        std::optional<T> value{std::move(items_.front())};
        items_.pop_front();
        return value;
    }

    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> items_;
    bool closed_ = false;
};

#endif // THREAD_SAFE_QUEUE_HPP
