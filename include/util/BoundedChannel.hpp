#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace tunebox::util {

// Fixed-capacity FIFO shared between threads.
//
// Producers pick their backpressure policy per call:
//   send()        - blocks while full (returns false once closed)
//   send_for()    - blocks up to a timeout, then rejects
//   try_send()    - rejects immediately when full
//   push_latest() - evicts the oldest entry when full (latest-wins)
//
// close() wakes every waiter; after that sends fail, receivers may still
// drain whatever is queued.
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    bool send(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) return false;
        queue_.push_back(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    bool send_for(T value, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = not_full_.wait_for(lock, timeout, [this] {
            return closed_ || queue_.size() < capacity_;
        });
        if (closed_) return false;
        if (!ready) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        queue_.push_back(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    bool try_send(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            if (queue_.size() >= capacity_) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            queue_.push_back(std::move(value));
        }
        not_empty_.notify_one();
        return true;
    }

    // Never blocks. Returns false only when the channel is closed.
    bool push_latest(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            if (queue_.size() >= capacity_) {
                queue_.pop_front();
                dropped_.fetch_add(1, std::memory_order_relaxed);
            }
            queue_.push_back(std::move(value));
        }
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> try_recv() {
        std::optional<T> value;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) return std::nullopt;
            value = std::move(queue_.front());
            queue_.pop_front();
        }
        not_full_.notify_one();
        return value;
    }

    // Empty result means timeout, or closed-and-drained (check is_closed()).
    std::optional<T> recv_for(std::chrono::milliseconds timeout) {
        std::optional<T> value;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
            if (queue_.empty()) return std::nullopt;
            value = std::move(queue_.front());
            queue_.pop_front();
        }
        not_full_.notify_one();
        return value;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }

    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    const size_t capacity_;
    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool closed_ = false;
    std::atomic<uint64_t> dropped_{0};
};

}  // namespace tunebox::util
