#ifndef CHUNK_CHANNEL_HPP
#define CHUNK_CHANNEL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

// What a full channel does with a new item.
enum class OverflowPolicy {
    DropOldest,   // producer never waits; the oldest queued item is discarded
    Block         // producer waits for room (or for close)
};

enum class PopStatus { Item, Timeout, Closed };
enum class PushStatus { Pushed, Timeout, Closed };

// Bounded single-producer/single-consumer hand-off between threads.
// close() lets the consumer drain what is queued; cancel() discards it.
template <typename T>
class ChunkChannel {
public:
    ChunkChannel(size_t capacity, OverflowPolicy policy)
        : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {}

    ChunkChannel(const ChunkChannel&) = delete;
    ChunkChannel& operator=(const ChunkChannel&) = delete;

    // Returns false once the channel is closed.
    bool push(T&& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (policy_ == OverflowPolicy::Block) {
            cv_push_.wait(lock, [this] { return queue_.size() < capacity_ || closed_; });
        }
        if (closed_) return false;

        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            dropped_count_++;
        }
        queue_.push_back(std::move(item));
        cv_pop_.notify_one();
        return true;
    }

    // Block policy with a bound on the wait. On Timeout `item` is left
    // untouched; on Closed it is dropped.
    template <typename Rep, typename Period>
    PushStatus pushFor(T& item, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_push_.wait_for(lock, timeout, [this] { return queue_.size() < capacity_ || closed_; })) {
            return PushStatus::Timeout;
        }
        if (closed_) return PushStatus::Closed;
        queue_.push_back(std::move(item));
        cv_pop_.notify_one();
        return PushStatus::Pushed;
    }

    // Enqueues past capacity. For a single trailing marker.
    bool pushUnbounded(T&& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        queue_.push_back(std::move(item));
        cv_pop_.notify_one();
        return true;
    }

    // Blocks until an item arrives or the channel is closed and drained.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_pop_.wait(lock, [this] { return !queue_.empty() || closed_; });
        return take(out);
    }

    template <typename Rep, typename Period>
    PopStatus popFor(T& out, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_pop_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; })) {
            return PopStatus::Timeout;
        }
        return take(out) ? PopStatus::Item : PopStatus::Closed;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_pop_.notify_all();
        cv_push_.notify_all();
    }

    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        queue_.clear();
        cv_pop_.notify_all();
        cv_push_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }
    OverflowPolicy policy() const { return policy_; }
    size_t droppedCount() const { return dropped_count_.load(); }

private:
    bool take(T& out) {
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        cv_push_.notify_one();
        return true;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_pop_;    // data available or closed
    std::condition_variable cv_push_;   // room available or closed
    std::deque<T> queue_;
    const size_t capacity_;
    const OverflowPolicy policy_;
    bool closed_ = false;
    std::atomic<size_t> dropped_count_{0};
};

#endif
