#ifndef PNEUMATIC_UTILS_BOUNDED_CHANNEL_HPP
#define PNEUMATIC_UTILS_BOUNDED_CHANNEL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stdexcept>

namespace pneumatic {
namespace utils {

// Multi-producer, multi-consumer FIFO with a fixed capacity.
// send() blocks while full, receive() blocks while empty.
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(std::size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("BoundedChannel: capacity must be positive");
        }
    }

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;


    // ---- CHANNEL CONTROL METHODS ----
    // Returns false if the channel was closed before the item was queued
    bool send(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this]() { return closed_ || queue_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Returns false once the channel is closed and drained
    bool receive(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return true;
    }

    // Wakes every blocked sender and receiver. Queued items stay readable.
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_full_.notify_all();
        not_empty_.notify_all();
    }


    // ---- QUERY METHODS ----
    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::size_t capacity() const { return capacity_; }

private:
    // ---- PARAMETERS ----
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> queue_;
    bool closed_ = false;
};

} // namespace utils
} // namespace pneumatic

#endif // PNEUMATIC_UTILS_BOUNDED_CHANNEL_HPP
