#ifndef FLUXDB_QUERY_CHANNEL_H_
#define FLUXDB_QUERY_CHANNEL_H_

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace fluxdb {
namespace query {

/**
 * @brief Bounded single-producer/single-consumer queue with explicit completion.
 *
 * The producer calls send() and finally close(). The consumer calls
 * receive() until it returns nullopt, or cancel() to walk away; after
 * cancel() a blocked or later send() returns false so the producer can stop.
 */
template<typename T>
class Channel {
public:
    explicit Channel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Blocks while full. Returns false if the consumer cancelled.
    bool send(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        producer_cv_.wait(lock, [this] { return queue_.size() < capacity_ || cancelled_; });
        if (cancelled_ || closed_) {
            return false;
        }
        queue_.push_back(std::move(value));
        consumer_cv_.notify_one();
        return true;
    }

    // Blocks until a value arrives. nullopt once closed and drained, or cancelled.
    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        consumer_cv_.wait(lock, [this] { return !queue_.empty() || closed_ || cancelled_; });
        if (cancelled_ || queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        producer_cv_.notify_one();
        return value;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        consumer_cv_.notify_all();
    }

    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        queue_.clear();
        producer_cv_.notify_all();
        consumer_cv_.notify_all();
    }

    bool cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    const size_t capacity_;
    std::deque<T> queue_;
    bool closed_ = false;
    bool cancelled_ = false;
    mutable std::mutex mutex_;
    std::condition_variable producer_cv_;
    std::condition_variable consumer_cv_;
};

} // namespace query
} // namespace fluxdb

#endif // FLUXDB_QUERY_CHANNEL_H_
