#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace codesync {

// Bounded multi-producer multi-consumer queue joining two pipeline stages.
// push() blocks while full; pop() blocks while empty and returns nullopt
// once the channel is closed and drained.
template <typename T>
class Channel {
public:
    explicit Channel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Returns false when the channel was closed; the item is dropped.
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) return false;
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    const size_t capacity_;
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    bool closed_ = false;
};

// Counting limiter on requests in flight. acquire() blocks at the limit.
class InFlightLimiter {
public:
    explicit InFlightLimiter(size_t limit) : limit_(limit == 0 ? 1 : limit) {}

    void acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return in_flight_ < limit_; });
        ++in_flight_;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_flight_;
        }
        cv_.notify_one();
    }

private:
    const size_t limit_;
    size_t in_flight_ = 0;
    std::mutex mutex_;
    std::condition_variable cv_;
};

// Releases a slot acquired before the work was queued.
class InFlightReleaser {
public:
    explicit InFlightReleaser(InFlightLimiter& limiter) : limiter_(limiter) {}
    ~InFlightReleaser() { limiter_.release(); }

    InFlightReleaser(const InFlightReleaser&) = delete;
    InFlightReleaser& operator=(const InFlightReleaser&) = delete;

private:
    InFlightLimiter& limiter_;
};

} // namespace codesync
