#pragma once

#include "../types.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace maestro {
namespace engine {

/// A request to run the routing loop for one conversation.
struct RoutingRequest {
    std::string conversation_id;
    std::chrono::steady_clock::time_point submitted_at = std::chrono::steady_clock::now();
};

/**
 * @brief Thread-safe MPMC queue of routing requests.
 *
 * Producers are the ingestion handlers; consumers are the routing workers.
 * Mutex + condition variable, blocking pop, graceful shutdown.
 */
class RoutingQueue {
public:
    /// @param max_size Maximum queue size (0 = unlimited)
    explicit RoutingQueue(size_t max_size = 0)
        : max_size_(max_size)
    {}

    /// @return false if the queue is full or shut down
    bool push(RoutingRequest request) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return false;
        }
        if (max_size_ > 0 && queue_.size() >= max_size_) {
            return false;
        }
        queue_.push(std::move(request));
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Block until a request is available.
     *
     * @return nullopt once shut down and drained
     */
    std::optional<RoutingRequest> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || shutdown_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        RoutingRequest request = std::move(queue_.front());
        queue_.pop();
        return request;
    }

    template<typename Rep, typename Period>
    std::optional<RoutingRequest> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || shutdown_; }) || queue_.empty()) {
            return std::nullopt;
        }
        RoutingRequest request = std::move(queue_.front());
        queue_.pop();
        return request;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    /// Wakes blocked consumers and rejects further pushes. Queued requests are discarded.
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        std::queue<RoutingRequest>().swap(queue_);
        cv_.notify_all();
    }

    bool is_shutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

private:
    std::queue<RoutingRequest> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t max_size_;
    bool shutdown_ = false;
};

} // namespace engine
} // namespace maestro
