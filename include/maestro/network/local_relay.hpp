#pragma once

#include "event_network.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

namespace maestro {
namespace network {

/**
 * @brief In-process event relay.
 *
 * Stores every published event and fans it out to matching subscriptions
 * from a background delivery thread. New subscriptions are back-filled
 * with stored events (newest `limit` per filter, delivered oldest first).
 *
 * With `redundancy > 1` each delivery is repeated, which reproduces the
 * duplicate arrivals seen when the same event comes from several relays.
 *
 * Thread Safety:
 * - publish(), subscribe() and unsubscribe() may be called from any thread,
 *   including from inside a delivery callback
 * - Callbacks are invoked on the delivery thread, one at a time
 */
class LocalRelay : public IEventNetwork {
public:
    explicit LocalRelay(size_t redundancy = 1)
        : redundancy_(std::max<size_t>(1, redundancy))
    {
        delivery_thread_ = std::thread([this]() { delivery_loop(); });
    }

    ~LocalRelay() override {
        close();
    }

    LocalRelay(const LocalRelay&) = delete;
    LocalRelay& operator=(const LocalRelay&) = delete;

    Expected<void> publish(const Event& event) override {
        if (event.id.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidEvent, "Cannot publish an event without id"});
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return tl::unexpected(Error{ErrorCode::NetworkClosed, "Relay is closed"});
        }

        if (stored_ids_.insert(event.id).second) {
            stored_.push_back(event);
        }

        for (const auto& [id, subscription] : subscriptions_) {
            if (any_matches(subscription.filters, event)) {
                for (size_t i = 0; i < redundancy_; ++i) {
                    pending_.push_back(Delivery{id, event});
                }
            }
        }
        cv_.notify_all();
        return {};
    }

    Expected<SubscriptionId> subscribe(const std::vector<Filter>& filters, EventCallback callback) override {
        if (!callback) {
            return tl::unexpected(Error{ErrorCode::SubscribeFailed, "Subscription callback is required"});
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return tl::unexpected(Error{ErrorCode::NetworkClosed, "Relay is closed"});
        }

        const SubscriptionId id = next_id_++;
        subscriptions_[id] = Subscription{filters, std::move(callback)};

        // Back-fill stored events, honouring each filter's limit.
        std::vector<const Event*> backfill;
        std::unordered_set<std::string> seen;
        for (const auto& filter : filters) {
            std::vector<const Event*> matched;
            for (auto it = stored_.rbegin(); it != stored_.rend(); ++it) {
                if (filter.limit.has_value() && matched.size() >= *filter.limit) {
                    break;
                }
                if (filter.matches(*it)) {
                    matched.push_back(&*it);
                }
            }
            for (auto it = matched.rbegin(); it != matched.rend(); ++it) {
                if (seen.insert((*it)->id).second) {
                    backfill.push_back(*it);
                }
            }
        }
        std::sort(backfill.begin(), backfill.end(), [](const Event* a, const Event* b) {
            return a->created_at < b->created_at;
        });
        for (const auto* event : backfill) {
            pending_.push_back(Delivery{id, *event});
        }
        cv_.notify_all();
        return id;
    }

    void unsubscribe(SubscriptionId id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions_.erase(id);
    }

    /**
     * @brief Block until every queued delivery has been handed to its callback.
     *
     * @return false if the timeout elapsed first
     */
    template<typename Rep, typename Period>
    bool wait_idle(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return idle_cv_.wait_for(lock, timeout, [this] {
            return pending_.empty() && !delivering_;
        });
    }

    /// Stop the delivery thread. Queued deliveries are dropped.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            pending_.clear();
            cv_.notify_all();
        }
        if (delivery_thread_.joinable()) {
            delivery_thread_.join();
        }
        idle_cv_.notify_all();
    }

    std::vector<Event> stored_events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<Event>(stored_.begin(), stored_.end());
    }

    size_t subscription_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscriptions_.size();
    }

private:
    struct Subscription {
        std::vector<Filter> filters;
        EventCallback callback;
    };

    struct Delivery {
        SubscriptionId subscription;
        Event event;
    };

    void delivery_loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            cv_.wait(lock, [this] { return closed_ || !pending_.empty(); });
            if (closed_) {
                break;
            }

            Delivery delivery = std::move(pending_.front());
            pending_.pop_front();

            auto it = subscriptions_.find(delivery.subscription);
            if (it == subscriptions_.end()) {
                if (pending_.empty()) {
                    idle_cv_.notify_all();
                }
                continue;
            }
            EventCallback callback = it->second.callback;

            delivering_ = true;
            lock.unlock();
            callback(delivery.event);
            lock.lock();
            delivering_ = false;

            if (pending_.empty()) {
                idle_cv_.notify_all();
            }
        }
    }

    const size_t redundancy_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Delivery> pending_;
    std::deque<Event> stored_;
    std::unordered_set<std::string> stored_ids_;
    std::map<SubscriptionId, Subscription> subscriptions_;
    SubscriptionId next_id_ = 1;
    bool delivering_ = false;
    bool closed_ = false;
    std::thread delivery_thread_;
};

} // namespace network
} // namespace maestro
