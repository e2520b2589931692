#pragma once

#include "maestro/network/event_network.hpp"

#include <map>
#include <mutex>
#include <vector>

namespace maestro {
namespace testing {

/**
 * @brief Mock event network for unit testing.
 *
 * Captures published events and lets tests inject inbound events, which are
 * delivered synchronously on the calling thread to matching subscriptions.
 * Publication failures can be injected for a number of calls.
 */
class MockEventNetwork : public network::IEventNetwork {
public:
    // Configuration
    int fail_next_publishes = 0;                 ///< Fail this many publish() calls, then succeed
    bool fail_all_publishes = false;
    ErrorCode publish_error = ErrorCode::PublishFailed;
    bool should_fail_subscribe = false;

    Expected<void> publish(const network::Event& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++publish_attempts_;
        if (fail_all_publishes || fail_next_publishes > 0) {
            if (fail_next_publishes > 0) {
                --fail_next_publishes;
            }
            return tl::unexpected(Error{publish_error, "Mock publish failure", event.id});
        }
        published_.push_back(event);
        return {};
    }

    Expected<network::SubscriptionId> subscribe(const std::vector<network::Filter>& filters,
                                                EventCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (should_fail_subscribe) {
            return tl::unexpected(Error{ErrorCode::SubscribeFailed, "Mock subscribe failure"});
        }
        const network::SubscriptionId id = next_id_++;
        subscriptions_[id] = Subscription{filters, std::move(callback)};
        return id;
    }

    void unsubscribe(network::SubscriptionId id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions_.erase(id);
    }

    /// Deliver `event` to every matching subscription. Returns the number of deliveries.
    size_t inject(const network::Event& event) {
        std::vector<EventCallback> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, subscription] : subscriptions_) {
                if (network::any_matches(subscription.filters, event)) {
                    targets.push_back(subscription.callback);
                }
            }
        }
        for (const auto& callback : targets) {
            callback(event);
        }
        return targets.size();
    }

    std::vector<network::Event> published() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

    int publish_attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return publish_attempts_;
    }

    size_t subscription_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscriptions_.size();
    }

    std::vector<network::Filter> last_filters() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (subscriptions_.empty()) {
            return {};
        }
        return subscriptions_.rbegin()->second.filters;
    }

private:
    struct Subscription {
        std::vector<network::Filter> filters;
        EventCallback callback;
    };

    mutable std::mutex mutex_;
    std::vector<network::Event> published_;
    std::map<network::SubscriptionId, Subscription> subscriptions_;
    network::SubscriptionId next_id_ = 1;
    int publish_attempts_ = 0;
};

} // namespace testing
} // namespace maestro
