#pragma once

#include "../context.hpp"
#include "../network/event_network.hpp"
#include "../network/schnorr_signer.hpp"
#include "event_classifier.hpp"
#include "processed_event_ledger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace maestro {
namespace ingestion {

struct IngestionStats {
    uint64_t received = 0;
    uint64_t duplicates = 0;
    uint64_t invalid = 0;
    uint64_t ignored = 0;
    uint64_t dispatched = 0;
    uint64_t handler_failures = 0;
};

/**
 * @brief Subscribes to the event network, drops duplicates and dispatches by class.
 *
 * Every event id is checked against the ledger before any handler runs,
 * so an id reaches a handler at most once across redeliveries and
 * restarts. An event is marked processed even when its handler throws.
 *
 * The ledger is flushed periodically from a background thread and on
 * stop(). A flush failure is logged at critical level and reported to
 * the alert callback; the entries stay pending and are retried.
 */
class IngestionLayer {
public:
    using Handler = std::function<void(const network::Event&)>;
    using AlertCallback = std::function<void(const Error&)>;

    struct Options {
        std::chrono::milliseconds flush_interval{1000};
        bool verify_signatures = true;
    };

    IngestionLayer(RuntimeContext context, std::shared_ptr<IEventLedger> ledger, Options options)
        : context_(std::move(context.with_defaults()))
        , ledger_(std::move(ledger))
        , options_(options)
    {}

    ~IngestionLayer() {
        auto stopped = stop();
        if (!stopped) {
            context_.log().critical("Ingestion stopped with unflushed ledger entries: {}",
                                    stopped.error().to_string());
        }
    }

    IngestionLayer(const IngestionLayer&) = delete;
    IngestionLayer& operator=(const IngestionLayer&) = delete;

    /// Register the handler for one event class. Must be called before start().
    void on(EventClass event_class, Handler handler) {
        handlers_[event_class] = std::move(handler);
    }

    void set_alert_callback(AlertCallback callback) {
        std::lock_guard<std::mutex> lock(alert_mutex_);
        alert_callback_ = std::move(callback);
    }

    /**
     * @brief Load the ledger, subscribe with `filters` and start the flusher.
     */
    Expected<void> start(const std::vector<network::Filter>& filters) {
        if (running_.load()) {
            return {};
        }
        if (!context_.network) {
            return tl::unexpected(Error{ErrorCode::SubscribeFailed, "No event network configured"});
        }

        auto loaded = ledger_->load();
        if (!loaded) {
            return tl::unexpected(loaded.error());
        }
        context_.log().info("Processed-event ledger loaded: {} id(s)", *loaded);

        accepting_.store(true);
        auto subscription = context_.network->subscribe(filters, [this](const network::Event& event) {
            ingest(event);
        });
        if (!subscription) {
            accepting_.store(false);
            return tl::unexpected(subscription.error());
        }
        subscription_ = *subscription;

        {
            std::lock_guard<std::mutex> lock(flush_mutex_);
            stop_flusher_ = false;
        }
        running_.store(true);
        flusher_ = std::thread([this]() { flush_loop(); });
        return {};
    }

    /**
     * @brief Stop accepting events, flush the ledger, then unsubscribe.
     *
     * @return The flush error, if the final flush failed
     */
    Expected<void> stop() {
        if (!running_.exchange(false)) {
            return {};
        }
        {
            // Ingests already past the accepting check finish before the final flush.
            std::unique_lock<std::mutex> lock(in_flight_mutex_);
            accepting_.store(false);
            in_flight_cv_.wait(lock, [this] { return in_flight_ == 0; });
        }

        {
            std::lock_guard<std::mutex> lock(flush_mutex_);
            stop_flusher_ = true;
        }
        flush_cv_.notify_all();
        if (flusher_.joinable()) {
            flusher_.join();
        }

        auto flushed = flush();

        if (subscription_) {
            context_.network->unsubscribe(*subscription_);
            subscription_.reset();
        }
        if (!flushed) {
            return tl::unexpected(flushed.error());
        }
        return {};
    }

    /// Flush now. Failures are alerted and returned.
    Expected<size_t> flush() {
        auto flushed = ledger_->flush();
        if (!flushed) {
            alert(flushed.error());
        }
        return flushed;
    }

    /**
     * @brief Process one inbound event.
     *
     * Called from the subscription; also usable directly when events are
     * fed from another source.
     */
    void ingest(const network::Event& event) {
        {
            std::lock_guard<std::mutex> lock(in_flight_mutex_);
            if (!accepting_.load()) {
                context_.log().debug("Event {} dropped: ingestion not accepting", event.id);
                return;
            }
            ++in_flight_;
        }
        InFlightGuard guard{*this};
        bump(&IngestionStats::received);

        if (options_.verify_signatures) {
            auto verified = network::verify_event(event);
            if (!verified) {
                bump(&IngestionStats::invalid);
                context_.log().warn("Event {} rejected: {}", event.id, verified.error().to_string());
                return;
            }
        } else if (event.id.empty()) {
            bump(&IngestionStats::invalid);
            return;
        } else if (auto serialized = network::canonical_serialization(event); !serialized) {
            bump(&IngestionStats::invalid);
            context_.log().warn("Event {} rejected: {}", event.id, serialized.error().to_string());
            return;
        }

        if (!ledger_->add(event.id, context_.now())) {
            bump(&IngestionStats::duplicates);
            context_.log().debug("Event {} already processed", event.id);
            return;
        }

        const EventClass event_class = classify(event, *context_.agents);
        if (event_class == EventClass::Ignored) {
            bump(&IngestionStats::ignored);
            return;
        }

        auto it = handlers_.find(event_class);
        if (it == handlers_.end() || !it->second) {
            context_.log().debug("No handler for {} event {}", event_class_to_string(event_class), event.id);
            return;
        }

        bump(&IngestionStats::dispatched);
        try {
            it->second(event);
        } catch (const std::exception& e) {
            bump(&IngestionStats::handler_failures);
            context_.log().warn("Handler for {} event {} failed: {}",
                                event_class_to_string(event_class), event.id, e.what());
        }
    }

    IngestionStats stats() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        return stats_;
    }

    bool is_running() const {
        return running_.load();
    }

private:
    struct InFlightGuard {
        IngestionLayer& layer;
        ~InFlightGuard() {
            std::lock_guard<std::mutex> lock(layer.in_flight_mutex_);
            if (--layer.in_flight_ == 0) {
                layer.in_flight_cv_.notify_all();
            }
        }
    };

    void flush_loop() {
        std::unique_lock<std::mutex> lock(flush_mutex_);
        while (!stop_flusher_) {
            flush_cv_.wait_for(lock, options_.flush_interval, [this] { return stop_flusher_; });
            if (stop_flusher_) {
                break;
            }
            lock.unlock();
            auto flushed = flush();
            if (flushed && *flushed > 0) {
                context_.log().debug("Ledger flushed {} id(s)", *flushed);
            }
            lock.lock();
        }
    }

    void alert(const Error& error) {
        context_.log().critical("Processed-event ledger flush failed: {}", error.to_string());
        AlertCallback callback;
        {
            std::lock_guard<std::mutex> lock(alert_mutex_);
            callback = alert_callback_;
        }
        if (callback) {
            callback(error);
        }
    }

    void bump(uint64_t IngestionStats::*counter) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++(stats_.*counter);
    }

    RuntimeContext context_;
    std::shared_ptr<IEventLedger> ledger_;
    Options options_;
    std::map<EventClass, Handler> handlers_;

    std::atomic<bool> accepting_{false};
    std::mutex in_flight_mutex_;
    std::condition_variable in_flight_cv_;
    size_t in_flight_ = 0;
    std::atomic<bool> running_{false};
    std::optional<network::SubscriptionId> subscription_;

    std::mutex flush_mutex_;
    std::condition_variable flush_cv_;
    bool stop_flusher_ = false;
    std::thread flusher_;

    std::mutex alert_mutex_;
    AlertCallback alert_callback_;

    mutable std::mutex stats_mutex_;
    IngestionStats stats_;
};

} // namespace ingestion
} // namespace maestro
