#pragma once

#include "../context.hpp"
#include "../conversation.hpp"
#include "../network/agent_publisher.hpp"
#include "conversation_store.hpp"

#include <atomic>
#include <cstdio>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace maestro {
namespace engine {

using DelegationResult = Expected<std::vector<Completion>>;

/**
 * @brief Handle for one in-flight delegation.
 *
 * The future resolves with the turn's completions (arrival order) once
 * every recipient reported, or with an error when the turn is cancelled
 * or force-closed.
 */
struct DelegationHandle {
    std::string conversation_id;
    std::string turn_id;
    std::future<DelegationResult> future;

    DelegationHandle() = default;
    DelegationHandle(std::string conversation_id, std::string turn_id, std::future<DelegationResult> future)
        : conversation_id(std::move(conversation_id))
        , turn_id(std::move(turn_id))
        , future(std::move(future)) {}
    DelegationHandle(DelegationHandle&&) = default;
    DelegationHandle& operator=(DelegationHandle&&) = default;
    DelegationHandle(const DelegationHandle&) = delete;
    DelegationHandle& operator=(const DelegationHandle&) = delete;
};

/**
 * @brief Synchronous-over-asynchronous delegation to specialist agents.
 *
 * begin() opens a turn, registers the wait and publishes one request per
 * recipient. Completions arrive through deliver() (called from the
 * ingestion thread); when the store closes the turn the wait resolves.
 *
 * There is no built-in timeout: callers that need one use wait_for() and
 * cancel() on expiry, which force-closes the turn.
 *
 * Thread Safety: all methods are thread-safe. The turn-closed callback
 * runs on whichever thread closed the turn.
 */
class DelegationService {
public:
    DelegationService(RuntimeContext context,
                      std::shared_ptr<ConversationStore> store,
                      std::shared_ptr<network::AgentPublisher> publisher)
        : context_(std::move(context.with_defaults()))
        , store_(std::move(store))
        , publisher_(std::move(publisher))
        , state_(std::make_shared<SharedState>())
    {
        // The store may outlive this service; the listener only holds the shared state.
        std::weak_ptr<SharedState> weak = state_;
        store_->add_turn_closed_listener([weak](const std::string&, const RoutingEntry& turn) {
            if (auto state = weak.lock()) {
                state->resolve(turn);
            }
        });
    }

    ~DelegationService() {
        shutdown("Delegation service shutting down");
    }

    DelegationService(const DelegationService&) = delete;
    DelegationService& operator=(const DelegationService&) = delete;

    /**
     * @brief Open a turn for `recipients` and send them the request.
     *
     * @param initiator_slug Agent whose identity signs the requests
     * @return Handle to wait on; TurnAlreadyOpen while another turn is open,
     *         UnknownAgent for unknown recipients, PublishFailed when a request
     *         could not be sent (the turn then stays open for the caller to close)
     */
    Expected<DelegationHandle> begin(const std::string& conversation_id,
                                     const std::string& initiator_slug,
                                     const std::vector<std::string>& recipients,
                                     const std::string& request,
                                     const std::string& reason) {
        if (state_->is_closed()) {
            return tl::unexpected(Error{ErrorCode::OrchestratorNotRunning, "Delegation service is shut down",
                                        conversation_id});
        }
        if (recipients.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidTurn, "Delegation needs at least one recipient"});
        }

        std::vector<AgentDefinition> targets;
        for (const auto& slug : recipients) {
            auto agent = context_.agents->find(slug);
            if (!agent || !agent->is_specialist()) {
                return tl::unexpected(Error{ErrorCode::UnknownAgent, "Unknown delegation recipient", slug});
            }
            targets.push_back(*agent);
        }

        const std::string turn_id = make_turn_id();
        auto opened = store_->open_turn(conversation_id, turn_id, recipients, reason);
        if (!opened) {
            if (opened.error().code == ErrorCode::TurnAlreadyOpen) {
                context_.log().warn("Conversation {} delegation rejected: turn {} still open",
                                    conversation_id, opened.error().context.value_or("?"));
            }
            return tl::unexpected(opened.error());
        }

        auto promise = std::make_shared<std::promise<DelegationResult>>();
        DelegationHandle handle(conversation_id, turn_id, promise->get_future());
        if (!state_->add(turn_id, conversation_id, std::move(promise))) {
            // Shut down while the turn was being opened; nothing was sent yet.
            auto closed = store_->close_turn(conversation_id, "delegation service shut down", turn_id);
            if (!closed) {
                context_.log().error("Conversation {}: turn {} left open at shutdown: {}",
                                     conversation_id, turn_id, closed.error().to_string());
            }
            return tl::unexpected(Error{ErrorCode::OrchestratorNotRunning, "Delegation service is shut down",
                                        conversation_id});
        }

        const std::string content = build_request_content(conversation_id, opened->phase, request, reason);
        for (const auto& target : targets) {
            auto published = publisher_->publish_delegation(
                initiator_slug, target, conversation_id, turn_id, opened->phase, content);
            if (!published) {
                state_->remove(turn_id);
                context_.log().error("Conversation {} turn {}: request to {} not delivered: {}",
                                     conversation_id, turn_id, target.slug, published.error().to_string());
                return tl::unexpected(published.error());
            }
            context_.log().debug("Conversation {} turn {}: request {} sent to {}",
                                 conversation_id, turn_id, published->id, target.slug);
        }
        return handle;
    }

    /**
     * @brief Wait on a turn that has no waiter, such as one left open by
     * an earlier process.
     *
     * A turn that already closed gives a handle that is ready at once.
     *
     * @return InvalidTurn for an unknown turn or one already waited on,
     *         OrchestratorNotRunning after shutdown()
     */
    Expected<DelegationHandle> adopt(const std::string& conversation_id, const std::string& turn_id) {
        if (state_->is_closed()) {
            return tl::unexpected(Error{ErrorCode::OrchestratorNotRunning, "Delegation service is shut down",
                                        conversation_id});
        }

        auto promise = std::make_shared<std::promise<DelegationResult>>();
        DelegationHandle handle(conversation_id, turn_id, promise->get_future());
        if (!state_->add(turn_id, conversation_id, promise)) {
            return tl::unexpected(Error{ErrorCode::InvalidTurn, "Turn already has a waiter", turn_id});
        }

        // Checked after registering, so a close in between is not missed.
        auto snapshot = store_->get(conversation_id);
        if (!snapshot) {
            state_->remove(turn_id);
            return tl::unexpected(snapshot.error());
        }
        if (snapshot->current_turn && snapshot->current_turn->turn_id == turn_id) {
            context_.log().info("Conversation {}: waiting on turn {} opened earlier", conversation_id, turn_id);
            return handle;
        }
        if (const auto* closed = snapshot->find_turn(turn_id)) {
            state_->resolve(*closed);
            return handle;
        }
        state_->remove(turn_id);
        return tl::unexpected(Error{ErrorCode::InvalidTurn, "Unknown turn", turn_id});
    }

    /// Block until the turn resolves.
    DelegationResult wait(DelegationHandle& handle) {
        return handle.future.get();
    }

    /**
     * @brief Block for at most `timeout`.
     *
     * On expiry returns DelegationTimeout and leaves the turn open; the
     * caller decides whether to cancel().
     */
    template<typename Rep, typename Period>
    DelegationResult wait_for(DelegationHandle& handle, const std::chrono::duration<Rep, Period>& timeout) {
        if (handle.future.wait_for(timeout) != std::future_status::ready) {
            return tl::unexpected(Error{ErrorCode::DelegationTimeout, "Delegation wait timed out", handle.turn_id});
        }
        return handle.future.get();
    }

    /// begin() followed by wait().
    DelegationResult delegate(const std::string& conversation_id,
                              const std::string& initiator_slug,
                              const std::vector<std::string>& recipients,
                              const std::string& request,
                              const std::string& reason) {
        auto handle = begin(conversation_id, initiator_slug, recipients, request, reason);
        if (!handle) {
            return tl::unexpected(handle.error());
        }
        return wait(*handle);
    }

    /**
     * @brief Record a completion reported by an agent.
     *
     * Anything that does not fit the open turn is an orphaned completion:
     * logged, and rejected unless `policy` is RecordAnyway.
     */
    Expected<CompletionOutcome> deliver(const std::string& conversation_id,
                                        const std::string& turn_id,
                                        Completion completion,
                                        CompletionPolicy policy = CompletionPolicy::Reject) {
        const std::string agent = completion.agent;
        auto outcome = store_->record_completion(conversation_id, turn_id, std::move(completion), policy);
        if (!outcome) {
            if (outcome.error().code == ErrorCode::OrphanedCompletion) {
                context_.log().warn("Conversation {}: orphaned completion from {} for turn {}",
                                    conversation_id, agent, turn_id);
            }
            return outcome;
        }
        if (outcome->unsolicited) {
            context_.log().warn("Conversation {}: unsolicited completion from {} kept on turn {}",
                                conversation_id, agent, turn_id);
        } else {
            context_.log().debug("Conversation {} turn {}: completion from {} recorded",
                                 conversation_id, turn_id, agent);
        }
        return outcome;
    }

    /**
     * @brief Tear down the wait for `turn_id` and force-close the turn.
     *
     * Replies arriving afterwards are orphaned. Returns false if no wait
     * was registered for this turn.
     */
    bool cancel(const std::string& turn_id, const std::string& reason = "delegation cancelled") {
        auto pending = state_->take(turn_id);
        if (!pending) {
            return false;
        }

        pending->promise->set_value(tl::unexpected(Error{ErrorCode::DelegationCancelled, reason, turn_id}));

        auto closed = store_->close_turn(pending->conversation_id, reason, turn_id);
        if (!closed) {
            context_.log().error("Conversation {}: cancelled turn {} could not be closed: {}",
                                 pending->conversation_id, turn_id, closed.error().to_string());
        } else if (*closed) {
            auto audited = store_->add_audit(pending->conversation_id, "delegation_cancelled", turn_id + ": " + reason);
            if (!audited) {
                context_.log().error("Conversation {}: audit entry not written: {}",
                                     pending->conversation_id, audited.error().to_string());
            }
        }
        context_.log().info("Conversation {} turn {} cancelled: {}", pending->conversation_id, turn_id, reason);
        return true;
    }

    /// Resolve every pending wait with DelegationCancelled. Turns are left as they are.
    void cancel_all(const std::string& reason) {
        state_->cancel_all(reason, false);
    }

    /**
     * @brief cancel_all() and refuse every later begin() with OrchestratorNotRunning.
     */
    void shutdown(const std::string& reason) {
        state_->cancel_all(reason, true);
    }

    bool is_shut_down() const {
        return state_->is_closed();
    }

    size_t pending_count() const {
        return state_->size();
    }

private:
    struct PendingWait {
        std::string conversation_id;
        std::shared_ptr<std::promise<DelegationResult>> promise;
    };

    struct SharedState {
        std::mutex mutex;
        std::unordered_map<std::string, PendingWait> pending;
        bool closed = false;

        /// false once closed or when the turn already has a waiter.
        bool add(const std::string& turn_id, const std::string& conversation_id,
                 std::shared_ptr<std::promise<DelegationResult>> promise) {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed || pending.count(turn_id) > 0) {
                return false;
            }
            pending[turn_id] = PendingWait{conversation_id, std::move(promise)};
            return true;
        }

        bool is_closed() {
            std::lock_guard<std::mutex> lock(mutex);
            return closed;
        }

        std::optional<PendingWait> take(const std::string& turn_id) {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = pending.find(turn_id);
            if (it == pending.end()) {
                return std::nullopt;
            }
            PendingWait wait = std::move(it->second);
            pending.erase(it);
            return wait;
        }

        void remove(const std::string& turn_id) {
            std::lock_guard<std::mutex> lock(mutex);
            pending.erase(turn_id);
        }

        void resolve(const RoutingEntry& turn) {
            auto wait = take(turn.turn_id);
            if (!wait) {
                return;
            }
            if (turn.closure == TurnClosure::Covered) {
                wait->promise->set_value(turn.solicited_completions());
            } else {
                wait->promise->set_value(tl::unexpected(Error{
                    ErrorCode::DelegationCancelled, "Turn closed before all agents reported: " + turn.close_reason,
                    turn.turn_id}));
            }
        }

        void cancel_all(const std::string& reason, bool close) {
            std::lock_guard<std::mutex> lock(mutex);
            closed = closed || close;
            for (auto& [turn_id, wait] : pending) {
                wait.promise->set_value(tl::unexpected(Error{ErrorCode::DelegationCancelled, reason, turn_id}));
            }
            pending.clear();
        }

        size_t size() {
            std::lock_guard<std::mutex> lock(mutex);
            return pending.size();
        }
    };

    std::string make_turn_id() {
        return "turn_" + std::to_string(context_.now()) + "_" + instance_tag_ + "_" +
               std::to_string(next_turn_.fetch_add(1, std::memory_order_relaxed));
    }

    std::string build_request_content(const std::string& conversation_id,
                                      const std::string& phase,
                                      const std::string& request,
                                      const std::string& reason) const {
        std::string instructions;
        auto snapshot = store_->get(conversation_id);
        if (snapshot && !snapshot->phase_transitions.empty() &&
            snapshot->phase_transitions.back().to == phase) {
            instructions = snapshot->phase_transitions.back().instructions;
        }
        if (instructions.empty()) {
            if (auto rule = context_.phases->rule(phase)) {
                instructions = rule->instructions;
            }
        }

        std::string content = "Phase: " + phase + "\n";
        if (!instructions.empty()) {
            content += "Phase instructions: " + instructions + "\n";
        }
        content += "Routing reason: " + reason + "\n\n" + request;
        return content;
    }

    RuntimeContext context_;
    std::shared_ptr<ConversationStore> store_;
    std::shared_ptr<network::AgentPublisher> publisher_;
    std::shared_ptr<SharedState> state_;
    std::atomic<uint64_t> next_turn_{1};
    std::string instance_tag_ = make_instance_tag();

    static std::string make_instance_tag() {
        std::random_device device;
        std::uniform_int_distribution<uint32_t> distribution(0, 0xFFFFFF);
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "%06x", distribution(device));
        return buffer;
    }
};

} // namespace engine
} // namespace maestro
