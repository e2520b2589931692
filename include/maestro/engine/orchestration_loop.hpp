#pragma once

#include "../context.hpp"
#include "conversation_store.hpp"
#include "delegation_service.hpp"
#include "routing_decision.hpp"
#include "routing_engine.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace maestro {
namespace engine {

struct LoopOptions {
    std::string orchestrator_slug = "orchestrator";
    int routing_max_attempts = 1;                       ///< decide() attempts per cycle
    int max_cycles = 20;                                ///< decide/delegate cycles per run()
    std::chrono::milliseconds delegation_timeout{0};    ///< 0 = wait without limit
};

enum class LoopOutcome {
    Ended,         ///< The router answered END
    Waiting,       ///< A turn with no waiter is still open and no timeout applies; nothing was decided
    CycleLimit,    ///< max_cycles reached without END
    Cancelled,     ///< The delegation wait was cancelled (shutdown or external close)
    Failed         ///< Routing, transition or delegation failure; recorded in the audit log
};

[[nodiscard]] inline const char* loop_outcome_to_string(LoopOutcome outcome) {
    switch (outcome) {
        case LoopOutcome::Ended: return "ended";
        case LoopOutcome::Waiting: return "waiting";
        case LoopOutcome::CycleLimit: return "cycle_limit";
        case LoopOutcome::Cancelled: return "cancelled";
        case LoopOutcome::Failed: return "failed";
    }
    return "unknown";
}

struct LoopResult {
    LoopOutcome outcome = LoopOutcome::Failed;
    int cycles = 0;
    std::vector<RoutingDecision> decisions;
    std::optional<Error> error;
};

/**
 * @brief The routing loop for one conversation.
 *
 * Each cycle takes a snapshot, asks the RoutingEngine for a decision,
 * applies a phase change if one was requested, delegates to the chosen
 * agents and waits for their completions. The loop ends on END, on
 * failure, on cancellation or after max_cycles.
 *
 * Failures never propagate as crashes: the open turn (if any) is
 * force-closed and the cause is written to the conversation's audit log.
 *
 * Callers must not run two loops for the same conversation at once.
 */
class OrchestrationLoop {
public:
    OrchestrationLoop(RuntimeContext context,
                      std::shared_ptr<ConversationStore> store,
                      std::shared_ptr<RoutingEngine> router,
                      std::shared_ptr<DelegationService> delegation,
                      LoopOptions options)
        : context_(std::move(context.with_defaults()))
        , store_(std::move(store))
        , router_(std::move(router))
        , delegation_(std::move(delegation))
        , options_(std::move(options))
    {}

    LoopResult run(const std::string& conversation_id,
                   const std::shared_ptr<std::atomic<bool>>& cancelled = nullptr) {
        LoopResult result;

        while (result.cycles < options_.max_cycles) {
            if (cancelled && cancelled->load(std::memory_order_acquire)) {
                result.outcome = LoopOutcome::Cancelled;
                return result;
            }

            auto snapshot = store_->get(conversation_id);
            if (!snapshot) {
                result.error = snapshot.error();
                result.outcome = LoopOutcome::Failed;
                return result;
            }
            if (snapshot->has_open_turn()) {
                const RoutingEntry& open = *snapshot->current_turn;
                if (options_.delegation_timeout.count() == 0) {
                    context_.log().info("Conversation {}: turn {} still open, routing deferred",
                                        conversation_id, open.turn_id);
                    result.outcome = LoopOutcome::Waiting;
                    return result;
                }
                auto adopted = delegation_->adopt(conversation_id, open.turn_id);
                if (!adopted) {
                    context_.log().info("Conversation {}: turn {} not adopted: {}",
                                        conversation_id, open.turn_id, adopted.error().to_string());
                    result.error = adopted.error();
                    result.outcome = adopted.error().code == ErrorCode::OrchestratorNotRunning
                        ? LoopOutcome::Cancelled : LoopOutcome::Waiting;
                    return result;
                }

                // The timeout counts from when the turn was opened.
                const auto age = std::chrono::seconds(std::max<Timestamp>(0, context_.now() - open.created_at));
                const auto remaining = std::max(std::chrono::milliseconds(1),
                                                options_.delegation_timeout -
                                                    std::chrono::duration_cast<std::chrono::milliseconds>(age));
                auto completions = delegation_->wait_for(*adopted, remaining);
                if (!completions) {
                    if (completions.error().code != ErrorCode::DelegationTimeout) {
                        result.error = completions.error();
                        result.outcome = LoopOutcome::Cancelled;
                        return result;
                    }
                    delegation_->cancel(open.turn_id, "delegation timed out");
                    context_.log().warn("Conversation {} turn {} from an earlier run timed out",
                                        conversation_id, open.turn_id);
                }
                continue;
            }

            ++result.cycles;
            auto decision = decide_with_retry(*snapshot);
            if (!decision) {
                return fail(conversation_id, "routing", decision.error(), std::move(result));
            }
            result.decisions.push_back(*decision);

            if (cancelled && cancelled->load(std::memory_order_acquire)) {
                context_.log().info("Conversation {}: decision dropped, routing cancelled", conversation_id);
                result.outcome = LoopOutcome::Cancelled;
                return result;
            }

            if (decision->is_end()) {
                record_audit(conversation_id, "workflow_complete", decision->reason);
                context_.log().info("Conversation {} complete: {}", conversation_id, decision->reason);
                result.outcome = LoopOutcome::Ended;
                return result;
            }

            if (decision->phase && *decision->phase != snapshot->phase) {
                auto transition = store_->transition_phase(
                    conversation_id, *decision->phase, "", options_.orchestrator_slug, decision->reason);
                if (!transition) {
                    return fail(conversation_id, "phase transition", transition.error(), std::move(result));
                }
            }

            auto handle = delegation_->begin(conversation_id, options_.orchestrator_slug,
                                             decision->agents, request_text(*snapshot), decision->reason);
            if (!handle) {
                if (handle.error().code == ErrorCode::OrchestratorNotRunning) {
                    result.error = handle.error();
                    result.outcome = LoopOutcome::Cancelled;
                    return result;
                }
                return fail(conversation_id, "delegation", handle.error(), std::move(result));
            }

            auto completions = wait(*handle);
            if (!completions) {
                if (completions.error().code == ErrorCode::DelegationTimeout) {
                    delegation_->cancel(handle->turn_id, "delegation timed out");
                    context_.log().warn("Conversation {} turn {} timed out; continuing with partial results",
                                        conversation_id, handle->turn_id);
                    continue;
                }
                result.error = completions.error();
                result.outcome = LoopOutcome::Cancelled;
                return result;
            }
            context_.log().info("Conversation {} turn {} complete with {} completion(s)",
                                conversation_id, handle->turn_id, completions->size());
        }

        record_audit(conversation_id, "cycle_limit",
                     "stopped after " + std::to_string(result.cycles) + " routing cycle(s)");
        result.outcome = LoopOutcome::CycleLimit;
        return result;
    }

private:
    Expected<RoutingDecision> decide_with_retry(const Conversation& conversation) {
        Expected<RoutingDecision> decision = router_->decide(conversation);
        for (int attempt = 2; !decision && attempt <= options_.routing_max_attempts; ++attempt) {
            context_.log().warn("Conversation {}: routing attempt {}/{} after: {}", conversation.id,
                                attempt, options_.routing_max_attempts, decision.error().to_string());
            decision = router_->decide(conversation);
        }
        return decision;
    }

    DelegationResult wait(DelegationHandle& handle) {
        if (options_.delegation_timeout.count() > 0) {
            return delegation_->wait_for(handle, options_.delegation_timeout);
        }
        return delegation_->wait(handle);
    }

    static std::string request_text(const Conversation& conversation) {
        auto latest = conversation.latest_user_message();
        if (latest) {
            return latest->content;
        }
        auto request = conversation.originating_request();
        return request ? request->content : conversation.title;
    }

    LoopResult fail(const std::string& conversation_id, const std::string& stage,
                    const Error& error, LoopResult result) {
        context_.log().error("Conversation {} {} failed ({}): {}", conversation_id, stage,
                             error_kind_to_string(error.kind()), error.to_string());

        auto closed = store_->close_turn(conversation_id, stage + " failure: " + error.message);
        if (!closed) {
            context_.log().error("Conversation {}: open turn not closed: {}",
                                 conversation_id, closed.error().to_string());
        }
        record_audit(conversation_id, "routing_failure", stage + ": " + error.to_string());

        result.error = error;
        result.outcome = LoopOutcome::Failed;
        return result;
    }

    void record_audit(const std::string& conversation_id, const std::string& kind, const std::string& detail) {
        auto audited = store_->add_audit(conversation_id, kind, detail);
        if (!audited) {
            context_.log().error("Conversation {}: audit entry '{}' not written: {}",
                                 conversation_id, kind, audited.error().to_string());
        }
    }

    RuntimeContext context_;
    std::shared_ptr<ConversationStore> store_;
    std::shared_ptr<RoutingEngine> router_;
    std::shared_ptr<DelegationService> delegation_;
    LoopOptions options_;
};

} // namespace engine
} // namespace maestro
