#pragma once

#include "../conversation.hpp"
#include "../phase.hpp"

#include <memory>
#include <string>

namespace maestro {
namespace engine {

/**
 * @brief Applies phase changes to a conversation.
 *
 * A transition is validated against the PhaseCatalog before anything is
 * touched. A valid transition force-closes the open turn, appends a
 * PhaseTransition record and sets the new phase, all in one step.
 *
 * Operates on a Conversation value; the ConversationStore calls it under
 * the conversation's lock and persists the result.
 */
class PhaseStateMachine {
public:
    explicit PhaseStateMachine(std::shared_ptr<const PhaseCatalog> catalog)
        : catalog_(std::move(catalog))
    {}

    /**
     * @brief Move `conversation` to `target`.
     *
     * @param instructions Required for custom phases; empty means the
     *        catalog's default instructions
     * @return The appended PhaseTransition, or ValidationError with the
     *         conversation unchanged
     */
    Expected<PhaseTransition> transition(Conversation& conversation,
                                         const std::string& target,
                                         const std::string& instructions,
                                         const std::string& initiating_agent,
                                         const std::string& reason,
                                         Timestamp now) const {
        auto rule = catalog_->rule(target);
        if (!rule) {
            return tl::unexpected(Error{ErrorCode::UnknownPhase, "Unknown phase", target});
        }
        if (!catalog_->can_transition(conversation.phase, target)) {
            return tl::unexpected(Error{
                ErrorCode::InvalidPhaseTransition,
                "Transition not allowed",
                conversation.phase + " -> " + target
            });
        }

        PhaseTransition record;
        record.from = conversation.phase;
        record.to = target;
        record.timestamp = now;
        record.initiating_agent = initiating_agent;
        record.reason = reason;
        record.instructions = instructions.empty() ? rule->instructions : instructions;

        close_turn(conversation, "phase transition to " + target, now);

        conversation.phase_transitions.push_back(record);
        if (record.from != record.to) {
            conversation.phase = target;
            conversation.phase_started_at = now;
        }
        return record;
    }

    /**
     * @brief Force-close the open turn, if any, and note it in the audit log.
     */
    std::optional<RoutingEntry> close_turn(Conversation& conversation,
                                           const std::string& reason,
                                           Timestamp now) const {
        auto closed = conversation.force_close_turn(reason, now);
        if (closed) {
            conversation.add_audit("turn_forced", closed->turn_id + ": " + reason, now);
        }
        return closed;
    }

    const PhaseCatalog& catalog() const {
        return *catalog_;
    }

private:
    std::shared_ptr<const PhaseCatalog> catalog_;
};

} // namespace engine
} // namespace maestro
