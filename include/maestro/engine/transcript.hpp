#pragma once

#include "../conversation.hpp"
#include "../types.hpp"

#include <string>
#include <vector>

namespace maestro {
namespace engine {

namespace detail {

inline std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out;
}

inline void append_turn(std::vector<Message>& lines, const RoutingEntry& turn, size_t number, bool current) {
    std::string header = "Turn " + std::to_string(number) + " [" + turn.phase + "] routed to: " +
                         join_names(turn.agents);
    if (current) {
        header += " (CURRENT)";
    }
    header += "\nReason: " + turn.reason;
    lines.push_back(Message::assistant(std::move(header)));

    for (const auto& completion : turn.completions) {
        std::string line = "[" + completion.agent + (completion.unsolicited ? " reported, unsolicited]\n" : " completed]\n");
        line += completion.content;
        lines.push_back(Message::user(std::move(line)));
    }

    if (current) {
        lines.push_back(Message::user("Waiting for agent responses: " + join_names(turn.pending_agents())));
    } else if (turn.closure == TurnClosure::Forced) {
        lines.push_back(Message::user("Turn closed before all agents reported: " + turn.close_reason));
    }
}

} // namespace detail

/**
 * @brief Role-tagged view of a conversation's routing history.
 *
 * Pure function of the conversation. Closed turns come first in the order
 * they were opened, then the open turn (if any), then the originating user
 * request and, when different, the latest user message. The orchestrator's
 * own routing lines are Assistant messages; agent reports and user input
 * are User messages.
 */
inline std::vector<Message> transcript(const Conversation& conversation) {
    std::vector<Message> lines;

    if (conversation.turns.empty() && !conversation.current_turn) {
        lines.push_back(Message::user("No agents have been routed yet."));
    }

    size_t number = 1;
    for (const auto& turn : conversation.turns) {
        detail::append_turn(lines, turn, number++, false);
    }
    if (conversation.current_turn) {
        detail::append_turn(lines, *conversation.current_turn, number, true);
    }

    auto request = conversation.originating_request();
    if (request) {
        lines.push_back(Message::user("ORIGINAL USER REQUEST:\n" + request->content));
    }
    auto latest = conversation.latest_user_message();
    if (latest && request && latest->event_id != request->event_id) {
        lines.push_back(Message::user("LATEST USER MESSAGE:\n" + latest->content));
    }
    return lines;
}

/**
 * @brief Narrative routing context sent to the completion service.
 *
 * Flattens transcript() into one text block headed by the current phase.
 */
inline std::string render_routing_context(const Conversation& conversation) {
    std::string text = "=== ORCHESTRATOR ROUTING CONTEXT ===\n";
    text += "Current phase: " + conversation.phase + "\n\n";
    text += "WORKFLOW HISTORY:\n";

    for (const auto& line : transcript(conversation)) {
        text += line.content;
        text += "\n\n";
    }

    if (!conversation.phase_transitions.empty()) {
        text += "PHASE TRANSITIONS:\n";
        for (const auto& transition : conversation.phase_transitions) {
            text += "- " + transition.from + " -> " + transition.to;
            if (!transition.reason.empty()) {
                text += ": " + transition.reason;
            }
            text += "\n";
        }
    }
    return text;
}

} // namespace engine
} // namespace maestro
