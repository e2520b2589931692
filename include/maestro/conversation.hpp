#pragma once

#include "types.hpp"

#include <algorithm>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace maestro {

// ============================================================================
// History
// ============================================================================

enum class HistoryRole {
    User,    ///< Message from a human participant
    Agent,   ///< Message from a registered agent
    System   ///< Message produced by the orchestrator process itself
};

[[nodiscard]] inline const char* history_role_to_string(HistoryRole role) {
    switch (role) {
        case HistoryRole::User: return "user";
        case HistoryRole::Agent: return "agent";
        case HistoryRole::System: return "system";
    }
    return "unknown";
}

inline HistoryRole history_role_from_string(const std::string& value) {
    if (value == "agent") return HistoryRole::Agent;
    if (value == "system") return HistoryRole::System;
    return HistoryRole::User;
}

/// One message in a conversation's history.
struct HistoryEntry {
    std::string event_id;
    std::string author;       ///< Agent slug for agents, pubkey for humans
    HistoryRole role = HistoryRole::User;
    std::string content;
    int kind = 1;
    Timestamp timestamp = 0;

    bool operator==(const HistoryEntry& other) const {
        return event_id == other.event_id && author == other.author && role == other.role &&
               content == other.content && kind == other.kind && timestamp == other.timestamp;
    }
    bool operator!=(const HistoryEntry& other) const { return !(*this == other); }
};

// ============================================================================
// Turns
// ============================================================================

/// One agent's report against a turn.
struct Completion {
    std::string agent;
    std::string content;
    Timestamp timestamp = 0;
    std::string event_id;
    bool unsolicited = false;   ///< Recorded on request from a non-target or after closure; never counts for coverage

    bool operator==(const Completion& other) const {
        return agent == other.agent && content == other.content && timestamp == other.timestamp &&
               event_id == other.event_id && unsolicited == other.unsolicited;
    }
    bool operator!=(const Completion& other) const { return !(*this == other); }
};

enum class TurnClosure {
    Open,
    Covered,   ///< Every target agent reported
    Forced     ///< Closed by a phase transition, cancellation or routing failure
};

[[nodiscard]] inline const char* turn_closure_to_string(TurnClosure closure) {
    switch (closure) {
        case TurnClosure::Open: return "open";
        case TurnClosure::Covered: return "covered";
        case TurnClosure::Forced: return "forced";
    }
    return "unknown";
}

inline TurnClosure turn_closure_from_string(const std::string& value) {
    if (value == "covered") return TurnClosure::Covered;
    if (value == "forced") return TurnClosure::Forced;
    return TurnClosure::Open;
}

/**
 * @brief One routing turn: the agents the orchestrator addressed and their reports.
 *
 * `is_completed` becomes true when every target agent has a completion, or
 * when the turn is force-closed (`closure == Forced`).
 */
struct RoutingEntry {
    std::string turn_id;
    Timestamp created_at = 0;
    std::string phase;
    std::vector<std::string> agents;
    std::vector<Completion> completions;
    std::string reason;
    bool is_completed = false;
    TurnClosure closure = TurnClosure::Open;
    Timestamp closed_at = 0;
    std::string close_reason;

    bool has_reported(const std::string& agent) const {
        return std::any_of(completions.begin(), completions.end(), [&](const Completion& c) {
            return !c.unsolicited && c.agent == agent;
        });
    }

    bool is_target(const std::string& agent) const {
        return std::find(agents.begin(), agents.end(), agent) != agents.end();
    }

    bool covers_all() const {
        return std::all_of(agents.begin(), agents.end(), [this](const std::string& agent) {
            return has_reported(agent);
        });
    }

    std::vector<std::string> pending_agents() const {
        std::vector<std::string> pending;
        for (const auto& agent : agents) {
            if (!has_reported(agent)) {
                pending.push_back(agent);
            }
        }
        return pending;
    }

    /// Counted completions (target agents only), in arrival order.
    std::vector<Completion> solicited_completions() const {
        std::vector<Completion> result;
        for (const auto& completion : completions) {
            if (!completion.unsolicited) {
                result.push_back(completion);
            }
        }
        return result;
    }

    bool operator==(const RoutingEntry& other) const {
        return turn_id == other.turn_id && created_at == other.created_at && phase == other.phase &&
               agents == other.agents && completions == other.completions && reason == other.reason &&
               is_completed == other.is_completed && closure == other.closure &&
               closed_at == other.closed_at && close_reason == other.close_reason;
    }
    bool operator!=(const RoutingEntry& other) const { return !(*this == other); }
};

// ============================================================================
// Audit
// ============================================================================

struct PhaseTransition {
    std::string from;
    std::string to;
    Timestamp timestamp = 0;
    std::string initiating_agent;
    std::string reason;
    std::string instructions;

    bool operator==(const PhaseTransition& other) const {
        return from == other.from && to == other.to && timestamp == other.timestamp &&
               initiating_agent == other.initiating_agent && reason == other.reason &&
               instructions == other.instructions;
    }
    bool operator!=(const PhaseTransition& other) const { return !(*this == other); }
};

struct AuditEntry {
    Timestamp timestamp = 0;
    std::string kind;     ///< routing_failure, turn_forced, delegation_cancelled, workflow_complete, ...
    std::string detail;

    bool operator==(const AuditEntry& other) const {
        return timestamp == other.timestamp && kind == other.kind && detail == other.detail;
    }
    bool operator!=(const AuditEntry& other) const { return !(*this == other); }
};

struct AgentState {
    size_t last_processed_message_index = 0;
    std::optional<std::string> session_id;
    std::optional<std::string> last_status;
    Timestamp last_seen = 0;

    bool operator==(const AgentState& other) const {
        return last_processed_message_index == other.last_processed_message_index &&
               session_id == other.session_id && last_status == other.last_status &&
               last_seen == other.last_seen;
    }
    bool operator!=(const AgentState& other) const { return !(*this == other); }
};

/// Wall-clock time during which the conversation had an open turn.
struct ExecutionTime {
    int64_t total_seconds = 0;
    bool is_active = false;
    Timestamp last_updated = 0;

    bool operator==(const ExecutionTime& other) const {
        return total_seconds == other.total_seconds && is_active == other.is_active &&
               last_updated == other.last_updated;
    }
    bool operator!=(const ExecutionTime& other) const { return !(*this == other); }
};

// ============================================================================
// Conversation
// ============================================================================

/// How record_completion() treats a completion that does not fit the open turn.
enum class CompletionPolicy {
    Reject,        ///< Return OrphanedCompletion and record nothing
    RecordAnyway   ///< Keep it as an unsolicited completion; never reopens or closes a turn
};

/// Result of recording a completion.
struct CompletionOutcome {
    bool turn_closed = false;               ///< This completion gave full coverage
    bool unsolicited = false;               ///< Kept under CompletionPolicy::RecordAnyway
    std::optional<RoutingEntry> closed_turn; ///< The finalized turn when turn_closed
};

/**
 * @brief Durable state of one user-initiated workflow.
 *
 * Value type. Turn operations validate before mutating: a failed call
 * leaves the conversation unchanged. At most one turn is open at a time
 * (`current_turn`); every entry in `turns` is closed.
 */
struct Conversation {
    std::string id;
    std::string title;
    std::string phase = "CHAT";
    Timestamp created_at = 0;
    Timestamp phase_started_at = 0;
    std::vector<HistoryEntry> history;
    std::optional<RoutingEntry> current_turn;
    std::vector<RoutingEntry> turns;
    std::vector<PhaseTransition> phase_transitions;
    std::map<std::string, AgentState> agent_states;
    ExecutionTime execution_time;
    std::vector<AuditEntry> audit;
    nlohmann::json metadata = nlohmann::json::object();

    bool has_open_turn() const {
        return current_turn.has_value();
    }

    const RoutingEntry* find_turn(const std::string& turn_id) const {
        if (current_turn && current_turn->turn_id == turn_id) {
            return &*current_turn;
        }
        for (const auto& turn : turns) {
            if (turn.turn_id == turn_id) {
                return &turn;
            }
        }
        return nullptr;
    }

    /**
     * @brief Open a new turn targeting `agents`.
     *
     * Duplicate agent names are collapsed. Fails with TurnAlreadyOpen while
     * another turn is open.
     */
    Expected<RoutingEntry> open_turn(std::string turn_id,
                                     std::vector<std::string> agents,
                                     std::string reason,
                                     Timestamp now) {
        if (current_turn.has_value()) {
            return tl::unexpected(Error{
                ErrorCode::TurnAlreadyOpen,
                "Conversation already has an open turn",
                current_turn->turn_id
            });
        }
        if (agents.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidTurn, "A turn needs at least one target agent"});
        }
        if (turn_id.empty() || find_turn(turn_id) != nullptr) {
            return tl::unexpected(Error{ErrorCode::InvalidTurn, "Turn id is empty or already used", turn_id});
        }

        std::vector<std::string> unique_agents;
        std::set<std::string> seen;
        for (auto& agent : agents) {
            if (seen.insert(agent).second) {
                unique_agents.push_back(std::move(agent));
            }
        }

        RoutingEntry entry;
        entry.turn_id = std::move(turn_id);
        entry.created_at = now;
        entry.phase = phase;
        entry.agents = std::move(unique_agents);
        entry.reason = std::move(reason);
        current_turn = entry;

        if (!execution_time.is_active) {
            execution_time.is_active = true;
            execution_time.last_updated = now;
        }
        return entry;
    }

    /**
     * @brief Record an agent's completion against `turn_id`.
     *
     * A completion for the open turn from one of its targets is counted;
     * when it gives full coverage the turn is closed and moved to `turns`.
     * Anything else (closed or unknown turn, non-target agent) is an
     * orphaned completion: rejected, or kept as unsolicited under
     * CompletionPolicy::RecordAnyway. Closed turns are never reopened.
     */
    Expected<CompletionOutcome> record_completion(const std::string& turn_id,
                                                  Completion completion,
                                                  CompletionPolicy policy,
                                                  Timestamp now) {
        const bool fits_open_turn = current_turn && current_turn->turn_id == turn_id &&
                                    current_turn->is_target(completion.agent);

        if (!fits_open_turn) {
            auto orphan = Error{
                ErrorCode::OrphanedCompletion,
                "Completion from '" + completion.agent + "' does not match an open turn target",
                turn_id
            };
            if (policy == CompletionPolicy::Reject) {
                return tl::unexpected(std::move(orphan));
            }

            RoutingEntry* turn = nullptr;
            if (current_turn && current_turn->turn_id == turn_id) {
                turn = &*current_turn;
            } else {
                for (auto& closed : turns) {
                    if (closed.turn_id == turn_id) {
                        turn = &closed;
                        break;
                    }
                }
            }
            if (turn == nullptr) {
                return tl::unexpected(std::move(orphan));
            }

            completion.unsolicited = true;
            turn->completions.push_back(std::move(completion));
            CompletionOutcome outcome;
            outcome.unsolicited = true;
            return outcome;
        }

        current_turn->completions.push_back(std::move(completion));

        CompletionOutcome outcome;
        if (current_turn->covers_all()) {
            outcome.turn_closed = true;
            outcome.closed_turn = finalize_turn(TurnClosure::Covered, "all agents reported", now);
        }
        return outcome;
    }

    /**
     * @brief Close the open turn regardless of coverage.
     *
     * @return The closed turn, or nullopt when no turn was open
     */
    std::optional<RoutingEntry> force_close_turn(const std::string& reason, Timestamp now) {
        if (!current_turn) {
            return std::nullopt;
        }
        return finalize_turn(TurnClosure::Forced, reason, now);
    }

    void add_audit(std::string kind, std::string detail, Timestamp now) {
        audit.push_back(AuditEntry{now, std::move(kind), std::move(detail)});
    }

    /// First message authored by a human participant.
    std::optional<HistoryEntry> originating_request() const {
        for (const auto& entry : history) {
            if (entry.role == HistoryRole::User) {
                return entry;
            }
        }
        return std::nullopt;
    }

    std::optional<HistoryEntry> latest_user_message() const {
        for (auto it = history.rbegin(); it != history.rend(); ++it) {
            if (it->role == HistoryRole::User) {
                return *it;
            }
        }
        return std::nullopt;
    }

    bool contains_event(const std::string& event_id) const {
        return std::any_of(history.begin(), history.end(), [&](const HistoryEntry& entry) {
            return entry.event_id == event_id;
        });
    }

private:
    RoutingEntry finalize_turn(TurnClosure closure, const std::string& reason, Timestamp now) {
        RoutingEntry entry = std::move(*current_turn);
        current_turn.reset();

        entry.is_completed = true;
        entry.closure = closure;
        entry.closed_at = now;
        entry.close_reason = reason;
        turns.push_back(entry);

        if (execution_time.is_active) {
            execution_time.total_seconds += std::max<int64_t>(0, now - execution_time.last_updated);
            execution_time.is_active = false;
            execution_time.last_updated = now;
        }
        return entry;
    }
};

// ============================================================================
// JSON serialization
// ============================================================================

inline void to_json(nlohmann::json& j, const HistoryEntry& entry) {
    j = nlohmann::json{
        {"event_id", entry.event_id},
        {"author", entry.author},
        {"role", history_role_to_string(entry.role)},
        {"content", entry.content},
        {"kind", entry.kind},
        {"timestamp", entry.timestamp}
    };
}

inline void from_json(const nlohmann::json& j, HistoryEntry& entry) {
    j.at("event_id").get_to(entry.event_id);
    j.at("author").get_to(entry.author);
    entry.role = history_role_from_string(j.at("role").get<std::string>());
    j.at("content").get_to(entry.content);
    entry.kind = j.value("kind", 1);
    j.at("timestamp").get_to(entry.timestamp);
}

inline void to_json(nlohmann::json& j, const Completion& completion) {
    j = nlohmann::json{
        {"agent", completion.agent},
        {"content", completion.content},
        {"timestamp", completion.timestamp},
        {"event_id", completion.event_id},
        {"unsolicited", completion.unsolicited}
    };
}

inline void from_json(const nlohmann::json& j, Completion& completion) {
    j.at("agent").get_to(completion.agent);
    j.at("content").get_to(completion.content);
    j.at("timestamp").get_to(completion.timestamp);
    completion.event_id = j.value("event_id", std::string{});
    completion.unsolicited = j.value("unsolicited", false);
}

inline void to_json(nlohmann::json& j, const RoutingEntry& entry) {
    j = nlohmann::json{
        {"turn_id", entry.turn_id},
        {"created_at", entry.created_at},
        {"phase", entry.phase},
        {"agents", entry.agents},
        {"completions", entry.completions},
        {"reason", entry.reason},
        {"is_completed", entry.is_completed},
        {"closure", turn_closure_to_string(entry.closure)},
        {"closed_at", entry.closed_at},
        {"close_reason", entry.close_reason}
    };
}

inline void from_json(const nlohmann::json& j, RoutingEntry& entry) {
    j.at("turn_id").get_to(entry.turn_id);
    j.at("created_at").get_to(entry.created_at);
    j.at("phase").get_to(entry.phase);
    j.at("agents").get_to(entry.agents);
    j.at("completions").get_to(entry.completions);
    j.at("reason").get_to(entry.reason);
    j.at("is_completed").get_to(entry.is_completed);
    entry.closure = turn_closure_from_string(j.value("closure", std::string{"open"}));
    entry.closed_at = j.value("closed_at", Timestamp{0});
    entry.close_reason = j.value("close_reason", std::string{});
}

inline void to_json(nlohmann::json& j, const PhaseTransition& transition) {
    j = nlohmann::json{
        {"from", transition.from},
        {"to", transition.to},
        {"timestamp", transition.timestamp},
        {"initiating_agent", transition.initiating_agent},
        {"reason", transition.reason},
        {"instructions", transition.instructions}
    };
}

inline void from_json(const nlohmann::json& j, PhaseTransition& transition) {
    j.at("from").get_to(transition.from);
    j.at("to").get_to(transition.to);
    j.at("timestamp").get_to(transition.timestamp);
    j.at("initiating_agent").get_to(transition.initiating_agent);
    j.at("reason").get_to(transition.reason);
    transition.instructions = j.value("instructions", std::string{});
}

inline void to_json(nlohmann::json& j, const AuditEntry& entry) {
    j = nlohmann::json{{"timestamp", entry.timestamp}, {"kind", entry.kind}, {"detail", entry.detail}};
}

inline void from_json(const nlohmann::json& j, AuditEntry& entry) {
    j.at("timestamp").get_to(entry.timestamp);
    j.at("kind").get_to(entry.kind);
    j.at("detail").get_to(entry.detail);
}

inline void to_json(nlohmann::json& j, const AgentState& state) {
    j = nlohmann::json{
        {"last_processed_message_index", state.last_processed_message_index},
        {"last_seen", state.last_seen}
    };
    if (state.session_id) j["session_id"] = *state.session_id;
    if (state.last_status) j["last_status"] = *state.last_status;
}

inline void from_json(const nlohmann::json& j, AgentState& state) {
    state.last_processed_message_index = j.value("last_processed_message_index", size_t{0});
    state.last_seen = j.value("last_seen", Timestamp{0});
    if (j.contains("session_id")) state.session_id = j.at("session_id").get<std::string>();
    if (j.contains("last_status")) state.last_status = j.at("last_status").get<std::string>();
}

inline void to_json(nlohmann::json& j, const ExecutionTime& time) {
    j = nlohmann::json{
        {"total_seconds", time.total_seconds},
        {"is_active", time.is_active},
        {"last_updated", time.last_updated}
    };
}

inline void from_json(const nlohmann::json& j, ExecutionTime& time) {
    time.total_seconds = j.value("total_seconds", int64_t{0});
    time.is_active = j.value("is_active", false);
    time.last_updated = j.value("last_updated", Timestamp{0});
}

inline void to_json(nlohmann::json& j, const Conversation& conversation) {
    j = nlohmann::json{
        {"id", conversation.id},
        {"title", conversation.title},
        {"phase", conversation.phase},
        {"created_at", conversation.created_at},
        {"phase_started_at", conversation.phase_started_at},
        {"history", conversation.history},
        {"turns", conversation.turns},
        {"phase_transitions", conversation.phase_transitions},
        {"agent_states", conversation.agent_states},
        {"execution_time", conversation.execution_time},
        {"audit", conversation.audit},
        {"metadata", conversation.metadata}
    };
    j["current_turn"] = conversation.current_turn ? nlohmann::json(*conversation.current_turn) : nlohmann::json();
}

inline void from_json(const nlohmann::json& j, Conversation& conversation) {
    j.at("id").get_to(conversation.id);
    j.at("title").get_to(conversation.title);
    j.at("phase").get_to(conversation.phase);
    conversation.created_at = j.value("created_at", Timestamp{0});
    conversation.phase_started_at = j.value("phase_started_at", Timestamp{0});
    j.at("history").get_to(conversation.history);
    j.at("turns").get_to(conversation.turns);
    j.at("phase_transitions").get_to(conversation.phase_transitions);
    if (j.contains("agent_states")) {
        j.at("agent_states").get_to(conversation.agent_states);
    }
    if (j.contains("execution_time")) {
        j.at("execution_time").get_to(conversation.execution_time);
    }
    if (j.contains("audit")) {
        j.at("audit").get_to(conversation.audit);
    }
    conversation.metadata = j.value("metadata", nlohmann::json::object());
    if (j.contains("current_turn") && !j.at("current_turn").is_null()) {
        conversation.current_turn = j.at("current_turn").get<RoutingEntry>();
    } else {
        conversation.current_turn.reset();
    }
}

} // namespace maestro
