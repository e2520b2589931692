#pragma once

#include "../context.hpp"
#include "../conversation.hpp"
#include "conversation_database.hpp"
#include "phase_state_machine.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace maestro {
namespace engine {

/**
 * @brief Single owner of conversation state.
 *
 * All mutation goes through this API. Each conversation has its own lock,
 * so operations on one conversation are serialized while different
 * conversations proceed in parallel. Every mutation is applied to a copy,
 * written to the repository, and only then made visible: a failed
 * validation or a failed write leaves the stored conversation unchanged.
 *
 * Readers get snapshots (copies), never references into live state.
 */
class ConversationStore {
public:
    /// Invoked after a mutation closed a turn (covered or forced), outside any lock.
    using TurnClosedListener = std::function<void(const std::string& conversation_id, const RoutingEntry& turn)>;

    ConversationStore(RuntimeContext context, std::shared_ptr<IConversationRepository> repository)
        : context_(std::move(context.with_defaults()))
        , repository_(std::move(repository))
        , phase_machine_(context_.phases)
    {}

    ConversationStore(const ConversationStore&) = delete;
    ConversationStore& operator=(const ConversationStore&) = delete;

    /**
     * @brief Replace in-memory state with the repository's records.
     *
     * @return Number of conversations loaded
     */
    Expected<size_t> load() {
        auto records = repository_->load_all();
        if (!records) {
            return tl::unexpected(records.error());
        }

        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        entries_.clear();
        for (auto& conversation : *records) {
            auto entry = std::make_shared<Entry>();
            const std::string id = conversation.id;
            entry->conversation = std::move(conversation);
            entries_[id] = std::move(entry);
        }
        context_.log().info("Loaded {} conversation(s)", entries_.size());
        return entries_.size();
    }

    void add_turn_closed_listener(TurnClosedListener listener) {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listeners_.push_back(std::move(listener));
    }

    /**
     * @brief Create a conversation from its root message.
     *
     * The conversation starts in CHAT with the message as its first
     * history entry.
     */
    Expected<Conversation> create(const std::string& id, const std::string& title, HistoryEntry first_message) {
        if (id.empty()) {
            return tl::unexpected(Error{ErrorCode::UnknownConversation, "Conversation id cannot be empty"});
        }

        const Timestamp now = context_.now();
        Conversation conversation;
        conversation.id = id;
        conversation.title = title;
        conversation.phase = phases::kChat;
        conversation.created_at = now;
        conversation.phase_started_at = now;
        conversation.history.push_back(std::move(first_message));

        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        if (entries_.count(id) > 0) {
            return tl::unexpected(Error{ErrorCode::DuplicateConversation, "Conversation already exists", id});
        }
        auto saved = repository_->save(conversation);
        if (!saved) {
            return tl::unexpected(persistence_error(saved.error()));
        }
        auto entry = std::make_shared<Entry>();
        entry->conversation = conversation;
        entries_[id] = std::move(entry);

        context_.log().info("Conversation {} created: {}", id, title);
        return conversation;
    }

    bool contains(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        return entries_.count(id) > 0;
    }

    /// Snapshot of one conversation.
    Expected<Conversation> get(const std::string& id) const {
        auto entry = find_entry(id);
        if (!entry) {
            return tl::unexpected(Error{ErrorCode::UnknownConversation, "Unknown conversation", id});
        }
        std::lock_guard<std::mutex> lock(entry->mutex);
        return entry->conversation;
    }

    std::vector<std::string> ids() const {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            result.push_back(id);
        }
        return result;
    }

    /// Append a message; a message whose event id is already present is ignored.
    Expected<void> append_message(const std::string& id, HistoryEntry message) {
        return mutate<void>(id, [&](Conversation& conversation) -> Expected<void> {
            if (!message.event_id.empty() && conversation.contains_event(message.event_id)) {
                return {};
            }
            conversation.history.push_back(std::move(message));
            return {};
        });
    }

    /// Open a turn. ConcurrencyConflict (TurnAlreadyOpen) if one is open.
    Expected<RoutingEntry> open_turn(const std::string& id,
                                     const std::string& turn_id,
                                     std::vector<std::string> agents,
                                     const std::string& reason) {
        auto result = mutate<RoutingEntry>(id, [&](Conversation& conversation) {
            return conversation.open_turn(turn_id, std::move(agents), reason, context_.now());
        });
        if (result) {
            context_.log().info("Conversation {} turn {} opened in {} for [{}]",
                                id, turn_id, result->phase, join(result->agents));
        }
        return result;
    }

    Expected<CompletionOutcome> record_completion(const std::string& id,
                                                  const std::string& turn_id,
                                                  Completion completion,
                                                  CompletionPolicy policy = CompletionPolicy::Reject) {
        return mutate<CompletionOutcome>(id, [&](Conversation& conversation) {
            return conversation.record_completion(turn_id, std::move(completion), policy, context_.now());
        });
    }

    /**
     * @brief Force-close the open turn through the phase state machine's close step.
     *
     * With `turn_id` set, only that turn is closed; a different open turn is left alone.
     *
     * @return The closed turn, or nullopt when nothing was closed
     */
    Expected<std::optional<RoutingEntry>> close_turn(const std::string& id,
                                                     const std::string& reason,
                                                     const std::optional<std::string>& turn_id = std::nullopt) {
        return mutate<std::optional<RoutingEntry>>(id, [&](Conversation& conversation)
                -> Expected<std::optional<RoutingEntry>> {
            if (turn_id && (!conversation.current_turn || conversation.current_turn->turn_id != *turn_id)) {
                return std::optional<RoutingEntry>();
            }
            return phase_machine_.close_turn(conversation, reason, context_.now());
        });
    }

    Expected<PhaseTransition> transition_phase(const std::string& id,
                                               const std::string& target,
                                               const std::string& instructions,
                                               const std::string& initiating_agent,
                                               const std::string& reason) {
        auto result = mutate<PhaseTransition>(id, [&](Conversation& conversation) {
            return phase_machine_.transition(conversation, target, instructions,
                                             initiating_agent, reason, context_.now());
        });
        if (result) {
            context_.log().info("Conversation {} phase {} -> {} ({})", id, result->from, result->to, reason);
        } else {
            context_.log().warn("Conversation {} phase transition rejected: {}", id, result.error().to_string());
        }
        return result;
    }

    Expected<void> update_agent_state(const std::string& id,
                                      const std::string& agent,
                                      const std::function<void(AgentState&)>& update) {
        return mutate<void>(id, [&](Conversation& conversation) -> Expected<void> {
            update(conversation.agent_states[agent]);
            return {};
        });
    }

    Expected<void> set_metadata(const std::string& id, const std::string& key, nlohmann::json value) {
        return mutate<void>(id, [&](Conversation& conversation) -> Expected<void> {
            conversation.metadata[key] = std::move(value);
            return {};
        });
    }

    Expected<void> add_audit(const std::string& id, const std::string& kind, const std::string& detail) {
        return mutate<void>(id, [&](Conversation& conversation) -> Expected<void> {
            conversation.add_audit(kind, detail, context_.now());
            return {};
        });
    }

    const PhaseStateMachine& phase_machine() const {
        return phase_machine_;
    }

private:
    struct Entry {
        std::mutex mutex;
        Conversation conversation;
    };

    std::shared_ptr<Entry> find_entry(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        auto it = entries_.find(id);
        return it == entries_.end() ? nullptr : it->second;
    }

    template<typename T, typename Fn>
    Expected<T> mutate(const std::string& id, Fn&& fn) {
        auto entry = find_entry(id);
        if (!entry) {
            return tl::unexpected(Error{ErrorCode::UnknownConversation, "Unknown conversation", id});
        }

        std::optional<RoutingEntry> closed_turn;
        Expected<T> result = tl::unexpected(Error{ErrorCode::Unknown, "Mutation did not run"});
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            Conversation working = entry->conversation;
            result = fn(working);
            if (!result) {
                return result;
            }

            auto saved = repository_->save(working);
            if (!saved) {
                context_.log().error("Conversation {} not persisted: {}", id, saved.error().to_string());
                return tl::unexpected(persistence_error(saved.error()));
            }

            const auto& before = entry->conversation.current_turn;
            if (before && (!working.current_turn || working.current_turn->turn_id != before->turn_id)) {
                if (const auto* turn = working.find_turn(before->turn_id)) {
                    closed_turn = *turn;
                }
            }
            entry->conversation = std::move(working);
        }

        if (closed_turn) {
            context_.log().info("Conversation {} turn {} closed ({}: {})", id, closed_turn->turn_id,
                                turn_closure_to_string(closed_turn->closure), closed_turn->close_reason);
            notify_turn_closed(id, *closed_turn);
        }
        return result;
    }

    void notify_turn_closed(const std::string& id, const RoutingEntry& turn) {
        std::vector<TurnClosedListener> listeners;
        {
            std::lock_guard<std::mutex> lock(listener_mutex_);
            listeners = listeners_;
        }
        for (const auto& listener : listeners) {
            listener(id, turn);
        }
    }

    static Error persistence_error(const Error& cause) {
        return Error{ErrorCode::PersistenceFailed, "Conversation store write failed: " + cause.message, cause.context};
    }

    static std::string join(const std::vector<std::string>& values) {
        std::string out;
        for (const auto& value : values) {
            if (!out.empty()) out += ", ";
            out += value;
        }
        return out;
    }

    RuntimeContext context_;
    std::shared_ptr<IConversationRepository> repository_;
    PhaseStateMachine phase_machine_;
    mutable std::shared_mutex map_mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
    std::mutex listener_mutex_;
    std::vector<TurnClosedListener> listeners_;
};

} // namespace engine
} // namespace maestro
