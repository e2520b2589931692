#pragma once

#include "context.hpp"
#include "engine/conversation_database.hpp"
#include "engine/conversation_store.hpp"
#include "engine/delegation_service.hpp"
#include "engine/orchestration_loop.hpp"
#include "engine/routing_engine.hpp"
#include "engine/routing_queue.hpp"
#include "ingestion/ingestion_layer.hpp"
#include "ingestion/processed_event_ledger.hpp"
#include "network/agent_publisher.hpp"
#include "types.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace maestro {

/**
 * @brief Orchestration service for one project.
 *
 * Wires the conversation store, phase state machine, routing engine,
 * delegation service and ingestion layer together and runs routing on a
 * pool of worker threads.
 *
 * Inbound user messages create or extend conversations and queue a routing
 * run. Routing for one conversation is never run twice at once: a request
 * for a conversation that is already being routed marks it for one more
 * run after the current one ends.
 *
 * Usage:
 * @code
 * auto orchestrator = maestro::Orchestrator::create(config, context);
 * if (!orchestrator) { handle error }
 * (*orchestrator)->start();
 * ...
 * (*orchestrator)->stop();
 * @endcode
 */
class Orchestrator {
public:
    /**
     * @brief Create an orchestrator persisting under `config.data_dir`.
     *
     * `context` must carry an event network, a completion service and an
     * agent registry containing the orchestrator agent with a signer.
     */
    static Expected<std::unique_ptr<Orchestrator>> create(const Config& config, RuntimeContext context) {
        auto validation = config.validate();
        if (!validation) {
            return tl::unexpected(validation.error());
        }

        std::error_code ec;
        std::filesystem::create_directories(config.data_dir, ec);
        if (ec) {
            return tl::unexpected(Error{ErrorCode::InvalidDataPath, "Cannot create data directory: " + ec.message(),
                                        config.data_dir});
        }

        auto database = engine::ConversationDatabase::open(config.conversations_path());
        if (!database) {
            return tl::unexpected(database.error());
        }
        auto ledger = ingestion::ProcessedEventLedger::open(config.ledger_path());
        if (!ledger) {
            return tl::unexpected(ledger.error());
        }
        return create(config, std::move(context), *database, *ledger);
    }

    /// Create with explicit persistence back ends.
    static Expected<std::unique_ptr<Orchestrator>> create(const Config& config,
                                                          RuntimeContext context,
                                                          std::shared_ptr<engine::IConversationRepository> repository,
                                                          std::shared_ptr<ingestion::IEventLedger> ledger) {
        auto validation = config.validate();
        if (!validation) {
            return tl::unexpected(validation.error());
        }
        context.with_defaults();
        auto context_validation = context.validate();
        if (!context_validation) {
            return tl::unexpected(context_validation.error());
        }

        auto orchestrator_agent = context.agents->find(config.orchestrator_slug);
        if (!orchestrator_agent || !orchestrator_agent->is_orchestrator()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig, "Orchestrator agent is not registered", config.orchestrator_slug});
        }
        if (!context.agents->signer_for(config.orchestrator_slug)) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig, "Orchestrator agent has no signer", config.orchestrator_slug});
        }

        return std::unique_ptr<Orchestrator>(new Orchestrator(
            config, std::move(context), *orchestrator_agent, std::move(repository), std::move(ledger)));
    }

    ~Orchestrator() {
        stop();
    }

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Load stored conversations, subscribe and start the routing workers.
     *
     * An orchestrator cannot be restarted once stopped.
     */
    Expected<void> start() {
        if (running_.load(std::memory_order_acquire)) {
            return {};
        }
        if (queue_->is_shutdown()) {
            return tl::unexpected(Error{ErrorCode::OrchestratorNotRunning, "Orchestrator was already stopped"});
        }

        auto loaded = store_->load();
        if (!loaded) {
            return tl::unexpected(loaded.error());
        }

        running_.store(true, std::memory_order_release);
        for (int i = 0; i < config_.worker_threads; ++i) {
            workers_.emplace_back([this]() { worker_loop(); });
        }

        auto started = ingestion_->start(subscription_filters());
        if (!started) {
            stop();
            return tl::unexpected(started.error());
        }
        context_.log().info("Orchestrator {} started with {} worker(s)",
                            orchestrator_.slug, config_.worker_threads);
        resume_open_turns();
        return {};
    }

    /**
     * @brief Stop ingestion (flushing the ledger), cancel waits and join workers.
     */
    void stop() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }

        auto stopped = ingestion_->stop();
        if (!stopped) {
            context_.log().critical("Ledger not flushed on shutdown: {}", stopped.error().to_string());
        }

        queue_->shutdown();
        shutdown_flag_->store(true, std::memory_order_release);
        delegation_->shutdown("Orchestrator stopping");

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
        context_.log().info("Orchestrator {} stopped", orchestrator_.slug);
    }

    bool is_running() const {
        return running_.load(std::memory_order_acquire);
    }

    /**
     * @brief Queue a routing run for a conversation.
     */
    Expected<void> request_routing(const std::string& conversation_id) {
        if (!running_.load(std::memory_order_acquire)) {
            return tl::unexpected(Error{ErrorCode::OrchestratorNotRunning, "Orchestrator is not running"});
        }
        if (!queue_->push(engine::RoutingRequest{conversation_id})) {
            return tl::unexpected(Error{ErrorCode::QueueFull, "Routing queue is full", conversation_id});
        }
        return {};
    }

    /// Filters the ingestion layer subscribes with.
    std::vector<network::Filter> subscription_filters() const {
        network::Filter addressed;
        addressed.kinds = {network::kinds::kTextNote, network::kinds::kGenericReply};
        addressed.tags[network::tags::kRecipient] = {orchestrator_.pubkey};

        network::Filter from_agents;
        from_agents.kinds = {network::kinds::kGenericReply, network::kinds::kAgentLesson};
        for (const auto& pubkey : context_.agents->pubkeys()) {
            if (pubkey != orchestrator_.pubkey) {
                from_agents.authors.push_back(pubkey);
            }
        }

        std::vector<network::Filter> filters{addressed};
        if (!from_agents.authors.empty()) {
            filters.push_back(from_agents);
        }
        return filters;
    }

    // ========================================================================
    // Operator surface
    // ========================================================================

    Expected<Conversation> conversation(const std::string& id) const {
        return store_->get(id);
    }

    std::vector<std::string> conversation_ids() const {
        return store_->ids();
    }

    /// Free-text question about a conversation's routing, answered by the completion service.
    Expected<std::string> explain(const std::string& conversation_id, const std::string& question) const {
        auto snapshot = store_->get(conversation_id);
        if (!snapshot) {
            return tl::unexpected(snapshot.error());
        }
        return router_->explain(*snapshot, question);
    }

    /// Manual phase change. Force-closes the open turn, which cancels its wait.
    Expected<PhaseTransition> change_phase(const std::string& conversation_id,
                                           const std::string& phase,
                                           const std::string& instructions,
                                           const std::string& reason) {
        return store_->transition_phase(conversation_id, phase, instructions, "operator", reason);
    }

    /// Cancel the wait on a turn and force-close it.
    bool cancel_turn(const std::string& turn_id) {
        return delegation_->cancel(turn_id, "cancelled by operator");
    }

    ingestion::IngestionStats ingestion_stats() const {
        return ingestion_->stats();
    }

    void set_alert_callback(ingestion::IngestionLayer::AlertCallback callback) {
        ingestion_->set_alert_callback(std::move(callback));
    }

    engine::ConversationStore& store() {
        return *store_;
    }

    engine::DelegationService& delegation() {
        return *delegation_;
    }

    ingestion::IngestionLayer& ingestion() {
        return *ingestion_;
    }

    const AgentDefinition& orchestrator_agent() const {
        return orchestrator_;
    }

private:
    Orchestrator(const Config& config,
                 RuntimeContext context,
                 AgentDefinition orchestrator,
                 std::shared_ptr<engine::IConversationRepository> repository,
                 std::shared_ptr<ingestion::IEventLedger> ledger)
        : config_(config)
        , context_(std::move(context))
        , orchestrator_(std::move(orchestrator))
        , store_(std::make_shared<engine::ConversationStore>(context_, std::move(repository)))
        , publisher_(std::make_shared<network::AgentPublisher>(
              context_, config.publish_max_attempts, config.publish_retry_delay))
        , router_(std::make_shared<engine::RoutingEngine>(context_, config.model))
        , delegation_(std::make_shared<engine::DelegationService>(context_, store_, publisher_))
        , loop_(std::make_shared<engine::OrchestrationLoop>(
              context_, store_, router_, delegation_,
              engine::LoopOptions{config.orchestrator_slug, config.routing_max_attempts,
                                  config.max_routing_cycles, config.delegation_timeout}))
        , ingestion_(std::make_unique<ingestion::IngestionLayer>(
              context_, std::move(ledger),
              ingestion::IngestionLayer::Options{config.ledger_flush_interval, config.verify_signatures}))
        , queue_(std::make_shared<engine::RoutingQueue>(config.routing_queue_capacity))
        , shutdown_flag_(std::make_shared<std::atomic<bool>>(false))
    {
        ingestion_->on(ingestion::EventClass::Message, [this](const network::Event& e) { handle_message(e); });
        ingestion_->on(ingestion::EventClass::Completion, [this](const network::Event& e) { handle_completion(e); });
        ingestion_->on(ingestion::EventClass::Status, [this](const network::Event& e) { handle_status(e); });
        ingestion_->on(ingestion::EventClass::Auxiliary, [this](const network::Event& e) { handle_auxiliary(e); });

        // A turn left open by an earlier run has no waiter; resume routing when it closes.
        store_->add_turn_closed_listener([this](const std::string& conversation_id, const RoutingEntry& turn) {
            if (turn.closure == TurnClosure::Covered && !is_active(conversation_id) && is_running()) {
                auto queued = request_routing(conversation_id);
                if (!queued) {
                    context_.log().warn("Conversation {}: resume not queued: {}",
                                        conversation_id, queued.error().to_string());
                }
            }
        });
    }

    // ========================================================================
    // Ingestion handlers
    // ========================================================================

    void handle_message(const network::Event& event) {
        const auto author = context_.agents->find_by_pubkey(event.pubkey);
        if (author && author->is_orchestrator()) {
            return;
        }

        HistoryEntry entry;
        entry.event_id = event.id;
        entry.author = author ? author->slug : event.pubkey;
        entry.role = author ? HistoryRole::Agent : HistoryRole::User;
        entry.content = event.content;
        entry.kind = event.kind;
        entry.timestamp = event.created_at;

        const auto root = event.tag_value(network::tags::kConversation);
        const std::string conversation_id = root ? *root : event.id;

        if (!store_->contains(conversation_id)) {
            if (author) {
                context_.log().debug("Agent message {} for unknown conversation {} ignored", event.id, conversation_id);
                return;
            }
            auto created = store_->create(conversation_id, make_title(event.content), entry);
            if (!created) {
                context_.log().error("Conversation {} not created: {}", conversation_id, created.error().to_string());
                return;
            }
        } else {
            auto appended = store_->append_message(conversation_id, entry);
            if (!appended) {
                context_.log().error("Conversation {}: message {} not stored: {}",
                                     conversation_id, event.id, appended.error().to_string());
                return;
            }
        }

        if (!author) {
            auto queued = request_routing(conversation_id);
            if (!queued) {
                context_.log().warn("Conversation {}: routing not queued: {}",
                                    conversation_id, queued.error().to_string());
            }
        }
    }

    void handle_completion(const network::Event& event) {
        const auto agent = context_.agents->find_by_pubkey(event.pubkey);
        const auto conversation_id = event.tag_value(network::tags::kConversation);
        const auto turn_id = event.tag_value(network::tags::kTurn);
        if (!agent || !conversation_id || !turn_id) {
            context_.log().warn("Completion {} lacks agent, conversation or turn", event.id);
            return;
        }
        if (!store_->contains(*conversation_id)) {
            context_.log().warn("Completion {} for unknown conversation {}", event.id, *conversation_id);
            return;
        }

        HistoryEntry entry{event.id, agent->slug, HistoryRole::Agent, event.content, event.kind, event.created_at};
        auto appended = store_->append_message(*conversation_id, entry);
        if (!appended) {
            context_.log().error("Conversation {}: completion {} not stored in history: {}",
                                 *conversation_id, event.id, appended.error().to_string());
        }

        Completion completion{agent->slug, event.content, event.created_at, event.id, false};
        auto delivered = delegation_->deliver(*conversation_id, *turn_id, std::move(completion));
        if (!delivered && delivered.error().code != ErrorCode::OrphanedCompletion) {
            context_.log().error("Conversation {}: completion {} not recorded: {}",
                                 *conversation_id, event.id, delivered.error().to_string());
        }
    }

    void handle_status(const network::Event& event) {
        const auto agent = context_.agents->find_by_pubkey(event.pubkey);
        const auto conversation_id = event.tag_value(network::tags::kConversation);
        if (!agent || !conversation_id || !store_->contains(*conversation_id)) {
            return;
        }
        const std::string status = event.tag_value(network::tags::kStatus).value_or("");
        const std::string text = event.content.empty() ? status : status + ": " + event.content;
        const Timestamp seen = event.created_at;
        auto updated = store_->update_agent_state(*conversation_id, agent->slug, [&](AgentState& state) {
            state.last_status = text;
            state.last_seen = seen;
        });
        if (!updated) {
            context_.log().error("Conversation {}: status of {} not stored: {}",
                                 *conversation_id, agent->slug, updated.error().to_string());
        }
    }

    void handle_auxiliary(const network::Event& event) {
        const auto agent = context_.agents->find_by_pubkey(event.pubkey);
        const auto conversation_id = event.tag_value(network::tags::kConversation);
        const std::string author = agent ? agent->slug : event.pubkey;
        if (!conversation_id || !store_->contains(*conversation_id)) {
            context_.log().info("Lesson {} from {} recorded outside any conversation", event.id, author);
            return;
        }

        auto snapshot = store_->get(*conversation_id);
        if (!snapshot) {
            return;
        }
        nlohmann::json lessons = snapshot->metadata.value("lessons", nlohmann::json::array());
        lessons.push_back({{"agent", author}, {"event_id", event.id}, {"content", event.content}});
        auto stored = store_->set_metadata(*conversation_id, "lessons", std::move(lessons));
        if (!stored) {
            context_.log().error("Conversation {}: lesson {} not stored: {}",
                                 *conversation_id, event.id, stored.error().to_string());
        }
    }

    // ========================================================================
    // Routing workers
    // ========================================================================

    /// Turns loaded with no waiter get the delegation timeout applied by a routing run.
    void resume_open_turns() {
        if (config_.delegation_timeout.count() == 0) {
            return;
        }
        for (const auto& id : store_->ids()) {
            auto snapshot = store_->get(id);
            if (!snapshot || !snapshot->has_open_turn()) {
                continue;
            }
            auto queued = request_routing(id);
            if (!queued) {
                context_.log().warn("Conversation {}: open turn {} not resumed: {}",
                                    id, snapshot->current_turn->turn_id, queued.error().to_string());
            }
        }
    }

    void worker_loop() {
        while (auto request = queue_->pop()) {
            const std::string& id = request->conversation_id;
            if (!claim(id)) {
                continue;
            }
            do {
                auto result = loop_->run(id, shutdown_flag_);
                context_.log().info("Conversation {} routing run {} after {} cycle(s)",
                                    id, loop_outcome_to_string(result.outcome), result.cycles);
            } while (release_or_rerun(id));
        }
    }

    /// false if the conversation is already being routed (it is then marked for a rerun).
    bool claim(const std::string& id) {
        std::lock_guard<std::mutex> lock(active_mutex_);
        if (active_.count(id) > 0) {
            rerun_.insert(id);
            return false;
        }
        active_.insert(id);
        return true;
    }

    bool release_or_rerun(const std::string& id) {
        std::lock_guard<std::mutex> lock(active_mutex_);
        if (running_.load(std::memory_order_acquire) && rerun_.erase(id) > 0) {
            return true;
        }
        rerun_.erase(id);
        active_.erase(id);
        return false;
    }

    bool is_active(const std::string& id) const {
        std::lock_guard<std::mutex> lock(active_mutex_);
        return active_.count(id) > 0;
    }

    static std::string make_title(const std::string& content) {
        constexpr size_t kMaxTitle = 80;
        std::string title = content.substr(0, content.find('\n'));
        if (title.size() > kMaxTitle) {
            size_t cut = kMaxTitle - 3;
            while (cut > 0 && (static_cast<unsigned char>(title[cut]) & 0xC0) == 0x80) {
                --cut;  // keep multi-byte UTF-8 sequences whole
            }
            title = title.substr(0, cut) + "...";
        }
        return title.empty() ? "Untitled conversation" : title;
    }

    Config config_;
    RuntimeContext context_;
    AgentDefinition orchestrator_;
    std::shared_ptr<engine::ConversationStore> store_;
    std::shared_ptr<network::AgentPublisher> publisher_;
    std::shared_ptr<engine::RoutingEngine> router_;
    std::shared_ptr<engine::DelegationService> delegation_;
    std::shared_ptr<engine::OrchestrationLoop> loop_;
    std::unique_ptr<ingestion::IngestionLayer> ingestion_;
    std::shared_ptr<engine::RoutingQueue> queue_;
    std::shared_ptr<std::atomic<bool>> shutdown_flag_;

    std::atomic<bool> running_{false};
    std::vector<std::thread> workers_;

    mutable std::mutex active_mutex_;
    std::set<std::string> active_;
    std::set<std::string> rerun_;
};

} // namespace maestro
