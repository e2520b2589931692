#pragma once

/**
 * @file maestro.hpp
 * @brief Convenience header for the Maestro orchestration core
 *
 * Quick Start:
 * @code
 * #include <maestro/maestro.hpp>
 *
 * int main() {
 *     maestro::Config config;
 *     config.data_dir = "/var/lib/maestro/project-x";
 *
 *     maestro::RuntimeContext context;
 *     context.network = relay;           // any network::IEventNetwork
 *     context.completion = completion;   // any completion::ICompletionService
 *     context.agents = registry;         // orchestrator + specialists with signers
 *
 *     auto orchestrator = maestro::Orchestrator::create(config, context);
 *     if (!orchestrator) {
 *         std::cerr << orchestrator.error().to_string() << std::endl;
 *         return 1;
 *     }
 *     (*orchestrator)->start();
 *     ...
 *     (*orchestrator)->stop();
 * }
 * @endcode
 *
 * Key Components:
 * - maestro::Orchestrator: service wiring ingestion, routing and delegation
 * - maestro::Conversation: per-conversation state, turns and phase history
 * - maestro::engine::PhaseStateMachine: guarded phase transitions
 * - maestro::engine::RoutingEngine: asks the completion service who goes next
 * - maestro::engine::DelegationService: publish a turn, wait for its completions
 * - maestro::ingestion::IngestionLayer: verified, de-duplicated event intake
 *
 * Thread Safety:
 * - Orchestrator runs routing on its own worker threads
 * - Ingestion handlers run on the event network's delivery thread
 * - ConversationStore serializes mutations per conversation
 */

#include "types.hpp"
#include "logging.hpp"
#include "agents.hpp"
#include "phase.hpp"
#include "conversation.hpp"
#include "context.hpp"

#include "network/event.hpp"
#include "network/filter.hpp"
#include "network/event_network.hpp"
#include "network/schnorr_signer.hpp"
#include "network/local_relay.hpp"
#include "network/agent_publisher.hpp"

#include "completion/completion_service.hpp"

#include "engine/phase_state_machine.hpp"
#include "engine/conversation_database.hpp"
#include "engine/conversation_store.hpp"
#include "engine/transcript.hpp"
#include "engine/routing_decision.hpp"
#include "engine/routing_engine.hpp"
#include "engine/delegation_service.hpp"
#include "engine/routing_queue.hpp"
#include "engine/orchestration_loop.hpp"

#include "ingestion/processed_event_ledger.hpp"
#include "ingestion/event_classifier.hpp"
#include "ingestion/ingestion_layer.hpp"

#include "orchestrator.hpp"

/**
 * @namespace maestro
 * @brief Core types, agents, phases and the Orchestrator service.
 *
 * Nested namespaces:
 * - maestro::network - signed events, filters, relays, publishing
 * - maestro::engine - conversation store, routing and delegation
 * - maestro::ingestion - processed-event ledger and event intake
 * - maestro::completion - completion service interface and llama.cpp adapter
 */
