#pragma once

#include "agents.hpp"
#include "completion/completion_service.hpp"
#include "logging.hpp"
#include "network/event_network.hpp"
#include "phase.hpp"
#include "types.hpp"

#include <functional>
#include <memory>

namespace maestro {

/**
 * @brief Shared collaborators handed explicitly to every component.
 *
 * Replaces process-wide singletons: the logger, agent registry, phase
 * catalog, event network and completion service of one orchestrator
 * instance. Copies share the same collaborators.
 */
struct RuntimeContext {
    std::shared_ptr<spdlog::logger> logger;
    std::shared_ptr<AgentRegistry> agents;
    std::shared_ptr<PhaseCatalog> phases;
    std::shared_ptr<network::IEventNetwork> network;
    std::shared_ptr<completion::ICompletionService> completion;
    std::function<Timestamp()> clock;   ///< Defaults to wall-clock seconds

    Timestamp now() const {
        return clock ? clock() : now_seconds();
    }

    spdlog::logger& log() const {
        return *logger;
    }

    /// Fill in defaults for the optional members (null logger, empty registries).
    RuntimeContext& with_defaults() {
        if (!logger) logger = make_null_logger();
        if (!agents) agents = std::make_shared<AgentRegistry>();
        if (!phases) phases = std::make_shared<PhaseCatalog>();
        return *this;
    }

    Expected<void> validate() const {
        if (!logger || !agents || !phases) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Runtime context is missing logger, agents or phases"});
        }
        if (!network) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Runtime context has no event network"});
        }
        if (!completion) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Runtime context has no completion service"});
        }
        return {};
    }
};

} // namespace maestro
