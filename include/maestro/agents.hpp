#pragma once

#include "types.hpp"
#include "network/event_network.hpp"

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace maestro {

// ============================================================================
// Agent Roles
// ============================================================================

/// Capabilities a specialist advertises to the router.
enum class Capability {
    Tools,
    Retrieval,
    Scheduling,
    Delegation
};

[[nodiscard]] inline const char* capability_to_string(Capability capability) {
    switch (capability) {
        case Capability::Tools: return "tools";
        case Capability::Retrieval: return "retrieval";
        case Capability::Scheduling: return "scheduling";
        case Capability::Delegation: return "delegation";
    }
    return "unknown";
}

/// The single routing agent. It never receives delegations.
struct OrchestratorRole {
    bool operator==(const OrchestratorRole&) const { return true; }
};

/// A routable agent with its capability set.
struct SpecialistRole {
    std::set<Capability> capabilities;

    bool operator==(const SpecialistRole& other) const {
        return capabilities == other.capabilities;
    }
};

using AgentRole = std::variant<OrchestratorRole, SpecialistRole>;

/**
 * @brief Static description of one agent.
 *
 * `slug` is the name used in routing decisions; `pubkey` identifies the
 * agent on the event network.
 */
struct AgentDefinition {
    std::string slug;
    std::string pubkey;
    std::string name;
    AgentRole role = SpecialistRole{};
    std::string description;

    bool is_orchestrator() const {
        return std::holds_alternative<OrchestratorRole>(role);
    }

    bool is_specialist() const {
        return std::holds_alternative<SpecialistRole>(role);
    }

    bool has_capability(Capability capability) const {
        if (const auto* specialist = std::get_if<SpecialistRole>(&role)) {
            return specialist->capabilities.count(capability) > 0;
        }
        return false;
    }
};

// ============================================================================
// AgentRegistry
// ============================================================================

/**
 * @brief Registry of the agents of one project, indexed by slug and pubkey.
 *
 * Each agent may carry the signer used to publish on its behalf.
 *
 * @threadsafety All methods are thread-safe
 */
class AgentRegistry {
public:
    Expected<void> register_agent(AgentDefinition definition,
                                  std::shared_ptr<network::ISigner> signer = nullptr) {
        if (definition.slug.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Agent slug cannot be empty"});
        }
        if (definition.slug == "END") {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "END is reserved and cannot name an agent"});
        }
        if (signer && definition.pubkey.empty()) {
            definition.pubkey = signer->pubkey();
        }
        if (definition.pubkey.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Agent pubkey cannot be empty", definition.slug});
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (by_slug_.count(definition.slug) > 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Agent already registered", definition.slug});
        }
        if (pubkey_index_.count(definition.pubkey) > 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Pubkey already belongs to agent " +
                                        pubkey_index_.at(definition.pubkey), definition.slug});
        }
        if (definition.is_orchestrator()) {
            for (const auto& [slug, entry] : by_slug_) {
                if (entry.definition.is_orchestrator()) {
                    return tl::unexpected(Error{
                        ErrorCode::InvalidConfig, "Only one orchestrator agent may be registered", slug});
                }
            }
        }

        pubkey_index_[definition.pubkey] = definition.slug;
        const std::string slug = definition.slug;
        by_slug_.emplace(slug, Entry{std::move(definition), std::move(signer)});
        order_.push_back(slug);
        return {};
    }

    std::optional<AgentDefinition> find(const std::string& slug) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = by_slug_.find(slug);
        if (it == by_slug_.end()) {
            return std::nullopt;
        }
        return it->second.definition;
    }

    std::optional<AgentDefinition> find_by_pubkey(const std::string& pubkey) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pubkey_index_.find(pubkey);
        if (it == pubkey_index_.end()) {
            return std::nullopt;
        }
        return by_slug_.at(it->second).definition;
    }

    std::shared_ptr<network::ISigner> signer_for(const std::string& slug) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = by_slug_.find(slug);
        return it == by_slug_.end() ? nullptr : it->second.signer;
    }

    std::optional<AgentDefinition> orchestrator() const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& slug : order_) {
            const auto& definition = by_slug_.at(slug).definition;
            if (definition.is_orchestrator()) {
                return definition;
            }
        }
        return std::nullopt;
    }

    /// Specialists in registration order.
    std::vector<AgentDefinition> specialists() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<AgentDefinition> result;
        for (const auto& slug : order_) {
            const auto& definition = by_slug_.at(slug).definition;
            if (definition.is_specialist()) {
                result.push_back(definition);
            }
        }
        return result;
    }

    /// The slug set routing decisions are validated against.
    std::set<std::string> specialist_slugs() const {
        std::set<std::string> result;
        for (const auto& definition : specialists()) {
            result.insert(definition.slug);
        }
        return result;
    }

    std::vector<std::string> pubkeys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        for (const auto& slug : order_) {
            result.push_back(by_slug_.at(slug).definition.pubkey);
        }
        return result;
    }

    bool is_agent_pubkey(const std::string& pubkey) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pubkey_index_.count(pubkey) > 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return by_slug_.size();
    }

private:
    struct Entry {
        AgentDefinition definition;
        std::shared_ptr<network::ISigner> signer;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> by_slug_;
    std::unordered_map<std::string, std::string> pubkey_index_;
    std::vector<std::string> order_;
};

} // namespace maestro
