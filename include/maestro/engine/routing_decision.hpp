#pragma once

#include "../phase.hpp"
#include "../types.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace maestro {

/// Reserved agent name that ends the routing loop.
inline const std::string kEndSentinel = "END";

/**
 * @brief The router's choice of next agents and, optionally, next phase.
 */
struct RoutingDecision {
    std::vector<std::string> agents;
    std::optional<std::string> phase;
    std::string reason;

    bool is_end() const {
        return agents.size() == 1 && agents.front() == kEndSentinel;
    }

    bool operator==(const RoutingDecision& other) const {
        return agents == other.agents && phase == other.phase && reason == other.reason;
    }
    bool operator!=(const RoutingDecision& other) const { return !(*this == other); }
};

namespace engine {

// ============================================================================
// DecisionParser
// ============================================================================

/**
 * @brief Extracts and validates a RoutingDecision from completion output.
 *
 * Accepts the first JSON object in the text that carries an "agents" key,
 * so code fences or stray prose around it are tolerated.
 */
class DecisionParser {
public:
    /**
     * @param output Raw completion text
     * @param known_agents Slugs a decision may route to
     * @param phases Catalog used to validate the optional phase
     * @return The decision, MalformedDecision for unusable output, or
     *         UnknownAgent / UnknownPhase for names that do not exist
     */
    static Expected<RoutingDecision> parse(const std::string& output,
                                           const std::set<std::string>& known_agents,
                                           const PhaseCatalog& phases) {
        auto json = extract_object(output);
        if (!json) {
            return tl::unexpected(Error{
                ErrorCode::MalformedDecision,
                "Routing output contains no decision object",
                truncate(output)
            });
        }
        const auto& j = *json;

        if (!j.contains("agents") || !j.at("agents").is_array() || j.at("agents").empty()) {
            return tl::unexpected(Error{
                ErrorCode::MalformedDecision, "\"agents\" must be a non-empty array", j.dump()});
        }
        if (!j.contains("reason") || !j.at("reason").is_string()) {
            return tl::unexpected(Error{
                ErrorCode::MalformedDecision, "\"reason\" must be a string", j.dump()});
        }

        RoutingDecision decision;
        decision.reason = j.at("reason").get<std::string>();

        for (const auto& agent : j.at("agents")) {
            if (!agent.is_string()) {
                return tl::unexpected(Error{
                    ErrorCode::MalformedDecision, "Agent names must be strings", j.dump()});
            }
            decision.agents.push_back(agent.get<std::string>());
        }

        if (j.contains("phase") && !j.at("phase").is_null()) {
            if (!j.at("phase").is_string()) {
                return tl::unexpected(Error{
                    ErrorCode::MalformedDecision, "\"phase\" must be a string", j.dump()});
            }
            decision.phase = j.at("phase").get<std::string>();
        }

        const bool mentions_end = std::find(decision.agents.begin(), decision.agents.end(), kEndSentinel)
                                  != decision.agents.end();
        if (mentions_end) {
            if (decision.agents.size() != 1) {
                return tl::unexpected(Error{
                    ErrorCode::MalformedDecision, "END cannot be combined with other agents", j.dump()});
            }
            return decision;
        }

        for (const auto& agent : decision.agents) {
            if (known_agents.count(agent) == 0) {
                return tl::unexpected(Error{ErrorCode::UnknownAgent, "Unknown agent in routing decision", agent});
            }
        }
        if (decision.phase && !phases.is_known(*decision.phase)) {
            return tl::unexpected(Error{ErrorCode::UnknownPhase, "Unknown phase in routing decision", *decision.phase});
        }
        return decision;
    }

private:
    static std::optional<nlohmann::json> extract_object(const std::string& output) {
        auto pos = output.find('{');
        while (pos != std::string::npos) {
            auto end_pos = find_json_object_end(output, pos);
            if (end_pos != std::string::npos) {
                try {
                    auto begin_it = output.cbegin() + static_cast<std::string::difference_type>(pos);
                    auto end_it = output.cbegin() + static_cast<std::string::difference_type>(end_pos + 1);
                    auto j = nlohmann::json::parse(begin_it, end_it);
                    if (j.is_object() && j.contains("agents")) {
                        return j;
                    }
                } catch (const nlohmann::json::exception&) {
                    // Not valid JSON, try the next '{'
                }
            }
            pos = output.find('{', pos + 1);
        }
        return std::nullopt;
    }

    static size_t find_json_object_end(const std::string& text, size_t start) {
        int depth = 0;
        bool in_string = false;
        bool escape_next = false;

        for (size_t i = start; i < text.size(); ++i) {
            const char c = text[i];
            if (escape_next) {
                escape_next = false;
                continue;
            }
            if (c == '\\' && in_string) {
                escape_next = true;
                continue;
            }
            if (c == '"') {
                in_string = !in_string;
                continue;
            }
            if (in_string) {
                continue;
            }
            if (c == '{') {
                ++depth;
            } else if (c == '}' && --depth == 0) {
                return i;
            }
        }
        return std::string::npos;
    }

    static std::string truncate(const std::string& text) {
        constexpr size_t kMax = 200;
        return text.size() <= kMax ? text : text.substr(0, kMax) + "...";
    }
};

} // namespace engine
} // namespace maestro
