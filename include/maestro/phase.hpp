#pragma once

#include "types.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace maestro {

namespace phases {
inline const std::string kChat = "CHAT";
inline const std::string kBrainstorm = "BRAINSTORM";
inline const std::string kPlan = "PLAN";
inline const std::string kExecute = "EXECUTE";
inline const std::string kVerification = "VERIFICATION";
inline const std::string kChores = "CHORES";
inline const std::string kReflection = "REFLECTION";
} // namespace phases

/// Description and default instructions of one phase.
struct PhaseRule {
    std::string name;
    std::string description;
    std::string instructions;
    bool custom = false;
};

/**
 * @brief The set of known phases and the allowed transitions between them.
 *
 * Standard phases are fixed at construction. Custom phases must be
 * registered with non-empty instructions; they are reachable from every
 * phase and may transition to any phase. Every phase may transition to
 * itself (same-phase handoff).
 *
 * @threadsafety All methods are thread-safe
 */
class PhaseCatalog {
public:
    PhaseCatalog() {
        add_standard(phases::kChat, "Open discussion",
                     "Clarify the user's request. Ask questions when requirements are unclear.",
                     {phases::kBrainstorm, phases::kPlan, phases::kExecute, phases::kReflection});
        add_standard(phases::kBrainstorm, "Exploration of ideas",
                     "Explore alternatives without committing to an implementation.",
                     {phases::kChat, phases::kPlan, phases::kExecute});
        add_standard(phases::kPlan, "Planning",
                     "Produce a concrete plan with the steps and agents needed to carry it out.",
                     {phases::kChat, phases::kExecute, phases::kReflection});
        add_standard(phases::kExecute, "Implementation",
                     "Carry out the plan. Report what was changed.",
                     {phases::kChat, phases::kPlan, phases::kVerification, phases::kReflection});
        add_standard(phases::kVerification, "Verification of the implementation",
                     "Check the result against the request. Report failures precisely.",
                     {phases::kChat, phases::kExecute, phases::kChores});
        add_standard(phases::kChores, "Cleanup and documentation",
                     "Update documentation and tidy up after the verified change.",
                     {phases::kVerification, phases::kReflection});
        add_standard(phases::kReflection, "Review",
                     "Review the completed work and record lessons learned.",
                     {phases::kChat, phases::kPlan, phases::kExecute});
    }

    /**
     * @brief Register a custom phase.
     *
     * @return ValidationError if the name collides with a standard phase
     *         or the instructions are empty
     */
    Expected<void> register_custom_phase(const std::string& name,
                                         const std::string& instructions,
                                         const std::string& description = "") {
        if (name.empty() || name == "END") {
            return tl::unexpected(Error{ErrorCode::UnknownPhase, "Invalid custom phase name", name});
        }
        if (instructions.empty()) {
            return tl::unexpected(Error{
                ErrorCode::UnknownPhase, "Custom phases require non-empty instructions", name});
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rules_.find(name);
        if (it != rules_.end() && !it->second.custom) {
            return tl::unexpected(Error{
                ErrorCode::UnknownPhase, "Cannot redefine a standard phase", name});
        }
        rules_[name] = PhaseRule{name, description.empty() ? "Custom phase" : description, instructions, true};
        if (it == rules_.end()) {
            order_.push_back(name);
        }
        return {};
    }

    bool is_known(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rules_.count(name) > 0;
    }

    bool is_custom(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rules_.find(name);
        return it != rules_.end() && it->second.custom;
    }

    std::optional<PhaseRule> rule(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rules_.find(name);
        if (it == rules_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /// Whether `from -> to` is an edge of the transition graph.
    bool can_transition(const std::string& from, const std::string& to) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto from_it = rules_.find(from);
        auto to_it = rules_.find(to);
        if (from_it == rules_.end() || to_it == rules_.end()) {
            return false;
        }
        if (from == to || from_it->second.custom || to_it->second.custom) {
            return true;
        }
        auto edges = edges_.find(from);
        return edges != edges_.end() && edges->second.count(to) > 0;
    }

    /// Phases reachable from `from`, in catalog order.
    std::vector<std::string> successors(const std::string& from) const {
        std::vector<std::string> result;
        for (const auto& name : names()) {
            if (can_transition(from, name)) {
                result.push_back(name);
            }
        }
        return result;
    }

    /// All phase names, standard phases first.
    std::vector<std::string> names() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return order_;
    }

private:
    void add_standard(const std::string& name,
                      const std::string& description,
                      const std::string& instructions,
                      std::set<std::string> targets) {
        rules_[name] = PhaseRule{name, description, instructions, false};
        edges_[name] = std::move(targets);
        order_.push_back(name);
    }

    mutable std::mutex mutex_;
    std::map<std::string, PhaseRule> rules_;
    std::map<std::string, std::set<std::string>> edges_;
    std::vector<std::string> order_;
};

} // namespace maestro
