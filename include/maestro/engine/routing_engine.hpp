#pragma once

#include "../context.hpp"
#include "../conversation.hpp"
#include "routing_decision.hpp"
#include "transcript.hpp"

#include <string>
#include <vector>

namespace maestro {
namespace engine {

/**
 * @brief Decides which agents act next by consulting the completion service.
 *
 * The prompt is the fixed routing instructions (agents, phases, allowed
 * transitions, output format) followed by the narrative routing context.
 * decide() has no side effects on the conversation.
 */
class RoutingEngine {
public:
    RoutingEngine(RuntimeContext context, std::string model, int max_tokens = 512)
        : context_(std::move(context.with_defaults()))
        , model_(std::move(model))
        , max_tokens_(max_tokens)
    {}

    /**
     * @brief Produce the next routing decision for a conversation.
     *
     * @return The validated decision; CompletionError when the service fails,
     *         ValidationError for malformed output or unknown names
     */
    Expected<RoutingDecision> decide(const Conversation& conversation) const {
        if (!context_.completion) {
            return tl::unexpected(Error{ErrorCode::BackendInitFailed, "No completion service configured"});
        }

        completion::CompletionRequest request;
        request.model = model_;
        request.format = completion::ResponseFormat::Json;
        request.max_tokens = max_tokens_;
        request.messages = build_prompt(conversation);

        auto result = context_.completion->complete(request);
        if (!result) {
            context_.log().error("Conversation {} routing call failed: {}",
                                 conversation.id, result.error().to_string());
            return tl::unexpected(result.error());
        }

        auto decision = DecisionParser::parse(result->content, context_.agents->specialist_slugs(), *context_.phases);
        if (!decision) {
            context_.log().error("Conversation {} routing output rejected: {}",
                                 conversation.id, decision.error().to_string());
            return decision;
        }

        context_.log().info("Conversation {} routing decision: [{}] phase={} reason={}",
                            conversation.id, detail::join_names(decision->agents),
                            decision->phase.value_or("-"), decision->reason);
        return decision;
    }

    /**
     * @brief Free-text diagnostic query about a conversation's routing state.
     *
     * Sends the role-tagged transcript followed by the question; the answer
     * is returned verbatim. Never changes the conversation.
     */
    Expected<std::string> explain(const Conversation& conversation, const std::string& question) const {
        if (!context_.completion) {
            return tl::unexpected(Error{ErrorCode::BackendInitFailed, "No completion service configured"});
        }

        completion::CompletionRequest request;
        request.model = model_;
        request.format = completion::ResponseFormat::Text;
        request.max_tokens = max_tokens_;
        request.messages.push_back(Message::system(
            routing_instructions(conversation.phase) +
            "\nYou are now answering a diagnostic question about your routing. "
            "Answer in plain text; do not output a routing decision."));
        for (auto& line : transcript(conversation)) {
            request.messages.push_back(std::move(line));
        }
        request.messages.push_back(Message::user("DIAGNOSTIC QUESTION:\n" + question));

        auto result = context_.completion->complete(request);
        if (!result) {
            return tl::unexpected(result.error());
        }
        return result->content;
    }

    /// Complete prompt used by decide().
    std::vector<Message> build_prompt(const Conversation& conversation) const {
        return {
            Message::system(routing_instructions(conversation.phase)),
            Message::user(render_routing_context(conversation))
        };
    }

    /// Fixed instructions: available agents, phases, transitions and the output contract.
    std::string routing_instructions(const std::string& current_phase) const {
        std::string text =
            "You are the orchestrator of a team of specialist agents. You never do the work yourself; "
            "you decide which agents act next and in which phase.\n\n";

        text += "AVAILABLE AGENTS:\n";
        for (const auto& agent : context_.agents->specialists()) {
            text += "- " + agent.slug;
            if (!agent.name.empty() && agent.name != agent.slug) {
                text += " (" + agent.name + ")";
            }
            if (!agent.description.empty()) {
                text += ": " + agent.description;
            }
            if (const auto* specialist = std::get_if<SpecialistRole>(&agent.role)) {
                if (!specialist->capabilities.empty()) {
                    std::string caps;
                    for (auto capability : specialist->capabilities) {
                        if (!caps.empty()) caps += ", ";
                        caps += capability_to_string(capability);
                    }
                    text += " [" + caps + "]";
                }
            }
            text += "\n";
        }

        text += "\nPHASES:\n";
        for (const auto& name : context_.phases->names()) {
            auto rule = context_.phases->rule(name);
            text += "- " + name + ": " + (rule ? rule->description : std::string{});
            if (rule && rule->custom) {
                text += " (instructions: " + rule->instructions + ")";
            }
            text += "\n";
        }

        text += "\nALLOWED NEXT PHASES FROM " + current_phase + ": " +
                detail::join_names(context_.phases->successors(current_phase)) + "\n";
        text +=
            "Standard flow: CHAT -> PLAN -> EXECUTE -> VERIFICATION -> CHORES -> REFLECTION. "
            "A failed verification goes back to EXECUTE.\n\n"
            "Respond with exactly one JSON object and nothing else:\n"
            "{\"agents\": [\"<agent>\", ...], \"phase\": \"<PHASE>\", \"reason\": \"<why>\"}\n"
            "\"phase\" is optional and only needed when the phase changes. "
            "Use {\"agents\": [\"END\"], \"reason\": \"...\"} when the user's request is fully handled.\n";
        return text;
    }

    const std::string& model() const {
        return model_;
    }

private:
    RuntimeContext context_;
    std::string model_;
    int max_tokens_;
};

} // namespace engine
} // namespace maestro
