#pragma once

#include "../context.hpp"
#include "event_network.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <thread>

namespace maestro {
namespace network {

/**
 * @brief Builds, signs and publishes events on behalf of registered agents.
 *
 * Publication is retried up to `max_attempts` times with a fixed delay.
 * Exhausted retries are reported as PublishFailed; nothing is rolled back.
 */
class AgentPublisher {
public:
    AgentPublisher(RuntimeContext context,
                   int max_attempts = 3,
                   std::chrono::milliseconds retry_delay = std::chrono::milliseconds(100))
        : context_(std::move(context.with_defaults()))
        , max_attempts_(std::max(1, max_attempts))
        , retry_delay_(retry_delay)
    {}

    /**
     * @brief Ask one agent to work on a turn.
     *
     * Tags: conversation root, recipient, turn id and phase.
     */
    Expected<Event> publish_delegation(const std::string& from_slug,
                                       const AgentDefinition& recipient,
                                       const std::string& conversation_id,
                                       const std::string& turn_id,
                                       const std::string& phase,
                                       const std::string& content) {
        Event event;
        event.kind = kinds::kGenericReply;
        event.content = content;
        event.tags = {
            {tags::kConversation, conversation_id, "", "root"},
            {tags::kRecipient, recipient.pubkey},
            {tags::kTurn, turn_id},
            {tags::kPhase, phase}
        };
        return sign_and_publish(from_slug, std::move(event));
    }

    /// An agent's report that it finished its part of a turn.
    Expected<Event> publish_completion(const std::string& from_slug,
                                       const std::string& conversation_id,
                                       const std::string& turn_id,
                                       const std::string& delegator_pubkey,
                                       const std::string& content) {
        Event event;
        event.kind = kinds::kGenericReply;
        event.content = content;
        event.tags = {
            {tags::kConversation, conversation_id, "", "root"},
            {tags::kRecipient, delegator_pubkey},
            {tags::kTurn, turn_id},
            {tags::kStatus, tags::kCompleted}
        };
        return sign_and_publish(from_slug, std::move(event));
    }

    /// Progress report from an agent, tagged with a status other than "completed".
    Expected<Event> publish_status(const std::string& from_slug,
                                   const std::string& conversation_id,
                                   const std::string& status,
                                   const std::string& content) {
        Event event;
        event.kind = kinds::kGenericReply;
        event.content = content;
        event.tags = {
            {tags::kConversation, conversation_id, "", "root"},
            {tags::kStatus, status}
        };
        return sign_and_publish(from_slug, std::move(event));
    }

    /// Sign `event` with an arbitrary signer (e.g. a human participant) and publish it.
    Expected<Event> publish_as(ISigner& signer, Event event) {
        auto finalized = finalize_event(std::move(event), signer);
        if (!finalized) {
            return tl::unexpected(Error{ErrorCode::SigningFailed, finalized.error().message, finalized.error().context});
        }
        auto published = publish_with_retry(*finalized);
        if (!published) {
            return tl::unexpected(published.error());
        }
        return finalized;
    }

    /// Publish an already signed event, retrying transient failures.
    Expected<void> publish_with_retry(const Event& event) {
        std::optional<Error> last_error;
        for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
            auto result = context_.network->publish(event);
            if (result) {
                return {};
            }
            last_error = result.error();
            if (result.error().code == ErrorCode::NetworkClosed) {
                break;
            }
            context_.log().warn("Publish of {} failed (attempt {}/{}): {}",
                                event.id, attempt, max_attempts_, result.error().to_string());
            if (attempt < max_attempts_ && retry_delay_.count() > 0) {
                std::this_thread::sleep_for(retry_delay_);
            }
        }
        return tl::unexpected(Error{
            ErrorCode::PublishFailed,
            "Publish failed after retries: " + (last_error ? last_error->message : std::string{"unknown"}),
            event.id
        });
    }

private:
    Expected<Event> sign_and_publish(const std::string& from_slug, Event event) {
        auto signer = context_.agents->signer_for(from_slug);
        if (!signer) {
            return tl::unexpected(Error{ErrorCode::SigningFailed, "No signer registered for agent", from_slug});
        }
        return publish_as(*signer, std::move(event));
    }

    RuntimeContext context_;
    int max_attempts_;
    std::chrono::milliseconds retry_delay_;
};

} // namespace network
} // namespace maestro
