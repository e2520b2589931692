#pragma once

#include "../agents.hpp"
#include "../network/event.hpp"

namespace maestro {
namespace ingestion {

enum class EventClass {
    Message,      ///< Conversational text (new conversation or reply)
    Completion,   ///< Agent report closing its part of a turn
    Status,       ///< Agent progress report
    Auxiliary,    ///< Records kept alongside conversations (lessons)
    Ignored       ///< Metadata, presence, typing, streaming and status broadcasts
};

[[nodiscard]] inline const char* event_class_to_string(EventClass event_class) {
    switch (event_class) {
        case EventClass::Message: return "message";
        case EventClass::Completion: return "completion";
        case EventClass::Status: return "status";
        case EventClass::Auxiliary: return "auxiliary";
        case EventClass::Ignored: return "ignored";
    }
    return "unknown";
}

/**
 * @brief Sort an inbound event into the class that decides its handler.
 *
 * Completions and status reports are only recognised from registered
 * agents; the same shapes from anyone else are treated as messages.
 */
inline EventClass classify(const network::Event& event, const AgentRegistry& agents) {
    using namespace network;

    switch (event.kind) {
        case kinds::kAgentLesson:
            return EventClass::Auxiliary;
        case kinds::kTextNote:
        case kinds::kGenericReply:
            break;
        default:
            return EventClass::Ignored;
    }

    const auto status = event.tag_value(tags::kStatus);
    if (status && agents.is_agent_pubkey(event.pubkey)) {
        if (*status == tags::kCompleted && event.tag_value(tags::kTurn)) {
            return EventClass::Completion;
        }
        if (*status != tags::kCompleted) {
            return EventClass::Status;
        }
    }
    return EventClass::Message;
}

} // namespace ingestion
} // namespace maestro
