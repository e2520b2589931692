#pragma once

#include "../types.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace maestro {
namespace network {

// ============================================================================
// Event kinds
// ============================================================================

namespace kinds {
constexpr int kTextNote = 1;
constexpr int kGenericReply = 1111;
constexpr int kAgentLesson = 4129;
constexpr int kStreamingResponse = 21111;
constexpr int kProjectStatus = 24010;
constexpr int kTypingStart = 24111;
constexpr int kTypingStop = 24112;
constexpr int kOperationsStatus = 24133;
} // namespace kinds

// ============================================================================
// Tag names
// ============================================================================

namespace tags {
constexpr const char* kConversation = "e";  ///< ["e", <conversation root id>, <relay>, "root"]
constexpr const char* kRecipient = "p";     ///< ["p", <recipient pubkey>]
constexpr const char* kTurn = "turn";       ///< ["turn", <turn id>]
constexpr const char* kPhase = "phase";     ///< ["phase", <phase name>]
constexpr const char* kStatus = "status";   ///< ["status", "completed"]
constexpr const char* kProject = "a";       ///< ["a", <project address>]
constexpr const char* kCompleted = "completed";
} // namespace tags

using Tag = std::vector<std::string>;

/**
 * @brief A signed, immutable event on the network.
 *
 * The id is the hex SHA-256 of the canonical serialization
 * `[0, pubkey, created_at, kind, tags, content]`.
 */
struct Event {
    std::string id;
    std::string pubkey;
    Timestamp created_at = 0;
    int kind = kinds::kTextNote;
    std::vector<Tag> tags;
    std::string content;
    std::string sig;

    /// First value of the first tag with this name.
    std::optional<std::string> tag_value(const std::string& name) const {
        for (const auto& tag : tags) {
            if (tag.size() >= 2 && tag[0] == name) {
                return tag[1];
            }
        }
        return std::nullopt;
    }

    /// Values of every tag with this name, in order.
    std::vector<std::string> tag_values(const std::string& name) const {
        std::vector<std::string> values;
        for (const auto& tag : tags) {
            if (tag.size() >= 2 && tag[0] == name) {
                values.push_back(tag[1]);
            }
        }
        return values;
    }

    bool has_tag(const std::string& name, const std::string& value) const {
        for (const auto& tag : tags) {
            if (tag.size() >= 2 && tag[0] == name && tag[1] == value) {
                return true;
            }
        }
        return false;
    }

    bool operator==(const Event& other) const {
        return id == other.id && pubkey == other.pubkey && created_at == other.created_at &&
               kind == other.kind && tags == other.tags && content == other.content && sig == other.sig;
    }
    bool operator!=(const Event& other) const { return !(*this == other); }
};

inline void to_json(nlohmann::json& j, const Event& event) {
    j = nlohmann::json{
        {"id", event.id},
        {"pubkey", event.pubkey},
        {"created_at", event.created_at},
        {"kind", event.kind},
        {"tags", event.tags},
        {"content", event.content},
        {"sig", event.sig}
    };
}

inline void from_json(const nlohmann::json& j, Event& event) {
    j.at("id").get_to(event.id);
    j.at("pubkey").get_to(event.pubkey);
    j.at("created_at").get_to(event.created_at);
    j.at("kind").get_to(event.kind);
    j.at("tags").get_to(event.tags);
    j.at("content").get_to(event.content);
    event.sig = j.value("sig", std::string{});
}

/**
 * @brief Canonical serialization the event id is computed over.
 *
 * InvalidEvent when a field is not valid UTF-8.
 */
inline Expected<std::string> canonical_serialization(const Event& event) {
    nlohmann::json array = nlohmann::json::array({
        0, event.pubkey, event.created_at, event.kind, event.tags, event.content
    });
    try {
        return array.dump();
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(Error{ErrorCode::InvalidEvent, std::string("Event is not serializable: ") + e.what(),
                                    event.id});
    }
}

/// Hex SHA-256 of the canonical serialization.
Expected<std::string> compute_event_id(const Event& event);

/// Lowercase hex encoding of raw bytes.
std::string to_hex(const unsigned char* data, size_t size);

/// Decodes lowercase or uppercase hex; fails on odd length or non-hex characters.
Expected<std::vector<unsigned char>> from_hex(const std::string& hex);

} // namespace network
} // namespace maestro
