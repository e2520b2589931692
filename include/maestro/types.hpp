#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace maestro {

// ============================================================================
// Message Types
// ============================================================================

/**
 * @brief Role tag of a transcript line or completion prompt message
 */
enum class Role {
    System,     ///< Fixed instructions for the completion service
    User,       ///< Input addressed to the orchestrator (user requests, agent reports)
    Assistant   ///< Orchestrator's own earlier routing decisions
};

[[nodiscard]] inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "unknown";
}

/**
 * @brief Single role-tagged message sent to the completion service
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Message {
    Role role;            ///< Message role
    std::string content;  ///< Text content

    static Message system(std::string content) {
        return Message{Role::System, std::move(content)};
    }

    static Message user(std::string content) {
        return Message{Role::User, std::move(content)};
    }

    static Message assistant(std::string content) {
        return Message{Role::Assistant, std::move(content)};
    }

    bool operator==(const Message& other) const {
        return role == other.role && content == other.content;
    }

    bool operator!=(const Message& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * - 100-199: Configuration errors
 * - 200-299: Validation errors (phases, agents, routing output, turns)
 * - 300-399: Concurrency conflicts
 * - 400-499: Transport errors (event network, signing)
 * - 500-599: Delegation runtime (orphaned completions, cancellation)
 * - 600-699: Persistence errors (ledger, conversation records)
 * - 700-799: Completion service errors
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,
    InvalidDataPath = 101,
    InvalidModelPath = 102,

    // Validation errors (200-299)
    InvalidPhaseTransition = 200,
    UnknownPhase = 201,
    UnknownAgent = 202,
    MalformedDecision = 203,
    InvalidTurn = 204,
    UnknownConversation = 205,
    InvalidEvent = 206,
    InvalidSignature = 207,
    DuplicateConversation = 208,

    // Concurrency errors (300-399)
    TurnAlreadyOpen = 300,
    RoutingInProgress = 301,

    // Transport errors (400-499)
    PublishFailed = 400,
    SubscribeFailed = 401,
    NetworkClosed = 402,
    SigningFailed = 403,

    // Delegation errors (500-599)
    OrphanedCompletion = 500,
    DelegationCancelled = 501,
    DelegationTimeout = 502,
    OrchestratorNotRunning = 503,
    QueueFull = 504,

    // Persistence errors (600-699)
    PersistenceFailed = 600,
    LedgerFlushFailed = 601,
    StoreWriteFailed = 602,
    StoreReadFailed = 603,
    CorruptRecord = 604,

    // Completion service errors (700-799)
    CompletionFailed = 700,
    BackendInitFailed = 701,
    ModelLoadFailed = 702,
    ContextCreationFailed = 703,
    TokenizationFailed = 704,
    ContextWindowExceeded = 705,
    InvalidTemplate = 706,

    // Unknown
    Unknown = 999
};

/**
 * @brief Coarse error taxonomy used by callers to decide how to react
 *
 * Validation errors are never retried. Transport errors may be retried with
 * a bound. Persistence errors surface to the operator.
 */
enum class ErrorKind {
    Configuration,
    Validation,
    ConcurrencyConflict,
    Transport,
    OrphanedCompletion,
    Runtime,
    Persistence,
    Completion,
    Unknown
};

[[nodiscard]] inline ErrorKind error_kind(ErrorCode code) {
    const int value = static_cast<int>(code);
    if (code == ErrorCode::OrphanedCompletion) return ErrorKind::OrphanedCompletion;
    if (value >= 100 && value < 200) return ErrorKind::Configuration;
    if (value >= 200 && value < 300) return ErrorKind::Validation;
    if (value >= 300 && value < 400) return ErrorKind::ConcurrencyConflict;
    if (value >= 400 && value < 500) return ErrorKind::Transport;
    if (value >= 500 && value < 600) return ErrorKind::Runtime;
    if (value >= 600 && value < 700) return ErrorKind::Persistence;
    if (value >= 700 && value < 800) return ErrorKind::Completion;
    return ErrorKind::Unknown;
}

[[nodiscard]] inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "ConfigurationError";
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::ConcurrencyConflict: return "ConcurrencyConflict";
        case ErrorKind::Transport: return "TransportError";
        case ErrorKind::OrphanedCompletion: return "OrphanedCompletion";
        case ErrorKind::Runtime: return "RuntimeError";
        case ErrorKind::Persistence: return "PersistenceError";
        case ErrorKind::Completion: return "CompletionError";
        case ErrorKind::Unknown: return "UnknownError";
    }
    return "UnknownError";
}

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type used with tl::expected for composable error handling
 * without exceptions.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (ids, paths, raw output)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    ErrorKind kind() const {
        return error_kind(code);
    }

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }
};

template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// Time helpers
// ============================================================================

/// Seconds since the Unix epoch, the resolution used by events and records.
using Timestamp = int64_t;

inline Timestamp now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Logger settings
 */
struct LogConfig {
    std::string name = "maestro";
    std::string level = "info";                 ///< trace, debug, info, warn, error, critical, off
    std::optional<std::string> pattern;         ///< spdlog pattern override
    std::optional<std::string> file_path;       ///< Also log to this file when set

    bool operator==(const LogConfig& other) const {
        return name == other.name && level == other.level &&
               pattern == other.pattern && file_path == other.file_path;
    }
    bool operator!=(const LogConfig& other) const { return !(*this == other); }
};

/**
 * @brief Complete configuration for an Orchestrator instance
 *
 * Value type. Must be validated via validate() before use.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Config {
    // Storage
    std::string data_dir;                                    ///< Directory holding the SQLite files (required)

    // Routing
    std::string model = "default";                           ///< Completion model identifier used for routing
    std::string orchestrator_slug = "orchestrator";          ///< Slug of the orchestrator agent in the registry
    int routing_max_attempts = 1;                            ///< Attempts per decide cycle (1 = no retry)
    int max_routing_cycles = 20;                             ///< Decide/delegate cycles per activation
    std::chrono::milliseconds delegation_timeout{0};         ///< 0 = wait until full coverage or cancellation

    // Workers
    int worker_threads = 2;                                  ///< Routing workers (conversations routed in parallel)
    size_t routing_queue_capacity = 0;                       ///< Maximum pending routing requests (0 = unlimited)

    // Network
    int publish_max_attempts = 3;                            ///< Bounded retry for event publication
    std::chrono::milliseconds publish_retry_delay{100};      ///< Delay between publish attempts
    bool verify_signatures = true;                           ///< Drop inbound events with invalid signatures

    // Ingestion
    std::chrono::milliseconds ledger_flush_interval{1000};   ///< Periodic ledger flush cadence

    // Logging
    LogConfig log;

    std::string conversations_path() const {
        return data_dir + "/conversations.sqlite";
    }

    std::string ledger_path() const {
        return data_dir + "/processed_events.sqlite";
    }

    Expected<void> validate() const {
        if (data_dir.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidDataPath, "Data directory cannot be empty"});
        }
        if (model.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Routing model identifier cannot be empty"});
        }
        if (orchestrator_slug.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Orchestrator slug cannot be empty"});
        }
        if (routing_max_attempts <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "routing_max_attempts must be positive"});
        }
        if (max_routing_cycles <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_routing_cycles must be positive"});
        }
        if (worker_threads <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "worker_threads must be positive"});
        }
        if (publish_max_attempts <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "publish_max_attempts must be positive"});
        }
        if (delegation_timeout.count() < 0 || publish_retry_delay.count() < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Durations cannot be negative"});
        }
        if (ledger_flush_interval.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "ledger_flush_interval must be positive"});
        }
        return {};
    }

    /**
     * @brief Build a Config from a JSON object, keeping defaults for absent keys
     *
     * Durations are given in milliseconds (`delegation_timeout_ms`,
     * `publish_retry_delay_ms`, `ledger_flush_interval_ms`). The result is validated.
     */
    static Expected<Config> from_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Configuration must be a JSON object"});
        }

        Config config;
        try {
            config.data_dir = j.value("data_dir", config.data_dir);
            config.model = j.value("model", config.model);
            config.orchestrator_slug = j.value("orchestrator_slug", config.orchestrator_slug);
            config.routing_max_attempts = j.value("routing_max_attempts", config.routing_max_attempts);
            config.max_routing_cycles = j.value("max_routing_cycles", config.max_routing_cycles);
            config.delegation_timeout = std::chrono::milliseconds(
                j.value("delegation_timeout_ms", static_cast<int64_t>(config.delegation_timeout.count())));
            config.worker_threads = j.value("worker_threads", config.worker_threads);
            config.routing_queue_capacity = j.value("routing_queue_capacity", config.routing_queue_capacity);
            config.publish_max_attempts = j.value("publish_max_attempts", config.publish_max_attempts);
            config.publish_retry_delay = std::chrono::milliseconds(
                j.value("publish_retry_delay_ms", static_cast<int64_t>(config.publish_retry_delay.count())));
            config.verify_signatures = j.value("verify_signatures", config.verify_signatures);
            config.ledger_flush_interval = std::chrono::milliseconds(
                j.value("ledger_flush_interval_ms", static_cast<int64_t>(config.ledger_flush_interval.count())));

            if (j.contains("log")) {
                const auto& log = j.at("log");
                config.log.name = log.value("name", config.log.name);
                config.log.level = log.value("level", config.log.level);
                if (log.contains("pattern")) {
                    config.log.pattern = log.at("pattern").get<std::string>();
                }
                if (log.contains("file")) {
                    config.log.file_path = log.at("file").get<std::string>();
                }
            }
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Invalid configuration value", e.what()});
        }

        auto validation = config.validate();
        if (!validation) {
            return tl::unexpected(validation.error());
        }
        return config;
    }
};

} // namespace maestro
