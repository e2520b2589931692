#include <gtest/gtest.h>
#include "maestro/types.hpp"
#include "maestro/logging.hpp"

using namespace maestro;

// ============================================================================
// Message Tests
// ============================================================================

TEST(MessageTest, FactoryMethods) {
    auto sys = Message::system("System message");
    EXPECT_EQ(sys.role, Role::System);
    EXPECT_EQ(sys.content, "System message");

    auto user = Message::user("User message");
    EXPECT_EQ(user.role, Role::User);

    auto assistant = Message::assistant("Assistant message");
    EXPECT_EQ(assistant.role, Role::Assistant);
    EXPECT_NE(user, Message::assistant("User message"));
}

TEST(RoleTest, RoleToString) {
    EXPECT_STREQ(role_to_string(Role::System), "system");
    EXPECT_STREQ(role_to_string(Role::User), "user");
    EXPECT_STREQ(role_to_string(Role::Assistant), "assistant");
}

// ============================================================================
// Error Tests
// ============================================================================

TEST(ErrorTest, ToStringIncludesContext) {
    Error plain{ErrorCode::UnknownAgent, "Unknown agent"};
    EXPECT_EQ(plain.to_string(), "[202] Unknown agent");

    Error with_context{ErrorCode::UnknownAgent, "Unknown agent", "ghost"};
    EXPECT_EQ(with_context.to_string(), "[202] Unknown agent | Context: ghost");
}

TEST(ErrorTest, KindTaxonomy) {
    EXPECT_EQ(error_kind(ErrorCode::InvalidPhaseTransition), ErrorKind::Validation);
    EXPECT_EQ(error_kind(ErrorCode::MalformedDecision), ErrorKind::Validation);
    EXPECT_EQ(error_kind(ErrorCode::TurnAlreadyOpen), ErrorKind::ConcurrencyConflict);
    EXPECT_EQ(error_kind(ErrorCode::PublishFailed), ErrorKind::Transport);
    EXPECT_EQ(error_kind(ErrorCode::OrphanedCompletion), ErrorKind::OrphanedCompletion);
    EXPECT_EQ(error_kind(ErrorCode::DelegationCancelled), ErrorKind::Runtime);
    EXPECT_EQ(error_kind(ErrorCode::LedgerFlushFailed), ErrorKind::Persistence);
    EXPECT_EQ(error_kind(ErrorCode::CompletionFailed), ErrorKind::Completion);
    EXPECT_EQ(error_kind(ErrorCode::InvalidConfig), ErrorKind::Configuration);
    EXPECT_EQ(error_kind(ErrorCode::Unknown), ErrorKind::Unknown);

    EXPECT_STREQ(error_kind_to_string(ErrorKind::Validation), "ValidationError");
    EXPECT_STREQ(error_kind_to_string(ErrorKind::ConcurrencyConflict), "ConcurrencyConflict");
    EXPECT_EQ(Error(ErrorCode::PersistenceFailed, "x").kind(), ErrorKind::Persistence);
}

TEST(ErrorTest, Expected) {
    Expected<int> success = 42;
    ASSERT_TRUE(success.has_value());
    EXPECT_EQ(*success, 42);

    Expected<int> failure = tl::unexpected(Error{ErrorCode::QueueFull, "full"});
    ASSERT_FALSE(failure.has_value());
    EXPECT_EQ(failure.error().code, ErrorCode::QueueFull);
}

// ============================================================================
// Config Tests
// ============================================================================

TEST(ConfigTest, Defaults) {
    Config config;
    EXPECT_EQ(config.model, "default");
    EXPECT_EQ(config.orchestrator_slug, "orchestrator");
    EXPECT_EQ(config.routing_max_attempts, 1);
    EXPECT_EQ(config.max_routing_cycles, 20);
    EXPECT_EQ(config.delegation_timeout.count(), 0);
    EXPECT_EQ(config.publish_max_attempts, 3);
    EXPECT_TRUE(config.verify_signatures);
    EXPECT_EQ(config.ledger_flush_interval.count(), 1000);
}

TEST(ConfigTest, ValidationRequiresDataDir) {
    Config config;
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidDataPath);

    config.data_dir = "/tmp/maestro";
    EXPECT_TRUE(config.validate().has_value());
    EXPECT_EQ(config.conversations_path(), "/tmp/maestro/conversations.sqlite");
    EXPECT_EQ(config.ledger_path(), "/tmp/maestro/processed_events.sqlite");
}

TEST(ConfigTest, ValidationRejectsNonPositiveLimits) {
    Config config;
    config.data_dir = "/tmp/maestro";

    config.max_routing_cycles = 0;
    EXPECT_FALSE(config.validate().has_value());
    config.max_routing_cycles = 5;

    config.worker_threads = 0;
    EXPECT_FALSE(config.validate().has_value());
    config.worker_threads = 1;

    config.delegation_timeout = std::chrono::milliseconds(-1);
    EXPECT_FALSE(config.validate().has_value());
    config.delegation_timeout = std::chrono::milliseconds(0);

    config.ledger_flush_interval = std::chrono::milliseconds(0);
    EXPECT_FALSE(config.validate().has_value());
}

TEST(ConfigTest, FromJson) {
    auto j = nlohmann::json::parse(R"({
        "data_dir": "/var/lib/maestro",
        "model": "router-small",
        "routing_max_attempts": 3,
        "delegation_timeout_ms": 45000,
        "ledger_flush_interval_ms": 250,
        "verify_signatures": false,
        "log": {"level": "debug", "file": "/tmp/maestro.log"}
    })");

    auto config = Config::from_json(j);
    ASSERT_TRUE(config.has_value()) << config.error().to_string();
    EXPECT_EQ(config->data_dir, "/var/lib/maestro");
    EXPECT_EQ(config->model, "router-small");
    EXPECT_EQ(config->routing_max_attempts, 3);
    EXPECT_EQ(config->delegation_timeout.count(), 45000);
    EXPECT_EQ(config->ledger_flush_interval.count(), 250);
    EXPECT_FALSE(config->verify_signatures);
    EXPECT_EQ(config->log.level, "debug");
    ASSERT_TRUE(config->log.file_path.has_value());
    EXPECT_EQ(*config->log.file_path, "/tmp/maestro.log");
    EXPECT_EQ(config->max_routing_cycles, 20);
}

TEST(ConfigTest, FromJsonRejectsBadInput) {
    auto not_object = Config::from_json(nlohmann::json::array());
    ASSERT_FALSE(not_object.has_value());
    EXPECT_EQ(not_object.error().code, ErrorCode::InvalidConfig);

    auto wrong_type = Config::from_json(nlohmann::json{{"data_dir", "/x"}, {"worker_threads", "two"}});
    ASSERT_FALSE(wrong_type.has_value());
    EXPECT_EQ(wrong_type.error().code, ErrorCode::InvalidConfig);

    auto invalid = Config::from_json(nlohmann::json{{"model", "m"}});
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().code, ErrorCode::InvalidDataPath);
}

// ============================================================================
// Logging Tests
// ============================================================================

TEST(LoggingTest, MakeLoggerAppliesLevel) {
    LogConfig config;
    config.name = "test-logger";
    config.level = "warn";

    auto logger = make_logger(config);
    ASSERT_TRUE(logger.has_value());
    EXPECT_EQ((*logger)->name(), "test-logger");
    EXPECT_EQ((*logger)->level(), spdlog::level::warn);
}

TEST(LoggingTest, MakeLoggerRejectsUnknownLevel) {
    LogConfig config;
    config.level = "chatty";
    auto logger = make_logger(config);
    ASSERT_FALSE(logger.has_value());
    EXPECT_EQ(logger.error().code, ErrorCode::InvalidConfig);
}

TEST(LoggingTest, NullLoggerDiscards) {
    auto logger = make_null_logger();
    ASSERT_NE(logger, nullptr);
    logger->info("dropped {}", 1);
    EXPECT_EQ(logger->name(), "maestro");
}
