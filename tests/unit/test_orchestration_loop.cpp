#include <gtest/gtest.h>
#include "maestro/engine/orchestration_loop.hpp"
#include "mocks/mock_completion_service.hpp"
#include "mocks/mock_conversation_repository.hpp"
#include "mocks/mock_event_network.hpp"
#include "fixtures/agent_roster.hpp"
#include "fixtures/sample_decisions.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <thread>

using namespace maestro;
using namespace maestro::engine;
using namespace maestro::testing;
using namespace std::chrono_literals;

namespace {

/// Plays every specialist: answers each open turn's pending agents.
class AutoResponder {
public:
    AutoResponder(std::shared_ptr<ConversationStore> store,
                  std::shared_ptr<DelegationService> delegation,
                  std::string conversation_id)
        : store_(std::move(store))
        , delegation_(std::move(delegation))
        , conversation_id_(std::move(conversation_id))
        , thread_([this]() { run(); })
    {}

    ~AutoResponder() {
        running_ = false;
        thread_.join();
    }

private:
    void run() {
        while (running_) {
            auto snapshot = store_->get(conversation_id_);
            if (snapshot && snapshot->current_turn) {
                for (const auto& agent : snapshot->current_turn->pending_agents()) {
                    auto delivered = delegation_->deliver(conversation_id_, snapshot->current_turn->turn_id,
                        Completion{agent, agent + " done", 0, "evt-" + snapshot->current_turn->turn_id + agent, false});
                    (void)delivered;
                }
            }
            std::this_thread::sleep_for(2ms);
        }
    }

    std::shared_ptr<ConversationStore> store_;
    std::shared_ptr<DelegationService> delegation_;
    std::string conversation_id_;
    std::atomic<bool> running_{true};
    std::thread thread_;
};

bool has_audit(const Conversation& conversation, const std::string& kind) {
    return std::any_of(conversation.audit.begin(), conversation.audit.end(),
                       [&](const AuditEntry& entry) { return entry.kind == kind; });
}

} // namespace

class OrchestrationLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        completion = std::make_shared<MockCompletionService>();
        net = std::make_shared<MockEventNetwork>();
        context.agents = make_roster();
        context.network = net;
        context.completion = completion;
        context.with_defaults();

        store = std::make_shared<ConversationStore>(context, std::make_shared<MockConversationRepository>());
        auto publisher = std::make_shared<network::AgentPublisher>(context, 1, 0ms);
        delegation = std::make_shared<DelegationService>(context, store, publisher);
        router = std::make_shared<RoutingEngine>(context, "router-model");

        ASSERT_TRUE(store->create("conv-1", "Build a CLI",
                                  HistoryEntry{"evt-root", "pk-user", HistoryRole::User, "Build a CLI", 1, 1}).has_value());
    }

    std::unique_ptr<OrchestrationLoop> make_loop(LoopOptions options = {}) {
        return std::make_unique<OrchestrationLoop>(context, store, router, delegation, options);
    }

    Conversation snapshot() {
        return *store->get("conv-1");
    }

    RuntimeContext context;
    std::shared_ptr<MockCompletionService> completion;
    std::shared_ptr<MockEventNetwork> net;
    std::shared_ptr<ConversationStore> store;
    std::shared_ptr<DelegationService> delegation;
    std::shared_ptr<RoutingEngine> router;
};

TEST_F(OrchestrationLoopTest, FirstDecisionMovesToPlanAndOpensTurn) {
    completion->enqueue(decisions::kRouteToPlanner);
    completion->enqueue(decisions::kEnd);
    auto loop = make_loop();

    auto run = std::async(std::launch::async, [&]() { return loop->run("conv-1"); });
    ASSERT_TRUE(wait_until([&]() { return snapshot().has_open_turn(); }));

    auto during = snapshot();
    EXPECT_EQ(during.phase, "PLAN");
    EXPECT_EQ(during.current_turn->agents, std::vector<std::string>{"planner"});
    EXPECT_EQ(during.current_turn->phase, "PLAN");
    ASSERT_EQ(during.phase_transitions.size(), 1U);
    EXPECT_EQ(during.phase_transitions[0].initiating_agent, "orchestrator");

    ASSERT_TRUE(delegation->deliver("conv-1", during.current_turn->turn_id,
                                    Completion{"planner", "the plan", 0, "evt-plan", false}).has_value());

    auto result = run.get();
    EXPECT_EQ(result.outcome, LoopOutcome::Ended);
    EXPECT_EQ(result.cycles, 2);
    ASSERT_EQ(result.decisions.size(), 2U);
    EXPECT_TRUE(result.decisions[1].is_end());

    auto after = snapshot();
    EXPECT_FALSE(after.has_open_turn());
    ASSERT_EQ(after.turns.size(), 1U);
    EXPECT_EQ(after.turns[0].closure, TurnClosure::Covered);
    EXPECT_TRUE(has_audit(after, "workflow_complete"));
}

TEST_F(OrchestrationLoopTest, EndStopsWithoutNewTurn) {
    completion->enqueue(decisions::kEnd);

    auto result = make_loop()->run("conv-1");
    EXPECT_EQ(result.outcome, LoopOutcome::Ended);
    EXPECT_EQ(result.cycles, 1);
    EXPECT_TRUE(net->published().empty());

    auto after = snapshot();
    EXPECT_TRUE(after.turns.empty());
    EXPECT_FALSE(after.has_open_turn());
    EXPECT_EQ(after.phase, "CHAT");
}

TEST_F(OrchestrationLoopTest, SecondRoutingPromptSeesCompletedTurn) {
    completion->enqueue(decisions::kRouteToPair);
    completion->enqueue(decisions::kEnd);
    AutoResponder responder(store, delegation, "conv-1");

    auto result = make_loop()->run("conv-1");
    ASSERT_EQ(result.outcome, LoopOutcome::Ended);

    auto requests = completion->requests();
    ASSERT_EQ(requests.size(), 2U);
    const auto& context_text = requests[1].messages[1].content;
    EXPECT_NE(context_text.find("[planner completed]"), std::string::npos);
    EXPECT_NE(context_text.find("[coder completed]"), std::string::npos);
}

TEST_F(OrchestrationLoopTest, MalformedDecisionFailsWithAudit) {
    completion->enqueue(decisions::kNoJson);

    auto result = make_loop()->run("conv-1");
    EXPECT_EQ(result.outcome, LoopOutcome::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, ErrorCode::MalformedDecision);

    auto after = snapshot();
    EXPECT_FALSE(after.has_open_turn());
    EXPECT_TRUE(has_audit(after, "routing_failure"));
}

TEST_F(OrchestrationLoopTest, RoutingIsRetriedWhenConfigured) {
    completion->enqueue(decisions::kNoJson);
    completion->enqueue(decisions::kEnd);
    LoopOptions options;
    options.routing_max_attempts = 2;

    auto result = make_loop(options)->run("conv-1");
    EXPECT_EQ(result.outcome, LoopOutcome::Ended);
    EXPECT_EQ(completion->call_count(), 2U);
}

TEST_F(OrchestrationLoopTest, DisallowedTransitionFailsAndKeepsPhase) {
    completion->enqueue(decisions::kDisallowedTransition);

    auto result = make_loop()->run("conv-1");
    EXPECT_EQ(result.outcome, LoopOutcome::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, ErrorCode::InvalidPhaseTransition);

    auto after = snapshot();
    EXPECT_EQ(after.phase, "CHAT");
    EXPECT_FALSE(after.has_open_turn());
    EXPECT_TRUE(net->published().empty());
}

TEST_F(OrchestrationLoopTest, CompletionServiceFailureIsRecorded) {
    completion->should_fail = true;

    auto result = make_loop()->run("conv-1");
    EXPECT_EQ(result.outcome, LoopOutcome::Failed);
    EXPECT_EQ(result.error->kind(), ErrorKind::Completion);
    EXPECT_TRUE(has_audit(snapshot(), "routing_failure"));
}

TEST_F(OrchestrationLoopTest, PublishFailureClosesTurn) {
    completion->enqueue(decisions::kRouteToCoderExecute);
    net->fail_all_publishes = true;

    auto result = make_loop()->run("conv-1");
    EXPECT_EQ(result.outcome, LoopOutcome::Failed);
    EXPECT_EQ(result.error->code, ErrorCode::PublishFailed);

    auto after = snapshot();
    EXPECT_FALSE(after.has_open_turn());
    ASSERT_EQ(after.turns.size(), 1U);
    EXPECT_EQ(after.turns[0].closure, TurnClosure::Forced);
}

TEST_F(OrchestrationLoopTest, OpenTurnDefersRouting) {
    ASSERT_TRUE(store->open_turn("conv-1", "turn-old", {"coder"}, "from before").has_value());

    auto result = make_loop()->run("conv-1");
    EXPECT_EQ(result.outcome, LoopOutcome::Waiting);
    EXPECT_EQ(result.cycles, 0);
    EXPECT_EQ(completion->call_count(), 0U);
}

TEST_F(OrchestrationLoopTest, CycleLimitStopsEndlessRouting) {
    completion->default_response = decisions::kRouteToPair;
    AutoResponder responder(store, delegation, "conv-1");
    LoopOptions options;
    options.max_cycles = 2;

    auto result = make_loop(options)->run("conv-1");
    EXPECT_EQ(result.outcome, LoopOutcome::CycleLimit);
    EXPECT_EQ(result.cycles, 2);

    auto after = snapshot();
    EXPECT_EQ(after.turns.size(), 2U);
    EXPECT_TRUE(has_audit(after, "cycle_limit"));
}

TEST_F(OrchestrationLoopTest, DelegationTimeoutForceClosesAndContinues) {
    completion->enqueue(decisions::kRouteToPlanner);
    completion->enqueue(decisions::kEnd);
    LoopOptions options;
    options.delegation_timeout = 30ms;

    auto result = make_loop(options)->run("conv-1");
    EXPECT_EQ(result.outcome, LoopOutcome::Ended);
    EXPECT_EQ(result.cycles, 2);

    auto after = snapshot();
    ASSERT_EQ(after.turns.size(), 1U);
    EXPECT_EQ(after.turns[0].closure, TurnClosure::Forced);
    EXPECT_TRUE(has_audit(after, "delegation_cancelled"));
}

TEST_F(OrchestrationLoopTest, CancellationFlagStopsLoop) {
    auto cancelled = std::make_shared<std::atomic<bool>>(true);

    auto result = make_loop()->run("conv-1", cancelled);
    EXPECT_EQ(result.outcome, LoopOutcome::Cancelled);
    EXPECT_EQ(completion->call_count(), 0U);
}

TEST_F(OrchestrationLoopTest, CancelAllReleasesBlockedLoop) {
    completion->enqueue(decisions::kRouteToPlanner);
    auto loop = make_loop();

    auto run = std::async(std::launch::async, [&]() { return loop->run("conv-1"); });
    ASSERT_TRUE(wait_until([&]() { return delegation->pending_count() == 1; }));

    delegation->cancel_all("shutting down");
    auto result = run.get();
    EXPECT_EQ(result.outcome, LoopOutcome::Cancelled);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, ErrorCode::DelegationCancelled);
}

TEST_F(OrchestrationLoopTest, UnknownConversationFails) {
    auto result = make_loop()->run("missing");
    EXPECT_EQ(result.outcome, LoopOutcome::Failed);
    EXPECT_EQ(result.error->code, ErrorCode::UnknownConversation);
}

TEST_F(OrchestrationLoopTest, UnwaitedTurnTimesOutThenRoutingContinues) {
    ASSERT_TRUE(store->open_turn("conv-1", "turn-old", {"coder"}, "from before").has_value());
    LoopOptions options;
    options.delegation_timeout = 30ms;

    auto result = make_loop(options)->run("conv-1");
    EXPECT_EQ(result.outcome, LoopOutcome::Ended);
    EXPECT_EQ(result.cycles, 1);

    auto after = snapshot();
    EXPECT_FALSE(after.has_open_turn());
    ASSERT_EQ(after.turns.size(), 1U);
    EXPECT_EQ(after.turns[0].turn_id, "turn-old");
    EXPECT_EQ(after.turns[0].closure, TurnClosure::Forced);
    EXPECT_TRUE(has_audit(after, "delegation_cancelled"));
}

TEST_F(OrchestrationLoopTest, UnwaitedTurnResumesWhenAgentReports) {
    ASSERT_TRUE(store->open_turn("conv-1", "turn-old", {"coder"}, "from before").has_value());
    AutoResponder responder(store, delegation, "conv-1");
    LoopOptions options;
    options.delegation_timeout = 5s;

    auto result = make_loop(options)->run("conv-1");
    EXPECT_EQ(result.outcome, LoopOutcome::Ended);

    auto after = snapshot();
    ASSERT_EQ(after.turns.size(), 1U);
    EXPECT_EQ(after.turns[0].closure, TurnClosure::Covered);
    EXPECT_EQ(delegation->pending_count(), 0U);
}

TEST_F(OrchestrationLoopTest, CancellationDuringDecisionOpensNoTurn) {
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    completion->responder = [cancelled](const completion::CompletionRequest&) {
        cancelled->store(true);
        return decisions::kRouteToPlanner;
    };

    auto result = make_loop()->run("conv-1", cancelled);
    EXPECT_EQ(result.outcome, LoopOutcome::Cancelled);
    EXPECT_EQ(result.cycles, 1);

    auto after = snapshot();
    EXPECT_FALSE(after.has_open_turn());
    EXPECT_TRUE(after.turns.empty());
    EXPECT_EQ(after.phase, "CHAT");
    EXPECT_TRUE(net->published().empty());
}

TEST_F(OrchestrationLoopTest, ShutDownDelegationCancelsInsteadOfFailing) {
    completion->enqueue(decisions::kRouteToPair);
    delegation->shutdown("stopping");

    auto result = make_loop()->run("conv-1");
    EXPECT_EQ(result.outcome, LoopOutcome::Cancelled);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, ErrorCode::OrchestratorNotRunning);

    auto after = snapshot();
    EXPECT_FALSE(after.has_open_turn());
    EXPECT_FALSE(has_audit(after, "routing_failure"));
    EXPECT_TRUE(net->published().empty());
}
