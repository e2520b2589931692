#include <gtest/gtest.h>
#include "maestro/engine/phase_state_machine.hpp"

#include <algorithm>
#include <map>
#include <set>

using namespace maestro;
using namespace maestro::engine;

class PhaseStateMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog = std::make_shared<PhaseCatalog>();
        machine = std::make_unique<PhaseStateMachine>(catalog);
        conversation.id = "conv-1";
        conversation.phase = phases::kChat;
        conversation.history.push_back(HistoryEntry{"evt-1", "pk-user", HistoryRole::User, "Build a CLI", 1, 100});
    }

    std::shared_ptr<PhaseCatalog> catalog;
    std::unique_ptr<PhaseStateMachine> machine;
    Conversation conversation;
};

// ============================================================================
// Catalog
// ============================================================================

TEST(PhaseCatalogTest, StandardGraph) {
    PhaseCatalog catalog;
    EXPECT_TRUE(catalog.can_transition(phases::kChat, phases::kPlan));
    EXPECT_TRUE(catalog.can_transition(phases::kPlan, phases::kExecute));
    EXPECT_TRUE(catalog.can_transition(phases::kExecute, phases::kVerification));
    EXPECT_TRUE(catalog.can_transition(phases::kVerification, phases::kExecute));
    EXPECT_TRUE(catalog.can_transition(phases::kVerification, phases::kChores));
    EXPECT_TRUE(catalog.can_transition(phases::kChores, phases::kReflection));

    EXPECT_FALSE(catalog.can_transition(phases::kChat, phases::kVerification));
    EXPECT_FALSE(catalog.can_transition(phases::kChat, phases::kChores));
    EXPECT_FALSE(catalog.can_transition(phases::kPlan, phases::kVerification));
    EXPECT_FALSE(catalog.can_transition(phases::kChores, phases::kExecute));
    EXPECT_FALSE(catalog.can_transition(phases::kChat, "NOWHERE"));
}

TEST(PhaseCatalogTest, SamePhaseIsAllowed) {
    PhaseCatalog catalog;
    for (const auto& name : catalog.names()) {
        EXPECT_TRUE(catalog.can_transition(name, name)) << name;
    }
}

TEST(PhaseCatalogTest, CustomPhaseRegistration) {
    PhaseCatalog catalog;

    auto missing_instructions = catalog.register_custom_phase("SECURITY_AUDIT", "");
    ASSERT_FALSE(missing_instructions.has_value());
    EXPECT_EQ(missing_instructions.error().kind(), ErrorKind::Validation);

    auto shadowing = catalog.register_custom_phase(phases::kPlan, "Plan differently");
    EXPECT_FALSE(shadowing.has_value());

    auto end = catalog.register_custom_phase("END", "Stop");
    EXPECT_FALSE(end.has_value());

    ASSERT_TRUE(catalog.register_custom_phase("SECURITY_AUDIT", "Audit dependencies for CVEs").has_value());
    EXPECT_TRUE(catalog.is_known("SECURITY_AUDIT"));
    EXPECT_TRUE(catalog.is_custom("SECURITY_AUDIT"));
    EXPECT_FALSE(catalog.is_custom(phases::kPlan));
    EXPECT_EQ(catalog.names().back(), "SECURITY_AUDIT");

    EXPECT_TRUE(catalog.can_transition(phases::kChores, "SECURITY_AUDIT"));
    EXPECT_TRUE(catalog.can_transition("SECURITY_AUDIT", phases::kChat));

    auto successors = catalog.successors(phases::kChat);
    EXPECT_NE(std::find(successors.begin(), successors.end(), "SECURITY_AUDIT"), successors.end());
    EXPECT_EQ(std::find(successors.begin(), successors.end(), phases::kChores), successors.end());
}

// ============================================================================
// Transitions
// ============================================================================

TEST_F(PhaseStateMachineTest, ValidTransitionAppendsRecord) {
    auto transition = machine->transition(conversation, phases::kPlan, "", "orchestrator", "need a plan", 200);
    ASSERT_TRUE(transition.has_value()) << transition.error().to_string();

    EXPECT_EQ(transition->from, phases::kChat);
    EXPECT_EQ(transition->to, phases::kPlan);
    EXPECT_EQ(transition->initiating_agent, "orchestrator");
    EXPECT_EQ(transition->reason, "need a plan");
    EXPECT_EQ(transition->instructions, catalog->rule(phases::kPlan)->instructions);

    EXPECT_EQ(conversation.phase, phases::kPlan);
    EXPECT_EQ(conversation.phase_started_at, 200);
    ASSERT_EQ(conversation.phase_transitions.size(), 1U);
    EXPECT_EQ(conversation.phase_transitions[0], *transition);
}

TEST_F(PhaseStateMachineTest, InvalidTransitionLeavesStateUnchanged) {
    ASSERT_TRUE(conversation.open_turn("turn-1", {"coder"}, "start", 150).has_value());
    const auto before_turn = conversation.current_turn;

    auto disallowed = machine->transition(conversation, phases::kChores, "", "orchestrator", "skip", 200);
    ASSERT_FALSE(disallowed.has_value());
    EXPECT_EQ(disallowed.error().code, ErrorCode::InvalidPhaseTransition);
    EXPECT_EQ(disallowed.error().kind(), ErrorKind::Validation);

    auto unknown = machine->transition(conversation, "DEPLOY", "", "orchestrator", "ship", 200);
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::UnknownPhase);

    EXPECT_EQ(conversation.phase, phases::kChat);
    EXPECT_TRUE(conversation.phase_transitions.empty());
    EXPECT_EQ(conversation.current_turn, before_turn);
    EXPECT_TRUE(conversation.turns.empty());
    EXPECT_TRUE(conversation.audit.empty());
}

TEST_F(PhaseStateMachineTest, EveryPairOutsideTheGraphIsRejected) {
    using namespace phases;
    const std::map<std::string, std::set<std::string>> graph = {
        {kChat, {kChat, kBrainstorm, kPlan, kExecute, kReflection}},
        {kBrainstorm, {kBrainstorm, kChat, kPlan, kExecute}},
        {kPlan, {kPlan, kChat, kExecute, kReflection}},
        {kExecute, {kExecute, kChat, kPlan, kVerification, kReflection}},
        {kVerification, {kVerification, kChat, kExecute, kChores}},
        {kChores, {kChores, kVerification, kReflection}},
        {kReflection, {kReflection, kChat, kPlan, kExecute}},
    };
    ASSERT_EQ(catalog->names().size(), graph.size());

    int rejected = 0;
    for (const auto& from : catalog->names()) {
        for (const auto& to : catalog->names()) {
            Conversation subject;
            subject.id = "conv-" + from + "-" + to;
            subject.phase = from;
            ASSERT_TRUE(subject.open_turn("turn-1", {"coder"}, "work", 150).has_value());

            auto result = machine->transition(subject, to, "", "orchestrator", "move", 200);
            if (graph.at(from).count(to) > 0) {
                ASSERT_TRUE(result.has_value()) << from << " -> " << to;
                EXPECT_EQ(subject.phase, to);
                EXPECT_EQ(subject.phase_transitions.size(), 1u);
                continue;
            }

            ++rejected;
            ASSERT_FALSE(result.has_value()) << from << " -> " << to;
            EXPECT_EQ(result.error().code, ErrorCode::InvalidPhaseTransition) << from << " -> " << to;
            EXPECT_EQ(subject.phase, from);
            EXPECT_TRUE(subject.phase_transitions.empty());
            EXPECT_TRUE(subject.has_open_turn()) << from << " -> " << to;
            EXPECT_TRUE(subject.turns.empty());
        }
    }
    EXPECT_EQ(rejected, 20);
}

TEST_F(PhaseStateMachineTest, TransitionForceClosesOpenTurn) {
    ASSERT_TRUE(conversation.open_turn("turn-1", {"planner", "coder"}, "start", 150).has_value());
    Completion done{"planner", "plan ready", 160, "evt-2", false};
    ASSERT_TRUE(conversation.record_completion("turn-1", done, CompletionPolicy::Reject, 160).has_value());

    auto transition = machine->transition(conversation, phases::kPlan, "", "operator", "manual", 200);
    ASSERT_TRUE(transition.has_value());

    EXPECT_FALSE(conversation.has_open_turn());
    ASSERT_EQ(conversation.turns.size(), 1U);
    const auto& closed = conversation.turns[0];
    EXPECT_TRUE(closed.is_completed);
    EXPECT_EQ(closed.closure, TurnClosure::Forced);
    EXPECT_EQ(closed.completions.size(), 1U);
    EXPECT_EQ(closed.pending_agents(), std::vector<std::string>{"coder"});
    ASSERT_EQ(conversation.audit.size(), 1U);
    EXPECT_EQ(conversation.audit[0].kind, "turn_forced");
}

TEST_F(PhaseStateMachineTest, DecisionWithPhaseChangeThenTurn) {
    auto transition = machine->transition(conversation, phases::kPlan, "", "orchestrator", "need a plan", 200);
    ASSERT_TRUE(transition.has_value());
    auto turn = conversation.open_turn("turn-1", {"planner"}, "need a plan", 200);
    ASSERT_TRUE(turn.has_value());

    EXPECT_EQ(conversation.phase, "PLAN");
    ASSERT_TRUE(conversation.has_open_turn());
    EXPECT_EQ(conversation.current_turn->agents, std::vector<std::string>{"planner"});
    EXPECT_EQ(conversation.current_turn->phase, "PLAN");
    EXPECT_TRUE(conversation.turns.empty());
}

TEST_F(PhaseStateMachineTest, SamePhaseHandoffKeepsPhase) {
    conversation.phase_started_at = 50;
    auto transition = machine->transition(conversation, phases::kChat, "", "orchestrator", "handoff", 200);
    ASSERT_TRUE(transition.has_value());
    EXPECT_EQ(transition->from, transition->to);
    EXPECT_EQ(conversation.phase, phases::kChat);
    EXPECT_EQ(conversation.phase_started_at, 50);
    EXPECT_EQ(conversation.phase_transitions.size(), 1U);
}

TEST_F(PhaseStateMachineTest, CustomPhaseCarriesInstructions) {
    ASSERT_TRUE(catalog->register_custom_phase("SECURITY_AUDIT", "Audit dependencies").has_value());

    auto defaulted = machine->transition(conversation, "SECURITY_AUDIT", "", "orchestrator", "audit", 200);
    ASSERT_TRUE(defaulted.has_value());
    EXPECT_EQ(defaulted->instructions, "Audit dependencies");

    auto overridden = machine->transition(conversation, phases::kChat, "Summarise findings", "operator", "back", 300);
    ASSERT_TRUE(overridden.has_value());
    EXPECT_EQ(overridden->instructions, "Summarise findings");
    EXPECT_EQ(conversation.phase, phases::kChat);
}

TEST_F(PhaseStateMachineTest, CloseTurnWithoutOpenTurnIsNoop) {
    auto closed = machine->close_turn(conversation, "nothing open", 200);
    EXPECT_FALSE(closed.has_value());
    EXPECT_TRUE(conversation.audit.empty());
}
