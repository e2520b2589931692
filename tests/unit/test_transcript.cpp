#include <gtest/gtest.h>
#include "maestro/engine/transcript.hpp"

using namespace maestro;
using namespace maestro::engine;

namespace {

Conversation make_conversation() {
    Conversation conversation;
    conversation.id = "conv-1";
    conversation.history.push_back(HistoryEntry{"evt-root", "pk-user", HistoryRole::User, "Build a CLI", 1, 10});
    return conversation;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(TranscriptTest, EmptyConversationHasPlaceholderAndRequest) {
    auto conversation = make_conversation();
    auto lines = transcript(conversation);

    ASSERT_EQ(lines.size(), 2U);
    EXPECT_EQ(lines[0].role, Role::User);
    EXPECT_EQ(lines[0].content, "No agents have been routed yet.");
    EXPECT_EQ(lines[1].content, "ORIGINAL USER REQUEST:\nBuild a CLI");
}

TEST(TranscriptTest, TurnsAppearInOrderWithRoles) {
    auto conversation = make_conversation();
    ASSERT_TRUE(conversation.open_turn("turn-1", {"planner"}, "needs a plan", 20).has_value());
    ASSERT_TRUE(conversation.record_completion("turn-1", Completion{"planner", "1. parse args", 30, "evt-p", false},
                                               CompletionPolicy::Reject, 30).has_value());
    ASSERT_TRUE(conversation.open_turn("turn-2", {"coder", "reviewer"}, "implement and review", 40).has_value());
    ASSERT_TRUE(conversation.record_completion("turn-2", Completion{"coder", "main.cpp written", 50, "evt-c", false},
                                               CompletionPolicy::Reject, 50).has_value());

    auto lines = transcript(conversation);
    ASSERT_EQ(lines.size(), 6U);

    EXPECT_EQ(lines[0].role, Role::Assistant);
    EXPECT_TRUE(contains(lines[0].content, "Turn 1 [CHAT] routed to: planner"));
    EXPECT_TRUE(contains(lines[0].content, "Reason: needs a plan"));
    EXPECT_EQ(lines[1].role, Role::User);
    EXPECT_EQ(lines[1].content, "[planner completed]\n1. parse args");

    EXPECT_EQ(lines[2].role, Role::Assistant);
    EXPECT_TRUE(contains(lines[2].content, "Turn 2 [CHAT] routed to: coder, reviewer (CURRENT)"));
    EXPECT_EQ(lines[3].content, "[coder completed]\nmain.cpp written");
    EXPECT_EQ(lines[4].content, "Waiting for agent responses: reviewer");
    EXPECT_EQ(lines[5].content, "ORIGINAL USER REQUEST:\nBuild a CLI");
}

TEST(TranscriptTest, ForcedTurnAndLatestUserMessage) {
    auto conversation = make_conversation();
    ASSERT_TRUE(conversation.open_turn("turn-1", {"coder"}, "write it", 20).has_value());
    ASSERT_TRUE(conversation.force_close_turn("cancelled", 25).has_value());
    conversation.history.push_back(HistoryEntry{"evt-2", "pk-user", HistoryRole::User, "Use Python instead", 1, 26});

    auto lines = transcript(conversation);
    ASSERT_EQ(lines.size(), 4U);
    EXPECT_EQ(lines[1].content, "Turn closed before all agents reported: cancelled");
    EXPECT_EQ(lines[2].content, "ORIGINAL USER REQUEST:\nBuild a CLI");
    EXPECT_EQ(lines[3].content, "LATEST USER MESSAGE:\nUse Python instead");
}

TEST(TranscriptTest, UnsolicitedCompletionsAreMarked) {
    auto conversation = make_conversation();
    ASSERT_TRUE(conversation.open_turn("turn-1", {"coder"}, "write it", 20).has_value());
    ASSERT_TRUE(conversation.record_completion("turn-1", Completion{"reviewer", "looks risky", 21, "evt-r", false},
                                               CompletionPolicy::RecordAnyway, 21).has_value());

    auto lines = transcript(conversation);
    EXPECT_EQ(lines[1].content, "[reviewer reported, unsolicited]\nlooks risky");
    EXPECT_EQ(lines[2].content, "Waiting for agent responses: coder");
}

TEST(TranscriptTest, IsPureFunctionOfConversation) {
    auto conversation = make_conversation();
    ASSERT_TRUE(conversation.open_turn("turn-1", {"planner"}, "plan", 20).has_value());
    const Conversation before = conversation;

    auto first = transcript(conversation);
    auto second = transcript(conversation);

    EXPECT_EQ(first, second);
    EXPECT_EQ(conversation.current_turn, before.current_turn);
    EXPECT_EQ(conversation.history, before.history);
}

TEST(TranscriptTest, RoutingContextCarriesPhaseAndTransitions) {
    auto conversation = make_conversation();
    conversation.phase = "PLAN";
    conversation.phase_transitions.push_back(PhaseTransition{"CHAT", "PLAN", 15, "orchestrator", "needs a plan", ""});

    auto text = render_routing_context(conversation);
    EXPECT_TRUE(contains(text, "Current phase: PLAN"));
    EXPECT_TRUE(contains(text, "WORKFLOW HISTORY:"));
    EXPECT_TRUE(contains(text, "ORIGINAL USER REQUEST:\nBuild a CLI"));
    EXPECT_TRUE(contains(text, "- CHAT -> PLAN: needs a plan"));
}
