#include <gtest/gtest.h>
#include "maestro/ingestion/ingestion_layer.hpp"
#include "mocks/mock_event_ledger.hpp"
#include "mocks/mock_event_network.hpp"
#include "fixtures/agent_roster.hpp"

#include <future>
#include <stdexcept>
#include <thread>

using namespace maestro;
using namespace maestro::ingestion;
using namespace maestro::network;
using namespace maestro::testing;
using namespace std::chrono_literals;

namespace {

Event make_event(const std::string& id, const std::string& pubkey, int kind, std::vector<Tag> tags = {}) {
    Event event;
    event.id = id;
    event.pubkey = pubkey;
    event.kind = kind;
    event.created_at = 1700000000;
    event.tags = std::move(tags);
    event.content = "content of " + id;
    return event;
}

} // namespace

// ============================================================================
// Classification
// ============================================================================

TEST(EventClassifierTest, ClassifiesByKindTagsAndAuthor) {
    auto roster = make_roster();

    EXPECT_EQ(classify(make_event("1", "pk-user", kinds::kTextNote), *roster), EventClass::Message);
    EXPECT_EQ(classify(make_event("2", "pk-user", kinds::kGenericReply), *roster), EventClass::Message);
    EXPECT_EQ(classify(make_event("3", "pk-coder", kinds::kGenericReply,
                                  {{"status", "completed"}, {"turn", "t1"}}), *roster),
              EventClass::Completion);
    EXPECT_EQ(classify(make_event("4", "pk-coder", kinds::kGenericReply, {{"status", "compiling"}}), *roster),
              EventClass::Status);
    EXPECT_EQ(classify(make_event("5", "pk-coder", kinds::kAgentLesson), *roster), EventClass::Auxiliary);

    for (int kind : {kinds::kStreamingResponse, kinds::kTypingStart, kinds::kTypingStop,
                     kinds::kProjectStatus, kinds::kOperationsStatus, 0}) {
        EXPECT_EQ(classify(make_event("x", "pk-coder", kind), *roster), EventClass::Ignored) << kind;
    }
}

TEST(EventClassifierTest, CompletionShapesFromStrangersAreMessages) {
    auto roster = make_roster();
    EXPECT_EQ(classify(make_event("1", "pk-user", kinds::kGenericReply,
                                  {{"status", "completed"}, {"turn", "t1"}}), *roster),
              EventClass::Message);
    EXPECT_EQ(classify(make_event("2", "pk-coder", kinds::kGenericReply, {{"status", "completed"}}), *roster),
              EventClass::Message);
}

// ============================================================================
// IngestionLayer
// ============================================================================

class IngestionLayerTest : public ::testing::Test {
protected:
    void SetUp() override {
        net = std::make_shared<MockEventNetwork>();
        ledger = std::make_shared<MockEventLedger>();
        context.agents = make_roster();
        context.network = net;
        context.with_defaults();
    }

    std::unique_ptr<IngestionLayer> make_layer(bool verify = false,
                                               std::chrono::milliseconds interval = std::chrono::milliseconds(1000)) {
        IngestionLayer::Options options;
        options.verify_signatures = verify;
        options.flush_interval = interval;
        auto layer = std::make_unique<IngestionLayer>(context, ledger, options);
        layer->on(EventClass::Message, [this](const Event& event) { messages.push_back(event.id); });
        layer->on(EventClass::Completion, [this](const Event& event) { completions.push_back(event.id); });
        return layer;
    }

    std::vector<Filter> filters() const {
        Filter filter;
        filter.kinds = {kinds::kTextNote, kinds::kGenericReply, kinds::kAgentLesson};
        return {filter};
    }

    RuntimeContext context;
    std::shared_ptr<MockEventNetwork> net;
    std::shared_ptr<MockEventLedger> ledger;
    std::vector<std::string> messages;
    std::vector<std::string> completions;
};

TEST_F(IngestionLayerTest, DuplicateDeliveryReachesHandlerOnce) {
    auto layer = make_layer();
    ASSERT_TRUE(layer->start(filters()).has_value());
    EXPECT_EQ(net->subscription_count(), 1U);

    const auto event = make_event("evt-1", "pk-user", kinds::kTextNote);
    EXPECT_EQ(net->inject(event), 1U);
    EXPECT_EQ(net->inject(event), 1U);

    EXPECT_EQ(messages, std::vector<std::string>{"evt-1"});
    EXPECT_EQ(ledger->pending_count(), 1U);
    auto stats = layer->stats();
    EXPECT_EQ(stats.received, 2U);
    EXPECT_EQ(stats.duplicates, 1U);
    EXPECT_EQ(stats.dispatched, 1U);
}

TEST_F(IngestionLayerTest, LedgerSurvivesRestart) {
    {
        auto layer = make_layer();
        ASSERT_TRUE(layer->start(filters()).has_value());
        net->inject(make_event("evt-1", "pk-user", kinds::kTextNote));
        ASSERT_TRUE(layer->stop().has_value());
    }
    EXPECT_EQ(ledger->durable.count("evt-1"), 1U);
    EXPECT_EQ(net->subscription_count(), 0U);

    auto restarted = std::make_shared<MockEventLedger>();
    restarted->durable = ledger->durable;
    ledger = restarted;
    messages.clear();

    auto layer = make_layer();
    ASSERT_TRUE(layer->start(filters()).has_value());
    net->inject(make_event("evt-1", "pk-user", kinds::kTextNote));
    net->inject(make_event("evt-2", "pk-user", kinds::kTextNote));
    EXPECT_EQ(messages, std::vector<std::string>{"evt-2"});
}

TEST_F(IngestionLayerTest, EventsBeforeStartAreDropped) {
    auto layer = make_layer();
    layer->ingest(make_event("evt-1", "pk-user", kinds::kTextNote));
    EXPECT_TRUE(messages.empty());
    EXPECT_FALSE(ledger->contains("evt-1"));
}

TEST_F(IngestionLayerTest, DispatchesByClass) {
    auto layer = make_layer();
    ASSERT_TRUE(layer->start(filters()).has_value());

    net->inject(make_event("msg", "pk-user", kinds::kTextNote));
    net->inject(make_event("done", "pk-coder", kinds::kGenericReply, {{"status", "completed"}, {"turn", "t1"}}));
    layer->ingest(make_event("typing", "pk-coder", kinds::kTypingStart));

    EXPECT_EQ(messages, std::vector<std::string>{"msg"});
    EXPECT_EQ(completions, std::vector<std::string>{"done"});
    EXPECT_EQ(layer->stats().ignored, 1U);
    EXPECT_TRUE(ledger->contains("typing"));
}

TEST_F(IngestionLayerTest, ThrowingHandlerStillMarksEvent) {
    auto layer = make_layer();
    int calls = 0;
    layer->on(EventClass::Message, [&calls](const Event&) {
        ++calls;
        throw std::runtime_error("handler exploded");
    });
    ASSERT_TRUE(layer->start(filters()).has_value());

    const auto event = make_event("evt-1", "pk-user", kinds::kTextNote);
    net->inject(event);
    net->inject(event);

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(ledger->contains("evt-1"));
    EXPECT_EQ(layer->stats().handler_failures, 1U);
}

TEST_F(IngestionLayerTest, SignaturesAreVerifiedWhenEnabled) {
    auto signer = SchnorrSigner::generate();
    ASSERT_TRUE(signer.has_value());
    auto layer = make_layer(true);
    ASSERT_TRUE(layer->start(filters()).has_value());

    Event draft;
    draft.kind = kinds::kTextNote;
    draft.content = "Build a CLI";
    auto signed_event = finalize_event(draft, **signer);
    ASSERT_TRUE(signed_event.has_value());

    auto forged = *signed_event;
    forged.content = "Delete everything";

    net->inject(forged);
    net->inject(*signed_event);

    EXPECT_EQ(messages, std::vector<std::string>{signed_event->id});
    EXPECT_EQ(layer->stats().invalid, 1U);
}

TEST_F(IngestionLayerTest, EventsWithoutIdAreInvalid) {
    auto layer = make_layer();
    ASSERT_TRUE(layer->start(filters()).has_value());
    layer->ingest(make_event("", "pk-user", kinds::kTextNote));
    EXPECT_TRUE(messages.empty());
    EXPECT_EQ(layer->stats().invalid, 1U);
}

TEST_F(IngestionLayerTest, PeriodicFlushPersistsEntries) {
    auto layer = make_layer(false, std::chrono::milliseconds(10));
    ASSERT_TRUE(layer->start(filters()).has_value());
    net->inject(make_event("evt-1", "pk-user", kinds::kTextNote));

    EXPECT_TRUE(wait_until([&]() { return ledger->pending_count() == 0; }));
    EXPECT_GE(ledger->flush_calls(), 1);
}

TEST_F(IngestionLayerTest, FlushFailureRaisesAlertAndKeepsEntriesPending) {
    std::vector<ErrorCode> alerts;
    auto layer = make_layer();
    layer->set_alert_callback([&alerts](const Error& error) { alerts.push_back(error.code); });
    ASSERT_TRUE(layer->start(filters()).has_value());
    net->inject(make_event("evt-1", "pk-user", kinds::kTextNote));

    ledger->should_fail_flush = true;
    auto stopped = layer->stop();
    ASSERT_FALSE(stopped.has_value());
    EXPECT_EQ(stopped.error().code, ErrorCode::LedgerFlushFailed);
    ASSERT_EQ(alerts.size(), 1U);
    EXPECT_EQ(alerts[0], ErrorCode::LedgerFlushFailed);
    EXPECT_EQ(ledger->pending_count(), 1U);

    ledger->should_fail_flush = false;
    auto retried = layer->flush();
    ASSERT_TRUE(retried.has_value());
    EXPECT_EQ(*retried, 1U);
}

TEST_F(IngestionLayerTest, StartFailures) {
    ledger->should_fail_load = true;
    auto layer = make_layer();
    auto no_ledger = layer->start(filters());
    ASSERT_FALSE(no_ledger.has_value());
    EXPECT_EQ(no_ledger.error().code, ErrorCode::PersistenceFailed);
    EXPECT_FALSE(layer->is_running());

    ledger->should_fail_load = false;
    net->should_fail_subscribe = true;
    auto no_subscription = layer->start(filters());
    ASSERT_FALSE(no_subscription.has_value());
    EXPECT_EQ(no_subscription.error().code, ErrorCode::SubscribeFailed);
    EXPECT_FALSE(layer->is_running());
}

TEST_F(IngestionLayerTest, InvalidUtf8EventIsCountedInvalid) {
    for (bool verify : {false, true}) {
        ledger = std::make_shared<MockEventLedger>();
        auto layer = make_layer(verify);
        ASSERT_TRUE(layer->start(filters()).has_value());

        auto event = make_event("evt-bad", "pk-user", kinds::kTextNote);
        event.content = "bad \xff\xfe bytes";
        EXPECT_NO_THROW(layer->ingest(event));

        EXPECT_EQ(layer->stats().invalid, 1U) << "verify=" << verify;
        EXPECT_EQ(layer->stats().dispatched, 0U);
        EXPECT_FALSE(ledger->contains("evt-bad"));
        EXPECT_TRUE(messages.empty());
        ASSERT_TRUE(layer->stop().has_value());
    }
}

TEST_F(IngestionLayerTest, StopWaitsForIngestInProgress) {
    std::promise<void> entered;
    std::promise<void> release;
    auto released = release.get_future().share();

    IngestionLayer::Options options;
    options.verify_signatures = false;
    auto layer = std::make_unique<IngestionLayer>(context, ledger, options);
    layer->on(EventClass::Message, [&](const Event& event) {
        entered.set_value();
        released.wait();
        messages.push_back(event.id);
    });
    ASSERT_TRUE(layer->start(filters()).has_value());

    std::thread relay([&]() { net->inject(make_event("evt-slow", "pk-user", kinds::kTextNote)); });
    entered.get_future().wait();

    auto stopping = std::async(std::launch::async, [&]() { return layer->stop(); });
    EXPECT_EQ(stopping.wait_for(100ms), std::future_status::timeout);

    release.set_value();
    ASSERT_EQ(stopping.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(stopping.get().has_value());
    relay.join();

    EXPECT_EQ(messages, std::vector<std::string>{"evt-slow"});
    EXPECT_EQ(ledger->durable.count("evt-slow"), 1U);
    EXPECT_EQ(ledger->pending_count(), 0U);
    EXPECT_FALSE(layer->is_running());
}
