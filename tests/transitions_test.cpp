#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../shared/cpp/ticket_sdk/include/transitions.hpp"

using namespace testing_support;

class TransitionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = dir_.file("tickets.db");
        store_ = std::make_unique<TicketStore>(db_path_);
        clock_.now = at("2026-01-05T10:30:00Z");
        engine_ = std::make_unique<TransitionEngine>(*store_, clock_.fn());
    }

    int stores_holding(const std::string& id) {
        int n = 0;
        for (Stage s : kAllStages) {
            if (store_->find(s, id)) ++n;
        }
        return n;
    }

    TempDir dir_;
    ManualClock clock_;
    std::string db_path_;
    std::unique_ptr<TicketStore> store_;
    std::unique_ptr<TransitionEngine> engine_;
};

TEST_F(TransitionEngineTest, ApproveDraftedKeepsDraftAndAttachesResolution) {
    const std::string reply = "Your account upgrade request has been processed successfully.";
    store_->insert(Stage::Drafted, make_drafted("TKT_0011", reply, 0.88));

    auto done = engine_->approve("TKT_0011", Stage::Drafted, "Sent to customer");
    EXPECT_EQ(done.resolution, std::optional<std::string>("Sent to customer"));

    auto stored = store_->find(Stage::Completed, "TKT_0011");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->resolution, std::optional<std::string>("Sent to customer"));
    EXPECT_EQ(stored->ai_drafted_response, std::optional<std::string>(reply));
    EXPECT_DOUBLE_EQ(stored->confidence.value_or(-1), 0.88);
    EXPECT_EQ(stored->used_policy, std::optional<std::string>("Subscription Upgrade Policy"));
    EXPECT_EQ(stored->metadata.closure_time, std::optional<TimePoint>(clock_.now));
    EXPECT_FALSE(store_->find(Stage::Drafted, "TKT_0011").has_value());
}

TEST_F(TransitionEngineTest, EscalateThenResolve) {
    store_->insert(Stage::Pending, make_pending("TKT_0005"));

    engine_->escalate("TKT_0005", Stage::Pending, std::string("Customer asked for a manager"));
    EXPECT_FALSE(store_->find(Stage::Pending, "TKT_0005").has_value());
    auto escalated = store_->find(Stage::Escalated, "TKT_0005");
    ASSERT_TRUE(escalated.has_value());
    EXPECT_EQ(escalated->issue, "Printer is offline");
    EXPECT_EQ(escalated->metadata.escalation_reason, std::optional<std::string>("Customer asked for a manager"));

    engine_->resolve("TKT_0005", "Refunded");
    EXPECT_FALSE(store_->find(Stage::Escalated, "TKT_0005").has_value());
    auto completed = store_->find(Stage::Completed, "TKT_0005");
    ASSERT_TRUE(completed.has_value());
    EXPECT_EQ(completed->resolution, std::optional<std::string>("Refunded"));
}

TEST_F(TransitionEngineTest, EscalatePreservesDraftFields) {
    store_->insert(Stage::Drafted, make_drafted("TKT_0012", "We will look into it.", 0.42));
    engine_->escalate("TKT_0012", Stage::Drafted);

    auto t = store_->find(Stage::Escalated, "TKT_0012");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->ai_drafted_response, std::optional<std::string>("We will look into it."));
    EXPECT_DOUBLE_EQ(t->confidence.value_or(-1), 0.42);
    EXPECT_EQ(t->metadata.tone, std::optional<std::string>("Professional"));
    EXPECT_FALSE(t->metadata.escalation_reason.has_value());
}

TEST_F(TransitionEngineTest, MissingSourceFailsClosed) {
    EXPECT_THROW(engine_->move("TKT_9999", Stage::Pending, Stage::Completed,
                               [](Ticket& t, TicketStore::Txn&) {
                                   t.resolution = "x";
                                   t.metadata.closure_time = Clock::now();
                               }),
                 NotFoundError);
    EXPECT_EQ(store_->count(Stage::Completed), 0u);

    EXPECT_THROW(engine_->approve("TKT_9999", Stage::Drafted, "Sent"), NotFoundError);
    EXPECT_EQ(store_->count(Stage::Completed), 0u);
}

TEST_F(TransitionEngineTest, SecondMoverSeesNotFound) {
    store_->insert(Stage::Pending, make_pending("TKT_0001"));
    engine_->escalate("TKT_0001", Stage::Pending);
    EXPECT_THROW(engine_->escalate("TKT_0001", Stage::Pending), NotFoundError);
    EXPECT_EQ(stores_holding("TKT_0001"), 1);
}

TEST_F(TransitionEngineTest, DisallowedEdgesAreRejected) {
    EXPECT_FALSE(TransitionEngine::allowed(Stage::Completed, Stage::Pending));
    EXPECT_FALSE(TransitionEngine::allowed(Stage::Escalated, Stage::Drafted));
    EXPECT_FALSE(TransitionEngine::allowed(Stage::Drafted, Stage::Pending));
    EXPECT_TRUE(TransitionEngine::allowed(Stage::Pending, Stage::Completed));

    store_->insert(Stage::Escalated, make_pending("TKT_0031"));
    EXPECT_THROW(engine_->escalate("TKT_0031", Stage::Escalated), std::invalid_argument);
    EXPECT_THROW(engine_->approve("TKT_0031", Stage::Completed, "x"), std::invalid_argument);
    EXPECT_TRUE(store_->find(Stage::Escalated, "TKT_0031").has_value());
}

TEST_F(TransitionEngineTest, FailedEnrichmentRollsBackTheMove) {
    store_->insert(Stage::Pending, make_pending("TKT_0001"));
    EXPECT_THROW(engine_->move("TKT_0001", Stage::Pending, Stage::Escalated,
                               [](Ticket&, TicketStore::Txn&) { throw std::runtime_error("boom"); }),
                 std::runtime_error);
    EXPECT_TRUE(store_->find(Stage::Pending, "TKT_0001").has_value());
    EXPECT_EQ(store_->count(Stage::Escalated), 0u);
}

TEST_F(TransitionEngineTest, DestinationRejectionKeepsSource) {
    store_->insert(Stage::Pending, make_pending("TKT_0001"));
    // No resolution attached: completed refuses the record.
    EXPECT_THROW(engine_->move("TKT_0001", Stage::Pending, Stage::Completed), SchemaError);
    EXPECT_TRUE(store_->find(Stage::Pending, "TKT_0001").has_value());
}

TEST_F(TransitionEngineTest, EscalatedWithoutEvidenceGetsManualDefaults) {
    store_->insert(Stage::Escalated, make_pending("TKT_0033"));
    auto done = engine_->resolve("TKT_0033", "Called the customer back");

    EXPECT_EQ(done.ai_drafted_response, std::optional<std::string>(kManualHandlingNote));
    EXPECT_EQ(done.used_policy, std::optional<std::string>(kManualHandlingNote));
    EXPECT_EQ(done.used_reference_ticket_id, std::optional<std::string>(kManualHandlingNote));
    EXPECT_TRUE(done.handled_manually);

    auto stored = store_->find(Stage::Completed, "TKT_0033");
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->handled_manually);
    EXPECT_EQ(ticket_to_json(*stored)["confidence"], kManualHandlingNote);
}

TEST_F(TransitionEngineTest, EscalatedEvidenceIsKept) {
    auto t = make_drafted("TKT_0034", "This ticket is Escalated.", 0.65);
    store_->insert(Stage::Escalated, t);
    auto done = engine_->resolve("TKT_0034", "Refunded");
    EXPECT_EQ(done.ai_drafted_response, std::optional<std::string>("This ticket is Escalated."));
    EXPECT_DOUBLE_EQ(done.confidence.value_or(-1), 0.65);
    EXPECT_FALSE(done.handled_manually);
}

TEST_F(TransitionEngineTest, ApproveUndraftedPendingHasNoDraft) {
    store_->insert(Stage::Pending, make_pending("TKT_0002"));
    auto done = engine_->approve("TKT_0002", Stage::Pending, "Rebooted router");
    EXPECT_FALSE(done.ai_drafted_response.has_value());
    EXPECT_FALSE(done.confidence.has_value());
    EXPECT_FALSE(done.metadata.tone.has_value());
    EXPECT_TRUE(store_->find(Stage::Completed, "TKT_0002").has_value());
}

TEST_F(TransitionEngineTest, ApproveDraftedPendingJoinsStrayDraftedRecord) {
    auto pending = make_pending("TKT_0003");
    pending.metadata.is_drafted = true;
    raw_insert(db_path_, Stage::Pending, pending);
    raw_insert(db_path_, Stage::Drafted, make_drafted("TKT_0003", "Please restart the device.", 0.77));

    auto done = engine_->approve("TKT_0003", Stage::Pending, "Customer confirmed fix");
    EXPECT_EQ(done.ai_drafted_response, std::optional<std::string>("Please restart the device."));
    EXPECT_DOUBLE_EQ(done.confidence.value_or(-1), 0.77);
    EXPECT_EQ(stores_holding("TKT_0003"), 1);
    EXPECT_TRUE(store_->find(Stage::Completed, "TKT_0003").has_value());
}

TEST_F(TransitionEngineTest, ClaimedButUndraftedPendingApprovesWithoutDraft) {
    auto pending = make_pending("TKT_0004");
    pending.metadata.is_drafted = true;
    pending.metadata.claimed_by = "drafter-1";
    store_->insert(Stage::Pending, pending);

    auto done = engine_->approve("TKT_0004", Stage::Pending, "Handled by phone");
    EXPECT_FALSE(done.ai_drafted_response.has_value());
    EXPECT_FALSE(done.metadata.claimed_by.has_value());
}

TEST_F(TransitionEngineTest, RecordDraftMovesClaimedTicket) {
    auto pending = make_pending("TKT_0006");
    pending.metadata.is_drafted = true;
    pending.metadata.claimed_by = "drafter-1";
    pending.metadata.claimed_at = clock_.now;
    store_->insert(Stage::Pending, pending);

    DraftResult draft;
    draft.reply = "Please power-cycle the printer.";
    draft.tone = "polite";
    draft.confidence = 0.8;
    draft.used_policy = std::string("Printer Policy");
    engine_->record_draft("TKT_0006", draft);

    auto t = store_->find(Stage::Drafted, "TKT_0006");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->ai_drafted_response, std::optional<std::string>("Please power-cycle the printer."));
    EXPECT_EQ(t->metadata.tone, std::optional<std::string>("polite"));
    EXPECT_TRUE(t->metadata.is_drafted);
    EXPECT_FALSE(t->metadata.claimed_by.has_value());
    EXPECT_FALSE(t->used_reference_ticket_id.has_value());
    EXPECT_FALSE(store_->find(Stage::Pending, "TKT_0006").has_value());
}

TEST_F(TransitionEngineTest, CreateRejectsIdsLiveElsewhere) {
    engine_->create(Stage::Escalated, make_pending("TKT_0050"));
    EXPECT_THROW(engine_->create(Stage::Pending, make_pending("TKT_0050")), DuplicateError);

    Ticket fresh = make_pending("TKT_0051");
    fresh.metadata.creation_time = TimePoint{};
    auto created = engine_->create(Stage::Pending, fresh);
    EXPECT_EQ(created.metadata.creation_time, clock_.now);
}

TEST_F(TransitionEngineTest, EveryTicketLivesInExactlyOneStore) {
    for (int i = 1; i <= 6; ++i) store_->insert(Stage::Pending, make_pending("TKT_000" + std::to_string(i)));
    store_->insert(Stage::Drafted, make_drafted("TKT_0011", "reply", 0.9));

    engine_->escalate("TKT_0001", Stage::Pending);
    engine_->approve("TKT_0002", Stage::Pending, "done");
    engine_->escalate("TKT_0011", Stage::Drafted);
    engine_->resolve("TKT_0011", "done");
    engine_->resolve("TKT_0001", "done");
    EXPECT_THROW(engine_->approve("TKT_0003", Stage::Drafted, "wrong store"), NotFoundError);

    for (const char* id : {"TKT_0001", "TKT_0002", "TKT_0003", "TKT_0004", "TKT_0005", "TKT_0006", "TKT_0011"}) {
        EXPECT_EQ(stores_holding(id), 1) << id;
    }
    EXPECT_EQ(store_->count(Stage::Completed), 3u);
    EXPECT_EQ(store_->count(Stage::Pending), 4u);
}
