#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../services/review/include/sample_data.hpp"

using namespace testing_support;

TEST(SampleDataTest, FortyTicketsTenPerStore) {
    auto tickets = sample_tickets();
    ASSERT_EQ(tickets.size(), 40u);
    std::array<int, 4> per_stage{};
    for (const auto& entry : tickets) {
        ++per_stage[static_cast<std::size_t>(entry.first)];
        EXPECT_NO_THROW(validate_for_stage(entry.second, entry.first)) << entry.second.ticket_id;
    }
    for (int n : per_stage) EXPECT_EQ(n, 10);
}

TEST(SampleDataTest, SeedReplacesExistingContents) {
    TempDir dir;
    TicketStore store(dir.file("tickets.db"));
    store.insert(Stage::Pending, make_pending("TKT_9999"));

    EXPECT_EQ(seed_sample_data(store), 40);
    EXPECT_FALSE(store.locate("TKT_9999").has_value());
    for (Stage stage : kAllStages) EXPECT_EQ(store.count(stage), 10u);

    // Seeding twice is not a duplicate.
    EXPECT_EQ(seed_sample_data(store), 40);
    EXPECT_EQ(store.count(Stage::Completed), 10u);
}

TEST(SampleDataTest, RecordsCarryStageEvidence) {
    TempDir dir;
    TicketStore store(dir.file("tickets.db"));
    seed_sample_data(store);

    auto completed = store.find(Stage::Completed, "TKT_0021");
    ASSERT_TRUE(completed.has_value());
    ASSERT_TRUE(completed->metadata.closure_time.has_value());
    EXPECT_EQ(*completed->metadata.closure_time - completed->metadata.creation_time, std::chrono::hours(2));
    EXPECT_EQ(completed->metadata.creation_time, at("2025-12-30T14:15:00Z"));

    auto drafted = store.find(Stage::Drafted, "TKT_0013");
    ASSERT_TRUE(drafted.has_value());
    EXPECT_EQ(drafted->used_reference_ticket_id, std::optional<std::string>("TKT_0003"));
    EXPECT_EQ(drafted->issue, "Request for account upgrade - Tier 3");

    auto escalated = store.find(Stage::Escalated, "TKT_0035");
    ASSERT_TRUE(escalated.has_value());
    EXPECT_EQ(escalated->metadata.escalation_reason, std::optional<std::string>("High priority / Complexity"));
    EXPECT_EQ(escalated->used_reference_ticket_id, std::optional<std::string>("TKT_0015"));
    EXPECT_EQ(escalated->metadata.priority, "critical");

    auto pending = store.find(Stage::Pending, "TKT_0004");
    ASSERT_TRUE(pending.has_value());
    EXPECT_FALSE(pending->metadata.is_drafted);
    EXPECT_FALSE(pending->ai_drafted_response.has_value());
}
