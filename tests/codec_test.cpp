#include <gtest/gtest.h>
#include "test_support.hpp"

using namespace testing_support;
using json = nlohmann::json;

TEST(TicketCodecTest, AbsentFieldsAreWrittenAsNull) {
    auto j = ticket_to_json(make_pending("TKT_0001"));
    EXPECT_EQ(j["ticket_id"], "TKT_0001");
    EXPECT_TRUE(j["confidence"].is_null());
    EXPECT_TRUE(j["resolution"].is_null());
    EXPECT_TRUE(j["ai_drafted_response"].is_null());
    EXPECT_TRUE(j["metadata"]["ticket_closure_time"].is_null());
    EXPECT_EQ(j["metadata"]["ticket_creation_time"], "2025-12-30T09:00:00Z");
    EXPECT_FALSE(j["metadata"]["is_drafted"].get<bool>());
}

TEST(TicketCodecTest, DecodesWhatItEncodes) {
    auto t = make_drafted("TKT_0011", "Your account upgrade request has been processed successfully.", 0.88);
    t.metadata.claimed_by = "drafter-7";
    auto back = ticket_from_json(ticket_to_json(t));
    EXPECT_EQ(back.ticket_id, "TKT_0011");
    ASSERT_TRUE(back.confidence.has_value());
    EXPECT_DOUBLE_EQ(*back.confidence, 0.88);
    EXPECT_EQ(back.ai_drafted_response, t.ai_drafted_response);
    EXPECT_EQ(back.metadata.tone, std::optional<std::string>("Professional"));
    EXPECT_EQ(back.metadata.claimed_by, std::optional<std::string>("drafter-7"));
    EXPECT_EQ(back.metadata.creation_time, t.metadata.creation_time);
    EXPECT_FALSE(back.resolution.has_value());
}

TEST(TicketCodecTest, ManualHandlingIsStoredAsNote) {
    auto t = make_pending("TKT_0031");
    t.handled_manually = true;
    auto j = ticket_to_json(t);
    EXPECT_EQ(j["confidence"], kManualHandlingNote);

    auto back = ticket_from_json(j);
    EXPECT_TRUE(back.handled_manually);
    EXPECT_FALSE(back.confidence.has_value());
}

TEST(TicketCodecTest, MalformedDocumentsRaiseParseError) {
    auto j = ticket_to_json(make_pending("TKT_0001"));
    auto missing_id = j;
    missing_id.erase("ticket_id");
    EXPECT_THROW(ticket_from_json(missing_id), ParseError);

    auto bad_time = j;
    bad_time["metadata"]["ticket_creation_time"] = "yesterday";
    EXPECT_THROW(ticket_from_json(bad_time), ParseError);

    EXPECT_THROW(ticket_from_json(json::array()), ParseError);
}

TEST(TicketCodecTest, TimestampsAreUtcSeconds) {
    auto tp = parse_time("2025-12-30T09:00:00Z");
    EXPECT_EQ(format_time(tp), "2025-12-30T09:00:00Z");
    EXPECT_EQ(format_time(tp + std::chrono::hours(2)), "2025-12-30T11:00:00Z");
    EXPECT_THROW(parse_time("not a time"), std::invalid_argument);
}

TEST(TicketTest, StageNamesRoundTrip) {
    for (Stage s : kAllStages) {
        auto parsed = parse_stage(stage_name(s));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, s);
    }
    EXPECT_FALSE(parse_stage("solved").has_value());
}

TEST(TicketTest, ConfidenceBands) {
    EXPECT_STREQ(confidence_band(0.95), "high");
    EXPECT_STREQ(confidence_band(0.9), "medium");
    EXPECT_STREQ(confidence_band(0.88), "medium");
    EXPECT_STREQ(confidence_band(0.7), "low");
    EXPECT_TRUE(confidence_in_range(0.0));
    EXPECT_TRUE(confidence_in_range(1.0));
    EXPECT_FALSE(confidence_in_range(1.4));
    EXPECT_FALSE(confidence_in_range(-0.1));
}

TEST(ErrorsTest, RetryableKinds) {
    EXPECT_TRUE(is_retryable(ErrorKind::Store));
    EXPECT_TRUE(is_retryable(ErrorKind::Connectivity));
    EXPECT_FALSE(is_retryable(ErrorKind::Parse));
    EXPECT_FALSE(is_retryable(ErrorKind::NotFound));
    EXPECT_FALSE(is_retryable(ErrorKind::Duplicate));
    EXPECT_FALSE(is_retryable(ErrorKind::Schema));

    ParseError e("bad");
    EXPECT_EQ(e.kind(), ErrorKind::Parse);
    EXPECT_STREQ(e.what(), "bad");
}
