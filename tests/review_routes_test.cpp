#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../services/review/include/review_routes.hpp"
#include "../services/review/include/sample_data.hpp"

using namespace testing_support;
using json = nlohmann::json;

class ReviewRoutesTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<TicketStore>(dir_.file("tickets.db"));
        engine_ = std::make_unique<TransitionEngine>(*store_);
        queue_ = std::make_unique<ClaimQueue>(*store_);
        builder_ = std::make_unique<RetrievalContextBuilder>(policy_, previous_);
        desk_ = std::make_unique<ReviewDesk>(*store_, *engine_, *queue_, *builder_, llm_);
        seed_sample_data(*store_);
    }

    RouteReply call(const std::string& method, const std::string& path, const std::string& body = "",
                    const std::map<std::string, std::string>& query = {}) {
        return handle_request(*desk_, method, path, query, body);
    }

    static json body_of(const RouteReply& r) { return json::parse(r.body); }

    TempDir dir_;
    FakeIndex policy_{"policy"};
    FakeIndex previous_{"previous-record"};
    FakeCompletion llm_;
    std::unique_ptr<TicketStore> store_;
    std::unique_ptr<TransitionEngine> engine_;
    std::unique_ptr<ClaimQueue> queue_;
    std::unique_ptr<RetrievalContextBuilder> builder_;
    std::unique_ptr<ReviewDesk> desk_;
};

TEST_F(ReviewRoutesTest, ListTicketsByStore) {
    auto r = call("GET", "/tickets", "", {{"store", "drafted"}, {"limit", "3"}});
    ASSERT_EQ(r.status, 200);
    auto j = body_of(r);
    EXPECT_EQ(j["store"], "drafted");
    EXPECT_EQ(j["total"], 10);
    EXPECT_EQ(j["degraded"], false);
    ASSERT_EQ(j["tickets"].size(), 3u);
    EXPECT_EQ(j["tickets"][0]["ticket_id"], "TKT_0020");
    EXPECT_EQ(j["tickets"][0]["store"], "drafted");

    auto pending = body_of(call("GET", "/tickets"));
    EXPECT_EQ(pending["store"], "pending");
    EXPECT_EQ(pending["tickets"].size(), 10u);
}

TEST_F(ReviewRoutesTest, ListRejectsUnknownStore) {
    EXPECT_EQ(call("GET", "/tickets", "", {{"store", "archive"}}).status, 400);
    EXPECT_EQ(call("GET", "/tickets", "", {{"limit", "lots"}}).status, 400);
}

TEST_F(ReviewRoutesTest, GetTicketShowsStoreAndConfidenceBand) {
    auto r = call("GET", "/tickets/TKT_0011");
    ASSERT_EQ(r.status, 200);
    auto j = body_of(r);
    EXPECT_EQ(j["store"], "drafted");
    EXPECT_EQ(j["confidence_band"], "medium");

    auto missing = call("GET", "/tickets/TKT_0404");
    EXPECT_EQ(missing.status, 404);
    EXPECT_EQ(body_of(missing)["error"], "Ticket TKT_0404 not found.");
}

TEST_F(ReviewRoutesTest, ApproveMovesTicket) {
    auto r = call("POST", "/tickets/TKT_0011/approve", R"({"from":"drafted","resolution":"Upgrade applied"})");
    ASSERT_EQ(r.status, 200);
    auto j = body_of(r);
    EXPECT_EQ(j["ok"], true);
    EXPECT_EQ(j["message"], "Ticket TKT_0011 approved and moved to completed!");
    EXPECT_EQ(j["ticket"]["resolution"], "Upgrade applied");

    EXPECT_EQ(call("POST", "/tickets/TKT_0011/approve", R"({"from":"drafted","resolution":"again"})").status, 404);
    EXPECT_EQ(call("POST", "/tickets/TKT_0012/approve", R"({"from":"drafted"})").status, 400);
    EXPECT_EQ(call("POST", "/tickets/TKT_0012/approve", "{not json").status, 400);
}

TEST_F(ReviewRoutesTest, EscalateThenResolve) {
    auto e = call("POST", "/tickets/TKT_0003/escalate", R"({"from":"pending","reason":"VIP customer"})");
    ASSERT_EQ(e.status, 200);
    EXPECT_EQ(store_->find(Stage::Escalated, "TKT_0003")->metadata.escalation_reason,
              std::optional<std::string>("VIP customer"));

    auto r = call("POST", "/tickets/TKT_0003/resolve", R"({"resolution":"Refunded"})");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(store_->locate("TKT_0003"), std::optional<Stage>(Stage::Completed));
}

TEST_F(ReviewRoutesTest, RaiseTicket) {
    auto r = call("POST", "/tickets", R"({"store":"pending","ticket_id":"TKT_0100","issue":"Cannot log in"})");
    ASSERT_EQ(r.status, 201);
    EXPECT_EQ(body_of(r)["message"], "Ticket TKT_0100 raised successfully in Pending!");

    auto dup = call("POST", "/tickets",
                    R"({"store":"drafted","ticket_id":"TKT_0100","issue":"Cannot log in","reply":"Reset sent."})");
    EXPECT_EQ(dup.status, 409);
    EXPECT_EQ(body_of(dup)["message"], "Ticket ID TKT_0100 already exists.");

    auto no_reply = call("POST", "/tickets", R"({"store":"drafted","ticket_id":"TKT_0101","issue":"Cannot log in"})");
    EXPECT_EQ(no_reply.status, 400);
    EXPECT_FALSE(store_->locate("TKT_0101").has_value());
}

TEST_F(ReviewRoutesTest, SimilarReturnsScoredSnippets) {
    previous_.hits.push_back({"Hardware failure report #21", json{{"ticket_id", "TKT_0021"}}, 1.0});
    auto r = call("GET", "/tickets/TKT_0001/similar");
    ASSERT_EQ(r.status, 200);
    auto j = body_of(r);
    ASSERT_EQ(j["previous_records"].size(), 1u);
    EXPECT_DOUBLE_EQ(j["previous_records"][0]["confidence"].get<double>(), 0.5);
    EXPECT_TRUE(j["policy"].empty());
}

TEST_F(ReviewRoutesTest, RephraseValidatesTemperature) {
    llm_.respond = [](const ChatRequest&) { return std::string("Kindly restart the device."); };
    auto ok = call("POST", "/rephrase", R"({"text":"restart it"})");
    ASSERT_EQ(ok.status, 200);
    EXPECT_EQ(body_of(ok)["text"], "Kindly restart the device.");

    EXPECT_EQ(call("POST", "/rephrase", R"({"text":"restart it","temperature":2})").status, 400);
    EXPECT_EQ(call("POST", "/rephrase", R"({})").status, 400);

    llm_.respond = [](const ChatRequest&) -> std::string { throw ConnectivityError("model offline"); };
    EXPECT_EQ(call("POST", "/rephrase", R"({"text":"restart it"})").status, 503);
}

TEST_F(ReviewRoutesTest, StatsAndUnknownRoutes) {
    auto s = body_of(call("GET", "/stats"));
    EXPECT_EQ(s["pending"], 10);
    EXPECT_EQ(s["completed"], 10);
    EXPECT_EQ(s["needs_attention"], 0);
    EXPECT_EQ(s["degraded"], false);

    EXPECT_EQ(call("GET", "/nowhere").status, 404);
    EXPECT_EQ(call("DELETE", "/tickets/TKT_0001").status, 404);
}
