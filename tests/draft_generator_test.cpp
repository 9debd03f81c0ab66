#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../shared/cpp/ticket_sdk/include/ticket_store.hpp"

using namespace testing_support;
using json = nlohmann::json;

static DraftRequest request_for(const std::string& id) {
    DraftRequest req;
    req.ticket_id = id;
    req.issue = "My router keeps disconnecting";
    return req;
}

TEST(DraftOutputTest, ParsesStructuredReply) {
    auto d = parse_draft_output(draft_json("TKT_0001", 0.83), "TKT_0001");
    EXPECT_EQ(d.reply, "Thanks for reaching out, we are on it.");
    EXPECT_EQ(d.tone, "polite");
    EXPECT_DOUBLE_EQ(d.confidence, 0.83);
    EXPECT_EQ(d.used_policy, std::optional<std::string>("Network Support Policy"));
    EXPECT_FALSE(d.used_reference_ticket_id.has_value());
}

TEST(DraftOutputTest, AcceptsCodeFencedJson) {
    auto raw = "```json\n" + draft_json("TKT_0001", 0.5) + "\n```";
    EXPECT_DOUBLE_EQ(parse_draft_output(raw, "TKT_0001").confidence, 0.5);
}

TEST(DraftOutputTest, PlaceholderReferencesBecomeAbsent) {
    for (const char* placeholder : {"", "null", "None", "N/A"}) {
        auto j = json::parse(draft_json("TKT_0001", 0.5));
        j["used_policy"] = placeholder;
        j["used_reference_ticket_id"] = placeholder;
        auto d = parse_draft_output(j.dump(), "TKT_0001");
        EXPECT_FALSE(d.used_policy.has_value()) << placeholder;
        EXPECT_FALSE(d.used_reference_ticket_id.has_value()) << placeholder;
    }
}

TEST(DraftOutputTest, ConfidenceMustBeAProbability) {
    EXPECT_THROW(parse_draft_output(draft_json("TKT_0001", 1.4), "TKT_0001"), ParseError);
    EXPECT_THROW(parse_draft_output(draft_json("TKT_0001", -0.2), "TKT_0001"), ParseError);
    EXPECT_NO_THROW(parse_draft_output(draft_json("TKT_0001", 1.0), "TKT_0001"));
    EXPECT_NO_THROW(parse_draft_output(draft_json("TKT_0001", 0.0), "TKT_0001"));

    auto j = json::parse(draft_json("TKT_0001", 0.5));
    j["confidence"] = "very";
    EXPECT_THROW(parse_draft_output(j.dump(), "TKT_0001"), ParseError);
}

TEST(DraftOutputTest, SchemaViolationsRaiseParseError) {
    EXPECT_THROW(parse_draft_output("I think the customer should reboot.", "TKT_0001"), ParseError);
    EXPECT_THROW(parse_draft_output("[1, 2, 3]", "TKT_0001"), ParseError);
    EXPECT_THROW(parse_draft_output(draft_json("TKT_0002", 0.5), "TKT_0001"), ParseError);

    auto j = json::parse(draft_json("TKT_0001", 0.5));
    j.erase("reply");
    EXPECT_THROW(parse_draft_output(j.dump(), "TKT_0001"), ParseError);

    auto k = json::parse(draft_json("TKT_0001", 0.5));
    k["tone"] = 3;
    EXPECT_THROW(parse_draft_output(k.dump(), "TKT_0001"), ParseError);
}

TEST(DraftGeneratorTest, SendsInstructionContractAndContext) {
    FakeCompletion llm;
    llm.respond = [](const ChatRequest& req) { return draft_json(ticket_id_in_prompt(req), 0.7); };
    DraftGenerator generator(llm);

    auto req = request_for("TKT_0042");
    req.previous_record_context = "- ticket TKT_0021 (confidence 0.8)";
    auto d = generator.draft(req);
    EXPECT_DOUBLE_EQ(d.confidence, 0.7);

    ASSERT_EQ(llm.requests.size(), 1u);
    const auto& sent = llm.requests[0];
    EXPECT_TRUE(sent.json_output);
    EXPECT_DOUBLE_EQ(sent.temperature, 0.2);
    ASSERT_EQ(sent.messages.size(), 2u);
    EXPECT_EQ(sent.messages[0].role, "system");
    EXPECT_NE(sent.messages[0].content.find("Do NOT make promises outside the policy."), std::string::npos);
    EXPECT_NE(sent.messages[1].content.find("My router keeps disconnecting"), std::string::npos);
    EXPECT_NE(sent.messages[1].content.find("No specific Policy Provided"), std::string::npos);
    EXPECT_NE(sent.messages[1].content.find("TKT_0021"), std::string::npos);
}

TEST(DraftGeneratorTest, ServiceFailureIsConnectivityError) {
    FakeCompletion llm;
    llm.respond = [](const ChatRequest&) -> std::string { throw ConnectivityError("connection refused"); };
    DraftGenerator generator(llm);
    EXPECT_THROW(generator.draft(request_for("TKT_0001")), ConnectivityError);
}

TEST(DraftGeneratorTest, OutOfRangeConfidenceIsRejectedBeforeAnyWrite) {
    TempDir dir;
    TicketStore store(dir.file("tickets.db"));
    store.insert(Stage::Pending, make_pending("TKT_0001"));

    FakeCompletion llm;
    llm.respond = [](const ChatRequest& req) { return draft_json(ticket_id_in_prompt(req), 1.4); };
    DraftGenerator generator(llm);
    EXPECT_THROW(generator.draft(request_for("TKT_0001")), ParseError);

    EXPECT_EQ(store.count(Stage::Drafted), 0u);
    auto t = store.find(Stage::Pending, "TKT_0001");
    ASSERT_TRUE(t.has_value());
    EXPECT_FALSE(t->ai_drafted_response.has_value());
}

TEST(RephraseTest, ReturnsTrimmedText) {
    FakeCompletion llm;
    llm.respond = [](const ChatRequest&) { return "  Could you please share your order number?\n"; };
    EXPECT_EQ(rephrase(llm, "give me your order number", 0.5), "Could you please share your order number?");
    ASSERT_EQ(llm.requests.size(), 1u);
    EXPECT_DOUBLE_EQ(llm.requests[0].temperature, 0.5);
    EXPECT_FALSE(llm.requests[0].json_output);
    EXPECT_NE(llm.requests[0].messages[0].content.find("give me your order number"), std::string::npos);
}

TEST(RephraseTest, RejectsBadInput) {
    FakeCompletion llm;
    llm.respond = [](const ChatRequest&) { return std::string("ok"); };
    EXPECT_THROW(rephrase(llm, "hello", 1.5), std::invalid_argument);
    EXPECT_THROW(rephrase(llm, "hello", -0.1), std::invalid_argument);
    EXPECT_THROW(rephrase(llm, "   ", 0.5), std::invalid_argument);
    EXPECT_TRUE(llm.requests.empty());
}
