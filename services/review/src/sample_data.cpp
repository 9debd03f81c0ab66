#include "../include/sample_data.hpp"
#include "../../../shared/cpp/ticket_sdk/include/util.hpp"
#include <spdlog/spdlog.h>
#include <cstdio>

static std::string ticket_id(int i) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "TKT_%04d", i);
    return buf;
}

static Ticket base_ticket(int i, const std::string& issue, const std::string& category, const std::string& priority,
                          TimePoint created) {
    Ticket t;
    t.ticket_id = ticket_id(i);
    t.issue = issue;
    t.metadata.category = category;
    t.metadata.priority = priority;
    t.metadata.creation_time = created;
    return t;
}

std::vector<std::pair<Stage, Ticket>> sample_tickets() {
    using std::chrono::minutes;
    using std::chrono::hours;
    const TimePoint base = parse_time("2025-12-30T09:00:00Z");
    std::vector<std::pair<Stage, Ticket>> out;

    for (int i = 1; i <= 10; ++i) {
        auto t = base_ticket(i, "Network connectivity issue reported by user " + std::to_string(i),
                             "Technical", "medium", base + minutes(i * 10));
        t.used_policy = "Standard Network Protocol";
        out.emplace_back(Stage::Pending, std::move(t));
    }

    for (int i = 11; i <= 20; ++i) {
        auto t = base_ticket(i, "Request for account upgrade - Tier " + std::to_string(i - 10),
                             "Billing", "high", base + minutes(i * 12));
        t.metadata.is_drafted = true;
        t.metadata.tone = "Professional";
        t.used_policy = "Subscription Upgrade Policy";
        t.ai_drafted_response = "Your account upgrade request has been processed successfully.";
        t.used_reference_ticket_id = ticket_id(i - 10);
        t.confidence = 0.88;
        out.emplace_back(Stage::Drafted, std::move(t));
    }

    for (int i = 21; i <= 30; ++i) {
        TimePoint created = base + minutes(i * 15);
        auto t = base_ticket(i, "Hardware failure report #" + std::to_string(i), "Hardware", "medium", created);
        t.metadata.closure_time = created + hours(2);
        t.metadata.is_drafted = true;
        t.metadata.tone = "Helpful";
        t.resolution = "Replacement unit shipped and tracking number provided.";
        t.ai_drafted_response = "We have processed your replacement. Your tracking ID is XYZ.";
        t.used_policy = "Hardware Warranty Policy";
        t.used_reference_ticket_id = "REF_GLOBAL_01";
        t.confidence = 0.95;
        out.emplace_back(Stage::Completed, std::move(t));
    }

    for (int i = 31; i <= 40; ++i) {
        auto t = base_ticket(i, "Urgent security breach or payment failure reported by VIP user " + std::to_string(i),
                             "Security", "critical", base + minutes(i * 8));
        t.metadata.is_drafted = true;
        t.metadata.escalation_reason = "High priority / Complexity";
        t.used_policy = "Critical Escalation Protocol";
        t.ai_drafted_response = "This ticket is Escalated. A senior manager is reviewing your case.";
        t.used_reference_ticket_id = ticket_id(i - 20);
        t.confidence = 0.65;
        out.emplace_back(Stage::Escalated, std::move(t));
    }
    return out;
}

int seed_sample_data(TicketStore& store) {
    auto tickets = sample_tickets();
    store.transaction([&](TicketStore::Txn& tx) {
        for (Stage stage : kAllStages) tx.clear(stage);
        for (const auto& entry : tickets) tx.insert(entry.first, entry.second);
    });
    spdlog::info("[seed] {} documents successfully uploaded.", tickets.size());
    return (int)tickets.size();
}
