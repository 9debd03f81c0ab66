#include "../include/transitions.hpp"
#include "../include/errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

static void clear_claim_state(Ticket& t) {
    t.metadata.claimed_by.reset();
    t.metadata.claimed_at.reset();
    t.metadata.needs_attention = false;
    t.metadata.attention_reason.reset();
}

TransitionEngine::TransitionEngine(TicketStore& store, std::function<TimePoint()> clock)
    : store_(store), clock_(std::move(clock)) {}

bool TransitionEngine::allowed(Stage from, Stage to) {
    switch (from) {
        case Stage::Pending:
            return to == Stage::Drafted || to == Stage::Escalated || to == Stage::Completed;
        case Stage::Drafted:
            return to == Stage::Escalated || to == Stage::Completed;
        case Stage::Escalated:
            return to == Stage::Completed;
        case Stage::Completed:
            return false;
    }
    return false;
}

Ticket TransitionEngine::move(const std::string& ticket_id, Stage from, Stage to, const Enrichment& enrich) {
    if (!allowed(from, to)) {
        throw std::invalid_argument(std::string("transition ") + stage_name(from) + " -> " + stage_name(to) +
                                    " is not allowed");
    }
    Ticket moved;
    store_.transaction([&](TicketStore::Txn& tx) {
        auto t = tx.take(from, ticket_id);
        if (!t) {
            throw NotFoundError("ticket '" + ticket_id + "' not found in " + stage_name(from));
        }
        if (enrich) enrich(*t, tx);
        tx.insert(to, *t);
        moved = std::move(*t);
    });
    spdlog::info("[transition] {} {} -> {}", ticket_id, stage_name(from), stage_name(to));
    return moved;
}

Ticket TransitionEngine::record_draft(const std::string& ticket_id, const DraftResult& draft) {
    return move(ticket_id, Stage::Pending, Stage::Drafted, [&](Ticket& t, TicketStore::Txn&) {
        t.metadata.is_drafted = true;
        t.metadata.tone = draft.tone;
        t.ai_drafted_response = draft.reply;
        t.confidence = draft.confidence;
        t.used_policy = draft.used_policy;
        t.used_reference_ticket_id = draft.used_reference_ticket_id;
        clear_claim_state(t);
    });
}

Ticket TransitionEngine::approve(const std::string& ticket_id, Stage from, const std::string& resolution) {
    if (from == Stage::Completed) {
        throw std::invalid_argument("ticket '" + ticket_id + "' is already completed");
    }
    TimePoint now = clock_();
    return move(ticket_id, from, Stage::Completed, [&](Ticket& t, TicketStore::Txn& tx) {
        switch (from) {
            case Stage::Pending:
                if (!t.metadata.is_drafted) {
                    t.ai_drafted_response.reset();
                    t.confidence.reset();
                    t.metadata.tone.reset();
                } else if (auto drafted = tx.take(Stage::Drafted, ticket_id)) {
                    // A drafted copy left behind next to the pending record.
                    t.ai_drafted_response = drafted->ai_drafted_response;
                    t.confidence = drafted->confidence;
                    t.metadata.tone = drafted->metadata.tone;
                    t.used_policy = drafted->used_policy;
                    t.used_reference_ticket_id = drafted->used_reference_ticket_id;
                    spdlog::warn("[transition] {} joined stray drafted record", ticket_id);
                } else {
                    // Claimed but never drafted.
                    t.ai_drafted_response.reset();
                    t.confidence.reset();
                    t.metadata.tone.reset();
                }
                break;
            case Stage::Drafted:
                break;
            case Stage::Escalated:
                if (!t.ai_drafted_response) t.ai_drafted_response = kManualHandlingNote;
                if (!t.used_policy) t.used_policy = kManualHandlingNote;
                if (!t.used_reference_ticket_id) t.used_reference_ticket_id = kManualHandlingNote;
                if (!t.confidence) t.handled_manually = true;
                break;
            case Stage::Completed:
                break;
        }
        t.resolution = resolution;
        t.metadata.closure_time = now;
        clear_claim_state(t);
    });
}

Ticket TransitionEngine::escalate(const std::string& ticket_id, Stage from, const std::optional<std::string>& reason) {
    if (from != Stage::Pending && from != Stage::Drafted) {
        throw std::invalid_argument(std::string("cannot escalate from ") + stage_name(from));
    }
    return move(ticket_id, from, Stage::Escalated, [&](Ticket& t, TicketStore::Txn&) {
        if (reason && !reason->empty()) t.metadata.escalation_reason = *reason;
    });
}

Ticket TransitionEngine::resolve(const std::string& ticket_id, const std::string& resolution) {
    return approve(ticket_id, Stage::Escalated, resolution);
}

Ticket TransitionEngine::create(Stage stage, Ticket ticket) {
    if (ticket.metadata.creation_time == TimePoint{}) ticket.metadata.creation_time = clock_();
    store_.insert(stage, ticket);
    spdlog::info("[intake] {} created in {}", ticket.ticket_id, stage_name(stage));
    return ticket;
}
