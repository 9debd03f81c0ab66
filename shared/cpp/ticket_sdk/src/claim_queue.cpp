#include "../include/claim_queue.hpp"
#include "../include/errors.hpp"
#include <spdlog/spdlog.h>
#include <utility>

static void clear_claim(Ticket& t) {
    t.metadata.is_drafted = false;
    t.metadata.claimed_by.reset();
    t.metadata.claimed_at.reset();
}

ClaimQueue::ClaimQueue(TicketStore& store, std::function<TimePoint()> clock)
    : store_(store), clock_(std::move(clock)) {}

std::optional<Ticket> ClaimQueue::claim_next(const std::string& worker_id) {
    TimePoint now = clock_();
    auto t = store_.find_and_update_unclaimed([&](Ticket& ticket) {
        ticket.metadata.is_drafted = true;
        ticket.metadata.claimed_by = worker_id;
        ticket.metadata.claimed_at = now;
    });
    if (t) spdlog::info("[claim] {} claimed {}", worker_id, t->ticket_id);
    return t;
}

bool ClaimQueue::update_pending(const std::string& ticket_id, const std::function<void(Ticket&)>& mutate) {
    bool updated = false;
    store_.transaction([&](TicketStore::Txn& tx) {
        auto t = tx.find(Stage::Pending, ticket_id);
        if (!t) return;
        mutate(*t);
        updated = tx.update(Stage::Pending, *t);
    });
    return updated;
}

bool ClaimQueue::release(const std::string& ticket_id) {
    bool ok = update_pending(ticket_id, clear_claim);
    if (ok) spdlog::warn("[claim] released {}", ticket_id);
    else spdlog::warn("[claim] release of {} skipped: no longer pending", ticket_id);
    return ok;
}

bool ClaimQueue::mark_needs_attention(const std::string& ticket_id, const std::string& reason) {
    bool ok = update_pending(ticket_id, [&](Ticket& t) {
        t.metadata.is_drafted = true;
        t.metadata.needs_attention = true;
        t.metadata.attention_reason = reason;
        t.metadata.claimed_at.reset();
    });
    if (ok) spdlog::error("[claim] {} needs attention: {}", ticket_id, reason);
    return ok;
}

bool ClaimQueue::requeue(const std::string& ticket_id) {
    bool ok = update_pending(ticket_id, [](Ticket& t) {
        clear_claim(t);
        t.metadata.needs_attention = false;
        t.metadata.attention_reason.reset();
    });
    if (ok) spdlog::info("[claim] requeued {}", ticket_id);
    return ok;
}

std::size_t ClaimQueue::reclaim_stale(std::chrono::seconds lease) {
    TimePoint cutoff = clock_() - lease;
    std::size_t released = 0;
    store_.transaction([&](TicketStore::Txn& tx) {
        for (auto& t : tx.stale_claims(cutoff)) {
            spdlog::warn("[claim] lease expired for {} (claimed by {})", t.ticket_id,
                         t.metadata.claimed_by.value_or("unknown"));
            clear_claim(t);
            try {
                if (tx.update(Stage::Pending, t)) ++released;
            } catch (const SchemaError& e) {
                spdlog::error("[claim] cannot release {}: {}", t.ticket_id, e.what());
            }
        }
    });
    return released;
}
