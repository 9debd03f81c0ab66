#pragma once
#include "ticket_store.hpp"
#include <functional>
#include <optional>
#include <string>

// Moves tickets between the lifecycle stores. Each move takes the record out
// of its source store, enriches it and inserts it into the destination inside
// one store transaction, so a ticket is never observable in two stores or in
// none.
//
//   pending  -> drafted    (worker)
//   pending  -> escalated, drafted -> escalated
//   pending | drafted | escalated -> completed
class TransitionEngine {
public:
    // Stage-specific field derivation, run inside the move transaction.
    using Enrichment = std::function<void(Ticket&, TicketStore::Txn&)>;

    explicit TransitionEngine(TicketStore& store, std::function<TimePoint()> clock = &Clock::now);

    static bool allowed(Stage from, Stage to);

    // Throws NotFoundError (source absent, destination untouched),
    // std::invalid_argument for a disallowed edge, SchemaError/DuplicateError
    // when the destination rejects the record.
    Ticket move(const std::string& ticket_id, Stage from, Stage to, const Enrichment& enrich = {});

    Ticket record_draft(const std::string& ticket_id, const DraftResult& draft);
    Ticket approve(const std::string& ticket_id, Stage from, const std::string& resolution);
    Ticket escalate(const std::string& ticket_id, Stage from, const std::optional<std::string>& reason = std::nullopt);
    Ticket resolve(const std::string& ticket_id, const std::string& resolution);

    // Intake: inserts a new ticket into `stage` after checking every store for
    // the id. Throws DuplicateError.
    Ticket create(Stage stage, Ticket ticket);

private:
    TicketStore& store_;
    std::function<TimePoint()> clock_;
};
