#include "../include/worker.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

const char* cycle_outcome_name(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::Idle: return "idle";
        case CycleOutcome::Drafted: return "drafted";
        case CycleOutcome::RolledBack: return "rolled-back";
        case CycleOutcome::NeedsAttention: return "needs-attention";
        case CycleOutcome::Superseded: return "superseded";
        case CycleOutcome::StoreUnavailable: return "store-unavailable";
        case CycleOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

RecoveryAction recovery_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Store:
        case ErrorKind::Connectivity:
            return RecoveryAction::ReleaseClaim;
        case ErrorKind::NotFound:
            return RecoveryAction::Abandon;
        case ErrorKind::Parse:
        case ErrorKind::Schema:
        case ErrorKind::Duplicate:
            return RecoveryAction::MarkNeedsAttention;
    }
    return RecoveryAction::MarkNeedsAttention;
}

DraftWorker::DraftWorker(ClaimQueue& claims, TransitionEngine& transitions, RetrievalContextBuilder& retrieval,
                         DraftGenerator& drafter, StopSignal& stop, WorkerConfig cfg)
    : claims_(claims), transitions_(transitions), retrieval_(retrieval), drafter_(drafter), stop_(stop),
      cfg_(std::move(cfg)) {}

void DraftWorker::reap_stale_claims() {
    if (cfg_.claim_lease_s <= 0) return;
    try {
        auto n = claims_.reclaim_stale(std::chrono::seconds(cfg_.claim_lease_s));
        if (n > 0) spdlog::warn("[worker] released {} expired claim(s)", n);
    } catch (const TicketError& e) {
        spdlog::warn("[worker] lease check failed ({}): {}", error_kind_name(e.kind()), e.what());
    }
}

CycleOutcome DraftWorker::run_once() {
    if (stop_.stop_requested()) return CycleOutcome::Cancelled;

    reap_stale_claims();

    std::optional<Ticket> claimed;
    try {
        claimed = claims_.claim_next(cfg_.worker_id);
    } catch (const TicketError& e) {
        spdlog::error("[worker] claim failed ({}): {}", error_kind_name(e.kind()), e.what());
        return CycleOutcome::StoreUnavailable;
    }
    if (!claimed) return CycleOutcome::Idle;

    const Ticket& ticket = *claimed;
    try {
        auto ctx = retrieval_.build(ticket.issue);
        if (stop_.stop_requested()) {
            claims_.release(ticket.ticket_id);
            return CycleOutcome::Cancelled;
        }

        DraftRequest req;
        req.ticket_id = ticket.ticket_id;
        req.issue = ticket.issue;
        req.policy_context = render_policy_context(ctx.policy);
        req.previous_record_context = render_previous_context(ctx.previous_records);

        auto draft = drafter_.draft(req);
        transitions_.record_draft(ticket.ticket_id, draft);
        spdlog::info("[worker] drafted {} (confidence {:.2f}, {})", ticket.ticket_id, draft.confidence,
                     confidence_band(draft.confidence));
        return CycleOutcome::Drafted;
    } catch (const TicketError& e) {
        return recover(ticket, e);
    } catch (const std::exception& e) {
        return park(ticket, e);
    }
}

// Anything outside the error taxonomy is not known to be transient.
CycleOutcome DraftWorker::park(const Ticket& ticket, const std::exception& e) {
    spdlog::error("[worker] {} failed unexpectedly: {}", ticket.ticket_id, e.what());
    try {
        claims_.mark_needs_attention(ticket.ticket_id, std::string("unexpected error: ") + e.what());
    } catch (const TicketError& se) {
        spdlog::error("[worker] parking {} failed: {}", ticket.ticket_id, se.what());
        return CycleOutcome::StoreUnavailable;
    }
    return CycleOutcome::NeedsAttention;
}

CycleOutcome DraftWorker::recover(const Ticket& ticket, const TicketError& e) {
    const std::string& id = ticket.ticket_id;
    auto action = recovery_for(e.kind());
    spdlog::warn("[worker] {} failed ({}): {}", id, error_kind_name(e.kind()), e.what());

    // A failed recovery leaves the claim in place; the lease check frees it later.
    try {
        switch (action) {
            case RecoveryAction::ReleaseClaim:
                claims_.release(id);
                if (stop_.stop_requested()) return CycleOutcome::Cancelled;
                return e.kind() == ErrorKind::Store ? CycleOutcome::StoreUnavailable : CycleOutcome::RolledBack;
            case RecoveryAction::MarkNeedsAttention:
                claims_.mark_needs_attention(id, std::string(error_kind_name(e.kind())) + ": " + e.what());
                return CycleOutcome::NeedsAttention;
            case RecoveryAction::Abandon:
                return CycleOutcome::Superseded;
        }
    } catch (const TicketError& se) {
        spdlog::error("[worker] recovery of {} failed: {}", id, se.what());
        return CycleOutcome::StoreUnavailable;
    }
    return CycleOutcome::StoreUnavailable;
}

std::chrono::milliseconds DraftWorker::next_delay(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::Idle:
        case CycleOutcome::RolledBack:
        case CycleOutcome::StoreUnavailable: {
            auto floor = std::chrono::milliseconds(cfg_.poll_ms);
            auto cap = std::chrono::milliseconds(std::max(cfg_.max_backoff_ms, cfg_.poll_ms));
            backoff_ = backoff_.count() == 0 ? floor : std::min(backoff_ * 2, cap);
            return backoff_;
        }
        case CycleOutcome::Drafted:
        case CycleOutcome::NeedsAttention:
        case CycleOutcome::Superseded:
        case CycleOutcome::Cancelled:
            break;
    }
    backoff_ = std::chrono::milliseconds(0);
    return backoff_;
}

int DraftWorker::run() {
    spdlog::info("[worker] {} started (poll {}ms, max backoff {}ms, lease {}s)", cfg_.worker_id, cfg_.poll_ms,
                 cfg_.max_backoff_ms, cfg_.claim_lease_s);
    int drafted = 0;
    while (!stop_.stop_requested()) {
        auto outcome = run_once();
        if (outcome == CycleOutcome::Cancelled) break;
        if (outcome == CycleOutcome::Drafted) ++drafted;
        if (outcome != CycleOutcome::Idle) spdlog::debug("[worker] cycle: {}", cycle_outcome_name(outcome));

        auto delay = next_delay(outcome);
        if (delay.count() > 0 && !stop_.wait_for(delay)) break;
    }
    spdlog::info("[worker] {} stopping after {} draft(s)", cfg_.worker_id, drafted);
    return drafted;
}
