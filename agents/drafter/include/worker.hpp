#pragma once
#include "../../../shared/cpp/ticket_sdk/include/claim_queue.hpp"
#include "../../../shared/cpp/ticket_sdk/include/completion.hpp"
#include "../../../shared/cpp/ticket_sdk/include/config.hpp"
#include "../../../shared/cpp/ticket_sdk/include/errors.hpp"
#include "../../../shared/cpp/ticket_sdk/include/retrieval.hpp"
#include "../../../shared/cpp/ticket_sdk/include/stop_signal.hpp"
#include "../../../shared/cpp/ticket_sdk/include/transitions.hpp"
#include <chrono>
#include <exception>
#include <string>

enum class CycleOutcome {
    Idle,             // nothing claimable
    Drafted,          // ticket moved to drafted
    RolledBack,       // retryable failure, claim released
    NeedsAttention,   // non-retryable failure, ticket parked
    Superseded,       // ticket left pending while we worked on it
    StoreUnavailable, // claim could not be attempted
    Cancelled         // stop requested
};

const char* cycle_outcome_name(CycleOutcome outcome);

enum class RecoveryAction { ReleaseClaim, MarkNeedsAttention, Abandon };

// What the worker does with a claimed ticket after a failure of `kind`.
RecoveryAction recovery_for(ErrorKind kind);

class DraftWorker {
public:
    DraftWorker(ClaimQueue& claims, TransitionEngine& transitions, RetrievalContextBuilder& retrieval,
                DraftGenerator& drafter, StopSignal& stop, WorkerConfig cfg);

    // Claim, retrieve, draft, persist: one ticket at most.
    CycleOutcome run_once();

    // Loops until stop is requested. Returns the number of drafted tickets.
    int run();

    // Sleep before the next cycle. Unproductive cycles double the delay from
    // poll_ms up to max_backoff_ms; productive ones reset it.
    std::chrono::milliseconds next_delay(CycleOutcome outcome);

private:
    CycleOutcome recover(const Ticket& ticket, const TicketError& e);
    CycleOutcome park(const Ticket& ticket, const std::exception& e);
    void reap_stale_claims();

    ClaimQueue& claims_;
    TransitionEngine& transitions_;
    RetrievalContextBuilder& retrieval_;
    DraftGenerator& drafter_;
    StopSignal& stop_;
    WorkerConfig cfg_;
    std::chrono::milliseconds backoff_{0};
};
