#pragma once
#include "ticket_store.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

// Exclusive hand-out of pending tickets to drafting workers. claim_next is
// the only coordination point between worker processes.
class ClaimQueue {
public:
    explicit ClaimQueue(TicketStore& store, std::function<TimePoint()> clock = &Clock::now);

    // Marks the oldest unclaimed pending ticket as drafted-in-progress and
    // returns the updated record. Throws StoreError.
    std::optional<Ticket> claim_next(const std::string& worker_id);

    // Makes a claimed ticket eligible again. False when it already left pending.
    bool release(const std::string& ticket_id);

    // Parks a claimed ticket for human attention; it is not handed out again.
    bool mark_needs_attention(const std::string& ticket_id, const std::string& reason);

    // Clears a needs-attention flag and any claim.
    bool requeue(const std::string& ticket_id);

    // Releases claims older than `lease`. Returns how many were released.
    std::size_t reclaim_stale(std::chrono::seconds lease);

private:
    bool update_pending(const std::string& ticket_id, const std::function<void(Ticket&)>& mutate);

    TicketStore& store_;
    std::function<TimePoint()> clock_;
};
