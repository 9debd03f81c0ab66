#pragma once
#include "../../../shared/cpp/ticket_sdk/include/ticket_store.hpp"
#include <utility>
#include <vector>

// Forty demo tickets, ten per store: TKT_0001-0010 pending, 0011-0020
// drafted, 0021-0030 completed, 0031-0040 escalated.
std::vector<std::pair<Stage, Ticket>> sample_tickets();

// Empties all four stores, then inserts sample_tickets(). Returns the count.
int seed_sample_data(TicketStore& store);
