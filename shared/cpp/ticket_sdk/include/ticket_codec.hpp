#pragma once
#include "ticket.hpp"
#include <nlohmann/json.hpp>

// Document form shared by the stores and the review API. Absent optionals are
// written as null; a manually handled confidence is written as kManualHandlingNote.
nlohmann::json ticket_to_json(const Ticket& t);

// Throws ParseError when required fields are missing or mistyped.
Ticket ticket_from_json(const nlohmann::json& j);
