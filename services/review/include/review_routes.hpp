#pragma once
#include "review_actions.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>

struct RouteReply {
    int status{200};
    std::string body; // JSON
};

// Dispatches one HTTP request against the desk. Never throws.
RouteReply handle_request(ReviewDesk& desk, const std::string& method, const std::string& path,
                          const std::map<std::string, std::string>& query, const std::string& body);

nlohmann::json ticket_view(const Ticket& t, std::optional<Stage> stage = std::nullopt);
nlohmann::json snippet_view(const RetrievedSnippet& s);
