#pragma once
#include "../../../shared/cpp/ticket_sdk/include/claim_queue.hpp"
#include "../../../shared/cpp/ticket_sdk/include/completion.hpp"
#include "../../../shared/cpp/ticket_sdk/include/config.hpp"
#include "../../../shared/cpp/ticket_sdk/include/errors.hpp"
#include "../../../shared/cpp/ticket_sdk/include/retrieval.hpp"
#include "../../../shared/cpp/ticket_sdk/include/transitions.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

// Outcome of a reviewer action. `status` uses HTTP codes so the service can
// pass it through unchanged.
struct ActionResult {
    bool ok{false};
    int status{200};
    std::string message;
    std::optional<Ticket> ticket;
};

struct TicketPage {
    Stage stage{Stage::Pending};
    std::vector<Ticket> tickets;
    std::size_t total{0};
    bool degraded{false}; // store unavailable, page is empty
};

struct RaiseRequest {
    Stage stage{Stage::Pending};
    std::string ticket_id;
    std::string issue;
    std::string category{"Technical"};
    std::string priority{"medium"};
    std::string tone{"Professional"};
    std::string reply;                // drafted
    double confidence{0.8};           // drafted
    std::string escalation_reason;    // escalated
    std::string resolution;           // completed
};

struct LocatedTicket {
    Stage stage{Stage::Pending};
    Ticket ticket;
};

struct SimilarView {
    std::vector<RetrievedSnippet> previous_records;
    std::vector<RetrievedSnippet> policy;
};

struct DeskStats {
    std::array<std::size_t, 4> counts{}; // indexed by Stage
    std::size_t needs_attention{0};
    bool degraded{false};
};

int status_for(ErrorKind kind);

class ReviewDesk {
public:
    ReviewDesk(TicketStore& store, TransitionEngine& transitions, ClaimQueue& claims,
               RetrievalContextBuilder& retrieval, CompletionClient& completion, ReviewConfig cfg = {});

    TicketPage list(Stage stage, int limit = 0);
    // Throws StoreError.
    std::optional<LocatedTicket> lookup(const std::string& ticket_id);

    ActionResult raise(const RaiseRequest& req);
    ActionResult approve(const std::string& ticket_id, Stage from, const std::string& resolution);
    ActionResult escalate(const std::string& ticket_id, Stage from, const std::optional<std::string>& reason);
    ActionResult resolve(const std::string& ticket_id, const std::string& resolution);
    ActionResult requeue(const std::string& ticket_id);

    // Empty when the ticket is unknown or either index is unreachable.
    SimilarView similar(const std::string& ticket_id);

    // Throws std::invalid_argument, ConnectivityError, ParseError.
    std::string rephrase(const std::string& text, std::optional<double> temperature = std::nullopt);

    DeskStats stats();

private:
    TicketStore& store_;
    TransitionEngine& transitions_;
    ClaimQueue& claims_;
    RetrievalContextBuilder& retrieval_;
    CompletionClient& completion_;
    ReviewConfig cfg_;
};

// "Pending", "Drafted", ... as shown to reviewers.
std::string stage_title(Stage stage);
