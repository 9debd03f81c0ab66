#include "../include/review_actions.hpp"
#include "../../../shared/cpp/ticket_sdk/include/util.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <stdexcept>

int status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return 404;
        case ErrorKind::Duplicate: return 409;
        case ErrorKind::Schema: return 400;
        case ErrorKind::Parse: return 502;
        case ErrorKind::Store:
        case ErrorKind::Connectivity: return 503;
    }
    return 500;
}

std::string stage_title(Stage stage) {
    std::string s = stage_name(stage);
    if (!s.empty()) s[0] = (char)std::toupper((unsigned char)s[0]);
    return s;
}

static ActionResult success(int status, std::string message, Ticket t) {
    ActionResult r;
    r.ok = true;
    r.status = status;
    r.message = std::move(message);
    r.ticket = std::move(t);
    return r;
}

static ActionResult failure(int status, std::string message) {
    ActionResult r;
    r.ok = false;
    r.status = status;
    r.message = std::move(message);
    return r;
}

ReviewDesk::ReviewDesk(TicketStore& store, TransitionEngine& transitions, ClaimQueue& claims,
                       RetrievalContextBuilder& retrieval, CompletionClient& completion, ReviewConfig cfg)
    : store_(store), transitions_(transitions), claims_(claims), retrieval_(retrieval), completion_(completion),
      cfg_(std::move(cfg)) {}

TicketPage ReviewDesk::list(Stage stage, int limit) {
    TicketPage page;
    page.stage = stage;
    if (limit <= 0) limit = cfg_.default_limit;
    try {
        page.tickets = store_.list_recent(stage, limit);
        page.total = store_.count(stage);
    } catch (const StoreError& e) {
        spdlog::error("[review] Failed to load {} tickets: {}", stage_name(stage), e.what());
        page.tickets.clear();
        page.total = 0;
        page.degraded = true;
    }
    return page;
}

std::optional<LocatedTicket> ReviewDesk::lookup(const std::string& ticket_id) {
    auto stage = store_.locate(ticket_id);
    if (!stage) return std::nullopt;
    auto t = store_.find(*stage, ticket_id);
    if (!t) return std::nullopt; // moved in between
    return LocatedTicket{*stage, std::move(*t)};
}

ActionResult ReviewDesk::raise(const RaiseRequest& req) {
    if (trim(req.ticket_id).empty() || trim(req.issue).empty()) {
        return failure(400, "Ticket ID and Issue are required.");
    }
    if (req.stage == Stage::Drafted && trim(req.reply).empty()) {
        return failure(400, "Drafted Response is required for drafted tickets.");
    }
    if (req.stage == Stage::Completed && trim(req.resolution).empty()) {
        return failure(400, "Resolution is required for completed tickets.");
    }

    Ticket t;
    t.ticket_id = trim(req.ticket_id);
    t.issue = req.issue;
    t.metadata.category = req.category;
    t.metadata.priority = req.priority;
    t.metadata.creation_time = Clock::now();
    t.metadata.is_drafted = req.stage == Stage::Drafted;

    switch (req.stage) {
        case Stage::Pending:
            break;
        case Stage::Drafted:
            t.ai_drafted_response = req.reply;
            t.confidence = req.confidence;
            t.metadata.tone = req.tone;
            t.used_policy = "Manual";
            t.used_reference_ticket_id = "N/A";
            break;
        case Stage::Escalated:
            t.ai_drafted_response = "Manual Escalation";
            t.confidence = 1.0;
            t.used_policy = "Escalation Protocol";
            t.used_reference_ticket_id = "N/A";
            t.metadata.escalation_reason = req.escalation_reason;
            break;
        case Stage::Completed:
            t.resolution = req.resolution;
            t.ai_drafted_response = "Manual Resolution";
            t.confidence = 1.0;
            t.used_policy = "N/A";
            t.used_reference_ticket_id = "N/A";
            t.metadata.closure_time = t.metadata.creation_time;
            break;
    }

    try {
        auto created = transitions_.create(req.stage, std::move(t));
        return success(201, "Ticket " + created.ticket_id + " raised successfully in " + stage_title(req.stage) + "!",
                       std::move(created));
    } catch (const DuplicateError&) {
        return failure(409, "Ticket ID " + trim(req.ticket_id) + " already exists.");
    } catch (const TicketError& e) {
        spdlog::error("[review] Error raising ticket {}: {}", req.ticket_id, e.what());
        return failure(status_for(e.kind()), "Failed to raise ticket.");
    }
}

ActionResult ReviewDesk::approve(const std::string& ticket_id, Stage from, const std::string& resolution) {
    const std::string failed = "Error: Failed to move ticket " + ticket_id + ".";
    if (trim(resolution).empty()) return failure(400, failed);
    try {
        auto t = transitions_.approve(ticket_id, from, resolution);
        return success(200, "Ticket " + ticket_id + " approved and moved to completed!", std::move(t));
    } catch (const TicketError& e) {
        spdlog::error("[review] Failed to move ticket {} to completed: {}", ticket_id, e.what());
        return failure(status_for(e.kind()), failed);
    } catch (const std::invalid_argument& e) {
        spdlog::error("[review] Failed to move ticket {} to completed: {}", ticket_id, e.what());
        return failure(400, failed);
    }
}

ActionResult ReviewDesk::escalate(const std::string& ticket_id, Stage from, const std::optional<std::string>& reason) {
    const std::string failed = "Error: Failed to escalate ticket " + ticket_id + ".";
    try {
        auto t = transitions_.escalate(ticket_id, from, reason);
        return success(200, "Ticket " + ticket_id + " escalated!", std::move(t));
    } catch (const TicketError& e) {
        spdlog::error("[review] Failed to escalate ticket {}: {}", ticket_id, e.what());
        return failure(status_for(e.kind()), failed);
    } catch (const std::invalid_argument& e) {
        spdlog::error("[review] Failed to escalate ticket {}: {}", ticket_id, e.what());
        return failure(400, failed);
    }
}

ActionResult ReviewDesk::resolve(const std::string& ticket_id, const std::string& resolution) {
    return approve(ticket_id, Stage::Escalated, resolution);
}

ActionResult ReviewDesk::requeue(const std::string& ticket_id) {
    try {
        if (!claims_.requeue(ticket_id)) {
            return failure(404, "Error: Ticket " + ticket_id + " is not pending.");
        }
        ActionResult r;
        r.ok = true;
        r.message = "Ticket " + ticket_id + " requeued for drafting.";
        r.ticket = store_.find(Stage::Pending, ticket_id);
        return r;
    } catch (const StoreError& e) {
        spdlog::error("[review] Failed to requeue ticket {}: {}", ticket_id, e.what());
        return failure(503, "Error: Failed to requeue ticket " + ticket_id + ".");
    }
}

SimilarView ReviewDesk::similar(const std::string& ticket_id) {
    SimilarView view;
    std::optional<LocatedTicket> found;
    try {
        found = lookup(ticket_id);
    } catch (const StoreError& e) {
        spdlog::error("[review] Failed to fetch ticket {}: {}", ticket_id, e.what());
        return view;
    }
    if (!found) return view;
    view.previous_records = retrieval_.lookup_previous(found->ticket.issue);
    view.policy = retrieval_.lookup_policy(found->ticket.issue);
    return view;
}

std::string ReviewDesk::rephrase(const std::string& text, std::optional<double> temperature) {
    return ::rephrase(completion_, text, temperature.value_or(cfg_.rephrase_temperature));
}

DeskStats ReviewDesk::stats() {
    DeskStats s;
    try {
        for (Stage stage : kAllStages) s.counts[static_cast<std::size_t>(stage)] = store_.count(stage);
        s.needs_attention = store_.count_needs_attention();
    } catch (const StoreError& e) {
        spdlog::error("[review] Failed to load store counts: {}", e.what());
        s = DeskStats{};
        s.degraded = true;
    }
    return s;
}
