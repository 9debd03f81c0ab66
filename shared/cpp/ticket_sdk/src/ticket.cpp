#include "../include/ticket.hpp"
#include "../include/errors.hpp"

const char* stage_name(Stage stage) {
    switch (stage) {
        case Stage::Pending: return "pending";
        case Stage::Drafted: return "drafted";
        case Stage::Escalated: return "escalated";
        case Stage::Completed: return "completed";
    }
    return "unknown";
}

std::optional<Stage> parse_stage(const std::string& name) {
    for (Stage s : kAllStages) {
        if (name == stage_name(s)) return s;
    }
    return std::nullopt;
}

bool confidence_in_range(double confidence) {
    return confidence >= 0.0 && confidence <= 1.0;
}

const char* confidence_band(double confidence) {
    if (confidence > 0.9) return "high";
    if (confidence > 0.7) return "medium";
    return "low";
}

static void require(bool cond, const Ticket& t, Stage stage, const std::string& what) {
    if (!cond) {
        throw SchemaError("ticket '" + t.ticket_id + "' rejected by " + stage_name(stage) + " store: " + what);
    }
}

void validate_for_stage(const Ticket& t, Stage stage) {
    require(!t.ticket_id.empty(), t, stage, "ticket_id is empty");
    require(!t.issue.empty(), t, stage, "issue is empty");
    require(!t.metadata.category.empty(), t, stage, "metadata.category is empty");
    require(!t.metadata.priority.empty(), t, stage, "metadata.priority is empty");
    if (t.confidence) {
        require(confidence_in_range(*t.confidence), t, stage, "confidence outside [0,1]");
    }

    switch (stage) {
        case Stage::Pending:
            require(!t.resolution, t, stage, "pending tickets carry no resolution");
            require(!t.metadata.closure_time, t, stage, "pending tickets carry no closure time");
            break;
        case Stage::Drafted:
            require(t.metadata.is_drafted, t, stage, "is_drafted must be set");
            require(t.ai_drafted_response.has_value(), t, stage, "ai_drafted_response missing");
            require(t.confidence.has_value(), t, stage, "confidence missing");
            require(!t.resolution, t, stage, "drafted tickets carry no resolution");
            break;
        case Stage::Escalated:
            require(!t.resolution, t, stage, "escalated tickets carry no resolution");
            break;
        case Stage::Completed:
            require(t.resolution.has_value(), t, stage, "resolution missing");
            require(t.metadata.closure_time.has_value(), t, stage, "closure time missing");
            break;
    }
}
