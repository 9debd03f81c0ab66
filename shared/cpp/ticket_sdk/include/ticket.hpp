#pragma once
#include <array>
#include <chrono>
#include <optional>
#include <string>

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// The four lifecycle stores. A ticket_id lives in exactly one of them.
enum class Stage { Pending, Drafted, Escalated, Completed };

constexpr std::array<Stage, 4> kAllStages = {
    Stage::Pending, Stage::Drafted, Stage::Escalated, Stage::Completed
};

const char* stage_name(Stage stage);
std::optional<Stage> parse_stage(const std::string& name);

// Default written into completed records when a senior agent took over an
// escalated ticket that never carried draft evidence.
constexpr const char* kManualHandlingNote = "Senior agent handled the response";

struct TicketMetadata {
    std::string category;
    std::string priority; // low | medium | high | critical
    TimePoint creation_time{};
    std::optional<TimePoint> closure_time;     // completed only
    bool is_drafted{false};
    std::optional<std::string> tone;
    std::optional<std::string> escalation_reason; // escalated only

    // Claim bookkeeping, pending only.
    std::optional<std::string> claimed_by;
    std::optional<TimePoint> claimed_at;
    bool needs_attention{false};
    std::optional<std::string> attention_reason;
};

struct Ticket {
    std::string ticket_id;
    std::string issue;
    TicketMetadata metadata;
    std::optional<double> confidence;
    bool handled_manually{false}; // confidence replaced by kManualHandlingNote
    std::optional<std::string> used_policy;
    std::optional<std::string> used_reference_ticket_id;
    std::optional<std::string> ai_drafted_response;
    std::optional<std::string> resolution;
};

// Structured output of the draft generator.
struct DraftResult {
    std::string reply;
    std::string tone;
    double confidence{0.0};
    std::optional<std::string> used_policy;
    std::optional<std::string> used_reference_ticket_id;
};

// Throws SchemaError when `ticket` may not be written into `stage`.
void validate_for_stage(const Ticket& ticket, Stage stage);

bool confidence_in_range(double confidence);

// "high" above 0.9, "medium" above 0.7, otherwise "low".
const char* confidence_band(double confidence);
