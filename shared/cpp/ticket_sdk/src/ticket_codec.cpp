#include "../include/ticket_codec.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"

using json = nlohmann::json;

static json opt_str(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

static json opt_time(const std::optional<TimePoint>& v) {
    return v ? json(format_time(*v)) : json(nullptr);
}

static std::optional<std::string> read_opt_str(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

static std::optional<TimePoint> read_opt_time(const json& j, const char* key) {
    auto s = read_opt_str(j, key);
    if (!s) return std::nullopt;
    return parse_time(*s);
}

json ticket_to_json(const Ticket& t) {
    const auto& m = t.metadata;
    json meta = {
        {"category", m.category},
        {"priority", m.priority},
        {"ticket_creation_time", format_time(m.creation_time)},
        {"ticket_closure_time", opt_time(m.closure_time)},
        {"is_drafted", m.is_drafted},
        {"tone", opt_str(m.tone)},
        {"escalation_reason", opt_str(m.escalation_reason)},
        {"needs_attention", m.needs_attention},
        {"attention_reason", opt_str(m.attention_reason)},
        {"claimed_by", opt_str(m.claimed_by)},
        {"claimed_at", opt_time(m.claimed_at)}
    };

    json confidence = nullptr;
    if (t.confidence) confidence = *t.confidence;
    else if (t.handled_manually) confidence = kManualHandlingNote;

    return json{
        {"ticket_id", t.ticket_id},
        {"issue", t.issue},
        {"metadata", meta},
        {"confidence", confidence},
        {"used_policy", opt_str(t.used_policy)},
        {"used_reference_ticket_id", opt_str(t.used_reference_ticket_id)},
        {"ai_drafted_response", opt_str(t.ai_drafted_response)},
        {"resolution", opt_str(t.resolution)}
    };
}

Ticket ticket_from_json(const json& j) {
    try {
        Ticket t;
        t.ticket_id = j.at("ticket_id").get<std::string>();
        t.issue = j.at("issue").get<std::string>();

        const json& meta = j.at("metadata");
        auto& m = t.metadata;
        m.category = meta.value("category", std::string());
        m.priority = meta.value("priority", std::string());
        m.creation_time = parse_time(meta.at("ticket_creation_time").get<std::string>());
        m.closure_time = read_opt_time(meta, "ticket_closure_time");
        m.is_drafted = meta.value("is_drafted", false);
        m.tone = read_opt_str(meta, "tone");
        m.escalation_reason = read_opt_str(meta, "escalation_reason");
        m.needs_attention = meta.value("needs_attention", false);
        m.attention_reason = read_opt_str(meta, "attention_reason");
        m.claimed_by = read_opt_str(meta, "claimed_by");
        m.claimed_at = read_opt_time(meta, "claimed_at");

        auto c = j.find("confidence");
        if (c != j.end() && c->is_number()) {
            t.confidence = c->get<double>();
        } else if (c != j.end() && c->is_string()) {
            t.handled_manually = true;
        }
        t.used_policy = read_opt_str(j, "used_policy");
        t.used_reference_ticket_id = read_opt_str(j, "used_reference_ticket_id");
        t.ai_drafted_response = read_opt_str(j, "ai_drafted_response");
        t.resolution = read_opt_str(j, "resolution");
        return t;
    } catch (const json::exception& e) {
        throw ParseError(std::string("malformed ticket document: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ParseError(std::string("malformed ticket document: ") + e.what());
    }
}
