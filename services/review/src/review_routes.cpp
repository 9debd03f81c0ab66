#include "../include/review_routes.hpp"
#include "../../../shared/cpp/ticket_sdk/include/ticket_codec.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

json ticket_view(const Ticket& t, std::optional<Stage> stage) {
    json j = ticket_to_json(t);
    if (stage) j["store"] = stage_name(*stage);
    if (t.confidence && !t.handled_manually) j["confidence_band"] = confidence_band(*t.confidence);
    return j;
}

json snippet_view(const RetrievedSnippet& s) {
    return json{
        {"content", s.content},
        {"metadata", s.metadata},
        {"distance", s.distance},
        {"confidence", distance_to_confidence(s.distance)}
    };
}

static RouteReply reply(int status, const json& j) {
    return RouteReply{status, j.dump()};
}

static RouteReply error_reply(int status, const std::string& message) {
    return reply(status, json{{"error", message}});
}

static RouteReply action_reply(const ActionResult& r) {
    json j = {{"ok", r.ok}, {"message", r.message}};
    if (r.ticket) j["ticket"] = ticket_view(*r.ticket);
    return reply(r.status, j);
}

static Stage require_stage(const std::string& name) {
    auto stage = parse_stage(name);
    if (!stage) throw std::invalid_argument("unknown store '" + name + "'");
    return *stage;
}

static std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : path) {
        if (c == '/') {
            if (!cur.empty()) parts.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

static RouteReply list_tickets(ReviewDesk& desk, const std::map<std::string, std::string>& query) {
    auto it = query.find("store");
    Stage stage = require_stage(it == query.end() || it->second.empty() ? "pending" : it->second);
    int limit = 0;
    auto lit = query.find("limit");
    if (lit != query.end() && !lit->second.empty()) {
        limit = std::stoi(lit->second);
        if (limit < 0) throw std::invalid_argument("limit must be positive");
    }
    auto page = desk.list(stage, limit);
    json tickets = json::array();
    for (const auto& t : page.tickets) tickets.push_back(ticket_view(t, stage));
    return reply(200, json{
        {"store", stage_name(stage)},
        {"tickets", tickets},
        {"total", page.total},
        {"degraded", page.degraded}
    });
}

static RouteReply raise_ticket(ReviewDesk& desk, const json& j) {
    RaiseRequest req;
    req.stage = require_stage(j.value("store", std::string("pending")));
    req.ticket_id = j.value("ticket_id", std::string());
    req.issue = j.value("issue", std::string());
    req.category = j.value("category", req.category);
    req.priority = j.value("priority", req.priority);
    req.tone = j.value("tone", req.tone);
    req.reply = j.value("reply", std::string());
    req.confidence = j.value("confidence", req.confidence);
    req.escalation_reason = j.value("escalation_reason", std::string());
    req.resolution = j.value("resolution", std::string());
    return action_reply(desk.raise(req));
}

static RouteReply ticket_route(ReviewDesk& desk, const std::string& method, const std::string& id,
                               const std::string& action, const json& j) {
    if (method == "GET" && action.empty()) {
        auto found = desk.lookup(id);
        if (!found) return error_reply(404, "Ticket " + id + " not found.");
        return reply(200, ticket_view(found->ticket, found->stage));
    }
    if (method == "GET" && action == "similar") {
        auto view = desk.similar(id);
        json previous = json::array();
        json policy = json::array();
        for (const auto& s : view.previous_records) previous.push_back(snippet_view(s));
        for (const auto& s : view.policy) policy.push_back(snippet_view(s));
        return reply(200, json{{"previous_records", previous}, {"policy", policy}});
    }
    if (method != "POST") return error_reply(404, "not found");

    if (action == "approve") {
        Stage from = require_stage(j.at("from").get<std::string>());
        return action_reply(desk.approve(id, from, j.at("resolution").get<std::string>()));
    }
    if (action == "escalate") {
        Stage from = require_stage(j.at("from").get<std::string>());
        std::optional<std::string> reason;
        if (j.contains("reason") && j["reason"].is_string()) reason = j["reason"].get<std::string>();
        return action_reply(desk.escalate(id, from, reason));
    }
    if (action == "resolve") {
        return action_reply(desk.resolve(id, j.at("resolution").get<std::string>()));
    }
    if (action == "requeue") {
        return action_reply(desk.requeue(id));
    }
    return error_reply(404, "not found");
}

static RouteReply stats_route(ReviewDesk& desk) {
    auto s = desk.stats();
    json out = json::object();
    for (Stage stage : kAllStages) out[stage_name(stage)] = s.counts[static_cast<std::size_t>(stage)];
    out["needs_attention"] = s.needs_attention;
    out["degraded"] = s.degraded;
    return reply(200, out);
}

RouteReply handle_request(ReviewDesk& desk, const std::string& method, const std::string& path,
                          const std::map<std::string, std::string>& query, const std::string& body) {
    try {
        json j = body.empty() ? json::object() : json::parse(body);
        auto parts = split_path(path);

        if (parts.size() == 1 && parts[0] == "tickets") {
            if (method == "GET") return list_tickets(desk, query);
            if (method == "POST") return raise_ticket(desk, j);
        }
        if ((parts.size() == 2 || parts.size() == 3) && parts[0] == "tickets") {
            return ticket_route(desk, method, parts[1], parts.size() == 3 ? parts[2] : std::string(), j);
        }
        if (method == "POST" && path == "/rephrase") {
            std::optional<double> temperature;
            if (j.contains("temperature") && !j["temperature"].is_null()) temperature = j["temperature"].get<double>();
            auto text = desk.rephrase(j.at("text").get<std::string>(), temperature);
            return reply(200, json{{"text", text}});
        }
        if (method == "GET" && path == "/stats") return stats_route(desk);
        return error_reply(404, "not found");
    } catch (const json::exception& e) {
        return error_reply(400, e.what());
    } catch (const std::invalid_argument& e) {
        return error_reply(400, e.what());
    } catch (const std::out_of_range& e) {
        return error_reply(400, e.what());
    } catch (const TicketError& e) {
        spdlog::error("[review] {} {} failed: {}", method, path, e.what());
        return error_reply(status_for(e.kind()), e.what());
    } catch (const std::exception& e) {
        spdlog::error("[review] {} {} failed: {}", method, path, e.what());
        return error_reply(500, e.what());
    }
}
