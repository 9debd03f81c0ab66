#include "../include/completion.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

OllamaCompletionClient::OllamaCompletionClient(LlmConfig cfg, const std::atomic<bool>* cancel)
    : cfg_(std::move(cfg)), cancel_(cancel) {}

std::string OllamaCompletionClient::chat(const ChatRequest& req) {
    json messages = json::array();
    for (const auto& m : req.messages) {
        messages.push_back(json{{"role", m.role}, {"content", m.content}});
    }
    json body = {
        {"model", cfg_.llm_model},
        {"messages", messages},
        {"stream", false},
        {"options", json{{"temperature", req.temperature}}}
    };
    if (req.json_output) body["format"] = "json";

    auto r = http_post_json(cfg_.ollama_url + "/api/chat", body.dump(), cfg_.timeout_ms, cancel_);
    if (r.status < 200 || r.status >= 300) {
        throw ConnectivityError("chat failed: status " + std::to_string(r.status));
    }
    try {
        auto data = json::parse(r.body);
        return data.at("message").at("content").get<std::string>();
    } catch (const json::exception& e) {
        throw ParseError(std::string("chat response malformed: ") + e.what());
    }
}

static const char* kDraftSystemPrompt =
    "You are a professional customer support agent for a large e-commerce platform.\n"
    "\n"
    "Your task:\n"
    "- Draft a safe, policy-compliant response for a human support agent to review.\n"
    "- Follow the provided policy strictly.\n"
    "- Use previous resolved tickets only as reference, not as guarantees.\n"
    "- Do NOT make promises outside the policy.\n"
    "- Do NOT mention internal processes or timelines unless stated in the policy.\n"
    "- Maintain a professional and calm tone at all times.";

static const char* kDraftOutputRules =
    "Respond with a single JSON object and nothing else:\n"
    "{\n"
    "  \"ticket_id\": string, the id of the ticket you are drafting,\n"
    "  \"reply\": string, policy-compliant reply draft for human review,\n"
    "  \"tone\": string, tone of the response: polite, neutral or apologetic,\n"
    "  \"confidence\": number between 0 and 1, how confident you are in the draft,\n"
    "  \"used_policy\": string or null, policy reference used in drafting,\n"
    "  \"used_reference_ticket_id\": string or null, id of a previous solved ticket used as reference\n"
    "}\n"
    "If no specific policy applies, set \"used_policy\" to null.";

DraftGenerator::DraftGenerator(CompletionClient& client, double temperature)
    : client_(client), temperature_(temperature) {}

std::string build_draft_prompt(const DraftRequest& req) {
    std::ostringstream os;
    os << "Ticket Id:\n" << req.ticket_id << "\n\n"
       << "Customer issue:\n" << req.issue << "\n\n"
       << "Relevant policy:\n"
       << (req.policy_context.empty() ? "No specific Policy Provided" : req.policy_context) << "\n\n"
       << "Previous resolved tickets (for reference only):\n"
       << (req.previous_record_context.empty() ? "No Previous Records Found" : req.previous_record_context) << "\n\n"
       << "--- OUTPUT RULES ---\n" << kDraftOutputRules << "\n";
    return os.str();
}

DraftResult DraftGenerator::draft(const DraftRequest& req) {
    ChatRequest chat;
    chat.temperature = temperature_;
    chat.json_output = true;
    chat.messages.push_back({"system", kDraftSystemPrompt});
    chat.messages.push_back({"user", build_draft_prompt(req)});

    auto raw = client_.chat(chat);
    auto result = parse_draft_output(raw, req.ticket_id);
    spdlog::debug("[draft] {} tone={} confidence={:.2f}", req.ticket_id, result.tone, result.confidence);
    return result;
}

static std::string strip_code_fence(const std::string& raw) {
    auto text = trim(raw);
    if (text.rfind("```", 0) != 0) return text;
    auto nl = text.find('\n');
    if (nl == std::string::npos) return text;
    auto end = text.rfind("```");
    if (end == std::string::npos || end <= nl) return trim(text.substr(nl + 1));
    return trim(text.substr(nl + 1, end - nl - 1));
}

static std::optional<std::string> optional_reference(const json& obj, const char* key) {
    if (!obj.contains(key) || obj[key].is_null()) return std::nullopt;
    if (!obj[key].is_string()) throw ParseError(std::string("draft field ") + key + " is not a string");
    auto v = trim(obj[key].get<std::string>());
    if (v.empty() || v == "null" || v == "None" || v == "N/A") return std::nullopt;
    return v;
}

static std::string required_string(const json& obj, const char* key) {
    if (!obj.contains(key) || !obj[key].is_string()) {
        throw ParseError(std::string("draft field ") + key + " missing or not a string");
    }
    return obj[key].get<std::string>();
}

DraftResult parse_draft_output(const std::string& raw, const std::string& expected_ticket_id) {
    auto doc = json::parse(strip_code_fence(raw), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw ParseError("draft output is not a JSON object");
    }

    auto ticket_id = required_string(doc, "ticket_id");
    if (ticket_id != expected_ticket_id) {
        throw ParseError("draft output is for " + ticket_id + ", expected " + expected_ticket_id);
    }

    DraftResult out;
    out.reply = required_string(doc, "reply");
    out.tone = required_string(doc, "tone");
    if (trim(out.reply).empty()) throw ParseError("draft reply is empty");

    if (!doc.contains("confidence") || !doc["confidence"].is_number()) {
        throw ParseError("draft field confidence missing or not a number");
    }
    out.confidence = doc["confidence"].get<double>();
    if (!confidence_in_range(out.confidence)) {
        throw ParseError("draft confidence " + std::to_string(out.confidence) + " outside [0,1]");
    }

    out.used_policy = optional_reference(doc, "used_policy");
    out.used_reference_ticket_id = optional_reference(doc, "used_reference_ticket_id");
    return out;
}

std::string rephrase(CompletionClient& client, const std::string& text, double temperature) {
    if (trim(text).empty()) throw std::invalid_argument("text to rephrase is empty");
    if (!(temperature >= 0.0 && temperature <= 1.0)) {
        throw std::invalid_argument("temperature must be within [0,1]");
    }
    ChatRequest req;
    req.temperature = temperature;
    req.messages.push_back({"user",
        "Your task is to rephrase the given text to make it more polite and professional.\n"
        "Please ensure that the meaning of the text remains unchanged.\n"
        "Reply with the rephrased text only.\n"
        "Text: " + text});
    return trim(client.chat(req));
}
