#pragma once
#include "config.hpp"
#include "ticket.hpp"
#include <atomic>
#include <string>
#include <vector>

struct ChatMessage {
    std::string role; // system | user | assistant
    std::string content;
};

struct ChatRequest {
    std::vector<ChatMessage> messages;
    double temperature{0.2};
    bool json_output{false};
};

// Chat-style completion service. Returns the raw assistant text.
class CompletionClient {
public:
    virtual ~CompletionClient() = default;
    virtual std::string chat(const ChatRequest& req) = 0;
};

// Ollama /api/chat with stream disabled.
class OllamaCompletionClient : public CompletionClient {
public:
    explicit OllamaCompletionClient(LlmConfig cfg, const std::atomic<bool>* cancel = nullptr);
    std::string chat(const ChatRequest& req) override;

private:
    LlmConfig cfg_;
    const std::atomic<bool>* cancel_;
};

struct DraftRequest {
    std::string ticket_id;
    std::string issue;
    std::string policy_context;
    std::string previous_record_context;
};

class DraftGenerator {
public:
    explicit DraftGenerator(CompletionClient& client, double temperature = 0.2);

    // One completion call. Throws ConnectivityError or ParseError; never
    // touches a store.
    DraftResult draft(const DraftRequest& req);

private:
    CompletionClient& client_;
    double temperature_;
};

std::string build_draft_prompt(const DraftRequest& req);

// Validates the structured reply for `expected_ticket_id`. Throws ParseError.
DraftResult parse_draft_output(const std::string& raw, const std::string& expected_ticket_id);

// Same meaning, more polite and professional phrasing.
// Throws std::invalid_argument for empty text or a temperature outside [0,1].
std::string rephrase(CompletionClient& client, const std::string& text, double temperature);
