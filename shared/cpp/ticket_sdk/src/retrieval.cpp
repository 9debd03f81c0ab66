#include "../include/retrieval.hpp"
#include "../include/errors.hpp"
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

RetrievalContextBuilder::RetrievalContextBuilder(SimilarityIndex& policy, SimilarityIndex& previous_records,
                                                 int policy_k, int previous_k)
    : policy_(policy), previous_(previous_records), policy_k_(policy_k), previous_k_(previous_k) {}

std::vector<RetrievedSnippet> RetrievalContextBuilder::retrieve(SimilarityIndex& index, const std::string& issue, int k) {
    if (k < 1) throw std::invalid_argument("retrieval depth must be at least 1, got " + std::to_string(k));
    auto hits = index.similarity_search(issue, k);
    if ((int)hits.size() > k) hits.resize(k);
    return hits;
}

RetrievalContext RetrievalContextBuilder::build(const std::string& issue) {
    RetrievalContext ctx;
    ctx.policy = retrieve(policy_, issue, policy_k_);
    ctx.previous_records = retrieve(previous_, issue, previous_k_);
    spdlog::debug("[retrieval] {} policy / {} previous-record hits", ctx.policy.size(), ctx.previous_records.size());
    return ctx;
}

std::vector<RetrievedSnippet> RetrievalContextBuilder::lookup_or_empty(SimilarityIndex& index, const std::string& issue, int k) {
    try {
        return retrieve(index, issue, k);
    } catch (const TicketError& e) {
        spdlog::error("[retrieval] {} index lookup failed: {}", index.name(), e.what());
        return {};
    }
}

std::vector<RetrievedSnippet> RetrievalContextBuilder::lookup_policy(const std::string& issue) {
    return lookup_or_empty(policy_, issue, policy_k_);
}

std::vector<RetrievedSnippet> RetrievalContextBuilder::lookup_previous(const std::string& issue) {
    return lookup_or_empty(previous_, issue, previous_k_);
}

// Index metadata is written by other tools; only string values are shown.
static std::string meta_string(const nlohmann::json& meta, const char* key, const std::string& fallback) {
    if (!meta.is_object()) return fallback;
    auto it = meta.find(key);
    return it != meta.end() && it->is_string() ? it->get<std::string>() : fallback;
}

std::string render_policy_context(const std::vector<RetrievedSnippet>& snippets) {
    if (snippets.empty()) return "No specific Policy Provided";
    std::ostringstream os;
    int i = 1;
    for (const auto& s : snippets) {
        os << "[" << i++ << "] (confidence " << distance_to_confidence(s.distance) << ")";
        auto filename = meta_string(s.metadata, "filename", std::string());
        if (!filename.empty()) os << " " << filename;
        os << "\n" << s.content << "\n\n";
    }
    return os.str();
}

std::string render_previous_context(const std::vector<RetrievedSnippet>& snippets) {
    if (snippets.empty()) return "No Previous Records Found";
    std::ostringstream os;
    for (const auto& s : snippets) {
        std::string id = meta_string(s.metadata, "ticket_id", "unknown");
        std::string resolution = meta_string(s.metadata, "resolution", std::string());
        os << "- ticket " << id << " (confidence " << distance_to_confidence(s.distance) << ")\n"
           << "  issue: " << s.content << "\n";
        if (!resolution.empty()) os << "  resolution: " << resolution << "\n";
    }
    return os.str();
}
