#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct RetrievedSnippet {
    std::string content;
    nlohmann::json metadata;
    double distance{0.0}; // >= 0, lower is closer
};

inline double distance_to_confidence(double distance) { return 1.0 / (1.0 + distance); }

// External similarity index. Results are ordered closest first; the index is
// never mutated by a search. Throws ConnectivityError when unreachable.
class SimilarityIndex {
public:
    virtual ~SimilarityIndex() = default;
    virtual std::vector<RetrievedSnippet> similarity_search(const std::string& query, int k) = 0;
    virtual std::string name() const = 0;
};

struct RetrievalContext {
    std::vector<RetrievedSnippet> policy;
    std::vector<RetrievedSnippet> previous_records;
};

class RetrievalContextBuilder {
public:
    RetrievalContextBuilder(SimilarityIndex& policy, SimilarityIndex& previous_records,
                            int policy_k = 3, int previous_k = 5);

    // Drafting path: index failures propagate.
    RetrievalContext build(const std::string& issue);

    // Reviewer path: failures are logged and yield an empty result.
    std::vector<RetrievedSnippet> lookup_policy(const std::string& issue);
    std::vector<RetrievedSnippet> lookup_previous(const std::string& issue);

    // At most k hits; k must be at least 1.
    static std::vector<RetrievedSnippet> retrieve(SimilarityIndex& index, const std::string& issue, int k);

private:
    std::vector<RetrievedSnippet> lookup_or_empty(SimilarityIndex& index, const std::string& issue, int k);

    SimilarityIndex& policy_;
    SimilarityIndex& previous_;
    int policy_k_;
    int previous_k_;
};

// Prompt renderings. Empty context is valid input and renders as an explicit
// "nothing found" line.
std::string render_policy_context(const std::vector<RetrievedSnippet>& snippets);
std::string render_previous_context(const std::vector<RetrievedSnippet>& snippets);
