#pragma once
#include "claim_queue.hpp"
#include "completion.hpp"
#include "config.hpp"
#include "retrieval.hpp"
#include "stop_signal.hpp"
#include "ticket_store.hpp"
#include "transitions.hpp"
#include "vector_index.hpp"
#include <memory>

// Everything a process needs, built once in main() and passed by reference.
// Members are declared in construction order; later ones refer to earlier ones.
class AppContext {
public:
    explicit AppContext(AppConfig cfg);

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    const AppConfig& config() const { return cfg_; }
    StopSignal& stop() { return stop_; }
    TicketStore& store() { return *store_; }
    VectorStore& vectors() { return *vectors_; }
    Embedder& embedder() { return *embedder_; }
    CompletionClient& completion() { return *completion_; }
    SimilarityIndex& policy_index() { return *policy_index_; }
    SimilarityIndex& previous_index() { return *previous_index_; }
    ClaimQueue& claims() { return *claims_; }
    TransitionEngine& transitions() { return *transitions_; }
    RetrievalContextBuilder& retrieval() { return *retrieval_; }
    DraftGenerator& drafter() { return *drafter_; }

private:
    AppConfig cfg_;
    StopSignal stop_;
    std::unique_ptr<TicketStore> store_;
    std::unique_ptr<VectorStore> vectors_;
    std::unique_ptr<Embedder> embedder_;
    std::unique_ptr<CompletionClient> completion_;
    std::unique_ptr<VectorSimilarityIndex> policy_index_;
    std::unique_ptr<VectorSimilarityIndex> previous_index_;
    std::unique_ptr<ClaimQueue> claims_;
    std::unique_ptr<TransitionEngine> transitions_;
    std::unique_ptr<RetrievalContextBuilder> retrieval_;
    std::unique_ptr<DraftGenerator> drafter_;
};
