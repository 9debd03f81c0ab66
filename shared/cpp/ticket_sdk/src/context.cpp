#include "../include/context.hpp"
#include <spdlog/spdlog.h>

AppContext::AppContext(AppConfig cfg) : cfg_(std::move(cfg)) {
    store_ = std::make_unique<TicketStore>(cfg_.store.db_path, cfg_.store.busy_timeout_ms);
    vectors_ = std::make_unique<VectorStore>(cfg_.store.index_db_path);
    embedder_ = std::make_unique<OllamaEmbedder>(cfg_.embed, stop_.flag());
    completion_ = std::make_unique<OllamaCompletionClient>(cfg_.llm, stop_.flag());
    policy_index_ = std::make_unique<VectorSimilarityIndex>(*vectors_, *embedder_, kPolicyCollection);
    previous_index_ = std::make_unique<VectorSimilarityIndex>(*vectors_, *embedder_, kPreviousRecordCollection);
    claims_ = std::make_unique<ClaimQueue>(*store_);
    transitions_ = std::make_unique<TransitionEngine>(*store_);
    retrieval_ = std::make_unique<RetrievalContextBuilder>(*policy_index_, *previous_index_,
                                                           cfg_.worker.policy_k, cfg_.worker.previous_k);
    drafter_ = std::make_unique<DraftGenerator>(*completion_, cfg_.llm.temperature);

    spdlog::info("Ticket store: {}", cfg_.store.db_path);
    spdlog::info("Vector index: {}", cfg_.store.index_db_path);
    spdlog::info("Ollama: {} (chat {}, embed {})", cfg_.llm.ollama_url, cfg_.llm.llm_model, cfg_.embed.embed_model);
}
