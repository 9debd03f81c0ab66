#pragma once
#include "config.hpp"
#include "retrieval.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

class Embedder {
public:
    virtual ~Embedder() = default;
    virtual std::vector<float> embed(const std::string& text) = 0;
};

// Ollama /api/embeddings.
class OllamaEmbedder : public Embedder {
public:
    explicit OllamaEmbedder(EmbedConfig cfg, const std::atomic<bool>* cancel = nullptr);
    std::vector<float> embed(const std::string& text) override;

private:
    EmbedConfig cfg_;
    const std::atomic<bool>* cancel_;
};

struct IndexedChunk {
    std::string content;
    nlohmann::json metadata;
};

struct ScoredChunk {
    IndexedChunk chunk;
    float score{0.0f}; // cosine similarity
};

// Embedding rows for several named collections in one SQLite file.
class VectorStore {
public:
    explicit VectorStore(const std::string& db_path);
    ~VectorStore();

    VectorStore(const VectorStore&) = delete;
    VectorStore& operator=(const VectorStore&) = delete;

    void reset(const std::string& collection);
    // Replaces every row previously stored under (collection, source_key).
    void upsert_source(const std::string& collection,
                       const std::string& source_key,
                       const std::vector<IndexedChunk>& chunks,
                       const std::vector<std::vector<float>>& embeddings);
    // Highest cosine first. Throws std::invalid_argument when top_k < 1.
    std::vector<ScoredChunk> topk_by_embedding(const std::string& collection, const std::vector<float>& query, int top_k);
    std::size_t count(const std::string& collection);

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();

    sqlite3* db_{nullptr};
    sqlite3_stmt* insert_stmt_{nullptr};
    sqlite3_stmt* delete_by_source_stmt_{nullptr};
    sqlite3_stmt* by_collection_stmt_{nullptr};
    sqlite3_stmt* count_stmt_{nullptr};
    std::mutex mtx_;
};

// SimilarityIndex over one VectorStore collection. Distance is 1 - cosine,
// clamped at zero.
class VectorSimilarityIndex : public SimilarityIndex {
public:
    VectorSimilarityIndex(VectorStore& store, Embedder& embedder, std::string collection);
    std::vector<RetrievedSnippet> similarity_search(const std::string& query, int k) override;
    std::string name() const override { return collection_; }

private:
    VectorStore& store_;
    Embedder& embedder_;
    std::string collection_;
};

constexpr const char* kPolicyCollection = "policy";
constexpr const char* kPreviousRecordCollection = "previous-record";
