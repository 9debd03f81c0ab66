#include "../include/vector_index.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/util.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <stdexcept>

using json = nlohmann::json;

OllamaEmbedder::OllamaEmbedder(EmbedConfig cfg, const std::atomic<bool>* cancel)
    : cfg_(std::move(cfg)), cancel_(cancel) {}

std::vector<float> OllamaEmbedder::embed(const std::string& text) {
    json body = {
        {"model", cfg_.embed_model},
        {"prompt", text}
    };
    auto r = http_post_json(cfg_.ollama_url + "/api/embeddings", body.dump(), cfg_.timeout_ms, cancel_);
    if (r.status < 200 || r.status >= 300) {
        throw ConnectivityError("embedding failed: status " + std::to_string(r.status));
    }
    std::vector<float> vec;
    try {
        auto data = json::parse(r.body);
        for (auto& v : data.at("embedding")) vec.push_back(v.get<float>());
    } catch (const json::exception& e) {
        throw ParseError(std::string("embedding response malformed: ") + e.what());
    }
    if (vec.empty()) throw ParseError("embedding response is empty");
    return vec;
}

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static void bind_blob(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
    sqlite3_bind_blob(st, idx, v.data(), (int)(v.size() * sizeof(float)), SQLITE_TRANSIENT);
}

VectorStore::VectorStore(const std::string& db_path) {
    auto parent = std::filesystem::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Failed to open vector index " + db_path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, 15000);
    init();
    prepare_statements();
}

VectorStore::~VectorStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void VectorStore::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS chunks (\n"
         "  id TEXT PRIMARY KEY,\n"
         "  collection TEXT NOT NULL,\n"
         "  source_key TEXT NOT NULL,\n"
         "  chunk_index INTEGER,\n"
         "  content TEXT,\n"
         "  metadata TEXT,\n"
         "  vector BLOB\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_chunks_collection ON chunks(collection, source_key);");
}

void VectorStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw StoreError("SQLite error: " + msg);
    }
}

void VectorStore::prepare_statements() {
    const char* ins = "INSERT OR REPLACE INTO chunks \n"
                      "(id, collection, source_key, chunk_index, content, metadata, vector) \n"
                      "VALUES (?, ?, ?, ?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, ins, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        throw StoreError("prepare insert failed");
    }
    const char* del = "DELETE FROM chunks WHERE collection = ? AND source_key = ?;";
    if (sqlite3_prepare_v2(db_, del, -1, &delete_by_source_stmt_, nullptr) != SQLITE_OK) {
        throw StoreError("prepare delete failed");
    }
    const char* sel = "SELECT content, metadata, vector FROM chunks WHERE collection = ?;";
    if (sqlite3_prepare_v2(db_, sel, -1, &by_collection_stmt_, nullptr) != SQLITE_OK) {
        throw StoreError("prepare select failed");
    }
    const char* cnt = "SELECT COUNT(*) FROM chunks WHERE collection = ?;";
    if (sqlite3_prepare_v2(db_, cnt, -1, &count_stmt_, nullptr) != SQLITE_OK) {
        throw StoreError("prepare count failed");
    }
}

void VectorStore::close_statements() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (delete_by_source_stmt_) { sqlite3_finalize(delete_by_source_stmt_); delete_by_source_stmt_ = nullptr; }
    if (by_collection_stmt_) { sqlite3_finalize(by_collection_stmt_); by_collection_stmt_ = nullptr; }
    if (count_stmt_) { sqlite3_finalize(count_stmt_); count_stmt_ = nullptr; }
}

void VectorStore::reset(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM chunks WHERE collection = ?;", -1, &st, nullptr) != SQLITE_OK) {
        throw StoreError("prepare reset failed");
    }
    bind_text(st, 1, collection);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) throw StoreError("reset of " + collection + " failed");
}

void VectorStore::upsert_source(const std::string& collection,
                                const std::string& source_key,
                                const std::vector<IndexedChunk>& chunks,
                                const std::vector<std::vector<float>>& embeddings) {
    if (chunks.size() != embeddings.size()) {
        throw std::invalid_argument("chunk / embedding count mismatch");
    }
    std::lock_guard<std::mutex> lock(mtx_);
    exec("BEGIN IMMEDIATE;");
    try {
        // Remove prior rows for this source
        sqlite3_reset(delete_by_source_stmt_);
        bind_text(delete_by_source_stmt_, 1, collection);
        bind_text(delete_by_source_stmt_, 2, source_key);
        if (sqlite3_step(delete_by_source_stmt_) != SQLITE_DONE) {
            throw StoreError("delete_by_source failed");
        }
        sqlite3_reset(delete_by_source_stmt_);

        for (size_t i = 0; i < chunks.size(); ++i) {
            std::string id = collection + ":" + source_key + ":" + std::to_string(i);
            sqlite3_reset(insert_stmt_);
            sqlite3_clear_bindings(insert_stmt_);
            bind_text(insert_stmt_, 1, id);
            bind_text(insert_stmt_, 2, collection);
            bind_text(insert_stmt_, 3, source_key);
            sqlite3_bind_int(insert_stmt_, 4, (int)i);
            bind_text(insert_stmt_, 5, chunks[i].content);
            bind_text(insert_stmt_, 6, chunks[i].metadata.dump());
            bind_blob(insert_stmt_, 7, embeddings[i]);
            if (sqlite3_step(insert_stmt_) != SQLITE_DONE) {
                throw StoreError("insert chunk failed");
            }
        }
        sqlite3_reset(insert_stmt_);
        exec("COMMIT;");
    } catch (...) {
        sqlite3_reset(delete_by_source_stmt_);
        sqlite3_reset(insert_stmt_);
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

std::vector<ScoredChunk> VectorStore::topk_by_embedding(const std::string& collection, const std::vector<float>& query, int top_k) {
    if (top_k < 1) throw std::invalid_argument("top_k must be at least 1, got " + std::to_string(top_k));
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<ScoredChunk> out;
    sqlite3_reset(by_collection_stmt_);
    bind_text(by_collection_stmt_, 1, collection);
    int rc;
    while ((rc = sqlite3_step(by_collection_stmt_)) == SQLITE_ROW) {
        IndexedChunk c;
        const char* content = reinterpret_cast<const char*>(sqlite3_column_text(by_collection_stmt_, 0));
        const char* meta = reinterpret_cast<const char*>(sqlite3_column_text(by_collection_stmt_, 1));
        c.content = content ? content : "";
        c.metadata = json::parse(meta ? meta : "{}", nullptr, false);
        if (c.metadata.is_discarded()) c.metadata = json::object();
        const void* blob = sqlite3_column_blob(by_collection_stmt_, 2);
        int bytes = sqlite3_column_bytes(by_collection_stmt_, 2);
        std::vector<float> vec(bytes / (int)sizeof(float));
        if (bytes > 0) std::memcpy(vec.data(), blob, bytes);
        float score = cosine_similarity(vec, query);
        out.push_back({std::move(c), score});
    }
    sqlite3_reset(by_collection_stmt_);
    sqlite3_clear_bindings(by_collection_stmt_);
    if (rc != SQLITE_DONE) throw StoreError("scan of " + collection + " failed");
    std::partial_sort(out.begin(), out.begin() + std::min<int>(top_k, (int)out.size()), out.end(),
                      [](const ScoredChunk& a, const ScoredChunk& b){ return a.score > b.score; });
    if ((int)out.size() > top_k) out.resize(top_k);
    return out;
}

std::size_t VectorStore::count(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(count_stmt_);
    bind_text(count_stmt_, 1, collection);
    std::size_t n = 0;
    if (sqlite3_step(count_stmt_) == SQLITE_ROW) n = (std::size_t)sqlite3_column_int64(count_stmt_, 0);
    sqlite3_reset(count_stmt_);
    sqlite3_clear_bindings(count_stmt_);
    return n;
}

VectorSimilarityIndex::VectorSimilarityIndex(VectorStore& store, Embedder& embedder, std::string collection)
    : store_(store), embedder_(embedder), collection_(std::move(collection)) {}

std::vector<RetrievedSnippet> VectorSimilarityIndex::similarity_search(const std::string& query, int k) {
    auto qvec = embedder_.embed(query);
    std::vector<RetrievedSnippet> out;
    for (auto& sc : store_.topk_by_embedding(collection_, qvec, k)) {
        double distance = std::max(0.0, 1.0 - (double)sc.score);
        out.push_back({std::move(sc.chunk.content), std::move(sc.chunk.metadata), distance});
    }
    return out;
}
